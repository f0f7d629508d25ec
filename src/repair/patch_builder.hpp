#pragma once

#include <string>

#include "classify/error_types.hpp"
#include "repair/repair_request.hpp"
#include "task/task_types.hpp"

namespace selfrepair::repair {

extern const char* const kStepByStepInstruction;

class PatchBuilder {
public:
    RepairRequest BuildRepair(const selfrepair::task::Task& task,
                              const selfrepair::task::Submission& submission,
                              const selfrepair::classify::ClassifiedError& error) const;
};

std::string RenderGenerationPrompt(const selfrepair::task::Task& task);
std::string RenderRepairPrompt(const RepairRequest& request);

}  // namespace selfrepair::repair
