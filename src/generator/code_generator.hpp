#pragma once

#include <string>

#include "repair/repair_request.hpp"
#include "task/task_types.hpp"

namespace selfrepair::generator {

struct GenerationResult {
    std::string code;
    std::string error;

    bool Ok() const { return error.empty() && !code.empty(); }
};

class CodeGenerator {
public:
    virtual ~CodeGenerator() = default;
    virtual GenerationResult Generate(const selfrepair::task::Task& task) = 0;
    virtual GenerationResult Repair(const selfrepair::repair::RepairRequest& request) = 0;
};

}  // namespace selfrepair::generator
