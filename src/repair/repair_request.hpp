#pragma once

#include <string>
#include <vector>

#include "classify/error_types.hpp"
#include "task/task_types.hpp"

namespace selfrepair::repair {

struct RepairRequest {
    selfrepair::task::Task task;
    selfrepair::task::Submission submission;
    selfrepair::classify::ClassifiedError error;
    std::vector<selfrepair::task::TestAssertion> failing_assertions;
    std::string instruction;
};

}  // namespace selfrepair::repair
