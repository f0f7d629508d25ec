#pragma once

#include "loop/batch_evaluator.hpp"
#include "loop/loop_types.hpp"
#include "nlohmann/json.hpp"

namespace selfrepair::loop {

nlohmann::json ErrorToJson(const selfrepair::classify::ClassifiedError& error);
nlohmann::json AttemptToJson(const AttemptRecord& record);
nlohmann::json ReportToJson(const EvaluationReport& report);
nlohmann::json BatchToJson(const std::vector<BatchItem>& items);

}  // namespace selfrepair::loop
