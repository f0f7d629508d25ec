#include "loop/report_json.hpp"

namespace selfrepair::loop {

nlohmann::json ErrorToJson(const selfrepair::classify::ClassifiedError& error) {
    nlohmann::json json{
        {"kind", selfrepair::classify::ToString(error.kind)},
        {"errorType", error.error_type},
        {"line", error.line_number ? nlohmann::json(*error.line_number) : nlohmann::json(nullptr)},
        {"failingTests", error.failing_tests},
        {"excerpt", error.excerpt},
        {"signature", error.Signature()}
    };
    if (!error.hint.Empty()) {
        json["hint"] = {
            {"expected", error.hint.expected},
            {"actual", error.hint.actual},
            {"input", error.hint.input}
        };
    }
    return json;
}

nlohmann::json AttemptToJson(const AttemptRecord& record) {
    nlohmann::json json{
        {"attempt", record.attempt},
        {"prompt", ToString(record.prompt)},
        {"freeReroll", record.free_reroll},
        {"code", record.submission.source},
        {"generationMs", record.generation_time.count()},
        {"executionMs", record.execution_time.count()},
        {"passed", record.Succeeded()}
    };
    if (record.execution) {
        const auto& exec = *record.execution;
        json["execution"] = {
            {"status", selfrepair::sandbox::ToString(exec.status)},
            {"exitCode", exec.exit_code},
            {"durationMs", exec.duration.count()},
            {"stdout", exec.stdout_text},
            {"stderr", exec.stderr_text},
            {"resourceExceeded", exec.resource_exceeded},
            {"outputTruncated", exec.output_truncated},
            {"networkIsolated", exec.network_isolated}
        };
    } else {
        json["execution"] = nullptr;
    }
    json["error"] = record.error ? ErrorToJson(*record.error) : nlohmann::json(nullptr);
    return json;
}

nlohmann::json ReportToJson(const EvaluationReport& report) {
    nlohmann::json attempts = nlohmann::json::array();
    for (const auto& record : report.attempts) {
        attempts.push_back(AttemptToJson(record));
    }
    const auto& outcome = report.outcome;
    return nlohmann::json{
        {"taskId", report.task_id},
        {"outcome", {
            {"succeeded", outcome.succeeded},
            {"attempt", outcome.attempt},
            {"reason", outcome.reason},
            {"lastError", outcome.last_error ? ErrorToJson(*outcome.last_error) : nlohmann::json(nullptr)}
        }},
        {"attempts", attempts},
        {"totalMs", report.total_time.count()}
    };
}

nlohmann::json BatchToJson(const std::vector<BatchItem>& items) {
    nlohmann::json results = nlohmann::json::array();
    int solved = 0;
    for (const auto& item : items) {
        auto json = ReportToJson(item.report);
        if (!item.infrastructure_error.empty()) {
            json["infrastructureError"] = item.infrastructure_error;
        }
        if (item.report.outcome.succeeded) {
            ++solved;
        }
        results.push_back(std::move(json));
    }
    return nlohmann::json{
        {"tasks", static_cast<int>(items.size())},
        {"solved", solved},
        {"results", results}
    };
}

}  // namespace selfrepair::loop
