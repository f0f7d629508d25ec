#include "task/task_loader.hpp"

#include <fstream>

namespace selfrepair::task {

namespace {

std::string RequireString(const nlohmann::json& json, const char* key) {
    if (!json.contains(key) || !json[key].is_string()) {
        throw TaskFormatError(std::string("task field '") + key + "' must be a string");
    }
    return json[key].get<std::string>();
}

}  // namespace

Task TaskFromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw TaskFormatError("task must be a JSON object");
    }
    Task task{};
    task.id = RequireString(json, "id");
    task.signature = json.value("signature", "");
    task.description = json.value("description", "");

    if (!json.contains("tests") || !json["tests"].is_array() || json["tests"].empty()) {
        throw TaskFormatError("task '" + task.id + "' needs a non-empty 'tests' array");
    }
    const auto& tests = json["tests"];
    for (std::size_t i = 0; i < tests.size(); ++i) {
        const auto& entry = tests[i];
        TestAssertion assertion{};
        if (entry.is_string()) {
            assertion.code = entry.get<std::string>();
        } else if (entry.is_object()) {
            assertion.name = entry.value("name", "");
            assertion.code = RequireString(entry, "code");
        } else {
            throw TaskFormatError("task '" + task.id + "' test " + std::to_string(i + 1) +
                " must be a string or {name, code}");
        }
        assertion.name = TestFunctionName(assertion, i);
        task.tests.push_back(std::move(assertion));
    }
    return task;
}

Task LoadTask(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw TaskFormatError("cannot open task file " + path.string());
    }
    try {
        return TaskFromJson(nlohmann::json::parse(input));
    } catch (const nlohmann::json::exception& ex) {
        throw TaskFormatError(path.string() + ": " + ex.what());
    }
}

}  // namespace selfrepair::task
