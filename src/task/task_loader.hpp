#pragma once

#include <filesystem>
#include <stdexcept>

#include "nlohmann/json.hpp"
#include "task/task_types.hpp"

namespace selfrepair::task {

class TaskFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Accepts {id, signature, description, tests}, where tests holds assertion
// strings or {name, code} objects. Unnamed assertions become test_<n>; a
// "def" body keeps the name of the function it defines.
Task TaskFromJson(const nlohmann::json& json);
Task LoadTask(const std::filesystem::path& path);

}  // namespace selfrepair::task
