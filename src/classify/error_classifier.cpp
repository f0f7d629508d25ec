#include "classify/error_classifier.hpp"

#include <algorithm>
#include <initializer_list>

#include "utils/common.hpp"

namespace selfrepair::classify {
namespace {

constexpr std::size_t kExcerptLimit = 300;

// An exception name that starts a traceback line, an "E " detail line, a
// "FAILED x - Name: ..." summary or a "file:line: Name" location line.
// Source listings such as "except KeyError:" do not match.
const std::regex kRaisedPattern(
    R"(^(?:E\s+)?(?:\S.*?\s-\s)?(?:\S+:\d+:\s*)?([A-Z]\w*(?:Error|Exception|Exit|Interrupt|Iteration))(?::|$))");
const std::regex kSolutionFramePattern(R"((?:^|[^\w])solution\.py["']?,\s*line\s*(\d+))");
const std::regex kSolutionShortPattern(R"((?:^|[^\w])solution\.py:(\d+))");
const std::regex kFailedPattern(R"((?:FAILED|ERROR)\s+\S+::(\w+))");
const std::regex kSectionPattern(R"(_{3,}\s*(test_\w+)\s*_{3,})");
const std::regex kPytestAssertPattern(R"(^E\s+assert\s+(.+?)\s*==\s*(.+?)\s*$)");
const std::regex kSourceAssertPattern(R"(assert\s+(.+?)\s*==\s*(.+?)\s*$)");
const std::regex kWherePattern(R"(where\s+.+?=\s*\w+\((.+?)\)\s*$)");

bool RaisedAny(const std::vector<std::string>& raised, std::initializer_list<const char*> names) {
    for (const auto& item : raised) {
        for (const auto* name : names) {
            if (item == name) {
                return true;
            }
        }
    }
    return false;
}

std::string FirstOf(const std::vector<std::string>& raised, std::initializer_list<const char*> names) {
    for (const auto& item : raised) {
        for (const auto* name : names) {
            if (item == name) {
                return item;
            }
        }
    }
    return {};
}

std::string FirstUnexpected(const std::vector<std::string>& raised) {
    for (const auto& item : raised) {
        if (item != "AssertionError") {
            return item;
        }
    }
    return {};
}

void AppendUnique(std::vector<std::string>& items, const std::string& value) {
    if (std::find(items.begin(), items.end(), value) == items.end()) {
        items.push_back(value);
    }
}

std::string TailLines(const std::string& output, std::size_t count) {
    auto lines = utils::SplitLines(output);
    lines.erase(
        std::remove_if(lines.begin(), lines.end(), [](const std::string& line) {
            return utils::Trim(line).empty();
        }),
        lines.end());
    if (lines.size() > count) {
        lines.erase(lines.begin(), lines.end() - static_cast<std::ptrdiff_t>(count));
    }
    return utils::Join(lines, "\n");
}

}  // namespace

ErrorClassifier::ErrorClassifier() {
    rules_ = {
        {ErrorKind::kSyntax, [](const ClassificationInput& in) {
            return RaisedAny(in.raised, {"SyntaxError", "IndentationError", "TabError"});
        }},
        {ErrorKind::kName, [](const ClassificationInput& in) {
            return RaisedAny(in.raised, {"NameError", "UnboundLocalError", "ImportError", "ModuleNotFoundError"});
        }},
        {ErrorKind::kType, [](const ClassificationInput& in) {
            return RaisedAny(in.raised, {"TypeError", "AttributeError"});
        }},
        {ErrorKind::kTimeout, [](const ClassificationInput& in) {
            return in.result.TimedOut();
        }},
        {ErrorKind::kRuntime, [](const ClassificationInput& in) {
            return in.result.status == selfrepair::sandbox::ExecStatus::kCrashed ||
                in.result.resource_exceeded ||
                !FirstUnexpected(in.raised).empty();
        }},
        {ErrorKind::kLogic, [](const ClassificationInput&) {
            return true;
        }},
    };
}

std::vector<std::string> ErrorClassifier::ExtractRaisedExceptions(const std::string& output) {
    std::vector<std::string> raised;
    for (const auto& line : utils::SplitLines(output)) {
        const auto trimmed = utils::Trim(line);
        if (trimmed.empty()) {
            continue;
        }
        std::smatch match;
        if (std::regex_search(trimmed, match, kRaisedPattern)) {
            AppendUnique(raised, match[1].str());
        }
    }
    return raised;
}

std::optional<int> ErrorClassifier::ExtractLineNumber(const std::string& output) {
    for (const auto* pattern : {&kSolutionFramePattern, &kSolutionShortPattern}) {
        std::optional<int> last;
        auto begin = std::sregex_iterator(output.begin(), output.end(), *pattern);
        for (auto it = begin; it != std::sregex_iterator(); ++it) {
            try {
                last = std::stoi((*it)[1].str());
            } catch (const std::exception&) {
                continue;
            }
        }
        if (last) {
            return last;
        }
    }
    return std::nullopt;
}

std::vector<std::string> ErrorClassifier::ExtractFailingTests(const std::string& output) {
    std::vector<std::string> tests;
    auto failed = std::sregex_iterator(output.begin(), output.end(), kFailedPattern);
    for (auto it = failed; it != std::sregex_iterator(); ++it) {
        AppendUnique(tests, (*it)[1].str());
    }
    auto sections = std::sregex_iterator(output.begin(), output.end(), kSectionPattern);
    for (auto it = sections; it != std::sregex_iterator(); ++it) {
        AppendUnique(tests, (*it)[1].str());
    }
    return tests;
}

std::string ErrorClassifier::ExtractExcerpt(const std::string& output, const std::string& error_type) {
    const auto lines = utils::SplitLines(output);
    if (!error_type.empty()) {
        const std::regex message_pattern(error_type + R"(:\s*(.+))");
        for (const auto& line : lines) {
            std::smatch match;
            if (std::regex_search(line, match, message_pattern)) {
                return utils::Truncate(error_type + ": " + utils::Trim(match[1].str()), kExcerptLimit);
            }
        }
    }
    std::vector<std::string> details;
    for (const auto& line : lines) {
        const auto trimmed = utils::Trim(line);
        if (trimmed.rfind("E ", 0) == 0 || trimmed.rfind("assert ", 0) == 0 || trimmed.rfind("> ", 0) == 0) {
            details.push_back(trimmed);
        }
        if (details.size() >= 6) {
            break;
        }
    }
    if (!details.empty()) {
        return utils::Truncate(utils::Join(details, "\n"), kExcerptLimit);
    }
    return utils::Truncate(TailLines(output, 5), kExcerptLimit);
}

AssertionHint ErrorClassifier::ExtractAssertionHint(const std::string& output) {
    AssertionHint hint{};
    const auto lines = utils::SplitLines(output);
    for (const auto* pattern : {&kPytestAssertPattern, &kSourceAssertPattern}) {
        for (const auto& line : lines) {
            std::smatch match;
            const auto trimmed = utils::Trim(line);
            if (std::regex_search(trimmed, match, *pattern)) {
                hint.actual = utils::Truncate(match[1].str(), 100);
                hint.expected = utils::Truncate(match[2].str(), 100);
                break;
            }
        }
        if (!hint.actual.empty()) {
            break;
        }
    }
    for (const auto& line : lines) {
        std::smatch match;
        const auto trimmed = utils::Trim(line);
        if (std::regex_search(trimmed, match, kWherePattern)) {
            hint.input = utils::Truncate(match[1].str(), 100);
            break;
        }
    }
    return hint;
}

std::optional<ClassifiedError> ErrorClassifier::Classify(
    const selfrepair::sandbox::ExecutionResult& result) const {
    if (result.Passed()) {
        return std::nullopt;
    }

    const auto combined = result.stdout_text + "\n" + result.stderr_text;
    const auto raised = ExtractRaisedExceptions(combined);
    const ClassificationInput input{result, combined, raised};

    ClassifiedError error{};
    for (const auto& rule : rules_) {
        if (rule.matches(input)) {
            error.kind = rule.kind;
            break;
        }
    }

    switch (error.kind) {
        case ErrorKind::kSyntax:
            error.error_type = FirstOf(raised, {"SyntaxError", "IndentationError", "TabError"});
            break;
        case ErrorKind::kName:
            error.error_type = FirstOf(raised, {"NameError", "UnboundLocalError", "ImportError", "ModuleNotFoundError"});
            break;
        case ErrorKind::kType:
            error.error_type = FirstOf(raised, {"TypeError", "AttributeError"});
            break;
        case ErrorKind::kTimeout:
            error.error_type = "Timeout";
            break;
        case ErrorKind::kRuntime:
            error.error_type = FirstUnexpected(raised);
            if (error.error_type.empty()) {
                error.error_type = result.resource_exceeded ? "ResourceLimitExceeded" : "Crash";
            }
            break;
        default:
            error.error_type = "AssertionError";
            break;
    }

    error.line_number = ExtractLineNumber(combined);
    error.failing_tests = ExtractFailingTests(combined);

    if (error.kind == ErrorKind::kTimeout) {
        error.excerpt = "Execution timed out and was terminated by the sandbox. "
                        "Check for infinite loops, excessive recursion or slow algorithms.";
    } else if (error.error_type == "ResourceLimitExceeded") {
        error.excerpt = "The run exceeded the sandbox memory limit.";
    } else if (error.error_type == "Crash") {
        error.excerpt = "The test run crashed (exit code " + std::to_string(result.exit_code) + ").";
        const auto tail = TailLines(combined, 3);
        if (!tail.empty()) {
            error.excerpt += "\n" + utils::Truncate(tail, kExcerptLimit);
        }
    } else {
        error.excerpt = ExtractExcerpt(combined, error.kind == ErrorKind::kLogic ? std::string() : error.error_type);
    }

    if (error.kind == ErrorKind::kLogic) {
        error.hint = ExtractAssertionHint(combined);
    }
    return error;
}

}  // namespace selfrepair::classify
