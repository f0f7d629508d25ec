#include "repair/patch_builder.hpp"

#include <algorithm>
#include <sstream>

#include "utils/common.hpp"

namespace selfrepair::repair {

using selfrepair::classify::ErrorKind;

const char* const kStepByStepInstruction =
    "Think step by step before writing code:\n"
    "1. What does each failing test expect?\n"
    "2. What is the current code actually doing?\n"
    "3. What is the smallest change that makes every test pass?\n"
    "Then return ONLY the complete corrected code, with no explanation.";

namespace {

constexpr std::size_t kMaxAssertionsInPrompt = 5;

void WriteCodeBlock(std::ostringstream& out, const std::string& code) {
    out << "```python\n" << code;
    if (code.empty() || code.back() != '\n') {
        out << "\n";
    }
    out << "```\n";
}

void WriteTaskHeader(std::ostringstream& out, const selfrepair::task::Task& task) {
    out << "Task: " << task.id << "\n";
    if (!task.signature.empty()) {
        out << "Signature: " << task.signature << "\n";
    }
    if (!task.description.empty()) {
        out << "\n" << task.description << "\n";
    }
}

void WriteFailingAssertions(std::ostringstream& out, const RepairRequest& request) {
    if (request.failing_assertions.empty()) {
        return;
    }
    out << "\nThe following test assertions failed:\n";
    const auto count = std::min(request.failing_assertions.size(), kMaxAssertionsInPrompt);
    for (std::size_t i = 0; i < count; ++i) {
        const auto& assertion = request.failing_assertions[i];
        out << "- " << assertion.name << ":\n";
        for (const auto& line : utils::SplitLines(assertion.code)) {
            out << "    " << line << "\n";
        }
    }
}

void WriteErrorSummary(std::ostringstream& out, const selfrepair::classify::ClassifiedError& error) {
    out << "\nError kind: " << ToString(error.kind) << "\n";
    if (!error.error_type.empty()) {
        out << "Error type: " << error.error_type << "\n";
    }
    out << "Line: " << (error.line_number ? std::to_string(*error.line_number) : std::string("unknown")) << "\n";
    if (!error.excerpt.empty()) {
        out << "Diagnostic:\n" << error.excerpt << "\n";
    }
}

std::string KindAdvice(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kSyntax:
            return "The code does not parse. Check parentheses, colons and indentation.";
        case ErrorKind::kName:
            return "An identifier is undefined. Check variable and function names and imports.";
        case ErrorKind::kType:
            return "A value has the wrong type or a call has the wrong arguments. Check data types and method calls.";
        case ErrorKind::kTimeout:
            return "The code ran past the time limit. Look for infinite loops, unbounded recursion or an "
                   "algorithm that is too slow.";
        case ErrorKind::kRuntime:
            return "The code raised an exception while running. Check boundary conditions and edge cases.";
        case ErrorKind::kLogic:
            return "The code runs but produces WRONG OUTPUT. Review the algorithm.";
        case ErrorKind::kBlocked:
            return "The code was rejected by the safety screen before it ran. Solve the task without process "
                   "execution, dynamic evaluation, file writes, network access or test manipulation.";
        case ErrorKind::kGenerationFailed:
            return "The previous response did not contain usable code.";
    }
    return {};
}

}  // namespace

RepairRequest PatchBuilder::BuildRepair(const selfrepair::task::Task& task,
                                        const selfrepair::task::Submission& submission,
                                        const selfrepair::classify::ClassifiedError& error) const {
    RepairRequest request{};
    request.task = task;
    request.submission = submission;
    request.error = error;
    for (const auto& failing : error.failing_tests) {
        for (std::size_t i = 0; i < task.tests.size(); ++i) {
            if (selfrepair::task::TestFunctionName(task.tests[i], i) == failing) {
                request.failing_assertions.push_back(task.tests[i]);
                break;
            }
        }
    }
    request.instruction = kStepByStepInstruction;
    return request;
}

std::string RenderGenerationPrompt(const selfrepair::task::Task& task) {
    std::ostringstream out;
    out << "Complete the following Python function. Return only the code, no explanations.\n\n";
    WriteTaskHeader(out, task);
    out << "\nConstraints:\n"
        << "- Keep the exact function signature\n"
        << "- No print statements or debug output\n"
        << "- Deterministic output only\n"
        << "- Use efficient algorithms\n"
        << "- Do not use subprocesses, eval/exec, file writes or network access\n"
        << "- Return ONLY the code, nothing else\n";
    return out.str();
}

std::string RenderRepairPrompt(const RepairRequest& request) {
    const auto& error = request.error;
    std::ostringstream out;
    out << "The code below failed. " << KindAdvice(error.kind) << "\n\n";
    WriteTaskHeader(out, request.task);
    out << "\nPrevious code:\n";
    WriteCodeBlock(out, request.submission.source);
    WriteErrorSummary(out, error);

    if (error.kind == ErrorKind::kLogic) {
        WriteFailingAssertions(out, request);
        if (!error.hint.Empty()) {
            out << "\nWhat went wrong:\n";
            if (!error.hint.input.empty()) {
                out << "  Input: " << error.hint.input << "\n";
            }
            if (!error.hint.expected.empty()) {
                out << "  Expected: " << error.hint.expected << "\n";
            }
            if (!error.hint.actual.empty()) {
                out << "  Got: " << error.hint.actual << "\n";
            }
        }
    } else {
        WriteFailingAssertions(out, request);
    }

    out << "\nInstructions:\n"
        << "- Keep the function signature unchanged\n"
        << "- Do NOT define or modify test functions\n\n"
        << request.instruction << "\n";
    return out.str();
}

}  // namespace selfrepair::repair
