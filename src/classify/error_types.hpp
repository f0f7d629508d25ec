#pragma once

#include <optional>
#include <string>
#include <vector>

namespace selfrepair::classify {

enum class ErrorKind {
    kGenerationFailed,
    kBlocked,
    kSyntax,
    kName,
    kType,
    kTimeout,
    kRuntime,
    kLogic
};

const char* ToString(ErrorKind kind);
std::optional<ErrorKind> ParseErrorKind(const std::string& value);

struct AssertionHint {
    std::string actual;
    std::string expected;
    std::string input;

    bool Empty() const { return actual.empty() && expected.empty() && input.empty(); }
};

struct ClassifiedError {
    ErrorKind kind = ErrorKind::kLogic;
    std::string error_type;
    std::optional<int> line_number;
    std::vector<std::string> failing_tests;
    std::string excerpt;
    AssertionHint hint;

    // Two failures with the same signature are treated as the same mistake.
    std::string Signature() const;
};

ClassifiedError MakeGenerationFailure(const std::string& reason);
ClassifiedError MakeBlocked(const std::string& reason);

}  // namespace selfrepair::classify
