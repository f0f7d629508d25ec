#pragma once

#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "classify/error_types.hpp"
#include "sandbox/execution_result.hpp"

namespace selfrepair::classify {

struct ClassificationInput {
    const selfrepair::sandbox::ExecutionResult& result;
    const std::string& combined_output;
    // Exception names the output shows as raised, in order of first appearance.
    const std::vector<std::string>& raised;
};

struct ClassificationRule {
    ErrorKind kind;
    std::function<bool(const ClassificationInput&)> matches;
};

class ErrorClassifier {
public:
    ErrorClassifier();

    // Empty for a passing result. Pure: the same result always yields the same error.
    std::optional<ClassifiedError> Classify(const selfrepair::sandbox::ExecutionResult& result) const;

    const std::vector<ClassificationRule>& Rules() const { return rules_; }

    static std::vector<std::string> ExtractRaisedExceptions(const std::string& output);
    static std::optional<int> ExtractLineNumber(const std::string& output);
    static std::vector<std::string> ExtractFailingTests(const std::string& output);
    static std::string ExtractExcerpt(const std::string& output, const std::string& error_type);
    static AssertionHint ExtractAssertionHint(const std::string& output);

private:
    std::vector<ClassificationRule> rules_;
};

}  // namespace selfrepair::classify
