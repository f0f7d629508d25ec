#pragma once

#include <regex>
#include <string>
#include <vector>

#include "config/config_schema.hpp"

namespace selfrepair::guard {

inline constexpr const char* kProcessExecution = "process_execution";
inline constexpr const char* kDynamicEvaluation = "dynamic_evaluation";
inline constexpr const char* kFilesystemMutation = "filesystem_mutation";
inline constexpr const char* kNetworkAccess = "network_access";
inline constexpr const char* kTestTampering = "test_tampering";

struct GuardRule {
    std::string category;
    std::string pattern;
    std::regex compiled;
};

struct ScreenResult {
    bool blocked = false;
    std::string category;
    std::string reason;
    std::string fragment;
    int line = 0;

    bool Allowed() const { return !blocked; }
};

class GuardrailScanner {
public:
    GuardrailScanner();
    explicit GuardrailScanner(const selfrepair::config::GuardrailConfig& config);

    // Rules are evaluated in insertion order; the first matching rule decides the category.
    bool AddRule(const std::string& category, const std::string& pattern);
    ScreenResult Screen(const std::string& source) const;

    const std::vector<GuardRule>& Rules() const { return rules_; }

private:
    bool enabled_ = true;
    std::vector<GuardRule> rules_;

    void LoadDefaultRules();
};

}  // namespace selfrepair::guard
