#pragma once

#include <cctype>
#include <string>
#include <vector>

namespace selfrepair::task {

struct TestAssertion {
    std::string name;
    std::string code;
};

struct Task {
    std::string id;
    std::string signature;
    std::string description;
    std::vector<TestAssertion> tests;
};

// pytest collects only test_ functions; names are made identifier-safe and
// prefixed. index is the zero-based position, used when the name is empty.
inline std::string CanonicalTestName(const std::string& name, std::size_t index) {
    std::string cleaned;
    for (const unsigned char c : name) {
        cleaned.push_back(std::isalnum(c) ? static_cast<char>(c) : '_');
    }
    if (cleaned.empty()) {
        cleaned = std::to_string(index + 1);
    }
    if (cleaned.rfind("test_", 0) != 0) {
        cleaned = "test_" + cleaned;
    }
    return cleaned;
}

// The function pytest reports for an assertion: the name a "def" body
// defines, otherwise the canonical name of the bare assertion.
inline std::string TestFunctionName(const TestAssertion& test, std::size_t index) {
    std::size_t pos = test.code.find_first_not_of(" \t\r\n");
    if (pos != std::string::npos && test.code.compare(pos, 4, "def ") == 0) {
        pos = test.code.find_first_not_of(" \t", pos + 4);
        std::size_t end = pos;
        while (end < test.code.size() &&
               (std::isalnum(static_cast<unsigned char>(test.code[end])) || test.code[end] == '_')) {
            ++end;
        }
        if (pos != std::string::npos && end > pos) {
            return test.code.substr(pos, end - pos);
        }
    }
    return CanonicalTestName(test.name, index);
}

struct Submission {
    std::string source;
    int attempt = 0;
};

}  // namespace selfrepair::task
