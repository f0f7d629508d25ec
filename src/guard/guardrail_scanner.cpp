#include "guard/guardrail_scanner.hpp"

#include <utility>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace selfrepair::guard {
namespace {

struct DefaultPattern {
    const char* category;
    const char* pattern;
};

const DefaultPattern kDefaultPatterns[] = {
    {kProcessExecution, R"(\bimport\s+(subprocess|pty|multiprocessing|signal)\b)"},
    {kProcessExecution, R"(\bfrom\s+(subprocess|pty|multiprocessing|signal)\s+import\b)"},
    {kProcessExecution, R"(\bsubprocess\s*\.)"},
    {kProcessExecution, R"(\bos\s*\.\s*(system|popen|spawn\w*|exec\w*|fork\w*|kill\w*|_exit)\b)"},
    {kProcessExecution, R"(\bfrom\s+os\s+import\s+.*\b(system|popen|spawn\w*|exec\w*|fork\w*|kill\w*)\b)"},
    {kProcessExecution, R"(\bfrom\s+(os|posix|nt)\s+import\s+\*)"},
    {kProcessExecution, R"((^|[^.\w])(system|popen|execv\w*|execl\w*|spawn\w*|fork)\s*\()"},
    {kProcessExecution, R"(\b(getattr|setattr|delattr)\s*\(\s*(os|posix|nt|sys|subprocess|shutil|io|pathlib|socket|builtins|__builtins__)\s*[,)])"},
    {kProcessExecution, R"(\bctypes\b)"},

    {kDynamicEvaluation, R"(\beval\s*\()"},
    {kDynamicEvaluation, R"(\bexec\s*\()"},
    {kDynamicEvaluation, R"((^|[^.\w])compile\s*\()"},
    {kDynamicEvaluation, R"(__import__\s*\()"},
    {kDynamicEvaluation, R"(\bimportlib\b)"},
    {kDynamicEvaluation, R"(\b(builtins|__builtins__)\b)"},
    {kDynamicEvaluation, R"(\b(globals|locals)\s*\(\s*\)\s*\[)"},
    {kDynamicEvaluation, R"(\b(getattr|setattr|delattr)\s*\([^,]+,(?!\s*['"]\w*['"]\s*[,)]))"},

    {kFilesystemMutation, R"(\bshutil\s*\.\s*(rmtree|move|copy\w*|chown|make_archive|unpack_archive)\b)"},
    {kFilesystemMutation, R"(\bos\s*\.\s*(remove|unlink|rmdir|removedirs|rename|renames|replace|chmod|chown|mkdir|makedirs|truncate|symlink|link|chdir)\b)"},
    // Any mode other than a read-only literal, including one held in a variable.
    {kFilesystemMutation, R"(\bopen\s*\([^,)]*,(?!\s*(['"][rbt]*['"]\s*[,)]|encoding\s*=|errors\s*=|newline\s*=|mode\s*=)))"},
    {kFilesystemMutation, R"(\bopen\s*\([^)]*\bmode\s*=(?!\s*['"][rbt]*['"]))"},
    {kFilesystemMutation, R"(\.\s*open\s*\((?!\s*(['"][rbt]*['"]\s*[,)]|\)|encoding\s*=)))"},
    {kFilesystemMutation, R"(\.\s*(write_text|write_bytes|unlink|rmdir|touch|mkdir|chmod|symlink_to|hardlink_to)\s*\()"},
    {kFilesystemMutation, R"(\bimport\s+tempfile\b|\btempfile\s*\.)"},

    {kNetworkAccess, R"(\bimport\s+(socket|ssl|requests|urllib\d?|http|httpx|aiohttp|ftplib|smtplib|telnetlib|poplib|imaplib|xmlrpc|paramiko|websocket\w*)\b)"},
    {kNetworkAccess, R"(\bfrom\s+(socket|ssl|requests|urllib\d?|http|httpx|aiohttp|ftplib|smtplib|telnetlib|poplib|imaplib|xmlrpc|paramiko|websocket\w*)\b)"},
    {kNetworkAccess, R"(\bsocket\s*\.)"},
    {kNetworkAccess, R"(\burlopen\s*\()"},
    {kNetworkAccess, R"(\brequests\s*\.\s*(get|post|put|delete|head|patch|request|Session)\b)"},
    {kNetworkAccess, R"(\b(https?|ftp|wss?)://)"},

    {kTestTampering, R"(^\s*def\s+test_\w*\s*\()"},
    {kTestTampering, R"(\b(import|from)\s+(pytest|_pytest|unittest|conftest)\b)"},
    {kTestTampering, R"(\b(sys\s*\.\s*exit|exit|quit)\s*\()"},
    {kTestTampering, R"(\bsys\s*\.\s*(modules|settrace|setprofile)\b)"},
    {kTestTampering, R"(\bAssertionError\s*=)"},
};

}  // namespace

GuardrailScanner::GuardrailScanner() {
    LoadDefaultRules();
}

GuardrailScanner::GuardrailScanner(const selfrepair::config::GuardrailConfig& config)
    : enabled_(config.enabled) {
    LoadDefaultRules();
    for (const auto& extra : config.extra_patterns) {
        AddRule(extra.category, extra.pattern);
    }
}

void GuardrailScanner::LoadDefaultRules() {
    for (const auto& item : kDefaultPatterns) {
        AddRule(item.category, item.pattern);
    }
}

bool GuardrailScanner::AddRule(const std::string& category, const std::string& pattern) {
    try {
        GuardRule rule{};
        rule.category = category;
        rule.pattern = pattern;
        rule.compiled = std::regex(pattern, std::regex::ECMAScript | std::regex::optimize);
        rules_.push_back(std::move(rule));
        return true;
    } catch (const std::regex_error& ex) {
        utils::Log(utils::LogLevel::kWarn, "guard", "skipping invalid pattern", {
            {"category", category},
            {"pattern", pattern},
            {"error", ex.what()}});
        return false;
    }
}

ScreenResult GuardrailScanner::Screen(const std::string& source) const {
    ScreenResult result{};
    if (!enabled_) {
        return result;
    }
    const auto lines = utils::SplitLines(source);
    for (const auto& rule : rules_) {
        for (std::size_t i = 0; i < lines.size(); ++i) {
            std::smatch match;
            if (!std::regex_search(lines[i], match, rule.compiled)) {
                continue;
            }
            result.blocked = true;
            result.category = rule.category;
            result.fragment = utils::Trim(match.str(0));
            result.line = static_cast<int>(i) + 1;
            result.reason = rule.category + ": forbidden construct '" + result.fragment +
                "' at line " + std::to_string(result.line);
            return result;
        }
    }
    return result;
}

}  // namespace selfrepair::guard
