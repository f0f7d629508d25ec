#include "generator/code_extraction.hpp"

#include <vector>

#include "utils/common.hpp"

namespace selfrepair::generator {

namespace {

bool ExtractFenced(const std::string& reply, std::string& code) {
    const auto open = reply.find("```");
    if (open == std::string::npos) {
        return false;
    }
    // Skip the language tag on the opening fence.
    const auto body_start = reply.find('\n', open + 3);
    if (body_start == std::string::npos) {
        return false;
    }
    const auto close = reply.find("```", body_start + 1);
    if (close == std::string::npos) {
        return false;
    }
    code = utils::Trim(reply.substr(body_start + 1, close - body_start - 1));
    return true;
}

bool ExtractTagged(const std::string& reply, std::string& code) {
    static const std::string kOpen = "[PYTHON]";
    static const std::string kClose = "[/PYTHON]";
    const auto open = reply.find(kOpen);
    if (open == std::string::npos) {
        return false;
    }
    const auto body_start = open + kOpen.size();
    const auto close = reply.find(kClose, body_start);
    if (close == std::string::npos) {
        return false;
    }
    code = utils::Trim(reply.substr(body_start, close - body_start));
    return true;
}

bool LooksLikeCode(const std::string& line) {
    static const std::vector<std::string> kPrefixes = {
        "#", "def ", "class ", "import ", "from ", "return ", "if ", "for ", "while ", "@"};
    const auto trimmed = utils::Trim(line);
    for (const auto& prefix : kPrefixes) {
        if (trimmed.rfind(prefix, 0) == 0) {
            return true;
        }
    }
    return false;
}

bool ExtractFromFirstCodeLine(const std::string& reply, std::string& code) {
    const auto lines = utils::SplitLines(reply);
    std::vector<std::string> kept;
    bool in_code = false;
    for (const auto& line : lines) {
        if (!in_code && LooksLikeCode(line)) {
            in_code = true;
        }
        if (in_code) {
            kept.push_back(line);
        }
    }
    if (kept.empty()) {
        return false;
    }
    code = utils::Trim(utils::Join(kept, "\n"));
    return !code.empty();
}

}  // namespace

std::string ExtractCode(const std::string& reply) {
    std::string code;
    if (ExtractFenced(reply, code) && !code.empty()) {
        return code;
    }
    if (ExtractTagged(reply, code) && !code.empty()) {
        return code;
    }
    if (ExtractFromFirstCodeLine(reply, code)) {
        return code;
    }
    return utils::Trim(reply);
}

}  // namespace selfrepair::generator
