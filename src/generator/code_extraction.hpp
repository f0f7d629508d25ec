#pragma once

#include <string>

namespace selfrepair::generator {

// Pulls Python source out of a model reply. Tries fenced markdown blocks,
// then [PYTHON] tags, then everything from the first code-like line, and
// finally falls back to the trimmed reply.
std::string ExtractCode(const std::string& reply);

}  // namespace selfrepair::generator
