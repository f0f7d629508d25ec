#include "classify/error_types.hpp"

namespace selfrepair::classify {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kGenerationFailed: return "GENERATION_FAILED";
        case ErrorKind::kBlocked: return "BLOCKED";
        case ErrorKind::kSyntax: return "SYNTAX";
        case ErrorKind::kName: return "NAME";
        case ErrorKind::kType: return "TYPE";
        case ErrorKind::kTimeout: return "TIMEOUT";
        case ErrorKind::kRuntime: return "RUNTIME";
        case ErrorKind::kLogic: return "LOGIC";
    }
    return "UNKNOWN";
}

std::optional<ErrorKind> ParseErrorKind(const std::string& value) {
    static const ErrorKind kAll[] = {
        ErrorKind::kGenerationFailed,
        ErrorKind::kBlocked,
        ErrorKind::kSyntax,
        ErrorKind::kName,
        ErrorKind::kType,
        ErrorKind::kTimeout,
        ErrorKind::kRuntime,
        ErrorKind::kLogic
    };
    for (const auto kind : kAll) {
        if (value == ToString(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

std::string ClassifiedError::Signature() const {
    std::string signature = ToString(kind);
    signature += ":";
    signature += error_type;
    signature += ":";
    signature += line_number ? std::to_string(*line_number) : "-";
    return signature;
}

ClassifiedError MakeGenerationFailure(const std::string& reason) {
    ClassifiedError error{};
    error.kind = ErrorKind::kGenerationFailed;
    error.error_type = "GenerationError";
    error.excerpt = reason;
    return error;
}

ClassifiedError MakeBlocked(const std::string& reason) {
    ClassifiedError error{};
    error.kind = ErrorKind::kBlocked;
    error.error_type = "GuardrailViolation";
    error.excerpt = reason;
    return error;
}

}  // namespace selfrepair::classify
