// =============================================================================
// zone-config - Error Handling Framework Implementation
// =============================================================================

#include "zcfg/common/error.h"

#include <sstream>

#include <fmt/format.h>

namespace zcfg {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (!filePath.empty()) {
        oss << "file: " << filePath;
        hasContent = true;
    }

    if (!field.empty()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "field: " << field;
        hasContent = true;
    }

    if (elementIndex.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "element: " << *elementIndex;
        hasContent = true;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// ZCFGException Implementation
// =============================================================================

void ZCFGException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

// =============================================================================
// Error Implementation
// =============================================================================

Error::Error(const ZCFGException& ex) : code_(ex.code()), message_(ex.message()) {
    if (ex.hasContext()) {
        std::string contextStr = ex.context()->format();
        if (!contextStr.empty()) {
            message_ += fmt::format(" ({})", contextStr);
        }
    }
}

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kParseError:
            throw ParseError(message_);
        case ErrorCode::kMisuseError:
            throw MisuseError(message_);
        default:
            break;
    }
    throw ZCFGException(code_, message_);
}

}  // namespace zcfg
