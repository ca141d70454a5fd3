/// @file core.cpp
#include "core.hpp"

namespace cave::core {

std::string_view version() noexcept {
    return "0.1.0";
}

std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:           return "Success";
        case ErrorCode::kFileNotFound:      return "FileNotFound";
        case ErrorCode::kParseError:        return "ParseError";
        case ErrorCode::kInvalidArgument:   return "InvalidArgument";
        case ErrorCode::kValidationError:   return "ValidationError";
        case ErrorCode::kConnectivityError: return "ConnectivityError";
        case ErrorCode::kViewError:         return "ViewError";
        case ErrorCode::kUnsupportedFormat: return "UnsupportedFormat";
        case ErrorCode::kWriteError:        return "WriteError";
        default:                            return "Unknown";
    }
}

}  // namespace cave::core
