// Copyright (c) 2025-2026 The fsguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <sstream>

namespace core {

// ---------------------------------------------------------------------------
// error_code_name: human-readable label for every ErrorCode variant
// ---------------------------------------------------------------------------
std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NONE:             return "NONE";

        case ErrorCode::PARSE_ERROR:      return "PARSE_ERROR";
        case ErrorCode::PARSE_BAD_FORMAT: return "PARSE_BAD_FORMAT";

        case ErrorCode::CONFIG_ERROR:     return "CONFIG_ERROR";
        case ErrorCode::CONFIG_MISSING:   return "CONFIG_MISSING";
        case ErrorCode::CONFIG_RANGE:     return "CONFIG_RANGE";

        case ErrorCode::IO_ERROR:         return "IO_ERROR";
        case ErrorCode::IO_NOT_FOUND:     return "IO_NOT_FOUND";
        case ErrorCode::IO_READ:          return "IO_READ";

        case ErrorCode::CRYPTO_ERROR:     return "CRYPTO_ERROR";
        case ErrorCode::CRYPTO_HASH_FAIL: return "CRYPTO_HASH_FAIL";

        case ErrorCode::INTERNAL_ERROR:   return "INTERNAL_ERROR";
    }

    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// Error::format: build a diagnostic string including source location
// ---------------------------------------------------------------------------
std::string Error::format() const {
    if (code_ == ErrorCode::NONE) {
        return "no error";
    }

    std::ostringstream oss;
    oss << error_code_name(code_)
        << '(' << static_cast<uint16_t>(code_) << ')';

    if (!message_.empty()) {
        oss << ": " << message_;
    }

    const char* file = location_.file_name();
    if (file && file[0] != '\0') {
        oss << " [" << file
            << ':' << location_.line()
            << ':' << location_.column() << ']';
    }

    return oss.str();
}

} // namespace core
