#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace geohash {

/**
 * Structured error reporting for the geohash library and tools.
 * Every error raised by the library derives from GeohashException.
 */

enum class ErrorCode {
    SUCCESS = 0,

    // Caller errors
    INVALID_ARGUMENT = 1,
    INVALID_SYMBOL = 2,

    // Tooling errors
    CONFIG_ERROR = 100,

    // Internal errors
    INTERNAL_ERROR = 500
};

inline const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::SUCCESS:          return "success";
        case ErrorCode::INVALID_ARGUMENT: return "invalid argument";
        case ErrorCode::INVALID_SYMBOL:   return "invalid symbol";
        case ErrorCode::CONFIG_ERROR:     return "configuration error";
        case ErrorCode::INTERNAL_ERROR:   return "internal error";
    }
    return "unknown";
}

class GeohashException : public std::runtime_error {
public:
    explicit GeohashException(ErrorCode code, const std::string& message,
                              const std::string& context = "",
                              const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "Geohash error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

/**
 * A character outside the 32-symbol geohash alphabet.
 * position() is the 0-based index in the hash string, or npos when
 * the symbol was looked up on its own.
 */
class InvalidSymbolError : public GeohashException {
public:
    static constexpr size_t npos = static_cast<size_t>(-1);

    explicit InvalidSymbolError(char symbol, size_t position = npos,
                                const std::string& context = "")
        : GeohashException(ErrorCode::INVALID_SYMBOL, describe(symbol, position), context,
                           "Geohash symbols are 0-9 and lowercase b-z excluding i, l and o")
        , symbol_(symbol)
        , position_(position) {}

    char symbol() const noexcept { return symbol_; }
    size_t position() const noexcept { return position_; }

private:
    static std::string describe(char symbol, size_t position) {
        std::string msg = "Invalid geohash symbol ";
        if (static_cast<unsigned char>(symbol) >= 0x20 && static_cast<unsigned char>(symbol) < 0x7f) {
            msg += "'" + std::string(1, symbol) + "'";
        } else {
            msg += "0x" + to_hex(static_cast<unsigned char>(symbol));
        }
        if (position != npos) {
            msg += " at position " + std::to_string(position);
        }
        return msg;
    }

    static std::string to_hex(unsigned char c) {
        static const char digits[] = "0123456789abcdef";
        return std::string{digits[c >> 4], digits[c & 0x0f]};
    }

    char symbol_;
    size_t position_;
};

class InvalidArgumentError : public GeohashException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : GeohashException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

class ConfigError : public GeohashException {
public:
    explicit ConfigError(const std::string& message,
                         const std::string& context = "",
                         const std::string& suggestion = "")
        : GeohashException(ErrorCode::CONFIG_ERROR, message, context, suggestion) {}
};

class ErrorHandler {
public:
    static void check_argument(bool condition, const std::string& message,
                               const std::string& context = "") {
        if (!condition) {
            throw InvalidArgumentError(message, context);
        }
    }
};

// Macros for common error checking
#define GEOHASH_CHECK_ARGUMENT(condition, message) \
    geohash::ErrorHandler::check_argument(condition, message, __func__)

#define GEOHASH_THROW_INVALID_ARG(message) \
    throw geohash::InvalidArgumentError(message, __func__)

} // namespace geohash
