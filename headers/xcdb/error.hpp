//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef XCDB_ERROR_HPP
#define XCDB_ERROR_HPP

/**
 * @file error.hpp
 * @brief Error type shared by the log scanner, the command processor
 *        and the CLI.
 *
 * Errors carry a category, a message and an optional context string
 * (usually the offending path or log line). Recoverable conditions inside
 * a log section never surface as an Error; anything returned through
 * Result<T, Error> stops the conversion.
 *
 * Usage:
 * @code
 *     auto record = processor.process_compile_command(line, directory);
 *     if (record.is_err()) {
 *         std::cerr << record.error() << std::endl;
 *         // Output: [UnresolvedHeader] Cannot find original header for
 *         //         precompiled header (context: /tmp/Prefix.pch)
 *     }
 * @endcode
 */

#include <string>
#include <optional>
#include <ostream>
#include <utility>

namespace xcdb {

    /**
     * Error category enumeration.
     */
    enum class ErrorCode {
        None,             ///< No error
        InvalidArgument,  ///< Invalid argument or parameter
        NotFound,         ///< Input file or resource not found
        ParseError,       ///< Command line or JSON could not be parsed
        IoError,          ///< I/O operation failed
        ConfigError,      ///< Configuration or exclusion pattern error
        UnresolvedHeader, ///< -include names neither a file nor a known PCH
        MissingSource,    ///< Compiler invocation without a -c argument
        InternalError     ///< Internal/unexpected error
    };

    /**
     * Converts an ErrorCode to its string representation.
     */
    inline const char* error_code_to_string(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::None:             return "None";
            case ErrorCode::InvalidArgument:  return "InvalidArgument";
            case ErrorCode::NotFound:         return "NotFound";
            case ErrorCode::ParseError:       return "ParseError";
            case ErrorCode::IoError:          return "IoError";
            case ErrorCode::ConfigError:      return "ConfigError";
            case ErrorCode::UnresolvedHeader: return "UnresolvedHeader";
            case ErrorCode::MissingSource:    return "MissingSource";
            case ErrorCode::InternalError:    return "InternalError";
        }
        return "Unknown";
    }

    /**
     * Structured error with code, message, and optional context.
     *
     * Error objects are immutable after construction.
     */
    class Error {
    public:
        Error(ErrorCode code, std::string message)
            : code_(code)
            , message_(std::move(message))
            , context_(std::nullopt) {}

        Error(ErrorCode code, std::string message, std::string context)
            : code_(code)
            , message_(std::move(message))
            , context_(std::move(context)) {}

        static Error invalid_argument(std::string message) {
            return {ErrorCode::InvalidArgument, std::move(message)};
        }

        static Error invalid_argument(std::string message, std::string context) {
            return {ErrorCode::InvalidArgument, std::move(message), std::move(context)};
        }

        static Error not_found(std::string message, std::string context) {
            return {ErrorCode::NotFound, std::move(message), std::move(context)};
        }

        static Error parse_error(std::string message) {
            return {ErrorCode::ParseError, std::move(message)};
        }

        static Error parse_error(std::string message, std::string context) {
            return {ErrorCode::ParseError, std::move(message), std::move(context)};
        }

        static Error io_error(std::string message, std::string context) {
            return {ErrorCode::IoError, std::move(message), std::move(context)};
        }

        static Error config_error(std::string message) {
            return {ErrorCode::ConfigError, std::move(message)};
        }

        static Error config_error(std::string message, std::string context) {
            return {ErrorCode::ConfigError, std::move(message), std::move(context)};
        }

        /**
         * Creates an error for an -include argument that is neither an
         * existing file nor a registered precompiled header artifact.
         */
        static Error unresolved_header(std::string include_path) {
            return {ErrorCode::UnresolvedHeader,
                    "Cannot find original header for precompiled header",
                    std::move(include_path)};
        }

        /**
         * Creates an error for a compiler invocation with no -c argument.
         */
        static Error missing_source(std::string command_line) {
            return {ErrorCode::MissingSource,
                    "Compiler invocation has no -c source file",
                    std::move(command_line)};
        }

        static Error internal_error(std::string message) {
            return {ErrorCode::InternalError, std::move(message)};
        }

        [[nodiscard]] ErrorCode code() const noexcept {
            return code_;
        }

        [[nodiscard]] const std::string& message() const noexcept {
            return message_;
        }

        [[nodiscard]] const std::optional<std::string>& context() const noexcept {
            return context_;
        }

        [[nodiscard]] bool has_context() const noexcept {
            return context_.has_value();
        }

        /**
         * Creates a new error with additional context appended.
         *
         * @param additional_context Context to append.
         * @return A new Error with combined context.
         */
        [[nodiscard]] Error with_context(std::string additional_context) const {
            if (context_.has_value()) {
                return {code_, message_, *context_ + "; " + std::move(additional_context)};
            }
            return {code_, message_, std::move(additional_context)};
        }

        /**
         * Formats the error as "[Code] message" or
         * "[Code] message (context: ...)".
         */
        [[nodiscard]] std::string to_string() const {
            std::string result = "[";
            result += error_code_to_string(code_);
            result += "] ";
            result += message_;
            if (context_.has_value()) {
                result += " (context: ";
                result += *context_;
                result += ")";
            }
            return result;
        }

        bool operator==(const Error& other) const {
            return code_ == other.code_ &&
                   message_ == other.message_ &&
                   context_ == other.context_;
        }

        bool operator!=(const Error& other) const {
            return !(*this == other);
        }

    private:
        ErrorCode code_;
        std::string message_;
        std::optional<std::string> context_;
    };

    inline std::ostream& operator<<(std::ostream& os, const Error& error) {
        return os << error.to_string();
    }

    inline std::ostream& operator<<(std::ostream& os, ErrorCode code) {
        return os << error_code_to_string(code);
    }

}  // namespace xcdb

#endif //XCDB_ERROR_HPP
