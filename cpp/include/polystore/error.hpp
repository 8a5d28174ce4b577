#pragma once

#include <stdexcept>
#include <string>

namespace polystore {

/**
 * Structured error reporting with context and recovery suggestions.
 *
 * Adapters (chunk stores, record stores, sources) throw these; the saga core
 * converts them into tagged results or recorded errors.
 */

enum class ErrorCode {
    INVALID_ARGUMENT = 1,

    // Database errors
    CONNECTION_FAILED = 100,

    // Storage errors
    STORAGE_BACKEND = 200,
    STORE_FAILED = 201,
    INTEGRITY_MISMATCH = 202,

    // Source errors
    SOURCE_NOT_FOUND = 300,
    CHUNK_METADATA_CORRUPT = 301,
    FILE_NOT_FOUND = 302
};

class PolystoreException : public std::runtime_error {
public:
    explicit PolystoreException(ErrorCode code, const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , message_(message)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    // Message without the code/context decoration
    const std::string& message() const noexcept { return message_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "Polystore error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string message_;
    std::string context_;
    std::string suggestion_;
};

// Convenience exception types
class InvalidArgumentError : public PolystoreException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : PolystoreException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

class DatabaseError : public PolystoreException {
public:
    explicit DatabaseError(const std::string& message,
                           const std::string& context = "",
                           const std::string& suggestion = "")
        : PolystoreException(ErrorCode::CONNECTION_FAILED, message, context, suggestion) {}
};

class IOError : public PolystoreException {
public:
    explicit IOError(const std::string& message,
                     const std::string& context = "",
                     const std::string& suggestion = "")
        : PolystoreException(ErrorCode::FILE_NOT_FOUND, message, context, suggestion) {}
};

// Transient chunk-store failure; the uploader retries these
class StorageError : public PolystoreException {
public:
    explicit StorageError(const std::string& message,
                          const std::string& context = "",
                          const std::string& suggestion = "")
        : PolystoreException(ErrorCode::STORAGE_BACKEND, message, context, suggestion) {}
};

// Source artifact vanished or can no longer be read; never retried
class SourceUnavailableError : public PolystoreException {
public:
    explicit SourceUnavailableError(const std::string& message,
                                    const std::string& context = "",
                                    const std::string& suggestion = "")
        : PolystoreException(ErrorCode::SOURCE_NOT_FOUND, message, context, suggestion) {}
};

class ChunkMetadataCorruptError : public PolystoreException {
public:
    explicit ChunkMetadataCorruptError(const std::string& message,
                                       const std::string& context = "",
                                       const std::string& suggestion = "")
        : PolystoreException(ErrorCode::CHUNK_METADATA_CORRUPT, message, context, suggestion) {}
};

// Downstream (vector / graph / relational) driver failure
class StoreError : public PolystoreException {
public:
    explicit StoreError(const std::string& message,
                        const std::string& context = "",
                        const std::string& suggestion = "")
        : PolystoreException(ErrorCode::STORE_FAILED, message, context, suggestion) {}
};

// Stored bytes do not match what was recorded at upload time
class IntegrityError : public PolystoreException {
public:
    explicit IntegrityError(const std::string& message,
                            const std::string& context = "",
                            const std::string& suggestion = "")
        : PolystoreException(ErrorCode::INTEGRITY_MISMATCH, message, context, suggestion) {}
};

// Error handling utilities
class ErrorHandler {
public:
    static void check_condition(bool condition, ErrorCode code,
                                const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "") {
        if (!condition) {
            if (code == ErrorCode::INVALID_ARGUMENT) {
                throw InvalidArgumentError(message, context, suggestion);
            }
            throw PolystoreException(code, message, context, suggestion);
        }
    }
};

// Macros for common error checking
#define POLYSTORE_CHECK(condition, code, message) \
    polystore::ErrorHandler::check_condition(condition, code, message, __func__)

#define POLYSTORE_CHECK_ARGUMENT(condition, message) \
    POLYSTORE_CHECK(condition, polystore::ErrorCode::INVALID_ARGUMENT, message)

} // namespace polystore
