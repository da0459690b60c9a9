#pragma once

#include <exception>
#include <string>

namespace zc {

/**
 * @brief Error categories reported by the counting engine
 */
enum class ErrorCode {
    NONE,
    VALIDATION,        ///< Malformed input, unknown camera in a definition, state unchanged
    UNKNOWN_ENTITY,    ///< Zone, line or camera not defined
    TRANSIENT_INGEST   ///< Sample dropped (unknown camera, bad coordinates)
};

/**
 * @brief Convert an ErrorCode to its wire name
 */
std::string errorCodeToString(ErrorCode code);

/**
 * @brief Base class of all engine errors
 */
class CounterError : public std::exception {
public:
    CounterError(ErrorCode code, const std::string& message) : code_(code), message_(message) {}
    const char* what() const noexcept override { return message_.c_str(); }
    ErrorCode code() const { return code_; }
private:
    ErrorCode code_;
    std::string message_;
};

class ValidationError : public CounterError {
public:
    explicit ValidationError(const std::string& message)
        : CounterError(ErrorCode::VALIDATION, message) {}
};

class UnknownEntityError : public CounterError {
public:
    explicit UnknownEntityError(const std::string& message)
        : CounterError(ErrorCode::UNKNOWN_ENTITY, message) {}
};

class TransientIngestError : public CounterError {
public:
    explicit TransientIngestError(const std::string& message)
        : CounterError(ErrorCode::TRANSIENT_INGEST, message) {}
};

} // namespace zc
