#pragma once

#include <string>
#include <functional>
#include <vector>
#include <memory>
#include <stdexcept>
#include <cstdint>

namespace quantbox {

enum class ErrorCode {
    OK = 0,
    POLICY_INVALID,
    IMPORT_DENIED,
    SCRIPT_FAILED,
    TIMEOUT,
    OUTPUT_CONTRACT,
    EXECUTION_FAILED,
    SETUP_FAILED,
    VALIDATION_FAILED,
    INTERNAL_ERROR,
    UNKNOWN
};

// One failure as it crosses a module boundary. context names the layer
// that produced it ("sandbox", "tool", "config").
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;
    uint64_t timestamp;

    Error() : code(ErrorCode::OK), timestamp(0) {}
    Error(ErrorCode c, const std::string& msg) : code(c), message(msg), timestamp(0) {}

    bool isError() const { return code != ErrorCode::OK; }
    std::string describe() const;
};

template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_(), hasValue_(true) {}
    Result(Error error) : value_(), error_(std::move(error)), hasValue_(false) {}

    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }

    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }

    T valueOr(const T& defaultValue) const { return hasValue_ ? value_ : defaultValue; }

private:
    T value_;
    Error error_;
    bool hasValue_;
};

template<>
class Result<void> {
public:
    Result() : error_(), hasValue_(true) {}
    Result(Error error) : error_(std::move(error)), hasValue_(false) {}

    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }
    const Error& error() const { return error_; }

private:
    Error error_;
    bool hasValue_;
};

class QuantboxError : public std::runtime_error {
public:
    QuantboxError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}
    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

// Raised at configuration time for out-of-range or inconsistent policies.
class PolicyError : public QuantboxError {
public:
    explicit PolicyError(const std::string& message)
        : QuantboxError(ErrorCode::POLICY_INVALID, message) {}
};

// Raised by the data engines on misuse (unknown operator, ragged columns, ...).
class ValidationError : public QuantboxError {
public:
    explicit ValidationError(const std::string& message)
        : QuantboxError(ErrorCode::VALIDATION_FAILED, message) {}
};

// Keeps a bounded history of reported failures and forwards each one to an
// optional observer.
class ErrorHandler {
public:
    static ErrorHandler& instance();

    void setHandler(std::function<void(const Error&)> handler);
    void handle(const Error& error);
    void handle(ErrorCode code, const std::string& message);

    // Newest first.
    std::vector<Error> getRecentErrors(size_t count = 10) const;
    void clearErrors();

    uint64_t getErrorCount() const;
    uint64_t getErrorCount(ErrorCode code) const;

    Error getLastError() const;
    bool hasErrors() const;

private:
    ErrorHandler();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

const char* errorToString(ErrorCode code);
const char* errorCodeName(ErrorCode code);
void throwIfError(const Error& error);

Error makeError(ErrorCode code, const std::string& message);
Error makeError(ErrorCode code, const std::string& message, const std::string& context);

#define QUANTBOX_ERROR(code, msg) quantbox::Error{code, msg}
#define QUANTBOX_CHECK(expr, code, msg) if (!(expr)) return quantbox::Result<void>(QUANTBOX_ERROR(code, msg))

}
