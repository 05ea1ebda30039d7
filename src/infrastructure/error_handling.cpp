#include "infrastructure/error_handling.h"
#include <algorithm>
#include <array>
#include <ctime>
#include <deque>
#include <mutex>

namespace quantbox {

namespace {

struct CodeInfo {
    ErrorCode code;
    const char* name;
    const char* text;
};

// Names match the error_type strings reported in execution results.
const CodeInfo CODE_TABLE[] = {
    {ErrorCode::OK, "", "OK"},
    {ErrorCode::POLICY_INVALID, "PolicyError", "Invalid isolation policy"},
    {ErrorCode::IMPORT_DENIED, "ImportDenied", "Import denied"},
    {ErrorCode::SCRIPT_FAILED, "ScriptError", "Script raised an exception"},
    {ErrorCode::TIMEOUT, "TimeoutError", "Timeout"},
    {ErrorCode::OUTPUT_CONTRACT, "OutputContractError", "Output contract violated"},
    {ErrorCode::EXECUTION_FAILED, "ExecutionError", "Execution failed"},
    {ErrorCode::SETUP_FAILED, "SetupError", "Execution setup failed"},
    {ErrorCode::VALIDATION_FAILED, "ValidationError", "Validation failed"},
    {ErrorCode::INTERNAL_ERROR, "InternalError", "Internal error"},
};

const CodeInfo UNKNOWN_CODE = {ErrorCode::UNKNOWN, "UnknownError", "Unknown error"};

const CodeInfo& infoFor(ErrorCode code) {
    for (const auto& info : CODE_TABLE) {
        if (info.code == code) return info;
    }
    return UNKNOWN_CODE;
}

constexpr size_t CODE_SLOTS = static_cast<size_t>(ErrorCode::UNKNOWN) + 1;
constexpr size_t HISTORY_LIMIT = 100;

uint64_t now() {
    return static_cast<uint64_t>(std::time(nullptr));
}

}

std::string Error::describe() const {
    if (!isError()) return "ok";
    std::string out = std::string(errorCodeName(code)) + ": " + message;
    if (!context.empty()) out += " (" + context + ")";
    return out;
}

const char* errorToString(ErrorCode code) {
    return infoFor(code).text;
}

const char* errorCodeName(ErrorCode code) {
    return infoFor(code).name;
}

void throwIfError(const Error& error) {
    if (!error.isError()) return;
    std::string what = error.context.empty() ? error.message : error.message + " [" + error.context + "]";
    if (error.code == ErrorCode::POLICY_INVALID) throw PolicyError(what);
    if (error.code == ErrorCode::VALIDATION_FAILED) throw ValidationError(what);
    throw QuantboxError(error.code, what);
}

Error makeError(ErrorCode code, const std::string& message) {
    Error err(code, message);
    err.timestamp = now();
    return err;
}

Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    Error err = makeError(code, message);
    err.context = context;
    return err;
}

struct ErrorHandler::Impl {
    mutable std::mutex mtx;
    std::function<void(const Error&)> observer;
    std::deque<Error> history;
    std::array<uint64_t, CODE_SLOTS> perCode{};
    uint64_t total = 0;
};

ErrorHandler::ErrorHandler() : impl_(std::make_unique<Impl>()) {}

ErrorHandler& ErrorHandler::instance() {
    static ErrorHandler inst;
    return inst;
}

void ErrorHandler::setHandler(std::function<void(const Error&)> handler) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->observer = std::move(handler);
}

void ErrorHandler::handle(const Error& error) {
    Error recorded = error;
    if (recorded.timestamp == 0) recorded.timestamp = now();

    std::function<void(const Error&)> observer;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->history.push_front(recorded);
        if (impl_->history.size() > HISTORY_LIMIT) impl_->history.pop_back();
        size_t slot = static_cast<size_t>(recorded.code);
        impl_->perCode[slot < CODE_SLOTS ? slot : CODE_SLOTS - 1]++;
        impl_->total++;
        observer = impl_->observer;
    }
    // Called outside the lock so an observer may query the handler.
    if (observer) observer(recorded);
}

void ErrorHandler::handle(ErrorCode code, const std::string& message) {
    handle(makeError(code, message));
}

std::vector<Error> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    size_t n = std::min(count, impl_->history.size());
    return std::vector<Error>(impl_->history.begin(), impl_->history.begin() + static_cast<std::ptrdiff_t>(n));
}

void ErrorHandler::clearErrors() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->history.clear();
    impl_->perCode.fill(0);
    impl_->total = 0;
}

uint64_t ErrorHandler::getErrorCount() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->total;
}

uint64_t ErrorHandler::getErrorCount(ErrorCode code) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    size_t slot = static_cast<size_t>(code);
    return slot < CODE_SLOTS ? impl_->perCode[slot] : 0;
}

Error ErrorHandler::getLastError() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->history.empty() ? Error{} : impl_->history.front();
}

bool ErrorHandler::hasErrors() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return !impl_->history.empty();
}

}
