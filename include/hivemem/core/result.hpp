/*
 * HiveMem C++ - Operation results
 *
 *   ErrorCode  - failure taxonomy shared by every subsystem
 *   Status     - success flag + code + message
 *   Result<T>  - Status carrying a value on success
 */
#ifndef hivemem_CORE_RESULT_HPP
#define hivemem_CORE_RESULT_HPP

#include <string>
#include <utility>

namespace hivemem {

enum class ErrorCode {
    NONE = 0,
    VALIDATION,               // malformed input, caller's fault
    ACCESS_DENIED,            // ACL check failed
    NOT_FOUND,                // absent or expired
    STORAGE,                  // SQLite failure, surfaced as-is
    SYNC,                     // peer unreachable / bad delta
    CONSOLIDATION_CONFLICT    // equally ranked merge candidates
};

const char* error_code_name(ErrorCode code);

struct Status {
    bool success;
    ErrorCode code;
    std::string error;

    Status() : success(true), code(ErrorCode::NONE) {}

    static Status ok() { return Status(); }

    static Status fail(ErrorCode c, const std::string& err) {
        Status s;
        s.success = false;
        s.code = c;
        s.error = err;
        return s;
    }

    explicit operator bool() const { return success; }
};

template<typename T>
struct Result {
    bool success;
    ErrorCode code;
    std::string error;
    T value;

    Result() : success(false), code(ErrorCode::NONE), value() {}

    static Result ok(T v) {
        Result r;
        r.success = true;
        r.value = std::move(v);
        return r;
    }

    static Result fail(ErrorCode c, const std::string& err) {
        Result r;
        r.success = false;
        r.code = c;
        r.error = err;
        return r;
    }

    static Result fail(const Status& status) {
        return fail(status.code, status.error);
    }

    Status status() const {
        return success ? Status::ok() : Status::fail(code, error);
    }

    explicit operator bool() const { return success; }
};

} // namespace hivemem

#endif // hivemem_CORE_RESULT_HPP
