/*
 * HiveMem C++ - Tool result
 */
#ifndef hivemem_TOOL_TOOL_HPP
#define hivemem_TOOL_TOOL_HPP

#include <hivemem/core/json.hpp>
#include <hivemem/core/result.hpp>
#include <string>

namespace hivemem {

struct ToolResult {
    bool success;
    Json data;
    std::string error;      // "<CODE>: message" on failure

    ToolResult() : success(false), data(Json::object()) {}

    static ToolResult ok(const Json& data) {
        ToolResult r;
        r.success = true;
        r.data = data;
        return r;
    }

    static ToolResult fail(const std::string& err) {
        ToolResult r;
        r.success = false;
        r.error = err;
        return r;
    }

    static ToolResult fail(const Status& status) {
        return fail(std::string(error_code_name(status.code)) + ": " + status.error);
    }

    // {"success":..., "output":..., "error":...}
    Json to_json() const {
        Json j;
        j["success"] = success;
        if (success) {
            j["output"] = data;
        } else {
            j["error"] = error;
        }
        return j;
    }
};

} // namespace hivemem

#endif // hivemem_TOOL_TOOL_HPP
