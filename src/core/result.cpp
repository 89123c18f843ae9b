/*
 * HiveMem C++ - Status and error codes Implementation
 */
#include <hivemem/core/result.hpp>

namespace hivemem {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "none";
        case ErrorCode::VALIDATION: return "validation_error";
        case ErrorCode::ACCESS_DENIED: return "access_denied";
        case ErrorCode::NOT_FOUND: return "not_found";
        case ErrorCode::STORAGE: return "storage_error";
        case ErrorCode::SYNC: return "sync_error";
        case ErrorCode::CONSOLIDATION_CONFLICT: return "consolidation_conflict";
        default: return "unknown";
    }
}

} // namespace hivemem
