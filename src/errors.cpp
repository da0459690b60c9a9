#include "errors.h"

namespace zc {

std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "none";
        case ErrorCode::VALIDATION: return "validation_error";
        case ErrorCode::UNKNOWN_ENTITY: return "unknown_entity";
        case ErrorCode::TRANSIENT_INGEST: return "transient_ingest_error";
        default: return "unknown";
    }
}

} // namespace zc
