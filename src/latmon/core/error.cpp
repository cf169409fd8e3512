#include "latmon/core/error.h"

namespace latmon {
namespace core {

const char* ErrorCodeName(Error::Code code) {
    switch (code) {
        case Error::Code::UNKNOWN: return "unknown";
        case Error::Code::INVALID_ARGUMENT: return "invalid_argument";
        case Error::Code::CAPTURE_FAILURE: return "capture_failure";
        case Error::Code::BUFFER_OVERFLOW: return "buffer_overflow";
        case Error::Code::COMMIT_FAILURE: return "commit_failure";
        case Error::Code::RETENTION_FAILURE: return "retention_failure";
        case Error::Code::QUERY_FAILURE: return "query_failure";
        case Error::Code::STORAGE_INIT: return "storage_init";
        case Error::Code::INTERNAL: return "internal";
    }
    return "unknown";
}

} // namespace core
} // namespace latmon
