#include "pool/error_classifier.hpp"
#include <algorithm>

namespace sqlpool {

bool is_fatal_server_code(uint32_t code) {
    return std::find(kFatalServerErrorCodes.begin(), kFatalServerErrorCodes.end(), code)
        != kFatalServerErrorCodes.end();
}

bool is_fatal_error(const Error& err) {
    switch (err.category) {
        case ErrorCategory::NONE:
        case ErrorCategory::END_OF_STREAM:
            return false;
        case ErrorCategory::DRIVER_ERROR:
            return err.code >= kFirstClientErrorCode || is_fatal_server_code(err.code);
        default:
            return true;
    }
}

} // namespace sqlpool
