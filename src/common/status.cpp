#include "runbox/common/status.hpp"

namespace runbox {

const char *status_code(status st) {
    switch (st) {
        case status::OK:
            return "OK";
        case status::RUNTIME_ERROR:
            return "RE";
        case status::SIGNALED:
        case status::SELF_SIGNALED:
            return "SG";
        case status::TIMEOUT:
            return "TO";
        case status::FORBIDDEN_SYSCALL:
            return "FO";
        case status::FORBIDDEN_FILE:
            return "FA";
        case status::INTERNAL_ERROR:
        default:
            return "XX";
    }
}

int exit_code_of(status st) {
    switch (st) {
        case status::OK:
            return 0;
        case status::INTERNAL_ERROR:
            return 2;
        default:
            return 1;
    }
}

}  // namespace runbox
