#include "util/result.hpp"

#include <cassert>
#include <string>

std::string getErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidInput:
            return "InvalidInput";
        case ErrorKind::InvalidHandInput:
            return "InvalidHandInput";
        case ErrorKind::IllegalAction:
            return "IllegalAction";
        case ErrorKind::PotAccountingViolation:
            return "PotAccountingViolation";
        default:
            assert(false);
            return "???";
    }
}
