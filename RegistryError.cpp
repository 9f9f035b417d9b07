#include "RegistryError.h"

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidUrl:      return "InvalidUrl";
        case ErrorCode::InvalidCode:     return "InvalidCode";
        case ErrorCode::InvalidValidity: return "InvalidValidity";
        case ErrorCode::CodeTaken:       return "CodeTaken";
        case ErrorCode::NotFound:        return "NotFound";
        case ErrorCode::Expired:         return "Expired";
        case ErrorCode::Internal:        return "Internal";
    }
    return "Internal";
}
