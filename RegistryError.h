#pragma once

#include <stdexcept>
#include <string>

enum class ErrorCode {
    InvalidUrl,
    InvalidCode,
    InvalidValidity,
    CodeTaken,
    NotFound,
    Expired,
    Internal
};

// Thrown by the registry and the components built on it. Callers map the code
// to a transport status; none of these are retried.
class RegistryError : public std::runtime_error {
public:
    RegistryError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), errorCode(code) {}

    ErrorCode code() const noexcept { return errorCode; }

private:
    ErrorCode errorCode;
};

const char* errorCodeName(ErrorCode code);
