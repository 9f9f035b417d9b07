#pragma once

#include <cstddef>
#include <string>

#include "Config.h"

// Random alphanumeric short codes. Uniqueness is the registry's job: it keeps
// drawing until a code is free.
class CodeGenerator {
public:
    static const std::string ALPHABET;

    explicit CodeGenerator(std::size_t length = Config::SHORT_CODE_LENGTH);
    virtual ~CodeGenerator() = default;

    virtual std::string generate();

    std::size_t length() const { return codeLength; }

private:
    std::size_t codeLength;
};
