#include "CodeGenerator.h"
#include <random>
#include <stdexcept>

const std::string CodeGenerator::ALPHABET = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

CodeGenerator::CodeGenerator(std::size_t length) : codeLength(length) {
    if (codeLength < Config::MIN_CUSTOM_CODE_LENGTH) {
        throw std::invalid_argument("Short code length must be at least " +
                                    std::to_string(Config::MIN_CUSTOM_CODE_LENGTH));
    }
}

std::string CodeGenerator::generate() {
    // One engine per worker thread so concurrent creates never share state
    static thread_local std::mt19937 generator{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> distribution(0, ALPHABET.size() - 1);

    std::string code;
    code.reserve(codeLength);
    for (std::size_t i = 0; i < codeLength; ++i)
        code += ALPHABET[distribution(generator)];
    return code;
}
