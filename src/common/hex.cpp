#include "common/hex.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace bitcoin_vm {

std::string bytes_to_hex(const std::vector<uint8_t>& bytes) {
    std::ostringstream oss;
    for (uint8_t byte : bytes) {
        oss << std::setfill('0') << std::setw(2) << std::hex << static_cast<int>(byte);
    }
    return oss.str();
}

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::vector<uint8_t> bytes_from_hex(const std::string& hex) {
    size_t start = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        start = 2;
    }
    if ((hex.size() - start) % 2 != 0) {
        throw std::invalid_argument("hex string has odd length: " + hex);
    }

    std::vector<uint8_t> bytes;
    bytes.reserve((hex.size() - start) / 2);
    for (size_t i = start; i < hex.size(); i += 2) {
        const int hi = hex_digit(hex[i]);
        const int lo = hex_digit(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid hex character in: " + hex);
        }
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return bytes;
}

} // namespace bitcoin_vm
