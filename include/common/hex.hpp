#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace bitcoin_vm {

// Lowercase, two characters per byte
std::string bytes_to_hex(const std::vector<uint8_t>& bytes);

/**
 * Parse an even-length hex string (optional 0x prefix)
 * @throws std::invalid_argument on odd length or non-hex characters
 */
std::vector<uint8_t> bytes_from_hex(const std::string& hex);

} // namespace bitcoin_vm
