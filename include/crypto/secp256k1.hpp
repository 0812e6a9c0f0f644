#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace bitcoin_vm {
namespace secp256k1 {

// 256-bit big-endian integer (coordinate, scalar or hash)
using Scalar = std::array<uint8_t, 32>;

/**
 * Affine point on secp256k1, coordinates big-endian
 */
struct AffinePoint {
    Scalar x{};
    Scalar y{};

    bool operator==(const AffinePoint& rhs) const { return x == rhs.x && y == rhs.y; }
    bool operator!=(const AffinePoint& rhs) const { return !(*this == rhs); }

    bool y_is_odd() const { return (y[31] & 1) != 0; }
    std::string to_string() const;
};

struct Signature {
    Scalar r{};
    Scalar s{};

    bool operator==(const Signature& rhs) const { return r == rhs.r && s == rhs.s; }
};

Scalar scalar_from_u64(uint64_t value);

/**
 * Parse a SEC1 public key (0x02/0x03 || x, or 0x04 || x || y)
 * 
 * @throws std::invalid_argument for an unknown prefix, a length that does
 *         not match the prefix, or a point that is not on the curve
 */
AffinePoint parse_public_key(const std::vector<uint8_t>& bytes);

std::vector<uint8_t> serialize_public_key(const AffinePoint& point, bool compressed);

AffinePoint generator();

/**
 * sk * G
 * @throws std::invalid_argument if sk is zero or not below the group order
 */
AffinePoint derive_public_key(const Scalar& secret_key);

/**
 * Deterministic ECDSA with an explicit nonce:
 *   r = (k * G).x mod n,  s = k^-1 * (h + r * sk) mod n
 */
Signature sign_with_nonce(const Scalar& secret_key, const Scalar& nonce, const Scalar& message_hash);

// Standard ECDSA verification; false for out-of-range r/s or an invalid key
bool verify_signature(const Signature& signature, const AffinePoint& public_key, const Scalar& message_hash);

} // namespace secp256k1
} // namespace bitcoin_vm
