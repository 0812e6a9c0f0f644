#include "crypto/secp256k1.hpp"
#include "script/opcodes.hpp"
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>

namespace bitcoin_vm {
namespace secp256k1 {

namespace {

struct BnDeleter    { void operator()(BIGNUM* p)   const { BN_free(p); } };
struct BnCtxDeleter { void operator()(BN_CTX* p)   const { BN_CTX_free(p); } };
struct GroupDeleter { void operator()(EC_GROUP* p) const { EC_GROUP_free(p); } };
struct PointDeleter { void operator()(EC_POINT* p) const { EC_POINT_free(p); } };

using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using GroupPtr = std::unique_ptr<EC_GROUP, GroupDeleter>;
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;

void check(int ok, const char* what) {
    if (ok != 1) {
        throw std::runtime_error(std::string("secp256k1: OpenSSL call failed: ") + what);
    }
}

const EC_GROUP* group() {
    static GroupPtr instance{EC_GROUP_new_by_curve_name(NID_secp256k1)};
    if (!instance) {
        throw std::runtime_error("secp256k1: curve unavailable in OpenSSL");
    }
    return instance.get();
}

const BIGNUM* order() {
    return EC_GROUP_get0_order(group());
}

BnCtxPtr new_ctx() {
    BnCtxPtr ctx{BN_CTX_new()};
    if (!ctx) throw std::runtime_error("secp256k1: BN_CTX_new failed");
    return ctx;
}

BnPtr new_bn() {
    BnPtr bn{BN_new()};
    if (!bn) throw std::runtime_error("secp256k1: BN_new failed");
    return bn;
}

PointPtr new_point() {
    PointPtr point{EC_POINT_new(group())};
    if (!point) throw std::runtime_error("secp256k1: EC_POINT_new failed");
    return point;
}

BnPtr to_bn(const Scalar& value) {
    BnPtr bn{BN_bin2bn(value.data(), static_cast<int>(value.size()), nullptr)};
    if (!bn) throw std::runtime_error("secp256k1: BN_bin2bn failed");
    return bn;
}

Scalar from_bn(const BIGNUM* bn) {
    Scalar out{};
    check(BN_bn2binpad(bn, out.data(), static_cast<int>(out.size())) == static_cast<int>(out.size()),
          "BN_bn2binpad");
    return out;
}

bool in_scalar_range(const BIGNUM* value) {
    return !BN_is_zero(value) && BN_cmp(value, order()) < 0;
}

PointPtr to_point(const AffinePoint& point, BN_CTX* ctx) {
    BnPtr x = to_bn(point.x);
    BnPtr y = to_bn(point.y);
    PointPtr result = new_point();
    // Fails for coordinates off the curve
    if (EC_POINT_set_affine_coordinates(group(), result.get(), x.get(), y.get(), ctx) != 1) {
        return nullptr;
    }
    return result;
}

AffinePoint to_affine(const EC_POINT* point, BN_CTX* ctx) {
    if (EC_POINT_is_at_infinity(group(), point)) {
        throw std::runtime_error("secp256k1: point at infinity has no affine form");
    }
    BnPtr x = new_bn();
    BnPtr y = new_bn();
    check(EC_POINT_get_affine_coordinates(group(), point, x.get(), y.get(), ctx),
          "EC_POINT_get_affine_coordinates");
    return AffinePoint{from_bn(x.get()), from_bn(y.get())};
}

} // anonymous namespace

std::string AffinePoint::to_string() const {
    std::ostringstream oss;
    oss << "(0x" << std::hex << std::setfill('0');
    for (uint8_t b : x) oss << std::setw(2) << static_cast<int>(b);
    oss << ", 0x";
    for (uint8_t b : y) oss << std::setw(2) << static_cast<int>(b);
    oss << ")";
    return oss.str();
}

Scalar scalar_from_u64(uint64_t value) {
    Scalar out{};
    for (size_t i = 0; i < 8; ++i) {
        out[31 - i] = static_cast<uint8_t>(value >> (8 * i));
    }
    return out;
}

AffinePoint parse_public_key(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        throw std::invalid_argument("public key is empty");
    }
    const uint8_t prefix = bytes[0];
    size_t expected = 0;
    if (prefix == PREFIX_PK_COMPRESSED_EVEN_Y || prefix == PREFIX_PK_COMPRESSED_ODD_Y) {
        expected = COMPRESSED_PUBLIC_KEY_SIZE;
    } else if (prefix == PREFIX_PK_UNCOMPRESSED) {
        expected = UNCOMPRESSED_PUBLIC_KEY_SIZE;
    } else {
        std::ostringstream oss;
        oss << "unknown public key prefix 0x" << std::hex << static_cast<int>(prefix);
        throw std::invalid_argument(oss.str());
    }
    if (bytes.size() != expected) {
        throw std::invalid_argument("public key with prefix " + std::to_string(prefix) + " must be " +
                                    std::to_string(expected) + " bytes, got " + std::to_string(bytes.size()));
    }

    BnCtxPtr ctx = new_ctx();
    PointPtr point = new_point();
    if (EC_POINT_oct2point(group(), point.get(), bytes.data(), bytes.size(), ctx.get()) != 1 ||
        EC_POINT_is_on_curve(group(), point.get(), ctx.get()) != 1) {
        throw std::invalid_argument("public key is not a point on secp256k1");
    }
    return to_affine(point.get(), ctx.get());
}

std::vector<uint8_t> serialize_public_key(const AffinePoint& point, bool compressed) {
    std::vector<uint8_t> out;
    if (compressed) {
        out.reserve(COMPRESSED_PUBLIC_KEY_SIZE);
        out.push_back(point.y_is_odd() ? PREFIX_PK_COMPRESSED_ODD_Y : PREFIX_PK_COMPRESSED_EVEN_Y);
        out.insert(out.end(), point.x.begin(), point.x.end());
    } else {
        out.reserve(UNCOMPRESSED_PUBLIC_KEY_SIZE);
        out.push_back(PREFIX_PK_UNCOMPRESSED);
        out.insert(out.end(), point.x.begin(), point.x.end());
        out.insert(out.end(), point.y.begin(), point.y.end());
    }
    return out;
}

AffinePoint generator() {
    BnCtxPtr ctx = new_ctx();
    return to_affine(EC_GROUP_get0_generator(group()), ctx.get());
}

AffinePoint derive_public_key(const Scalar& secret_key) {
    BnPtr sk = to_bn(secret_key);
    if (!in_scalar_range(sk.get())) {
        throw std::invalid_argument("secret key out of range");
    }
    BnCtxPtr ctx = new_ctx();
    PointPtr pk = new_point();
    check(EC_POINT_mul(group(), pk.get(), sk.get(), nullptr, nullptr, ctx.get()), "EC_POINT_mul");
    return to_affine(pk.get(), ctx.get());
}

Signature sign_with_nonce(const Scalar& secret_key, const Scalar& nonce, const Scalar& message_hash) {
    BnPtr sk = to_bn(secret_key);
    BnPtr k = to_bn(nonce);
    if (!in_scalar_range(sk.get()) || !in_scalar_range(k.get())) {
        throw std::invalid_argument("secret key or nonce out of range");
    }
    BnCtxPtr ctx = new_ctx();

    PointPtr kg = new_point();
    check(EC_POINT_mul(group(), kg.get(), k.get(), nullptr, nullptr, ctx.get()), "EC_POINT_mul");
    BnPtr rx = new_bn();
    check(EC_POINT_get_affine_coordinates(group(), kg.get(), rx.get(), nullptr, ctx.get()),
          "EC_POINT_get_affine_coordinates");

    BnPtr r = new_bn();
    check(BN_nnmod(r.get(), rx.get(), order(), ctx.get()), "BN_nnmod");

    // s = k^-1 (h + r sk)
    BnPtr h = to_bn(message_hash);
    BnPtr s = new_bn();
    check(BN_mod_mul(s.get(), r.get(), sk.get(), order(), ctx.get()), "BN_mod_mul");
    check(BN_mod_add(s.get(), s.get(), h.get(), order(), ctx.get()), "BN_mod_add");
    BnPtr k_inv{BN_mod_inverse(nullptr, k.get(), order(), ctx.get())};
    if (!k_inv) throw std::runtime_error("secp256k1: BN_mod_inverse failed");
    check(BN_mod_mul(s.get(), s.get(), k_inv.get(), order(), ctx.get()), "BN_mod_mul");

    if (BN_is_zero(r.get()) || BN_is_zero(s.get())) {
        throw std::invalid_argument("nonce yields a degenerate signature");
    }
    return Signature{from_bn(r.get()), from_bn(s.get())};
}

bool verify_signature(const Signature& signature, const AffinePoint& public_key, const Scalar& message_hash) {
    BnPtr r = to_bn(signature.r);
    BnPtr s = to_bn(signature.s);
    if (!in_scalar_range(r.get()) || !in_scalar_range(s.get())) {
        return false;
    }
    BnCtxPtr ctx = new_ctx();
    PointPtr q = to_point(public_key, ctx.get());
    if (!q) {
        return false;
    }

    BnPtr h = to_bn(message_hash);
    BnPtr w{BN_mod_inverse(nullptr, s.get(), order(), ctx.get())};
    if (!w) throw std::runtime_error("secp256k1: BN_mod_inverse failed");

    BnPtr u1 = new_bn();
    BnPtr u2 = new_bn();
    check(BN_mod_mul(u1.get(), h.get(), w.get(), order(), ctx.get()), "BN_mod_mul");
    check(BN_mod_mul(u2.get(), r.get(), w.get(), order(), ctx.get()), "BN_mod_mul");

    // R = u1 G + u2 Q
    PointPtr big_r = new_point();
    check(EC_POINT_mul(group(), big_r.get(), u1.get(), q.get(), u2.get(), ctx.get()), "EC_POINT_mul");
    if (EC_POINT_is_at_infinity(group(), big_r.get())) {
        return false;
    }
    BnPtr rx = new_bn();
    check(EC_POINT_get_affine_coordinates(group(), big_r.get(), rx.get(), nullptr, ctx.get()),
          "EC_POINT_get_affine_coordinates");
    check(BN_nnmod(rx.get(), rx.get(), order(), ctx.get()), "BN_nnmod");
    return BN_cmp(rx.get(), r.get()) == 0;
}

} // namespace secp256k1
} // namespace bitcoin_vm
