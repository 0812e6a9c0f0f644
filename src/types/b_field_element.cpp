#include "types/b_field_element.hpp"
#include <stdexcept>

namespace bitcoin_vm {

uint64_t BFieldElement::reduce(uint128_t value) {
    return static_cast<uint64_t>(value % MODULUS);
}

BFieldElement BFieldElement::operator+(const BFieldElement& rhs) const {
    // Branchless addition: compute sum, then subtract MODULUS if overflow
    uint64_t sum = value_ + rhs.value_;
    uint64_t overflow = static_cast<uint64_t>(sum < value_);
    uint64_t too_large = static_cast<uint64_t>(sum >= MODULUS);
    sum -= MODULUS & (-(overflow | too_large));
    return BFieldElement(sum);
}

BFieldElement BFieldElement::operator-(const BFieldElement& rhs) const {
    uint64_t diff = value_ - rhs.value_;
    uint64_t underflow = static_cast<uint64_t>(value_ < rhs.value_);
    diff += MODULUS & (-underflow);
    return BFieldElement(diff);
}

BFieldElement BFieldElement::operator*(const BFieldElement& rhs) const {
    uint128_t product = static_cast<uint128_t>(value_) * static_cast<uint128_t>(rhs.value_);
    return BFieldElement(reduce(product));
}

BFieldElement BFieldElement::operator-() const {
    if (value_ == 0) return *this;
    return BFieldElement(MODULUS - value_);
}

BFieldElement& BFieldElement::operator+=(const BFieldElement& rhs) {
    *this = *this + rhs;
    return *this;
}

BFieldElement& BFieldElement::operator-=(const BFieldElement& rhs) {
    *this = *this - rhs;
    return *this;
}

BFieldElement& BFieldElement::operator*=(const BFieldElement& rhs) {
    *this = *this * rhs;
    return *this;
}

BFieldElement& BFieldElement::operator/=(const BFieldElement& rhs) {
    *this = *this / rhs;
    return *this;
}

BFieldElement BFieldElement::pow(uint64_t exp) const {
    BFieldElement result = BFieldElement::one();
    BFieldElement base = *this;
    while (exp > 0) {
        if (exp & 1) {
            result *= base;
        }
        base *= base;
        exp >>= 1;
    }
    return result;
}

BFieldElement BFieldElement::inverse() const {
    if (value_ == 0) {
        throw std::domain_error("Cannot invert zero");
    }
    // Fermat's little theorem: a^(-1) = a^(p-2) mod p
    return pow(MODULUS - 2);
}

BFieldElement BFieldElement::inverse_or_zero() const {
    if (value_ == 0) {
        return BFieldElement::zero();
    }
    return inverse();
}

BFieldElement BFieldElement::operator/(const BFieldElement& rhs) const {
    return *this * rhs.inverse();
}

std::vector<BFieldElement> BFieldElement::batch_inversion(const std::vector<BFieldElement>& elements) {
    const size_t n = elements.size();
    std::vector<BFieldElement> inverses(n, BFieldElement::zero());
    if (n == 0) {
        return inverses;
    }

    std::vector<BFieldElement> prefix_products(n, BFieldElement::one());
    BFieldElement accumulator = BFieldElement::one();
    for (size_t i = 0; i < n; ++i) {
        if (elements[i].is_zero()) {
            throw std::domain_error("batch_inversion encountered zero element");
        }
        prefix_products[i] = accumulator;
        accumulator *= elements[i];
    }

    BFieldElement inverse_acc = accumulator.inverse();
    for (size_t i = n; i-- > 0;) {
        inverses[i] = prefix_products[i] * inverse_acc;
        inverse_acc *= elements[i];
    }
    return inverses;
}

std::string BFieldElement::to_string() const {
    return std::to_string(value_);
}

std::ostream& operator<<(std::ostream& os, const BFieldElement& elem) {
    os << elem.value_;
    return os;
}

} // namespace bitcoin_vm
