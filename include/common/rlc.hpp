#pragma once

#include "types/b_field_element.hpp"
#include <cstdint>
#include <vector>

namespace bitcoin_vm {

/**
 * Rlc - Randomized linear combinations
 * 
 * Every RLC in the circuit (script bytes, pushed data, public keys) uses
 * the same randomness challenge, threaded explicitly through each call.
 */
class Rlc {
public:
    /**
     * Horner fold in push order: fold(randomness * running + byte).
     * The first byte ends up with weight randomness^(n-1).
     */
    static BFieldElement horner(
        const std::vector<uint8_t>& bytes,
        BFieldElement randomness,
        BFieldElement initial = BFieldElement::zero()
    ) {
        BFieldElement result = initial;
        for (uint8_t byte : bytes) {
            result = randomness * result + BFieldElement(byte);
        }
        return result;
    }

    /**
     * Fold over the reversed sequence: Σ bytes[i] * randomness^i.
     * This is the script commitment exposed as a public input.
     */
    static BFieldElement horner_reversed(
        const std::vector<uint8_t>& bytes,
        BFieldElement randomness
    ) {
        BFieldElement result = BFieldElement::zero();
        for (size_t i = bytes.size(); i-- > 0;) {
            result = randomness * result + BFieldElement(bytes[i]);
        }
        return result;
    }

    /**
     * Running accumulators of the reversed fold: acc[i] = Σ_{j>=i} bytes[j] * r^(j-i),
     * with acc[n] = 0.
     */
    static std::vector<BFieldElement> suffix_accumulators(
        const std::vector<uint8_t>& bytes,
        BFieldElement randomness
    ) {
        std::vector<BFieldElement> acc(bytes.size() + 1, BFieldElement::zero());
        for (size_t i = bytes.size(); i-- > 0;) {
            acc[i] = randomness * acc[i + 1] + BFieldElement(bytes[i]);
        }
        return acc;
    }

    // [r^0, r^1, ..., r^count]
    static std::vector<BFieldElement> powers(BFieldElement randomness, size_t count) {
        std::vector<BFieldElement> result(count + 1, BFieldElement::one());
        for (size_t i = 1; i <= count; ++i) {
            result[i] = result[i - 1] * randomness;
        }
        return result;
    }
};

} // namespace bitcoin_vm
