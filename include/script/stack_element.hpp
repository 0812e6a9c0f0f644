#pragma once

#include "types/b_field_element.hpp"
#include "script/script_stack.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace bitcoin_vm {

/**
 * StackElement - symbolic stack item known to the prover
 * 
 * Signatures never enter the circuit; the stack only records whether the
 * signature at that position verifies. Data items carry literal bytes.
 */
struct StackElement {
    enum class Kind : uint8_t {
        InvalidSignature,
        ValidSignature,
        Data,
    };

    Kind kind = Kind::Data;
    std::vector<uint8_t> data;

    static StackElement invalid_signature() { return StackElement{Kind::InvalidSignature, {}}; }
    static StackElement valid_signature() { return StackElement{Kind::ValidSignature, {}}; }
    static StackElement bytes(std::vector<uint8_t> payload) { return StackElement{Kind::Data, std::move(payload)}; }

    bool is_signature() const { return kind != Kind::Data; }

    /**
     * Field encoding used in the stack columns:
     * InvalidSignature -> 0, ValidSignature -> 1,
     * Data -> Horner RLC of the bytes, empty data -> EMPTY_ARRAY_REPRESENTATION.
     */
    BFieldElement to_field(BFieldElement randomness) const;

    std::string to_string() const;
};

/**
 * Encode a symbolic initial stack (index 0 = top) into stack slots.
 * Throws std::invalid_argument when it holds more than MAX_STACK_DEPTH items.
 */
StackSlots initial_stack_values(const std::vector<StackElement>& elements, BFieldElement randomness);

} // namespace bitcoin_vm
