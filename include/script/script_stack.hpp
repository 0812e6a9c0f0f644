#pragma once

#include "types/b_field_element.hpp"
#include "script/opcodes.hpp"
#include <array>

namespace bitcoin_vm {

using StackSlots = std::array<BFieldElement, MAX_STACK_DEPTH>;

/**
 * ScriptStack - Fixed-depth stack for script execution
 * 
 * Always holds exactly MAX_STACK_DEPTH elements, index 0 = top.
 * Unused slots are zero. Pushing onto a full stack drops the bottom
 * element, and popping fills the bottom with zero, so every row of
 * the execution region carries the same number of stack columns.
 */
class ScriptStack {
public:
    ScriptStack() { slots_.fill(BFieldElement::zero()); }
    explicit ScriptStack(const StackSlots& slots) : slots_(slots) {}

    /**
     * Push a value (shift every slot one position towards the bottom)
     */
    void push(BFieldElement value);

    /**
     * Pop the top value (shift towards the top, bottom becomes zero)
     */
    BFieldElement pop();

    /**
     * Peek at element at depth (0 = top)
     */
    BFieldElement peek_at(size_t depth) const;

    BFieldElement top() const { return slots_[0]; }
    void set_top(BFieldElement value) { slots_[0] = value; }

    const StackSlots& slots() const { return slots_; }

private:
    StackSlots slots_;
};

} // namespace bitcoin_vm
