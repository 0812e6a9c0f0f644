#include "script/script_stack.hpp"
#include <stdexcept>
#include <string>

namespace bitcoin_vm {

void ScriptStack::push(BFieldElement value) {
    for (size_t i = MAX_STACK_DEPTH - 1; i > 0; --i) {
        slots_[i] = slots_[i - 1];
    }
    slots_[0] = value;
}

BFieldElement ScriptStack::pop() {
    BFieldElement value = slots_[0];
    for (size_t i = 0; i + 1 < MAX_STACK_DEPTH; ++i) {
        slots_[i] = slots_[i + 1];
    }
    slots_[MAX_STACK_DEPTH - 1] = BFieldElement::zero();
    return value;
}

BFieldElement ScriptStack::peek_at(size_t depth) const {
    if (depth >= MAX_STACK_DEPTH) {
        throw std::out_of_range("ScriptStack::peek_at: depth " + std::to_string(depth) +
                                " exceeds stack depth " + std::to_string(MAX_STACK_DEPTH));
    }
    return slots_[depth];
}

} // namespace bitcoin_vm
