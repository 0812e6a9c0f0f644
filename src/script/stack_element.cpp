#include "script/stack_element.hpp"
#include "common/rlc.hpp"
#include <stdexcept>
#include <sstream>
#include <iomanip>

namespace bitcoin_vm {

BFieldElement StackElement::to_field(BFieldElement randomness) const {
    switch (kind) {
        case Kind::InvalidSignature:
            return BFieldElement::zero();
        case Kind::ValidSignature:
            return BFieldElement::one();
        case Kind::Data:
            if (data.empty()) {
                return BFieldElement(EMPTY_ARRAY_REPRESENTATION);
            }
            return Rlc::horner(data, randomness);
    }
    throw std::logic_error("StackElement::to_field: unknown kind");
}

std::string StackElement::to_string() const {
    switch (kind) {
        case Kind::InvalidSignature:
            return "InvalidSignature";
        case Kind::ValidSignature:
            return "ValidSignature";
        case Kind::Data: {
            std::ostringstream oss;
            oss << "Data(";
            for (uint8_t b : data) {
                oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
            }
            oss << ")";
            return oss.str();
        }
    }
    return "?";
}

StackSlots initial_stack_values(const std::vector<StackElement>& elements, BFieldElement randomness) {
    if (elements.size() > MAX_STACK_DEPTH) {
        throw std::invalid_argument("initial stack holds " + std::to_string(elements.size()) +
                                    " items, maximum is " + std::to_string(MAX_STACK_DEPTH));
    }
    StackSlots slots;
    slots.fill(BFieldElement::zero());
    for (size_t i = 0; i < elements.size(); ++i) {
        slots[i] = elements[i].to_field(randomness);
    }
    return slots;
}

} // namespace bitcoin_vm
