#include "gadgets/is_zero.hpp"

namespace bitcoin_vm {

IsZeroConfig IsZeroChip::configure(
    ConstraintSystem& cs,
    const std::string& name,
    const Expression& q_enable,
    const Expression& value,
    Column value_inv
) {
    const Expression value_inv_expr = Expression::query(value_inv, Rotation::cur());
    const Expression is_zero_expr = Expression::constant(1) - value * value_inv_expr;

    cs.create_gate(name + " is zero", {q_enable * value * is_zero_expr});

    return IsZeroConfig(value_inv, is_zero_expr);
}

AssignedCell IsZeroChip::assign(Region& region, size_t offset, BFieldElement value) const {
    return region.assign_advice(config_.value_inv(), offset, value.inverse_or_zero());
}

} // namespace bitcoin_vm
