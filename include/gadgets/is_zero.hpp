#pragma once

#include "types/b_field_element.hpp"
#include "circuit/assignment.hpp"
#include "circuit/constraint_system.hpp"
#include "circuit/expression.hpp"
#include <string>

namespace bitcoin_vm {

/**
 * IsZeroConfig - boolean indicator for `value == 0`
 * 
 * expr() = 1 - value * value_inv. The gate
 *   q_enable * value * (1 - value * value_inv) = 0
 * forces value_inv = 1/value whenever value != 0, so the indicator is 0
 * exactly when value is non-zero.
 */
class IsZeroConfig {
public:
    IsZeroConfig() = default;
    IsZeroConfig(Column value_inv, Expression is_zero_expr)
        : value_inv_(value_inv), is_zero_expr_(std::move(is_zero_expr)) {}

    Expression expr() const { return is_zero_expr_; }
    Column value_inv() const { return value_inv_; }

private:
    Column value_inv_;
    Expression is_zero_expr_;
};

class IsZeroChip {
public:
    explicit IsZeroChip(IsZeroConfig config) : config_(std::move(config)) {}

    /**
     * Register the is-zero gate
     * 
     * @param q_enable Expression gating the constraint
     * @param value Expression tested against zero
     * @param value_inv Advice column receiving the inverse witness
     */
    static IsZeroConfig configure(
        ConstraintSystem& cs,
        const std::string& name,
        const Expression& q_enable,
        const Expression& value,
        Column value_inv
    );

    /**
     * Write inverse_or_zero(value) into the inverse column at `offset`
     */
    AssignedCell assign(Region& region, size_t offset, BFieldElement value) const;

    const IsZeroConfig& config() const { return config_; }

private:
    IsZeroConfig config_;
};

} // namespace bitcoin_vm
