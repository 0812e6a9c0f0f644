#pragma once

#include "types/b_field_element.hpp"
#include "circuit/assignment.hpp"
#include "circuit/constraint_system.hpp"
#include <string>
#include <vector>

namespace bitcoin_vm {

/**
 * VerifyFailure - one violated constraint found by the MockProver
 */
struct VerifyFailure {
    enum class Kind : uint8_t {
        ConstraintNotSatisfied,
        Lookup,
        Permutation,
    };

    Kind kind;
    // Gate or lookup name, or the cells of a copy constraint
    std::string name;
    // Index of the polynomial inside its gate (gates only)
    size_t index = 0;
    size_t row = 0;

    std::string to_string() const;
};

/**
 * MockProver - checks that a witness satisfies a constraint system
 * 
 * Evaluates every gate on every row (rotations wrap around), checks
 * every lookup input tuple against its table and every copy constraint,
 * including instance bindings. No proof is produced.
 */
class MockProver {
public:
    static MockProver run(
        const ConstraintSystem& cs,
        const Assignment& assignment,
        std::vector<std::vector<BFieldElement>> instances
    );

    std::vector<VerifyFailure> verify() const;

    /**
     * Throws std::runtime_error listing the first failures when the
     * witness does not satisfy the constraint system.
     */
    void assert_satisfied() const;

    size_t num_rows() const { return assignment_.num_rows(); }

private:
    MockProver(const ConstraintSystem& cs, const Assignment& assignment,
               std::vector<std::vector<BFieldElement>> instances);

    BFieldElement cell_value(const Column& column, size_t row) const;
    BFieldElement query(const Column& column, size_t row, int32_t rotation) const;

    void verify_gates(std::vector<VerifyFailure>& failures) const;
    void verify_lookups(std::vector<VerifyFailure>& failures) const;
    void verify_copies(std::vector<VerifyFailure>& failures) const;

    const ConstraintSystem& cs_;
    const Assignment& assignment_;
    std::vector<std::vector<BFieldElement>> instances_;
};

} // namespace bitcoin_vm
