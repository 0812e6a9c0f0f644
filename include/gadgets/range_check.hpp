#pragma once

#include "types/b_field_element.hpp"
#include "circuit/assignment.hpp"
#include "circuit/constraint_system.hpp"
#include <vector>

namespace bitcoin_vm {

struct RangeCheckConfig {
    Column running_sum;
    Column byte;
    Selector q_decompose;
    Selector q_zero;
    TableColumn byte_table;
};

/**
 * RangeCheckChip - little-endian byte decomposition
 * 
 * Running sum z_0 = value, z_i = 256 * z_{i+1} + b_i, z_n = 0, with every
 * b_i looked up in a 0..255 table. A decomposition of n bytes uses n + 1
 * rows of its region.
 */
class RangeCheckChip {
public:
    static constexpr size_t BYTE_BITS = 8;
    static constexpr size_t TABLE_ROWS = 256;

    explicit RangeCheckChip(RangeCheckConfig config) : config_(config) {}

    static RangeCheckConfig configure(ConstraintSystem& cs);

    static size_t rows_for(size_t total_bits) { return total_bits / BYTE_BITS + 1; }

    void load(Layouter& layouter) const;

    /**
     * Decompose `value` into total_bits / byte_width little-endian bytes,
     * starting at `offset`. The running sum is copy-constrained to `value`.
     * 
     * @throws std::invalid_argument for a byte width other than 8, a bit
     *         count that is not a whole number of bytes, or a value that
     *         does not fit in total_bits
     */
    std::vector<AssignedCell> decompose(
        Region& region,
        size_t offset,
        const AssignedCell& value,
        size_t byte_width,
        size_t total_bits
    ) const;

    const RangeCheckConfig& config() const { return config_; }

private:
    RangeCheckConfig config_;
};

} // namespace bitcoin_vm
