#pragma once

#include "types/b_field_element.hpp"
#include "circuit/assignment.hpp"
#include "circuit/constraint_system.hpp"
#include <cstdint>
#include <utility>
#include <vector>

namespace bitcoin_vm {

struct ParityTableConfig {
    TableColumn pk_prefix;
    TableColumn parity_byte;
};

/**
 * ParityTableChip - binds a SEC1 prefix to the least-significant byte of y
 * 
 * 0x04 accepts every byte, 0x02 only even bytes, 0x03 only odd bytes.
 * The last row is all-zero.
 */
class ParityTableChip {
public:
    static constexpr size_t NUM_ROWS = 2 * 256 + 1;

    explicit ParityTableChip(ParityTableConfig config) : config_(config) {}

    /**
     * Register the lookup (q*pk_prefix, q*parity_byte) in table
     */
    static ParityTableConfig configure(
        ConstraintSystem& cs,
        const Expression& q_lookup,
        const Expression& pk_prefix,
        const Expression& parity_byte
    );

    void load(Layouter& layouter) const;

    // (prefix, parity byte) pairs in table order, zero row included
    static std::vector<std::pair<uint8_t, uint8_t>> rows();

    const ParityTableConfig& config() const { return config_; }

private:
    ParityTableConfig config_;
};

} // namespace bitcoin_vm
