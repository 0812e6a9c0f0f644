#include "gadgets/range_check.hpp"
#include <stdexcept>
#include <string>

namespace bitcoin_vm {

RangeCheckConfig RangeCheckChip::configure(ConstraintSystem& cs) {
    RangeCheckConfig config;
    config.running_sum = cs.advice_column();
    config.byte = cs.advice_column();
    config.q_decompose = cs.selector();
    config.q_zero = cs.selector();
    config.byte_table = cs.lookup_table_column();
    cs.enable_equality(config.running_sum);
    cs.enable_equality(config.byte);
    cs.annotate_column(config.running_sum, "range_running_sum");
    cs.annotate_column(config.byte, "range_byte");

    const Expression q = Expression::query(config.q_decompose);
    const Expression z_cur = Expression::query(config.running_sum, Rotation::cur());
    const Expression z_next = Expression::query(config.running_sum, Rotation::next());
    const Expression byte = Expression::query(config.byte, Rotation::cur());

    cs.create_gate("byte decomposition running sum", {
        q * (z_cur - Expression::constant(256) * z_next - byte),
    });
    cs.create_gate("byte decomposition terminates at zero", {
        Expression::query(config.q_zero) * z_cur,
    });
    cs.lookup("byte range", {{q * byte, config.byte_table}});

    return config;
}

void RangeCheckChip::load(Layouter& layouter) const {
    TableRegion table = layouter.table("byte range table");
    for (size_t value = 0; value < TABLE_ROWS; ++value) {
        table.assign_cell(config_.byte_table, value, BFieldElement(value));
    }
}

std::vector<AssignedCell> RangeCheckChip::decompose(
    Region& region,
    size_t offset,
    const AssignedCell& value,
    size_t byte_width,
    size_t total_bits
) const {
    if (byte_width != BYTE_BITS) {
        throw std::invalid_argument("RangeCheckChip: only 8-bit limbs are supported, got " +
                                    std::to_string(byte_width));
    }
    if (total_bits == 0 || total_bits % BYTE_BITS != 0 || total_bits >= 64) {
        throw std::invalid_argument("RangeCheckChip: cannot decompose into " + std::to_string(total_bits) + " bits");
    }
    const uint64_t raw = value.value.value();
    if ((raw >> total_bits) != 0) {
        throw std::invalid_argument("RangeCheckChip: value " + value.value.to_string() +
                                    " does not fit in " + std::to_string(total_bits) + " bits");
    }

    const size_t num_bytes = total_bits / BYTE_BITS;
    std::vector<AssignedCell> bytes;
    bytes.reserve(num_bytes);

    uint64_t z = raw;
    region.copy_advice(value, config_.running_sum, offset);
    for (size_t i = 0; i < num_bytes; ++i) {
        region.enable_selector(config_.q_decompose, offset + i);
        bytes.push_back(region.assign_advice(config_.byte, offset + i, BFieldElement(z & 0xff)));
        z >>= BYTE_BITS;
        region.assign_advice(config_.running_sum, offset + i + 1, BFieldElement(z));
    }
    region.enable_selector(config_.q_zero, offset + num_bytes);
    return bytes;
}

} // namespace bitcoin_vm
