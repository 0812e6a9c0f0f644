#include "table/parity_table.hpp"
#include "script/opcodes.hpp"

namespace bitcoin_vm {

ParityTableConfig ParityTableChip::configure(
    ConstraintSystem& cs,
    const Expression& q_lookup,
    const Expression& pk_prefix,
    const Expression& parity_byte
) {
    ParityTableConfig config;
    config.pk_prefix = cs.lookup_table_column();
    config.parity_byte = cs.lookup_table_column();
    cs.lookup("public key parity", {
        {q_lookup * pk_prefix, config.pk_prefix},
        {q_lookup * parity_byte, config.parity_byte},
    });
    return config;
}

std::vector<std::pair<uint8_t, uint8_t>> ParityTableChip::rows() {
    std::vector<std::pair<uint8_t, uint8_t>> result;
    result.reserve(NUM_ROWS);
    for (size_t byte = 0; byte < 256; ++byte) {
        result.emplace_back(PREFIX_PK_UNCOMPRESSED, static_cast<uint8_t>(byte));
    }
    for (size_t byte = 0; byte < 256; ++byte) {
        const uint8_t prefix = (byte % 2 == 0) ? PREFIX_PK_COMPRESSED_EVEN_Y : PREFIX_PK_COMPRESSED_ODD_Y;
        result.emplace_back(prefix, static_cast<uint8_t>(byte));
    }
    result.emplace_back(0, 0);
    return result;
}

void ParityTableChip::load(Layouter& layouter) const {
    TableRegion table = layouter.table("public key parity table");
    const auto entries = rows();
    for (size_t row = 0; row < entries.size(); ++row) {
        table.assign_cell(config_.pk_prefix, row, BFieldElement(entries[row].first));
        table.assign_cell(config_.parity_byte, row, BFieldElement(entries[row].second));
    }
}

} // namespace bitcoin_vm
