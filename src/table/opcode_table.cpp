#include "table/opcode_table.hpp"
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace bitcoin_vm {

OpcodeTableConfig OpcodeTableChip::configure(
    ConstraintSystem& cs,
    const Expression& q_lookup,
    Column opcode,
    const OpcodeIndicatorColumns& indicators
) {
    OpcodeTableConfig config;
    for (auto& column : config.columns) {
        column = cs.lookup_table_column();
    }

    const std::array<Column, OPCODE_TABLE_WIDTH> inputs = {
        opcode,
        indicators.enabled,
        indicators.op0,
        indicators.op1_to_op16,
        indicators.push1_to_push75,
        indicators.pushdata1,
        indicators.pushdata2,
        indicators.pushdata4,
        indicators.checksig,
    };

    std::vector<std::pair<Expression, TableColumn>> map;
    for (size_t i = 0; i < OPCODE_TABLE_WIDTH; ++i) {
        map.emplace_back(q_lookup * Expression::query(inputs[i], Rotation::cur()), config.columns[i]);
    }
    cs.lookup("opcode classification", map);
    return config;
}

OpcodeTableRow OpcodeTableChip::row_for(uint8_t opcode) {
    OpcodeTableRow row{};
    row[static_cast<size_t>(OpcodeTableColumn::Opcode)] = opcode;
    row[static_cast<size_t>(OpcodeTableColumn::Enabled)] = opcode_enabled(opcode) ? 1 : 0;
    // One-hot class indicator; OP_NOP and disabled opcodes have none
    OpcodeClass cls;
    if (classify_opcode(opcode, cls)) {
        row[static_cast<size_t>(OpcodeTableColumn::Op0) + static_cast<size_t>(cls)] = 1;
    }
    return row;
}

void OpcodeTableChip::load(Layouter& layouter) const {
    TableRegion table = layouter.table("opcode classification table");

    // Rows 0..255 are the byte values; row 256 stays all-zero
    #pragma omp parallel for schedule(static)
    for (size_t value = 0; value < 256; ++value) {
        const OpcodeTableRow row = row_for(static_cast<uint8_t>(value));
        for (size_t i = 0; i < OPCODE_TABLE_WIDTH; ++i) {
            table.assign_cell(config_.columns[i], value, BFieldElement(row[i]));
        }
    }
    for (size_t i = 0; i < OPCODE_TABLE_WIDTH; ++i) {
        table.assign_cell(config_.columns[i], NUM_ROWS - 1, BFieldElement::zero());
    }
}

} // namespace bitcoin_vm
