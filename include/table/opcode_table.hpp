#pragma once

#include "types/b_field_element.hpp"
#include "circuit/assignment.hpp"
#include "circuit/constraint_system.hpp"
#include "script/opcodes.hpp"
#include <array>
#include <cstdint>

namespace bitcoin_vm {

// Position of each value inside an opcode table row
enum class OpcodeTableColumn : size_t {
    Opcode = 0,
    Enabled,
    Op0,
    Op1ToOp16,
    Push1ToPush75,
    PushData1,
    PushData2,
    PushData4,
    CheckSig,
};

constexpr size_t OPCODE_TABLE_WIDTH = 9;

// Class indicators follow OpcodeClass order
static_assert(static_cast<size_t>(OpcodeTableColumn::Op0) + OPCODE_CLASS_COUNT == OPCODE_TABLE_WIDTH,
              "one table column per opcode class");
static_assert(static_cast<size_t>(OpcodeTableColumn::CheckSig) ==
              static_cast<size_t>(OpcodeTableColumn::Op0) + static_cast<size_t>(OpcodeClass::CheckSig),
              "class columns out of order");

using OpcodeTableRow = std::array<uint64_t, OPCODE_TABLE_WIDTH>;

/**
 * Advice columns of the execution region that are bound to the opcode
 * classification table by lookup
 */
struct OpcodeIndicatorColumns {
    Column enabled;
    Column op0;
    Column op1_to_op16;
    Column push1_to_push75;
    Column pushdata1;
    Column pushdata2;
    Column pushdata4;
    Column checksig;
};

struct OpcodeTableConfig {
    std::array<TableColumn, OPCODE_TABLE_WIDTH> columns;
};

/**
 * OpcodeTableChip - static opcode classification table
 * 
 * One row per byte value (enabled flag plus one-hot class indicators)
 * followed by an all-zero row matched by rows where the lookup is off.
 */
class OpcodeTableChip {
public:
    static constexpr size_t NUM_ROWS = 257;

    explicit OpcodeTableChip(OpcodeTableConfig config) : config_(config) {}

    /**
     * Register the lookup (q*opcode, q*enabled, q*op0, ..., q*checksig) in table
     */
    static OpcodeTableConfig configure(
        ConstraintSystem& cs,
        const Expression& q_lookup,
        Column opcode,
        const OpcodeIndicatorColumns& indicators
    );

    void load(Layouter& layouter) const;

    static OpcodeTableRow row_for(uint8_t opcode);

    const OpcodeTableConfig& config() const { return config_; }

private:
    OpcodeTableConfig config_;
};

} // namespace bitcoin_vm
