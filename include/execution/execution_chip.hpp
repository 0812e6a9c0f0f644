#pragma once

#include "types/b_field_element.hpp"
#include "circuit/assignment.hpp"
#include "circuit/constraint_system.hpp"
#include "gadgets/is_zero.hpp"
#include "script/script_vm.hpp"
#include "table/opcode_table.hpp"
#include <array>

namespace bitcoin_vm {

/**
 * ExecutionConfig - columns of the scriptPubkey execution region
 */
struct ExecutionConfig {
    // Public inputs: script length, initial script RLC, randomness
    Column instance;
    Column randomness;

    Selector q_first;
    Selector q_execution;
    Selector q_last;

    // Current script byte (opcode or data)
    Column opcode;
    OpcodeIndicatorColumns indicators;
    OpcodeTableConfig opcode_table;

    Column script_rlc_acc;
    Column num_script_bytes_remaining;
    IsZeroConfig num_script_bytes_remaining_is_zero;

    std::array<Column, MAX_STACK_DEPTH> stack;

    Column num_data_bytes_remaining;
    IsZeroConfig num_data_bytes_remaining_is_zero;

    Column num_data_length_bytes_remaining;
    IsZeroConfig num_data_length_bytes_remaining_is_zero;
    IsZeroConfig num_data_length_bytes_remaining_is_one;
    // Weight 256^j of the current little-endian length byte
    Column num_data_length_acc_constant;

    Column pk_rlc_acc;
    Column num_checksig_opcodes;

    // top * (top - NEGATIVE_ZERO) must be non-zero once the script is read
    IsZeroConfig stack_top_is_false;
};

/**
 * Cells shared with the public instance and the checksig region
 */
struct ExecutionCells {
    AssignedCell script_length;
    AssignedCell initial_script_rlc;
    AssignedCell randomness;
    AssignedCell pk_rlc_acc;
    AssignedCell num_checksig_opcodes;
};

/**
 * ExecutionChip - constraints and assignment of the script execution region
 * 
 * One row per script byte between a first row (initial state) and a last
 * row (final state). Each opcode class has its own constraint family,
 * multiplied by the class indicator so that it vanishes elsewhere.
 */
class ExecutionChip {
public:
    static constexpr size_t NUM_ROWS = ScriptVM::NUM_ROWS;

    // Rows of the instance column
    static constexpr size_t INSTANCE_SCRIPT_LENGTH = 0;
    static constexpr size_t INSTANCE_SCRIPT_RLC = 1;
    static constexpr size_t INSTANCE_RANDOMNESS = 2;

    explicit ExecutionChip(ExecutionConfig config) : config_(std::move(config)) {}

    static ExecutionConfig configure(ConstraintSystem& cs);

    // Load the opcode classification table
    void load(Layouter& layouter) const;

    /**
     * Materialize a trace into the region (which must be NUM_ROWS high)
     */
    ExecutionCells assign(Region& region, const ScriptVM::TraceResult& trace) const;

    /**
     * Bind script length, initial script RLC and randomness to the instance column
     */
    void expose_public(Layouter& layouter, const ExecutionCells& cells) const;

    const ExecutionConfig& config() const { return config_; }

private:
    void assign_row(Region& region, size_t offset, const TraceRow& row, BFieldElement randomness) const;

    ExecutionConfig config_;
};

} // namespace bitcoin_vm
