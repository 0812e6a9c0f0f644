#pragma once

#include "types/b_field_element.hpp"
#include "script/opcodes.hpp"
#include "script/script_stack.hpp"
#include <cstdint>
#include <string>

namespace bitcoin_vm {

/**
 * ParseMode - what the next script byte means
 * 
 * Idle:               the byte is an opcode
 * PendingFixedPush:   the byte is pushed data, `remaining` bytes still to come
 * PendingLengthField: the byte is part of an OP_PUSHDATA length field
 */
enum class ParseMode : uint8_t {
    Idle,
    PendingFixedPush,
    PendingLengthField,
};

const char* parse_mode_name(ParseMode mode);

struct ParseState {
    ParseMode mode = ParseMode::Idle;
    // Data bytes (PendingFixedPush) or length bytes (PendingLengthField) left, this byte included
    uint64_t remaining = 0;
    // PendingLengthField only: length decoded so far and the weight 256^j of the next length byte
    uint64_t decoded_length = 0;
    uint64_t length_weight = 0;

    static ParseState idle() { return ParseState{}; }
    static ParseState fixed_push(uint64_t num_bytes) {
        return ParseState{ParseMode::PendingFixedPush, num_bytes, 0, 0};
    }
    static ParseState length_field(uint64_t num_length_bytes) {
        return ParseState{ParseMode::PendingLengthField, num_length_bytes, 0, 1};
    }
};

/**
 * TraceRow - one row of the execution region
 * 
 * Counters describe the state the byte was read in; stack and
 * accumulators describe the state after the byte was applied.
 */
struct TraceRow {
    uint8_t opcode = 0;
    // RLC of the script bytes that follow this one
    BFieldElement script_rlc_acc;
    // Script bytes left, this one included
    uint64_t num_script_bytes_remaining = 0;
    StackSlots stack{};
    // PendingFixedPush: bytes left. PendingLengthField: length decoded through this byte.
    uint64_t num_data_bytes_remaining = 0;
    uint64_t num_data_length_bytes_remaining = 0;
    uint64_t num_data_length_acc_constant = 0;
    BFieldElement pk_rlc_acc;
    uint64_t num_checksig_opcodes = 0;
    ParseMode mode = ParseMode::Idle;
    bool is_padding = false;
};

/**
 * ScriptState - Tracks the interpreter state between script bytes
 */
class ScriptState {
public:
    ScriptState(BFieldElement randomness, const StackSlots& initial_stack);

    /**
     * Apply one script byte and return the row that records it.
     * `bytes_left_after` is the number of script bytes that follow this one;
     * pushes that would run past the end of the script are rejected.
     */
    TraceRow step(uint8_t byte, uint64_t bytes_left_after);

    const ScriptStack& stack() const { return stack_; }
    const ParseState& parse_state() const { return parse_state_; }
    BFieldElement pk_rlc_acc() const { return pk_rlc_acc_; }
    uint64_t num_checksig_opcodes() const { return num_checksig_opcodes_; }
    BFieldElement randomness() const { return randomness_; }

private:
    void execute_opcode(uint8_t opcode, uint64_t bytes_left_after);
    void execute_checksig();

    BFieldElement randomness_;
    ScriptStack stack_;
    ParseState parse_state_;
    BFieldElement pk_rlc_acc_;
    uint64_t num_checksig_opcodes_ = 0;
};

} // namespace bitcoin_vm
