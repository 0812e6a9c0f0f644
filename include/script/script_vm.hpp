#pragma once

#include "script/script_state.hpp"
#include "script/stack_element.hpp"
#include <vector>

namespace bitcoin_vm {

/**
 * ScriptVM - scriptPubkey interpreter
 * 
 * Replays a script byte by byte and records every intermediate state the
 * execution region needs. The trace always has NUM_ROWS rows:
 *   row 0                      initial state
 *   rows 1..MAX_SCRIPT_SIZE    one script byte each, OP_NOP padding after the script
 *   row NUM_ROWS - 1           final state, repeated for next-row queries
 */
class ScriptVM {
public:
    static constexpr size_t FIRST_ROW = 0;
    static constexpr size_t NUM_ROWS = MAX_SCRIPT_PUBKEY_SIZE + 2;
    static constexpr size_t LAST_ROW = NUM_ROWS - 1;

    /**
     * Result of trace execution
     */
    struct TraceResult {
        std::vector<TraceRow> rows;
        std::vector<uint8_t> script;
        BFieldElement randomness;
        // Σ script[i] * randomness^i
        BFieldElement initial_script_rlc;

        size_t script_length() const { return script.size(); }
        const TraceRow& first_row() const { return rows.front(); }
        const TraceRow& last_row() const { return rows.back(); }
        const StackSlots& final_stack() const { return rows.back().stack; }
        BFieldElement pk_rlc_acc() const { return rows.back().pk_rlc_acc; }
        uint64_t num_checksig_opcodes() const { return rows.back().num_checksig_opcodes; }

        /**
         * [script length, initial script RLC, randomness]
         */
        std::vector<BFieldElement> public_inputs() const;
    };

    /**
     * Trace the execution of a scriptPubkey
     * 
     * @param script Script bytes, at most MAX_SCRIPT_PUBKEY_SIZE
     * @param randomness Challenge shared by every RLC in the circuit
     * @param initial_stack Stack before the first byte (index 0 = top)
     * @return TraceResult with NUM_ROWS rows
     * @throws std::invalid_argument for oversized or malformed scripts
     */
    static TraceResult trace_execution(
        const std::vector<uint8_t>& script,
        BFieldElement randomness,
        const StackSlots& initial_stack
    );

    static TraceResult trace_execution(
        const std::vector<uint8_t>& script,
        BFieldElement randomness,
        const std::vector<StackElement>& initial_stack = {}
    );
};

} // namespace bitcoin_vm
