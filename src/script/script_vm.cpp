#include "script/script_vm.hpp"
#include "common/debug_control.hpp"
#include "common/rlc.hpp"
#include <stdexcept>

namespace bitcoin_vm {

std::vector<BFieldElement> ScriptVM::TraceResult::public_inputs() const {
    return {
        BFieldElement(static_cast<uint64_t>(script.size())),
        initial_script_rlc,
        randomness,
    };
}

ScriptVM::TraceResult ScriptVM::trace_execution(
    const std::vector<uint8_t>& script,
    BFieldElement randomness,
    const std::vector<StackElement>& initial_stack
) {
    return trace_execution(script, randomness, initial_stack_values(initial_stack, randomness));
}

ScriptVM::TraceResult ScriptVM::trace_execution(
    const std::vector<uint8_t>& script,
    BFieldElement randomness,
    const StackSlots& initial_stack
) {
    if (script.size() > MAX_SCRIPT_PUBKEY_SIZE) {
        throw std::invalid_argument("script of " + std::to_string(script.size()) +
                                    " bytes exceeds MAX_SCRIPT_PUBKEY_SIZE (" +
                                    std::to_string(MAX_SCRIPT_PUBKEY_SIZE) + ")");
    }

    TraceResult result;
    result.script = script;
    result.randomness = randomness;
    result.rows.reserve(NUM_ROWS);

    const std::vector<BFieldElement> script_rlc = Rlc::suffix_accumulators(script, randomness);
    result.initial_script_rlc = script_rlc[0];

    ScriptState state(randomness, initial_stack);

    TraceRow first;
    first.script_rlc_acc = script_rlc[0];
    first.num_script_bytes_remaining = script.size();
    first.stack = initial_stack;
    result.rows.push_back(first);

    const size_t length = script.size();
    for (size_t byte_index = 0; byte_index < MAX_SCRIPT_PUBKEY_SIZE; ++byte_index) {
        if (byte_index < length) {
            TraceRow row = state.step(script[byte_index], length - byte_index - 1);
            row.script_rlc_acc = script_rlc[byte_index + 1];
            row.num_script_bytes_remaining = length - byte_index;
            result.rows.push_back(row);
        } else {
            // Frozen tail: the script is read, state no longer changes
            TraceRow row;
            row.opcode = OP_NOP;
            row.stack = state.stack().slots();
            row.pk_rlc_acc = state.pk_rlc_acc();
            row.num_checksig_opcodes = state.num_checksig_opcodes();
            row.is_padding = true;
            result.rows.push_back(row);
        }
    }

    if (state.parse_state().mode != ParseMode::Idle) {
        // ScriptState rejects overrunning pushes, so this is unreachable for valid input
        throw std::logic_error("script ended inside a push");
    }

    TraceRow last;
    last.opcode = 0;
    last.stack = state.stack().slots();
    last.pk_rlc_acc = state.pk_rlc_acc();
    last.num_checksig_opcodes = state.num_checksig_opcodes();
    last.is_padding = true;
    result.rows.push_back(last);

    BITCOIN_VM_IF_DEBUG {
        std::cout << "[script_vm] traced " << length << " script bytes, "
                  << result.num_checksig_opcodes() << " counted OP_CHECKSIG, top="
                  << result.final_stack()[0] << std::endl;
    }

    return result;
}

} // namespace bitcoin_vm
