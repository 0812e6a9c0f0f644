#include "script/script_state.hpp"
#include "common/debug_control.hpp"
#include <stdexcept>

namespace bitcoin_vm {

const char* parse_mode_name(ParseMode mode) {
    switch (mode) {
        case ParseMode::Idle: return "Idle";
        case ParseMode::PendingFixedPush: return "PendingFixedPush";
        case ParseMode::PendingLengthField: return "PendingLengthField";
    }
    return "Unknown";
}

ScriptState::ScriptState(BFieldElement randomness, const StackSlots& initial_stack)
    : randomness_(randomness),
      stack_(initial_stack),
      parse_state_(ParseState::idle()),
      pk_rlc_acc_(BFieldElement::zero()) {}

TraceRow ScriptState::step(uint8_t byte, uint64_t bytes_left_after) {
    TraceRow row;
    row.opcode = byte;
    row.mode = parse_state_.mode;

    switch (parse_state_.mode) {
        case ParseMode::Idle:
            execute_opcode(byte, bytes_left_after);
            break;

        case ParseMode::PendingFixedPush:
            row.num_data_bytes_remaining = parse_state_.remaining;
            stack_.set_top(BFieldElement(byte) + randomness_ * stack_.top());
            if (parse_state_.remaining == 1) {
                parse_state_ = ParseState::idle();
            } else {
                parse_state_.remaining -= 1;
            }
            break;

        case ParseMode::PendingLengthField: {
            // Length bytes are little-endian
            const uint64_t decoded = parse_state_.decoded_length +
                                     static_cast<uint64_t>(byte) * parse_state_.length_weight;
            row.num_data_bytes_remaining = decoded;
            row.num_data_length_bytes_remaining = parse_state_.remaining;
            row.num_data_length_acc_constant = parse_state_.length_weight;

            if (parse_state_.remaining == 1) {
                if (decoded == 0) {
                    throw std::invalid_argument("OP_PUSHDATA with zero data length");
                }
                if (decoded > bytes_left_after) {
                    throw std::invalid_argument("OP_PUSHDATA of " + std::to_string(decoded) +
                                                " bytes overruns the script (" +
                                                std::to_string(bytes_left_after) + " bytes left)");
                }
                parse_state_ = ParseState::fixed_push(decoded);
            } else {
                parse_state_.decoded_length = decoded;
                parse_state_.length_weight *= 256;
                parse_state_.remaining -= 1;
            }
            break;
        }
    }

    row.stack = stack_.slots();
    row.pk_rlc_acc = pk_rlc_acc_;
    row.num_checksig_opcodes = num_checksig_opcodes_;
    return row;
}

void ScriptState::execute_opcode(uint8_t opcode, uint64_t bytes_left_after) {
    if (is_op0(opcode)) {
        stack_.push(BFieldElement(EMPTY_ARRAY_REPRESENTATION));
    } else if (is_op1_to_op16(opcode)) {
        stack_.push(BFieldElement(static_cast<uint64_t>(opcode - OP_RESERVED)));
    } else if (is_push1_to_push75(opcode)) {
        if (opcode > bytes_left_after) {
            throw std::invalid_argument("push of " + std::to_string(opcode) +
                                        " bytes overruns the script (" +
                                        std::to_string(bytes_left_after) + " bytes left)");
        }
        // Zero seed for the data accumulator
        stack_.push(BFieldElement::zero());
        parse_state_ = ParseState::fixed_push(opcode);
    } else if (is_pushdata(opcode)) {
        const size_t width = pushdata_length_width(opcode);
        if (width > bytes_left_after) {
            throw std::invalid_argument(opcode_name(opcode) + " length field overruns the script");
        }
        stack_.push(BFieldElement::zero());
        parse_state_ = ParseState::length_field(width);
    } else if (is_checksig(opcode)) {
        execute_checksig();
    } else if (!opcode_enabled(opcode)) {
        // Left to the execution constraints, which reject disabled opcodes
        BITCOIN_VM_DEBUG_FPRINTF(stderr, "[script_state] disabled opcode %s traced as no-op\n",
                                 opcode_name(opcode).c_str());
    }
}

void ScriptState::execute_checksig() {
    const BFieldElement signature_flag = stack_.peek_at(1);
    if (!signature_flag.is_zero() && !signature_flag.is_one()) {
        throw std::invalid_argument("OP_CHECKSIG signature flag must be 0 or 1, got " +
                                    signature_flag.to_string());
    }
    const BFieldElement public_key = stack_.pop();
    stack_.pop();
    if (signature_flag.is_one()) {
        pk_rlc_acc_ = pk_rlc_acc_ * randomness_ + public_key;
        num_checksig_opcodes_ += 1;
    }
    stack_.push(signature_flag);
}

} // namespace bitcoin_vm
