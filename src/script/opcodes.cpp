#include "script/opcodes.hpp"
#include <sstream>
#include <iomanip>

namespace bitcoin_vm {

bool classify_opcode(uint8_t opcode, OpcodeClass& cls) {
    if (is_op0(opcode)) {
        cls = OpcodeClass::Op0;
    } else if (is_op1_to_op16(opcode)) {
        cls = OpcodeClass::Op1ToOp16;
    } else if (is_push1_to_push75(opcode)) {
        cls = OpcodeClass::Push1ToPush75;
    } else if (opcode == OP_PUSHDATA1) {
        cls = OpcodeClass::PushData1;
    } else if (opcode == OP_PUSHDATA2) {
        cls = OpcodeClass::PushData2;
    } else if (opcode == OP_PUSHDATA4) {
        cls = OpcodeClass::PushData4;
    } else if (is_checksig(opcode)) {
        cls = OpcodeClass::CheckSig;
    } else {
        return false;
    }
    return true;
}

std::string opcode_name(uint8_t opcode) {
    if (opcode == OP_0) return "OP_0";
    if (is_push1_to_push75(opcode)) return "OP_PUSHBYTES_" + std::to_string(opcode);
    switch (opcode) {
        case OP_PUSHDATA1: return "OP_PUSHDATA1";
        case OP_PUSHDATA2: return "OP_PUSHDATA2";
        case OP_PUSHDATA4: return "OP_PUSHDATA4";
        case OP_1NEGATE: return "OP_1NEGATE";
        case OP_RESERVED: return "OP_RESERVED";
        case OP_NOP: return "OP_NOP";
        case OP_CHECKSIG: return "OP_CHECKSIG";
        default: break;
    }
    if (is_op1_to_op16(opcode)) {
        return "OP_" + std::to_string(opcode - OP_RESERVED);
    }
    std::ostringstream oss;
    oss << "OP_UNKNOWN(0x" << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(opcode) << ")";
    return oss.str();
}

} // namespace bitcoin_vm
