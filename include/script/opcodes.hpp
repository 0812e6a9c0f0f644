#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace bitcoin_vm {

// Largest scriptPubkey the execution region can unroll
constexpr size_t MAX_SCRIPT_PUBKEY_SIZE = 520;
constexpr size_t MAX_STACK_DEPTH = 33;

// Number of signature-verification slots; unused slots carry the padding pair
constexpr size_t MAX_CHECKSIG_COUNT = 4;

// A stack element is true if it has a non-zero byte, unless the
// non-zero bytes encode a negative zero (0x80).
constexpr uint64_t NEGATIVE_ZERO = 0x80;

// OP_0 pushes the empty byte array, which is falsy.
constexpr uint64_t EMPTY_ARRAY_REPRESENTATION = NEGATIVE_ZERO;

// Every signature slot verifies against this message hash
constexpr uint64_t ECDSA_MESSAGE_HASH = 1;

// SEC1 public key prefixes
constexpr uint8_t PREFIX_PK_COMPRESSED_EVEN_Y = 0x02;
constexpr uint8_t PREFIX_PK_COMPRESSED_ODD_Y = 0x03;
constexpr uint8_t PREFIX_PK_UNCOMPRESSED = 0x04;
constexpr size_t COMPRESSED_PUBLIC_KEY_SIZE = 33;
constexpr size_t UNCOMPRESSED_PUBLIC_KEY_SIZE = 65;

// Data push opcodes
constexpr uint8_t OP_0 = 0x00;
constexpr uint8_t OP_PUSH_NEXT1 = 0x01;
constexpr uint8_t OP_PUSH_NEXT75 = 0x4b;
constexpr uint8_t OP_PUSHDATA1 = 0x4c;
constexpr uint8_t OP_PUSHDATA2 = 0x4d;
constexpr uint8_t OP_PUSHDATA4 = 0x4e;
constexpr uint8_t OP_1NEGATE = 0x4f;
constexpr uint8_t OP_RESERVED = 0x50;
constexpr uint8_t OP_1 = 0x51;
constexpr uint8_t OP_16 = 0x60;

// Flow control
constexpr uint8_t OP_NOP = 0x61;

// Crypto
constexpr uint8_t OP_CHECKSIG = 0xac;

/**
 * OpcodeClass - the mutually exclusive opcode classes the execution
 * region dispatches on. OP_NOP is enabled but belongs to no class.
 */
enum class OpcodeClass : uint8_t {
    Op0,
    Op1ToOp16,
    Push1ToPush75,
    PushData1,
    PushData2,
    PushData4,
    CheckSig,
};

constexpr size_t OPCODE_CLASS_COUNT = 7;

inline constexpr bool opcode_enabled(uint8_t opcode) {
    return (opcode <= OP_NOP && opcode != OP_1NEGATE && opcode != OP_RESERVED)
        || opcode == OP_CHECKSIG;
}

inline constexpr bool is_op0(uint8_t opcode) { return opcode == OP_0; }

inline constexpr bool is_op1_to_op16(uint8_t opcode) {
    return opcode >= OP_1 && opcode <= OP_16;
}

inline constexpr bool is_push1_to_push75(uint8_t opcode) {
    return opcode >= OP_PUSH_NEXT1 && opcode <= OP_PUSH_NEXT75;
}

inline constexpr bool is_pushdata(uint8_t opcode) {
    return opcode >= OP_PUSHDATA1 && opcode <= OP_PUSHDATA4;
}

inline constexpr bool is_checksig(uint8_t opcode) { return opcode == OP_CHECKSIG; }

// Returns true and sets `cls` if the opcode belongs to one of the classes
bool classify_opcode(uint8_t opcode, OpcodeClass& cls);

// Width in bytes of the little-endian length field following OP_PUSHDATA1/2/4
inline constexpr size_t pushdata_length_width(uint8_t opcode) {
    return size_t{1} << (opcode - OP_PUSHDATA1);
}

std::string opcode_name(uint8_t opcode);

} // namespace bitcoin_vm
