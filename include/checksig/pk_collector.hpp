#pragma once

#include "crypto/secp256k1.hpp"
#include "script/opcodes.hpp"
#include "script/stack_element.hpp"
#include <cstdint>
#include <vector>

namespace bitcoin_vm {

/**
 * Public key consumed by an OP_CHECKSIG whose signature verified
 */
struct CollectedPublicKey {
    std::vector<uint8_t> bytes;
    secp256k1::AffinePoint point;

    bool compressed() const { return bytes.size() == COMPRESSED_PUBLIC_KEY_SIZE; }
};

/**
 * Replay the script over symbolic stack elements and collect, in script
 * order, the public key of every OP_CHECKSIG with a valid signature flag.
 * 
 * Stricter than ScriptVM::trace_execution on two inputs, which trace
 * without error there but throw here:
 *  - OP_CHECKSIG over fewer than two items. The trace pops zero slots,
 *    so the flag reads 0 and the execution region stays satisfiable.
 *  - A data item of field value 1 below the key (OP_1 <pk> OP_CHECKSIG).
 *    The trace takes it as a valid flag; here only a signature element is.
 * Circuit synthesis runs both, so such scripts are rejected before any
 * witness is built.
 * 
 * @param initial_stack Index 0 = top
 * @throws std::invalid_argument for malformed scripts, a data item in the
 *         signature position, fewer than two stack items, or a public key
 *         that does not parse
 */
std::vector<CollectedPublicKey> collect_public_keys(
    const std::vector<uint8_t>& script,
    const std::vector<StackElement>& initial_stack
);

} // namespace bitcoin_vm
