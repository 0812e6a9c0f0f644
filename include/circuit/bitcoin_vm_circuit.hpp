#pragma once

#include "types/b_field_element.hpp"
#include "checksig/checksig_chip.hpp"
#include "circuit/assignment.hpp"
#include "circuit/constraint_system.hpp"
#include "circuit/mock_prover.hpp"
#include "execution/execution_chip.hpp"
#include "script/stack_element.hpp"
#include <cstdint>
#include <vector>

namespace bitcoin_vm {

/**
 * Witness inputs of one scriptPubkey execution
 */
struct CircuitInput {
    std::vector<uint8_t> script;
    BFieldElement randomness;
    // Index 0 = top
    std::vector<StackElement> initial_stack;
    // One per OP_CHECKSIG with a valid signature, in script order
    std::vector<SignatureWithKey> signatures;
};

struct BitcoinVmConfig {
    ExecutionConfig execution;
    CheckSigConfig checksig;
};

/**
 * BitcoinVmCircuit - execution region, checksig bridge and their tables
 * 
 * Public inputs (one instance column): script length, initial script RLC
 * and the randomness.
 */
class BitcoinVmCircuit {
public:
    explicit BitcoinVmCircuit(CircuitInput input) : input_(std::move(input)) {}

    static BitcoinVmConfig configure(ConstraintSystem& cs);

    /**
     * Build the witness
     * 
     * @throws std::invalid_argument for oversized inputs or malformed scripts
     * @throws SynthesisError when the signatures do not match the script
     */
    Assignment synthesize(const ConstraintSystem& cs, const BitcoinVmConfig& config) const;

    std::vector<std::vector<BFieldElement>> instances() const;

    /**
     * configure + synthesize + MockProver::verify
     */
    std::vector<VerifyFailure> mock_verify() const;

    const CircuitInput& input() const { return input_; }

private:
    CircuitInput input_;
};

} // namespace bitcoin_vm
