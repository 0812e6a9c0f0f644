#include "circuit/bitcoin_vm_circuit.hpp"
#include "checksig/pk_collector.hpp"
#include "common/debug_control.hpp"
#include "common/rlc.hpp"
#include "gadgets/range_check.hpp"
#include "script/script_vm.hpp"
#include <chrono>
#include <stdexcept>
#include <string>

#ifdef BVM_USE_TBB
#include <tbb/parallel_invoke.h>
#else
#include <future>
#endif

namespace bitcoin_vm {

BitcoinVmConfig BitcoinVmCircuit::configure(ConstraintSystem& cs) {
    BitcoinVmConfig config;
    config.execution = ExecutionChip::configure(cs);
    const EcdsaConfig ecdsa = NativeEcdsaChip::configure(cs);
    const RangeCheckConfig range = RangeCheckChip::configure(cs);
    config.checksig = CheckSigChip::configure(cs, ecdsa, range);
    return config;
}

Assignment BitcoinVmCircuit::synthesize(const ConstraintSystem& cs, const BitcoinVmConfig& config) const {
    auto t_start = std::chrono::high_resolution_clock::now();

    if (input_.signatures.size() > MAX_CHECKSIG_COUNT) {
        throw std::invalid_argument("at most " + std::to_string(MAX_CHECKSIG_COUNT) +
                                    " signatures are supported, got " + std::to_string(input_.signatures.size()));
    }

    const ScriptVM::TraceResult trace =
        ScriptVM::trace_execution(input_.script, input_.randomness, input_.initial_stack);
    const std::vector<CollectedPublicKey> keys = collect_public_keys(input_.script, input_.initial_stack);

    const ExecutionChip execution(config.execution);
    const NativeEcdsaChip ecdsa(config.checksig.ecdsa);
    const CheckSigChip checksig(config.checksig, ecdsa);

    Layouter layouter(cs);
    const size_t execution_region = layouter.plan_region("execution", ExecutionChip::NUM_ROWS);
    layouter.plan_table("opcode table", OpcodeTableChip::NUM_ROWS);
    const CheckSigRegions checksig_regions = checksig.plan(layouter);
    layouter.allocate();

    execution.load(layouter);
    checksig.load(layouter);

    // The two sides write disjoint rows and columns
    ExecutionCells execution_cells;
    BridgeCells bridge_cells;
    auto fill_execution = [&]() {
        Region region = layouter.region(execution_region);
        execution_cells = execution.assign(region, trace);
        layouter.commit(region);
    };
    auto fill_checksig = [&]() {
        bridge_cells = checksig.assign(layouter, checksig_regions, input_.randomness, input_.signatures, keys);
    };

#ifdef BVM_USE_TBB
    tbb::parallel_invoke(fill_execution, fill_checksig);
#else
    auto execution_done = std::async(std::launch::async, fill_execution);
    fill_checksig();
    execution_done.get();
#endif

    layouter.constrain_equal(execution_cells.pk_rlc_acc.cell, bridge_cells.pk_rlc_acc.cell);
    layouter.constrain_equal(execution_cells.num_checksig_opcodes.cell, bridge_cells.num_checksig_opcodes.cell);
    layouter.constrain_equal(execution_cells.randomness.cell, bridge_cells.randomness.cell);
    execution.expose_public(layouter, execution_cells);

    BITCOIN_VM_PROFILE_PRINT("[circuit] synthesized %zu rows in %.2f ms\n", layouter.num_rows(),
                             std::chrono::duration<double, std::milli>(
                                 std::chrono::high_resolution_clock::now() - t_start).count());
    return layouter.take_assignment();
}

std::vector<std::vector<BFieldElement>> BitcoinVmCircuit::instances() const {
    return {{
        BFieldElement(static_cast<uint64_t>(input_.script.size())),
        Rlc::horner_reversed(input_.script, input_.randomness),
        input_.randomness,
    }};
}

std::vector<VerifyFailure> BitcoinVmCircuit::mock_verify() const {
    ConstraintSystem cs;
    const BitcoinVmConfig config = configure(cs);
    const Assignment assignment = synthesize(cs, config);
    return MockProver::run(cs, assignment, instances()).verify();
}

} // namespace bitcoin_vm
