/**
 * Trace and verification utility
 * 
 * Traces a scriptPubkey given as JSON, synthesizes the full circuit and
 * runs the mock prover. Writes the trace dump and the verification
 * summary as JSON.
 */

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <omp.h>
#include "circuit/bitcoin_vm_circuit.hpp"
#include "common/debug_control.hpp"
#include "io/input_loader.hpp"
#include "script/script_vm.hpp"

using namespace bitcoin_vm;

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <input.json> [output.json]\n";
        std::cerr << "Example: " << argv[0] << " p2pk.json /tmp/p2pk_trace.json\n";
        return 1;
    }

    const std::string input_path = argv[1];
    const std::string output_path = argc > 2 ? argv[2] : "";

    if (const char* threads = std::getenv("BITCOIN_VM_THREADS")) {
        const int n = std::atoi(threads);
        if (n > 0) {
            omp_set_num_threads(n);
        }
    }

    nlohmann::json out;
    bool satisfied = false;
    try {
        const CircuitInput input = InputLoader::load_input(input_path);
        std::cout << "Tracing " << input.script.size() << " script bytes, "
                  << input.signatures.size() << " signatures" << std::endl;

        const ScriptVM::TraceResult trace =
            ScriptVM::trace_execution(input.script, input.randomness, input.initial_stack);
        out["trace"] = InputLoader::trace_to_json(trace);

        const BitcoinVmCircuit circuit(input);
        const std::vector<VerifyFailure> failures = circuit.mock_verify();
        satisfied = failures.empty();
        out["verification"] = {
            {"satisfied", satisfied},
            {"failures", InputLoader::failures_to_json(failures)},
        };

        std::cout << "Checksig opcodes with valid signatures: " << trace.num_checksig_opcodes() << std::endl;
        std::cout << "Verification: " << (satisfied ? "satisfied" : "NOT satisfied") << std::endl;
        for (const auto& failure : failures) {
            BITCOIN_VM_DEBUG_COUT("  " << failure.to_string());
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }

    if (output_path.empty()) {
        std::cout << out.dump(2) << std::endl;
    } else {
        std::ofstream f(output_path);
        if (!f.is_open()) {
            std::cerr << "Error: cannot write " << output_path << std::endl;
            return 2;
        }
        f << out.dump(2) << std::endl;
        std::cout << "Trace data dumped to: " << output_path << std::endl;
    }

    return satisfied ? 0 : 3;
}
