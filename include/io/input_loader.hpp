#pragma once

#include "circuit/bitcoin_vm_circuit.hpp"
#include "circuit/mock_prover.hpp"
#include "script/script_vm.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace bitcoin_vm {

/**
 * InputLoader - JSON circuit inputs and trace dumps
 * 
 * Input format:
 * {
 *   "script": "<hex>",
 *   "randomness": <u64>,
 *   "initial_stack": ["valid_signature" | "invalid_signature" | "<hex data>", ...],
 *   "signatures": [{"r": "<hex32>", "s": "<hex32>", "public_key": "<SEC1 hex>"}, ...]
 * }
 * initial_stack lists the top first; everything but "script" is optional.
 */
class InputLoader {
public:
    static nlohmann::json load_json(const std::string& path);

    /**
     * @throws std::invalid_argument for missing or malformed fields
     */
    static CircuitInput parse_input(const nlohmann::json& json);

    static CircuitInput load_input(const std::string& path) { return parse_input(load_json(path)); }

    /**
     * Rows 0..script_length+1 plus the last row, with the summary fields
     */
    static nlohmann::json trace_to_json(const ScriptVM::TraceResult& trace);

    static nlohmann::json failures_to_json(const std::vector<VerifyFailure>& failures);
};

} // namespace bitcoin_vm
