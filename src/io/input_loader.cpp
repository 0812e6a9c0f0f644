#include "io/input_loader.hpp"
#include "common/hex.hpp"
#include "crypto/secp256k1.hpp"
#include "script/opcodes.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace bitcoin_vm {

namespace {

secp256k1::Scalar parse_scalar(const nlohmann::json& json, const char* field) {
    if (!json.contains(field) || !json[field].is_string()) {
        throw std::invalid_argument(std::string("signature field '") + field + "' must be a hex string");
    }
    const std::vector<uint8_t> bytes = bytes_from_hex(json[field].get<std::string>());
    if (bytes.size() != 32) {
        throw std::invalid_argument(std::string("signature field '") + field + "' must be 32 bytes");
    }
    secp256k1::Scalar scalar{};
    std::copy(bytes.begin(), bytes.end(), scalar.begin());
    return scalar;
}

StackElement parse_stack_element(const nlohmann::json& json) {
    if (!json.is_string()) {
        throw std::invalid_argument("initial_stack entries must be strings");
    }
    const std::string value = json.get<std::string>();
    if (value == "valid_signature") return StackElement::valid_signature();
    if (value == "invalid_signature") return StackElement::invalid_signature();
    return StackElement::bytes(bytes_from_hex(value));
}

nlohmann::json field_json(BFieldElement value) {
    return value.value();
}

} // anonymous namespace

nlohmann::json InputLoader::load_json(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    return nlohmann::json::parse(file);
}

CircuitInput InputLoader::parse_input(const nlohmann::json& json) {
    if (!json.is_object() || !json.contains("script") || !json["script"].is_string()) {
        throw std::invalid_argument("input must be an object with a hex 'script' field");
    }

    CircuitInput input;
    input.script = bytes_from_hex(json["script"].get<std::string>());
    input.randomness = BFieldElement(json.value("randomness", uint64_t{0}));

    if (json.contains("initial_stack")) {
        for (const auto& entry : json["initial_stack"]) {
            input.initial_stack.push_back(parse_stack_element(entry));
        }
    }
    if (json.contains("signatures")) {
        for (const auto& entry : json["signatures"]) {
            if (!entry.contains("public_key") || !entry["public_key"].is_string()) {
                throw std::invalid_argument("signature entry needs a hex 'public_key'");
            }
            const secp256k1::Signature signature{parse_scalar(entry, "r"), parse_scalar(entry, "s")};
            const secp256k1::AffinePoint key =
                secp256k1::parse_public_key(bytes_from_hex(entry["public_key"].get<std::string>()));
            input.signatures.emplace_back(signature, key);
        }
    }
    return input;
}

nlohmann::json InputLoader::trace_to_json(const ScriptVM::TraceResult& trace) {
    nlohmann::json out;
    out["script_length"] = trace.script_length();
    out["randomness"] = field_json(trace.randomness);
    out["initial_script_rlc"] = field_json(trace.initial_script_rlc);
    out["pk_rlc_acc"] = field_json(trace.pk_rlc_acc());
    out["num_checksig_opcodes"] = trace.num_checksig_opcodes();

    nlohmann::json public_inputs = nlohmann::json::array();
    for (const auto& value : trace.public_inputs()) {
        public_inputs.push_back(field_json(value));
    }
    out["public_inputs"] = public_inputs;

    nlohmann::json final_stack = nlohmann::json::array();
    for (const auto& slot : trace.final_stack()) {
        final_stack.push_back(field_json(slot));
    }
    out["final_stack"] = final_stack;

    // Padding rows repeat the final state; dump up to the first one
    const size_t last_dumped = std::min(trace.script_length() + 1, ScriptVM::LAST_ROW - 1);
    nlohmann::json rows = nlohmann::json::array();
    auto dump_row = [&](size_t index) {
        const TraceRow& row = trace.rows[index];
        nlohmann::json j;
        j["row"] = index;
        j["opcode"] = row.opcode;
        j["opcode_name"] = opcode_name(row.opcode);
        j["mode"] = parse_mode_name(row.mode);
        j["script_rlc_acc"] = field_json(row.script_rlc_acc);
        j["num_script_bytes_remaining"] = row.num_script_bytes_remaining;
        j["num_data_bytes_remaining"] = row.num_data_bytes_remaining;
        j["num_data_length_bytes_remaining"] = row.num_data_length_bytes_remaining;
        j["stack_top"] = field_json(row.stack[0]);
        j["pk_rlc_acc"] = field_json(row.pk_rlc_acc);
        j["num_checksig_opcodes"] = row.num_checksig_opcodes;
        j["is_padding"] = row.is_padding;
        rows.push_back(j);
    };
    for (size_t index = 0; index <= last_dumped; ++index) {
        dump_row(index);
    }
    dump_row(ScriptVM::LAST_ROW);
    out["rows"] = rows;
    return out;
}

nlohmann::json InputLoader::failures_to_json(const std::vector<VerifyFailure>& failures) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& failure : failures) {
        out.push_back(failure.to_string());
    }
    return out;
}

} // namespace bitcoin_vm
