#include "checksig/pk_collector.hpp"
#include "common/debug_control.hpp"
#include "script/opcodes.hpp"
#include <deque>
#include <stdexcept>
#include <string>

namespace bitcoin_vm {

namespace {

class SymbolicStack {
public:
    explicit SymbolicStack(const std::vector<StackElement>& initial)
        : items_(initial.begin(), initial.end()) {
        truncate();
    }

    void push(StackElement element) {
        items_.push_front(std::move(element));
        truncate();
    }

    StackElement pop() {
        StackElement top = std::move(items_.front());
        items_.pop_front();
        return top;
    }

    size_t size() const { return items_.size(); }
    const StackElement& at(size_t index) const { return items_.at(index); }

private:
    // Items pushed past the bottom slot are lost, as in the stack columns
    void truncate() {
        while (items_.size() > MAX_STACK_DEPTH) {
            items_.pop_back();
        }
    }

    std::deque<StackElement> items_;
};

// Read `count` bytes at `pos`, failing if the script ends first
std::vector<uint8_t> read_bytes(const std::vector<uint8_t>& script, size_t pos, size_t count) {
    if (count > script.size() - pos) {
        throw std::invalid_argument("push of " + std::to_string(count) + " bytes at position " +
                                    std::to_string(pos) + " overruns the script");
    }
    return std::vector<uint8_t>(script.begin() + pos, script.begin() + pos + count);
}

} // anonymous namespace

std::vector<CollectedPublicKey> collect_public_keys(
    const std::vector<uint8_t>& script,
    const std::vector<StackElement>& initial_stack
) {
    if (script.size() > MAX_SCRIPT_PUBKEY_SIZE) {
        throw std::invalid_argument("script of " + std::to_string(script.size()) +
                                    " bytes exceeds " + std::to_string(MAX_SCRIPT_PUBKEY_SIZE));
    }

    SymbolicStack stack(initial_stack);
    std::vector<CollectedPublicKey> keys;

    size_t pos = 0;
    while (pos < script.size()) {
        const uint8_t opcode = script[pos++];

        if (is_op0(opcode)) {
            stack.push(StackElement::bytes({}));
        } else if (is_op1_to_op16(opcode)) {
            stack.push(StackElement::bytes({static_cast<uint8_t>(opcode - OP_RESERVED)}));
        } else if (is_push1_to_push75(opcode)) {
            stack.push(StackElement::bytes(read_bytes(script, pos, opcode)));
            pos += opcode;
        } else if (is_pushdata(opcode)) {
            const size_t width = pushdata_length_width(opcode);
            const std::vector<uint8_t> field = read_bytes(script, pos, width);
            pos += width;
            uint64_t length = 0;
            for (size_t j = 0; j < width; ++j) {
                length |= static_cast<uint64_t>(field[j]) << (8 * j);
            }
            if (length == 0) {
                throw std::invalid_argument("OP_PUSHDATA with zero data length");
            }
            stack.push(StackElement::bytes(read_bytes(script, pos, length)));
            pos += length;
        } else if (is_checksig(opcode)) {
            if (stack.size() < 2) {
                throw std::invalid_argument("OP_CHECKSIG at position " + std::to_string(pos - 1) +
                                            " needs two stack items, found " + std::to_string(stack.size()));
            }
            const StackElement& signature = stack.at(1);
            if (!signature.is_signature()) {
                throw std::invalid_argument("OP_CHECKSIG at position " + std::to_string(pos - 1) +
                                            " expects a signature below the public key, found " +
                                            signature.to_string());
            }
            const bool valid = signature.kind == StackElement::Kind::ValidSignature;
            if (valid) {
                const StackElement& public_key = stack.at(0);
                if (public_key.is_signature()) {
                    throw std::invalid_argument("OP_CHECKSIG public key is a signature");
                }
                keys.push_back(CollectedPublicKey{public_key.data, secp256k1::parse_public_key(public_key.data)});
            }
            stack.pop();
            stack.pop();
            stack.push(valid ? StackElement::valid_signature() : StackElement::invalid_signature());
        }
        // OP_NOP and disabled opcodes do not touch the stack
    }

    BITCOIN_VM_DEBUG_PRINT("[pk_collector] %zu public keys collected from %zu script bytes\n",
                           keys.size(), script.size());
    return keys;
}

} // namespace bitcoin_vm
