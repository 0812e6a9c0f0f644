#pragma once

#include <stdexcept>
#include <string>

namespace bitcoin_vm {

/**
 * SynthesisError - witness inputs are inconsistent with each other
 * (collected keys vs. supplied signatures, failed signature checks).
 * No partial witness is produced.
 */
class SynthesisError : public std::runtime_error {
public:
    explicit SynthesisError(const std::string& what)
        : std::runtime_error("synthesis error: " + what) {}
};

} // namespace bitcoin_vm
