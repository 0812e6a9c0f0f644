#include "checksig/checksig_chip.hpp"
#include "circuit/synthesis_error.hpp"
#include "common/debug_control.hpp"
#include "common/rlc.hpp"
#include <stdexcept>
#include <string>

namespace bitcoin_vm {

namespace {

Expression cur(const Column& column) { return Expression::query(column, Rotation::cur()); }
Expression next(const Column& column) { return Expression::query(column, Rotation::next()); }

} // anonymous namespace

CheckSigConfig CheckSigChip::configure(ConstraintSystem& cs, const EcdsaConfig& ecdsa, const RangeCheckConfig& range) {
    CheckSigConfig config;
    config.ecdsa = ecdsa;
    config.range = range;

    config.randomness = cs.advice_column();
    cs.enable_equality(config.randomness);
    cs.annotate_column(config.randomness, "bridge_randomness");
    for (size_t k = 0; k < PUBLIC_KEY_RLC_POWERS; ++k) {
        config.powers[k] = cs.advice_column();
    }
    config.num_checksig_opcodes = cs.advice_column();
    cs.enable_equality(config.num_checksig_opcodes);
    cs.annotate_column(config.num_checksig_opcodes, "bridge_num_checksig_opcodes");
    config.pk_rlc_acc = cs.advice_column();
    cs.enable_equality(config.pk_rlc_acc);
    cs.annotate_column(config.pk_rlc_acc, "bridge_pk_rlc_acc");
    config.pk_rlc = cs.advice_column();
    cs.annotate_column(config.pk_rlc, "bridge_pk_rlc");
    config.pk_prefix = cs.advice_column();
    cs.annotate_column(config.pk_prefix, "bridge_pk_prefix");
    for (size_t k = 0; k < PUBLIC_KEY_COORDINATE_BYTES; ++k) {
        config.x_le[k] = cs.advice_column();
        config.y_le[k] = cs.advice_column();
        cs.enable_equality(config.x_le[k]);
        cs.enable_equality(config.y_le[k]);
    }
    config.q_bridge = cs.selector();
    config.q_end = cs.selector();

    const Expression q = Expression::query(config.q_bridge);
    const Expression q_end = Expression::query(config.q_end);
    const Expression one = Expression::constant(1);
    const Expression r = cur(config.randomness);

    {
        std::vector<Expression> constraints = {
            q * (next(config.randomness) - r),
            q * (cur(config.powers[0]) - r),
        };
        for (size_t k = 1; k < PUBLIC_KEY_RLC_POWERS; ++k) {
            constraints.push_back(q * (cur(config.powers[k]) - cur(config.powers[k - 1]) * r));
        }
        cs.create_gate("randomness powers", std::move(constraints));
    }

    // r^k
    auto power = [&config, &one](size_t k) {
        return k == 0 ? one : cur(config.powers[k - 1]);
    };

    const Expression prefix = cur(config.pk_prefix);
    const Expression two = Expression::constant(PREFIX_PK_COMPRESSED_EVEN_Y);
    const Expression three = Expression::constant(PREFIX_PK_COMPRESSED_ODD_Y);
    const Expression four = Expression::constant(PREFIX_PK_UNCOMPRESSED);
    // 1 for 0x04, 0 for 0x02 and 0x03
    const Expression uncompressed = (prefix - two) * (prefix - three) * Expression(BFieldElement(2).inverse());
    const Expression compressed = one - uncompressed;

    {
        std::vector<Expression> compressed_terms = {prefix * power(PUBLIC_KEY_COORDINATE_BYTES)};
        std::vector<Expression> uncompressed_terms = {prefix * power(PUBLIC_KEY_RLC_POWERS)};
        for (size_t k = 0; k < PUBLIC_KEY_COORDINATE_BYTES; ++k) {
            compressed_terms.push_back(cur(config.x_le[k]) * power(k));
            uncompressed_terms.push_back(cur(config.x_le[k]) * power(PUBLIC_KEY_COORDINATE_BYTES + k));
            uncompressed_terms.push_back(cur(config.y_le[k]) * power(k));
        }
        cs.create_gate("public key rlc", {
            q * (prefix - two) * (prefix - three) * (prefix - four),
            q * (cur(config.pk_rlc) - (compressed * Expression::sum(compressed_terms) +
                                       uncompressed * Expression::sum(uncompressed_terms))),
        });
    }

    config.num_checksig_opcodes_is_zero = IsZeroChip::configure(
        cs, "num_checksig_opcodes", q, cur(config.num_checksig_opcodes), cs.advice_column());

    {
        const Expression count = cur(config.num_checksig_opcodes);
        const Expression done = config.num_checksig_opcodes_is_zero.expr();
        const Expression pending = one - done;
        cs.create_gate("pk_rlc_acc folds verified keys", {
            q * pending * (cur(config.pk_rlc_acc) - cur(config.pk_rlc) - r * next(config.pk_rlc_acc)),
            q * pending * (next(config.num_checksig_opcodes) + one - count),
            q * done * cur(config.pk_rlc_acc),
            q * done * next(config.num_checksig_opcodes),
        });
        cs.create_gate("every checksig consumed", {
            q_end * count,
            q_end * cur(config.pk_rlc_acc),
        });
    }

    config.parity_table = ParityTableChip::configure(cs, q, prefix, cur(config.y_le[0]));

    return config;
}

CheckSigRegions CheckSigChip::plan(Layouter& layouter) const {
    CheckSigRegions regions;
    regions.ecdsa = layouter.plan_region("ecdsa", NUM_SLOTS * ecdsa_.rows_per_verification());
    regions.range = layouter.plan_region("public key range check", NUM_SLOTS * RANGE_ROWS_PER_SLOT);
    regions.bridge = layouter.plan_region("checksig bridge", BRIDGE_ROWS);
    layouter.plan_table("public key parity table", ParityTableChip::NUM_ROWS);
    layouter.plan_table("byte range table", RangeCheckChip::TABLE_ROWS);
    return regions;
}

void CheckSigChip::load(Layouter& layouter) const {
    ParityTableChip(config_.parity_table).load(layouter);
    RangeCheckChip(config_.range).load(layouter);
}

BFieldElement CheckSigChip::public_key_rlc(const secp256k1::AffinePoint& point, bool compressed,
                                           BFieldElement randomness) {
    return Rlc::horner(secp256k1::serialize_public_key(point, compressed), randomness);
}

SignatureWithKey CheckSigChip::padding_signature() {
    const secp256k1::Scalar one = secp256k1::scalar_from_u64(1);
    const secp256k1::Scalar hash = secp256k1::scalar_from_u64(ECDSA_MESSAGE_HASH);
    // sk = 1 makes the key the generator
    return {secp256k1::sign_with_nonce(one, one, hash), secp256k1::generator()};
}

std::vector<CheckSigChip::Slot> CheckSigChip::build_slots(
    const std::vector<SignatureWithKey>& signatures,
    const std::vector<CollectedPublicKey>& collected_keys
) const {
    if (signatures.size() > NUM_SLOTS) {
        throw std::invalid_argument("at most " + std::to_string(NUM_SLOTS) + " signatures are supported, got " +
                                    std::to_string(signatures.size()));
    }
    if (signatures.size() != collected_keys.size()) {
        throw SynthesisError(std::to_string(signatures.size()) + " signatures supplied but the script checks " +
                             std::to_string(collected_keys.size()) + " valid signatures");
    }
    for (size_t j = 0; j < signatures.size(); ++j) {
        if (signatures[j].second != collected_keys[j].point) {
            throw SynthesisError("public key of signature " + std::to_string(j) +
                                 " does not match the key consumed by the script");
        }
    }

    const size_t m = signatures.size();
    const SignatureWithKey padding = padding_signature();
    const uint8_t padding_prefix = secp256k1::serialize_public_key(padding.second, true)[0];

    std::vector<Slot> slots;
    slots.reserve(NUM_SLOTS);
    for (size_t i = 0; i < NUM_SLOTS; ++i) {
        if (i < m) {
            const size_t j = m - 1 - i;
            slots.push_back(Slot{signatures[j].first, signatures[j].second, collected_keys[j].bytes[0]});
        } else {
            slots.push_back(Slot{padding.first, padding.second, padding_prefix});
        }
    }
    return slots;
}

BridgeCells CheckSigChip::assign(
    Layouter& layouter,
    const CheckSigRegions& regions,
    BFieldElement randomness,
    const std::vector<SignatureWithKey>& signatures,
    const std::vector<CollectedPublicKey>& collected_keys
) const {
    const std::vector<Slot> slots = build_slots(signatures, collected_keys);
    const size_t m = signatures.size();
    const secp256k1::Scalar message_hash = secp256k1::scalar_from_u64(ECDSA_MESSAGE_HASH);

    // Verify each slot and range check its coordinate limbs
    Region ecdsa_region = layouter.region(regions.ecdsa);
    Region range_region = layouter.region(regions.range);
    const RangeCheckChip range_chip(config_.range);

    std::vector<std::array<AssignedCell, PUBLIC_KEY_COORDINATE_BYTES>> x_bytes(NUM_SLOTS);
    std::vector<std::array<AssignedCell, PUBLIC_KEY_COORDINATE_BYTES>> y_bytes(NUM_SLOTS);
    const size_t limb_rows = RangeCheckChip::rows_for(ECDSA_LIMB_BITS);

    for (size_t i = 0; i < NUM_SLOTS; ++i) {
        const AssignedPublicKey key = ecdsa_.verify(
            ecdsa_region, i * ecdsa_.rows_per_verification(), slots[i].signature, slots[i].point, message_hash);

        const size_t base = i * RANGE_ROWS_PER_SLOT;
        for (size_t limb = 0; limb < ECDSA_NUM_LIMBS; ++limb) {
            const auto x = range_chip.decompose(range_region, base + limb * limb_rows,
                                                key.x[limb], 8, ECDSA_LIMB_BITS);
            const auto y = range_chip.decompose(range_region, base + (ECDSA_NUM_LIMBS + limb) * limb_rows,
                                                key.y[limb], 8, ECDSA_LIMB_BITS);
            for (size_t j = 0; j < x.size(); ++j) {
                x_bytes[i][4 * limb + j] = x[j];
                y_bytes[i][4 * limb + j] = y[j];
            }
        }
    }

    // Bridge rows, accumulator filled from the end
    Region bridge = layouter.region(regions.bridge);
    const std::vector<BFieldElement> powers = Rlc::powers(randomness, PUBLIC_KEY_RLC_POWERS);

    std::vector<BFieldElement> pk_rlc(NUM_SLOTS);
    std::vector<BFieldElement> pk_rlc_acc(BRIDGE_ROWS, BFieldElement::zero());
    for (size_t i = 0; i < NUM_SLOTS; ++i) {
        const bool compressed = slots[i].prefix != PREFIX_PK_UNCOMPRESSED;
        pk_rlc[i] = public_key_rlc(slots[i].point, compressed, randomness);
    }
    for (size_t i = m; i-- > 0;) {
        pk_rlc_acc[i] = pk_rlc[i] + randomness * pk_rlc_acc[i + 1];
    }

    BridgeCells cells;
    for (size_t row = 0; row < BRIDGE_ROWS; ++row) {
        const BFieldElement count(static_cast<uint64_t>(row < m ? m - row : 0));
        const AssignedCell r_cell = bridge.assign_advice(config_.randomness, row, randomness);
        const AssignedCell count_cell = bridge.assign_advice(config_.num_checksig_opcodes, row, count);
        const AssignedCell acc_cell = bridge.assign_advice(config_.pk_rlc_acc, row, pk_rlc_acc[row]);
        if (row == 0) {
            cells = BridgeCells{r_cell, acc_cell, count_cell};
        }

        if (row == NUM_SLOTS) {
            bridge.enable_selector(config_.q_end, row);
            break;
        }

        bridge.enable_selector(config_.q_bridge, row);
        for (size_t k = 0; k < PUBLIC_KEY_RLC_POWERS; ++k) {
            bridge.assign_advice(config_.powers[k], row, powers[k + 1]);
        }
        IsZeroChip(config_.num_checksig_opcodes_is_zero).assign(bridge, row, count);
        bridge.assign_advice(config_.pk_rlc, row, pk_rlc[row]);
        bridge.assign_advice(config_.pk_prefix, row, BFieldElement(slots[row].prefix));

        for (size_t k = 0; k < PUBLIC_KEY_COORDINATE_BYTES; ++k) {
            bridge.copy_advice(x_bytes[row][k], config_.x_le[k], row);
            bridge.copy_advice(y_bytes[row][k], config_.y_le[k], row);
        }
    }

    layouter.commit(ecdsa_region);
    layouter.commit(range_region);
    layouter.commit(bridge);

    BITCOIN_VM_DEBUG_PRINT("[checksig] %zu signatures in %zu slots, pk_rlc_acc=%s\n",
                           m, NUM_SLOTS, pk_rlc_acc[0].to_string().c_str());
    return cells;
}

} // namespace bitcoin_vm
