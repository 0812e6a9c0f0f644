#include "execution/execution_chip.hpp"
#include "common/debug_control.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace bitcoin_vm {

namespace {

Expression cur(const Column& column) { return Expression::query(column, Rotation::cur()); }
Expression prev(const Column& column) { return Expression::query(column, Rotation::prev()); }
Expression next(const Column& column) { return Expression::query(column, Rotation::next()); }
Expression constant(uint64_t value) { return Expression::constant(value); }

// cond * (stack[i] - prev.stack[i - 1]) for every i >= 1
void push_shift_right(std::vector<Expression>& constraints, const Expression& cond,
                      const std::array<Column, MAX_STACK_DEPTH>& stack) {
    for (size_t i = 1; i < MAX_STACK_DEPTH; ++i) {
        constraints.push_back(cond * (cur(stack[i]) - prev(stack[i - 1])));
    }
}

// cond * (stack[i] - prev.stack[i]) for every i >= from
void push_stack_unchanged(std::vector<Expression>& constraints, const Expression& cond,
                          const std::array<Column, MAX_STACK_DEPTH>& stack, size_t from = 0) {
    for (size_t i = from; i < MAX_STACK_DEPTH; ++i) {
        constraints.push_back(cond * (cur(stack[i]) - prev(stack[i])));
    }
}

} // anonymous namespace

ExecutionConfig ExecutionChip::configure(ConstraintSystem& cs) {
    ExecutionConfig config;

    config.instance = cs.instance_column();
    cs.enable_equality(config.instance);
    config.randomness = cs.advice_column();
    cs.enable_equality(config.randomness);
    cs.annotate_column(config.randomness, "randomness");

    config.q_first = cs.selector();
    config.q_execution = cs.selector();
    config.q_last = cs.selector();

    config.opcode = cs.advice_column();
    cs.annotate_column(config.opcode, "opcode");
    config.indicators.enabled = cs.advice_column();
    config.indicators.op0 = cs.advice_column();
    config.indicators.op1_to_op16 = cs.advice_column();
    config.indicators.push1_to_push75 = cs.advice_column();
    config.indicators.pushdata1 = cs.advice_column();
    config.indicators.pushdata2 = cs.advice_column();
    config.indicators.pushdata4 = cs.advice_column();
    config.indicators.checksig = cs.advice_column();
    cs.annotate_column(config.indicators.enabled, "is_opcode_enabled");

    config.script_rlc_acc = cs.advice_column();
    cs.enable_equality(config.script_rlc_acc);
    cs.annotate_column(config.script_rlc_acc, "script_rlc_acc");

    config.num_script_bytes_remaining = cs.advice_column();
    cs.enable_equality(config.num_script_bytes_remaining);
    cs.annotate_column(config.num_script_bytes_remaining, "num_script_bytes_remaining");

    for (size_t i = 0; i < MAX_STACK_DEPTH; ++i) {
        config.stack[i] = cs.advice_column();
        cs.annotate_column(config.stack[i], "stack[" + std::to_string(i) + "]");
    }

    config.num_data_bytes_remaining = cs.advice_column();
    cs.annotate_column(config.num_data_bytes_remaining, "num_data_bytes_remaining");
    config.num_data_length_bytes_remaining = cs.advice_column();
    cs.annotate_column(config.num_data_length_bytes_remaining, "num_data_length_bytes_remaining");
    config.num_data_length_acc_constant = cs.advice_column();
    cs.annotate_column(config.num_data_length_acc_constant, "num_data_length_acc_constant");

    config.pk_rlc_acc = cs.advice_column();
    cs.enable_equality(config.pk_rlc_acc);
    cs.annotate_column(config.pk_rlc_acc, "pk_rlc_acc");
    config.num_checksig_opcodes = cs.advice_column();
    cs.enable_equality(config.num_checksig_opcodes);
    cs.annotate_column(config.num_checksig_opcodes, "num_checksig_opcodes");

    const Expression q_first = Expression::query(config.q_first);
    const Expression q = Expression::query(config.q_execution);
    const Expression q_last = Expression::query(config.q_last);
    const Expression one = constant(1);

    config.num_script_bytes_remaining_is_zero = IsZeroChip::configure(
        cs, "num_script_bytes_remaining", q,
        cur(config.num_script_bytes_remaining), cs.advice_column());
    config.num_data_bytes_remaining_is_zero = IsZeroChip::configure(
        cs, "num_data_bytes_remaining", q,
        cur(config.num_data_bytes_remaining), cs.advice_column());
    config.num_data_length_bytes_remaining_is_zero = IsZeroChip::configure(
        cs, "num_data_length_bytes_remaining", q,
        cur(config.num_data_length_bytes_remaining), cs.advice_column());
    config.num_data_length_bytes_remaining_is_one = IsZeroChip::configure(
        cs, "num_data_length_bytes_remaining - 1", q,
        cur(config.num_data_length_bytes_remaining) - one, cs.advice_column());

    config.opcode_table = OpcodeTableChip::configure(cs, q, config.opcode, config.indicators);

    const auto& stack = config.stack;
    const Expression r = cur(config.randomness);
    const Expression opcode = cur(config.opcode);
    const Expression top = cur(stack[0]);
    const Expression script_read = config.num_script_bytes_remaining_is_zero.expr();
    const Expression active = one - script_read;
    const Expression data_zero = config.num_data_bytes_remaining_is_zero.expr();
    const Expression length_zero = config.num_data_length_bytes_remaining_is_zero.expr();
    const Expression last_length_byte = config.num_data_length_bytes_remaining_is_one.expr();

    // The current byte is an opcode (not data, not a length byte)
    const Expression opcode_row = q * active * data_zero * length_zero;

    const Expression is_op0 = cur(config.indicators.op0);
    const Expression is_op1_to_op16 = cur(config.indicators.op1_to_op16);
    const Expression is_push1_to_push75 = cur(config.indicators.push1_to_push75);
    const Expression is_checksig = cur(config.indicators.checksig);
    // OP_NOP is the only enabled byte without a class indicator
    const Expression is_nop = cur(config.indicators.enabled) - Expression::sum({
        is_op0, is_op1_to_op16, is_push1_to_push75,
        cur(config.indicators.pushdata1), cur(config.indicators.pushdata2), cur(config.indicators.pushdata4),
        is_checksig,
    });

    const Expression data = cur(config.num_data_bytes_remaining);
    const Expression length = cur(config.num_data_length_bytes_remaining);
    const Expression next_data = next(config.num_data_bytes_remaining);
    const Expression next_length = next(config.num_data_length_bytes_remaining);

    cs.create_gate("first row", {
        q_first * data,
        q_first * length,
        q_first * next_data,
        q_first * next_length,
        q_first * cur(config.pk_rlc_acc),
        q_first * cur(config.num_checksig_opcodes),
        q_first * (next(config.num_script_bytes_remaining) - cur(config.num_script_bytes_remaining)),
    });

    cs.create_gate("randomness is the same in all rows", {
        q * (r - prev(config.randomness)),
        q_last * (r - prev(config.randomness)),
    });

    cs.create_gate("pop byte out of script_rlc_acc", {
        q * active * (opcode + r * cur(config.script_rlc_acc) - prev(config.script_rlc_acc)),
        q * active * (next(config.num_script_bytes_remaining) + one - cur(config.num_script_bytes_remaining)),
        q * script_read * cur(config.script_rlc_acc),
        q * script_read * next(config.num_script_bytes_remaining),
    });

    {
        const Expression frozen = q * script_read;
        std::vector<Expression> constraints;
        push_stack_unchanged(constraints, frozen, stack);
        constraints.push_back(frozen * (opcode - constant(OP_NOP)));
        constraints.push_back(frozen * data);
        constraints.push_back(frozen * length);
        constraints.push_back(frozen * (cur(config.pk_rlc_acc) - prev(config.pk_rlc_acc)));
        constraints.push_back(frozen * (cur(config.num_checksig_opcodes) - prev(config.num_checksig_opcodes)));
        cs.create_gate("state frozen once script is read", std::move(constraints));
    }

    cs.create_gate("only enabled opcodes", {
        opcode_row * (one - cur(config.indicators.enabled)),
    });

    {
        const Expression c = opcode_row * is_op1_to_op16;
        std::vector<Expression> constraints = {c * (top - (opcode - constant(OP_RESERVED)))};
        push_shift_right(constraints, c, stack);
        constraints.push_back(c * next_data);
        constraints.push_back(c * next_length);
        cs.create_gate("OP_1 to OP_16", std::move(constraints));
    }

    {
        const Expression c = opcode_row * is_op0;
        std::vector<Expression> constraints = {c * (top - constant(EMPTY_ARRAY_REPRESENTATION))};
        push_shift_right(constraints, c, stack);
        constraints.push_back(c * next_data);
        constraints.push_back(c * next_length);
        cs.create_gate("OP_0", std::move(constraints));
    }

    {
        const Expression c = opcode_row * is_nop;
        std::vector<Expression> constraints;
        push_stack_unchanged(constraints, c, stack);
        constraints.push_back(c * next_data);
        constraints.push_back(c * next_length);
        cs.create_gate("OP_NOP", std::move(constraints));
    }

    {
        const Expression c = opcode_row * is_push1_to_push75;
        std::vector<Expression> constraints = {
            c * top,
            // The opcode value is the number of bytes to push
            c * (next_data - opcode),
            c * next_length,
        };
        push_shift_right(constraints, c, stack);
        cs.create_gate("PUSH1 to PUSH75", std::move(constraints));
    }

    const std::array<std::pair<Column, uint64_t>, 3> pushdata_variants = {{
        {config.indicators.pushdata1, 1},
        {config.indicators.pushdata2, 2},
        {config.indicators.pushdata4, 4},
    }};
    for (const auto& [indicator, width] : pushdata_variants) {
        const Expression c = opcode_row * cur(indicator);
        std::vector<Expression> constraints = {
            c * top,
            c * (next_length - constant(width)),
            // First length byte has weight 256^0
            c * (next(config.num_data_length_acc_constant) - one),
        };
        push_shift_right(constraints, c, stack);
        cs.create_gate("PUSHDATA" + std::to_string(width), std::move(constraints));
    }

    {
        const Expression c = q * active * (one - data_zero) * length_zero;
        std::vector<Expression> constraints = {
            c * (top - (opcode + r * prev(stack[0]))),
            c * (next_data + one - data),
            c * next_length,
        };
        push_stack_unchanged(constraints, c, stack, 1);
        cs.create_gate("accumulate data byte in stack top", std::move(constraints));
    }

    {
        const Expression c = q * active * (one - length_zero);
        const Expression acc_constant = cur(config.num_data_length_acc_constant);
        std::vector<Expression> constraints = {
            // Length bytes are little-endian
            c * (data - (opcode * acc_constant + prev(config.num_data_bytes_remaining))),
            c * (next_length + one - length),
            c * (one - last_length_byte) * (next(config.num_data_length_acc_constant) - constant(256) * acc_constant),
            // The decoded length becomes the data counter of the next row
            c * last_length_byte * (next_data - data),
            // Zero-length pushes are not allowed
            c * last_length_byte * data_zero,
        };
        push_stack_unchanged(constraints, c, stack);
        cs.create_gate("accumulate data length into num_data_bytes_remaining", std::move(constraints));
    }

    {
        const Expression c = opcode_row * is_checksig;
        const Expression flag = prev(stack[1]);
        const Expression prev_acc = prev(config.pk_rlc_acc);
        std::vector<Expression> constraints = {
            c * flag * (one - flag),
            c * (top - flag),
            c * (cur(config.pk_rlc_acc) - (prev_acc + flag * (prev_acc * (r - one) + prev(stack[0])))),
            c * (cur(config.num_checksig_opcodes) - prev(config.num_checksig_opcodes) - flag),
            c * cur(stack[MAX_STACK_DEPTH - 1]),
            c * next_data,
            c * next_length,
        };
        for (size_t i = 2; i < MAX_STACK_DEPTH; ++i) {
            constraints.push_back(c * (cur(stack[i - 1]) - prev(stack[i])));
        }
        cs.create_gate("OP_CHECKSIG", std::move(constraints));
    }

    {
        const Expression not_checksig = q * (one - opcode_row * is_checksig);
        cs.create_gate("public key accumulators unchanged", {
            not_checksig * (cur(config.pk_rlc_acc) - prev(config.pk_rlc_acc)),
            not_checksig * (cur(config.num_checksig_opcodes) - prev(config.num_checksig_opcodes)),
        });
    }

    {
        const Expression terminal = q * script_read + q_last;
        config.stack_top_is_false = IsZeroChip::configure(
            cs, "stack top truthiness", terminal,
            top * (top - constant(NEGATIVE_ZERO)), cs.advice_column());
        cs.create_gate("stack top is true after execution", {
            terminal * config.stack_top_is_false.expr(),
        });
    }

    {
        std::vector<Expression> constraints = {
            q_last * cur(config.num_script_bytes_remaining),
            q_last * data,
            q_last * length,
            q_last * cur(config.script_rlc_acc),
            q_last * (cur(config.pk_rlc_acc) - prev(config.pk_rlc_acc)),
            q_last * (cur(config.num_checksig_opcodes) - prev(config.num_checksig_opcodes)),
        };
        push_stack_unchanged(constraints, q_last, stack);
        cs.create_gate("last row", std::move(constraints));
    }

    return config;
}

void ExecutionChip::load(Layouter& layouter) const {
    OpcodeTableChip(config_.opcode_table).load(layouter);
}

void ExecutionChip::assign_row(Region& region, size_t offset, const TraceRow& row,
                               BFieldElement randomness) const {
    region.assign_advice(config_.randomness, offset, randomness);
    region.assign_advice(config_.opcode, offset, BFieldElement(row.opcode));
    region.assign_advice(config_.script_rlc_acc, offset, row.script_rlc_acc);
    region.assign_advice(config_.num_script_bytes_remaining, offset, BFieldElement(row.num_script_bytes_remaining));
    for (size_t i = 0; i < MAX_STACK_DEPTH; ++i) {
        region.assign_advice(config_.stack[i], offset, row.stack[i]);
    }
    region.assign_advice(config_.num_data_bytes_remaining, offset, BFieldElement(row.num_data_bytes_remaining));
    region.assign_advice(config_.num_data_length_bytes_remaining, offset,
                         BFieldElement(row.num_data_length_bytes_remaining));
    region.assign_advice(config_.num_data_length_acc_constant, offset,
                         BFieldElement(row.num_data_length_acc_constant));
    region.assign_advice(config_.pk_rlc_acc, offset, row.pk_rlc_acc);
    region.assign_advice(config_.num_checksig_opcodes, offset, BFieldElement(row.num_checksig_opcodes));

    IsZeroChip(config_.num_script_bytes_remaining_is_zero)
        .assign(region, offset, BFieldElement(row.num_script_bytes_remaining));
    IsZeroChip(config_.num_data_bytes_remaining_is_zero)
        .assign(region, offset, BFieldElement(row.num_data_bytes_remaining));
    IsZeroChip(config_.num_data_length_bytes_remaining_is_zero)
        .assign(region, offset, BFieldElement(row.num_data_length_bytes_remaining));
    IsZeroChip(config_.num_data_length_bytes_remaining_is_one)
        .assign(region, offset, BFieldElement(row.num_data_length_bytes_remaining) - BFieldElement::one());

    const BFieldElement top = row.stack[0];
    IsZeroChip(config_.stack_top_is_false)
        .assign(region, offset, top * (top - BFieldElement(NEGATIVE_ZERO)));
}

ExecutionCells ExecutionChip::assign(Region& region, const ScriptVM::TraceResult& trace) const {
    if (region.height() != NUM_ROWS || trace.rows.size() != NUM_ROWS) {
        throw std::invalid_argument("ExecutionChip::assign: expected " + std::to_string(NUM_ROWS) +
                                    " rows, region has " + std::to_string(region.height()) +
                                    " and trace has " + std::to_string(trace.rows.size()));
    }

    const BFieldElement randomness = trace.randomness;
    ExecutionCells cells;

    // First row: initial state
    region.enable_selector(config_.q_first, ScriptVM::FIRST_ROW);
    assign_row(region, ScriptVM::FIRST_ROW, trace.first_row(), randomness);

    // Byte rows: the lookup binds indicators to whatever byte sits in the row
    for (size_t offset = ScriptVM::FIRST_ROW + 1; offset < ScriptVM::LAST_ROW; ++offset) {
        const TraceRow& row = trace.rows[offset];
        region.enable_selector(config_.q_execution, offset);
        assign_row(region, offset, row, randomness);

        const OpcodeTableRow indicators = OpcodeTableChip::row_for(row.opcode);
        auto indicator = [&indicators](OpcodeTableColumn column) {
            return BFieldElement(indicators[static_cast<size_t>(column)]);
        };
        region.assign_advice(config_.indicators.enabled, offset, indicator(OpcodeTableColumn::Enabled));
        region.assign_advice(config_.indicators.op0, offset, indicator(OpcodeTableColumn::Op0));
        region.assign_advice(config_.indicators.op1_to_op16, offset, indicator(OpcodeTableColumn::Op1ToOp16));
        region.assign_advice(config_.indicators.push1_to_push75, offset, indicator(OpcodeTableColumn::Push1ToPush75));
        region.assign_advice(config_.indicators.pushdata1, offset, indicator(OpcodeTableColumn::PushData1));
        region.assign_advice(config_.indicators.pushdata2, offset, indicator(OpcodeTableColumn::PushData2));
        region.assign_advice(config_.indicators.pushdata4, offset, indicator(OpcodeTableColumn::PushData4));
        region.assign_advice(config_.indicators.checksig, offset, indicator(OpcodeTableColumn::CheckSig));
    }

    // Last row: final state, target of next-row queries
    region.enable_selector(config_.q_last, ScriptVM::LAST_ROW);
    assign_row(region, ScriptVM::LAST_ROW, trace.last_row(), randomness);

    const size_t first = region.start_row() + ScriptVM::FIRST_ROW;
    const size_t last = region.start_row() + ScriptVM::LAST_ROW;
    const TraceRow& first_row = trace.first_row();
    const TraceRow& last_row = trace.last_row();
    cells.script_length = AssignedCell{Cell{config_.num_script_bytes_remaining, first},
                                       BFieldElement(first_row.num_script_bytes_remaining)};
    cells.initial_script_rlc = AssignedCell{Cell{config_.script_rlc_acc, first}, first_row.script_rlc_acc};
    cells.randomness = AssignedCell{Cell{config_.randomness, first}, randomness};
    cells.pk_rlc_acc = AssignedCell{Cell{config_.pk_rlc_acc, last}, last_row.pk_rlc_acc};
    cells.num_checksig_opcodes = AssignedCell{Cell{config_.num_checksig_opcodes, last},
                                              BFieldElement(last_row.num_checksig_opcodes)};

    BITCOIN_VM_DEBUG_PRINT("[execution] assigned %zu rows at %zu, pk_rlc_acc=%s, checksig count=%llu\n",
                           region.height(), region.start_row(), last_row.pk_rlc_acc.to_string().c_str(),
                           static_cast<unsigned long long>(last_row.num_checksig_opcodes));
    return cells;
}

void ExecutionChip::expose_public(Layouter& layouter, const ExecutionCells& cells) const {
    layouter.constrain_instance(cells.script_length.cell, config_.instance, INSTANCE_SCRIPT_LENGTH);
    layouter.constrain_instance(cells.initial_script_rlc.cell, config_.instance, INSTANCE_SCRIPT_RLC);
    layouter.constrain_instance(cells.randomness.cell, config_.instance, INSTANCE_RANDOMNESS);
}

} // namespace bitcoin_vm
