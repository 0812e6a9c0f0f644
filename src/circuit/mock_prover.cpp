#include "circuit/mock_prover.hpp"
#include "common/debug_control.hpp"
#include <algorithm>
#include <chrono>
#include <set>
#include <sstream>
#include <stdexcept>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace bitcoin_vm {

std::string VerifyFailure::to_string() const {
    std::ostringstream oss;
    switch (kind) {
        case Kind::ConstraintNotSatisfied:
            oss << "constraint " << index << " of gate '" << name << "' not satisfied at row " << row;
            break;
        case Kind::Lookup:
            oss << "lookup '" << name << "' input not in table at row " << row;
            break;
        case Kind::Permutation:
            oss << "copy constraint violated: " << name;
            break;
    }
    return oss.str();
}

MockProver::MockProver(const ConstraintSystem& cs, const Assignment& assignment,
                       std::vector<std::vector<BFieldElement>> instances)
    : cs_(cs), assignment_(assignment), instances_(std::move(instances)) {}

MockProver MockProver::run(
    const ConstraintSystem& cs,
    const Assignment& assignment,
    std::vector<std::vector<BFieldElement>> instances
) {
    if (instances.size() != cs.num_instance_columns()) {
        throw std::invalid_argument("MockProver: expected " + std::to_string(cs.num_instance_columns()) +
                                    " instance columns, got " + std::to_string(instances.size()));
    }
    for (const auto& column : instances) {
        if (column.size() > assignment.num_rows()) {
            throw std::invalid_argument("MockProver: instance column longer than the circuit");
        }
    }
    return MockProver(cs, assignment, std::move(instances));
}

BFieldElement MockProver::cell_value(const Column& column, size_t row) const {
    if (column.type == ColumnType::Instance) {
        const auto& values = instances_.at(column.index);
        return row < values.size() ? values[row] : BFieldElement::zero();
    }
    return assignment_.get(column, row);
}

BFieldElement MockProver::query(const Column& column, size_t row, int32_t rotation) const {
    const int64_t n = static_cast<int64_t>(assignment_.num_rows());
    int64_t target = (static_cast<int64_t>(row) + rotation) % n;
    if (target < 0) {
        target += n;
    }
    return cell_value(column, static_cast<size_t>(target));
}

void MockProver::verify_gates(std::vector<VerifyFailure>& failures) const {
    const size_t n = assignment_.num_rows();

    for (const auto& gate : cs_.gates()) {
        std::vector<uint8_t> row_failed(n * gate.polys.size(), 0);

        #pragma omp parallel for schedule(static)
        for (size_t row = 0; row < n; ++row) {
            auto row_query = [this, row](const Column& column, int32_t rotation) {
                return query(column, row, rotation);
            };
            for (size_t p = 0; p < gate.polys.size(); ++p) {
                if (!gate.polys[p].evaluate(row_query).is_zero()) {
                    row_failed[row * gate.polys.size() + p] = 1;
                }
            }
        }

        for (size_t row = 0; row < n; ++row) {
            for (size_t p = 0; p < gate.polys.size(); ++p) {
                if (row_failed[row * gate.polys.size() + p]) {
                    failures.push_back(VerifyFailure{VerifyFailure::Kind::ConstraintNotSatisfied, gate.name, p, row});
                }
            }
        }
    }
}

void MockProver::verify_lookups(std::vector<VerifyFailure>& failures) const {
    const size_t n = assignment_.num_rows();

    for (const auto& lookup : cs_.lookups()) {
        std::set<std::vector<uint64_t>> table;
        for (size_t row = 0; row < n; ++row) {
            std::vector<uint64_t> tuple;
            tuple.reserve(lookup.table.size());
            for (const auto& column : lookup.table) {
                tuple.push_back(assignment_.get(column.column, row).value());
            }
            table.insert(std::move(tuple));
        }

        std::vector<uint8_t> row_failed(n, 0);

        #pragma omp parallel for schedule(static)
        for (size_t row = 0; row < n; ++row) {
            auto row_query = [this, row](const Column& column, int32_t rotation) {
                return query(column, row, rotation);
            };
            std::vector<uint64_t> input;
            input.reserve(lookup.inputs.size());
            for (const auto& expr : lookup.inputs) {
                input.push_back(expr.evaluate(row_query).value());
            }
            if (table.count(input) == 0) {
                row_failed[row] = 1;
            }
        }

        for (size_t row = 0; row < n; ++row) {
            if (row_failed[row]) {
                failures.push_back(VerifyFailure{VerifyFailure::Kind::Lookup, lookup.name, 0, row});
            }
        }
    }
}

void MockProver::verify_copies(std::vector<VerifyFailure>& failures) const {
    for (const auto& [lhs, rhs] : assignment_.copies()) {
        if (cell_value(lhs.column, lhs.row) != cell_value(rhs.column, rhs.row)) {
            failures.push_back(VerifyFailure{
                VerifyFailure::Kind::Permutation,
                cs_.column_name(lhs.column) + "@" + std::to_string(lhs.row) + " != " +
                    cs_.column_name(rhs.column) + "@" + std::to_string(rhs.row),
                0, lhs.row});
        }
    }
}

std::vector<VerifyFailure> MockProver::verify() const {
    auto start = std::chrono::high_resolution_clock::now();

    std::vector<VerifyFailure> failures;
    verify_gates(failures);
    verify_lookups(failures);
    verify_copies(failures);

    auto end = std::chrono::high_resolution_clock::now();
    BITCOIN_VM_PROFILE_PRINT("[mock_prover] verified %zu rows, %zu gates, %zu lookups in %.2f ms\n",
                             assignment_.num_rows(), cs_.gates().size(), cs_.lookups().size(),
                             std::chrono::duration<double, std::milli>(end - start).count());
    return failures;
}

void MockProver::assert_satisfied() const {
    const std::vector<VerifyFailure> failures = verify();
    if (failures.empty()) {
        return;
    }
    std::ostringstream oss;
    oss << "MockProver: " << failures.size() << " constraint failure(s)";
    const size_t shown = std::min<size_t>(failures.size(), 10);
    for (size_t i = 0; i < shown; ++i) {
        oss << "\n  " << failures[i].to_string();
    }
    BITCOIN_VM_DEBUG_FPRINTF(stderr, "[mock_prover] %s\n", oss.str().c_str());
    throw std::runtime_error(oss.str());
}

} // namespace bitcoin_vm
