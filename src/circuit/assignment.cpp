#include "circuit/assignment.hpp"
#include "common/debug_control.hpp"
#include <algorithm>
#include <stdexcept>

namespace bitcoin_vm {

namespace {

void check_equality_enabled(const ConstraintSystem& cs, const Cell& cell) {
    if (!cs.equality_enabled(cell.column)) {
        throw std::invalid_argument("copy constraint on " + cs.column_name(cell.column) +
                                    ", which is not equality-enabled");
    }
}

size_t next_power_of_two(size_t n) {
    size_t result = 1;
    while (result < n) {
        result <<= 1;
    }
    return result;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Assignment
// ---------------------------------------------------------------------------

Assignment::Assignment(const ConstraintSystem& cs, size_t num_rows)
    : cs_(&cs),
      num_rows_(num_rows),
      advice_(cs.num_advice_columns(), std::vector<BFieldElement>(num_rows, BFieldElement::zero())),
      fixed_(cs.num_fixed_columns(), std::vector<BFieldElement>(num_rows, BFieldElement::zero())) {}

std::vector<BFieldElement>& Assignment::column_storage(const Column& column) {
    switch (column.type) {
        case ColumnType::Advice:
            if (column.index < advice_.size()) return advice_[column.index];
            break;
        case ColumnType::Fixed:
            if (column.index < fixed_.size()) return fixed_[column.index];
            break;
        case ColumnType::Instance:
            throw std::invalid_argument("instance values are supplied to the MockProver, not assigned");
    }
    throw std::out_of_range("unknown column " + column.to_string());
}

const std::vector<BFieldElement>& Assignment::column_storage(const Column& column) const {
    return const_cast<Assignment*>(this)->column_storage(column);
}

void Assignment::set(const Column& column, size_t row, BFieldElement value) {
    if (row >= num_rows_) {
        throw std::out_of_range("row " + std::to_string(row) + " outside circuit of " +
                                std::to_string(num_rows_) + " rows");
    }
    column_storage(column)[row] = value;
}

BFieldElement Assignment::get(const Column& column, size_t row) const {
    if (row >= num_rows_) {
        throw std::out_of_range("row " + std::to_string(row) + " outside circuit of " +
                                std::to_string(num_rows_) + " rows");
    }
    return column_storage(column)[row];
}

const std::vector<BFieldElement>& Assignment::column_values(const Column& column) const {
    return column_storage(column);
}

void Assignment::add_copies(const std::vector<CopyConstraint>& copies) {
    for (const auto& copy : copies) {
        check_equality_enabled(*cs_, copy.first);
        check_equality_enabled(*cs_, copy.second);
    }
    copies_.insert(copies_.end(), copies.begin(), copies.end());
}

// ---------------------------------------------------------------------------
// Region
// ---------------------------------------------------------------------------

Region::Region(const ConstraintSystem& cs, Assignment& assignment, std::string name,
               size_t start_row, size_t height)
    : cs_(cs),
      assignment_(assignment),
      name_(std::move(name)),
      start_row_(start_row),
      height_(height) {}

size_t Region::absolute_row(size_t offset) const {
    if (offset >= height_) {
        throw std::out_of_range("region '" + name_ + "': offset " + std::to_string(offset) +
                                " outside height " + std::to_string(height_));
    }
    return start_row_ + offset;
}

AssignedCell Region::assign_advice(const Column& column, size_t offset, BFieldElement value) {
    if (column.type != ColumnType::Advice) {
        throw std::invalid_argument("region '" + name_ + "': " + column.to_string() + " is not an advice column");
    }
    const size_t row = absolute_row(offset);
    assignment_.set(column, row, value);
    return AssignedCell{Cell{column, row}, value};
}

AssignedCell Region::assign_fixed(const Column& column, size_t offset, BFieldElement value) {
    if (column.type != ColumnType::Fixed) {
        throw std::invalid_argument("region '" + name_ + "': " + column.to_string() + " is not a fixed column");
    }
    const size_t row = absolute_row(offset);
    assignment_.set(column, row, value);
    return AssignedCell{Cell{column, row}, value};
}

void Region::enable_selector(const Selector& selector, size_t offset) {
    assignment_.set(selector.column, absolute_row(offset), BFieldElement::one());
}

AssignedCell Region::copy_advice(const AssignedCell& from, const Column& column, size_t offset) {
    AssignedCell cell = assign_advice(column, offset, from.value);
    constrain_equal(from.cell, cell.cell);
    return cell;
}

void Region::constrain_equal(const Cell& lhs, const Cell& rhs) {
    check_equality_enabled(cs_, lhs);
    check_equality_enabled(cs_, rhs);
    copies_.emplace_back(lhs, rhs);
}

// ---------------------------------------------------------------------------
// TableRegion
// ---------------------------------------------------------------------------

void TableRegion::assign_cell(const TableColumn& column, size_t row, BFieldElement value) {
    if (row >= max_rows_) {
        throw std::out_of_range("table '" + name_ + "': row " + std::to_string(row) +
                                " exceeds planned size " + std::to_string(max_rows_));
    }
    assignment_.set(column.column, row, value);
}

// ---------------------------------------------------------------------------
// Layouter
// ---------------------------------------------------------------------------

Layouter::Layouter(const ConstraintSystem& cs) : cs_(cs) {}

size_t Layouter::plan_region(const std::string& name, size_t height) {
    if (allocated()) {
        throw std::logic_error("Layouter: cannot plan region '" + name + "' after allocation");
    }
    regions_.push_back(PlannedRegion{name, next_row_, height});
    next_row_ += height;
    return regions_.size() - 1;
}

void Layouter::plan_table(const std::string& name, size_t rows) {
    if (allocated()) {
        throw std::logic_error("Layouter: cannot plan table '" + name + "' after allocation");
    }
    table_rows_ = std::max(table_rows_, rows);
}

size_t Layouter::num_rows() const {
    return next_power_of_two(std::max(next_row_, table_rows_));
}

void Layouter::allocate() {
    if (allocated()) {
        throw std::logic_error("Layouter: already allocated");
    }
    assignment_ = std::make_unique<Assignment>(cs_, num_rows());

    BITCOIN_VM_IF_DEBUG {
        std::cout << "[layouter] " << num_rows() << " rows (" << next_row_ << " region rows, "
                  << table_rows_ << " table rows)" << std::endl;
        for (const auto& region : regions_) {
            std::cout << "[layouter]   " << region.name << ": rows " << region.start_row
                      << ".." << (region.start_row + region.height) << std::endl;
        }
    }
}

Assignment& Layouter::assignment() {
    if (!allocated()) {
        throw std::logic_error("Layouter: not allocated");
    }
    return *assignment_;
}

Region Layouter::region(size_t region_index) {
    if (region_index >= regions_.size()) {
        throw std::out_of_range("Layouter: unknown region " + std::to_string(region_index));
    }
    const PlannedRegion& planned = regions_[region_index];
    return Region(cs_, assignment(), planned.name, planned.start_row, planned.height);
}

TableRegion Layouter::table(const std::string& name) {
    return TableRegion(assignment(), name, table_rows_);
}

void Layouter::commit(Region& region) {
    std::vector<CopyConstraint> copies = region.take_copies();
    std::lock_guard<std::mutex> lock(commit_mutex_);
    assignment().add_copies(copies);
}

void Layouter::constrain_equal(const Cell& lhs, const Cell& rhs) {
    std::lock_guard<std::mutex> lock(commit_mutex_);
    assignment().add_copies({CopyConstraint{lhs, rhs}});
}

void Layouter::constrain_instance(const Cell& cell, const Column& instance, size_t row) {
    if (instance.type != ColumnType::Instance) {
        throw std::invalid_argument("constrain_instance: " + instance.to_string() + " is not an instance column");
    }
    constrain_equal(cell, Cell{instance, row});
}

Assignment Layouter::take_assignment() {
    Assignment result = std::move(assignment());
    assignment_.reset();
    return result;
}

} // namespace bitcoin_vm
