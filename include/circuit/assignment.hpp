#pragma once

#include "types/b_field_element.hpp"
#include "circuit/column.hpp"
#include "circuit/constraint_system.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace bitcoin_vm {

/**
 * AssignedCell - a cell together with the value written into it
 */
struct AssignedCell {
    Cell cell;
    BFieldElement value;
};

using CopyConstraint = std::pair<Cell, Cell>;

/**
 * Assignment - the witness matrix (advice and fixed columns)
 * 
 * Sized once; regions write disjoint rows, so independent regions may be
 * filled from different threads.
 */
class Assignment {
public:
    Assignment(const ConstraintSystem& cs, size_t num_rows);

    size_t num_rows() const { return num_rows_; }

    void set(const Column& column, size_t row, BFieldElement value);
    BFieldElement get(const Column& column, size_t row) const;

    const std::vector<BFieldElement>& column_values(const Column& column) const;

    void add_copies(const std::vector<CopyConstraint>& copies);
    const std::vector<CopyConstraint>& copies() const { return copies_; }

private:
    std::vector<BFieldElement>& column_storage(const Column& column);
    const std::vector<BFieldElement>& column_storage(const Column& column) const;

    const ConstraintSystem* cs_;
    size_t num_rows_;
    std::vector<std::vector<BFieldElement>> advice_;
    std::vector<std::vector<BFieldElement>> fixed_;
    std::vector<CopyConstraint> copies_;
};

/**
 * Region - contiguous block of rows owned by one chip
 * 
 * Offsets are relative to the first row of the region. Copy constraints
 * are collected locally and merged by the Layouter on commit.
 */
class Region {
public:
    Region(const ConstraintSystem& cs, Assignment& assignment, std::string name,
           size_t start_row, size_t height);

    AssignedCell assign_advice(const Column& column, size_t offset, BFieldElement value);
    AssignedCell assign_fixed(const Column& column, size_t offset, BFieldElement value);
    void enable_selector(const Selector& selector, size_t offset);

    // Assign `from.value` at (column, offset) and constrain it equal to `from`
    AssignedCell copy_advice(const AssignedCell& from, const Column& column, size_t offset);

    void constrain_equal(const Cell& lhs, const Cell& rhs);

    const std::string& name() const { return name_; }
    size_t start_row() const { return start_row_; }
    size_t height() const { return height_; }

    std::vector<CopyConstraint> take_copies() { return std::move(copies_); }

private:
    size_t absolute_row(size_t offset) const;

    const ConstraintSystem& cs_;
    Assignment& assignment_;
    std::string name_;
    size_t start_row_;
    size_t height_;
    std::vector<CopyConstraint> copies_;
};

/**
 * TableRegion - writes a static lookup table from row 0 of its columns
 */
class TableRegion {
public:
    TableRegion(Assignment& assignment, std::string name, size_t max_rows)
        : assignment_(assignment), name_(std::move(name)), max_rows_(max_rows) {}

    void assign_cell(const TableColumn& column, size_t row, BFieldElement value);

private:
    Assignment& assignment_;
    std::string name_;
    size_t max_rows_;
};

/**
 * Layouter - sequential floor planner
 * 
 * Two phases: plan region heights and table sizes, then allocate the
 * matrix (height rounded up to a power of two) and hand out regions.
 * Regions are placed one after the other; tables start at row 0 of
 * their own columns.
 */
class Layouter {
public:
    explicit Layouter(const ConstraintSystem& cs);

    size_t plan_region(const std::string& name, size_t height);
    void plan_table(const std::string& name, size_t rows);

    void allocate();
    bool allocated() const { return assignment_ != nullptr; }

    Region region(size_t region_index);
    TableRegion table(const std::string& name);

    // Merge a filled region's copy constraints
    void commit(Region& region);

    void constrain_equal(const Cell& lhs, const Cell& rhs);
    void constrain_instance(const Cell& cell, const Column& instance, size_t row);

    size_t num_rows() const;
    Assignment& assignment();

    // Release the witness; the layouter cannot be used afterwards
    Assignment take_assignment();

private:
    struct PlannedRegion {
        std::string name;
        size_t start_row;
        size_t height;
    };

    const ConstraintSystem& cs_;
    std::vector<PlannedRegion> regions_;
    size_t next_row_ = 0;
    size_t table_rows_ = 0;
    std::unique_ptr<Assignment> assignment_;
    std::mutex commit_mutex_;
};

} // namespace bitcoin_vm
