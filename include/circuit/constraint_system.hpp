#pragma once

#include "circuit/column.hpp"
#include "circuit/expression.hpp"
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace bitcoin_vm {

/**
 * Gate - named set of polynomials that must vanish on every row
 */
struct Gate {
    std::string name;
    std::vector<Expression> polys;
};

/**
 * Lookup - the tuple of input expressions, evaluated on any row, must
 * equal the tuple of table column values on some row
 */
struct Lookup {
    std::string name;
    std::vector<Expression> inputs;
    std::vector<TableColumn> table;
};

/**
 * ConstraintSystem - circuit shape
 * 
 * Declares columns, gates, lookups and which columns take part in copy
 * constraints. Built once per circuit shape, independent of any witness.
 */
class ConstraintSystem {
public:
    Column advice_column();
    Column fixed_column();
    Column instance_column();
    Selector selector();
    TableColumn lookup_table_column();

    void enable_equality(const Column& column);
    bool equality_enabled(const Column& column) const;

    void create_gate(const std::string& name, std::vector<Expression> polys);
    void lookup(const std::string& name, const std::vector<std::pair<Expression, TableColumn>>& map);

    // Human-readable column names for failure reports
    void annotate_column(const Column& column, const std::string& name);
    std::string column_name(const Column& column) const;

    size_t num_advice_columns() const { return num_advice_; }
    size_t num_fixed_columns() const { return num_fixed_; }
    size_t num_instance_columns() const { return num_instance_; }

    const std::vector<Gate>& gates() const { return gates_; }
    const std::vector<Lookup>& lookups() const { return lookups_; }

    size_t max_degree() const;

private:
    size_t num_advice_ = 0;
    size_t num_fixed_ = 0;
    size_t num_instance_ = 0;
    std::set<Column> equality_columns_;
    std::map<Column, std::string> annotations_;
    std::vector<Gate> gates_;
    std::vector<Lookup> lookups_;
};

} // namespace bitcoin_vm
