#include "circuit/constraint_system.hpp"
#include <algorithm>
#include <stdexcept>

namespace bitcoin_vm {

Column ConstraintSystem::advice_column() {
    return Column{ColumnType::Advice, num_advice_++};
}

Column ConstraintSystem::fixed_column() {
    return Column{ColumnType::Fixed, num_fixed_++};
}

Column ConstraintSystem::instance_column() {
    return Column{ColumnType::Instance, num_instance_++};
}

Selector ConstraintSystem::selector() {
    return Selector{fixed_column()};
}

TableColumn ConstraintSystem::lookup_table_column() {
    return TableColumn{fixed_column()};
}

void ConstraintSystem::enable_equality(const Column& column) {
    equality_columns_.insert(column);
}

bool ConstraintSystem::equality_enabled(const Column& column) const {
    return equality_columns_.count(column) > 0;
}

void ConstraintSystem::create_gate(const std::string& name, std::vector<Expression> polys) {
    if (polys.empty()) {
        throw std::invalid_argument("gate '" + name + "' has no constraints");
    }
    gates_.push_back(Gate{name, std::move(polys)});
}

void ConstraintSystem::lookup(const std::string& name,
                              const std::vector<std::pair<Expression, TableColumn>>& map) {
    if (map.empty()) {
        throw std::invalid_argument("lookup '" + name + "' has no inputs");
    }
    Lookup entry;
    entry.name = name;
    for (const auto& [input, table_column] : map) {
        entry.inputs.push_back(input);
        entry.table.push_back(table_column);
    }
    lookups_.push_back(std::move(entry));
}

void ConstraintSystem::annotate_column(const Column& column, const std::string& name) {
    annotations_[column] = name;
}

std::string ConstraintSystem::column_name(const Column& column) const {
    auto it = annotations_.find(column);
    if (it == annotations_.end()) {
        return column.to_string();
    }
    return it->second;
}

size_t ConstraintSystem::max_degree() const {
    size_t degree = 0;
    for (const auto& gate : gates_) {
        for (const auto& poly : gate.polys) {
            degree = std::max(degree, poly.degree());
        }
    }
    for (const auto& lookup : lookups_) {
        for (const auto& input : lookup.inputs) {
            // Input expressions enter the lookup argument with degree + 1
            degree = std::max(degree, input.degree() + 1);
        }
    }
    return degree;
}

} // namespace bitcoin_vm
