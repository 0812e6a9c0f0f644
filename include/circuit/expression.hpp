#pragma once

#include "types/b_field_element.hpp"
#include "circuit/column.hpp"
#include <memory>
#include <string>
#include <vector>

namespace bitcoin_vm {

/**
 * Expression - polynomial over queried cells
 * 
 * Immutable tree of constants, cell queries (column + rotation), sums,
 * products and negations. Gates are lists of expressions that must
 * evaluate to zero on every row; lookup inputs are expressions whose
 * tuple of values must appear in a table.
 */
class Expression {
public:
    enum class Kind : uint8_t {
        Constant,
        Query,
        Sum,
        Product,
        Negated,
    };

    struct Node {
        Kind kind = Kind::Constant;
        BFieldElement constant;
        Column column;
        int32_t rotation = 0;
        std::shared_ptr<const Node> lhs;
        std::shared_ptr<const Node> rhs;
    };

    // Constant zero
    Expression();
    Expression(BFieldElement constant);

    static Expression constant(uint64_t value) { return Expression(BFieldElement(value)); }
    static Expression query(const Column& column, Rotation rotation);
    static Expression query(const Selector& selector) { return query(selector.column, Rotation::cur()); }

    Kind kind() const { return node_->kind; }

    /**
     * Evaluate with `query(column, rotation)` supplying cell values
     */
    template <typename QueryFn>
    BFieldElement evaluate(const QueryFn& query) const {
        return evaluate_node(*node_, query);
    }

    size_t degree() const;
    std::string to_string() const;

    // Sum of expressions (zero for an empty list)
    static Expression sum(const std::vector<Expression>& terms);

    friend Expression operator+(const Expression& lhs, const Expression& rhs);
    friend Expression operator-(const Expression& lhs, const Expression& rhs);
    friend Expression operator*(const Expression& lhs, const Expression& rhs);
    friend Expression operator-(const Expression& expr);

private:
    explicit Expression(std::shared_ptr<const Node> node) : node_(std::move(node)) {}

    template <typename QueryFn>
    static BFieldElement evaluate_node(const Node& node, const QueryFn& query) {
        switch (node.kind) {
            case Kind::Constant:
                return node.constant;
            case Kind::Query:
                return query(node.column, node.rotation);
            case Kind::Sum:
                return evaluate_node(*node.lhs, query) + evaluate_node(*node.rhs, query);
            case Kind::Product:
                return evaluate_node(*node.lhs, query) * evaluate_node(*node.rhs, query);
            case Kind::Negated:
                return -evaluate_node(*node.lhs, query);
        }
        return BFieldElement::zero();
    }

    static size_t degree_of(const Node& node);
    static void print(const Node& node, std::string& out);

    std::shared_ptr<const Node> node_;
};

} // namespace bitcoin_vm
