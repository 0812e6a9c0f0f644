#include "circuit/expression.hpp"
#include <algorithm>

namespace bitcoin_vm {

Expression::Expression() : Expression(BFieldElement::zero()) {}

Expression::Expression(BFieldElement constant) {
    auto node = std::make_shared<Node>();
    node->kind = Kind::Constant;
    node->constant = constant;
    node_ = std::move(node);
}

Expression Expression::query(const Column& column, Rotation rotation) {
    auto node = std::make_shared<Node>();
    node->kind = Kind::Query;
    node->column = column;
    node->rotation = rotation.offset;
    return Expression(std::shared_ptr<const Node>(std::move(node)));
}

Expression Expression::sum(const std::vector<Expression>& terms) {
    if (terms.empty()) {
        return Expression();
    }
    Expression result = terms[0];
    for (size_t i = 1; i < terms.size(); ++i) {
        result = result + terms[i];
    }
    return result;
}

Expression operator+(const Expression& lhs, const Expression& rhs) {
    auto node = std::make_shared<Expression::Node>();
    node->kind = Expression::Kind::Sum;
    node->lhs = lhs.node_;
    node->rhs = rhs.node_;
    return Expression(std::shared_ptr<const Expression::Node>(std::move(node)));
}

Expression operator-(const Expression& expr) {
    auto node = std::make_shared<Expression::Node>();
    node->kind = Expression::Kind::Negated;
    node->lhs = expr.node_;
    return Expression(std::shared_ptr<const Expression::Node>(std::move(node)));
}

Expression operator-(const Expression& lhs, const Expression& rhs) {
    return lhs + (-rhs);
}

Expression operator*(const Expression& lhs, const Expression& rhs) {
    auto node = std::make_shared<Expression::Node>();
    node->kind = Expression::Kind::Product;
    node->lhs = lhs.node_;
    node->rhs = rhs.node_;
    return Expression(std::shared_ptr<const Expression::Node>(std::move(node)));
}

size_t Expression::degree() const {
    return degree_of(*node_);
}

size_t Expression::degree_of(const Node& node) {
    switch (node.kind) {
        case Kind::Constant: return 0;
        case Kind::Query: return 1;
        case Kind::Sum: return std::max(degree_of(*node.lhs), degree_of(*node.rhs));
        case Kind::Product: return degree_of(*node.lhs) + degree_of(*node.rhs);
        case Kind::Negated: return degree_of(*node.lhs);
    }
    return 0;
}

std::string Expression::to_string() const {
    std::string out;
    print(*node_, out);
    return out;
}

void Expression::print(const Node& node, std::string& out) {
    switch (node.kind) {
        case Kind::Constant:
            out += node.constant.to_string();
            break;
        case Kind::Query:
            out += node.column.to_string();
            if (node.rotation != 0) {
                out += (node.rotation > 0 ? "[+" : "[") + std::to_string(node.rotation) + "]";
            }
            break;
        case Kind::Sum:
            out += "(";
            print(*node.lhs, out);
            out += " + ";
            print(*node.rhs, out);
            out += ")";
            break;
        case Kind::Product:
            print(*node.lhs, out);
            out += " * ";
            print(*node.rhs, out);
            break;
        case Kind::Negated:
            out += "-(";
            print(*node.lhs, out);
            out += ")";
            break;
    }
}

} // namespace bitcoin_vm
