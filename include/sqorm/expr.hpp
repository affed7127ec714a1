/**
 * sqorm/expr.hpp - Predicate expressions for WHERE clauses
 *
 * Part of sqorm - a declarative object-relational mapping layer.
 *
 * Expressions are immutable trees with shared nodes, so copying and
 * composing them never mutates an existing predicate.
 *
 * Example:
 *
 *   auto pred = (sqorm::col("age") >= 18) && sqorm::col("name").like("A%");
 *   pred.to_string();   // ((age >= 18) AND (name LIKE 'A%'))
 */

#pragma once

#include "types.hpp"
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace sqorm {

enum class ExprOp {
    Column,
    Literal,
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
    And,
    Or,
    Not,
    In,
    NotIn,
    Like,
    Between,
    IsNull,
    IsNotNull
};

inline const char* expr_op_sql(ExprOp op) {
    switch (op) {
        case ExprOp::Eq:        return "=";
        case ExprOp::Ne:        return "<>";
        case ExprOp::Lt:        return "<";
        case ExprOp::Le:        return "<=";
        case ExprOp::Gt:        return ">";
        case ExprOp::Ge:        return ">=";
        case ExprOp::And:       return "AND";
        case ExprOp::Or:        return "OR";
        case ExprOp::Not:       return "NOT";
        case ExprOp::In:        return "IN";
        case ExprOp::NotIn:     return "NOT IN";
        case ExprOp::Like:      return "LIKE";
        case ExprOp::Between:   return "BETWEEN";
        case ExprOp::IsNull:    return "IS NULL";
        case ExprOp::IsNotNull: return "IS NOT NULL";
        default:                return "";
    }
}

struct ExprNode {
    ExprOp op = ExprOp::Literal;

    // Column name (Column only)
    std::string column;

    // Literal: one value. In/NotIn: the list. Between: low, high.
    std::vector<Value> values;

    std::vector<std::shared_ptr<const ExprNode>> children;
};

class Expr {
public:
    Expr() = default;
    explicit Expr(std::shared_ptr<const ExprNode> node) : node_(std::move(node)) {}

    static Expr column(std::string name) {
        auto node = std::make_shared<ExprNode>();
        node->op = ExprOp::Column;
        node->column = std::move(name);
        return Expr(std::move(node));
    }

    static Expr literal(Value v) {
        auto node = std::make_shared<ExprNode>();
        node->op = ExprOp::Literal;
        node->values.push_back(std::move(v));
        return Expr(std::move(node));
    }

    bool empty() const { return node_ == nullptr; }
    explicit operator bool() const { return node_ != nullptr; }

    const ExprNode& node() const { return require("node()"); }
    ExprOp op() const { return require("op()").op; }

    // ========================================================================
    // Builders
    // ========================================================================

    Expr compare(ExprOp op, const Value& rhs) const {
        return binary(op, *this, literal(rhs));
    }

    Expr in(std::vector<Value> values) const {
        return list(ExprOp::In, std::move(values));
    }

    Expr not_in(std::vector<Value> values) const {
        return list(ExprOp::NotIn, std::move(values));
    }

    Expr like(const std::string& pattern) const {
        return compare(ExprOp::Like, pattern);
    }

    Expr between(const Value& low, const Value& high) const {
        require("between()");
        auto node = std::make_shared<ExprNode>();
        node->op = ExprOp::Between;
        node->values = {low, high};
        node->children.push_back(node_);
        return Expr(std::move(node));
    }

    Expr is_null() const { return unary(ExprOp::IsNull, *this); }
    Expr is_not_null() const { return unary(ExprOp::IsNotNull, *this); }

    static Expr binary(ExprOp op, const Expr& lhs, const Expr& rhs) {
        lhs.require(expr_op_sql(op));
        rhs.require(expr_op_sql(op));
        auto node = std::make_shared<ExprNode>();
        node->op = op;
        node->children.push_back(lhs.node_);
        node->children.push_back(rhs.node_);
        return Expr(std::move(node));
    }

    static Expr unary(ExprOp op, const Expr& operand) {
        operand.require(expr_op_sql(op));
        auto node = std::make_shared<ExprNode>();
        node->op = op;
        node->children.push_back(operand.node_);
        return Expr(std::move(node));
    }

    /**
     * Column names referenced anywhere in the tree, in visit order
     */
    std::vector<std::string> columns() const {
        std::vector<std::string> out;
        if (node_) collect_columns(*node_, out);
        return out;
    }

    /**
     * Debug rendering with literals inlined (not for execution)
     */
    std::string to_string() const {
        if (!node_) return "";
        std::ostringstream ss;
        render(*node_, ss);
        return ss.str();
    }

private:
    std::shared_ptr<const ExprNode> node_;

    const ExprNode& require(const std::string& what) const {
        if (!node_) throw ValueError("Empty expression used as operand of " + what);
        return *node_;
    }

    Expr list(ExprOp op, std::vector<Value> values) const {
        require(expr_op_sql(op));
        auto node = std::make_shared<ExprNode>();
        node->op = op;
        node->values = std::move(values);
        node->children.push_back(node_);
        return Expr(std::move(node));
    }

    static void collect_columns(const ExprNode& n, std::vector<std::string>& out) {
        if (n.op == ExprOp::Column) out.push_back(n.column);
        for (const auto& child : n.children) {
            if (child) collect_columns(*child, out);
        }
    }

    static void render_value(const Value& v, std::ostringstream& ss) {
        if (v.is_text()) {
            ss << "'" << v.as_text() << "'";
        } else {
            ss << v.to_string();
        }
    }

    static void render(const ExprNode& n, std::ostringstream& ss) {
        switch (n.op) {
            case ExprOp::Column:
                ss << n.column;
                return;
            case ExprOp::Literal:
                render_value(n.values.front(), ss);
                return;
            case ExprOp::Not:
                ss << "(NOT ";
                render(*n.children[0], ss);
                ss << ")";
                return;
            case ExprOp::IsNull:
            case ExprOp::IsNotNull:
                ss << "(";
                render(*n.children[0], ss);
                ss << " " << expr_op_sql(n.op) << ")";
                return;
            case ExprOp::In:
            case ExprOp::NotIn:
                ss << "(";
                render(*n.children[0], ss);
                ss << " " << expr_op_sql(n.op) << " (";
                for (size_t i = 0; i < n.values.size(); ++i) {
                    if (i > 0) ss << ", ";
                    render_value(n.values[i], ss);
                }
                ss << "))";
                return;
            case ExprOp::Between:
                ss << "(";
                render(*n.children[0], ss);
                ss << " BETWEEN ";
                render_value(n.values[0], ss);
                ss << " AND ";
                render_value(n.values[1], ss);
                ss << ")";
                return;
            default:
                ss << "(";
                render(*n.children[0], ss);
                ss << " " << expr_op_sql(n.op) << " ";
                render(*n.children[1], ss);
                ss << ")";
                return;
        }
    }
};

// ============================================================================
// Composition
// ============================================================================

// An empty side is "no predicate", so and/or with it yields the other side
inline Expr operator&&(const Expr& lhs, const Expr& rhs) {
    if (lhs.empty()) return rhs;
    if (rhs.empty()) return lhs;
    return Expr::binary(ExprOp::And, lhs, rhs);
}

inline Expr operator||(const Expr& lhs, const Expr& rhs) {
    if (lhs.empty()) return rhs;
    if (rhs.empty()) return lhs;
    return Expr::binary(ExprOp::Or, lhs, rhs);
}

// Negating "no predicate" is still no predicate
inline Expr operator!(const Expr& e) {
    if (e.empty()) return e;
    return Expr::unary(ExprOp::Not, e);
}

inline Expr operator==(const Expr& lhs, const Value& rhs) { return lhs.compare(ExprOp::Eq, rhs); }
inline Expr operator!=(const Expr& lhs, const Value& rhs) { return lhs.compare(ExprOp::Ne, rhs); }
inline Expr operator<(const Expr& lhs, const Value& rhs)  { return lhs.compare(ExprOp::Lt, rhs); }
inline Expr operator<=(const Expr& lhs, const Value& rhs) { return lhs.compare(ExprOp::Le, rhs); }
inline Expr operator>(const Expr& lhs, const Value& rhs)  { return lhs.compare(ExprOp::Gt, rhs); }
inline Expr operator>=(const Expr& lhs, const Value& rhs) { return lhs.compare(ExprOp::Ge, rhs); }

inline Expr col(std::string name) {
    return Expr::column(std::move(name));
}

} // namespace sqorm
