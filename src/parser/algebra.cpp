/*
 * @FileName   : algebra.cpp
 * @CreateAt   : 2026/9/21
 * @Description: constructors of the algebra nodes
 */

#include "parser/algebra.hpp"

namespace quint {

const Term &TriplePattern::at(term_name name) const {
    switch (name) {
        case SUBJECT:   return subject;
        case PREDICATE: return predicate;
        case OBJECT:    return object;
        case GRAPH:     return graph;
    }
    return graph;
}

ExpressionPtr Expression::makeTerm(const Term &term) {
    auto expr = std::make_shared<Expression>();
    expr->type = TERM_EXPR;
    expr->term = term;
    return expr;
}

ExpressionPtr Expression::makeOperator(const std::string &op, std::vector<ExpressionPtr> args) {
    auto expr = std::make_shared<Expression>();
    expr->type = OPERATOR_EXPR;
    expr->op = op;
    expr->args = std::move(args);
    return expr;
}

ExpressionPtr Expression::makeNamed(const Term &function, std::vector<ExpressionPtr> args) {
    auto expr = std::make_shared<Expression>();
    expr->type = NAMED_EXPR;
    expr->term = function;
    expr->args = std::move(args);
    return expr;
}

ExpressionPtr Expression::makeExistence(bool not_exists, OperationPtr pattern) {
    auto expr = std::make_shared<Expression>();
    expr->type = EXISTENCE_EXPR;
    expr->not_exists = not_exists;
    expr->pattern = std::move(pattern);
    return expr;
}

OperationPtr Operation::make(operation_type type, std::vector<OperationPtr> inputs) {
    auto op = std::make_shared<Operation>();
    op->type = type;
    op->inputs = std::move(inputs);
    return op;
}

OperationPtr Operation::makeBgp(std::vector<TriplePattern> patterns) {
    auto op = std::make_shared<Operation>();
    op->type = BGP;
    op->patterns = std::move(patterns);
    return op;
}

const char *operationTypeToString(Operation::operation_type type) {
    switch (type) {
        case Operation::PROJECT:   return "project";
        case Operation::SLICE:     return "slice";
        case Operation::DISTINCT:  return "distinct";
        case Operation::REDUCED:   return "reduced";
        case Operation::ORDER_BY:  return "orderby";
        case Operation::FILTER:    return "filter";
        case Operation::BGP:       return "bgp";
        case Operation::JOIN:      return "join";
        case Operation::LEFT_JOIN: return "leftjoin";
        case Operation::UNION:     return "union";
        case Operation::MINUS:     return "minus";
        case Operation::GRAPH:     return "graph";
        case Operation::ASK:       return "ask";
        case Operation::CONSTRUCT: return "construct";
        case Operation::DESCRIBE:  return "describe";
    }
    return "unknown";
}

} // namespace quint
