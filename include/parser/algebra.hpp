/*
 * @FileName   : algebra.hpp
 * @CreateAt   : 2026/9/21
 * @Description: SPARQL algebra produced by `SparqlParser`.
 *               An `Operation` tree follows the SPARQL 1.1 translation: a group's filters wrap
 *               the group, OPTIONAL becomes LEFT_JOIN, and the solution modifiers wrap the
 *               pattern as ORDER_BY -> PROJECT -> DISTINCT / REDUCED -> SLICE.
 *               Operator names of expressions are lower case (`&&`, `=`, `regex`, `notin` ...).
 */

#ifndef QUINT_ALGEBRA_HPP
#define QUINT_ALGEBRA_HPP

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <optional>

#include "common/type.hpp"

namespace quint {

/* graph is the default graph unless the pattern comes from INSERT / DELETE DATA */
struct TriplePattern {
    Term subject;
    Term predicate;
    Term object;
    Term graph;

    const Term &at(term_name name) const;

    bool operator==(const TriplePattern &other) const {
        return subject == other.subject && predicate == other.predicate
            && object == other.object && graph == other.graph;
    }
};

struct Operation;
using OperationPtr = std::shared_ptr<Operation>;

struct Expression;
using ExpressionPtr = std::shared_ptr<Expression>;

struct Expression {
    enum expression_type {
        TERM_EXPR,
        OPERATOR_EXPR,
        /* call of an IRI named function */
        NAMED_EXPR,
        EXISTENCE_EXPR,
    };

    expression_type type = TERM_EXPR;
    Term term;
    std::string op;
    std::vector<ExpressionPtr> args;
    bool not_exists = false;
    OperationPtr pattern;

    static ExpressionPtr makeTerm(const Term &term);
    static ExpressionPtr makeOperator(const std::string &op, std::vector<ExpressionPtr> args);
    static ExpressionPtr makeNamed(const Term &function, std::vector<ExpressionPtr> args);
    static ExpressionPtr makeExistence(bool not_exists, OperationPtr pattern);

    bool isVariable() const { return type == TERM_EXPR && term.isVariable(); }
    bool isOperator(const std::string &name) const { return type == OPERATOR_EXPR && op == name; }
};

struct OrderCondition {
    ExpressionPtr expression;
    bool ascending = true;
};

struct Operation {
    enum operation_type {
        PROJECT,
        SLICE,
        DISTINCT,
        REDUCED,
        ORDER_BY,
        FILTER,
        BGP,
        JOIN,
        LEFT_JOIN,
        UNION,
        MINUS,
        GRAPH,
        ASK,
        CONSTRUCT,
        DESCRIBE,
    };

    operation_type type = BGP;
    /* one input for the unary operations, two for JOIN / LEFT_JOIN / UNION / MINUS */
    std::vector<OperationPtr> inputs;

    std::vector<Term> variables;            // PROJECT, DESCRIBE
    std::optional<size_t> start;            // SLICE
    std::optional<size_t> length;           // SLICE
    std::vector<OrderCondition> order;      // ORDER_BY
    ExpressionPtr expression;               // FILTER, LEFT_JOIN (may be null)
    std::vector<TriplePattern> patterns;    // BGP, CONSTRUCT template
    Term graph;                             // GRAPH

    OperationPtr input() const { return inputs.empty() ? nullptr : inputs[0]; }

    static OperationPtr make(operation_type type, std::vector<OperationPtr> inputs = {});
    static OperationPtr makeBgp(std::vector<TriplePattern> patterns);
};

const char *operationTypeToString(Operation::operation_type type);

enum query_form {
    SELECT_QUERY,
    ASK_QUERY,
    CONSTRUCT_QUERY,
    DESCRIBE_QUERY,
    UPDATE_REQUEST,
};

struct ParsedQuery {
    query_form form = SELECT_QUERY;
    /* null for update requests */
    OperationPtr root;
    std::map<std::string, std::string> prefixes;
    std::string base;
    /* INSERT DATA / DELETE DATA content */
    QuintList insert_data;
    QuintList delete_data;
};

} // namespace quint

#endif //QUINT_ALGEBRA_HPP
