/*
 * @FileName   : query_optimizer.hpp
 * @CreateAt   : 2026/10/19
 * @Description: Multi pattern plans for the queries `QueryPlanner` gives up on.
 *               Two shapes are recognised under the solution modifiers:
 *                 OPTIONAL  a core group followed by `OPTIONAL { ?s <p> ?x }` blocks on the
 *                           subject of the core. The core runs first, the optional values
 *                           of every core subject come from one `getAttributes` batch and
 *                           the first value of each predicate is bound.
 *                 COMPOUND  two or more patterns sharing their subject variable, with the
 *                           FILTER conjuncts pushed into the pattern holding their variable.
 *                           The store answers with one self-join on the subject.
 *               Anything else is NOT_OPTIMIZED and goes to the general evaluator.
 */

#ifndef QUINT_QUERY_OPTIMIZER_HPP
#define QUINT_QUERY_OPTIMIZER_HPP

#include <memory>
#include <string>
#include <vector>
#include <utility>
#include <optional>

#include <spdlog/spdlog.h>

#include "common/result_set.hpp"
#include "database/quint_store.hpp"
#include "parser/algebra.hpp"
#include "query/filter_pushdown.hpp"
#include "query/query_evaluator.hpp"

namespace quint {

/* what wraps the pattern: ORDER BY, projection, DISTINCT / REDUCED and the slice */
struct SolutionModifiers {
    /* projected variable names; empty projects every bound variable */
    std::vector<std::string> variables;
    std::optional<size_t> limit;
    std::optional<size_t> offset;
    bool distinct = false;
    std::optional<std::string> order_variable;
    bool reverse = false;
};

/* patterns joined on the subject; graph already taken from an enclosing GRAPH node */
struct CompoundAnalysis {
    std::vector<TriplePattern> patterns;
    std::string join_variable;
    term_name join_field = SUBJECT;
    /* pushed down FILTER operators, one entry per pattern */
    std::vector<PushdownFilters> filters;
};

struct OptionalAnalysis {
    /* the group left of the OPTIONAL blocks */
    CompoundAnalysis core;
    std::string subject_variable;
    std::vector<Term> predicates;
    /* predicate -> variable it binds, in query order */
    std::vector<std::pair<Term, std::string>> optional_variables;
    /* set when the query sits in GRAPH <iri> */
    std::optional<Term> graph;
};

struct OptimizationResult {
    enum optimization_type {
        NOT_OPTIMIZED,
        OPTIONAL_BATCH,
        COMPOUND_JOIN,
    };

    optimization_type type = NOT_OPTIMIZED;
    CompoundAnalysis compound;
    OptionalAnalysis optional;
    SolutionModifiers modifiers;
};

class QueryOptimizer {
public:
    explicit QueryOptimizer(std::shared_ptr<QuintStore> store,
                            std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());
    ~QueryOptimizer();

    /* OPTIONAL is tried first, then COMPOUND */
    OptimizationResult analyzeQuery(const OperationPtr &root) const;

    std::optional<OptionalAnalysis> analyzeOptional(const OperationPtr &root) const;

    std::optional<CompoundAnalysis> analyzeCompound(const OperationPtr &root) const;

    /* runs an analysed query with its solution modifiers applied */
    SolutionSet execute(const OptimizationResult &plan, const QueryContext &context = {}) const;

    /* one row per join; `options` slices and orders on the store side */
    SolutionSet executeCompound(const CompoundAnalysis &analysis, const QueryContext &context = {},
                                const QueryOptions &options = {}) const;

    /*
     * Extends every core solution with the optional values of its subject. A predicate
     * without value leaves its variable unbound. When `order_variable` is given the rows
     * are sorted on it, unbound values last.
     */
    SolutionSet executeOptionalOptimized(const OptionalAnalysis &analysis, const SolutionSet &core,
                                         const QueryContext &context = {},
                                         const std::optional<std::string> &order_variable = std::nullopt,
                                         bool reverse = false) const;

    /* numeric literals compare by value, other terms by their lexical value */
    static void sortSolutions(std::vector<Binding> &solutions, const std::string &variable, bool reverse);

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace quint

#endif //QUINT_QUERY_OPTIMIZER_HPP
