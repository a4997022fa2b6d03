/*
 * @FileName   : query_planner.hpp
 * @CreateAt   : 2026/9/24
 * @Description: Decides whether a SPARQL query can be answered by one store lookup.
 *               The algebra is walked from the outermost operator inward. A plan exists
 *               when the walk reaches a BGP of exactly one triple pattern through
 *               project / slice / distinct / reduced / orderby / graph nodes only.
 *               FILTER, joins, unions, minus and multi-pattern BGPs abort the walk,
 *               which is not an error: the caller delegates to a general evaluator.
 */

#ifndef QUINT_QUERY_PLANNER_HPP
#define QUINT_QUERY_PLANNER_HPP

#include <memory>
#include <string>
#include <vector>
#include <optional>

#include <spdlog/spdlog.h>

#include "database/pattern.hpp"
#include "parser/algebra.hpp"

namespace quint {

struct OptimizeParams {
    std::optional<size_t> limit;
    std::optional<size_t> offset;
    std::vector<term_name> order;
    bool reverse = false;
    /* the single triple pattern, its graph taken from an enclosing GRAPH node */
    TriplePattern pattern;
    /* projected variable names, without '?' */
    std::vector<std::string> variables;
    bool distinct = false;
};

class QueryPlanner {
public:
    explicit QueryPlanner(std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());
    ~QueryPlanner();

    /* parses `sparql`; unparsable text and non SELECT / ASK forms give nullopt */
    std::optional<OptimizeParams> analyze(const std::string &sparql) const;

    std::optional<OptimizeParams> analyzeAlgebra(const OperationPtr &root) const;

    /* `s` / `subject` ... `g` / `graph`, case insensitive */
    static std::optional<term_name> varNameToTermName(const std::string &name);

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace quint

#endif //QUINT_QUERY_PLANNER_HPP
