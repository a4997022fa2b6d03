/*
 * @FileName   : query_evaluator.hpp
 * @CreateAt   : 2026/9/24
 * @Description: SPARQL evaluation interface, implemented by `OptimizedEngine` and by the
 *               general purpose evaluator it delegates to. A general evaluator reads the
 *               store through `QuintStore::match`.
 */

#ifndef QUINT_QUERY_EVALUATOR_HPP
#define QUINT_QUERY_EVALUATOR_HPP

#include <string>
#include <optional>

#include "common/result_set.hpp"
#include "common/type.hpp"
#include "database/pattern.hpp"

namespace quint {

struct QueryContext {
    /* tenant isolation, applied to every store pattern of the query */
    std::optional<QuintPattern> security_filters;
    std::string base_iri;
};

class QueryEvaluator {
public:
    virtual ~QueryEvaluator() = default;

    /* SELECT */
    virtual SolutionSet queryBindings(const std::string &query, const QueryContext &context) = 0;
    /* ASK */
    virtual bool queryBoolean(const std::string &query, const QueryContext &context) = 0;
    /* CONSTRUCT / DESCRIBE */
    virtual QuintList queryQuads(const std::string &query, const QueryContext &context) = 0;
    /* updates */
    virtual void queryVoid(const std::string &query, const QueryContext &context) = 0;
};

} // namespace quint

#endif //QUINT_QUERY_EVALUATOR_HPP
