/*
 * @FileName   : optimized_engine.hpp
 * @CreateAt   : 2026/9/24
 * @Description: SPARQL engine answering SELECT / ASK queries on the store where it can.
 *               A single pattern takes one `QuintStore::get`, the OPTIONAL and shared subject
 *               shapes of `QueryOptimizer` take one batch or one join, everything else is
 *               delegated. Without a delegate, a query that needs one raises
 *               `UnsupportedQueryError`.
 */

#ifndef QUINT_OPTIMIZED_ENGINE_HPP
#define QUINT_OPTIMIZED_ENGINE_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "database/quint_store.hpp"
#include "query/query_evaluator.hpp"
#include "query/query_optimizer.hpp"
#include "query/query_planner.hpp"

namespace quint {

class OptimizedEngine : public QueryEvaluator {
public:
    OptimizedEngine(std::shared_ptr<QuintStore> store,
                    std::shared_ptr<QueryEvaluator> delegate = nullptr,
                    std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());
    ~OptimizedEngine() override;

    SolutionSet queryBindings(const std::string &query, const QueryContext &context = {}) override;
    bool queryBoolean(const std::string &query, const QueryContext &context = {}) override;
    QuintList queryQuads(const std::string &query, const QueryContext &context = {}) override;
    void queryVoid(const std::string &query, const QueryContext &context = {}) override;

    std::shared_ptr<QuintStore> getStore() const;

    /* milliseconds spent in the last query */
    double getQueryTime() const;

    /* whether the last query ran on the store instead of the delegate */
    bool lastQueryOptimized() const;

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace quint

#endif //QUINT_OPTIMIZED_ENGINE_HPP
