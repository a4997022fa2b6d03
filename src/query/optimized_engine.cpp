/*
 * @FileName   : optimized_engine.cpp
 * @CreateAt   : 2026/9/24
 * @Description: implement OptimizedEngine
 */

#include "query/optimized_engine.hpp"

#include <set>
#include <tuple>
#include <atomic>
#include <optional>
#include <algorithm>

#include <boost/algorithm/string/join.hpp>

#include "common/error.hpp"
#include "common/utils.hpp"
#include "parser/sparql_parser.hpp"
#include "query/pattern_builder.hpp"

namespace quint {

class OptimizedEngine::Impl {
public:
    Impl(std::shared_ptr<QuintStore> store, std::shared_ptr<QueryEvaluator> delegate,
         std::shared_ptr<spdlog::logger> logger)
        : store_(std::move(store)), delegate_(std::move(delegate)), logger_(logger),
          planner_(logger), optimizer_(store_, logger), query_time_(0), optimized_(false) {}

    SolutionSet queryBindings(const std::string &query, const QueryContext &context) {
        SolutionSet result;
        double elapsed = 0;
        bool optimized = false;
        std::tie(result, elapsed) = timeit([&] {
            auto parsed = parse_(query);
            if (parsed) {
                if (auto params = planner_.analyzeAlgebra(parsed->root)) {
                    optimized = true;
                    logger_->debug("[engine] push-down path for SELECT");
                    return executeSelect_(*params, context);
                }
                auto plan = optimizer_.analyzeQuery(parsed->root);
                if (plan.type != OptimizationResult::NOT_OPTIMIZED) {
                    optimized = true;
                    logger_->debug("[engine] multi pattern path for SELECT");
                    return optimizer_.execute(plan, context);
                }
            }
            logger_->debug("[engine] delegating SELECT");
            return delegate_for_("SELECT")->queryBindings(query, context);
        });
        query_time_ = elapsed;
        optimized_ = optimized;
        return result;
    }

    bool queryBoolean(const std::string &query, const QueryContext &context) {
        bool result = false;
        double elapsed = 0;
        bool optimized = false;
        std::tie(result, elapsed) = timeit([&] {
            auto parsed = parse_(query);
            if (parsed) {
                if (auto params = planner_.analyzeAlgebra(parsed->root)) {
                    optimized = true;
                    logger_->debug("[engine] push-down path for ASK");
                    params->limit = 1;
                    return !executeSelect_(*params, context).empty();
                }
                auto plan = optimizer_.analyzeQuery(parsed->root);
                if (plan.type != OptimizationResult::NOT_OPTIMIZED) {
                    optimized = true;
                    logger_->debug("[engine] multi pattern path for ASK");
                    plan.modifiers.limit = 1;
                    return !optimizer_.execute(plan, context).empty();
                }
            }
            logger_->debug("[engine] delegating ASK");
            return delegate_for_("ASK")->queryBoolean(query, context);
        });
        query_time_ = elapsed;
        optimized_ = optimized;
        return result;
    }

    QuintList queryQuads(const std::string &query, const QueryContext &context) {
        optimized_ = false;
        logger_->debug("[engine] delegating CONSTRUCT / DESCRIBE");
        QuintList result;
        double elapsed = 0;
        std::tie(result, elapsed) = timeit([&] {
            return delegate_for_("CONSTRUCT / DESCRIBE")->queryQuads(query, context);
        });
        query_time_ = elapsed;
        return result;
    }

    void queryVoid(const std::string &query, const QueryContext &context) {
        optimized_ = false;
        logger_->debug("[engine] delegating update");
        query_time_ = timeitVoid([&] {
            delegate_for_("update")->queryVoid(query, context);
        });
    }

    std::shared_ptr<QuintStore> store_;
    std::shared_ptr<QueryEvaluator> delegate_;
    std::shared_ptr<spdlog::logger> logger_;
    QueryPlanner planner_;
    QueryOptimizer optimizer_;
    // read by other threads while a query runs
    std::atomic<double> query_time_;
    std::atomic<bool> optimized_;

private:
    const std::shared_ptr<QueryEvaluator> &delegate_for_(const std::string &form) const {
        if (!delegate_) {
            throw UnsupportedQueryError(form + " query needs a general SPARQL evaluator, none is configured");
        }
        return delegate_;
    }

    /* SELECT / ASK algebra, nullopt for what only the delegate understands */
    std::optional<ParsedQuery> parse_(const std::string &query) const {
        ParsedQuery parsed;
        try {
            SparqlParser parser;
            parsed = parser.parse(query);
        } catch (const ParseError &e) {
            logger_->debug("[engine] parse failed: {}", e.what());
            return std::nullopt;
        }
        if (parsed.form != SELECT_QUERY && parsed.form != ASK_QUERY) return std::nullopt;
        return parsed;
    }

    SolutionSet executeSelect_(const OptimizeParams &params, const QueryContext &context) {
        PatternBuilder builder([&context] { return context.security_filters; }, logger_);
        QuintPattern pattern = builder.buildBasePattern(params.pattern);
        if (params.pattern.graph.isVariable()) {
            PatternBuilder::excludeDefaultGraph(pattern);
        }

        QueryOptions options;
        options.order = params.order;
        options.reverse = params.reverse;
        // DISTINCT has to see the duplicates before the slice is taken
        if (!params.distinct) {
            options.limit = rowsToFetch(params.limit, params.offset);
        }

        auto quints = store_->get(pattern, options);

        SolutionSet solutions(params.variables);
        std::set<std::string> seen;
        size_t offset = params.offset.value_or(0);
        size_t skipped = 0;
        for (const auto &quint : quints) {
            if (params.limit && solutions.size() >= *params.limit) break;
            Binding binding = bind_(params, quint);
            if (params.distinct && !seen.insert(distinctKey_(params.variables, binding)).second) {
                continue;
            }
            if (skipped < offset) {
                ++skipped;
                continue;
            }
            solutions.push_back(std::move(binding));
        }
        logger_->debug("[engine] {} rows fetched, {} solutions", quints.size(), solutions.size());
        return solutions;
    }

    static Binding bind_(const OptimizeParams &params, const Quint &quint) {
        Binding binding;
        for (auto name : {SUBJECT, PREDICATE, OBJECT, GRAPH}) {
            const Term &term = params.pattern.at(name);
            if (!term.isVariable()) continue;
            if (std::find(params.variables.begin(), params.variables.end(), term.value()) == params.variables.end()) {
                continue;
            }
            binding[term.value()] = quint.at(name);
        }
        return binding;
    }

    static std::string distinctKey_(const std::vector<std::string> &variables, const Binding &binding) {
        std::vector<std::string> parts;
        for (const auto &variable : variables) {
            auto it = binding.find(variable);
            parts.push_back(variable + "=" + (it == binding.end() ? "" : it->second.toString()));
        }
        std::sort(parts.begin(), parts.end());
        return boost::algorithm::join(parts, "|");
    }
};

OptimizedEngine::OptimizedEngine(std::shared_ptr<QuintStore> store,
                                 std::shared_ptr<QueryEvaluator> delegate,
                                 std::shared_ptr<spdlog::logger> logger)
    : impl_(std::make_shared<Impl>(std::move(store), std::move(delegate), std::move(logger))) {}

OptimizedEngine::~OptimizedEngine() = default;

SolutionSet OptimizedEngine::queryBindings(const std::string &query, const QueryContext &context) {
    return impl_->queryBindings(query, context);
}

bool OptimizedEngine::queryBoolean(const std::string &query, const QueryContext &context) {
    return impl_->queryBoolean(query, context);
}

QuintList OptimizedEngine::queryQuads(const std::string &query, const QueryContext &context) {
    return impl_->queryQuads(query, context);
}

void OptimizedEngine::queryVoid(const std::string &query, const QueryContext &context) {
    impl_->queryVoid(query, context);
}

std::shared_ptr<QuintStore> OptimizedEngine::getStore() const {
    return impl_->store_;
}

double OptimizedEngine::getQueryTime() const {
    return impl_->query_time_;
}

bool OptimizedEngine::lastQueryOptimized() const {
    return impl_->optimized_;
}

} // namespace quint
