/*
 * @FileName   : query_planner.cpp
 * @CreateAt   : 2026/9/24
 * @Description: implement QueryPlanner
 */

#include "query/query_planner.hpp"

#include <algorithm>

#include <boost/algorithm/string.hpp>

#include "common/error.hpp"
#include "parser/sparql_parser.hpp"

namespace quint {

class QueryPlanner::Impl {
public:
    explicit Impl(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {}

    std::optional<OptimizeParams> analyze(const std::string &sparql) const {
        ParsedQuery query;
        try {
            SparqlParser parser;
            query = parser.parse(sparql);
        } catch (const ParseError &e) {
            logger_->debug("[planner] not eligible, parse failed: {}", e.what());
            return std::nullopt;
        }
        if (query.form != SELECT_QUERY && query.form != ASK_QUERY) {
            logger_->debug("[planner] not eligible, only SELECT and ASK are pushed down");
            return std::nullopt;
        }
        return analyzeAlgebra(query.root);
    }

    std::optional<OptimizeParams> analyzeAlgebra(const OperationPtr &root) const {
        OptimizeParams params;
        std::optional<Term> graph;
        std::optional<std::string> order_variable;
        bool bgp_found = false;

        for (auto current = root; current && !bgp_found;) {
            switch (current->type) {
                case Operation::PROJECT:
                    for (const auto &variable : current->variables) {
                        params.variables.push_back(variable.value());
                    }
                    current = current->input();
                    break;

                case Operation::SLICE:
                    if (current->length) params.limit = current->length;
                    if (current->start && *current->start > 0) params.offset = current->start;
                    current = current->input();
                    break;

                case Operation::DISTINCT:
                case Operation::REDUCED:
                    params.distinct = true;
                    current = current->input();
                    break;

                case Operation::ORDER_BY: {
                    if (current->order.size() != 1 || !current->order[0].expression->isVariable()) {
                        return abort_("ORDER BY is not a single variable");
                    }
                    order_variable = current->order[0].expression->term.value();
                    params.reverse = !current->order[0].ascending;
                    current = current->input();
                    break;
                }

                case Operation::FILTER:
                    return abort_("query has a filter");

                case Operation::BGP:
                    if (current->patterns.size() != 1) {
                        return abort_("BGP has " + std::to_string(current->patterns.size()) + " patterns");
                    }
                    params.pattern = current->patterns.front();
                    bgp_found = true;
                    break;

                case Operation::JOIN:
                case Operation::LEFT_JOIN:
                case Operation::UNION:
                case Operation::MINUS:
                    return abort_(std::string("query has ") + operationTypeToString(current->type));

                case Operation::GRAPH:
                    graph = current->graph;
                    current = current->input();
                    break;

                default:
                    current = current->input();
            }
        }
        if (!bgp_found) return abort_("no basic graph pattern");

        if (graph) params.pattern.graph = *graph;
        if (hasRepeatedVariable_(params.pattern)) {
            return abort_("a variable occurs twice in the pattern");
        }
        if (order_variable) {
            auto position = positionOf_(*order_variable, params.pattern);
            if (!position) position = varNameToTermName(*order_variable);
            if (!position) return abort_("ORDER BY ?" + *order_variable + " maps to no column");
            params.order = {*position};
        }
        if (params.variables.empty()) {
            for (auto name : {SUBJECT, PREDICATE, OBJECT, GRAPH}) {
                const Term &term = params.pattern.at(name);
                if (term.isVariable()) params.variables.push_back(term.value());
            }
        }

        logger_->debug("[planner] eligible for push-down: {} {} {} {}",
                       params.pattern.subject.toString(), params.pattern.predicate.toString(),
                       params.pattern.object.toString(), params.pattern.graph.toString());
        return params;
    }

private:
    std::shared_ptr<spdlog::logger> logger_;

    std::optional<OptimizeParams> abort_(const std::string &reason) const {
        logger_->debug("[planner] not eligible, {}", reason);
        return std::nullopt;
    }

    static std::optional<term_name> positionOf_(const std::string &variable, const TriplePattern &pattern) {
        for (auto name : {SUBJECT, PREDICATE, OBJECT, GRAPH}) {
            const Term &term = pattern.at(name);
            if (term.isVariable() && term.value() == variable) return name;
        }
        return std::nullopt;
    }

    // one column cannot express the equality between two positions
    static bool hasRepeatedVariable_(const TriplePattern &pattern) {
        std::vector<std::string> seen;
        for (auto name : {SUBJECT, PREDICATE, OBJECT, GRAPH}) {
            const Term &term = pattern.at(name);
            if (!term.isVariable()) continue;
            if (std::find(seen.begin(), seen.end(), term.value()) != seen.end()) return true;
            seen.push_back(term.value());
        }
        return false;
    }
};

QueryPlanner::QueryPlanner(std::shared_ptr<spdlog::logger> logger)
    : impl_(std::make_shared<Impl>(std::move(logger))) {}

QueryPlanner::~QueryPlanner() = default;

std::optional<OptimizeParams> QueryPlanner::analyze(const std::string &sparql) const {
    return impl_->analyze(sparql);
}

std::optional<OptimizeParams> QueryPlanner::analyzeAlgebra(const OperationPtr &root) const {
    return impl_->analyzeAlgebra(root);
}

std::optional<term_name> QueryPlanner::varNameToTermName(const std::string &name) {
    auto lower = boost::algorithm::to_lower_copy(name);
    if (lower == "s" || lower == "subject") return SUBJECT;
    if (lower == "p" || lower == "predicate") return PREDICATE;
    if (lower == "o" || lower == "object") return OBJECT;
    if (lower == "g" || lower == "graph") return GRAPH;
    return std::nullopt;
}

} // namespace quint
