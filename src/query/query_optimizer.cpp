/*
 * @FileName   : query_optimizer.cpp
 * @CreateAt   : 2026/10/19
 * @Description: implement QueryOptimizer
 */

#include "query/query_optimizer.hpp"

#include <set>
#include <cmath>
#include <cstdlib>
#include <algorithm>
#include <stdexcept>

#include <boost/algorithm/string/join.hpp>

#include "common/utils.hpp"
#include "query/pattern_builder.hpp"

namespace quint {

namespace {

const term_name JOINED_POSITIONS[] = {PREDICATE, OBJECT, GRAPH};

bool contains(const std::vector<std::string> &names, const std::string &name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

/* `a && b && c` as [a, b, c] */
void splitConjunction(const ExpressionPtr &expr, std::vector<ExpressionPtr> &out) {
    if (expr && expr->isOperator("&&")) {
        for (const auto &arg : expr->args) splitConjunction(arg, out);
    } else {
        out.push_back(expr);
    }
}

/* two operator sets constraining the same key of one variable */
bool overlaps(const TermOperators &a, const TermOperators &b) {
    return (a.eq && b.eq) || (a.ne && b.ne) || (a.gt && b.gt) || (a.gte && b.gte)
        || (a.lt && b.lt) || (a.lte && b.lte) || (a.in && b.in) || (a.not_in && b.not_in)
        || (a.starts_with && b.starts_with) || (a.ends_with && b.ends_with)
        || (a.contains && b.contains) || (a.regex && b.regex) || (a.is_null && b.is_null);
}

bool numericValue(const Term &term, double &value) {
    if (!term.isLiteral() || term.value().empty()) return false;
    const char *begin = term.value().c_str();
    char *end = nullptr;
    value = std::strtod(begin, &end);
    return end == begin + term.value().size() && !std::isnan(value);
}

} // namespace

class QueryOptimizer::Impl {
public:
    Impl(std::shared_ptr<QuintStore> store, std::shared_ptr<spdlog::logger> logger)
        : store_(std::move(store)), logger_(std::move(logger)) {}

    OptimizationResult analyzeQuery(const OperationPtr &root) const {
        OptimizationResult result;
        auto body = stripModifiers_(root, result.modifiers);
        if (!body) return result;

        if (auto optional = analyzeOptional_(body)) {
            result.type = OptimizationResult::OPTIONAL_BATCH;
            result.optional = std::move(*optional);
            logger_->debug("[optimizer] OPTIONAL batch on ?{}, {} predicate(s)",
                           result.optional.subject_variable, result.optional.predicates.size());
        } else if (auto compound = analyzeCompound_(body)) {
            result.type = OptimizationResult::COMPOUND_JOIN;
            result.compound = std::move(*compound);
            logger_->debug("[optimizer] compound join of {} patterns on ?{}",
                           result.compound.patterns.size(), result.compound.join_variable);
        }
        return result;
    }

    std::optional<OptionalAnalysis> analyzeOptional(const OperationPtr &root) const {
        SolutionModifiers modifiers;
        auto body = stripModifiers_(root, modifiers);
        if (!body) return std::nullopt;
        return analyzeOptional_(body);
    }

    std::optional<CompoundAnalysis> analyzeCompound(const OperationPtr &root) const {
        SolutionModifiers modifiers;
        auto body = stripModifiers_(root, modifiers);
        if (!body) return std::nullopt;
        return analyzeCompound_(body);
    }

    SolutionSet execute(const OptimizationResult &plan, const QueryContext &context) const {
        const auto &modifiers = plan.modifiers;
        QueryOptions options;
        // ORDER BY and DISTINCT run here, they need every row
        if (!modifiers.order_variable && !modifiers.distinct) {
            options.limit = rowsToFetch(modifiers.limit, modifiers.offset);
        }

        SolutionSet solutions;
        switch (plan.type) {
            case OptimizationResult::COMPOUND_JOIN:
                solutions = executeCompound(plan.compound, context, options);
                break;
            case OptimizationResult::OPTIONAL_BATCH:
                solutions = executeOptionalOptimized(plan.optional,
                                                     executeCompound(plan.optional.core, context, options),
                                                     context, std::nullopt, false);
                break;
            default:
                throw std::invalid_argument("query has no multi pattern plan");
        }

        std::vector<Binding> rows(solutions.begin(), solutions.end());
        if (modifiers.order_variable) {
            sortSolutions(rows, *modifiers.order_variable, modifiers.reverse);
        }
        auto variables = modifiers.variables.empty() ? solutions.variables() : modifiers.variables;
        return applySlice_(rows, variables, modifiers);
    }

    SolutionSet executeCompound(const CompoundAnalysis &analysis, const QueryContext &context,
                                const QueryOptions &options) const {
        PatternBuilder builder([&context] { return context.security_filters; }, logger_);

        CompoundPattern compound;
        compound.join_on = analysis.join_field;
        std::vector<std::string> variables{analysis.join_variable};
        for (size_t i = 0; i < analysis.patterns.size(); ++i) {
            const auto &pattern = analysis.patterns[i];
            static const PushdownFilters no_filters;
            const auto &filters = i < analysis.filters.size() ? analysis.filters[i] : no_filters;
            QuintPattern quint_pattern = builder.buildQuintPattern(pattern, filters);
            if (pattern.graph.isVariable()) {
                PatternBuilder::excludeDefaultGraph(quint_pattern);
            }
            compound.patterns.push_back(std::move(quint_pattern));

            for (auto name : JOINED_POSITIONS) {
                const Term &term = pattern.at(name);
                if (!term.isVariable() || contains(variables, term.value())) continue;
                compound.select.push_back(CompoundSelect{i, name, term.value()});
                variables.push_back(term.value());
            }
        }

        auto results = store_->getCompound(compound, options);

        SolutionSet solutions(variables);
        solutions.reserve(results.size());
        for (const auto &result : results) {
            Binding binding;
            binding[analysis.join_variable] = result.join_value;
            for (const auto &select : compound.select) {
                auto it = result.bindings.find(select.alias);
                if (it != result.bindings.end()) binding[select.alias] = it->second;
            }
            solutions.push_back(std::move(binding));
        }
        logger_->debug("[optimizer] compound returned {} row(s)", solutions.size());
        return solutions;
    }

    SolutionSet executeOptionalOptimized(const OptionalAnalysis &analysis, const SolutionSet &core,
                                         const QueryContext &context,
                                         const std::optional<std::string> &order_variable, bool reverse) const {
        auto variables = core.variables();
        for (const auto &entry : analysis.optional_variables) {
            if (!contains(variables, entry.second)) variables.push_back(entry.second);
        }
        SolutionSet solutions(variables);
        if (core.empty()) return solutions;

        std::vector<Term> subjects;
        std::set<Term> seen;
        for (const auto &row : core) {
            auto it = row.find(analysis.subject_variable);
            if (it == row.end() || it->second.isLiteral()) continue;
            if (seen.insert(it->second).second) subjects.push_back(it->second);
        }

        AttributeMap attributes = fetchAttributes_(subjects, analysis, context);
        logger_->debug("[optimizer] OPTIONAL: {} core row(s), {} subject(s), values for {}",
                       core.size(), subjects.size(), attributes.size());

        std::vector<Binding> rows;
        rows.reserve(core.size());
        for (const auto &row : core) {
            Binding binding = row;
            auto subject = row.find(analysis.subject_variable);
            auto found = subject == row.end() ? attributes.end() : attributes.find(subject->second);
            if (found != attributes.end()) {
                for (const auto &entry : analysis.optional_variables) {
                    auto values = found->second.find(entry.first);
                    if (values != found->second.end() && !values->second.empty()) {
                        binding[entry.second] = values->second.front();
                    }
                }
            }
            rows.push_back(std::move(binding));
        }

        if (order_variable && rows.size() > 1) {
            sortSolutions(rows, *order_variable, reverse);
        }
        for (auto &row : rows) {
            solutions.push_back(std::move(row));
        }
        return solutions;
    }

private:
    std::shared_ptr<QuintStore> store_;
    std::shared_ptr<spdlog::logger> logger_;

    template<typename T>
    std::optional<T> abort_(const std::string &reason) const {
        logger_->debug("[optimizer] not eligible, {}", reason);
        return std::nullopt;
    }

    /* null when the modifiers cannot be applied to joined rows */
    OperationPtr stripModifiers_(const OperationPtr &root, SolutionModifiers &modifiers) const {
        auto current = root;
        while (current) {
            switch (current->type) {
                case Operation::PROJECT:
                    for (const auto &variable : current->variables) {
                        modifiers.variables.push_back(variable.value());
                    }
                    break;
                case Operation::SLICE:
                    modifiers.limit = current->length;
                    if (current->start && *current->start > 0) modifiers.offset = current->start;
                    break;
                case Operation::DISTINCT:
                case Operation::REDUCED:
                    modifiers.distinct = true;
                    break;
                case Operation::ORDER_BY:
                    if (current->order.size() != 1 || !current->order[0].expression->isVariable()) {
                        logger_->debug("[optimizer] not eligible, ORDER BY is not a single variable");
                        return nullptr;
                    }
                    modifiers.order_variable = current->order[0].expression->term.value();
                    modifiers.reverse = !current->order[0].ascending;
                    break;
                case Operation::ASK:
                    break;
                default:
                    return current;
            }
            current = current->input();
        }
        return nullptr;
    }

    std::optional<OptionalAnalysis> analyzeOptional_(const OperationPtr &body) const {
        using Result = OptionalAnalysis;
        OptionalAnalysis analysis;

        // a FILTER above the OPTIONAL blocks has to fit the core
        std::vector<ExpressionPtr> filters;
        auto current = body;
        while (current && (current->type == Operation::FILTER || current->type == Operation::GRAPH)) {
            if (current->type == Operation::FILTER) {
                filters.push_back(current->expression);
            } else {
                if (analysis.graph) return abort_<Result>("nested GRAPH");
                // a graph variable would need one lookup per graph
                if (current->graph.isVariable()) return abort_<Result>("OPTIONAL in GRAPH ?var");
                analysis.graph = current->graph;
            }
            current = current->input();
        }

        std::vector<OperationPtr> left_joins;
        while (current && current->type == Operation::LEFT_JOIN) {
            left_joins.push_back(current);
            current = current->inputs[0];
        }
        if (left_joins.empty()) return abort_<Result>("no OPTIONAL");
        std::reverse(left_joins.begin(), left_joins.end());

        auto core = analyzeGroup_(current, filters, analysis.graph, 1);
        if (!core) return abort_<Result>("OPTIONAL core is not a subject group");
        analysis.core = std::move(*core);
        analysis.subject_variable = analysis.core.join_variable;

        std::vector<std::string> bound = variablesOf_(analysis.core.patterns);
        for (const auto &left_join : left_joins) {
            if (left_join->expression) return abort_<Result>("OPTIONAL has a FILTER");
            const auto &right = left_join->inputs[1];
            if (right->type != Operation::BGP || right->patterns.size() != 1) {
                return abort_<Result>("OPTIONAL is not a single pattern");
            }
            const auto &pattern = right->patterns.front();
            if (!pattern.subject.isVariable() || pattern.subject.value() != analysis.subject_variable) {
                return abort_<Result>("OPTIONAL subject is not ?" + analysis.subject_variable);
            }
            if (!pattern.predicate.isNamedNode()) {
                return abort_<Result>("OPTIONAL predicate is not an IRI");
            }
            analysis.predicates.push_back(pattern.predicate);
            if (!pattern.object.isVariable()) continue;
            // a variable shared with the core or another block joins, not extends
            if (contains(bound, pattern.object.value())) {
                return abort_<Result>("?" + pattern.object.value() + " is bound twice");
            }
            bound.push_back(pattern.object.value());
            analysis.optional_variables.emplace_back(pattern.predicate, pattern.object.value());
        }
        return analysis;
    }

    std::optional<CompoundAnalysis> analyzeCompound_(const OperationPtr &body) const {
        return analyzeGroup_(body, {}, std::nullopt, 2);
    }

    /* FILTER / GRAPH wrapped BGPs and JOINs of them, every pattern on the same subject */
    std::optional<CompoundAnalysis> analyzeGroup_(OperationPtr current, std::vector<ExpressionPtr> filters,
                                                  std::optional<Term> graph, size_t min_patterns) const {
        using Result = CompoundAnalysis;
        CompoundAnalysis analysis;

        while (current && (current->type == Operation::FILTER || current->type == Operation::GRAPH)) {
            if (current->type == Operation::FILTER) {
                filters.push_back(current->expression);
            } else {
                if (graph) return abort_<Result>("nested GRAPH");
                graph = current->graph;
            }
            current = current->input();
        }
        if (!current || !collectPatterns_(current, analysis.patterns)) {
            return abort_<Result>("group is not a join of basic graph patterns");
        }
        if (analysis.patterns.size() < min_patterns) {
            return abort_<Result>(std::to_string(analysis.patterns.size()) + " pattern(s)");
        }

        const Term &subject = analysis.patterns.front().subject;
        if (!subject.isVariable()) return abort_<Result>("subject is not a variable");
        analysis.join_variable = subject.value();
        for (auto &pattern : analysis.patterns) {
            if (pattern.subject != subject) return abort_<Result>("patterns do not share their subject");
            pattern.graph = graph ? *graph : Term::defaultGraph();
        }

        // one join column cannot express equality between other positions
        std::vector<std::string> seen{analysis.join_variable};
        if (graph && graph->isVariable()) {
            if (contains(seen, graph->value())) return abort_<Result>("graph variable is the subject");
            seen.push_back(graph->value());
        }
        for (const auto &pattern : analysis.patterns) {
            for (auto name : {PREDICATE, OBJECT}) {
                const Term &term = pattern.at(name);
                if (!term.isVariable()) continue;
                if (contains(seen, term.value())) return abort_<Result>("?" + term.value() + " occurs twice");
                seen.push_back(term.value());
            }
        }

        analysis.filters.resize(analysis.patterns.size());
        std::vector<ExpressionPtr> conjuncts;
        for (const auto &filter : filters) splitConjunction(filter, conjuncts);
        for (const auto &conjunct : conjuncts) {
            if (!pushConjunct_(conjunct, analysis)) return abort_<Result>("FILTER cannot be pushed down");
        }
        if (analysis.patterns.size() > 1) {
            for (const auto &filters_of_pattern : analysis.filters) {
                for (const auto &entry : filters_of_pattern) {
                    if (entry.second.regex) return abort_<Result>("regex in a join");
                }
            }
        }
        return analysis;
    }

    /* into the first pattern that takes the whole condition */
    static bool pushConjunct_(const ExpressionPtr &conjunct, CompoundAnalysis &analysis) {
        for (size_t i = 0; i < analysis.patterns.size(); ++i) {
            auto pushed = FilterPushdownExtractor::extract(conjunct, analysis.patterns[i]);
            if (pushed.remainder || !pushed.or_branches.empty() || pushed.filters.empty()) continue;

            auto &filters = analysis.filters[i];
            for (const auto &entry : pushed.filters) {
                auto it = filters.find(entry.first);
                if (it != filters.end() && overlaps(it->second, entry.second)) return false;
            }
            for (const auto &entry : pushed.filters) {
                filters[entry.first].merge(entry.second);
            }
            return true;
        }
        return false;
    }

    static bool collectPatterns_(const OperationPtr &op, std::vector<TriplePattern> &patterns) {
        if (op->type == Operation::BGP) {
            patterns.insert(patterns.end(), op->patterns.begin(), op->patterns.end());
            return true;
        }
        if (op->type == Operation::JOIN) {
            for (const auto &input : op->inputs) {
                if (!input || !collectPatterns_(input, patterns)) return false;
            }
            return true;
        }
        return false;
    }

    static std::vector<std::string> variablesOf_(const std::vector<TriplePattern> &patterns) {
        std::vector<std::string> variables;
        for (const auto &pattern : patterns) {
            for (auto name : {SUBJECT, PREDICATE, OBJECT, GRAPH}) {
                const Term &term = pattern.at(name);
                if (term.isVariable() && !contains(variables, term.value())) variables.push_back(term.value());
            }
        }
        return variables;
    }

    AttributeMap fetchAttributes_(const std::vector<Term> &subjects, const OptionalAnalysis &analysis,
                                  const QueryContext &context) const {
        if (!context.security_filters) {
            return store_->getAttributes(subjects, analysis.predicates, analysis.graph);
        }
        if (subjects.empty()) return {};

        // the tenant constraint has to reach the lookup as well
        PatternBuilder builder([&context] { return context.security_filters; }, logger_);
        TriplePattern lookup{Term::variable("s"), Term::variable("p"), Term::variable("o"),
                             analysis.graph ? *analysis.graph : Term::defaultGraph()};
        PushdownFilters filters;
        filters["s"].in = std::vector<OperatorValue>(subjects.begin(), subjects.end());
        filters["p"].in = std::vector<OperatorValue>(analysis.predicates.begin(), analysis.predicates.end());

        AttributeMap attributes;
        for (const auto &quint : store_->get(builder.buildQuintPattern(lookup, filters))) {
            attributes[quint.subject][quint.predicate].push_back(quint.object);
        }
        return attributes;
    }

    static SolutionSet applySlice_(const std::vector<Binding> &rows, const std::vector<std::string> &variables,
                                   const SolutionModifiers &modifiers) {
        SolutionSet solutions(variables);
        std::set<std::string> seen;
        size_t offset = modifiers.offset.value_or(0);
        size_t skipped = 0;
        for (const auto &row : rows) {
            if (modifiers.limit && solutions.size() >= *modifiers.limit) break;
            Binding binding;
            for (const auto &variable : variables) {
                auto it = row.find(variable);
                if (it != row.end()) binding[variable] = it->second;
            }
            if (modifiers.distinct && !seen.insert(distinctKey_(variables, binding)).second) {
                continue;
            }
            if (skipped < offset) {
                ++skipped;
                continue;
            }
            solutions.push_back(std::move(binding));
        }
        return solutions;
    }

    static std::string distinctKey_(const std::vector<std::string> &variables, const Binding &binding) {
        std::vector<std::string> parts;
        for (const auto &variable : variables) {
            auto it = binding.find(variable);
            parts.push_back(variable + "=" + (it == binding.end() ? "" : it->second.toString()));
        }
        return boost::algorithm::join(parts, "|");
    }
};

QueryOptimizer::QueryOptimizer(std::shared_ptr<QuintStore> store, std::shared_ptr<spdlog::logger> logger)
    : impl_(std::make_shared<Impl>(std::move(store), std::move(logger))) {}

QueryOptimizer::~QueryOptimizer() = default;

OptimizationResult QueryOptimizer::analyzeQuery(const OperationPtr &root) const {
    return impl_->analyzeQuery(root);
}

std::optional<OptionalAnalysis> QueryOptimizer::analyzeOptional(const OperationPtr &root) const {
    return impl_->analyzeOptional(root);
}

std::optional<CompoundAnalysis> QueryOptimizer::analyzeCompound(const OperationPtr &root) const {
    return impl_->analyzeCompound(root);
}

SolutionSet QueryOptimizer::execute(const OptimizationResult &plan, const QueryContext &context) const {
    return impl_->execute(plan, context);
}

SolutionSet QueryOptimizer::executeCompound(const CompoundAnalysis &analysis, const QueryContext &context,
                                            const QueryOptions &options) const {
    return impl_->executeCompound(analysis, context, options);
}

SolutionSet QueryOptimizer::executeOptionalOptimized(const OptionalAnalysis &analysis, const SolutionSet &core,
                                                     const QueryContext &context,
                                                     const std::optional<std::string> &order_variable,
                                                     bool reverse) const {
    return impl_->executeOptionalOptimized(analysis, core, context, order_variable, reverse);
}

void QueryOptimizer::sortSolutions(std::vector<Binding> &solutions, const std::string &variable, bool reverse) {
    // numeric literals first by value, then every other term by its lexical value
    auto key = [&variable](const Binding &binding, double &number, const std::string *&text) {
        auto it = binding.find(variable);
        if (it == binding.end()) return 2;
        text = &it->second.value();
        return numericValue(it->second, number) ? 0 : 1;
    };
    std::stable_sort(solutions.begin(), solutions.end(), [&](const Binding &a, const Binding &b) {
        double a_number = 0, b_number = 0;
        const std::string *a_text = nullptr, *b_text = nullptr;
        int a_rank = key(a, a_number, a_text);
        int b_rank = key(b, b_number, b_text);
        // unbound stays last in both directions
        if (a_rank == 2 || b_rank == 2) return a_rank < b_rank;
        if (a_rank != b_rank) return reverse ? a_rank > b_rank : a_rank < b_rank;
        if (a_rank == 0) {
            return reverse ? b_number < a_number : a_number < b_number;
        }
        return reverse ? *b_text < *a_text : *a_text < *b_text;
    });
}

} // namespace quint
