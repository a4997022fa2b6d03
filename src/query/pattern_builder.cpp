/*
 * @FileName   : pattern_builder.cpp
 * @CreateAt   : 2026/9/23
 * @Description: implement PatternBuilder
 */

#include "query/pattern_builder.hpp"

namespace quint {

namespace {

const term_name POSITIONS[] = {SUBJECT, PREDICATE, OBJECT, GRAPH};

bool isBound(const Term &term, term_name name) {
    return !term.isVariable() && !(name == GRAPH && term.isDefaultGraph());
}

} // namespace

PatternBuilder::PatternBuilder(SecurityFilterProvider security_filters, std::shared_ptr<spdlog::logger> logger)
    : security_filters_(std::move(security_filters)), logger_(std::move(logger)) {}

void PatternBuilder::applySecurityFilters_(QuintPattern &pattern) const {
    if (!security_filters_) return;
    auto filters = security_filters_();
    if (!filters) return;
    for (auto name : POSITIONS) {
        if (filters->at(name) && !pattern.at(name)) {
            pattern.at(name) = filters->at(name);
        }
    }
}

QuintPattern PatternBuilder::buildBasePattern(const TriplePattern &pattern) const {
    QuintPattern quint_pattern;
    for (auto name : POSITIONS) {
        const Term &term = pattern.at(name);
        if (isBound(term, name)) {
            quint_pattern.at(name) = TermMatch(term);
        }
    }
    applySecurityFilters_(quint_pattern);
    return quint_pattern;
}

QuintPattern PatternBuilder::buildQuintPattern(const TriplePattern &pattern, const PushdownFilters &filters) const {
    QuintPattern quint_pattern = buildBasePattern(pattern);
    for (auto name : POSITIONS) {
        const Term &term = pattern.at(name);
        if (!term.isVariable()) continue;
        auto it = filters.find(term.value());
        if (it == filters.end()) continue;

        auto &slot = quint_pattern.at(name);
        if (!slot) {
            slot = TermMatch(it->second);
        } else if (!slot->isConcrete()) {
            slot->operators().merge(it->second);
        } else {
            logger_->debug("[pattern builder] filter on ?{} dropped, {} is bound", term.value(), termNameToString(name));
        }
    }
    return quint_pattern;
}

QuintPattern PatternBuilder::buildExistsPattern(const TriplePattern &pattern, const Binding &binding) const {
    QuintPattern quint_pattern;
    for (auto name : POSITIONS) {
        Term term = pattern.at(name);
        if (term.isVariable()) {
            auto it = binding.find(term.value());
            if (it == binding.end()) continue;
            term = it->second;
        }
        if (isBound(term, name)) {
            quint_pattern.at(name) = TermMatch(term);
        }
    }
    applySecurityFilters_(quint_pattern);
    return quint_pattern;
}

void PatternBuilder::excludeDefaultGraph(QuintPattern &pattern) {
    if (!pattern.graph) {
        TermOperators ops;
        ops.ne = Term::defaultGraph();
        pattern.graph = TermMatch(ops);
    } else if (!pattern.graph->isConcrete() && !pattern.graph->operators().ne) {
        pattern.graph->operators().ne = Term::defaultGraph();
    }
}

} // namespace quint
