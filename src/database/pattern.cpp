/*
 * @FileName   : pattern.cpp
 * @CreateAt   : 2026/9/16
 * @Description: implement the helpers of the pattern types
 */

#include "database/pattern.hpp"

namespace quint {

bool TermOperators::empty() const {
    return !eq && !ne && !gt && !gte && !lt && !lte && !in && !not_in
        && !starts_with && !ends_with && !contains && !regex && !is_null;
}

void TermOperators::merge(const TermOperators &other) {
    if (other.eq) eq = other.eq;
    if (other.ne) ne = other.ne;
    if (other.gt) gt = other.gt;
    if (other.gte) gte = other.gte;
    if (other.lt) lt = other.lt;
    if (other.lte) lte = other.lte;
    if (other.in) in = other.in;
    if (other.not_in) not_in = other.not_in;
    if (other.starts_with) starts_with = other.starts_with;
    if (other.ends_with) ends_with = other.ends_with;
    if (other.contains) contains = other.contains;
    if (other.regex) regex = other.regex;
    if (other.is_null) is_null = other.is_null;
}

std::optional<TermMatch> &QuintPattern::at(term_name name) {
    switch (name) {
        case SUBJECT:   return subject;
        case PREDICATE: return predicate;
        case OBJECT:    return object;
        case GRAPH:     return graph;
    }
    return graph;
}

const std::optional<TermMatch> &QuintPattern::at(term_name name) const {
    switch (name) {
        case SUBJECT:   return subject;
        case PREDICATE: return predicate;
        case OBJECT:    return object;
        case GRAPH:     return graph;
    }
    return graph;
}

bool QuintPattern::hasRegex() const {
    for (auto name : {SUBJECT, PREDICATE, OBJECT, GRAPH}) {
        const auto &match = at(name);
        if (match && !match->isConcrete() && match->operators().regex) {
            return true;
        }
    }
    return false;
}

} // namespace quint
