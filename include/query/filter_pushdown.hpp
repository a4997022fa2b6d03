/*
 * @FileName   : filter_pushdown.hpp
 * @CreateAt   : 2026/9/23
 * @Description: Derives store operators from a FILTER expression for one triple pattern.
 *               Only conditions on a variable that occurs in the pattern are pushed; the
 *               values are expressed against the stored encoding (plain literals are
 *               stored as `"lexical"`, numeric ones as `N\0...`).
 */

#ifndef QUINT_FILTER_PUSHDOWN_HPP
#define QUINT_FILTER_PUSHDOWN_HPP

#include <map>
#include <string>
#include <vector>
#include <optional>

#include "database/pattern.hpp"
#include "parser/algebra.hpp"

namespace quint {

/* variable name (without '?') -> operators on the column the variable occupies */
using PushdownFilters = std::map<std::string, TermOperators>;

struct PushdownResult {
    PushdownFilters filters;
    /* what still has to be evaluated, null when everything was pushed */
    ExpressionPtr remainder;
    /* alternatives of a disjunction that could not become `$in`, one query each */
    std::vector<PushdownFilters> or_branches;
    /* alternatives of that disjunction which cannot be pushed */
    std::vector<ExpressionPtr> or_remainder;
};

class FilterPushdownExtractor {
public:
    /* `&&` is split and merged per variable, `||` goes through `$in` or OR branches */
    static PushdownResult extract(const ExpressionPtr &expr, const TriplePattern &pattern);

    /* a single condition, nullopt when it cannot be pushed */
    static std::optional<PushdownFilters> extractSingle(const ExpressionPtr &expr, const TriplePattern &pattern);

    static bool isVariableInPattern(const std::string &variable, const TriplePattern &pattern);

private:
    static PushdownResult extractOr_(const ExpressionPtr &expr, const TriplePattern &pattern);
    static std::optional<PushdownFilters> convertToIn_(const std::vector<PushdownFilters> &branches);
    static std::optional<PushdownFilters> extractComparison_(const Expression &expr, const TriplePattern &pattern);
};

} // namespace quint

#endif //QUINT_FILTER_PUSHDOWN_HPP
