/*
 * @FileName   : pattern.hpp
 * @CreateAt   : 2026/9/16
 * @Description: Declarative match patterns over the quints table.
 *               A pattern maps each of subject / predicate / object / graph to an optional
 *               `TermMatch`, which is either a concrete term (exact match) or a set of
 *               operators ANDed together. Absent fields match anything.
 */

#ifndef QUINT_PATTERN_HPP
#define QUINT_PATTERN_HPP

#include <map>
#include <string>
#include <vector>
#include <optional>

#include "common/type.hpp"

namespace quint {

/*
 * Right-hand side of an operator: a term (encoded the way its column is encoded),
 * a number (compared through the sortable numeric key on the object column), or a
 * raw string already in stored form.
 */
class OperatorValue {
public:
    enum value_kind {
        TERM_VALUE,
        NUMBER_VALUE,
        RAW_VALUE,
    };

    OperatorValue(const Term &term) : kind_(TERM_VALUE), term_(term), number_(0) {}
    OperatorValue(double number) : kind_(NUMBER_VALUE), number_(number) {}
    OperatorValue(int number) : kind_(NUMBER_VALUE), number_(number) {}
    OperatorValue(long long number) : kind_(NUMBER_VALUE), number_(static_cast<double>(number)) {}
    OperatorValue(const std::string &raw) : kind_(RAW_VALUE), number_(0), raw_(raw) {}
    OperatorValue(const char *raw) : kind_(RAW_VALUE), number_(0), raw_(raw) {}

    value_kind kind() const { return kind_; }
    const Term &term() const { return term_; }
    double number() const { return number_; }
    const std::string &raw() const { return raw_; }

    bool operator==(const OperatorValue &other) const {
        return kind_ == other.kind_ && term_ == other.term_ && number_ == other.number_ && raw_ == other.raw_;
    }

private:
    value_kind kind_;
    Term term_;
    double number_;
    std::string raw_;
};

/* all present operators must hold */
struct TermOperators {
    std::optional<OperatorValue> eq;
    std::optional<OperatorValue> ne;
    std::optional<OperatorValue> gt;
    std::optional<OperatorValue> gte;
    std::optional<OperatorValue> lt;
    std::optional<OperatorValue> lte;
    std::optional<std::vector<OperatorValue>> in;
    std::optional<std::vector<OperatorValue>> not_in;
    std::optional<std::string> starts_with;
    std::optional<std::string> ends_with;
    std::optional<std::string> contains;
    std::optional<std::string> regex;
    std::optional<bool> is_null;

    bool empty() const;

    /* union of the keys, the operators of `other` win on conflict */
    void merge(const TermOperators &other);
};

class TermMatch {
public:
    enum match_kind {
        CONCRETE,
        OPERATORS,
    };

    TermMatch(const Term &term) : kind_(CONCRETE), term_(term) {}
    TermMatch(const TermOperators &operators) : kind_(OPERATORS), operators_(operators) {}

    match_kind kind() const { return kind_; }
    bool isConcrete() const { return kind_ == CONCRETE; }

    const Term &term() const { return term_; }
    const TermOperators &operators() const { return operators_; }
    TermOperators &operators() { return operators_; }

private:
    match_kind kind_;
    Term term_;
    TermOperators operators_;
};

struct QuintPattern {
    std::optional<TermMatch> subject;
    std::optional<TermMatch> predicate;
    std::optional<TermMatch> object;
    std::optional<TermMatch> graph;

    std::optional<TermMatch> &at(term_name name);
    const std::optional<TermMatch> &at(term_name name) const;

    bool hasRegex() const;
};

struct QueryOptions {
    std::optional<size_t> limit;
    std::optional<size_t> offset;
    std::vector<term_name> order;
    bool reverse = false;
};

/* projection of one column of one joined pattern, returned under `alias` */
struct CompoundSelect {
    size_t pattern;
    term_name field;
    std::string alias;
};

/*
 * N patterns sharing the value of `join_on` inside the same graph, evaluated as one
 * SQL self-join. Without explicit `select`, every pattern projects its object and
 * predicate as `p<i>_object` / `p<i>_predicate`.
 */
struct CompoundPattern {
    std::vector<QuintPattern> patterns;
    term_name join_on = SUBJECT;
    std::vector<CompoundSelect> select;
};

struct CompoundResult {
    Term join_value;
    std::map<std::string, Term> bindings;
    /* only filled by the single pattern shortcut */
    QuintList quints;
};

using CompoundResultList = std::vector<CompoundResult>;

} // namespace quint

#endif //QUINT_PATTERN_HPP
