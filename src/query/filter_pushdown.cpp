/*
 * @FileName   : filter_pushdown.cpp
 * @CreateAt   : 2026/9/23
 * @Description: implement FilterPushdownExtractor
 */

#include "query/filter_pushdown.hpp"

#include <cctype>

#include <boost/algorithm/string.hpp>

#include "codec/term_codec.hpp"

namespace quint {

namespace {

std::optional<std::string> variableOf(const ExpressionPtr &expr) {
    if (expr && expr->isVariable()) return expr->term.value();
    return std::nullopt;
}

/* `?x` or `STR(?x)` */
std::optional<std::string> strVariableOf(const ExpressionPtr &expr) {
    if (auto variable = variableOf(expr)) return variable;
    if (expr && expr->isOperator("str") && expr->args.size() == 1) {
        return variableOf(expr->args[0]);
    }
    return std::nullopt;
}

std::optional<Term> literalOf(const ExpressionPtr &expr) {
    if (expr && expr->type == Expression::TERM_EXPR && expr->term.isLiteral()) return expr->term;
    return std::nullopt;
}

/* any bound term: IRI, blank node or literal */
std::optional<Term> concreteOf(const ExpressionPtr &expr) {
    if (expr && expr->type == Expression::TERM_EXPR && !expr->term.isVariable()) return expr->term;
    return std::nullopt;
}

std::string reverseComparison(const std::string &op) {
    if (op == "<") return ">";
    if (op == ">") return "<";
    if (op == "<=") return ">=";
    if (op == ">=") return "<=";
    return op;
}

void setComparison(TermOperators &ops, const std::string &op, const Term &value) {
    if (op == "=") ops.eq = value;
    else if (op == "!=") ops.ne = value;
    else if (op == "<") ops.lt = value;
    else if (op == ">") ops.gt = value;
    else if (op == "<=") ops.lte = value;
    else ops.gte = value;
}

/* case insensitive language range, `en` also matches `en-US` */
std::string languageRegex(const std::string &range) {
    std::string regex = "\"@";
    for (char ch : range) {
        if (std::isalpha(static_cast<unsigned char>(ch))) {
            regex += "[";
            regex += static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            regex += static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            regex += "]";
        } else if (std::isdigit(static_cast<unsigned char>(ch)) || ch == '-') {
            regex += ch;
        }
    }
    return regex + "(-[A-Za-z0-9]+)*$";
}

PushdownFilters single(const std::string &variable, const TermOperators &ops) {
    PushdownFilters filters;
    filters[variable] = ops;
    return filters;
}

bool onlyEquality(const TermOperators &ops) {
    TermOperators rest = ops;
    rest.eq.reset();
    return ops.eq.has_value() && rest.empty();
}

} // namespace

bool FilterPushdownExtractor::isVariableInPattern(const std::string &variable, const TriplePattern &pattern) {
    for (auto name : {SUBJECT, PREDICATE, OBJECT, GRAPH}) {
        const Term &term = pattern.at(name);
        if (term.isVariable() && term.value() == variable) return true;
    }
    return false;
}

PushdownResult FilterPushdownExtractor::extract(const ExpressionPtr &expr, const TriplePattern &pattern) {
    PushdownResult result;
    if (!expr || expr->type != Expression::OPERATOR_EXPR) {
        result.remainder = expr;
        return result;
    }

    if (expr->op == "&&") {
        std::vector<ExpressionPtr> remainders;
        for (const auto &arg : expr->args) {
            auto part = extract(arg, pattern);
            for (const auto &entry : part.filters) {
                result.filters[entry.first].merge(entry.second);
            }
            if (part.remainder) remainders.push_back(part.remainder);
            // a nested disjunction stays a condition to evaluate
            if (!part.or_branches.empty()) remainders.push_back(arg);
        }
        if (remainders.size() == 1) {
            result.remainder = remainders.front();
        } else if (remainders.size() > 1) {
            result.remainder = Expression::makeOperator("&&", remainders);
        }
        return result;
    }

    if (expr->op == "||") {
        return extractOr_(expr, pattern);
    }

    if (auto filters = extractSingle(expr, pattern)) {
        result.filters = std::move(*filters);
    } else {
        result.remainder = expr;
    }
    return result;
}

PushdownResult FilterPushdownExtractor::extractOr_(const ExpressionPtr &expr, const TriplePattern &pattern) {
    std::vector<ExpressionPtr> branches;
    std::vector<ExpressionPtr> stack{expr};
    while (!stack.empty()) {
        auto current = stack.back();
        stack.pop_back();
        if (current->isOperator("||")) {
            // keep the written order of the alternatives
            for (auto it = current->args.rbegin(); it != current->args.rend(); ++it) stack.push_back(*it);
        } else {
            branches.push_back(current);
        }
    }

    PushdownResult result;
    std::vector<PushdownFilters> pushable;
    for (const auto &branch : branches) {
        auto filters = extractSingle(branch, pattern);
        if (filters && !filters->empty()) {
            pushable.push_back(std::move(*filters));
        } else {
            result.or_remainder.push_back(branch);
        }
    }

    if (pushable.empty()) {
        result.or_remainder.clear();
        result.remainder = expr;
        return result;
    }
    if (result.or_remainder.empty()) {
        if (auto in = convertToIn_(pushable)) {
            result.filters = std::move(*in);
            return result;
        }
    }
    result.or_branches = std::move(pushable);
    return result;
}

std::optional<PushdownFilters> FilterPushdownExtractor::convertToIn_(const std::vector<PushdownFilters> &branches) {
    std::string variable;
    std::vector<OperatorValue> values;
    for (const auto &filters : branches) {
        if (filters.size() != 1) return std::nullopt;
        const auto &entry = *filters.begin();
        if (!onlyEquality(entry.second)) return std::nullopt;
        if (!variable.empty() && variable != entry.first) return std::nullopt;
        variable = entry.first;
        values.push_back(*entry.second.eq);
    }
    TermOperators ops;
    ops.in = std::move(values);
    return single(variable, ops);
}

std::optional<PushdownFilters> FilterPushdownExtractor::extractComparison_(const Expression &expr,
                                                                           const TriplePattern &pattern) {
    const auto &left = expr.args[0];
    const auto &right = expr.args[1];
    bool equality = expr.op == "=" || expr.op == "!=";

    std::optional<std::string> variable;
    std::optional<Term> value;
    std::string op = expr.op;
    if ((variable = variableOf(left)) && (value = equality ? concreteOf(right) : literalOf(right))) {
        // ?x op value
    } else if ((variable = variableOf(right)) && (value = equality ? concreteOf(left) : literalOf(left))) {
        op = reverseComparison(op);
    } else {
        return std::nullopt;
    }
    if (!isVariableInPattern(*variable, pattern)) return std::nullopt;

    TermOperators ops;
    setComparison(ops, op, *value);
    return single(*variable, ops);
}

std::optional<PushdownFilters> FilterPushdownExtractor::extractSingle(const ExpressionPtr &expr,
                                                                      const TriplePattern &pattern) {
    if (!expr || expr->type != Expression::OPERATOR_EXPR) return std::nullopt;
    const std::string &op = expr->op;
    const auto &args = expr->args;
    TermOperators ops;

    if ((op == "=" || op == "!=" || op == "<" || op == ">" || op == "<=" || op == ">=") && args.size() == 2) {
        return extractComparison_(*expr, pattern);
    }

    if ((op == "strstarts" || op == "strends" || op == "contains") && args.size() == 2) {
        auto variable = strVariableOf(args[0]);
        auto value = literalOf(args[1]);
        if (!variable || !value || value->value().empty() || !isVariableInPattern(*variable, pattern)) {
            return std::nullopt;
        }
        // plain literals are stored between double quotes
        if (op == "strstarts") ops.starts_with = "\"" + value->value();
        else if (op == "strends") ops.ends_with = value->value() + "\"";
        else ops.contains = value->value();
        return single(*variable, ops);
    }

    // flags would change the meaning of the stored string match
    if (op == "regex" && args.size() == 2) {
        auto variable = strVariableOf(args[0]);
        auto value = literalOf(args[1]);
        if (!variable || !value || value->value().empty() || !isVariableInPattern(*variable, pattern)) {
            return std::nullopt;
        }
        ops.regex = value->value();
        return single(*variable, ops);
    }

    if ((op == "in" || op == "notin") && !args.empty()) {
        auto variable = variableOf(args[0]);
        if (!variable || !isVariableInPattern(*variable, pattern) || args.size() < 2) return std::nullopt;
        std::vector<OperatorValue> values;
        for (size_t i = 1; i < args.size(); ++i) {
            auto value = concreteOf(args[i]);
            if (!value) return std::nullopt;
            values.emplace_back(*value);
        }
        if (op == "in") ops.in = std::move(values);
        else ops.not_in = std::move(values);
        return single(*variable, ops);
    }

    if (op == "bound" && args.size() == 1) {
        auto variable = variableOf(args[0]);
        if (!variable || !isVariableInPattern(*variable, pattern)) return std::nullopt;
        ops.is_null = false;
        return single(*variable, ops);
    }

    if (op == "!" && args.size() == 1 && args[0]->isOperator("bound") && args[0]->args.size() == 1) {
        auto variable = variableOf(args[0]->args[0]);
        if (!variable || !isVariableInPattern(*variable, pattern)) return std::nullopt;
        ops.is_null = true;
        return single(*variable, ops);
    }

    if ((op == "isiri" || op == "isuri" || op == "isblank" || op == "isliteral" || op == "isnumeric")
        && args.size() == 1) {
        auto variable = variableOf(args[0]);
        if (!variable || !isVariableInPattern(*variable, pattern)) return std::nullopt;
        if (op == "isiri" || op == "isuri") {
            ops.starts_with = "http";
        } else if (op == "isblank") {
            ops.starts_with = "_:";
        } else if (op == "isliteral") {
            ops.regex = "^[\"ND]";
        } else {
            ops.starts_with = "N" + TermCodec::SEP;
        }
        return single(*variable, ops);
    }

    // LANGMATCHES(LANG(?x), "range")
    if (op == "langmatches" && args.size() == 2 && args[0]->isOperator("lang") && args[0]->args.size() == 1) {
        auto variable = variableOf(args[0]->args[0]);
        auto range = literalOf(args[1]);
        if (!variable || !range || !isVariableInPattern(*variable, pattern)) return std::nullopt;
        if (range->value() == "*") {
            ops.regex = "\"@[A-Za-z]+(-[A-Za-z0-9]+)*$";
        } else {
            ops.regex = languageRegex(boost::algorithm::to_lower_copy(range->value()));
        }
        return single(*variable, ops);
    }

    return std::nullopt;
}

} // namespace quint
