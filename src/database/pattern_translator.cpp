/*
 * @FileName   : pattern_translator.cpp
 * @CreateAt   : 2026/9/17
 * @Description: implement `PatternTranslator`
 */

#include "database/pattern_translator.hpp"

#include <cmath>
#include <cctype>
#include <cstring>
#include <cstdint>
#include <stdexcept>

#include <fmt/format.h>

#include "codec/term_codec.hpp"
#include "database/quint_schema.hpp"

namespace quint {

namespace {

const term_name FIELD_ORDER[] = {GRAPH, SUBJECT, PREDICATE, OBJECT};

bool isOrdering(PatternTranslator::value_op op) {
    return op == PatternTranslator::OP_GT || op == PatternTranslator::OP_GTE
        || op == PatternTranslator::OP_LT || op == PatternTranslator::OP_LTE;
}

bool needsUpperSuffix(PatternTranslator::value_op op) {
    return op == PatternTranslator::OP_GT || op == PatternTranslator::OP_LTE;
}

bool startsWith(const std::string &str, const std::string &prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

std::string formatNumber(double value) {
    if (std::floor(value) == value && std::fabs(value) < 1e15) {
        return fmt::format("{}", static_cast<int64_t>(value));
    }
    return fmt::format("{}", value);
}

/* LIKE operand matching `text` literally, used with ESCAPE '\' */
std::string escapeLike(const std::string &text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        if (c == '\\' || c == '%' || c == '_') {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

/* drop the last UTF-8 code point */
void popCodePoint(std::string &str) {
    while (!str.empty() && (static_cast<unsigned char>(str.back()) & 0xC0) == 0x80) {
        str.pop_back();
    }
    if (!str.empty()) {
        str.pop_back();
    }
}

SqlBuilder comparison(const std::string &column, const char *op, const SqlParam &value) {
    SqlBuilder builder;
    builder.sql(column).sql(" ").sql(op).sql(" ").param(value);
    return builder;
}

SqlBuilder prefixRange(const std::string &column, const std::string &prefix) {
    SqlBuilder builder;
    builder.sql(column).sql(" >= ").param(prefix)
           .sql(" AND ").sql(column).sql(" < ").param(prefix + TermCodec::MAX_CHAR);
    return builder;
}

} // namespace

std::string PatternTranslator::encodeField(const Term &term, term_name field) {
    return field == OBJECT ? TermCodec::encodeObject(term) : TermCodec::encodeTerm(term);
}

SqlParam PatternTranslator::encodeValue(const OperatorValue &value, term_name field, value_op op) {
    switch (value.kind()) {
        case OperatorValue::TERM_VALUE: {
            std::string prefix;
            if (field == OBJECT && isOrdering(op) && TermCodec::sortablePrefix(value.term(), prefix)) {
                return needsUpperSuffix(op) ? prefix + TermCodec::SEP + TermCodec::MAX_CHAR : prefix;
            }
            return encodeField(value.term(), field);
        }
        case OperatorValue::NUMBER_VALUE: {
            if (field != OBJECT) {
                return formatNumber(value.number());
            }
            if (!isOrdering(op)) {
                bool integral = std::floor(value.number()) == value.number();
                Term literal = Term::typedLiteral(formatNumber(value.number()),
                                                  integral ? xsd::INTEGER : xsd::DECIMAL);
                return TermCodec::encodeObject(literal);
            }
            std::string prefix = TermCodec::numericPrefix(value.number());
            return needsUpperSuffix(op) ? prefix + TermCodec::SEP + TermCodec::MAX_CHAR : prefix;
        }
        case OperatorValue::RAW_VALUE: {
            const std::string &raw = value.raw();
            if (field == OBJECT && !startsWith(raw, "N" + TermCodec::SEP)
                && !startsWith(raw, "D" + TermCodec::SEP) && !startsWith(raw, "\"")) {
                return "\"" + raw + "\"";
            }
            return raw;
        }
    }
    return value.raw();
}

std::string PatternTranslator::regexPrefix(const std::string &regex) {
    if (regex.empty() || regex[0] != '^' || regex.find('|') != std::string::npos) {
        return "";
    }

    std::string prefix;
    size_t i = 1;
    for (; i < regex.size(); ++i) {
        char c = regex[i];
        if (c == '\\') {
            // escaped punctuation is literal, `\d` and friends are classes
            if (i + 1 < regex.size() && !std::isalnum(static_cast<unsigned char>(regex[i + 1]))) {
                prefix += regex[++i];
                continue;
            }
            break;
        }
        if (std::strchr(".^$|?*+()[]{}", c) != nullptr) {
            break;
        }
        prefix += c;
    }
    // a quantifier allowing zero repetitions makes the last character optional
    if (i < regex.size() && std::strchr("?*{", regex[i]) != nullptr) {
        popCodePoint(prefix);
    }
    return prefix;
}

std::vector<PatternTranslator::RegexFilter> PatternTranslator::regexFilters(const QuintPattern &pattern) {
    std::vector<RegexFilter> filters;
    for (auto field : FIELD_ORDER) {
        const auto &match = pattern.at(field);
        if (match && !match->isConcrete() && match->operators().regex) {
            const std::string &source = *match->operators().regex;
            filters.push_back(RegexFilter{field, source, std::regex(source, std::regex::ECMAScript)});
        }
    }
    return filters;
}

void PatternTranslator::addConditions_(std::vector<SqlBuilder> &out, const std::string &column,
                                       term_name field, const TermMatch &match, bool compound) {
    if (match.isConcrete()) {
        out.emplace_back(comparison(column, "=", encodeField(match.term(), field)));
        return;
    }

    const TermOperators &ops = match.operators();

    if (ops.eq) out.emplace_back(comparison(column, "=", encodeValue(*ops.eq, field, OP_EQ)));
    if (ops.ne) out.emplace_back(comparison(column, "!=", encodeValue(*ops.ne, field, OP_NE)));
    if (ops.gt) out.emplace_back(comparison(column, ">", encodeValue(*ops.gt, field, OP_GT)));
    if (ops.gte) out.emplace_back(comparison(column, ">=", encodeValue(*ops.gte, field, OP_GTE)));
    if (ops.lt) out.emplace_back(comparison(column, "<", encodeValue(*ops.lt, field, OP_LT)));
    if (ops.lte) out.emplace_back(comparison(column, "<=", encodeValue(*ops.lte, field, OP_LTE)));

    if (ops.in) {
        SqlBuilder builder;
        if (ops.in->empty()) {
            // an empty set admits nothing
            builder.sql("1 = 0");
        } else {
            std::vector<SqlParam> values;
            for (const auto &value : *ops.in) {
                values.emplace_back(encodeValue(value, field, OP_IN));
            }
            builder.sql(column).sql(" IN (").paramList(values).sql(")");
        }
        out.emplace_back(builder);
    }
    if (ops.not_in && !ops.not_in->empty()) {
        std::vector<SqlParam> values;
        for (const auto &value : *ops.not_in) {
            values.emplace_back(encodeValue(value, field, OP_NOT_IN));
        }
        SqlBuilder builder;
        builder.sql(column).sql(" NOT IN (").paramList(values).sql(")");
        out.emplace_back(builder);
    }

    if (ops.starts_with) {
        out.emplace_back(prefixRange(column, *ops.starts_with));
    }
    if (ops.ends_with) {
        SqlBuilder builder;
        builder.sql(column).sql(" LIKE ").param("%" + escapeLike(*ops.ends_with)).sql(" ESCAPE '\\'");
        out.emplace_back(builder);
    }
    if (ops.contains) {
        SqlBuilder builder;
        builder.sql(column).sql(" LIKE ").param("%" + escapeLike(*ops.contains) + "%").sql(" ESCAPE '\\'");
        out.emplace_back(builder);
    }

    if (ops.regex) {
        if (compound) {
            throw std::invalid_argument("$regex is not supported in compound patterns");
        }
        std::string prefix = regexPrefix(*ops.regex);
        if (!prefix.empty()) {
            out.emplace_back(prefixRange(column, prefix));
        }
    }

    if (ops.is_null) {
        SqlBuilder builder;
        builder.sql(column).sql(*ops.is_null ? " IS NULL" : " IS NOT NULL");
        out.emplace_back(builder);
    }
}

SqlBuilder PatternTranslator::conditions(const QuintPattern &pattern, const std::string &alias) {
    std::vector<SqlBuilder> parts;
    for (auto field : FIELD_ORDER) {
        const auto &match = pattern.at(field);
        if (!match) continue;
        std::string column = alias.empty()
                ? std::string(QuintSchema::column(field))
                : alias + "." + QuintSchema::column(field);
        addConditions_(parts, column, field, *match, !alias.empty());
    }
    return SqlBuilder::join(parts, " AND ");
}

SqlBuilder PatternTranslator::whereClause(const QuintPattern &pattern) {
    SqlBuilder where;
    SqlBuilder conds = conditions(pattern);
    if (!conds.empty()) {
        where.sql(" WHERE ").append(conds);
    }
    return where;
}

} // namespace quint
