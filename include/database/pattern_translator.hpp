/*
 * @FileName   : pattern_translator.hpp
 * @CreateAt   : 2026/9/17
 * @Description: Compiles a `QuintPattern` into a parameterized SQL condition.
 *               A concrete term becomes `column = ?`, every operator of an operator set
 *               compiles on its own and all of them are ANDed. Values always travel as
 *               bound parameters; column names and aliases come from a fixed set.
 *
 *               Operator values are encoded the way the column stores them. On the object
 *               column an ordering operator ($gt, $gte, $lt, $lte) against a numeric or
 *               dateTime value compares with the sortable prefix only; $gt and $lte append
 *               SEP + U+FFFF so that the bound lies after every key sharing the prefix.
 *
 *               `$regex` is not expressible portably in SQL. The translator emits an index
 *               range for its literal prefix (after a leading `^`) and the caller checks
 *               `regexFilters()` on every fetched row.
 */

#ifndef QUINT_PATTERN_TRANSLATOR_HPP
#define QUINT_PATTERN_TRANSLATOR_HPP

#include <regex>
#include <string>
#include <vector>

#include "database/pattern.hpp"
#include "database/sql_builder.hpp"

namespace quint {

class PatternTranslator {
public:
    enum value_op {
        OP_EQ,
        OP_NE,
        OP_GT,
        OP_GTE,
        OP_LT,
        OP_LTE,
        OP_IN,
        OP_NOT_IN,
    };

    struct RegexFilter {
        term_name field;
        std::string source;
        std::regex regex;
    };

    /*
     * Conditions of `pattern` joined with AND, empty when nothing is constrained.
     * A non-empty `alias` qualifies every column (`q1.subject`), which is how compound
     * patterns are compiled; `$regex` is rejected there with std::invalid_argument.
     */
    static SqlBuilder conditions(const QuintPattern &pattern, const std::string &alias = "");

    /* " WHERE <conditions>" or nothing */
    static SqlBuilder whereClause(const QuintPattern &pattern);

    /* stored form of a concrete term in `field` */
    static std::string encodeField(const Term &term, term_name field);

    static SqlParam encodeValue(const OperatorValue &value, term_name field, value_op op);

    /* literal prefix of an anchored regex (`^abc.*` -> `abc`), empty if there is none */
    static std::string regexPrefix(const std::string &regex);

    /* the $regex operators of `pattern`, compiled with ECMAScript syntax */
    static std::vector<RegexFilter> regexFilters(const QuintPattern &pattern);

private:
    static void addConditions_(std::vector<SqlBuilder> &out, const std::string &column,
                               term_name field, const TermMatch &match, bool compound);
};

} // namespace quint

#endif //QUINT_PATTERN_TRANSLATOR_HPP
