/*
 * @FileName   : sql_builder.hpp
 * @CreateAt   : 2026/9/17
 * @Description: Accumulates SQL text and its bound parameters side by side.
 *               `param()` writes the placeholder and records the value in the same call,
 *               so the parameter list can never drift from the placeholders.
 */

#ifndef QUINT_SQL_BUILDER_HPP
#define QUINT_SQL_BUILDER_HPP

#include <string>
#include <vector>

#include "database/sql_executor.hpp"

namespace quint {

class SqlBuilder {
public:
    SqlBuilder() = default;
    explicit SqlBuilder(const std::string &text) : text_(text) {}

    /* raw SQL, only for identifiers and keywords from a fixed internal set */
    SqlBuilder &sql(const std::string &text) {
        text_ += text;
        return *this;
    }

    SqlBuilder &param(const SqlParam &value) {
        text_ += "?";
        params_.emplace_back(value);
        return *this;
    }

    /* `?, ?, ?` for each value */
    SqlBuilder &paramList(const std::vector<SqlParam> &values) {
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) text_ += ", ";
            param(values[i]);
        }
        return *this;
    }

    SqlBuilder &append(const SqlBuilder &other) {
        text_ += other.text_;
        params_.insert(params_.end(), other.params_.begin(), other.params_.end());
        return *this;
    }

    /* join non-empty fragments with `separator` */
    static SqlBuilder join(const std::vector<SqlBuilder> &parts, const std::string &separator) {
        SqlBuilder joined;
        bool first = true;
        for (const auto &part : parts) {
            if (part.empty()) continue;
            if (!first) joined.sql(separator);
            joined.append(part);
            first = false;
        }
        return joined;
    }

    bool empty() const { return text_.empty(); }
    const std::string &text() const { return text_; }
    const SqlParams &params() const { return params_; }

    SqlStatement build() const { return SqlStatement{text_, params_}; }

private:
    std::string text_;
    SqlParams params_;
};

} // namespace quint

#endif //QUINT_SQL_BUILDER_HPP
