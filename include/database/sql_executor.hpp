/*
 * @FileName   : sql_executor.hpp
 * @CreateAt   : 2026/9/17
 * @Description: The narrow interface a SQL engine offers to the quint store.
 *               Generated SQL always uses `?` placeholders, an executor rewrites them
 *               into its own syntax. Every failure is raised as `SqlError`.
 */

#ifndef QUINT_SQL_EXECUTOR_HPP
#define QUINT_SQL_EXECUTOR_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <unordered_map>

namespace quint {

class SqlParam {
public:
    enum param_type {
        TEXT,
        INTEGER,
        NULL_VALUE,
    };

    SqlParam() : type_(NULL_VALUE), integer_(0) {}
    SqlParam(const std::string &text) : type_(TEXT), text_(text), integer_(0) {}
    SqlParam(const char *text) : type_(TEXT), text_(text), integer_(0) {}
    SqlParam(int64_t integer) : type_(INTEGER), integer_(integer) {}

    static SqlParam null() { return SqlParam(); }

    param_type type() const { return type_; }
    const std::string &text() const { return text_; }
    int64_t integer() const { return integer_; }

    /* text form handed to engines that bind everything as text */
    std::string toText() const {
        return type_ == INTEGER ? std::to_string(integer_) : text_;
    }

    bool operator==(const SqlParam &other) const {
        return type_ == other.type_ && text_ == other.text_ && integer_ == other.integer_;
    }

private:
    param_type type_;
    std::string text_;
    int64_t integer_;
};

using SqlParams = std::vector<SqlParam>;

struct SqlValue {
    bool is_null = true;
    std::string text;
};

/* column name -> value */
using SqlRow = std::unordered_map<std::string, SqlValue>;
using SqlRows = std::vector<SqlRow>;

struct SqlStatement {
    std::string sql;
    SqlParams params;
};

enum sql_dialect {
    SQLITE_DIALECT,
    POSTGRES_DIALECT,
};

class SqlExecutor {
public:
    virtual ~SqlExecutor() = default;

    /* run a statement returning rows */
    virtual SqlRows query(const std::string &sql, const SqlParams &params) = 0;

    /* run a data modifying statement, return the number of affected rows */
    virtual size_t execute(const std::string &sql, const SqlParams &params) = 0;

    /* all statements commit together or none does, the first failure is rethrown */
    virtual void executeInTransaction(const std::vector<SqlStatement> &statements) = 0;

    /* parameterless DDL */
    virtual void exec(const std::string &sql) = 0;

    virtual sql_dialect dialect() const = 0;

    /* release the connection(s), later calls fail */
    virtual void close() = 0;
};

} // namespace quint

#endif //QUINT_SQL_EXECUTOR_HPP
