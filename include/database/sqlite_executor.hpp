/*
 * @FileName   : sqlite_executor.hpp
 * @CreateAt   : 2026/9/18
 * @Description: `SqlExecutor` over one SQLite connection. Statements are serialised by a
 *               mutex; a transaction holds it from BEGIN to COMMIT / ROLLBACK.
 */

#ifndef QUINT_SQLITE_EXECUTOR_HPP
#define QUINT_SQLITE_EXECUTOR_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "database/sql_executor.hpp"

namespace quint {

class SqliteExecutor : public SqlExecutor {
public:
    /* `path` is a file path or ":memory:"; the parent directory of a file is created */
    explicit SqliteExecutor(const std::string &path,
                            std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());
    ~SqliteExecutor() override;

    SqlRows query(const std::string &sql, const SqlParams &params) override;
    size_t execute(const std::string &sql, const SqlParams &params) override;
    void executeInTransaction(const std::vector<SqlStatement> &statements) override;
    void exec(const std::string &sql) override;
    sql_dialect dialect() const override { return SQLITE_DIALECT; }
    void close() override;

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace quint

#endif //QUINT_SQLITE_EXECUTOR_HPP
