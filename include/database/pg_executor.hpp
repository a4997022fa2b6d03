/*
 * @FileName   : pg_executor.hpp
 * @CreateAt   : 2026/9/18
 * @Description: `SqlExecutor` over a pool of libpq connections.
 *               `?` placeholders are rewritten to `$1..$n`. PostgreSQL TEXT cannot hold
 *               NUL, so the NUL separator of encoded objects is swapped for U+001F on
 *               the way in and back on the way out; callers never see the difference.
 */

#ifndef QUINT_PG_EXECUTOR_HPP
#define QUINT_PG_EXECUTOR_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "database/sql_executor.hpp"

namespace quint {

class PgExecutor : public SqlExecutor {
public:
    /* `conninfo` is handed to libpq verbatim (URI or key=value form) */
    PgExecutor(const std::string &conninfo, size_t pool_size,
               std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());
    ~PgExecutor() override;

    SqlRows query(const std::string &sql, const SqlParams &params) override;
    size_t execute(const std::string &sql, const SqlParams &params) override;
    void executeInTransaction(const std::vector<SqlStatement> &statements) override;
    void exec(const std::string &sql) override;
    sql_dialect dialect() const override { return POSTGRES_DIALECT; }
    void close() override;

    /* `?` -> `$n` in order of appearance */
    static std::string rewritePlaceholders(const std::string &sql);

    static std::string toPgText(const std::string &text);
    static std::string fromPgText(const std::string &text);

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace quint

#endif //QUINT_PG_EXECUTOR_HPP
