/*
 * @FileName   : store_config.hpp
 * @CreateAt   : 2026/9/19
 * @Description: backend selection and connection settings of a quint store
 */

#ifndef QUINT_STORE_CONFIG_HPP
#define QUINT_STORE_CONFIG_HPP

#include <string>

namespace quint {

struct StoreConfig {
    enum backend_kind {
        SQLITE_BACKEND,
        POSTGRES_BACKEND,
    };

    backend_kind backend = SQLITE_BACKEND;
    /* file path or ":memory:" for SQLite, libpq URI for PostgreSQL */
    std::string location = ":memory:";
    size_t pool_size = 10;
    /* log generated SQL and planner decisions */
    bool debug = false;

    /*
     * `sqlite:<path>`, `sqlite::memory:`, a bare path (SQLite),
     * `postgresql://...` or `postgres://...` (kept verbatim for libpq).
     * Throws std::invalid_argument for an empty endpoint or any other `scheme://`.
     */
    static StoreConfig FromEndpoint(const std::string &endpoint);
};

} // namespace quint

#endif //QUINT_STORE_CONFIG_HPP
