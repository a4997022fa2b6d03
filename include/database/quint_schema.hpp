/*
 * @FileName   : quint_schema.hpp
 * @CreateAt   : 2026/9/17
 * @Description: The single `quints` table and its six covering indexes.
 *               Every leading prefix of bound columns is the leading prefix of one index,
 *               so any 1 to 4 bound fields is answered by an index range scan.
 */

#ifndef QUINT_QUINT_SCHEMA_HPP
#define QUINT_QUINT_SCHEMA_HPP

#include <string>
#include <vector>

#include "common/type.hpp"
#include "database/sql_executor.hpp"

namespace quint {

class QuintSchema {
public:
    static const char *TABLE;
    static const char *VECTOR_COLUMN;

    /* column name of a quad position */
    static const char *column(term_name name);

    /* PostgreSQL text columns use the C collation so that byte order drives range scans */
    static std::string createTableSql(sql_dialect dialect = SQLITE_DIALECT);
    static std::vector<std::string> createIndexSql();

    /* create-if-not-exists for the table and every index */
    static void ensure(SqlExecutor &executor);
};

} // namespace quint

#endif //QUINT_QUINT_SCHEMA_HPP
