/*
 * @FileName   : quint_schema.cpp
 * @CreateAt   : 2026/9/17
 * @Description: implement `QuintSchema`
 */

#include "database/quint_schema.hpp"

namespace quint {

const char *QuintSchema::TABLE = "quints";
const char *QuintSchema::VECTOR_COLUMN = "vector";

const char *QuintSchema::column(term_name name) {
    return termNameToString(name);
}

std::string QuintSchema::createTableSql(sql_dialect dialect) {
    std::string text = dialect == POSTGRES_DIALECT ? "TEXT COLLATE \"C\"" : "TEXT";
    return "CREATE TABLE IF NOT EXISTS quints ("
           "graph " + text + " NOT NULL, "
           "subject " + text + " NOT NULL, "
           "predicate " + text + " NOT NULL, "
           "object " + text + " NOT NULL, "
           "vector TEXT, "
           "PRIMARY KEY (graph, subject, predicate, object))";
}

std::vector<std::string> QuintSchema::createIndexSql() {
    return {
        "CREATE INDEX IF NOT EXISTS idx_spog ON quints (subject, predicate, object, graph)",
        "CREATE INDEX IF NOT EXISTS idx_ogsp ON quints (object, graph, subject, predicate)",
        "CREATE INDEX IF NOT EXISTS idx_gspo ON quints (graph, subject, predicate, object)",
        "CREATE INDEX IF NOT EXISTS idx_sopg ON quints (subject, object, predicate, graph)",
        "CREATE INDEX IF NOT EXISTS idx_pogs ON quints (predicate, object, graph, subject)",
        "CREATE INDEX IF NOT EXISTS idx_gpos ON quints (graph, predicate, object, subject)",
    };
}

void QuintSchema::ensure(SqlExecutor &executor) {
    executor.exec(createTableSql(executor.dialect()));
    // one statement per call, not every engine accepts a script
    for (const auto &sql : createIndexSql()) {
        executor.exec(sql);
    }
}

} // namespace quint
