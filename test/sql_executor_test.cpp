#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <vector>

#include "common/error.hpp"
#include "database/pg_executor.hpp"
#include "database/sqlite_executor.hpp"

namespace test {

using quint::SqlParam;
using quint::SqlStatement;
using quint::PgExecutor;

class SqliteExecutorTest : public testing::Test {
protected:
    void SetUp() override {
        executor_ = std::make_shared<quint::SqliteExecutor>(":memory:");
        executor_->exec("CREATE TABLE items (name TEXT PRIMARY KEY)");
    }

    void TearDown() override {
        executor_->close();
    }

    size_t countItems() {
        auto rows = executor_->query("SELECT COUNT(*) AS n FROM items", {});
        return std::stoul(rows.at(0).at("n").text);
    }

    static SqlStatement insert(const std::string &name) {
        return {"INSERT INTO items (name) VALUES (?)", {SqlParam(name)}};
    }

    std::shared_ptr<quint::SqliteExecutor> executor_;
};

TEST_F(SqliteExecutorTest, TransactionCommitsEveryStatement) {
    executor_->executeInTransaction({insert("a"), insert("b"), insert("c")});
    EXPECT_EQ(3u, countItems());
}

TEST_F(SqliteExecutorTest, FailingStatementRollsBackTheBatch) {
    EXPECT_THROW(executor_->executeInTransaction({insert("a"), insert("b"), insert("a")}), quint::SqlError);
    EXPECT_EQ(0u, countItems());

    executor_->executeInTransaction({insert("a")});
    EXPECT_EQ(1u, countItems());
}

TEST_F(SqliteExecutorTest, FailingCommitRollsBackTheBatch) {
    // deferred constraints are only checked by COMMIT
    executor_->exec("PRAGMA foreign_keys = ON");
    executor_->exec("CREATE TABLE parts (item TEXT REFERENCES items (name) DEFERRABLE INITIALLY DEFERRED)");

    EXPECT_THROW(executor_->executeInTransaction({
            insert("a"),
            {"INSERT INTO parts (item) VALUES (?)", {SqlParam("missing")}},
    }), quint::SqlError);
    EXPECT_EQ(0u, countItems());

    // no transaction is left open behind the failed COMMIT
    executor_->executeInTransaction({insert("b")});
    EXPECT_EQ(1u, countItems());
}

TEST_F(SqliteExecutorTest, TextKeepsEmbeddedNuls) {
    std::string key("N\0" "5", 3);
    executor_->execute("INSERT INTO items (name) VALUES (?)", {SqlParam(key)});
    auto rows = executor_->query("SELECT name FROM items WHERE name = ?", {SqlParam(key)});
    ASSERT_EQ(1u, rows.size());
    EXPECT_EQ(key, rows[0].at("name").text);
}

TEST_F(SqliteExecutorTest, ClosedExecutorFails) {
    executor_->close();
    EXPECT_THROW(executor_->query("SELECT 1", {}), quint::SqlError);
    EXPECT_THROW(executor_->executeInTransaction({insert("a")}), quint::SqlError);
}

TEST(PgExecutorTest, PlaceholdersAreNumberedInOrder) {
    EXPECT_EQ("SELECT * FROM quints WHERE graph = $1 AND subject >= $2 AND subject < $3",
              PgExecutor::rewritePlaceholders("SELECT * FROM quints WHERE graph = ? AND subject >= ? AND subject < ?"));
    EXPECT_EQ("SELECT 1", PgExecutor::rewritePlaceholders("SELECT 1"));
    EXPECT_EQ("object LIKE $1 ESCAPE '\\' AND predicate = $2",
              PgExecutor::rewritePlaceholders("object LIKE ? ESCAPE '\\' AND predicate = ?"));
    // quoted text is not a placeholder
    EXPECT_EQ("SELECT '?' AS mark, $1", PgExecutor::rewritePlaceholders("SELECT '?' AS mark, ?"));
}

TEST(PgExecutorTest, SeparatorSwap) {
    std::string sep(1, '\0');
    std::string key = "N" + sep + "50001.00000000000000000" + sep + "http://www.w3.org/2001/XMLSchema#integer" + sep + "1";
    std::string stored = PgExecutor::toPgText(key);
    EXPECT_EQ(std::string::npos, stored.find('\0'));
    EXPECT_EQ(3, std::count(stored.begin(), stored.end(), '\x1f'));
    EXPECT_EQ(key, PgExecutor::fromPgText(stored));

    EXPECT_EQ("http://ex/a", PgExecutor::toPgText("http://ex/a"));
    EXPECT_EQ("http://ex/a", PgExecutor::fromPgText("http://ex/a"));
}

} // namespace test
