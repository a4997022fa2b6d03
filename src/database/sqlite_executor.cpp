/*
 * @FileName   : sqlite_executor.cpp
 * @CreateAt   : 2026/9/18
 * @Description: implement `SqliteExecutor`
 */

#include "database/sqlite_executor.hpp"

#include <mutex>

#include <sqlite3.h>
#include <boost/filesystem.hpp>

#include "common/error.hpp"

namespace quint {

namespace fs = boost::filesystem;

namespace {

const char *MEMORY_PATH = ":memory:";
const int BUSY_TIMEOUT_MS = 5000;

/* finalizes the prepared statement when leaving scope */
class Statement {
public:
    explicit Statement(sqlite3_stmt *stmt) : stmt_(stmt) {}
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const { return stmt_; }

private:
    sqlite3_stmt *stmt_;
};

} // namespace

class SqliteExecutor::Impl {
public:
    Impl(const std::string &path, std::shared_ptr<spdlog::logger> logger)
        : path_(path), logger_(std::move(logger)) {
        if (path_ != MEMORY_PATH) {
            fs::path parent = fs::path(path_).parent_path();
            if (!parent.empty() && !fs::exists(parent)) {
                fs::create_directories(parent);
            }
        }

        int rc = sqlite3_open_v2(path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
        if (rc != SQLITE_OK) {
            std::string message = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
            sqlite3_close(db_);
            db_ = nullptr;
            throw SqlError("cannot open sqlite database '" + path_ + "': " + message, rc);
        }

        sqlite3_busy_timeout(db_, BUSY_TIMEOUT_MS);
        try {
            // LIKE must be byte exact, as on PostgreSQL
            execRaw_("PRAGMA case_sensitive_like = ON");
            if (path_ != MEMORY_PATH) {
                execRaw_("PRAGMA journal_mode = WAL");
            }
        } catch (const SqlError &) {
            sqlite3_close(db_);
            db_ = nullptr;
            throw;
        }
        logger_->debug("sqlite connection opened on '{}'", path_);
    }

    ~Impl() { close(); }

    SqlRows query(const std::string &sql, const SqlParams &params) {
        std::lock_guard<std::mutex> lock(mutex_);
        ensureOpen_();

        Statement stmt(prepare_(sql));
        bind_(stmt.get(), params);

        SqlRows rows;
        int rc;
        int columns = sqlite3_column_count(stmt.get());
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            SqlRow row;
            for (int col = 0; col < columns; ++col) {
                SqlValue value;
                if (sqlite3_column_type(stmt.get(), col) != SQLITE_NULL) {
                    // column_text first, then column_bytes counts every byte including NULs
                    auto text = reinterpret_cast<const char *>(sqlite3_column_text(stmt.get(), col));
                    int size = sqlite3_column_bytes(stmt.get(), col);
                    value.is_null = false;
                    if (text != nullptr) {
                        value.text.assign(text, static_cast<size_t>(size));
                    }
                }
                row.emplace(sqlite3_column_name(stmt.get(), col), std::move(value));
            }
            rows.emplace_back(std::move(row));
        }
        if (rc != SQLITE_DONE) {
            throw error_(rc);
        }
        return rows;
    }

    size_t execute(const std::string &sql, const SqlParams &params) {
        std::lock_guard<std::mutex> lock(mutex_);
        ensureOpen_();
        return step_(sql, params);
    }

    void executeInTransaction(const std::vector<SqlStatement> &statements) {
        std::lock_guard<std::mutex> lock(mutex_);
        ensureOpen_();

        execRaw_("BEGIN");
        try {
            for (const auto &statement : statements) {
                step_(statement.sql, statement.params);
            }
            // a failed COMMIT (busy, deferred constraint) leaves the transaction open
            execRaw_("COMMIT");
        } catch (...) {
            rollback_();
            throw;
        }
    }

    void exec(const std::string &sql) {
        std::lock_guard<std::mutex> lock(mutex_);
        ensureOpen_();
        execRaw_(sql);
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (db_ == nullptr) {
            return;
        }
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK) {
            logger_->warn("sqlite close of '{}' returned {}", path_, sqlite3_errstr(rc));
        }
        db_ = nullptr;
        logger_->debug("sqlite connection on '{}' closed", path_);
    }

private:
    void ensureOpen_() const {
        if (db_ == nullptr) {
            throw SqlError("sqlite connection is closed", SQLITE_MISUSE);
        }
    }

    SqlError error_(int rc) const {
        return SqlError(sqlite3_errmsg(db_), rc);
    }

    sqlite3_stmt *prepare_(const std::string &sql) {
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt, nullptr);
        if (rc != SQLITE_OK) {
            sqlite3_finalize(stmt);
            throw error_(rc);
        }
        return stmt;
    }

    void bind_(sqlite3_stmt *stmt, const SqlParams &params) {
        for (size_t i = 0; i < params.size(); ++i) {
            int index = static_cast<int>(i + 1);
            const SqlParam &param = params[i];
            int rc = SQLITE_OK;
            switch (param.type()) {
                case SqlParam::TEXT:
                    // explicit length, encoded objects carry NUL separators
                    rc = sqlite3_bind_text(stmt, index, param.text().data(),
                                           static_cast<int>(param.text().size()), SQLITE_TRANSIENT);
                    break;
                case SqlParam::INTEGER:
                    rc = sqlite3_bind_int64(stmt, index, param.integer());
                    break;
                case SqlParam::NULL_VALUE:
                    rc = sqlite3_bind_null(stmt, index);
                    break;
            }
            if (rc != SQLITE_OK) {
                throw error_(rc);
            }
        }
    }

    size_t step_(const std::string &sql, const SqlParams &params) {
        Statement stmt(prepare_(sql));
        bind_(stmt.get(), params);
        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {}
        if (rc != SQLITE_DONE) {
            throw error_(rc);
        }
        return static_cast<size_t>(sqlite3_changes(db_));
    }

    void execRaw_(const std::string &sql) {
        char *message = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &message);
        if (rc != SQLITE_OK) {
            std::string text = message ? message : sqlite3_errstr(rc);
            sqlite3_free(message);
            throw SqlError(text, rc);
        }
    }

    void rollback_() {
        if (sqlite3_get_autocommit(db_)) {
            // sqlite already rolled back on its own
            return;
        }
        char *message = nullptr;
        int rc = sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, &message);
        if (rc != SQLITE_OK) {
            logger_->warn("sqlite rollback failed: {}", message ? message : sqlite3_errstr(rc));
        }
        sqlite3_free(message);
    }

    std::string path_;
    std::shared_ptr<spdlog::logger> logger_;
    sqlite3 *db_ = nullptr;
    std::mutex mutex_;
};

SqliteExecutor::SqliteExecutor(const std::string &path, std::shared_ptr<spdlog::logger> logger)
    : impl_(std::make_shared<Impl>(path, std::move(logger))) {}

SqliteExecutor::~SqliteExecutor() = default;

SqlRows SqliteExecutor::query(const std::string &sql, const SqlParams &params) {
    return impl_->query(sql, params);
}

size_t SqliteExecutor::execute(const std::string &sql, const SqlParams &params) {
    return impl_->execute(sql, params);
}

void SqliteExecutor::executeInTransaction(const std::vector<SqlStatement> &statements) {
    impl_->executeInTransaction(statements);
}

void SqliteExecutor::exec(const std::string &sql) {
    impl_->exec(sql);
}

void SqliteExecutor::close() {
    impl_->close();
}

} // namespace quint
