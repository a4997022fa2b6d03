/*
 * @FileName   : pg_executor.cpp
 * @CreateAt   : 2026/9/18
 * @Description: implement `PgExecutor`
 */

#include "database/pg_executor.hpp"

#include <queue>
#include <mutex>
#include <condition_variable>

#include <libpq-fe.h>

#include "common/error.hpp"

namespace quint {

namespace {

const char PG_SEP = '\x1f';

/* owning PGconn */
class Connection {
public:
    explicit Connection(const std::string &conninfo) : conn_(PQconnectdb(conninfo.c_str())) {}
    ~Connection() {
        if (conn_) PQfinish(conn_);
    }

    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;

    PGconn *get() const { return conn_; }
    bool ok() const { return conn_ && PQstatus(conn_) == CONNECTION_OK; }
    const char *error() const { return conn_ ? PQerrorMessage(conn_) : "no connection"; }

private:
    PGconn *conn_;
};

struct ResultDeleter {
    void operator()(PGresult *result) const { PQclear(result); }
};

using Result = std::unique_ptr<PGresult, ResultDeleter>;

void noticeToLogger(void *arg, const char *message) {
    auto logger = static_cast<spdlog::logger *>(arg);
    std::string text(message);
    while (!text.empty() && text.back() == '\n') text.pop_back();
    logger->debug("postgres: {}", text);
}

} // namespace

class PgExecutor::Impl {
public:
    /* returns its connection to the pool when leaving scope */
    class Lease {
    public:
        Lease(Impl &owner, std::unique_ptr<Connection> conn) : owner_(owner), conn_(std::move(conn)) {}
        ~Lease() { owner_.release_(std::move(conn_)); }

        Lease(const Lease &) = delete;
        Lease &operator=(const Lease &) = delete;

        PGconn *get() const { return conn_->get(); }

    private:
        Impl &owner_;
        std::unique_ptr<Connection> conn_;
    };

    Impl(const std::string &conninfo, size_t pool_size, std::shared_ptr<spdlog::logger> logger)
        : conninfo_(conninfo), max_size_(pool_size == 0 ? 1 : pool_size), logger_(std::move(logger)) {
        // connect eagerly so that a bad endpoint fails on open()
        Lease lease(*this, acquire_());
        logger_->debug("postgres pool ready, at most {} connection(s)", max_size_);
    }

    ~Impl() { close(); }

    SqlRows query(const std::string &sql, const SqlParams &params) {
        Lease lease(*this, acquire_());
        Result result = run_(lease.get(), sql, params);
        return rows_(result.get());
    }

    size_t execute(const std::string &sql, const SqlParams &params) {
        Lease lease(*this, acquire_());
        Result result = run_(lease.get(), sql, params);
        return affected_(result.get());
    }

    void executeInTransaction(const std::vector<SqlStatement> &statements) {
        // the whole transaction stays on one pooled connection
        Lease lease(*this, acquire_());
        run_(lease.get(), "BEGIN", {});
        try {
            for (const auto &statement : statements) {
                run_(lease.get(), statement.sql, statement.params);
            }
            run_(lease.get(), "COMMIT", {});
        } catch (...) {
            rollback_(lease.get());
            throw;
        }
    }

    void exec(const std::string &sql) {
        Lease lease(*this, acquire_());
        Result result(PQexec(lease.get(), sql.c_str()));
        check_(lease.get(), result.get());
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;
        while (!idle_.empty()) {
            idle_.pop();
            active_ -= 1;
        }
        cv_.notify_all();
        logger_->debug("postgres pool closed");
    }

private:
    std::unique_ptr<Connection> acquire_() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !idle_.empty() || active_ < max_size_; });
        if (closed_) {
            throw SqlError("postgres connection pool is closed", CONNECTION_BAD);
        }

        if (!idle_.empty()) {
            auto conn = std::move(idle_.front());
            idle_.pop();
            return conn;
        }

        active_ += 1;
        lock.unlock();
        auto conn = std::make_unique<Connection>(conninfo_);
        if (!conn->ok()) {
            std::string message = conn->error();
            lock.lock();
            active_ -= 1;
            cv_.notify_one();
            throw SqlError("cannot connect to postgres: " + message, CONNECTION_BAD);
        }
        PQsetNoticeProcessor(conn->get(), noticeToLogger, logger_.get());
        return conn;
    }

    void release_(std::unique_ptr<Connection> conn) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || !conn || !conn->ok()) {
            // broken or surplus connection, drop it
            active_ -= 1;
        } else {
            idle_.push(std::move(conn));
        }
        cv_.notify_one();
    }

    Result run_(PGconn *conn, const std::string &sql, const SqlParams &params) {
        std::vector<std::string> texts;
        std::vector<const char *> values;
        texts.reserve(params.size());
        values.reserve(params.size());
        for (const auto &param : params) {
            if (param.type() == SqlParam::NULL_VALUE) {
                texts.emplace_back();
                continue;
            }
            texts.emplace_back(toPgText(param.toText()));
        }
        for (size_t i = 0; i < params.size(); ++i) {
            values.push_back(params[i].type() == SqlParam::NULL_VALUE ? nullptr : texts[i].c_str());
        }

        std::string pg_sql = rewritePlaceholders(sql);
        Result result(PQexecParams(conn, pg_sql.c_str(), static_cast<int>(values.size()),
                                   nullptr, values.data(), nullptr, nullptr, 0));
        check_(conn, result.get());
        return result;
    }

    static void check_(PGconn *conn, PGresult *result) {
        if (result == nullptr) {
            throw SqlError(PQerrorMessage(conn), PGRES_FATAL_ERROR);
        }
        ExecStatusType status = PQresultStatus(result);
        if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
            throw SqlError(PQresultErrorMessage(result), status);
        }
    }

    static SqlRows rows_(PGresult *result) {
        SqlRows rows;
        int tuples = PQntuples(result);
        int fields = PQnfields(result);
        rows.reserve(static_cast<size_t>(tuples));
        for (int r = 0; r < tuples; ++r) {
            SqlRow row;
            for (int f = 0; f < fields; ++f) {
                SqlValue value;
                if (!PQgetisnull(result, r, f)) {
                    value.is_null = false;
                    value.text = fromPgText(std::string(PQgetvalue(result, r, f),
                                                        static_cast<size_t>(PQgetlength(result, r, f))));
                }
                row.emplace(PQfname(result, f), std::move(value));
            }
            rows.emplace_back(std::move(row));
        }
        return rows;
    }

    static size_t affected_(PGresult *result) {
        const char *tuples = PQcmdTuples(result);
        if (tuples == nullptr || *tuples == '\0') {
            return 0;
        }
        return static_cast<size_t>(std::stoull(tuples));
    }

    void rollback_(PGconn *conn) {
        if (PQtransactionStatus(conn) == PQTRANS_IDLE) return;
        Result result(PQexec(conn, "ROLLBACK"));
        if (result == nullptr || PQresultStatus(result.get()) != PGRES_COMMAND_OK) {
            logger_->warn("postgres rollback failed: {}", PQerrorMessage(conn));
        }
    }

    std::string conninfo_;
    size_t max_size_;
    std::shared_ptr<spdlog::logger> logger_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::unique_ptr<Connection>> idle_;
    size_t active_ = 0;
    bool closed_ = false;
};

PgExecutor::PgExecutor(const std::string &conninfo, size_t pool_size, std::shared_ptr<spdlog::logger> logger)
    : impl_(std::make_shared<Impl>(conninfo, pool_size, std::move(logger))) {}

PgExecutor::~PgExecutor() = default;

SqlRows PgExecutor::query(const std::string &sql, const SqlParams &params) {
    return impl_->query(sql, params);
}

size_t PgExecutor::execute(const std::string &sql, const SqlParams &params) {
    return impl_->execute(sql, params);
}

void PgExecutor::executeInTransaction(const std::vector<SqlStatement> &statements) {
    impl_->executeInTransaction(statements);
}

void PgExecutor::exec(const std::string &sql) {
    impl_->exec(sql);
}

void PgExecutor::close() {
    impl_->close();
}

std::string PgExecutor::rewritePlaceholders(const std::string &sql) {
    std::string rewritten;
    rewritten.reserve(sql.size() + 16);
    int index = 0;
    bool quoted = false;
    for (char c : sql) {
        if (c == '\'') quoted = !quoted;
        if (c == '?' && !quoted) {
            rewritten += "$" + std::to_string(++index);
        } else {
            rewritten += c;
        }
    }
    return rewritten;
}

std::string PgExecutor::toPgText(const std::string &text) {
    std::string swapped(text);
    for (auto &c : swapped) {
        if (c == '\0') c = PG_SEP;
    }
    return swapped;
}

std::string PgExecutor::fromPgText(const std::string &text) {
    std::string swapped(text);
    for (auto &c : swapped) {
        if (c == PG_SEP) c = '\0';
    }
    return swapped;
}

} // namespace quint
