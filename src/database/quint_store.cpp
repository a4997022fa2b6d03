/*
 * @FileName   : quint_store.cpp
 * @CreateAt   : 2026/9/19
 * @Description: implement `SqlQuintStore`, `QuintStream` and `QuintStoreBuilder`
 */

#include "database/quint_store.hpp"

#include <mutex>
#include <limits>
#include <iterator>
#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "common/error.hpp"
#include "codec/term_codec.hpp"
#include "database/quint_schema.hpp"
#include "database/sql_builder.hpp"
#include "database/pattern_translator.hpp"
#include "database/sqlite_executor.hpp"
#include "database/pg_executor.hpp"

namespace quint {

using json = nlohmann::json;

bool QuintStream::next(Quint &quint) {
    if (!started_) {
        started_ = true;
        buffer_ = producer_();
        producer_ = nullptr;
    }
    if (position_ >= buffer_.size()) {
        return false;
    }
    quint = std::move(buffer_[position_++]);
    return true;
}

QuintList QuintStream::toList() {
    QuintList rest;
    Quint quint;
    while (next(quint)) {
        rest.emplace_back(std::move(quint));
    }
    return rest;
}

class SqlQuintStore::Impl {
public:
    Impl(ExecutorFactory factory, std::shared_ptr<spdlog::logger> logger)
        : factory_(std::move(factory)), logger_(std::move(logger)) {}

    void open() {
        std::lock_guard<std::mutex> lock(lifecycle_);
        if (executor_) {
            return;
        }
        auto executor = factory_();
        QuintSchema::ensure(*executor);
        executor_ = executor;
        logger_->info("quint store opened, schema ensured");
    }

    void close() {
        std::shared_ptr<SqlExecutor> executor;
        {
            std::lock_guard<std::mutex> lock(lifecycle_);
            executor.swap(executor_);
        }
        if (!executor) {
            return;
        }
        // a call still in flight keeps its copy and releases the connection when done
        if (executor.use_count() == 1) {
            executor->close();
        }
        logger_->info("quint store closed");
    }

    bool isOpen() const {
        std::lock_guard<std::mutex> lock(lifecycle_);
        return executor_ != nullptr;
    }

    std::shared_ptr<SqlExecutor> executor() const {
        std::lock_guard<std::mutex> lock(lifecycle_);
        if (!executor_) {
            throw StoreNotOpenError();
        }
        return executor_;
    }

    QuintList get(const QuintPattern &pattern, const QueryOptions &options) {
        auto executor = this->executor();
        auto filters = PatternTranslator::regexFilters(pattern);

        SqlBuilder builder("SELECT graph, subject, predicate, object, vector FROM quints");
        builder.append(PatternTranslator::whereClause(pattern));
        appendOrder_(builder, options, "");
        if (filters.empty()) {
            appendSlice_(builder, options);
        }
        logger_->debug("get: {} [{} param(s)]", builder.text(), builder.params().size());

        SqlRows rows = executor->query(builder.text(), builder.params());
        if (!filters.empty()) {
            rows = sliceRows_(filterRows_(std::move(rows), filters), options);
        }

        QuintList quints;
        quints.reserve(rows.size());
        for (const auto &row : rows) {
            quints.emplace_back(rowToQuint_(row));
        }
        return quints;
    }

    size_t count(const QuintPattern &pattern) {
        auto executor = this->executor();
        auto filters = PatternTranslator::regexFilters(pattern);
        if (!filters.empty()) {
            SqlBuilder builder("SELECT graph, subject, predicate, object FROM quints");
            builder.append(PatternTranslator::whereClause(pattern));
            return filterRows_(executor->query(builder.text(), builder.params()), filters).size();
        }

        SqlBuilder builder("SELECT COUNT(*) AS count FROM quints");
        builder.append(PatternTranslator::whereClause(pattern));
        logger_->debug("count: {} [{} param(s)]", builder.text(), builder.params().size());
        SqlRows rows = executor->query(builder.text(), builder.params());
        return rows.empty() ? 0 : static_cast<size_t>(integerOf_(rows[0], "count"));
    }

    void put(const Quint &quint) {
        auto executor = this->executor();
        SqlStatement statement = upsert_(*executor, quint);
        executor->execute(statement.sql, statement.params);
    }

    void multiPut(const QuintList &quints) {
        auto executor = this->executor();
        if (quints.empty()) {
            return;
        }
        std::vector<SqlStatement> statements;
        statements.reserve(quints.size());
        for (const auto &quint : quints) {
            statements.emplace_back(upsert_(*executor, quint));
        }
        executor->executeInTransaction(statements);
    }

    size_t updateEmbedding(const QuintPattern &pattern, const Vector &vector) {
        auto executor = this->executor();
        std::string payload = json(vector).dump();
        auto filters = PatternTranslator::regexFilters(pattern);

        if (filters.empty()) {
            SqlBuilder builder;
            builder.sql("UPDATE quints SET vector = ").param(payload)
                   .append(PatternTranslator::whereClause(pattern));
            return executor->execute(builder.text(), builder.params());
        }

        // regex patterns resolve to exact keys first
        std::vector<SqlStatement> statements;
        for (const auto &row : matchingKeys_(*executor, pattern, filters)) {
            SqlBuilder builder;
            builder.sql("UPDATE quints SET vector = ").param(payload).append(keyCondition_(row));
            statements.emplace_back(builder.build());
        }
        if (!statements.empty()) {
            executor->executeInTransaction(statements);
        }
        return statements.size();
    }

    size_t del(const QuintPattern &pattern) {
        auto executor = this->executor();
        auto filters = PatternTranslator::regexFilters(pattern);

        if (filters.empty()) {
            SqlBuilder builder("DELETE FROM quints");
            builder.append(PatternTranslator::whereClause(pattern));
            logger_->debug("del: {} [{} param(s)]", builder.text(), builder.params().size());
            return executor->execute(builder.text(), builder.params());
        }

        std::vector<SqlStatement> statements;
        for (const auto &row : matchingKeys_(*executor, pattern, filters)) {
            SqlBuilder builder("DELETE FROM quints");
            builder.append(keyCondition_(row));
            statements.emplace_back(builder.build());
        }
        if (!statements.empty()) {
            executor->executeInTransaction(statements);
        }
        return statements.size();
    }

    void multiDel(const QuintList &quints) {
        auto executor = this->executor();
        if (quints.empty()) {
            return;
        }
        std::vector<SqlStatement> statements;
        statements.reserve(quints.size());
        for (const auto &quint : quints) {
            SqlBuilder builder("DELETE FROM quints WHERE graph = ");
            builder.param(TermCodec::encodeTerm(quint.graph))
                   .sql(" AND subject = ").param(TermCodec::encodeTerm(quint.subject))
                   .sql(" AND predicate = ").param(TermCodec::encodeTerm(quint.predicate))
                   .sql(" AND object = ").param(TermCodec::encodeObject(quint.object));
            statements.emplace_back(builder.build());
        }
        executor->executeInTransaction(statements);
    }

    CompoundResultList getCompound(const CompoundPattern &compound, const QueryOptions &options) {
        auto executor = this->executor();
        const auto &patterns = compound.patterns;
        for (const auto &select : compound.select) {
            if (select.pattern >= patterns.size()) {
                throw std::invalid_argument(fmt::format(
                        "compound select '{}' refers to pattern {} of {}",
                        select.alias, select.pattern, patterns.size()));
            }
        }
        if (patterns.empty()) {
            return {};
        }
        if (patterns.size() == 1) {
            return singleCompound_(compound, options);
        }

        const char *join_column = QuintSchema::column(compound.join_on);
        SqlBuilder builder;
        builder.sql(fmt::format("SELECT q0.{} AS join_value", join_column));

        // caller aliases never reach SQL, the internal names map back to them
        std::vector<std::pair<std::string, term_name>> projected;
        if (!compound.select.empty()) {
            for (size_t k = 0; k < compound.select.size(); ++k) {
                const auto &select = compound.select[k];
                builder.sql(fmt::format(", q{}.{} AS sel{}", select.pattern,
                                        QuintSchema::column(select.field), k));
                projected.emplace_back(fmt::format("sel{}", k), select.field);
            }
        } else {
            for (size_t i = 0; i < patterns.size(); ++i) {
                builder.sql(fmt::format(", q{0}.object AS p{0}_object, q{0}.predicate AS p{0}_predicate", i));
                projected.emplace_back(fmt::format("p{}_object", i), OBJECT);
                projected.emplace_back(fmt::format("p{}_predicate", i), PREDICATE);
            }
        }

        builder.sql(" FROM quints q0");
        for (size_t i = 1; i < patterns.size(); ++i) {
            builder.sql(fmt::format(" JOIN quints q{0} ON q0.{1} = q{0}.{1}", i, join_column));
            if (compound.join_on != GRAPH) {
                builder.sql(fmt::format(" AND q0.graph = q{}.graph", i));
            }
        }

        std::vector<SqlBuilder> conditions;
        for (size_t i = 0; i < patterns.size(); ++i) {
            conditions.emplace_back(PatternTranslator::conditions(patterns[i], fmt::format("q{}", i)));
        }
        SqlBuilder where = SqlBuilder::join(conditions, " AND ");
        if (!where.empty()) {
            builder.sql(" WHERE ").append(where);
        }
        appendOrder_(builder, options, "q0.");
        appendSlice_(builder, options);

        logger_->debug("compound ({} patterns, join on {}): {} [{} param(s)]",
                       patterns.size(), join_column, builder.text(), builder.params().size());

        SqlRows rows = executor->query(builder.text(), builder.params());
        CompoundResultList results;
        results.reserve(rows.size());
        for (const auto &row : rows) {
            CompoundResult result;
            result.join_value = decodeField_(textOf_(row, "join_value"), compound.join_on);
            for (size_t k = 0; k < projected.size(); ++k) {
                std::string name = compound.select.empty() ? projected[k].first : compound.select[k].alias;
                result.bindings[name] = decodeField_(textOf_(row, projected[k].first), projected[k].second);
            }
            results.emplace_back(std::move(result));
        }
        return results;
    }

    AttributeMap getAttributes(const std::vector<Term> &subjects, const std::vector<Term> &predicates,
                               const std::optional<Term> &graph) {
        auto executor = this->executor();
        if (subjects.empty() || predicates.empty()) {
            return {};
        }

        std::vector<SqlParam> subject_ids, predicate_ids;
        for (const auto &subject : subjects) subject_ids.emplace_back(TermCodec::encodeTerm(subject));
        for (const auto &predicate : predicates) predicate_ids.emplace_back(TermCodec::encodeTerm(predicate));

        SqlBuilder builder("SELECT subject, predicate, object FROM quints WHERE subject IN (");
        builder.paramList(subject_ids).sql(") AND predicate IN (").paramList(predicate_ids).sql(")");
        if (graph && !graph->isDefaultGraph() && !graph->isVariable()) {
            builder.sql(" AND graph = ").param(TermCodec::encodeTerm(*graph));
        }
        logger_->debug("getAttributes: {} [{} subject(s), {} predicate(s)]",
                       builder.text(), subjects.size(), predicates.size());

        AttributeMap attributes;
        for (const auto &row : executor->query(builder.text(), builder.params())) {
            Term subject = TermCodec::decodeTerm(textOf_(row, "subject"));
            Term predicate = TermCodec::decodeTerm(textOf_(row, "predicate"));
            attributes[subject][predicate].emplace_back(TermCodec::decodeObject(textOf_(row, "object")));
        }
        logger_->debug("getAttributes returned {} subject(s)", attributes.size());
        return attributes;
    }

    StoreStats stats() {
        auto executor = this->executor();
        StoreStats stats;
        stats.total_count = scalar_(*executor, "SELECT COUNT(*) AS count FROM quints");
        stats.vector_count = scalar_(*executor, "SELECT COUNT(*) AS count FROM quints WHERE vector IS NOT NULL");
        stats.graph_count = scalar_(*executor, "SELECT COUNT(DISTINCT graph) AS count FROM quints");
        return stats;
    }

    void clear() {
        auto executor = this->executor();
        executor->execute("DELETE FROM quints", {});
    }

private:
    static SqlStatement upsert_(const SqlExecutor &executor, const Quint &quint) {
        SqlBuilder builder;
        builder.sql(executor.dialect() == POSTGRES_DIALECT
                    ? "INSERT INTO quints (graph, subject, predicate, object, vector) VALUES ("
                    : "INSERT OR REPLACE INTO quints (graph, subject, predicate, object, vector) VALUES (");
        builder.param(TermCodec::encodeTerm(quint.graph)).sql(", ")
               .param(TermCodec::encodeTerm(quint.subject)).sql(", ")
               .param(TermCodec::encodeTerm(quint.predicate)).sql(", ")
               .param(TermCodec::encodeObject(quint.object)).sql(", ")
               .param(quint.vector ? SqlParam(json(*quint.vector).dump()) : SqlParam::null())
               .sql(")");
        if (executor.dialect() == POSTGRES_DIALECT) {
            builder.sql(" ON CONFLICT (graph, subject, predicate, object) DO UPDATE SET vector = EXCLUDED.vector");
        }
        return builder.build();
    }

    static void appendOrder_(SqlBuilder &builder, const QueryOptions &options, const std::string &qualifier) {
        if (options.order.empty()) {
            return;
        }
        builder.sql(" ORDER BY ");
        for (size_t i = 0; i < options.order.size(); ++i) {
            if (i > 0) builder.sql(", ");
            builder.sql(qualifier).sql(QuintSchema::column(options.order[i]));
            if (options.reverse) builder.sql(" DESC");
        }
    }

    static void appendSlice_(SqlBuilder &builder, const QueryOptions &options) {
        if (options.limit) {
            builder.sql(" LIMIT ").param(toSqlInteger_(*options.limit));
        } else if (options.offset) {
            // OFFSET alone is not valid SQLite
            builder.sql(" LIMIT ").param(std::numeric_limits<int64_t>::max());
        }
        if (options.offset) {
            builder.sql(" OFFSET ").param(toSqlInteger_(*options.offset));
        }
    }

    // SQL integers are signed 64 bit
    static int64_t toSqlInteger_(size_t value) {
        const auto max = static_cast<size_t>(std::numeric_limits<int64_t>::max());
        return static_cast<int64_t>(std::min(value, max));
    }

    static SqlRows filterRows_(SqlRows rows, const std::vector<PatternTranslator::RegexFilter> &filters) {
        SqlRows kept;
        for (auto &row : rows) {
            bool matched = true;
            for (const auto &filter : filters) {
                if (!std::regex_search(textOf_(row, QuintSchema::column(filter.field)), filter.regex)) {
                    matched = false;
                    break;
                }
            }
            if (matched) {
                kept.emplace_back(std::move(row));
            }
        }
        return kept;
    }

    static SqlRows sliceRows_(SqlRows rows, const QueryOptions &options) {
        size_t begin = std::min(options.offset.value_or(0), rows.size());
        size_t end = options.limit ? std::min(rows.size(), begin + *options.limit) : rows.size();
        return SqlRows(std::make_move_iterator(rows.begin() + static_cast<std::ptrdiff_t>(begin)),
                       std::make_move_iterator(rows.begin() + static_cast<std::ptrdiff_t>(end)));
    }

    SqlRows matchingKeys_(SqlExecutor &executor, const QuintPattern &pattern,
                          const std::vector<PatternTranslator::RegexFilter> &filters) {
        SqlBuilder builder("SELECT graph, subject, predicate, object FROM quints");
        builder.append(PatternTranslator::whereClause(pattern));
        SqlRows rows = filterRows_(executor.query(builder.text(), builder.params()), filters);
        logger_->debug("regex pattern resolved to {} key(s)", rows.size());
        return rows;
    }

    /* WHERE clause on the stored key of `row` */
    static SqlBuilder keyCondition_(const SqlRow &row) {
        SqlBuilder builder;
        builder.sql(" WHERE graph = ").param(textOf_(row, "graph"))
               .sql(" AND subject = ").param(textOf_(row, "subject"))
               .sql(" AND predicate = ").param(textOf_(row, "predicate"))
               .sql(" AND object = ").param(textOf_(row, "object"));
        return builder;
    }

    CompoundResultList singleCompound_(const CompoundPattern &compound, const QueryOptions &options) {
        CompoundResultList results;
        for (auto &quint : get(compound.patterns[0], options)) {
            CompoundResult result;
            result.join_value = quint.at(compound.join_on);
            if (compound.select.empty()) {
                result.bindings["p0_object"] = quint.object;
                result.bindings["p0_predicate"] = quint.predicate;
            } else {
                for (const auto &select : compound.select) {
                    result.bindings[select.alias] = quint.at(select.field);
                }
            }
            result.quints.emplace_back(std::move(quint));
            results.emplace_back(std::move(result));
        }
        return results;
    }

    Quint rowToQuint_(const SqlRow &row) const {
        Quint quint(TermCodec::decodeTerm(textOf_(row, "subject")),
                    TermCodec::decodeTerm(textOf_(row, "predicate")),
                    TermCodec::decodeObject(textOf_(row, "object")),
                    TermCodec::decodeTerm(textOf_(row, "graph")));
        auto vector = row.find(QuintSchema::VECTOR_COLUMN);
        if (vector != row.end() && !vector->second.is_null) {
            try {
                quint.vector = json::parse(vector->second.text).get<Vector>();
            } catch (const json::exception &e) {
                logger_->warn("unreadable vector payload ignored: {}", e.what());
            }
        }
        return quint;
    }

    static Term decodeField_(const std::string &text, term_name field) {
        return field == OBJECT ? TermCodec::decodeObject(text) : TermCodec::decodeTerm(text);
    }

    static const std::string &textOf_(const SqlRow &row, const std::string &column) {
        static const std::string EMPTY;
        auto it = row.find(column);
        return it == row.end() ? EMPTY : it->second.text;
    }

    static int64_t integerOf_(const SqlRow &row, const std::string &column) {
        const std::string &text = textOf_(row, column);
        return text.empty() ? 0 : std::stoll(text);
    }

    static int64_t scalar_(SqlExecutor &executor, const std::string &sql) {
        SqlRows rows = executor.query(sql, {});
        return rows.empty() ? 0 : integerOf_(rows[0], "count");
    }

    ExecutorFactory factory_;
    std::shared_ptr<spdlog::logger> logger_;
    mutable std::mutex lifecycle_;
    std::shared_ptr<SqlExecutor> executor_;
};

SqlQuintStore::SqlQuintStore(ExecutorFactory factory, std::shared_ptr<spdlog::logger> logger)
    : impl_(std::make_shared<Impl>(std::move(factory), std::move(logger))) {}

SqlQuintStore::~SqlQuintStore() {
    impl_->close();
}

void SqlQuintStore::open() {
    impl_->open();
}

void SqlQuintStore::close() {
    impl_->close();
}

bool SqlQuintStore::isOpen() const {
    return impl_->isOpen();
}

QuintList SqlQuintStore::get(const QuintPattern &pattern, const QueryOptions &options) {
    return impl_->get(pattern, options);
}

QuintStream SqlQuintStore::match(const std::optional<Term> &subject, const std::optional<Term> &predicate,
                                 const std::optional<Term> &object, const std::optional<Term> &graph) {
    // fail fast, the query itself runs on the first pull
    impl_->executor();

    QuintPattern pattern;
    if (subject && !subject->isVariable()) pattern.subject = TermMatch(*subject);
    if (predicate && !predicate->isVariable()) pattern.predicate = TermMatch(*predicate);
    if (object && !object->isVariable()) pattern.object = TermMatch(*object);
    if (graph && !graph->isVariable() && !graph->isDefaultGraph()) pattern.graph = TermMatch(*graph);

    auto impl = impl_;
    return QuintStream([impl, pattern] { return impl->get(pattern, QueryOptions()); });
}

QuintList SqlQuintStore::getByGraphPrefix(const std::string &prefix, const QueryOptions &options) {
    TermOperators operators;
    operators.starts_with = prefix;
    QuintPattern pattern;
    pattern.graph = TermMatch(operators);
    return impl_->get(pattern, options);
}

size_t SqlQuintStore::count(const QuintPattern &pattern) {
    return impl_->count(pattern);
}

void SqlQuintStore::put(const Quint &quint) {
    impl_->put(quint);
}

void SqlQuintStore::multiPut(const QuintList &quints) {
    impl_->multiPut(quints);
}

size_t SqlQuintStore::updateEmbedding(const QuintPattern &pattern, const Vector &vector) {
    return impl_->updateEmbedding(pattern, vector);
}

size_t SqlQuintStore::del(const QuintPattern &pattern) {
    return impl_->del(pattern);
}

void SqlQuintStore::multiDel(const QuintList &quints) {
    impl_->multiDel(quints);
}

CompoundResultList SqlQuintStore::getCompound(const CompoundPattern &compound, const QueryOptions &options) {
    return impl_->getCompound(compound, options);
}

AttributeMap SqlQuintStore::getAttributes(const std::vector<Term> &subjects, const std::vector<Term> &predicates,
                                          const std::optional<Term> &graph) {
    return impl_->getAttributes(subjects, predicates, graph);
}

StoreStats SqlQuintStore::stats() {
    return impl_->stats();
}

void SqlQuintStore::clear() {
    impl_->clear();
}

std::shared_ptr<QuintStore> QuintStoreBuilder::Create(const StoreConfig &config,
                                                      std::shared_ptr<spdlog::logger> logger) {
    if (config.debug) {
        logger->set_level(spdlog::level::debug);
    }

    SqlQuintStore::ExecutorFactory factory;
    if (config.backend == StoreConfig::POSTGRES_BACKEND) {
        std::string location = config.location;
        size_t pool_size = config.pool_size;
        factory = [location, pool_size, logger] {
            return std::make_shared<PgExecutor>(location, pool_size, logger);
        };
    } else {
        std::string location = config.location;
        factory = [location, logger] {
            return std::make_shared<SqliteExecutor>(location, logger);
        };
    }
    return std::make_shared<SqlQuintStore>(factory, logger);
}

std::shared_ptr<QuintStore> QuintStoreBuilder::Create(const std::string &endpoint,
                                                      std::shared_ptr<spdlog::logger> logger) {
    return Create(StoreConfig::FromEndpoint(endpoint), std::move(logger));
}

} // namespace quint
