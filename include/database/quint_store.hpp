/*
 * @FileName   : quint_store.hpp
 * @CreateAt   : 2026/9/19
 * @Description: The quint store contract and its SQL implementation.
 *               class `QuintStore` is the contract consumed by the query layer,
 *               class `SqlQuintStore` implements it once for every SQL engine, the engine
 *               specific part is the `SqlExecutor` produced by the injected factory,
 *               class `QuintStoreBuilder` creates a not yet opened store from a `StoreConfig`.
 *               Every operation except `open()` / `close()` throws `StoreNotOpenError`
 *               until the store is opened; SQL failures propagate as `SqlError`.
 */

#ifndef QUINT_QUINT_STORE_HPP
#define QUINT_QUINT_STORE_HPP

#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <functional>

#include <spdlog/spdlog.h>

#include "common/type.hpp"
#include "database/pattern.hpp"
#include "database/sql_executor.hpp"
#include "database/store_config.hpp"

namespace quint {

/*
 * Pull based sequence of quints. The underlying query runs on the first `next()`,
 * a consumer may stop at any point. Not restartable once exhausted.
 */
class QuintStream {
public:
    using Producer = std::function<QuintList()>;

    explicit QuintStream(Producer producer) : producer_(std::move(producer)) {}

    /* false once exhausted */
    bool next(Quint &quint);

    /* drain what is left */
    QuintList toList();

private:
    Producer producer_;
    bool started_ = false;
    QuintList buffer_;
    size_t position_ = 0;
};

class QuintStore {
public:
    virtual ~QuintStore() = default;

    /* idempotent, safe under concurrent calls */
    virtual void open() = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    virtual QuintList get(const QuintPattern &pattern, const QueryOptions &options = {}) = 0;

    /* absent, variable and default graph arguments match anything */
    virtual QuintStream match(const std::optional<Term> &subject = std::nullopt,
                              const std::optional<Term> &predicate = std::nullopt,
                              const std::optional<Term> &object = std::nullopt,
                              const std::optional<Term> &graph = std::nullopt) = 0;

    /* the rows whose graph starts with `prefix` */
    virtual QuintList getByGraphPrefix(const std::string &prefix, const QueryOptions &options = {}) = 0;

    virtual size_t count(const QuintPattern &pattern) = 0;

    /* upsert by (graph, subject, predicate, object), only the vector changes on conflict */
    virtual void put(const Quint &quint) = 0;
    virtual void multiPut(const QuintList &quints) = 0;

    virtual size_t updateEmbedding(const QuintPattern &pattern, const Vector &vector) = 0;

    /* an empty pattern deletes every row */
    virtual size_t del(const QuintPattern &pattern) = 0;

    /*
     * Exact tuple deletes in one transaction. Tuples that are not stored are skipped,
     * the ones that are stored are deleted all together or not at all.
     */
    virtual void multiDel(const QuintList &quints) = 0;

    virtual CompoundResultList getCompound(const CompoundPattern &compound, const QueryOptions &options = {}) = 0;

    /* subject -> predicate -> objects for every pair of the two lists, in `graph` when given */
    virtual AttributeMap getAttributes(const std::vector<Term> &subjects,
                                       const std::vector<Term> &predicates,
                                       const std::optional<Term> &graph = std::nullopt) = 0;

    virtual StoreStats stats() = 0;
    virtual void clear() = 0;
};

class SqlQuintStore : public QuintStore {
public:
    using ExecutorFactory = std::function<std::shared_ptr<SqlExecutor>()>;

    explicit SqlQuintStore(ExecutorFactory factory,
                           std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());
    ~SqlQuintStore() override;

    void open() override;
    void close() override;
    bool isOpen() const override;

    QuintList get(const QuintPattern &pattern, const QueryOptions &options = {}) override;
    QuintStream match(const std::optional<Term> &subject = std::nullopt,
                      const std::optional<Term> &predicate = std::nullopt,
                      const std::optional<Term> &object = std::nullopt,
                      const std::optional<Term> &graph = std::nullopt) override;
    QuintList getByGraphPrefix(const std::string &prefix, const QueryOptions &options = {}) override;
    size_t count(const QuintPattern &pattern) override;

    void put(const Quint &quint) override;
    void multiPut(const QuintList &quints) override;
    size_t updateEmbedding(const QuintPattern &pattern, const Vector &vector) override;
    size_t del(const QuintPattern &pattern) override;
    void multiDel(const QuintList &quints) override;

    CompoundResultList getCompound(const CompoundPattern &compound, const QueryOptions &options = {}) override;
    AttributeMap getAttributes(const std::vector<Term> &subjects,
                               const std::vector<Term> &predicates,
                               const std::optional<Term> &graph = std::nullopt) override;

    StoreStats stats() override;
    void clear() override;

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

class QuintStoreBuilder {
public:
    /* a store for `config`, not opened yet */
    static std::shared_ptr<QuintStore> Create(const StoreConfig &config,
                                              std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /* same, from an endpoint string such as `sqlite:data/pod.db` or `postgresql://...` */
    static std::shared_ptr<QuintStore> Create(const std::string &endpoint,
                                              std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());
};

} // namespace quint

#endif //QUINT_QUINT_STORE_HPP
