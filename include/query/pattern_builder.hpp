/*
 * @FileName   : pattern_builder.hpp
 * @CreateAt   : 2026/9/23
 * @Description: Builds the store pattern of one SPARQL triple pattern.
 *               Three layers are merged, a concrete term always wins:
 *                 1. the bound positions of the triple pattern (default graph left open),
 *                 2. the security filter, filling the positions the query left open,
 *                 3. pushed down FILTER operators of the variables of the pattern.
 */

#ifndef QUINT_PATTERN_BUILDER_HPP
#define QUINT_PATTERN_BUILDER_HPP

#include <memory>
#include <optional>
#include <functional>

#include <spdlog/spdlog.h>

#include "common/result_set.hpp"
#include "database/pattern.hpp"
#include "parser/algebra.hpp"
#include "query/filter_pushdown.hpp"

namespace quint {

/* tenant isolation constraint, looked up on every build */
using SecurityFilterProvider = std::function<std::optional<QuintPattern>()>;

class PatternBuilder {
public:
    explicit PatternBuilder(SecurityFilterProvider security_filters = nullptr,
                            std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    QuintPattern buildBasePattern(const TriplePattern &pattern) const;

    QuintPattern buildQuintPattern(const TriplePattern &pattern, const PushdownFilters &filters) const;

    /* variables resolved against a partial solution, for EXISTS / NOT EXISTS */
    QuintPattern buildExistsPattern(const TriplePattern &pattern, const Binding &binding) const;

    /* GRAPH ?g ranges over the named graphs only */
    static void excludeDefaultGraph(QuintPattern &pattern);

private:
    void applySecurityFilters_(QuintPattern &pattern) const;

    SecurityFilterProvider security_filters_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace quint

#endif //QUINT_PATTERN_BUILDER_HPP
