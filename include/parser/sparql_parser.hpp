/*
 * @FileName   : sparql_parser.hpp
 * @CreateAt   : 2026/9/21
 * @Description: Recursive descent SPARQL parser producing the algebra of `algebra.hpp`.
 *               Covers SELECT / ASK / CONSTRUCT / DESCRIBE with basic graph patterns,
 *               OPTIONAL, UNION, MINUS, GRAPH, FILTER (full expression grammar, EXISTS),
 *               ORDER BY, LIMIT and OFFSET, plus INSERT DATA / DELETE DATA updates.
 *               Anything else (property paths, BIND, VALUES, GROUP BY, sub-selects ...)
 *               raises `ParseError`.
 */

#ifndef QUINT_SPARQL_PARSER_HPP
#define QUINT_SPARQL_PARSER_HPP

#include <memory>
#include <string>
#include <vector>

#include "common/type.hpp"
#include "parser/algebra.hpp"

namespace quint {

class SparqlParser {
public:
    SparqlParser();
    ~SparqlParser();

    /* throws ParseError */
    ParsedQuery parse(const std::string &sparql);

    /*
     * N-Triples, N-Quads, prefixed triples (`@prefix` / `PREFIX`, `GRAPH <g> { }` blocks)
     * or an INSERT DATA request; triples without a graph go to `default_graph`.
     */
    QuintList parseData(const std::string &text, const Term &default_graph = Term::defaultGraph());

    /* form of a request from its leading keyword, without parsing the body */
    static query_form classify(const std::string &sparql);

    /* about the last `parse()` */
    std::vector<std::string> getQueryVariables() const;
    std::vector<TriplePattern> getQueryTriplets() const;
    QuintList getInsertQuints() const;
    bool isDistinctQuery() const;

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace quint

#endif //QUINT_SPARQL_PARSER_HPP
