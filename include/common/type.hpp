/*
 * @FileName   : type.hpp
 * @CreateAt   : 2026/9/14
 * @Description: RDF terms and quints shared by the codec, the store and the query layer
 */

#ifndef QUINT_TYPE_HPP
#define QUINT_TYPE_HPP

#include <map>
#include <tuple>
#include <cstdint>
#include <string>
#include <vector>
#include <optional>

namespace quint {

enum term_type {
    NAMED_NODE,
    BLANK_NODE,
    LITERAL,
    DEFAULT_GRAPH,
    VARIABLE,
};

/* the four positions of a quad, also the column names of the quints table */
enum term_name {
    SUBJECT,
    PREDICATE,
    OBJECT,
    GRAPH,
};

const char *termNameToString(term_name name);

namespace xsd {
extern const std::string NS;
extern const std::string STRING;
extern const std::string INTEGER;
extern const std::string DECIMAL;
extern const std::string DOUBLE;
extern const std::string BOOLEAN;
extern const std::string DATE_TIME;
}

namespace rdf {
extern const std::string TYPE;
extern const std::string LANG_STRING;
}

/*
 * An immutable RDF term. `value` holds the IRI, the blank node label, the
 * lexical form of a literal or the name of a variable (without '?').
 * A literal carries either a language tag or a datatype, never both;
 * xsd:string is folded into the empty datatype.
 */
class Term {
public:
    Term() : type_(DEFAULT_GRAPH) {}

    static Term namedNode(const std::string &iri);
    static Term blankNode(const std::string &label);
    static Term literal(const std::string &lexical);
    static Term literal(const std::string &lexical, const Term &datatype);
    static Term langLiteral(const std::string &lexical, const std::string &language);
    static Term typedLiteral(const std::string &lexical, const std::string &datatype);
    static Term variable(const std::string &name);
    static Term defaultGraph();

    term_type type() const { return type_; }
    const std::string &value() const { return value_; }
    const std::string &language() const { return language_; }
    const std::string &datatype() const { return datatype_; }

    bool isNamedNode() const { return type_ == NAMED_NODE; }
    bool isBlankNode() const { return type_ == BLANK_NODE; }
    bool isLiteral() const { return type_ == LITERAL; }
    bool isVariable() const { return type_ == VARIABLE; }
    bool isDefaultGraph() const { return type_ == DEFAULT_GRAPH; }

    bool operator==(const Term &other) const;
    bool operator!=(const Term &other) const { return !(*this == other); }
    bool operator<(const Term &other) const;

    /* N-Triples like rendering, used for logs and the CLI output */
    std::string toString() const;

private:
    Term(term_type type, std::string value, std::string language, std::string datatype);

    term_type type_;
    std::string value_;
    std::string language_;
    std::string datatype_;
};

using Vector = std::vector<float>;

/*
 * (graph, subject, predicate, object) is the identity of a stored row,
 * `vector` is an independently updatable payload.
 */
struct Quint {
    Term graph;
    Term subject;
    Term predicate;
    Term object;
    std::optional<Vector> vector;

    Quint() = default;
    Quint(Term s, Term p, Term o, Term g = Term::defaultGraph())
        : graph(std::move(g)), subject(std::move(s)), predicate(std::move(p)), object(std::move(o)) {}

    const Term &at(term_name name) const;

    /* identity comparison, the vector is not part of it */
    bool sameKey(const Quint &other) const;
    bool operator==(const Quint &other) const;
    bool operator!=(const Quint &other) const { return !(*this == other); }
};

using QuintList = std::vector<Quint>;

/* subject -> predicate -> objects, the result of a batched attribute fetch */
using AttributeMap = std::map<Term, std::map<Term, std::vector<Term>>>;

struct StoreStats {
    int64_t total_count = 0;
    int64_t vector_count = 0;
    int64_t graph_count = 0;
};

} // namespace quint

#endif //QUINT_TYPE_HPP
