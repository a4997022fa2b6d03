/*
 * @FileName   : type.cpp
 * @CreateAt   : 2026/9/14
 * @Description: implement `Term` and `Quint`
 */

#include "common/type.hpp"

namespace quint {

namespace xsd {
const std::string NS = "http://www.w3.org/2001/XMLSchema#";
const std::string STRING = NS + "string";
const std::string INTEGER = NS + "integer";
const std::string DECIMAL = NS + "decimal";
const std::string DOUBLE = NS + "double";
const std::string BOOLEAN = NS + "boolean";
const std::string DATE_TIME = NS + "dateTime";
}

namespace rdf {
const std::string TYPE = "http://www.w3.org/1999/02/22-rdf-syntax-ns#type";
const std::string LANG_STRING = "http://www.w3.org/1999/02/22-rdf-syntax-ns#langString";
}

const char *termNameToString(term_name name) {
    switch (name) {
        case SUBJECT:   return "subject";
        case PREDICATE: return "predicate";
        case OBJECT:    return "object";
        case GRAPH:     return "graph";
    }
    return "graph";
}

Term::Term(term_type type, std::string value, std::string language, std::string datatype)
    : type_(type)
    , value_(std::move(value))
    , language_(std::move(language))
    , datatype_(std::move(datatype)) {}

Term Term::namedNode(const std::string &iri) {
    return Term(NAMED_NODE, iri, "", "");
}

Term Term::blankNode(const std::string &label) {
    return Term(BLANK_NODE, label, "", "");
}

Term Term::literal(const std::string &lexical) {
    return Term(LITERAL, lexical, "", "");
}

Term Term::literal(const std::string &lexical, const Term &datatype) {
    return typedLiteral(lexical, datatype.value());
}

Term Term::langLiteral(const std::string &lexical, const std::string &language) {
    return Term(LITERAL, lexical, language, "");
}

Term Term::typedLiteral(const std::string &lexical, const std::string &datatype) {
    if (datatype == xsd::STRING || datatype == rdf::LANG_STRING) {
        return Term(LITERAL, lexical, "", "");
    }
    return Term(LITERAL, lexical, "", datatype);
}

Term Term::variable(const std::string &name) {
    return Term(VARIABLE, name, "", "");
}

Term Term::defaultGraph() {
    return Term();
}

bool Term::operator==(const Term &other) const {
    return type_ == other.type_
        && value_ == other.value_
        && language_ == other.language_
        && datatype_ == other.datatype_;
}

bool Term::operator<(const Term &other) const {
    return std::tie(type_, value_, language_, datatype_)
         < std::tie(other.type_, other.value_, other.language_, other.datatype_);
}

std::string Term::toString() const {
    switch (type_) {
        case NAMED_NODE:
            return "<" + value_ + ">";
        case BLANK_NODE:
            return "_:" + value_;
        case VARIABLE:
            return "?" + value_;
        case DEFAULT_GRAPH:
            return "";
        case LITERAL: {
            std::string out = "\"" + value_ + "\"";
            if (!language_.empty()) {
                out += "@" + language_;
            } else if (!datatype_.empty()) {
                out += "^^<" + datatype_ + ">";
            }
            return out;
        }
    }
    return value_;
}

const Term &Quint::at(term_name name) const {
    switch (name) {
        case SUBJECT:   return subject;
        case PREDICATE: return predicate;
        case OBJECT:    return object;
        case GRAPH:     return graph;
    }
    return graph;
}

bool Quint::sameKey(const Quint &other) const {
    return graph == other.graph
        && subject == other.subject
        && predicate == other.predicate
        && object == other.object;
}

bool Quint::operator==(const Quint &other) const {
    return sameKey(other) && vector == other.vector;
}

} // namespace quint
