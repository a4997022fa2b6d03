#include <gtest/gtest.h>
#include <fstream>
#include <sstream>
#include <iostream>
#include <string>
#include <spdlog/spdlog.h>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

#include "common/error.hpp"
#include "parser/sparql_parser.hpp"

namespace test {

namespace fs = boost::filesystem;

using quint::Term;
using quint::Operation;
using quint::Expression;
using quint::TriplePattern;

class SparqlParserTest : public testing::Test {
protected:
    std::string readSPARQLFromFile(const fs::path& filepath) {
        fs::ifstream infile(filepath, std::ios::in);
        std::ostringstream buf;
        std::string sparql;
        char ch;
        if (infile.is_open()) {
            while (buf && infile.get(ch)) {
                buf.put(ch);
            }
            sparql = buf.str();
        } else {
            std::cerr << "cannot open file: " << filepath << std::endl;
        }
        infile.close();
        return sparql;
    }

    static Term var(const std::string &name) {
        return Term::variable(name);
    }

    static Term iri(const std::string &value) {
        return Term::namedNode(value);
    }
};

TEST_F(SparqlParserTest, IndistinctSparql) {
    std::string sparql = "select ?x ?p where { ?x ?p <FullProfessor0>. }";
    quint::SparqlParser sparqlParser;
    sparqlParser.parse(sparql);

    auto distinct = sparqlParser.isDistinctQuery();
    EXPECT_FALSE(distinct);

    auto query_variables = sparqlParser.getQueryVariables();
    auto expect_variables = std::vector<std::string> {"?x", "?p"};
    EXPECT_EQ(expect_variables, query_variables);

    auto triplets = sparqlParser.getQueryTriplets();
    ASSERT_EQ(1, triplets.size());
    EXPECT_EQ((TriplePattern{var("x"), var("p"), iri("FullProfessor0"), Term::defaultGraph()}), triplets[0]);
}

TEST_F(SparqlParserTest, ParseSparqlInCRLF) {
    std::string sparql = "SELECT   ?v0 ?v1    \r\n"
                         "WHERE     {    \r\n"
                         "?v0 <http://db.uwaterloo.ca/~galuc/wsdbm/likes> ?v1 . \r\n"
                         "?v0 <http://db.uwaterloo.ca/~galuc/wsdbm/subscribes> <http://db.uwaterloo.ca/~galuc/wsdbm/Website36> . \r\n"
                         "}";
    quint::SparqlParser sparqlParser;
    sparqlParser.parse(sparql);

    auto distinct = sparqlParser.isDistinctQuery();
    EXPECT_FALSE(distinct);

    auto query_variables = sparqlParser.getQueryVariables();
    auto expect_variables = std::vector<std::string> {"?v0", "?v1"};
    EXPECT_EQ(expect_variables, query_variables);

    auto triplets = sparqlParser.getQueryTriplets();
    EXPECT_EQ(2, triplets.size());

    std::vector<TriplePattern> answer = {
            {var("v0"), iri("http://db.uwaterloo.ca/~galuc/wsdbm/likes"), var("v1"), Term::defaultGraph()},
            {var("v0"), iri("http://db.uwaterloo.ca/~galuc/wsdbm/subscribes"),
             iri("http://db.uwaterloo.ca/~galuc/wsdbm/Website36"), Term::defaultGraph()},
    };
    for (auto a_beg = answer.begin(), b_beg = triplets.begin();
         a_beg != answer.end() && b_beg != triplets.end();
         a_beg++, b_beg++) {
        EXPECT_EQ(*a_beg, *b_beg);
    }
}

TEST_F(SparqlParserTest, DistinctSparql) {
    std::string sparql = "select distinct ?x ?p where { ?x ?p <FullProfessor0>. }";
    quint::SparqlParser sparqlParser;
    auto query = sparqlParser.parse(sparql);

    auto distinct = sparqlParser.isDistinctQuery();
    EXPECT_TRUE(distinct);
    EXPECT_EQ(Operation::DISTINCT, query.root->type);

    auto query_variables = sparqlParser.getQueryVariables();
    auto expect_variables = std::vector<std::string> {"?x", "?p"};
    EXPECT_EQ(expect_variables, query_variables);
}

TEST_F(SparqlParserTest, ReadSparqlFromFile) {
    fs::path path = fs::temp_directory_path() / fs::unique_path("quint-%%%%-%%%%.sparql");
    {
        fs::ofstream out(path);
        out << "PREFIX ex: <http://ex/>\n# people and their names\nSELECT ?s ?name WHERE { ?s ex:name ?name }\n";
    }
    std::string sparql = readSPARQLFromFile(path);
    fs::remove(path);

    quint::SparqlParser parser;
    auto query = parser.parse(sparql);
    EXPECT_EQ(quint::SELECT_QUERY, query.form);
    EXPECT_EQ("http://ex/", query.prefixes["ex"]);
    auto triplets = parser.getQueryTriplets();
    ASSERT_EQ(1, triplets.size());
    EXPECT_EQ(iri("http://ex/name"), triplets[0].predicate);
}

TEST_F(SparqlParserTest, ParseInsertStatement) {
    std::string sparql = "PREFIX : <http://ex/>\n"
                         "INSERT DATA { :A :likes :B .\n"
                         ":A :likes :C ."
                         ":B :follows :D ."
                         "GRAPH :g { :D :follows :E } "
                         "}";
    quint::SparqlParser parser;
    auto query = parser.parse(sparql);
    EXPECT_EQ(quint::UPDATE_REQUEST, query.form);
    auto quints = parser.getInsertQuints();
    EXPECT_EQ(4, quints.size());

    quint::QuintList answer = {
            {iri("http://ex/A"), iri("http://ex/likes"), iri("http://ex/B")},
            {iri("http://ex/A"), iri("http://ex/likes"), iri("http://ex/C")},
            {iri("http://ex/B"), iri("http://ex/follows"), iri("http://ex/D")},
            {iri("http://ex/D"), iri("http://ex/follows"), iri("http://ex/E"), iri("http://ex/g")},
    };
    for (auto a_beg = answer.begin(), b_beg = quints.begin();
              a_beg != answer.end() && b_beg != quints.end();
              a_beg++, b_beg++) {
        EXPECT_EQ(*a_beg, *b_beg);
    }
}

TEST_F(SparqlParserTest, InsertAndDeleteData) {
    std::string sparql = "DELETE DATA { <http://ex/a> <http://ex/p> \"old\" } ;\n"
                         "INSERT DATA { <http://ex/a> <http://ex/p> \"new\"@en }";
    quint::SparqlParser parser;
    auto query = parser.parse(sparql);
    ASSERT_EQ(1, query.delete_data.size());
    ASSERT_EQ(1, query.insert_data.size());
    EXPECT_EQ(Term::literal("old"), query.delete_data[0].object);
    EXPECT_EQ(Term::langLiteral("new", "en"), query.insert_data[0].object);

    EXPECT_THROW(parser.parse("DELETE WHERE { ?s ?p ?o }"), quint::ParseError);
    EXPECT_THROW(parser.parse("LOAD <http://ex/data.ttl>"), quint::ParseError);
}

TEST_F(SparqlParserTest, SolutionModifiersWrapInOrder) {
    std::string sparql = "SELECT ?s WHERE { ?s ?p ?o . FILTER(?o > -5) } ORDER BY DESC(?s) LIMIT 10 OFFSET 2";
    quint::SparqlParser parser;
    auto query = parser.parse(sparql);

    auto slice = query.root;
    ASSERT_EQ(Operation::SLICE, slice->type);
    EXPECT_EQ(2u, *slice->start);
    EXPECT_EQ(10u, *slice->length);

    auto project = slice->input();
    ASSERT_EQ(Operation::PROJECT, project->type);
    EXPECT_EQ(std::vector<Term>{var("s")}, project->variables);

    auto order = project->input();
    ASSERT_EQ(Operation::ORDER_BY, order->type);
    ASSERT_EQ(1, order->order.size());
    EXPECT_FALSE(order->order[0].ascending);
    EXPECT_TRUE(order->order[0].expression->isVariable());

    auto filter = order->input();
    ASSERT_EQ(Operation::FILTER, filter->type);
    ASSERT_TRUE(filter->expression->isOperator(">"));
    EXPECT_EQ(Term::typedLiteral("-5", quint::xsd::INTEGER), filter->expression->args[1]->term);
    EXPECT_EQ(Operation::BGP, filter->input()->type);
}

TEST_F(SparqlParserTest, OptionalFilterMovesIntoTheLeftJoin) {
    std::string sparql = "SELECT * { ?s <http://ex/p> ?o OPTIONAL { ?s <http://ex/q> ?x FILTER(bound(?x)) } }";
    quint::SparqlParser parser;
    auto query = parser.parse(sparql);

    auto expect_variables = std::vector<std::string> {"?s", "?o", "?x"};
    EXPECT_EQ(expect_variables, parser.getQueryVariables());

    auto left_join = query.root->input();
    ASSERT_EQ(Operation::LEFT_JOIN, left_join->type);
    ASSERT_TRUE(left_join->expression);
    EXPECT_TRUE(left_join->expression->isOperator("bound"));
    EXPECT_EQ(Operation::BGP, left_join->inputs[1]->type);
    EXPECT_EQ(2, parser.getQueryTriplets().size());
}

TEST_F(SparqlParserTest, GraphUnionAndMinus) {
    quint::SparqlParser parser;
    auto graph = parser.parse("SELECT ?g WHERE { GRAPH ?g { ?s ?p ?o } }").root->input();
    ASSERT_EQ(Operation::GRAPH, graph->type);
    EXPECT_EQ(var("g"), graph->graph);

    auto alternatives = parser.parse("SELECT ?s { { ?s a <http://ex/A> } UNION { ?s a <http://ex/B> } }").root->input();
    ASSERT_EQ(Operation::UNION, alternatives->type);
    EXPECT_EQ(iri(quint::rdf::TYPE), alternatives->inputs[0]->patterns[0].predicate);

    auto minus = parser.parse("SELECT ?s { ?s ?p ?o MINUS { ?s <http://ex/hidden> true } }").root->input();
    ASSERT_EQ(Operation::MINUS, minus->type);
    EXPECT_EQ(Term::typedLiteral("true", quint::xsd::BOOLEAN), minus->inputs[1]->patterns[0].object);
}

TEST_F(SparqlParserTest, TermsAndPropertyLists) {
    std::string sparql = "PREFIX ex: <http://ex/>\n"
                         "BASE <http://base/>\n"
                         "SELECT * { ?s ex:name \"Al\\u00E9\"@fr-CA ; ex:age 4.5, 1e3 ; ex:ref <rel> . _:b ex:p ?o }";
    quint::SparqlParser parser;
    parser.parse(sparql);

    auto triplets = parser.getQueryTriplets();
    ASSERT_EQ(5, triplets.size());
    EXPECT_EQ(Term::langLiteral("Al\xC3\xA9", "fr-CA"), triplets[0].object);
    EXPECT_EQ(Term::typedLiteral("4.5", quint::xsd::DECIMAL), triplets[1].object);
    EXPECT_EQ(Term::typedLiteral("1e3", quint::xsd::DOUBLE), triplets[2].object);
    EXPECT_EQ(iri("http://base/rel"), triplets[3].object);
    EXPECT_TRUE(triplets[4].subject.isVariable());

    // the blank node is not a projected variable
    auto expect_variables = std::vector<std::string> {"?s", "?o"};
    EXPECT_EQ(expect_variables, parser.getQueryVariables());
}

TEST_F(SparqlParserTest, ExpressionOperators) {
    std::string sparql = "SELECT ?s { ?s ?p ?o FILTER(?o IN (1, 2) && !(?o NOT IN (3)) || regex(str(?o), \"^a\", \"i\")) }";
    quint::SparqlParser parser;
    auto query = parser.parse(sparql);
    auto expression = query.root->input()->expression;
    ASSERT_TRUE(expression->isOperator("||"));
    auto conjunction = expression->args[0];
    ASSERT_TRUE(conjunction->isOperator("&&"));
    EXPECT_TRUE(conjunction->args[0]->isOperator("in"));
    EXPECT_EQ(3, conjunction->args[0]->args.size());
    EXPECT_TRUE(conjunction->args[1]->isOperator("!"));
    EXPECT_TRUE(conjunction->args[1]->args[0]->isOperator("notin"));
    EXPECT_TRUE(expression->args[1]->isOperator("regex"));
    EXPECT_EQ(3, expression->args[1]->args.size());

    auto exists = parser.parse("ASK { ?s ?p ?o FILTER NOT EXISTS { ?o ?q ?s } }").root->input()->expression;
    ASSERT_EQ(Expression::EXISTENCE_EXPR, exists->type);
    EXPECT_TRUE(exists->not_exists);
}

TEST_F(SparqlParserTest, QueryForms) {
    quint::SparqlParser parser;
    auto ask = parser.parse("ASK { <http://ex/a> ?p ?o }");
    EXPECT_EQ(quint::ASK_QUERY, ask.form);
    EXPECT_EQ(Operation::ASK, ask.root->type);

    auto construct = parser.parse("CONSTRUCT { ?s <http://ex/copy> ?o } WHERE { ?s <http://ex/p> ?o }");
    EXPECT_EQ(quint::CONSTRUCT_QUERY, construct.form);
    ASSERT_EQ(1, construct.root->patterns.size());
    EXPECT_EQ(iri("http://ex/copy"), construct.root->patterns[0].predicate);

    auto short_construct = parser.parse("CONSTRUCT WHERE { ?s <http://ex/p> ?o }");
    EXPECT_EQ(1, short_construct.root->patterns.size());

    auto describe = parser.parse("DESCRIBE <http://ex/a>");
    EXPECT_EQ(quint::DESCRIBE_QUERY, describe.form);
    EXPECT_EQ(std::vector<Term>{iri("http://ex/a")}, describe.root->variables);
}

TEST_F(SparqlParserTest, UnsupportedSyntax) {
    quint::SparqlParser parser;
    EXPECT_THROW(parser.parse("SELECT ?s { ?s <http://ex/p>/<http://ex/q> ?o }"), quint::ParseError);
    EXPECT_THROW(parser.parse("SELECT ?s { ?s ?p ?o BIND(1 AS ?x) }"), quint::ParseError);
    EXPECT_THROW(parser.parse("SELECT ?s { ?s ex:p ?o }"), quint::ParseError);
    EXPECT_THROW(parser.parse("SELECT ?s { ?s ?p ?o } GROUP BY ?s"), quint::ParseError);
    EXPECT_THROW(parser.parse("SELECT (COUNT(?s) AS ?n) { ?s ?p ?o }"), quint::ParseError);
    EXPECT_THROW(parser.parse("SELECT ?s FROM <http://ex/g> { ?s ?p ?o }"), quint::ParseError);
    EXPECT_THROW(parser.parse("SELECT ?s { ?s ?p \"open }"), quint::ParseError);
    EXPECT_THROW(parser.parse("SELECT ?s { ?s ?p ?o"), quint::ParseError);
}

TEST_F(SparqlParserTest, Classify) {
    EXPECT_EQ(quint::SELECT_QUERY, quint::SparqlParser::classify("select * { ?s ?p ?o }"));
    EXPECT_EQ(quint::ASK_QUERY, quint::SparqlParser::classify("PREFIX ex: <http://ex/> ASK { ?s ex:p ?o }"));
    EXPECT_EQ(quint::CONSTRUCT_QUERY, quint::SparqlParser::classify("BASE <http://b/> CONSTRUCT WHERE { ?s ?p ?o }"));
    EXPECT_EQ(quint::DESCRIBE_QUERY, quint::SparqlParser::classify("DESCRIBE <http://ex/a>"));
    EXPECT_EQ(quint::UPDATE_REQUEST, quint::SparqlParser::classify("DELETE WHERE { ?s ?p ?o }"));
    EXPECT_THROW(quint::SparqlParser::classify("hello world"), quint::ParseError);
}

TEST_F(SparqlParserTest, ParseData) {
    std::string text = "@prefix ex: <http://ex/> .\n"
                       "ex:a ex:p \"x\" .\n"
                       "<http://ex/b> <http://ex/p> _:n1 <http://ex/g1> .\n"
                       "ex:g2 { ex:c a ex:C }\n"
                       "GRAPH ex:g3 { ex:d ex:p 42 }\n";
    quint::SparqlParser parser;
    auto quints = parser.parseData(text, iri("http://ex/default"));
    ASSERT_EQ(4, quints.size());
    EXPECT_EQ(iri("http://ex/default"), quints[0].graph);
    EXPECT_EQ(Term::blankNode("n1"), quints[1].object);
    EXPECT_EQ(iri("http://ex/g1"), quints[1].graph);
    EXPECT_EQ(iri(quint::rdf::TYPE), quints[2].predicate);
    EXPECT_EQ(iri("http://ex/g2"), quints[2].graph);
    EXPECT_EQ(Term::typedLiteral("42", quint::xsd::INTEGER), quints[3].object);
    EXPECT_EQ(iri("http://ex/g3"), quints[3].graph);

    EXPECT_THROW(parser.parseData("?s <http://ex/p> <http://ex/o> ."), quint::ParseError);
}

} // namespace test
