#include <gtest/gtest.h>
#include <set>
#include <string>
#include <vector>

#include "database/quint_store.hpp"
#include "parser/sparql_parser.hpp"
#include "query/query_optimizer.hpp"

namespace test {

using quint::Term;
using quint::Quint;
using quint::Binding;
using quint::TermMatch;
using quint::QuintPattern;
using quint::SolutionSet;
using quint::QueryContext;
using quint::TermOperators;
using quint::QueryOptimizer;
using quint::OptimizationResult;

class QueryOptimizerTest : public testing::Test {
protected:
    void SetUp() override {
        store_ = quint::QuintStoreBuilder::Create("sqlite::memory:");
        store_->open();
        store_->multiPut({
                Quint(iri("alice"), iri("age"), integer(30), iri("alice/profile")),
                Quint(iri("alice"), iri("name"), Term::literal("Alice"), iri("alice/profile")),
                Quint(iri("alice"), iri("nick"), Term::literal("Al"), iri("alice/profile")),
                Quint(iri("bob"), iri("age"), integer(25), iri("bob/profile")),
                Quint(iri("bob"), iri("name"), Term::literal("Bob"), iri("bob/profile")),
                Quint(iri("bob"), iri("nick"), Term::literal("Bobby")),
                Quint(iri("carol"), iri("age"), integer(41), iri("carol/profile")),
                Quint(iri("dave"), iri("age"), integer(19)),
        });
        optimizer_ = std::make_shared<QueryOptimizer>(store_);
    }

    void TearDown() override {
        store_->close();
    }

    static Term iri(const std::string &value) {
        return Term::namedNode("http://ex/" + value);
    }

    static Term integer(int value) {
        return Term::typedLiteral(std::to_string(value), quint::xsd::INTEGER);
    }

    static quint::OperationPtr algebra(const std::string &query) {
        quint::SparqlParser parser;
        return parser.parse(query).root;
    }

    SolutionSet run(const std::string &query, const QueryContext &context = {}) {
        auto plan = optimizer_->analyzeQuery(algebra(query));
        EXPECT_NE(OptimizationResult::NOT_OPTIMIZED, plan.type) << query;
        return optimizer_->execute(plan, context);
    }

    static std::set<Term> column(const SolutionSet &solutions, const std::string &variable) {
        std::set<Term> values;
        for (const auto &row : solutions) {
            auto it = row.find(variable);
            if (it != row.end()) values.insert(it->second);
        }
        return values;
    }

    std::shared_ptr<quint::QuintStore> store_;
    std::shared_ptr<QueryOptimizer> optimizer_;
};

TEST_F(QueryOptimizerTest, AnalyzeOptional) {
    auto analysis = optimizer_->analyzeOptional(algebra(
            "SELECT ?s ?name ?mail WHERE { ?s <http://ex/age> ?age "
            "OPTIONAL { ?s <http://ex/name> ?name } OPTIONAL { ?s <http://ex/mbox> ?mail } }"));
    ASSERT_TRUE(analysis);
    EXPECT_EQ("s", analysis->subject_variable);
    EXPECT_EQ((std::vector<Term>{iri("name"), iri("mbox")}), analysis->predicates);
    ASSERT_EQ(2u, analysis->optional_variables.size());
    EXPECT_EQ(iri("name"), analysis->optional_variables[0].first);
    EXPECT_EQ("name", analysis->optional_variables[0].second);
    EXPECT_EQ("mail", analysis->optional_variables[1].second);
    ASSERT_EQ(1u, analysis->core.patterns.size());
    EXPECT_EQ(iri("age"), analysis->core.patterns[0].predicate);
    EXPECT_FALSE(analysis->graph);

    analysis = optimizer_->analyzeOptional(algebra(
            "SELECT * { GRAPH <http://ex/g> { ?s <http://ex/age> ?age FILTER(?age > 20) "
            "OPTIONAL { ?s <http://ex/name> ?name } } }"));
    ASSERT_TRUE(analysis);
    ASSERT_TRUE(analysis->graph);
    EXPECT_EQ(iri("g"), *analysis->graph);
    EXPECT_EQ(iri("g"), analysis->core.patterns[0].graph);
    ASSERT_EQ(1u, analysis->core.filters[0].count("age"));
    EXPECT_TRUE(analysis->core.filters[0].at("age").gt);
}

TEST_F(QueryOptimizerTest, OptionalNotEligible) {
    // FILTER inside the OPTIONAL
    EXPECT_FALSE(optimizer_->analyzeOptional(algebra(
            "SELECT * { ?s <http://ex/age> ?a OPTIONAL { ?s <http://ex/name> ?n FILTER(?n != \"x\") } }")));
    // another subject
    EXPECT_FALSE(optimizer_->analyzeOptional(algebra(
            "SELECT * { ?s <http://ex/knows> ?o OPTIONAL { ?o <http://ex/name> ?n } }")));
    // variable predicate
    EXPECT_FALSE(optimizer_->analyzeOptional(algebra(
            "SELECT * { ?s <http://ex/age> ?a OPTIONAL { ?s ?p ?n } }")));
    // the optional value joins with the core
    EXPECT_FALSE(optimizer_->analyzeOptional(algebra(
            "SELECT * { ?s <http://ex/age> ?a OPTIONAL { ?s <http://ex/name> ?a } }")));
    // two patterns in one block
    EXPECT_FALSE(optimizer_->analyzeOptional(algebra(
            "SELECT * { ?s <http://ex/age> ?a OPTIONAL { ?s <http://ex/name> ?n . ?s <http://ex/nick> ?k } }")));
    // one graph per row
    EXPECT_FALSE(optimizer_->analyzeOptional(algebra(
            "SELECT * { GRAPH ?g { ?s <http://ex/age> ?a OPTIONAL { ?s <http://ex/name> ?n } } }")));
    // a filter on an optional value
    EXPECT_FALSE(optimizer_->analyzeOptional(algebra(
            "SELECT * { ?s <http://ex/age> ?a OPTIONAL { ?s <http://ex/name> ?n } FILTER(?n = \"Bob\") }")));
    EXPECT_FALSE(optimizer_->analyzeOptional(algebra("SELECT * { ?s <http://ex/age> ?a }")));
}

TEST_F(QueryOptimizerTest, AnalyzeCompound) {
    auto analysis = optimizer_->analyzeCompound(algebra(
            "SELECT ?s ?name WHERE { ?s <http://ex/age> ?age . ?s <http://ex/name> ?name "
            "FILTER(?age >= 18 && STRSTARTS(?name, \"A\")) }"));
    ASSERT_TRUE(analysis);
    EXPECT_EQ("s", analysis->join_variable);
    EXPECT_EQ(quint::SUBJECT, analysis->join_field);
    ASSERT_EQ(2u, analysis->patterns.size());
    ASSERT_EQ(2u, analysis->filters.size());
    ASSERT_EQ(1u, analysis->filters[0].count("age"));
    EXPECT_TRUE(analysis->filters[0].at("age").gte);
    ASSERT_EQ(1u, analysis->filters[1].count("name"));
    EXPECT_EQ("\"A", *analysis->filters[1].at("name").starts_with);

    // groups joined by JOIN flatten into one pattern list
    analysis = optimizer_->analyzeCompound(algebra(
            "SELECT * { { ?s <http://ex/age> ?age } { ?s <http://ex/name> ?name . ?s <http://ex/nick> ?nick } }"));
    ASSERT_TRUE(analysis);
    EXPECT_EQ(3u, analysis->patterns.size());
}

TEST_F(QueryOptimizerTest, CompoundNotEligible) {
    EXPECT_FALSE(optimizer_->analyzeCompound(algebra("SELECT * { ?s <http://ex/age> ?age }")));
    EXPECT_FALSE(optimizer_->analyzeCompound(algebra(
            "SELECT * { ?s <http://ex/knows> ?o . ?o <http://ex/name> ?name }")));
    EXPECT_FALSE(optimizer_->analyzeCompound(algebra(
            "SELECT * { <http://ex/alice> <http://ex/age> ?age . ?s <http://ex/name> ?name }")));
    EXPECT_FALSE(optimizer_->analyzeCompound(algebra(
            "SELECT * { ?s <http://ex/name> ?n . ?s <http://ex/nick> ?n }")));
    EXPECT_FALSE(optimizer_->analyzeCompound(algebra(
            "SELECT * { ?s <http://ex/age> ?a . ?s <http://ex/name> ?n FILTER(?a = ?n) }")));
    EXPECT_FALSE(optimizer_->analyzeCompound(algebra(
            "SELECT * { ?s <http://ex/age> ?a . ?s <http://ex/name> ?n FILTER(REGEX(?n, \"^A\")) }")));
    EXPECT_FALSE(optimizer_->analyzeCompound(algebra(
            "SELECT * { ?s <http://ex/age> ?a . ?s <http://ex/name> ?n } ORDER BY STR(?n)")));
    EXPECT_FALSE(optimizer_->analyzeCompound(algebra(
            "SELECT * { { ?s <http://ex/age> ?a } UNION { ?s <http://ex/name> ?n } }")));
}

TEST_F(QueryOptimizerTest, AnalyzeQueryKeepsModifiers) {
    auto plan = optimizer_->analyzeQuery(algebra(
            "SELECT DISTINCT ?s ?name { ?s <http://ex/age> ?age OPTIONAL { ?s <http://ex/name> ?name } } "
            "ORDER BY DESC(?name) LIMIT 2 OFFSET 1"));
    EXPECT_EQ(OptimizationResult::OPTIONAL_BATCH, plan.type);
    EXPECT_EQ((std::vector<std::string>{"s", "name"}), plan.modifiers.variables);
    EXPECT_TRUE(plan.modifiers.distinct);
    EXPECT_EQ(2u, *plan.modifiers.limit);
    EXPECT_EQ(1u, *plan.modifiers.offset);
    EXPECT_EQ("name", *plan.modifiers.order_variable);
    EXPECT_TRUE(plan.modifiers.reverse);

    plan = optimizer_->analyzeQuery(algebra("ASK { ?s <http://ex/age> ?age . ?s <http://ex/nick> ?nick }"));
    EXPECT_EQ(OptimizationResult::COMPOUND_JOIN, plan.type);

    plan = optimizer_->analyzeQuery(algebra("SELECT * { ?s ?p ?o . ?o ?q ?s }"));
    EXPECT_EQ(OptimizationResult::NOT_OPTIMIZED, plan.type);
}

TEST_F(QueryOptimizerTest, CompoundJoinsInsideOneGraph) {
    auto result = run("SELECT ?s ?age ?name { ?s <http://ex/age> ?age . ?s <http://ex/name> ?name }");
    EXPECT_EQ((std::vector<std::string>{"s", "age", "name"}), result.variables());
    EXPECT_EQ(2u, result.size());
    EXPECT_EQ((std::set<Term>{iri("alice"), iri("bob")}), column(result, "s"));

    result = run("SELECT ?s { ?s <http://ex/age> ?age . ?s <http://ex/name> ?name FILTER(?age > 26) }");
    ASSERT_EQ(1u, result.size());
    EXPECT_EQ(iri("alice"), result[0].at("s"));
    EXPECT_EQ(0u, result[0].count("age"));

    // bob's nick lives in the default graph, away from his name
    result = run("SELECT ?s ?nick { ?s <http://ex/name> ?name . ?s <http://ex/nick> ?nick }");
    ASSERT_EQ(1u, result.size());
    EXPECT_EQ(Term::literal("Al"), result[0].at("nick"));
}

TEST_F(QueryOptimizerTest, CompoundGraphVariable) {
    auto result = run("SELECT ?g ?s { GRAPH ?g { ?s <http://ex/age> ?age . ?s <http://ex/name> ?name } }");
    EXPECT_EQ(2u, result.size());
    EXPECT_EQ((std::set<Term>{iri("alice/profile"), iri("bob/profile")}), column(result, "g"));
}

TEST_F(QueryOptimizerTest, CompoundSliceAndOrder) {
    auto result = run("SELECT ?s { ?s <http://ex/age> ?age . ?s <http://ex/name> ?name } "
                      "ORDER BY ?age LIMIT 1 OFFSET 1");
    ASSERT_EQ(1u, result.size());
    EXPECT_EQ(iri("alice"), result[0].at("s"));

    result = run("SELECT ?s { ?s <http://ex/age> ?age . ?s <http://ex/name> ?name } LIMIT 1");
    EXPECT_EQ(1u, result.size());

    result = run("SELECT ?s { ?s <http://ex/age> ?age . ?s <http://ex/name> ?name } "
                 "LIMIT 18446744073709551615 OFFSET 1");
    EXPECT_EQ(1u, result.size());
}

TEST_F(QueryOptimizerTest, OptionalBindsFirstValues) {
    auto result = run("SELECT ?s ?name ?nick { ?s <http://ex/age> ?age "
                      "OPTIONAL { ?s <http://ex/name> ?name } OPTIONAL { ?s <http://ex/nick> ?nick } } "
                      "ORDER BY DESC(?name)");
    EXPECT_EQ((std::vector<std::string>{"s", "name", "nick"}), result.variables());
    ASSERT_EQ(4u, result.size());
    EXPECT_EQ(iri("bob"), result[0].at("s"));
    EXPECT_EQ(Term::literal("Bob"), result[0].at("name"));
    // optional values are looked up in every graph
    EXPECT_EQ(Term::literal("Bobby"), result[0].at("nick"));
    EXPECT_EQ(iri("alice"), result[1].at("s"));
    EXPECT_EQ(Term::literal("Al"), result[1].at("nick"));
    for (size_t i = 2; i < result.size(); ++i) {
        EXPECT_EQ(0u, result[i].count("name"));
        EXPECT_EQ(0u, result[i].count("nick"));
    }
    EXPECT_EQ((std::set<Term>{iri("carol"), iri("dave")}),
              (std::set<Term>{result[2].at("s"), result[3].at("s")}));
}

TEST_F(QueryOptimizerTest, OptionalWithoutMatches) {
    auto result = run("SELECT * { ?s <http://ex/age> ?age OPTIONAL { ?s <http://ex/unknown> ?x } }");
    EXPECT_EQ(4u, result.size());
    EXPECT_TRUE(column(result, "x").empty());

    result = run("SELECT * { ?s <http://ex/age> ?age FILTER(?age > 100) OPTIONAL { ?s <http://ex/name> ?n } }");
    EXPECT_TRUE(result.empty());
}

TEST_F(QueryOptimizerTest, OptionalUnderSecurityFilter) {
    TermOperators pod;
    pod.starts_with = "http://ex/bob/";
    QueryContext context;
    context.security_filters = QuintPattern();
    context.security_filters->graph = TermMatch(pod);

    auto result = run("SELECT ?s ?name ?nick { ?s <http://ex/age> ?age "
                      "OPTIONAL { ?s <http://ex/name> ?name } OPTIONAL { ?s <http://ex/nick> ?nick } }", context);
    ASSERT_EQ(1u, result.size());
    EXPECT_EQ(iri("bob"), result[0].at("s"));
    EXPECT_EQ(Term::literal("Bob"), result[0].at("name"));
    // the nick sits outside the pod
    EXPECT_EQ(0u, result[0].count("nick"));
}

TEST_F(QueryOptimizerTest, ExecuteOptionalOnGivenRows) {
    auto analysis = optimizer_->analyzeOptional(algebra(
            "SELECT * { ?s <http://ex/age> ?age OPTIONAL { ?s <http://ex/name> ?name } }"));
    ASSERT_TRUE(analysis);

    SolutionSet core(std::vector<std::string>{"s"});
    EXPECT_TRUE(optimizer_->executeOptionalOptimized(*analysis, core).empty());

    core.push_back({{"s", iri("alice")}});
    core.push_back({{"s", iri("nobody")}});
    core.push_back({});
    auto result = optimizer_->executeOptionalOptimized(*analysis, core, {}, std::string("name"));
    EXPECT_EQ((std::vector<std::string>{"s", "name"}), result.variables());
    ASSERT_EQ(3u, result.size());
    EXPECT_EQ(Term::literal("Alice"), result[0].at("name"));
    EXPECT_EQ(0u, result[1].count("name"));
    EXPECT_EQ(0u, result[2].count("name"));
}

TEST_F(QueryOptimizerTest, SortSolutions) {
    std::vector<Binding> rows = {
            Binding{{"v", Term::literal("b")}},
            Binding{},
            Binding{{"v", integer(10)}},
            Binding{{"v", integer(2)}},
            Binding{{"v", Term::literal("a")}},
    };
    QueryOptimizer::sortSolutions(rows, "v", false);
    EXPECT_EQ(integer(2), rows[0].at("v"));
    EXPECT_EQ(integer(10), rows[1].at("v"));
    EXPECT_EQ(Term::literal("a"), rows[2].at("v"));
    EXPECT_EQ(Term::literal("b"), rows[3].at("v"));
    EXPECT_EQ(0u, rows[4].count("v"));

    // unbound stays last
    QueryOptimizer::sortSolutions(rows, "v", true);
    EXPECT_EQ(Term::literal("b"), rows[0].at("v"));
    EXPECT_EQ(Term::literal("a"), rows[1].at("v"));
    EXPECT_EQ(integer(10), rows[2].at("v"));
    EXPECT_EQ(integer(2), rows[3].at("v"));
    EXPECT_EQ(0u, rows[4].count("v"));
}

} // namespace test
