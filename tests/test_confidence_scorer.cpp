#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "inference/confidence_scorer.hpp"
#include "inference/relationship_inference.hpp"
#include "fixtures/schema_fixtures.hpp"

using namespace schemagraph;
using namespace schemagraph::fixtures;
using Catch::Approx;

namespace {

struct Candidate {
    const TableInfo* source_table;
    const ColumnInfo* source_column;
    const TableInfo* target_table;
    const ColumnInfo* target_key;
};

Candidate candidate(const SchemaModel& schema, const std::string& source_table,
                    const std::string& source_column, const std::string& target_table) {
    Candidate c{};
    c.source_table = schema.find_table(source_table);
    c.target_table = schema.find_table(target_table);
    REQUIRE(c.source_table != nullptr);
    REQUIRE(c.target_table != nullptr);
    c.source_column = c.source_table->find_column(source_column);
    c.target_key = c.target_table->primary_key_column();
    REQUIRE(c.source_column != nullptr);
    REQUIRE(c.target_key != nullptr);
    return c;
}

std::optional<ScoredCandidate> score(const ConfidenceScorer& scorer, const Candidate& c) {
    return scorer.score(*c.source_column, *c.source_table, *c.target_table, *c.target_key);
}

} // anonymous namespace

TEST_CASE("ConfidenceScorer exact tier", "[scorer]") {
    const ConfidenceScorer scorer;

    SECTION("Same declared type scores highest") {
        const auto schema = make_schema({
            table("customers", {column("customer_id", "integer", true)}),
            table("orders", {column("order_id", "integer", true), column("customer_id", "integer")}),
        });
        const auto result = score(scorer, candidate(schema, "orders", "customer_id", "customers"));
        REQUIRE(result.has_value());
        CHECK(result->basis == Basis::EXACT_MATCH);
        CHECK(result->score == Approx(0.98));
    }

    SECTION("Only the type class agrees") {
        const auto schema = make_schema({
            table("customers", {column("customer_id", "integer", true)}),
            table("orders", {column("order_id", "integer", true), column("customer_id", "bigint")}),
        });
        const auto result = score(scorer, candidate(schema, "orders", "customer_id", "customers"));
        REQUIRE(result.has_value());
        CHECK(result->basis == Basis::EXACT_MATCH);
        CHECK(result->score == Approx(0.95));
    }

    SECTION("Type parameters do not break an exact match") {
        const auto schema = make_schema({
            table("accounts", {column("account_id", "varchar(36)", true)}),
            table("payments", {column("payment_id", "integer", true), column("ACCOUNT_ID", "VARCHAR(64)")}),
        });
        const auto result = score(scorer, candidate(schema, "payments", "ACCOUNT_ID", "accounts"));
        REQUIRE(result.has_value());
        CHECK(result->basis == Basis::EXACT_MATCH);
        CHECK(result->score == Approx(0.98));
    }
}

TEST_CASE("ConfidenceScorer pattern tier", "[scorer]") {
    const ConfidenceScorer scorer;

    SECTION("Stem names the table, key is a plain id") {
        const auto schema = make_schema({
            table("customers", {column("id", "integer", true)}),
            table("orders", {column("id", "integer", true), column("customer_id", "integer")}),
        });
        const auto result = score(scorer, candidate(schema, "orders", "customer_id", "customers"));
        REQUIRE(result.has_value());
        CHECK(result->basis == Basis::PATTERN_MATCH);
        CHECK(result->score == Approx(0.92));
    }

    SECTION("Near miss scores lower") {
        const auto schema = make_schema({
            table("customers", {column("id", "integer", true)}),
            table("orders", {column("id", "integer", true), column("custmer_id", "integer")}),
        });
        const auto result = score(scorer, candidate(schema, "orders", "custmer_id", "customers"));
        REQUIRE(result.has_value());
        CHECK(result->basis == Basis::PATTERN_MATCH);
        // similarity 0.875 -> 0.50 + 0.42 * 0.5
        CHECK(result->score == Approx(0.71));
    }

    SECTION("Unrelated names are rejected") {
        const auto schema = make_schema({
            table("customers", {column("id", "integer", true)}),
            table("orders", {column("id", "integer", true), column("vendor_id", "integer")}),
        });
        CHECK_FALSE(score(scorer, candidate(schema, "orders", "vendor_id", "customers")).has_value());
    }

    SECTION("Stricter minimum similarity rejects near misses") {
        ConfidenceScorer::Config cfg;
        cfg.min_similarity = 0.9;
        const ConfidenceScorer strict(cfg);

        const auto schema = make_schema({
            table("customers", {column("id", "integer", true)}),
            table("orders", {column("id", "integer", true), column("custmer_id", "integer")}),
        });
        CHECK_FALSE(score(strict, candidate(schema, "orders", "custmer_id", "customers")).has_value());
    }

    SECTION("Name similarity of the pattern tier") {
        CHECK(ConfidenceScorer::name_similarity("custmer_id", "customers", "id") == Approx(0.875));
        CHECK(ConfidenceScorer::name_similarity("customer_id", "clients", "customer_id") == Approx(1.0));
        CHECK(ConfidenceScorer::name_similarity("id", "customers", "id") == Approx(0.0));
        CHECK(ConfidenceScorer::name_similarity("cost", "posts", "post_id") == Approx(0.0));
        CHECK(ConfidenceScorer::name_similarity("customer", "customers", "id") == Approx(1.0));
    }
}

TEST_CASE("ConfidenceScorer needs a key marker for fuzzy matches", "[scorer]") {
    const ConfidenceScorer scorer;
    const auto schema = make_schema({
        table("posts", {column("post_id", "integer", true)}),
        table("banks", {column("bank_id", "integer", true)}),
        table("books", {column("book_id", "integer", true)}),
        table("customers", {column("id", "integer", true)}),
        table("products", {column("product_id", "integer", true),
                           column("cost", "integer"),
                           column("rank", "integer"),
                           column("hooks", "integer"),
                           column("customer", "integer")}),
    });

    SECTION("One letter away from a table name is not enough") {
        CHECK_FALSE(score(scorer, candidate(schema, "products", "cost", "posts")).has_value());
        CHECK_FALSE(score(scorer, candidate(schema, "products", "rank", "banks")).has_value());
        CHECK_FALSE(score(scorer, candidate(schema, "products", "hooks", "books")).has_value());
    }

    SECTION("An exact entity name still matches") {
        const auto result = score(scorer, candidate(schema, "products", "customer", "customers"));
        REQUIRE(result.has_value());
        CHECK(result->basis == Basis::PATTERN_MATCH);
        CHECK(result->score == Approx(0.92));
    }

    SECTION("Whole schema infers nothing from measurement columns") {
        const auto rels = infer_relationships(schema);
        CHECK(find_fk(rels, "products", "cost") == nullptr);
        CHECK(find_fk(rels, "products", "rank") == nullptr);
        CHECK(find_fk(rels, "products", "hooks") == nullptr);
        REQUIRE(find_fk(rels, "products", "customer") != nullptr);
        CHECK(find_fk(rels, "products", "customer")->target_table == "customers");
    }
}

TEST_CASE("ConfidenceScorer type gate", "[scorer]") {
    const ConfidenceScorer scorer;
    const auto schema = make_schema({
        table("customers", {column("customer_id", "integer", true)}),
        table("orders", {column("order_id", "integer", true), column("customer_id", "varchar(20)")}),
    });
    CHECK_FALSE(score(scorer, candidate(schema, "orders", "customer_id", "customers")).has_value());
}

TEST_CASE("ConfidenceScorer generic names", "[scorer]") {
    const ConfidenceScorer scorer;

    CHECK(scorer.is_generic_name("status"));
    CHECK(scorer.is_generic_name("Status"));
    CHECK(scorer.is_generic_name("ID"));
    CHECK(scorer.is_generic_name("created_at"));
    CHECK_FALSE(scorer.is_generic_name("customer_id"));

    const auto schema = make_schema({
        table("status", {column("status", "integer", true)}),
        table("orders", {column("order_id", "integer", true), column("status", "integer")}),
    });
    CHECK_FALSE(score(scorer, candidate(schema, "orders", "status", "status")).has_value());

    SECTION("Configured generic names") {
        ConfidenceScorer::Config cfg;
        cfg.generic_names.push_back("Customer_ID");
        const ConfidenceScorer custom(cfg);
        CHECK(custom.is_generic_name("customer_id"));
    }
}

TEST_CASE("ConfidenceScorer self references", "[scorer]") {
    const ConfidenceScorer scorer;
    const auto schema = make_schema({
        table("employees", {column("employee_id", "integer", true),
                            column("manager_id", "integer"),
                            column("department_id", "integer")}),
        table("categories", {column("category_id", "integer", true),
                             column("parent_category_id", "integer"),
                             column("parent", "integer")}),
        table("departments", {column("department_id", "integer", true),
                              column("manager_id", "integer")}),
    });

    SECTION("Hierarchical name with key suffix") {
        const auto result = score(scorer, candidate(schema, "categories", "parent_category_id", "categories"));
        REQUIRE(result.has_value());
        CHECK(result->basis == Basis::HIERARCHICAL);
        CHECK(result->score == Approx(0.90));
    }

    SECTION("Bare hierarchical name") {
        const auto result = score(scorer, candidate(schema, "categories", "parent", "categories"));
        REQUIRE(result.has_value());
        CHECK(result->basis == Basis::HIERARCHICAL);
        CHECK(result->score == Approx(0.85));
    }

    SECTION("Other columns never point at their own table") {
        CHECK_FALSE(score(scorer, candidate(schema, "employees", "department_id", "employees")).has_value());
    }

    SECTION("Person-style names are not hierarchical by default") {
        CHECK_FALSE(score(scorer, candidate(schema, "departments", "manager_id", "departments")).has_value());
        CHECK_FALSE(score(scorer, candidate(schema, "employees", "manager_id", "employees")).has_value());
    }

    SECTION("Configured markers") {
        ConfidenceScorer::Config cfg;
        cfg.hierarchical_markers.push_back("manager");
        const ConfidenceScorer people(cfg);

        const auto result = score(people, candidate(schema, "employees", "manager_id", "employees"));
        REQUIRE(result.has_value());
        CHECK(result->basis == Basis::HIERARCHICAL);
        CHECK(result->score == Approx(0.90));
    }

    SECTION("Marker detection") {
        CHECK(scorer.is_hierarchical_name("parent_category_id"));
        CHECK(scorer.is_hierarchical_name("category_parent"));
        CHECK(scorer.is_hierarchical_name("ParentId"));
        CHECK_FALSE(scorer.is_hierarchical_name("manager_id"));
        CHECK_FALSE(scorer.is_hierarchical_name("transparent_id"));
        CHECK_FALSE(scorer.is_hierarchical_name("customer_id"));

        ConfidenceScorer::Config cfg;
        cfg.hierarchical_markers = {"reports_to", "supervisor"};
        const ConfidenceScorer custom(cfg);
        CHECK(custom.is_hierarchical_name("reports_to"));
        CHECK(custom.is_hierarchical_name("SupervisorId"));
        CHECK_FALSE(custom.is_hierarchical_name("parent_id"));
    }
}

TEST_CASE("ConfidenceScorer tier ordering", "[scorer]") {
    const ConfidenceScorer::Config cfg;
    CHECK(cfg.exact_typed_score > cfg.exact_score);
    CHECK(cfg.exact_score > cfg.pattern_max_score);
    CHECK(cfg.pattern_max_score > cfg.hierarchical_score);
    CHECK(cfg.hierarchical_score > cfg.hierarchical_bare_score);
    CHECK(cfg.pattern_min_score >= 0.0);
    CHECK(cfg.exact_typed_score <= 1.0);
}
