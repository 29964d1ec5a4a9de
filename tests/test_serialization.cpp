#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "serialization/schema_reader.hpp"
#include "serialization/relationship_writer.hpp"
#include "serialization/graph_writer.hpp"
#include "serialization/file_io.hpp"
#include "graph/graph_builder.hpp"
#include "inference/relationship_inference.hpp"
#include "fixtures/schema_fixtures.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>

using namespace schemagraph;
using namespace schemagraph::fixtures;
using json = nlohmann::json;
using Catch::Approx;

namespace {

const char* kShopJson = R"json({
  "database": "shop",
  "database_type": "postgresql",
  "tables": [
    {
      "name": "customers",
      "columns": [
        {"name": "customer_id", "type": "integer", "nullable": false, "is_primary_key": true},
        {"name": "email", "type": "varchar(255)"}
      ],
      "primary_key": "customer_id",
      "foreign_keys": []
    },
    {
      "name": "orders",
      "columns": [
        {"name": "order_id", "type": "integer", "primary_key": true},
        {"name": "customer_id", "type": "integer", "nullable": true}
      ],
      "foreign_keys": [
        {"column": "customer_id", "references_table": "customers", "references_column": "customer_id"}
      ]
    }
  ]
})json";

} // anonymous namespace

TEST_CASE("Schema description reader", "[serialization]") {

    SECTION("Reads a complete document") {
        const auto result = parse_schema_description(kShopJson);
        REQUIRE(result.is_ok());
        const auto& schema = result.value();
        CHECK(schema.database == "shop");
        CHECK(schema.database_type == "postgresql");
        REQUIRE(schema.tables.size() == 2);

        const auto& customers = schema.tables[0];
        CHECK(customers.name == "customers");
        CHECK(customers.primary_key == "customer_id");
        REQUIRE(customers.columns.size() == 2);
        CHECK_FALSE(customers.columns[0].nullable);
        CHECK(customers.columns[0].is_primary_key);
        CHECK(customers.columns[1].nullable);

        const auto& orders = schema.tables[1];
        CHECK(orders.columns[0].is_primary_key);
        CHECK_FALSE(orders.primary_key.has_value());
        REQUIRE(orders.foreign_keys.size() == 1);
        CHECK(orders.foreign_keys[0] ==
              DeclaredForeignKey{"customer_id", "customers", "customer_id"});
    }

    SECTION("Malformed JSON") {
        const auto result = parse_schema_description("{ not json");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::INVALID_SCHEMA);
        CHECK(result.error_message().find("malformed") != std::string::npos);
    }

    SECTION("Wrong shapes are all reported") {
        const auto result = parse_schema_description(R"({
            "database": 42,
            "tables": [ {"name": "t", "columns": {"id": "integer"}},
                        {"name": "u", "columns": [ {"name": "id", "type": "int", "nullable": "no"} ]} ]
        })");
        REQUIRE(result.is_error());
        CHECK(result.error_message().find("'database' must be a string") != std::string::npos);
        CHECK(result.error_message().find("table 't': 'columns' must be an array") != std::string::npos);
        CHECK(result.error_message().find("'nullable' must be a boolean") != std::string::npos);
    }

    SECTION("Missing tables and unknown database type") {
        CHECK(parse_schema_description(R"({"database": "x"})").is_error());

        const auto result = parse_schema_description(R"({"database_type": "cassandra", "tables": []})");
        REQUIRE(result.is_error());
        CHECK(result.error_message().find("cassandra") != std::string::npos);
    }

    SECTION("Missing file") {
        const auto result = read_schema_file("/nonexistent/schema.json");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::IO_ERROR);
    }
}

TEST_CASE("Relationship YAML", "[serialization]") {
    const auto schema = make_schema(shop_tables());
    const auto rels = infer_relationships(schema);
    const auto text = relationships_to_yaml(rels);

    const YAML::Node doc = YAML::Load(text);
    REQUIRE(doc.IsMap());
    CHECK(doc.size() == 4);

    const auto orders = doc["orders"];
    CHECK(orders["primary_key"].as<std::string>() == "order_id");
    REQUIRE(orders["foreign_keys"].IsSequence());
    REQUIRE(orders["foreign_keys"].size() == 1);
    CHECK(orders["foreign_keys"][0]["column"].as<std::string>() == "customer_id");
    CHECK(orders["foreign_keys"][0]["references"].as<std::string>() == "customers.customer_id");
    CHECK(orders["foreign_keys"][0]["confidence"].as<double>() == Approx(0.98));

    CHECK(doc["customers"]["foreign_keys"].size() == 0);
    CHECK(text.find("\"customers.customer_id\"") != std::string::npos);

    SECTION("Missing primary key is null") {
        const auto keyless = make_schema({table("log", {column("message", "text")})});
        const YAML::Node log = YAML::Load(relationships_to_yaml(infer_relationships(keyless)));
        CHECK(log["log"]["primary_key"].IsNull());
    }
}

TEST_CASE("Relationship JSON", "[serialization]") {
    const auto schema = make_schema({
        table("customers", {column("customer_id", "integer", true)}),
        table("orders", {column("order_id", "integer", true),
                         column("customer_id", "integer"),
                         column("ghost_id", "integer")},
              {foreign_key("ghost_id", "ghosts", "id")}),
    });
    const auto doc = relationships_to_json(infer_relationships(schema));

    const auto& fks = doc["orders"]["foreign_keys"];
    REQUIRE(fks.size() == 2);
    CHECK(fks[0]["column"] == "customer_id");
    CHECK(fks[0]["basis"] == "exact_match");
    CHECK_FALSE(fks[0].contains("dangling"));
    CHECK(fks[1]["basis"] == "declared");
    CHECK(fks[1]["confidence"].get<double>() == Approx(1.0));
    CHECK(fks[1]["dangling"] == true);
    CHECK(doc["customers"]["primary_key"] == "customer_id");
}

TEST_CASE("Graph node-link JSON", "[serialization]") {
    const auto schema = make_schema(shop_tables());
    const auto graph = build_schema_graph(schema, infer_relationships(schema));
    const auto doc = graph_to_node_link_json(graph);

    CHECK(doc["directed"] == true);
    CHECK(doc["multigraph"] == true);
    REQUIRE(doc["nodes"].size() == 4);
    REQUIRE(doc["edges"].size() == 3);

    CHECK(doc["nodes"][0]["id"] == "customers");
    CHECK(doc["nodes"][0]["column_count"] == 2);
    CHECK(doc["nodes"][0]["primary_key"] == "customer_id");
    CHECK(doc["nodes"][0]["placeholder"] == false);

    const auto& edge = doc["edges"][0];
    CHECK(edge["source"] == "order_items");
    CHECK(edge["target"] == "orders");
    CHECK(edge["source_column"] == "order_id");
    CHECK(edge["target_column"] == "order_id");
    CHECK(edge["basis"] == "exact_match");
}

TEST_CASE("Text file round trip", "[serialization]") {
    const auto dir = std::filesystem::temp_directory_path() / "schemagraph_io_test";
    std::filesystem::remove_all(dir);
    const auto path = (dir / "nested" / "out.txt").string();

    const auto written = io::write_text_file(path, "hello\n");
    REQUIRE(written.is_ok());
    CHECK(written.value() == path);

    const auto read = io::read_text_file(path);
    REQUIRE(read.is_ok());
    CHECK(read.value() == "hello\n");

    std::filesystem::remove_all(dir);
}
