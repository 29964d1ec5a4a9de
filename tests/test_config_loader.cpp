#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "config/config_loader.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace schemagraph;
using Catch::Approx;

namespace {

bool contains_name(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

} // anonymous namespace

TEST_CASE("Config: empty document gives defaults", "[config]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.logging.level == "info");
    CHECK_FALSE(cfg.input.database_type.has_value());
    CHECK(cfg.inference.min_similarity == Approx(0.75));
    CHECK(cfg.inference.min_confidence == Approx(0.0));
    CHECK(cfg.inference.generic_names.empty());
    CHECK(cfg.output.directory == "output");
    CHECK(cfg.output.relationships_file == "{db}_inferred_relationships.yaml");
    CHECK(cfg.output.graph_file == "{db}_schema_graph.json");
    CHECK_FALSE(cfg.output.write_json_relationships);
}

TEST_CASE("Config: all sections are read", "[config]") {
    const std::string toml = R"(
[logging]
level = "debug"

[input]
database_type = "mysql"

[inference]
min_similarity = 0.8
min_confidence = 0.6
generic_names = ["flag", "Source"]
hierarchical_markers = ["owner"]

[output]
directory = "out"
relationships_file = "{db}.yaml"
graph_file = "{db}.graph.json"
write_json_relationships = true
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.logging.level == "debug");
    CHECK(cfg.input.database_type == "mysql");
    CHECK(cfg.inference.min_similarity == Approx(0.8));
    CHECK(cfg.inference.min_confidence == Approx(0.6));
    CHECK(cfg.inference.generic_names == std::vector<std::string>{"flag", "Source"});
    CHECK(cfg.inference.hierarchical_markers == std::vector<std::string>{"owner"});
    CHECK(cfg.output.directory == "out");
    CHECK(cfg.output.relationships_file == "{db}.yaml");
    CHECK(cfg.output.relationships_json_file == "{db}_inferred_relationships.json");
    CHECK(cfg.output.graph_file == "{db}.graph.json");
    CHECK(cfg.output.write_json_relationships);
}

TEST_CASE("Config: env vars are expanded", "[config][env]") {
    ::setenv("SCHEMAGRAPH_TEST_OUT", "/tmp/graphs", 1);
    ::setenv("SCHEMAGRAPH_TEST_NAME", "tenant", 1);

    const std::string toml = R"(
[output]
directory = "${SCHEMAGRAPH_TEST_OUT}/run"

[inference]
generic_names = ["${SCHEMAGRAPH_TEST_NAME}"]
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.output.directory == "/tmp/graphs/run");
    CHECK(result.config.inference.generic_names == std::vector<std::string>{"tenant"});

    ::unsetenv("SCHEMAGRAPH_TEST_OUT");
    ::unsetenv("SCHEMAGRAPH_TEST_NAME");
}

TEST_CASE("Config: unclosed ${ is a parse error", "[config][env]") {
    const std::string toml = R"(
[output]
directory = "${UNCLOSED"
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
    CHECK(result.error_message.find("Unclosed env var") != std::string::npos);
}

TEST_CASE("Config: malformed TOML and missing file", "[config]") {
    auto parsed = ConfigLoader::load_from_string("[inference\nmin_similarity = ");
    CHECK_FALSE(parsed.success);
    CHECK(parsed.error_message.starts_with("Failed to parse config"));

    auto loaded = ConfigLoader::load_from_file("/nonexistent/schemagraph.toml");
    CHECK_FALSE(loaded.success);
    CHECK(loaded.error_message.starts_with("Failed to load config"));
}

TEST_CASE("Config: file loading", "[config]") {
    const auto path = std::filesystem::temp_directory_path() / "schemagraph_config_test.toml";
    {
        std::ofstream out(path);
        out << "[logging]\nlevel = \"warn\"\n";
    }

    auto result = ConfigLoader::load_from_file(path.string());
    REQUIRE(result.success);
    CHECK(result.config.logging.level == "warn");

    std::filesystem::remove(path);
}

TEST_CASE("ConfigValidation: bad values are reported by key", "[config][validation]") {

    SECTION("Unknown log level") {
        auto result = ConfigLoader::load_from_string("[logging]\nlevel = \"verbose\"\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("logging.level") != std::string::npos);
        CHECK(result.error_message.find("'verbose'") != std::string::npos);
    }

    SECTION("Unknown database type") {
        auto result = ConfigLoader::load_from_string("[input]\ndatabase_type = \"cassandra\"\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("input.database_type") != std::string::npos);
    }

    SECTION("Similarity outside (0, 1)") {
        CHECK_FALSE(ConfigLoader::load_from_string("[inference]\nmin_similarity = 1.0\n").success);
        CHECK_FALSE(ConfigLoader::load_from_string("[inference]\nmin_similarity = 0.0\n").success);
        auto result = ConfigLoader::load_from_string("[inference]\nmin_similarity = 1.5\n");
        CHECK(result.error_message.find("inference.min_similarity") != std::string::npos);
    }

    SECTION("Confidence outside [0, 1]") {
        CHECK(ConfigLoader::load_from_string("[inference]\nmin_confidence = 1.0\n").success);
        auto result = ConfigLoader::load_from_string("[inference]\nmin_confidence = -0.1\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("inference.min_confidence") != std::string::npos);
    }

    SECTION("Blank names") {
        auto result = ConfigLoader::load_from_string(
            "[inference]\ngeneric_names = [\"ok\", \"  \"]\nhierarchical_markers = [\"\"]\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("inference.generic_names[1]") != std::string::npos);
        CHECK(result.error_message.find("inference.hierarchical_markers[0]") != std::string::npos);
    }

    SECTION("Empty output settings") {
        auto result = ConfigLoader::load_from_string("[output]\ndirectory = \"\"\ngraph_file = \"\"\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.starts_with("Config validation failed:"));
        CHECK(result.error_message.find("output.directory") != std::string::npos);
        CHECK(result.error_message.find("output.graph_file") != std::string::npos);
    }
}

TEST_CASE("ConfigValidation: every problem is collected", "[config][validation]") {
    AppConfig cfg;
    cfg.logging.level = "loud";
    cfg.inference.min_similarity = 2.0;
    cfg.output.relationships_file.clear();

    const auto errors = ConfigLoader::validate_config(cfg);
    CHECK(errors.size() == 3);
    CHECK(ConfigLoader::validate_config(AppConfig{}).empty());
}

TEST_CASE("Inference config from settings", "[config]") {
    InferenceSettings settings;
    settings.min_similarity = 0.8;
    settings.min_confidence = 0.5;
    settings.generic_names = {" Flag ", "status", "flag"};
    settings.hierarchical_markers = {"Owner"};

    const auto cfg = make_inference_config(settings);
    CHECK(cfg.min_confidence == Approx(0.5));
    CHECK(cfg.scorer.min_similarity == Approx(0.8));

    const auto& generic = cfg.scorer.generic_names;
    CHECK(contains_name(generic, "flag"));
    CHECK(contains_name(generic, "id"));
    CHECK(std::count(generic.begin(), generic.end(), "flag") == 1);
    CHECK(std::count(generic.begin(), generic.end(), "status") == 1);

    CHECK(contains_name(cfg.scorer.hierarchical_markers, "owner"));
    CHECK(contains_name(cfg.scorer.hierarchical_markers, "parent"));
}

TEST_CASE("Output file patterns", "[config]") {
    CHECK(expand_file_pattern("{db}_schema_graph.json", "shop") == "shop_schema_graph.json");
    CHECK(expand_file_pattern("{db}/{db}.yaml", "crm") == "crm/crm.yaml");
    CHECK(expand_file_pattern("graph.json", "shop") == "graph.json");
    CHECK(expand_file_pattern("{db", "shop") == "{db");
}
