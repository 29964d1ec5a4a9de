#include "serialization/relationship_writer.hpp"

#include <yaml-cpp/yaml.h>

#include <cmath>

using json = nlohmann::json;

namespace schemagraph {

namespace {

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

} // anonymous namespace

std::string relationships_to_yaml(const RelationshipMap& relationships) {
    YAML::Emitter out;
    out.SetIndent(2);
    out.SetDoublePrecision(3);

    out << YAML::BeginMap;
    for (const auto& [table, entry] : relationships) {
        out << YAML::Key << table << YAML::Value << YAML::BeginMap;

        out << YAML::Key << "primary_key" << YAML::Value;
        if (entry.primary_key) {
            out << *entry.primary_key;
        } else {
            out << YAML::Null;
        }

        out << YAML::Key << "foreign_keys" << YAML::Value;
        if (entry.foreign_keys.empty()) {
            out << YAML::Flow;
        }
        out << YAML::BeginSeq;
        for (const auto& rel : entry.foreign_keys) {
            out << YAML::BeginMap;
            out << YAML::Key << "column" << YAML::Value << rel.source_column;
            out << YAML::Key << "references" << YAML::Value << YAML::DoubleQuoted << rel.references();
            out << YAML::Key << "confidence" << YAML::Value << round2(rel.confidence);
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;

        out << YAML::EndMap;
    }
    out << YAML::EndMap;

    std::string text = out.c_str();
    text += '\n';
    return text;
}

json relationships_to_json(const RelationshipMap& relationships) {
    json doc = json::object();
    for (const auto& [table, entry] : relationships) {
        json fks = json::array();
        for (const auto& rel : entry.foreign_keys) {
            json fk = {
                {"column", rel.source_column},
                {"references", rel.references()},
                {"confidence", round2(rel.confidence)},
                {"basis", basis_to_string(rel.basis)},
            };
            if (rel.dangling) {
                fk["dangling"] = true;
            }
            fks.push_back(std::move(fk));
        }

        doc[table] = {
            {"primary_key", entry.primary_key ? json(*entry.primary_key) : json(nullptr)},
            {"foreign_keys", std::move(fks)},
        };
    }
    return doc;
}

} // namespace schemagraph
