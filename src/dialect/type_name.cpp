#include "dialect/type_name.hpp"
#include "core/utils.hpp"

#include <array>
#include <algorithm>
#include <cctype>

namespace schemagraph {

namespace {

constexpr std::array<std::string_view, 3> kDroppedModifiers = {
    "unsigned", "signed", "zerofill",
};

bool is_dropped_modifier(std::string_view word) {
    return std::find(kDroppedModifiers.begin(), kDroppedModifiers.end(), word)
        != kDroppedModifiers.end();
}

bool contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

bool starts_with(const std::string& str, std::string_view prefix) {
    return str.compare(0, prefix.size(), prefix) == 0;
}

} // anonymous namespace

NormalizedType normalize_type_name(std::string_view declared_type) {
    NormalizedType result;

    std::string outside;
    outside.reserve(declared_type.size());
    std::string param_text;
    int depth = 0;

    for (const char raw : declared_type) {
        const char c = static_cast<char>(std::tolower(static_cast<unsigned char>(raw)));
        if (c == '(') {
            if (depth++ > 0) param_text += c;
            continue;
        }
        if (c == ')') {
            if (depth > 0 && --depth > 0) param_text += c;
            continue;
        }
        if (depth > 0) {
            param_text += c;
            continue;
        }
        if (c == '[' || c == ']') {
            result.is_array = true;
            continue;
        }
        outside += c;
    }

    if (!param_text.empty()) {
        for (auto& p : utils::split(param_text, ',')) {
            auto trimmed = utils::trim(p);
            if (!trimmed.empty()) {
                result.params.emplace_back(std::move(trimmed));
            }
        }
    }

    // Rebuild base from words so "timestamp  with time zone" and
    // "int unsigned" collapse to a canonical spelling
    for (const auto& word : utils::split(outside, ' ')) {
        const auto w = utils::trim(word);
        if (w.empty() || is_dropped_modifier(w)) continue;
        if (!result.base.empty()) result.base += ' ';
        result.base += w;
    }

    if (result.base == "array") {
        result.is_array = true;
    }

    return result;
}

TypeClass classify_generic(const std::string& base) {
    if (base.empty()) {
        return TypeClass::OTHER;
    }

    if (contains(base, "uuid") || contains(base, "guid") || base == "uniqueidentifier") {
        return TypeClass::UUID;
    }

    // Before the integer check: "interval" contains "int"
    if (base == "interval" || starts_with(base, "interval ")) {
        return TypeClass::TEMPORAL;
    }
    if (contains(base, "date") || contains(base, "time")) {
        return TypeClass::TEMPORAL;
    }

    // int/integer/int2/int4/int8, bigint, smallint, tinyint, mediumint, serial
    if (base != "point" &&
        (starts_with(base, "int") || utils::ends_with(base, "int") || contains(base, "serial"))) {
        return TypeClass::INTEGER;
    }

    if (contains(base, "char") || contains(base, "text") || contains(base, "string") ||
        base == "clob" || base == "nclob") {
        return TypeClass::STRING;
    }

    return TypeClass::OTHER;
}

} // namespace schemagraph
