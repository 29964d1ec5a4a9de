#include "inference/name_matching.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <set>

namespace schemagraph::naming {

namespace {

constexpr std::array<std::string_view, 3> kKeySuffixes = {"_id", "_key", "_fk"};
constexpr std::array<std::string_view, 3> kKeyTokens = {"id", "key", "fk"};

// A bare trailing "id" ("customerid") is only stripped when this much remains,
// so "paid" or "void" keep their spelling.
constexpr size_t kMinBareIdStem = 3;

bool is_separator(char c) {
    return c == '_' || c == '-' || c == '.' || c == ' ';
}

bool is_key_token(std::string_view token) {
    return std::find(kKeyTokens.begin(), kKeyTokens.end(), token) != kKeyTokens.end();
}

bool is_vowel(char c) {
    return c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u';
}

} // anonymous namespace

std::vector<std::string> tokenize(std::string_view identifier) {
    std::vector<std::string> tokens;
    std::string current;

    const auto flush = [&] {
        if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    };

    for (size_t i = 0; i < identifier.size(); ++i) {
        const auto c = static_cast<unsigned char>(identifier[i]);
        if (is_separator(static_cast<char>(c))) {
            flush();
            continue;
        }
        if (std::isupper(c) && i > 0) {
            const auto prev = static_cast<unsigned char>(identifier[i - 1]);
            if (std::islower(prev) || std::isdigit(prev)) {
                flush();
            }
        }
        current += static_cast<char>(std::tolower(c));
    }
    flush();
    return tokens;
}

std::string normalize(std::string_view identifier) {
    std::string result;
    result.reserve(identifier.size());
    for (const char c : identifier) {
        if (!is_separator(c)) {
            result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return result;
}

std::string entity_stem(std::string_view column_name) {
    std::string lower = utils::to_lower(column_name);

    if (is_key_token(lower)) {
        return "";
    }

    // "customer_id_fk" -> "customer"
    bool any_stripped = false;
    for (bool stripped = true; stripped;) {
        stripped = false;
        for (const auto suffix : kKeySuffixes) {
            if (lower.size() > suffix.size() && utils::ends_with(lower, suffix)) {
                lower.resize(lower.size() - suffix.size());
                stripped = any_stripped = true;
                break;
            }
        }
    }

    if (!any_stripped && lower.size() >= kMinBareIdStem + 2 && utils::ends_with(lower, "id")) {
        lower.resize(lower.size() - 2);
    }

    return normalize(lower);
}

std::vector<std::string> entity_tokens(std::string_view column_name) {
    auto tokens = tokenize(column_name);
    if (tokens.size() > 1 && is_key_token(tokens.back())) {
        tokens.pop_back();
    }
    return tokens;
}

bool has_key_suffix(std::string_view column_name) {
    const auto tokens = tokenize(column_name);
    return tokens.size() > 1 && is_key_token(tokens.back());
}

bool has_key_marker(std::string_view column_name) {
    const std::string stem = entity_stem(column_name);
    return !stem.empty() && stem != normalize(column_name);
}

std::string singular(const std::string& word) {
    const size_t n = word.size();
    if (n > 3 && utils::ends_with(word, "ies")) {
        return word.substr(0, n - 3) + "y";
    }
    if (utils::ends_with(word, "sses") || utils::ends_with(word, "uses") ||
        utils::ends_with(word, "xes") || utils::ends_with(word, "ches") ||
        utils::ends_with(word, "shes")) {
        return word.substr(0, n - 2);
    }
    if (utils::ends_with(word, "ss") || utils::ends_with(word, "us") ||
        utils::ends_with(word, "is")) {
        return word;
    }
    if (n > 1 && word.back() == 's') {
        return word.substr(0, n - 1);
    }
    return word;
}

std::string plural(const std::string& word) {
    const size_t n = word.size();
    if (n > 1 && word.back() == 'y' && !is_vowel(word[n - 2])) {
        return word.substr(0, n - 1) + "ies";
    }
    if (utils::ends_with(word, "s") || utils::ends_with(word, "x") ||
        utils::ends_with(word, "z") || utils::ends_with(word, "ch") ||
        utils::ends_with(word, "sh")) {
        return word + "es";
    }
    return word + "s";
}

std::vector<std::string> table_name_variants(std::string_view table_name) {
    const std::string base = normalize(table_name);
    std::vector<std::string> variants;
    variants.reserve(3);
    for (auto candidate : {base, singular(base), plural(base)}) {
        if (!candidate.empty() &&
            std::find(variants.begin(), variants.end(), candidate) == variants.end()) {
            variants.push_back(std::move(candidate));
        }
    }
    return variants;
}

size_t edit_distance(std::string_view a, std::string_view b) {
    if (a.empty()) return b.size();
    if (b.empty()) return a.size();

    std::vector<size_t> prev(b.size() + 1);
    std::vector<size_t> curr(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) {
        prev[j] = j;
    }

    for (size_t i = 1; i <= a.size(); ++i) {
        curr[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            const size_t substitution = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
            curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, substitution});
        }
        std::swap(prev, curr);
    }
    return prev[b.size()];
}

double similarity_ratio(std::string_view a, std::string_view b) {
    const size_t longest = std::max(a.size(), b.size());
    if (longest == 0) {
        return 1.0;
    }
    return 1.0 - static_cast<double>(edit_distance(a, b)) / static_cast<double>(longest);
}

double token_overlap(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    if (a.empty() || b.empty()) {
        return 0.0;
    }
    const std::set<std::string> set_a(a.begin(), a.end());
    const std::set<std::string> set_b(b.begin(), b.end());

    size_t common = 0;
    for (const auto& token : set_a) {
        if (set_b.contains(token)) ++common;
    }
    return static_cast<double>(common) /
           static_cast<double>(std::max(set_a.size(), set_b.size()));
}

} // namespace schemagraph::naming
