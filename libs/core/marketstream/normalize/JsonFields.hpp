#pragma once
// Lenient accessors over loosely-typed wire JSON. Numbers may arrive as JSON
// numbers or numeric strings; anything else reads as absent.
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdlib>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace MarketStream {
namespace JsonFields {

inline std::string_view trim(std::string_view s) {
    const char* ws = " \t\r\n\f\v";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

inline std::string toUpper(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        if (c >= 'a' && c <= 'z') c = static_cast<char>(c - ('a' - 'A'));
    }
    return out;
}

inline std::string toLower(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c + ('a' - 'A'));
    }
    return out;
}

inline bool isRecord(const nlohmann::json* v) {
    return v != nullptr && v->is_object();
}

// Member lookup that tolerates non-object parents
inline const nlohmann::json* find(const nlohmann::json& obj, std::string_view key) {
    if (!obj.is_object()) return nullptr;
    auto it = obj.find(std::string(key));
    return it == obj.end() ? nullptr : &*it;
}

inline const nlohmann::json* findRecord(const nlohmann::json& obj, std::string_view key) {
    const auto* v = find(obj, key);
    return isRecord(v) ? v : nullptr;
}

inline std::optional<double> parseNumber(std::string_view text) {
    const auto trimmed = trim(text);
    if (trimmed.empty()) return std::nullopt;
    const std::string buf(trimmed);
    const char* begin = buf.c_str();
    char* end = nullptr;
    const double value = std::strtod(begin, &end);
    if (end == begin || static_cast<std::size_t>(end - begin) != buf.size()) return std::nullopt;
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

inline std::optional<double> toNumber(const nlohmann::json* v) {
    if (v == nullptr) return std::nullopt;
    if (v->is_number()) {
        const double d = v->get<double>();
        return std::isfinite(d) ? std::optional<double>(d) : std::nullopt;
    }
    if (v->is_string()) return parseNumber(v->get_ref<const std::string&>());
    return std::nullopt;
}

inline std::optional<double> number(const nlohmann::json& obj, std::string_view key) {
    return toNumber(find(obj, key));
}

// First key that yields a finite number
inline std::optional<double> firstNumber(const nlohmann::json& obj, std::initializer_list<std::string_view> keys) {
    for (auto key : keys) {
        if (auto n = number(obj, key)) return n;
    }
    return std::nullopt;
}

// Trimmed, non-empty string or nullopt
inline std::optional<std::string> toString(const nlohmann::json* v) {
    if (v == nullptr || !v->is_string()) return std::nullopt;
    const auto t = trim(v->get_ref<const std::string&>());
    if (t.empty()) return std::nullopt;
    return std::string(t);
}

inline std::optional<std::string> string(const nlohmann::json& obj, std::string_view key) {
    return toString(find(obj, key));
}

inline std::optional<std::string> firstString(const nlohmann::json& obj, std::initializer_list<std::string_view> keys) {
    for (auto key : keys) {
        if (auto s = string(obj, key)) return s;
    }
    return std::nullopt;
}

// Equivalent of Number(x.toFixed(6))
inline double round6(double value) {
    return std::round(value * 1e6) / 1e6;
}

} // namespace JsonFields
} // namespace MarketStream
