/**
 * @file json.cpp
 * @brief Реализация минимальной работы с JSON
 */

#include "json.hpp"

#include <cctype>
#include <charconv>
#include <cstdio>

namespace loadmesh::json {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::optional<std::string> extract_raw(std::string_view body, std::string_view key) {
    std::string search;
    search.reserve(key.size() + 2);
    search += '"';
    search += key;
    search += '"';

    auto pos = body.find(search);
    if (pos == std::string_view::npos) return std::nullopt;
    pos += search.size();

    // Пропускаем пробелы и двоеточие
    while (pos < body.size() && is_space(body[pos])) ++pos;
    if (pos >= body.size() || body[pos] != ':') return std::nullopt;
    ++pos;
    while (pos < body.size() && is_space(body[pos])) ++pos;

    if (pos >= body.size()) return std::nullopt;

    if (body[pos] == '"') {
        // Строковое значение
        ++pos;
        std::string value;
        while (pos < body.size() && body[pos] != '"') {
            if (body[pos] == '\\' && pos + 1 < body.size()) ++pos;
            value += body[pos++];
        }
        if (pos >= body.size()) return std::nullopt;
        return value;
    }

    if (body[pos] == '{' || body[pos] == '[') {
        // Объект или массив: ищем парную скобку
        char open = body[pos];
        char close = (open == '{') ? '}' : ']';
        int depth = 1;
        auto start = pos++;
        while (pos < body.size() && depth > 0) {
            if (body[pos] == open) {
                ++depth;
            } else if (body[pos] == close) {
                --depth;
            } else if (body[pos] == '"') {
                ++pos;
                while (pos < body.size() && body[pos] != '"') {
                    if (body[pos] == '\\') ++pos;
                    ++pos;
                }
            }
            ++pos;
        }
        if (depth != 0) return std::nullopt;
        return std::string(body.substr(start, pos - start));
    }

    // Число, bool или null
    auto end = body.find_first_of(",}]", pos);
    if (end == std::string_view::npos) end = body.size();
    auto value = body.substr(pos, end - pos);
    while (!value.empty() && is_space(value.back())) {
        value.remove_suffix(1);
    }
    return std::string(value);
}

std::optional<double> extract_number(std::string_view body, std::string_view key) {
    auto raw = extract_raw(body, key);
    if (!raw || raw->empty()) return std::nullopt;

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), value);
    if (ec != std::errc{} || ptr != raw->data() + raw->size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<bool> extract_bool(std::string_view body, std::string_view key) {
    auto raw = extract_raw(body, key);
    if (!raw) return std::nullopt;
    if (*raw == "true") return true;
    if (*raw == "false") return false;
    return std::nullopt;
}

std::string escape(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 8);

    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

} // namespace loadmesh::json
