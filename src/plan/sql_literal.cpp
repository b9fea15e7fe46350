#include "plan/sql_literal.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <cmath>
#include <format>
#include <unordered_map>

namespace querywatch {

namespace {

std::string quote(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 2);
    out += '\'';
    for (const char c : text) {
        if (c == '\'') out += '\'';
        out += c;
    }
    out += '\'';
    return out;
}

std::string hex_upper(const Bytes& bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const uint8_t b : bytes) {
        out += std::format("{:02X}", b);
    }
    return out;
}

// Decimal text is emitted verbatim only when it really is a number
bool is_numeric_text(std::string_view text) {
    if (text.empty()) return false;
    size_t i = (text[0] == '-' || text[0] == '+') ? 1 : 0;
    bool digits = false;
    bool dot = false;
    bool exponent = false;
    for (; i < text.size(); ++i) {
        const char c = text[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits = true;
        } else if (c == '.' && !dot && !exponent) {
            dot = true;
        } else if ((c == 'e' || c == 'E') && digits && !exponent) {
            exponent = true;
            digits = false;
            if (i + 1 < text.size() && (text[i + 1] == '-' || text[i + 1] == '+')) ++i;
        } else {
            return false;
        }
    }
    return digits;
}

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string normalize_name(std::string_view name) {
    if (!name.empty() && (name[0] == '@' || name[0] == ':' || name[0] == '$')) {
        name.remove_prefix(1);
    }
    return utils::to_lower(name);
}

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // anonymous namespace

std::string to_sql_literal(const ParameterValue& value, LiteralStyle style) {
    const bool pg = style == LiteralStyle::POSTGRESQL;

    return std::visit(overloaded{
        [](std::monostate) -> std::string { return "NULL"; },
        [pg](bool v) -> std::string {
            if (pg) return v ? "TRUE" : "FALSE";
            return v ? "1" : "0";
        },
        [](int64_t v) -> std::string { return std::format("{}", v); },
        [](uint64_t v) -> std::string { return std::format("{}", v); },
        [](double v) -> std::string {
            if (!std::isfinite(v)) return "NULL";
            // Shortest representation that round-trips
            return std::format("{}", v);
        },
        [](const Decimal& v) -> std::string {
            return is_numeric_text(v.value) ? v.value : quote(v.value);
        },
        [](const std::string& v) -> std::string { return quote(v); },
        [](char v) -> std::string { return quote(std::string_view(&v, 1)); },
        [](const TimePoint& v) -> std::string {
            return quote(utils::format_datetime(v, ' '));
        },
        [](const DateTimeOffset& v) -> std::string {
            return quote(utils::format_datetime(v.local_time, ' ') + ' ' +
                         utils::format_utc_offset(v.offset));
        },
        [](const TimeSpan& v) -> std::string { return quote(utils::format_time_span(v)); },
        [](const Uuid& v) -> std::string { return quote(v.value); },
        [pg](const Bytes& v) -> std::string {
            if (pg) return std::format("'\\x{}'::bytea", hex_upper(v));
            return "0x" + hex_upper(v);
        },
    }, value);
}

std::string substitute_parameters(std::string_view sql,
                                  const ParameterMap& parameters,
                                  LiteralStyle style) {
    if (parameters.empty()) {
        return std::string(sql);
    }

    std::unordered_map<std::string, std::string> literals;
    literals.reserve(parameters.size());
    for (const auto& [name, value] : parameters) {
        literals.try_emplace(normalize_name(name), to_sql_literal(value, style));
    }

    std::string out;
    out.reserve(sql.size() + parameters.size() * 8);

    const size_t n = sql.size();
    size_t i = 0;

    // Copy a quoted section verbatim; a doubled closing quote escapes itself
    const auto copy_quoted = [&](char close) {
        out += sql[i++];
        while (i < n) {
            const char c = sql[i];
            out += c;
            ++i;
            if (c == close) {
                if (i < n && sql[i] == close && close != ']') {
                    out += sql[i++];
                    continue;
                }
                return;
            }
        }
    };

    while (i < n) {
        const char c = sql[i];
        const char prev = i > 0 ? sql[i - 1] : '\0';

        if (c == '\'' || c == '"' || c == '`') {
            copy_quoted(c);
            continue;
        }
        if (c == '[') {
            copy_quoted(']');
            continue;
        }
        if (c == '-' && i + 1 < n && sql[i + 1] == '-') {
            const size_t end = sql.find('\n', i);
            const size_t stop = end == std::string_view::npos ? n : end;
            out.append(sql.substr(i, stop - i));
            i = stop;
            continue;
        }
        if (c == '/' && i + 1 < n && sql[i + 1] == '*') {
            const size_t end = sql.find("*/", i + 2);
            const size_t stop = end == std::string_view::npos ? n : end + 2;
            out.append(sql.substr(i, stop - i));
            i = stop;
            continue;
        }

        // PostgreSQL dollar-quoted body: $tag$ ... $tag$
        if (c == '$' && !is_ident_char(prev) && i + 1 < n &&
            (sql[i + 1] == '$' || is_ident_start(sql[i + 1]))) {
            size_t j = i + 1;
            while (j < n && is_ident_char(sql[j])) ++j;
            if (j < n && sql[j] == '$') {
                const std::string_view tag = sql.substr(i, j - i + 1);
                const size_t close = sql.find(tag, j + 1);
                const size_t stop = close == std::string_view::npos ? n : close + tag.size();
                out.append(sql.substr(i, stop - i));
                i = stop;
                continue;
            }
        }

        // prev != c keeps @@globals and ::casts intact
        const bool sigil = (c == '@' || c == ':' || c == '$');
        if (sigil && i + 1 < n && !is_ident_char(prev) && prev != c) {
            const char next = sql[i + 1];
            const bool starts_token = (c == '$') ? std::isdigit(static_cast<unsigned char>(next))
                                                 : is_ident_char(next);
            if (starts_token) {
                size_t j = i + 1;
                while (j < n && is_ident_char(sql[j])) ++j;

                const std::string_view token = sql.substr(i, j - i);
                const auto it = literals.find(normalize_name(token));
                if (it != literals.end()) {
                    out += it->second;
                } else {
                    out.append(token);
                }
                i = j;
                continue;
            }
        }

        out += c;
        ++i;
    }

    return out;
}

} // namespace querywatch
