#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>

namespace querywatch {

/**
 * @brief Literal dialect differences that matter for plan capture
 *
 * GENERIC:    bool -> 1/0, bytes -> 0xABCD (SQL Server, MySQL)
 * POSTGRESQL: bool -> TRUE/FALSE, bytes -> '\xABCD'::bytea
 */
enum class LiteralStyle {
    GENERIC,
    POSTGRESQL
};

/**
 * @brief Render a parameter value as an inline SQL literal
 *
 * null -> NULL, strings single-quoted with embedded quotes doubled,
 * numbers in invariant form (non-finite doubles -> NULL), date/time as
 * 'YYYY-MM-DD HH:MM:SS.fff' (UTC), offsets appended as " +HH:MM",
 * time spans as '[-]HH:MM:SS.fff', UUIDs quoted, bytes as hex.
 */
[[nodiscard]] std::string to_sql_literal(const ParameterValue& value,
                                         LiteralStyle style = LiteralStyle::GENERIC);

/**
 * @brief Replace named/positional placeholders with literal values
 *
 * Recognizes @name, :name and $n as whole tokens outside string literals,
 * quoted identifiers and comments. Parameter names may be given with or
 * without their sigil and match case-insensitively. Placeholders with no
 * matching parameter are left untouched.
 */
[[nodiscard]] std::string substitute_parameters(std::string_view sql,
                                                const ParameterMap& parameters,
                                                LiteralStyle style = LiteralStyle::GENERIC);

} // namespace querywatch
