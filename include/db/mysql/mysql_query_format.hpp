#pragma once

#include "core/error.hpp"
#include "db/idb_connection.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlpool {

/**
 * @brief Escapes a value for use between single quotes
 *
 * Returns std::nullopt when the value cannot be escaped.
 */
using EscapeFn = std::function<std::optional<std::string>(std::string_view)>;

/**
 * @brief Substitute `?` placeholders with quoted, escaped parameters
 *
 * Placeholders inside quoted strings, backquoted identifiers and comments
 * are left alone. std::nullopt parameters become NULL. The number of
 * placeholders must match the number of parameters (INTERNAL_ERROR
 * otherwise).
 */
[[nodiscard]] Result<std::string> expand_placeholders(std::string_view sql,
                                                      const std::vector<Field>& params,
                                                      const EscapeFn& escape);

} // namespace sqlpool
