#include "db/mysql/mysql_query_format.hpp"
#include <format>

namespace sqlpool {

namespace {

// Offsets of the `?` placeholders outside literals and comments
std::vector<size_t> find_placeholders(std::string_view sql) {
    std::vector<size_t> positions;
    size_t i = 0;
    while (i < sql.size()) {
        const char c = sql[i];

        if (c == '\'' || c == '"' || c == '`') {
            // Quoted literal or identifier; doubled quotes and backslashes escape
            ++i;
            while (i < sql.size()) {
                if (sql[i] == '\\' && c != '`') {
                    i += 2;
                    continue;
                }
                if (sql[i] == c) {
                    if (i + 1 < sql.size() && sql[i + 1] == c) {
                        i += 2;
                        continue;
                    }
                    break;
                }
                ++i;
            }
            ++i;
            continue;
        }

        if (c == '#' || (c == '-' && sql.substr(i).starts_with("-- "))) {
            const size_t eol = sql.find('\n', i);
            i = (eol == std::string_view::npos) ? sql.size() : eol + 1;
            continue;
        }

        if (c == '/' && sql.substr(i).starts_with("/*")) {
            const size_t end = sql.find("*/", i + 2);
            i = (end == std::string_view::npos) ? sql.size() : end + 2;
            continue;
        }

        if (c == '?') {
            positions.push_back(i);
        }
        ++i;
    }
    return positions;
}

} // anonymous namespace

Result<std::string> expand_placeholders(std::string_view sql,
                                        const std::vector<Field>& params,
                                        const EscapeFn& escape) {
    const auto positions = find_placeholders(sql);
    if (positions.size() != params.size()) {
        return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR, std::format(
            "Query has {} placeholders but {} parameters were given",
            positions.size(), params.size()));
    }

    std::string out;
    out.reserve(sql.size() + params.size() * 8);
    size_t copied = 0;
    for (size_t n = 0; n < positions.size(); ++n) {
        out.append(sql.substr(copied, positions[n] - copied));
        copied = positions[n] + 1;

        if (!params[n]) {
            out += "NULL";
            continue;
        }
        auto escaped = escape(*params[n]);
        if (!escaped) {
            return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR,
                std::format("Cannot escape parameter {}", n + 1));
        }
        out += '\'';
        out += *escaped;
        out += '\'';
    }
    out.append(sql.substr(copied));
    return Result<std::string>::ok(std::move(out));
}

} // namespace sqlpool
