#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <mediadex/core/types.h>
#include <mediadex/metadata/database.h>
#include <mediadex/metadata/index_types.h>

namespace mediadex::metadata::sql {

struct QuerySpec {
    std::string table;                // Simple table form
    std::optional<std::string> from;  // Optional full FROM clause (e.g., with JOINs)
    std::vector<std::string> columns; // empty => "*"
    std::vector<std::string> conditions;
    std::optional<std::string> orderBy;
    std::optional<std::string> groupBy;
    std::optional<std::string> having;
    std::optional<int64_t> limit;
    std::optional<int64_t> offset;
};

// Build a basic SELECT statement
std::string buildSelect(const QuerySpec& spec);

using Param = std::variant<int64_t, double, std::string>;

/// WHERE conditions with their positional parameters, in order
struct Clause {
    std::vector<std::string> conditions;
    std::vector<Param> params;

    void append(Clause other);
};

// Escape LIKE wildcards; use with ESCAPE '\'
std::string escapeLike(std::string_view text);

/**
 * @brief Existential sampler predicates against `f.id`
 *
 * Yields EXISTS subqueries only, so matching several samplers of one file
 * never repeats the file row.
 */
Clause metadataFilterClause(const MetadataFilter& filter);

// Folder scope, search, favourites, prefixes and extensions plus metadata
Clause fileQueryClause(const FileQuery& query);

// Bind parameters starting at 1-based `firstIndex`
Result<void> bindParams(Statement& stmt, const std::vector<Param>& params, int firstIndex = 1);

} // namespace mediadex::metadata::sql
