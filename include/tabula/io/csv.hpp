#pragma once

#include <tabula/core/record.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <unordered_set>

namespace tabula::io {

struct CsvReadOptions {
    bool null_if_empty = false;
    std::unordered_set<std::string> null_tokens;
};

/// Comma-separated null tokens; `<empty>` marks empty cells as null.
///
/// Example: "<empty>,NA,n/a".
[[nodiscard]] auto parse_null_spec(std::string_view spec) -> CsvReadOptions;

/// Load a CSV file (header row, RFC 4180 quoting) into a table.
///
/// Each column is typed as int64 if every non-null cell parses as one, else
/// double, else string. Null cells are stored as explicit nulls.
[[nodiscard]] auto read_csv(std::string_view path, const CsvReadOptions& options = {})
    -> std::expected<Table, std::string>;

[[nodiscard]] auto read_csv(std::string_view path, std::string_view null_spec)
    -> std::expected<Table, std::string>;

}  // namespace tabula::io
