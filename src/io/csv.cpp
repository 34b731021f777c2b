#include <tabula/io/csv.hpp>

#include <fmt/format.h>
#include <rapidcsv.h>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <exception>
#include <optional>
#include <string_view>
#include <vector>

namespace tabula::io {

namespace {

constexpr std::string_view kBlank = " \t\r\n";

auto trim(std::string_view text) -> std::string_view {
    text.remove_prefix(std::min(text.find_first_not_of(kBlank), text.size()));
    if (auto last = text.find_last_not_of(kBlank); last != std::string_view::npos) {
        text.remove_suffix(text.size() - last - 1);
    }
    return text;
}

/// Whole-cell parse; a partial match is not a number.
template <typename T>
auto parse_whole(std::string_view cell) -> std::optional<T> {
    T parsed{};
    const char* end = cell.data() + cell.size();
    auto [ptr, ec] = std::from_chars(cell.data(), end, parsed);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return parsed;
}

enum class CellType : std::uint8_t { Int, Double, Text };

/// Narrowest type every valid cell parses as; an all-null column stays text.
auto column_type(const std::vector<std::string>& vals, const std::vector<bool>& validity)
    -> CellType {
    CellType type = CellType::Int;
    bool any_valid = false;
    for (std::size_t i = 0; i < vals.size() && type != CellType::Text; ++i) {
        if (!validity[i]) {
            continue;
        }
        any_valid = true;
        if (type == CellType::Int && !parse_whole<std::int64_t>(vals[i])) {
            type = CellType::Double;
        }
        if (type == CellType::Double && !parse_whole<double>(vals[i])) {
            type = CellType::Text;
        }
    }
    return any_valid ? type : CellType::Text;
}

/// Typed cells of one column, in row order.
auto type_column(const std::vector<std::string>& vals, const std::vector<bool>& validity)
    -> std::vector<Value> {
    const CellType type = column_type(vals, validity);
    std::vector<Value> cells;
    cells.reserve(vals.size());
    for (std::size_t i = 0; i < vals.size(); ++i) {
        if (!validity[i]) {
            cells.emplace_back(Null{});
            continue;
        }
        switch (type) {
            case CellType::Int:
                cells.emplace_back(*parse_whole<std::int64_t>(vals[i]));
                break;
            case CellType::Double:
                cells.emplace_back(*parse_whole<double>(vals[i]));
                break;
            case CellType::Text:
                cells.emplace_back(vals[i]);
                break;
        }
    }
    return cells;
}

}  // namespace

auto parse_null_spec(std::string_view spec) -> CsvReadOptions {
    CsvReadOptions options;
    std::size_t pos = 0;
    while (pos <= spec.size()) {
        std::size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }
        auto token = trim(spec.substr(pos, comma - pos));
        if (!token.empty()) {
            if (token == "<empty>") {
                options.null_if_empty = true;
            } else {
                options.null_tokens.emplace(token);
            }
        }
        if (comma == spec.size()) {
            break;
        }
        pos = comma + 1;
    }
    return options;
}

auto read_csv(std::string_view path, const CsvReadOptions& options)
    -> std::expected<Table, std::string> {
    try {
        // Row 0 is the header; there is no row-index column.
        rapidcsv::Document doc(std::string(path), rapidcsv::LabelParams(0, -1),
                               rapidcsv::SeparatorParams(','));

        auto names = doc.GetColumnNames();
        const std::size_t rows = doc.GetRowCount();
        std::vector<std::vector<Value>> columns;
        columns.reserve(names.size());
        for (const auto& name : names) {
            auto vals = doc.GetColumn<std::string>(name);
            vals.resize(rows);
            std::vector<bool> validity(vals.size(), true);
            for (std::size_t i = 0; i < vals.size(); ++i) {
                validity[i] = !((options.null_if_empty && vals[i].empty()) ||
                                options.null_tokens.contains(vals[i]));
            }
            columns.push_back(type_column(vals, validity));
        }

        Table table;
        table.records.reserve(rows);
        for (std::size_t r = 0; r < rows; ++r) {
            Record record;
            for (std::size_t c = 0; c < names.size(); ++c) {
                record.set(names[c], std::move(columns[c][r]));
            }
            table.add_record(std::move(record));
        }
        return table;
    } catch (const std::exception& e) {
        return std::unexpected(fmt::format("failed to read csv '{}': {}", path, e.what()));
    }
}

auto read_csv(std::string_view path, std::string_view null_spec)
    -> std::expected<Table, std::string> {
    return read_csv(path, parse_null_spec(null_spec));
}

}  // namespace tabula::io
