#include <tabula/core/schema.hpp>

namespace tabula {

namespace {

auto merge_kind(ColumnInfo& info, ValueKind kind) -> void {
    if (info.non_null == 0) {
        info.kind = kind;
        return;
    }
    if (info.mixed || info.kind == kind) {
        return;
    }
    const bool both_numeric = (info.kind == ValueKind::Int || info.kind == ValueKind::Double) &&
                              (kind == ValueKind::Int || kind == ValueKind::Double);
    if (both_numeric) {
        info.kind = ValueKind::Double;
        return;
    }
    info.mixed = true;
}

}  // namespace

auto Schema::find(const std::string& name) const -> const ColumnInfo* {
    if (auto it = index.find(name); it != index.end()) {
        return &columns[it->second];
    }
    return nullptr;
}

auto Schema::names() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(columns.size());
    for (const auto& column : columns) {
        out.push_back(column.name);
    }
    return out;
}

auto Schema::numeric_columns() const -> std::vector<std::string> {
    std::vector<std::string> out;
    for (const auto& column : columns) {
        if (column.numeric()) {
            out.push_back(column.name);
        }
    }
    return out;
}

auto infer_schema(const Table& table) -> Schema {
    Schema schema;
    for (const auto& record : table) {
        for (const auto& field : record) {
            auto [it, inserted] = schema.index.try_emplace(field.name, schema.columns.size());
            if (inserted) {
                schema.columns.push_back(ColumnInfo{.name = field.name});
            }
            auto& info = schema.columns[it->second];
            if (is_null(field.value)) {
                continue;
            }
            merge_kind(info, kind_of(field.value));
            ++info.non_null;
        }
    }
    for (auto& info : schema.columns) {
        info.nulls = table.rows() - info.non_null;
    }
    return schema;
}

auto format_columns(const Schema& schema) -> std::string {
    if (schema.columns.empty()) {
        return "<none>";
    }
    std::string out;
    for (std::size_t i = 0; i < schema.columns.size(); ++i) {
        if (i > 0) {
            out.append(", ");
        }
        out.append(schema.columns[i].name);
    }
    return out;
}

}  // namespace tabula
