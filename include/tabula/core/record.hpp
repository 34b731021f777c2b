#pragma once

#include <tabula/core/value.hpp>

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace tabula {

/// A named cell of a record.
struct Field {
    std::string name;
    Value value;

    auto operator==(const Field&) const -> bool = default;
};

/// An ordered mapping from column name to value.
///
/// Field order is insertion order. Lookups are linear; records are narrow.
class Record {
   public:
    using const_iterator = std::vector<Field>::const_iterator;

    Record() = default;

    /// Later duplicates of a name overwrite earlier ones in place.
    Record(std::initializer_list<Field> fields);

    [[nodiscard]] auto size() const noexcept -> std::size_t { return fields_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return fields_.empty(); }

    [[nodiscard]] auto contains(std::string_view name) const noexcept -> bool;

    /// Pointer to the value stored under `name`, or nullptr when absent.
    [[nodiscard]] auto find(std::string_view name) const noexcept -> const Value*;
    [[nodiscard]] auto find(std::string_view name) noexcept -> Value*;

    /// Value stored under `name`; an absent column reads as null.
    [[nodiscard]] auto get(std::string_view name) const noexcept -> const Value&;

    /// Replace the value under `name`, or append a new field.
    void set(std::string name, Value value);

    [[nodiscard]] auto fields() const noexcept -> const std::vector<Field>& { return fields_; }

    [[nodiscard]] auto begin() const noexcept -> const_iterator { return fields_.cbegin(); }
    [[nodiscard]] auto end() const noexcept -> const_iterator { return fields_.cend(); }

    auto operator==(const Record&) const -> bool = default;

   private:
    std::vector<Field> fields_;
};

/// An ordered sequence of records.
struct Table {
    std::vector<Record> records;

    Table() = default;
    Table(std::initializer_list<Record> init) : records(init) {}
    explicit Table(std::vector<Record> rows) : records(std::move(rows)) {}

    void add_record(Record record) { records.push_back(std::move(record)); }

    [[nodiscard]] auto rows() const noexcept -> std::size_t { return records.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return records.empty(); }

    [[nodiscard]] auto operator[](std::size_t row) const noexcept -> const Record& {
        return records[row];
    }

    /// Bounds-checked row access.
    [[nodiscard]] auto at(std::size_t row) const -> const Record& { return records.at(row); }

    [[nodiscard]] auto begin() const noexcept { return records.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return records.cend(); }

    auto operator==(const Table&) const -> bool = default;
};

}  // namespace tabula
