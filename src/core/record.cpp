#include <tabula/core/record.hpp>

#include <algorithm>

namespace tabula {

namespace {

const Value kNullValue{};

}  // namespace

Record::Record(std::initializer_list<Field> fields) {
    fields_.reserve(fields.size());
    for (const auto& field : fields) {
        set(field.name, field.value);
    }
}

auto Record::contains(std::string_view name) const noexcept -> bool {
    return find(name) != nullptr;
}

auto Record::find(std::string_view name) const noexcept -> const Value* {
    auto it = std::ranges::find_if(fields_, [name](const Field& f) { return f.name == name; });
    if (it == fields_.end()) {
        return nullptr;
    }
    return &it->value;
}

auto Record::find(std::string_view name) noexcept -> Value* {
    auto it = std::ranges::find_if(fields_, [name](const Field& f) { return f.name == name; });
    if (it == fields_.end()) {
        return nullptr;
    }
    return &it->value;
}

auto Record::get(std::string_view name) const noexcept -> const Value& {
    if (const auto* value = find(name)) {
        return *value;
    }
    return kNullValue;
}

void Record::set(std::string name, Value value) {
    if (auto* existing = find(name)) {
        *existing = std::move(value);
        return;
    }
    fields_.push_back(Field{.name = std::move(name), .value = std::move(value)});
}

}  // namespace tabula
