#include "metadata/symbol.hpp"

#include <sstream>

namespace argschema::metadata {

auto TypedConstant::to_display() const -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return std::to_string(v);
            } else if constexpr (std::is_same_v<T, double>) {
                std::ostringstream oss;
                oss << v;
                return oss.str();
            } else {
                return "\"" + v + "\"";
            }
        },
        value);
}

auto member_kind_name(MemberKind kind) -> const char* {
    switch (kind) {
    case MemberKind::Property:
        return "property";
    case MemberKind::Field:
        return "field";
    case MemberKind::Method:
        return "method";
    }
    return "unknown";
}

auto type_kind_name(TypeKind kind) -> const char* {
    switch (kind) {
    case TypeKind::Class:
        return "class";
    case TypeKind::Struct:
        return "struct";
    case TypeKind::Enum:
        return "enum";
    }
    return "unknown";
}

// ============================================================================
// MetadataStore
// ============================================================================

auto MetadataStore::add_type(TypeSymbol type) -> const TypeSymbol& {
    types_.push_back(make_box<TypeSymbol>(std::move(type)));
    const TypeSymbol* added = types_.back().get();
    by_name_[added->name] = added;
    return *added;
}

auto MetadataStore::types() const -> std::vector<const TypeSymbol*> {
    std::vector<const TypeSymbol*> out;
    out.reserve(types_.size());
    for (const auto& type : types_) {
        out.push_back(type.get());
    }
    return out;
}

auto MetadataStore::find_type(std::string_view name) const -> const TypeSymbol* {
    auto it = by_name_.find(std::string(name));
    return it != by_name_.end() ? it->second : nullptr;
}

} // namespace argschema::metadata
