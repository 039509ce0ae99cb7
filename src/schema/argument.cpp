#include "schema/argument.hpp"

#include "text/case_fold.hpp"

namespace argschema::schema {

auto argument_name(const Argument& arg) -> const std::string& {
    return std::visit([](const auto& a) -> const std::string& { return a.name; }, arg);
}

auto argument_member(const Argument& arg) -> const metadata::MemberSymbol* {
    return std::visit([](const auto& a) { return a.member; }, arg);
}

// ============================================================================
// GroupMap
// ============================================================================

auto GroupMap::add_group(std::string_view name) -> bool {
    auto key = text::fold_case(name);
    if (index_.contains(key)) {
        return false;
    }
    index_.emplace(std::move(key), groups_.size());
    groups_.push_back(Group{std::string(name), {}});
    return true;
}

auto GroupMap::get_or_create(std::string_view name) -> std::vector<Argument>& {
    auto key = text::fold_case(name);
    auto it = index_.find(key);
    if (it != index_.end()) {
        return groups_[it->second].arguments;
    }
    index_.emplace(std::move(key), groups_.size());
    groups_.push_back(Group{std::string(name), {}});
    return groups_.back().arguments;
}

auto GroupMap::find(std::string_view name) const -> const std::vector<Argument>* {
    auto it = index_.find(text::fold_case(name));
    if (it == index_.end()) {
        return nullptr;
    }
    return &groups_[it->second].arguments;
}

void GroupMap::append_to_all(const Argument& arg) {
    for (auto& group : groups_) {
        group.arguments.push_back(arg);
    }
}

auto GroupMap::names() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(groups_.size());
    for (const auto& group : groups_) {
        out.push_back(group.name);
    }
    return out;
}

} // namespace argschema::schema
