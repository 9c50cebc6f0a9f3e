#include <shuttle/headers.hpp>

#include <algorithm>

#include "utils.hpp"

Headers::Headers(std::initializer_list<std::pair<std::string, std::string>> fields)
{
    for (auto const& [name, value] : fields) {
        this->add(name, value);
    }
}

auto Headers::find(std::string_view name) -> std::vector<Entry>::iterator
{
    return std::find_if(std::begin(entries_), std::end(entries_),
                        [name](Entry const& e) { return shuttle::utils::equalsIgnoreCase(e.name, name); });
}

auto Headers::find(std::string_view name) const -> const_iterator
{
    return std::find_if(std::begin(entries_), std::end(entries_),
                        [name](Entry const& e) { return shuttle::utils::equalsIgnoreCase(e.name, name); });
}

auto Headers::has(std::string_view name) const -> bool
{
    return this->find(name) != std::end(entries_);
}

auto Headers::get(std::string_view name) const -> std::vector<std::string>
{
    if (auto const iter = this->find(name); iter != std::end(entries_)) {
        return iter->values;
    }
    return {};
}

auto Headers::line(std::string_view name) const -> std::string
{
    std::string result;
    for (auto const& value : this->get(name)) {
        if (!result.empty()) {
            result += ", ";
        }
        result += value;
    }
    return result;
}

void Headers::set(std::string_view name, std::string_view value)
{
    if (auto iter = this->find(name); iter != std::end(entries_)) {
        iter->name = std::string{name};
        iter->values = {std::string{value}};
        return;
    }
    entries_.push_back(Entry{std::string{name}, {std::string{value}}});
}

void Headers::add(std::string_view name, std::string_view value)
{
    if (auto iter = this->find(name); iter != std::end(entries_)) {
        iter->values.emplace_back(value);
        return;
    }
    entries_.push_back(Entry{std::string{name}, {std::string{value}}});
}

void Headers::remove(std::string_view name)
{
    if (auto iter = this->find(name); iter != std::end(entries_)) {
        entries_.erase(iter);
    }
}
