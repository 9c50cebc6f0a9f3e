#ifndef SHUTTLE_HEADERS_HPP_
#define SHUTTLE_HEADERS_HPP_

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Ordered header multimap.
//
// Names compare case-insensitively; the casing last given to set()
// (or first given to add()) is kept for output. Entries stay in the
// order their names were first declared.
class Headers {
public:
    struct Entry {
        std::string name;
        std::vector<std::string> values;
    };
    using const_iterator = std::vector<Entry>::const_iterator;

    Headers() = default;
    Headers(std::initializer_list<std::pair<std::string, std::string>> fields);

    auto has(std::string_view name) const -> bool;

    // empty if the name is absent
    auto get(std::string_view name) const -> std::vector<std::string>;
    auto line(std::string_view name) const -> std::string;

    void set(std::string_view name, std::string_view value);
    void add(std::string_view name, std::string_view value);
    void remove(std::string_view name);

    auto size() const -> size_t { return entries_.size(); }
    auto empty() const -> bool { return entries_.empty(); }

    auto begin() const -> const_iterator { return std::begin(entries_); }
    auto end() const -> const_iterator { return std::end(entries_); }

private:
    std::vector<Entry> entries_;

    auto find(std::string_view name) -> std::vector<Entry>::iterator;
    auto find(std::string_view name) const -> const_iterator;
};

#endif  // SHUTTLE_HEADERS_HPP_
