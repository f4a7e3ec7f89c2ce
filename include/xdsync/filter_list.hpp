#pragma once

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <string_view>
#include <utility>
#include <vector>

namespace xdsync {

/**
 * @brief Ordered container of named filters
 *
 * Filter order is significant to the proxy, so the only structural edits are
 * appending and inserting immediately before the first element matching a
 * predicate. Elements must expose a `_name` member.
 *
 * @tparam Filter The filter element type
 */
template<typename Filter>
class filter_list {
public:
    using value_type = Filter;
    using iterator = typename std::vector<Filter>::iterator;
    using const_iterator = typename std::vector<Filter>::const_iterator;
    
    filter_list() = default;
    filter_list(std::initializer_list<Filter> filters) : _filters(filters) {}
    explicit filter_list(std::vector<Filter> filters) : _filters(std::move(filters)) {}
    
    auto push_back(Filter filter) -> void {
        _filters.push_back(std::move(filter));
    }
    
    /**
     * @brief Insert a filter immediately before the first element satisfying pred
     *
     * @return true if a matching element was found and the filter was inserted
     */
    template<typename Predicate>
    auto insert_before(Predicate&& pred, Filter filter) -> bool {
        auto it = std::find_if(_filters.begin(), _filters.end(), std::forward<Predicate>(pred));
        if (it == _filters.end()) {
            return false;
        }
        _filters.insert(it, std::move(filter));
        return true;
    }
    
    template<typename Predicate>
    auto find_if(Predicate&& pred) -> iterator {
        return std::find_if(_filters.begin(), _filters.end(), std::forward<Predicate>(pred));
    }
    
    template<typename Predicate>
    auto find_if(Predicate&& pred) const -> const_iterator {
        return std::find_if(_filters.begin(), _filters.end(), std::forward<Predicate>(pred));
    }
    
    [[nodiscard]] auto contains_name(std::string_view name) const -> bool {
        return std::any_of(_filters.begin(), _filters.end(),
            [name](const Filter& f) { return f._name == name; });
    }
    
    [[nodiscard]] auto position_of(std::string_view name) const -> std::ptrdiff_t {
        auto it = std::find_if(_filters.begin(), _filters.end(),
            [name](const Filter& f) { return f._name == name; });
        if (it == _filters.end()) {
            return -1;
        }
        return std::distance(_filters.begin(), it);
    }
    
    [[nodiscard]] auto size() const -> std::size_t { return _filters.size(); }
    [[nodiscard]] auto empty() const -> bool { return _filters.empty(); }
    
    auto operator[](std::size_t i) -> Filter& { return _filters[i]; }
    auto operator[](std::size_t i) const -> const Filter& { return _filters[i]; }
    
    auto begin() -> iterator { return _filters.begin(); }
    auto end() -> iterator { return _filters.end(); }
    auto begin() const -> const_iterator { return _filters.begin(); }
    auto end() const -> const_iterator { return _filters.end(); }
    
    auto operator==(const filter_list&) const -> bool = default;

private:
    std::vector<Filter> _filters;
};

} // namespace xdsync
