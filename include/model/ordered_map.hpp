#pragma once

#include <iterator>
#include <list>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace kbg {

/**
 * @brief Associative container that iterates in insertion order
 *
 * Overwriting an existing key keeps its original position; erasing a key and
 * setting it again moves it to the end. Knowledge-base mappings rely on this
 * so that re-indexing follows source encounter order.
 */
template <typename Key, typename Value>
class OrderedMap {
public:
    using value_type = std::pair<const Key, Value>;
    using iterator = typename std::list<value_type>::iterator;
    using const_iterator = typename std::list<value_type>::const_iterator;

    OrderedMap() = default;

    OrderedMap(const OrderedMap& other) { *this = other; }

    OrderedMap& operator=(const OrderedMap& other) {
        if (this != &other) {
            clear();
            for (const auto& [key, value] : other) {
                set(key, value);
            }
        }
        return *this;
    }

    OrderedMap(OrderedMap&&) = default;
    OrderedMap& operator=(OrderedMap&&) = default;

    /**
     * @brief Insert or overwrite; returns true when the key was new
     */
    bool set(const Key& key, Value value) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = std::move(value);
            return false;
        }
        entries_.emplace_back(key, std::move(value));
        index_.emplace(key, std::prev(entries_.end()));
        return true;
    }

    bool erase(const Key& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        entries_.erase(it->second);
        index_.erase(it);
        return true;
    }

    /**
     * @brief Remove every entry matching the predicate, returns the count
     */
    template <typename Predicate>
    size_t erase_if(Predicate pred) {
        size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (pred(*it)) {
                index_.erase(it->first);
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    bool contains(const Key& key) const { return index_.find(key) != index_.end(); }

    const Value* find(const Key& key) const {
        auto it = index_.find(key);
        return it != index_.end() ? &it->second->second : nullptr;
    }

    Value* find(const Key& key) {
        auto it = index_.find(key);
        return it != index_.end() ? &it->second->second : nullptr;
    }

    const Value& at(const Key& key) const {
        auto it = index_.find(key);
        if (it == index_.end()) {
            throw std::out_of_range("OrderedMap::at: key not found");
        }
        return it->second->second;
    }

    /**
     * @brief Access or default-insert at the end
     */
    Value& operator[](const Key& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            entries_.emplace_back(key, Value{});
            it = index_.emplace(key, std::prev(entries_.end())).first;
        }
        return it->second->second;
    }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    void clear() {
        entries_.clear();
        index_.clear();
    }

    iterator begin() { return entries_.begin(); }
    iterator end() { return entries_.end(); }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

private:
    std::list<value_type> entries_;
    std::unordered_map<Key, iterator> index_;
};

} // namespace kbg
