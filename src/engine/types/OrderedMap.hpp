#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <list>
#include <unordered_map>
#include <utility>

namespace kineticEngine {

/**
 * @brief Hash map that iterates in insertion order
 *
 * Entries live in a list (iteration order), a sparse index maps keys to
 * list positions. Erasing keeps the order of the remaining entries.
 */
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class OrderedMap {
  public:
    using Entry = std::pair<const Key, Value>;
    using iterator = typename std::list<Entry>::iterator;
    using const_iterator = typename std::list<Entry>::const_iterator;

    // Returns false and leaves the map untouched when the key is present.
    bool tryAdd(const Key& key, Value value) {
        if (_index.find(key) != _index.end()) return false;
        _entries.emplace_back(key, std::move(value));
        _index.emplace(key, std::prev(_entries.end()));
        return true;
    }

    Value* find(const Key& key) {
        auto it = _index.find(key);
        if (it == _index.end()) return nullptr;
        return &it->second->second;
    }

    const Value* find(const Key& key) const {
        auto it = _index.find(key);
        if (it == _index.end()) return nullptr;
        return &it->second->second;
    }

    bool contains(const Key& key) const {
        return _index.find(key) != _index.end();
    }

    bool erase(const Key& key) {
        auto it = _index.find(key);
        if (it == _index.end()) return false;
        _entries.erase(it->second);
        _index.erase(it);
        return true;
    }

    void clear() {
        _index.clear();
        _entries.clear();
    }

    std::size_t size() const { return _entries.size(); }
    bool empty() const { return _entries.empty(); }

    iterator begin() { return _entries.begin(); }
    iterator end() { return _entries.end(); }
    const_iterator begin() const { return _entries.begin(); }
    const_iterator end() const { return _entries.end(); }

  private:
    std::list<Entry> _entries;
    std::unordered_map<Key, iterator, Hash> _index;
};

}  // namespace kineticEngine
