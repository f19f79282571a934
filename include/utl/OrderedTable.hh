#pragma once

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tuslice {
// Keyed table that iterates in insertion order, at most one entry per key
template <typename K, typename V>
class OrderedTable {
private:
  std::vector<std::pair<K, V>> _entries;
  std::unordered_map<K, size_t> _index;

public:
  using const_iterator = typename std::vector<std::pair<K, V>>::const_iterator;

  // Returns false (and leaves the table untouched) if the key is already present
  bool insert(K const& key, V value) {
    auto [it, inserted] = _index.try_emplace(key, _entries.size());
    if (!inserted) {
      return false;
    }
    _entries.emplace_back(key, std::move(value));
    return true;
  }

  V const* find(K const& key) const {
    auto it = _index.find(key);
    return it == _index.end() ? nullptr : &_entries[it->second].second;
  }

  V* find(K const& key) {
    auto it = _index.find(key);
    return it == _index.end() ? nullptr : &_entries[it->second].second;
  }

  bool contains(K const& key) const { return _index.find(key) != _index.end(); }

  // Position of the key in insertion order
  std::optional<size_t> position(K const& key) const {
    auto it = _index.find(key);
    if (it == _index.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::pair<K, V> const& at(size_t idx) const { return _entries[idx]; }

  size_t size() const { return _entries.size(); }
  bool empty() const { return _entries.empty(); }

  const_iterator begin() const { return _entries.begin(); }
  const_iterator end() const { return _entries.end(); }
};
}  // namespace tuslice
