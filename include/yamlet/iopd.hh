// This file defines the mapping container for yamlet value graphs.
// `iopd` is an insertion-order preserving dictionary used to represent YAML
// mappings while keeping the original key order and rejecting duplicate keys.
#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace yamlet {
namespace yaml {

// ---------------------------------------------------------------------------
// iopd – insertion-order preserving dictionary
//
// K and V may be incomplete at the point the dictionary type is named (the
// YAML Node type contains maps of Nodes). The index is keyed by hash value
// only, so it never stores K itself; key equality is resolved against the
// entry storage.
// ---------------------------------------------------------------------------
template <typename K, typename V, typename Hash = std::hash<K>, typename KeyEqual = std::equal_to<K>> class iopd {
public:
  // Public aliases -----------------------------------------------------------
  using key_type = K;
  using mapped_type = V;
  using hasher = Hash;
  using key_equal = KeyEqual;
  using size_type = std::size_t;

  struct entry {
    key_type key;
    mapped_type value;

    entry(key_type k, mapped_type v) : key(std::move(k)), value(std::move(v)) {}
  };

  using storage_type = std::vector<entry>;
  using iterator = typename storage_type::iterator;
  using const_iterator = typename storage_type::const_iterator;

  static constexpr size_type npos = static_cast<size_type>(-1);

private:
  // hash(key) -> position inside `storage_`; collisions share a bucket
  std::unordered_multimap<std::size_t, size_type> index_;
  storage_type storage_;

  iterator nth(size_type idx) { return storage_.begin() + static_cast<std::ptrdiff_t>(idx); }
  const_iterator nth(size_type idx) const { return storage_.cbegin() + static_cast<std::ptrdiff_t>(idx); }

  size_type locate(const key_type &key, std::size_t h) const {
    auto [first, last] = index_.equal_range(h);
    for (auto it = first; it != last; ++it) {
      if (KeyEqual{}(storage_[it->second].key, key)) {
        return it->second;
      }
    }
    return npos;
  }

  size_type locate(const key_type &key) const { return locate(key, Hash{}(key)); }

public:
  // Constructors ------------------------------------------------------------
  iopd() = default;

  // Capacity ----------------------------------------------------------------
  [[nodiscard]] bool empty() const noexcept { return storage_.empty(); }
  [[nodiscard]] size_type size() const noexcept { return storage_.size(); }
  void reserve(size_type n) {
    storage_.reserve(n);
    index_.reserve(n);
  }

  // Iteration ---------------------------------------------------------------
  iterator begin() noexcept { return storage_.begin(); }
  iterator end() noexcept { return storage_.end(); }
  const_iterator begin() const noexcept { return storage_.cbegin(); }
  const_iterator end() const noexcept { return storage_.cend(); }
  const_iterator cbegin() const noexcept { return storage_.cbegin(); }
  const_iterator cend() const noexcept { return storage_.cend(); }

  const entry &entry_at(size_type idx) const {
    if (idx >= storage_.size())
      throw std::out_of_range("iopd::entry_at – index out of range");
    return storage_[idx];
  }

  // Lookup ------------------------------------------------------------------
  bool contains(const key_type &key) const { return locate(key) != npos; }

  // Position of `key` in insertion order, or npos
  size_type index_of(const key_type &key) const { return locate(key); }

  mapped_type &at(const key_type &key) {
    auto idx = locate(key);
    if (idx == npos)
      throw std::out_of_range("iopd::at – key not found");
    return storage_[idx].value;
  }

  const mapped_type &at(const key_type &key) const {
    auto idx = locate(key);
    if (idx == npos)
      throw std::out_of_range("iopd::at – key not found");
    return storage_[idx].value;
  }

  iterator find(const key_type &key) {
    auto idx = locate(key);
    return idx == npos ? storage_.end() : nth(idx);
  }

  const_iterator find(const key_type &key) const {
    auto idx = locate(key);
    return idx == npos ? storage_.cend() : nth(idx);
  }

  // Insertion ----------------------------------------------------------------
  // Appends a key/value pair unless the key is already present, in which case
  // the dictionary is left untouched and {existing, false} is returned.
  std::pair<iterator, bool> insert(key_type key, mapped_type value) {
    const std::size_t h = Hash{}(key);
    auto existing = locate(key, h);
    if (existing != npos) {
      return {nth(existing), false};
    }

    const size_type new_index = storage_.size();
    storage_.emplace_back(std::move(key), std::move(value));
    index_.emplace(h, new_index);
    return {storage_.end() - 1, true};
  }

  // Inserts or overwrites; insertion order of an existing key stays unchanged.
  std::pair<iterator, bool> insert_or_assign(key_type key, mapped_type value) {
    const std::size_t h = Hash{}(key);
    auto existing = locate(key, h);
    if (existing != npos) {
      storage_[existing].value = std::move(value);
      return {nth(existing), false};
    }

    const size_type new_index = storage_.size();
    storage_.emplace_back(std::move(key), std::move(value));
    index_.emplace(h, new_index);
    return {storage_.end() - 1, true};
  }

  template <typename... Args>
    requires std::constructible_from<mapped_type, Args...>
  std::pair<iterator, bool> emplace(key_type key, Args &&...args) {
    return insert(std::move(key), mapped_type(std::forward<Args>(args)...));
  }

  // Erase --------------------------------------------------------------------
  // Removes the entry with given key, preserving order of remaining items.
  bool erase(const key_type &key) {
    auto idx = locate(key);
    if (idx == npos)
      return false;

    storage_.erase(nth(idx));

    // Positions after the erased one shift down by one, so rebuild the index.
    index_.clear();
    for (size_type i = 0; i < storage_.size(); ++i) {
      index_.emplace(Hash{}(storage_[i].key), i);
    }
    return true;
  }
};

} // namespace yaml
} // namespace yamlet
