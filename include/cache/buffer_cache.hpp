#ifndef MEDIAVAULT_BUFFER_CACHE_HPP
#define MEDIAVAULT_BUFFER_CACHE_HPP

#include <cstddef>
#include <list>
#include <map>
#include <mutex>
#include <optional>
#include <utility>
#include <boost/log/trivial.hpp>
#include "store/types.hpp"

namespace mediavault {
namespace cache {

// Least-recently-used cache of decoded payloads keyed by (variant, image id).
// A capacity of 0 disables eviction.
template <typename T>
class BufferCache {
public:
  using Key = std::pair<store::Variant, store::SubItemId>;

  explicit BufferCache(std::size_t capacity = 64) : capacity_(capacity) {}

  std::optional<T> get(store::Variant variant, store::SubItemId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(Key{variant, id});
    if (it == index_.end()) {
      return std::nullopt;
    }
    // Move to the front of the recency list
    order_.splice(order_.begin(), order_, it->second);
    return it->second->second;
  }

  void put(store::Variant variant, store::SubItemId id, T value) {
    std::lock_guard<std::mutex> lock(mutex_);
    const Key key{variant, id};
    auto it = index_.find(key);
    if (it != index_.end()) {
      it->second->second = std::move(value);
      order_.splice(order_.begin(), order_, it->second);
      return;
    }

    order_.emplace_front(key, std::move(value));
    index_[key] = order_.begin();

    if (capacity_ > 0 && order_.size() > capacity_) {
      const Key& oldest = order_.back().first;
      BOOST_LOG_TRIVIAL(trace) << "Buffer cache: Evicting " << store::to_string(oldest.first)
                               << " of image " << oldest.second;
      index_.erase(oldest);
      order_.pop_back();
    }
  }

  // Drops every variant of an image
  bool remove(store::SubItemId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool removed = false;
    for (auto variant : {store::Variant::Thumbnail, store::Variant::Exhibition, store::Variant::Origin}) {
      auto it = index_.find(Key{variant, id});
      if (it != index_.end()) {
        order_.erase(it->second);
        index_.erase(it);
        removed = true;
      }
    }
    return removed;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    index_.clear();
    order_.clear();
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_.size();
  }


private:
  using Node = std::pair<Key, T>;

  std::size_t capacity_;
  std::list<Node> order_;  // most recently used first
  std::map<Key, typename std::list<Node>::iterator> index_;
  mutable std::mutex mutex_;
};

} // namespace cache
} // namespace mediavault

#endif // MEDIAVAULT_BUFFER_CACHE_HPP
