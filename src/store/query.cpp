#include "store/query.hpp"
#include <algorithm>

namespace mediavault {
namespace store {

namespace {

// Three-way compare of two entries on a single key
int compare_entries(const Entry& a, const Entry& b, EntryOrder key) {
  switch (key) {
    case EntryOrder::Id:
      return (a.id < b.id) ? -1 : (a.id > b.id ? 1 : 0);
    case EntryOrder::Title:
      return a.title.compare(b.title) < 0 ? -1 : (a.title == b.title ? 0 : 1);
    case EntryOrder::CreatedAt:
      return (a.created_at < b.created_at) ? -1 : (a.created_at > b.created_at ? 1 : 0);
    case EntryOrder::Favorite:
      return static_cast<int>(a.favorite) - static_cast<int>(b.favorite);
  }
  return 0;
}

int compare_tags(const std::string& a, const std::string& b, TagOrder key) {
  switch (key) {
    case TagOrder::Name:
      return a.compare(b) < 0 ? -1 : (a == b ? 0 : 1);
    case TagOrder::Length:
      return (a.size() < b.size()) ? -1 : (a.size() > b.size() ? 1 : 0);
  }
  return 0;
}

} // namespace

//==============================================
// PREDICATE BUILDERS
//==============================================

EntryPredicate with_tag(const std::string& tag) {
  return [tag](const Entry& entry) { return entry.has_tag(tag); };
}

EntryPredicate favorites_only() {
  return [](const Entry& entry) { return entry.favorite; };
}

TagPredicate tag_contains(const std::string& fragment) {
  return [fragment](const std::string& tag) { return tag.find(fragment) != std::string::npos; };
}


//==============================================
// SORTING
//==============================================

void sort_entries(std::vector<Entry>& entries, const std::vector<EntryOrder>& order, bool desc) {
  if (order.empty()) {
    return;
  }
  std::stable_sort(entries.begin(), entries.end(), [&order, desc](const Entry& a, const Entry& b) {
    for (auto key : order) {
      int result = compare_entries(a, b, key);
      if (result != 0) {
        return desc ? result > 0 : result < 0;
      }
    }
    return false;
  });
}

void sort_tags(std::vector<std::string>& tags, const std::vector<TagOrder>& order, bool desc) {
  if (order.empty()) {
    return;
  }
  std::stable_sort(tags.begin(), tags.end(), [&order, desc](const std::string& a, const std::string& b) {
    for (auto key : order) {
      int result = compare_tags(a, b, key);
      if (result != 0) {
        return desc ? result > 0 : result < 0;
      }
    }
    return false;
  });
}

} // namespace store
} // namespace mediavault
