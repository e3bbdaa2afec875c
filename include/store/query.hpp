#ifndef MEDIAVAULT_STORE_QUERY_HPP
#define MEDIAVAULT_STORE_QUERY_HPP

#include <functional>
#include <string>
#include <vector>
#include "store/types.hpp"

namespace mediavault {
namespace store {

enum class EntryOrder {
  Id,
  Title,
  CreatedAt,
  Favorite
};

enum class TagOrder {
  Name,
  Length
};

using EntryPredicate = std::function<bool(const Entry&)>;
using TagPredicate = std::function<bool(const std::string&)>;

// Empty predicate matches everything; order keys apply left to right,
// all in the same direction.
struct EntryQuery {
  EntryPredicate predicate;
  std::vector<EntryOrder> order;
  bool desc{false};
};

struct TagQuery {
  TagPredicate predicate;
  std::vector<TagOrder> order;
  bool desc{false};
};

// ---- PREDICATE BUILDERS ----
// Matches entries whose own or image tags contain tag
EntryPredicate with_tag(const std::string& tag);
EntryPredicate favorites_only();
TagPredicate tag_contains(const std::string& fragment);


// ---- SORTING ----
// Stable sort by successive keys
void sort_entries(std::vector<Entry>& entries, const std::vector<EntryOrder>& order, bool desc);
void sort_tags(std::vector<std::string>& tags, const std::vector<TagOrder>& order, bool desc);

} // namespace store
} // namespace mediavault

#endif // MEDIAVAULT_STORE_QUERY_HPP
