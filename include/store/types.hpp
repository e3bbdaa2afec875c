#ifndef MEDIAVAULT_STORE_TYPES_HPP
#define MEDIAVAULT_STORE_TYPES_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <json/json.h>

namespace mediavault {
namespace store {

using EntryId = int64_t;
using SubItemId = int64_t;
using BlockIndex = uint64_t;

// Named renditions of an image payload
enum class Variant : uint8_t {
  Origin,
  Exhibition,
  Thumbnail
};

const char* to_string(Variant variant);
std::optional<Variant> variant_from_string(const std::string& name);

// Image belonging to an entry
struct SubItem {
  SubItemId id{0};  // 0 means unassigned
  std::set<std::string> tags;

  bool operator==(const SubItem& other) const {
    return id == other.id && tags == other.tags;
  }
};

// Catalog entry (an illustration with its images)
struct Entry {
  EntryId id{0};  // 0 means unassigned
  std::string title;
  int64_t created_at{0};  // epoch milliseconds
  bool favorite{false};
  std::set<std::string> tags;
  std::vector<SubItem> images;
  std::map<std::string, std::string> attributes;

  // True if the entry or any of its images carries the tag
  bool has_tag(const std::string& tag) const;

  bool operator==(const Entry& other) const {
    return id == other.id && title == other.title && created_at == other.created_at &&
           favorite == other.favorite && tags == other.tags && images == other.images &&
           attributes == other.attributes;
  }
};

// Blocks holding one encrypted payload variant
struct BlockRecord {
  std::vector<BlockIndex> blocks;
  uint64_t size{0};
};


// ---- JSON CONVERSION ----
Json::Value to_json(const Entry& entry);
// Throws Json::LogicError or std::invalid_argument on malformed input
Entry entry_from_json(const Json::Value& value);

Json::Value to_json(const BlockRecord& record);
BlockRecord block_record_from_json(const Json::Value& value);

} // namespace store
} // namespace mediavault

#endif // MEDIAVAULT_STORE_TYPES_HPP
