#pragma once

#include <deque>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include <json/json.h>
#include "crypto/codec.hpp"
#include "store/query.hpp"
#include "store/types.hpp"

namespace mediavault {
namespace store {

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

struct UpdateResult {
  std::vector<Entry> updated;
  std::vector<SubItemId> released;  // images dropped by the update
};

struct DeleteResult {
  std::size_t deleted{0};
  std::vector<SubItemId> released;  // images of the deleted entries
};

// In-memory catalog persisted as one encrypted document.
// Tags only grow during a session; the set is rebuilt from the entries on load,
// which is the only point where unreferenced tags disappear.
class MetadataStore {
public:
  static constexpr const char* DOCUMENT_NAME = "data.db";
  static constexpr const char* FORMAT_VERSION = "v1.0.0";

  // ---- CONSTRUCTOR ----
  MetadataStore(const std::filesystem::path& folder, const crypto::Codec& codec);


  // ---- PERSISTENCE ----
  // Restores the document, or starts empty if none exists. Returns false and keeps
  // the current state when the document cannot be decoded.
  bool load();
  // Replaces the document atomically through a temporary file
  void save() const;


  // ---- ENTRY OPERATIONS ----
  std::vector<Entry> find_entries(const EntryQuery& query) const;
  std::optional<Entry> get_entry(EntryId id) const;
  // Assigns missing ids; throws StoreError on explicit id collisions
  std::vector<Entry> create_entries(std::vector<Entry> entries);
  // Replaces entries by id; unknown ids are skipped
  UpdateResult update_entries(std::vector<Entry> entries);
  // Removes entries and returns all of their blocks to the free list
  DeleteResult delete_entries(const std::vector<EntryId>& ids);


  // ---- TAG OPERATIONS ----
  std::vector<std::string> find_tags(const TagQuery& query) const;


  // ---- BLOCK MAP ----
  // Oldest freed block first, then the next unused index
  BlockIndex allocate_block();
  void release_blocks(const std::vector<BlockIndex>& blocks);
  // Records the blocks of a payload variant, freeing any previous record of the slot.
  // Returns false (and frees the blocks) if the image no longer exists.
  bool record_blocks(SubItemId sub_item, Variant variant, BlockRecord record);
  std::optional<BlockRecord> find_blocks(SubItemId sub_item, Variant variant) const;
  bool has_sub_item(SubItemId sub_item) const;


  // ---- CONFIGURATION ----
  std::optional<Json::Value> get_config(const std::string& key) const;
  void put_config(const std::string& key, const Json::Value& value);
  bool exists_config(const std::string& key) const;


  // ---- GETTERS ----
  std::filesystem::path document_path() const { return folder_ / DOCUMENT_NAME; }
  EntryId next_entry_id() const;
  SubItemId next_sub_item_id() const;
  BlockIndex next_block_index() const;
  std::vector<BlockIndex> free_blocks() const;
  std::size_t entry_count() const;

private:
  // Whole catalog; replaced as a unit on load
  struct State {
    EntryId next_entry_id{1};
    SubItemId next_sub_item_id{1};
    BlockIndex next_block_index{0};
    std::map<EntryId, Entry> entries;
    std::map<SubItemId, EntryId> sub_items;  // image id -> owning entry
    std::set<std::string> tags;
    std::map<SubItemId, std::map<Variant, BlockRecord>> blocks;
    std::deque<BlockIndex> free_blocks;
    std::map<std::string, Json::Value> config;
  };

  // ---- PARAMETERS ----
  std::filesystem::path folder_;
  const crypto::Codec& codec_;
  State state_;
  mutable std::mutex mutex_;


  // ---- DOCUMENT CODEC ----
  Json::Value serialize(const State& state) const;
  // Throws on malformed documents
  State deserialize(const Json::Value& document) const;


  // ---- HELPERS (caller holds mutex_) ----
  void fold_tags(const Entry& entry);
  void release_sub_item(SubItemId sub_item);
  void assign_sub_item_ids(Entry& entry);
  void check_directory_exists() const;
};

} // namespace store
} // namespace mediavault
