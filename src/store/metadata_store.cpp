#include "store/metadata_store.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace mediavault {
namespace store {

//==============================================
// CONSTRUCTOR
//==============================================

MetadataStore::MetadataStore(const std::filesystem::path& folder, const crypto::Codec& codec)
  : folder_(folder)
  , codec_(codec) {
  BOOST_LOG_TRIVIAL(debug) << "Metadata store: Created for folder: " << folder_.string();
}


//==============================================
// PERSISTENCE
//==============================================

bool MetadataStore::load() {
  const auto file_path = document_path();
  BOOST_LOG_TRIVIAL(info) << "Metadata store: Loading document: " << file_path.string();

  std::error_code ec;
  const bool found = std::filesystem::exists(file_path, ec);
  if (ec) {
    // Unknown state; starting empty here could overwrite the catalog on save
    BOOST_LOG_TRIVIAL(error) << "Metadata store: Cannot inspect document " << file_path.string()
                             << ": " << ec.message();
    return false;
  }
  if (!found) {
    check_directory_exists();
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = State{};
    BOOST_LOG_TRIVIAL(info) << "Metadata store: No document found, starting with an empty catalog";
    return true;
  }

  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Metadata store: Failed to open document: " << file_path.string();
    return false;
  }
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

  auto text = codec_.decode_document(bytes);
  if (!text) {
    BOOST_LOG_TRIVIAL(error) << "Metadata store: Document could not be decoded";
    return false;
  }

  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value document;
  std::string errors;
  if (!reader->parse(text->data(), text->data() + text->size(), &document, &errors)) {
    BOOST_LOG_TRIVIAL(error) << "Metadata store: Malformed document: " << errors;
    return false;
  }

  try {
    State loaded = deserialize(document);
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = std::move(loaded);
    BOOST_LOG_TRIVIAL(info) << "Metadata store: Loaded " << state_.entries.size() << " entries and "
                            << state_.tags.size() << " tags";
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Metadata store: Invalid document structure: " << e.what();
    return false;
  }
  return true;
}

void MetadataStore::save() const {
  Json::Value document;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    document = serialize(state_);
  }

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  const auto bytes = codec_.encode_document(Json::writeString(builder, document));

  check_directory_exists();
  const auto file_path = document_path();
  auto temp_path = file_path;
  temp_path += ".tmp";

  {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw StoreError("Metadata store: Failed to create file: " + temp_path.string());
    }
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    file.flush();
    if (!file) {
      throw StoreError("Metadata store: Failed to write document: " + temp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, file_path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Metadata store: Failed to replace document: " << ec.message();
    throw StoreError("Metadata store: Failed to replace document: " + ec.message());
  }
  BOOST_LOG_TRIVIAL(info) << "Metadata store: Saved document of " << bytes.size() << " bytes";
}


//==============================================
// DOCUMENT CODEC
//==============================================

Json::Value MetadataStore::serialize(const State& state) const {
  Json::Value document(Json::objectValue);
  document["version"] = FORMAT_VERSION;

  Json::Value next_index(Json::objectValue);
  next_index["entry"] = static_cast<Json::Int64>(state.next_entry_id);
  next_index["sub_item"] = static_cast<Json::Int64>(state.next_sub_item_id);
  next_index["block"] = static_cast<Json::UInt64>(state.next_block_index);
  document["next_index"] = next_index;

  Json::Value entries(Json::arrayValue);
  for (const auto& [id, entry] : state.entries) {
    entries.append(to_json(entry));
  }
  document["entries"] = entries;

  Json::Value blocks(Json::objectValue);
  for (const auto& [sub_item, variants] : state.blocks) {
    Json::Value records(Json::objectValue);
    for (const auto& [variant, record] : variants) {
      records[to_string(variant)] = to_json(record);
    }
    blocks[std::to_string(sub_item)] = records;
  }
  document["blocks"] = blocks;

  Json::Value free_blocks(Json::arrayValue);
  for (auto block : state.free_blocks) {
    free_blocks.append(static_cast<Json::UInt64>(block));
  }
  document["free_blocks"] = free_blocks;

  Json::Value config(Json::objectValue);
  for (const auto& [key, value] : state.config) {
    config[key] = value;
  }
  document["config"] = config;

  // Derived from the entries; never read back
  Json::Value tags(Json::arrayValue);
  for (const auto& tag : state.tags) {
    tags.append(tag);
  }
  document["tags"] = tags;
  return document;
}

MetadataStore::State MetadataStore::deserialize(const Json::Value& document) const {
  if (!document.isObject() || !document["version"].isString()) {
    throw StoreError("missing version tag");
  }
  // The version tag is informational until an incompatible layout ships
  BOOST_LOG_TRIVIAL(debug) << "Metadata store: Document version " << document["version"].asString();

  const Json::Value& next_index = document["next_index"];
  if (!next_index.isObject() || !document["entries"].isArray()) {
    throw StoreError("missing counters or entries");
  }

  State state;
  state.next_entry_id = next_index["entry"].asInt64();
  state.next_sub_item_id = next_index["sub_item"].asInt64();
  state.next_block_index = next_index["block"].asUInt64();

  for (const auto& value : document["entries"]) {
    Entry entry = entry_from_json(value);
    for (const auto& image : entry.images) {
      if (!state.sub_items.emplace(image.id, entry.id).second) {
        throw StoreError("duplicate image id " + std::to_string(image.id));
      }
      state.tags.insert(image.tags.begin(), image.tags.end());
    }
    state.tags.insert(entry.tags.begin(), entry.tags.end());
    const EntryId id = entry.id;
    if (!state.entries.emplace(id, std::move(entry)).second) {
      throw StoreError("duplicate entry id " + std::to_string(id));
    }
  }

  const Json::Value& blocks = document["blocks"];
  if (blocks.isObject()) {
    for (const auto& key : blocks.getMemberNames()) {
      const SubItemId sub_item = std::stoll(key);
      const Json::Value& records = blocks[key];
      for (const auto& name : records.getMemberNames()) {
        auto variant = variant_from_string(name);
        if (!variant) {
          throw StoreError("unknown variant " + name);
        }
        state.blocks[sub_item][*variant] = block_record_from_json(records[name]);
      }
    }
  }

  for (const auto& block : document["free_blocks"]) {
    state.free_blocks.push_back(block.asUInt64());
  }

  const Json::Value& config = document["config"];
  if (config.isObject()) {
    for (const auto& key : config.getMemberNames()) {
      state.config[key] = config[key];
    }
  }
  return state;
}


//==============================================
// ENTRY OPERATIONS
//==============================================

std::vector<Entry> MetadataStore::find_entries(const EntryQuery& query) const {
  std::vector<Entry> result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, entry] : state_.entries) {
      if (!query.predicate || query.predicate(entry)) {
        result.push_back(entry);
      }
    }
  }
  sort_entries(result, query.order, query.desc);
  return result;
}

std::optional<Entry> MetadataStore::get_entry(EntryId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = state_.entries.find(id);
  if (it == state_.entries.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Entry> MetadataStore::create_entries(std::vector<Entry> entries) {
  std::lock_guard<std::mutex> lock(mutex_);

  // Validate explicit ids before touching any state
  std::set<EntryId> batch_entries;
  std::set<SubItemId> batch_sub_items;
  EntryId max_entry = 0;
  SubItemId max_sub_item = 0;
  for (const auto& entry : entries) {
    if (entry.id < 0) {
      throw StoreError("Metadata store: Negative entry id " + std::to_string(entry.id));
    }
    if (entry.id > 0 && (state_.entries.count(entry.id) > 0 || !batch_entries.insert(entry.id).second)) {
      throw StoreError("Metadata store: Entry id already exists: " + std::to_string(entry.id));
    }
    max_entry = std::max(max_entry, entry.id);
    for (const auto& image : entry.images) {
      if (image.id < 0) {
        throw StoreError("Metadata store: Negative image id " + std::to_string(image.id));
      }
      if (image.id > 0 && (state_.sub_items.count(image.id) > 0 || !batch_sub_items.insert(image.id).second)) {
        throw StoreError("Metadata store: Image id already exists: " + std::to_string(image.id));
      }
      max_sub_item = std::max(max_sub_item, image.id);
    }
  }

  // Generated ids always land above every explicit id
  state_.next_entry_id = std::max(state_.next_entry_id, max_entry + 1);
  state_.next_sub_item_id = std::max(state_.next_sub_item_id, max_sub_item + 1);

  for (auto& entry : entries) {
    if (entry.id == 0) {
      entry.id = state_.next_entry_id++;
    }
    assign_sub_item_ids(entry);
    for (const auto& image : entry.images) {
      state_.sub_items[image.id] = entry.id;
    }
    fold_tags(entry);
    state_.entries[entry.id] = entry;
  }

  BOOST_LOG_TRIVIAL(debug) << "Metadata store: Created " << entries.size() << " entries";
  return entries;
}

UpdateResult MetadataStore::update_entries(std::vector<Entry> entries) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::set<SubItemId> batch_sub_items;
  SubItemId max_sub_item = 0;
  for (const auto& entry : entries) {
    if (state_.entries.count(entry.id) == 0) {
      continue;
    }
    for (const auto& image : entry.images) {
      if (image.id < 0) {
        throw StoreError("Metadata store: Negative image id " + std::to_string(image.id));
      }
      if (image.id == 0) {
        continue;
      }
      auto owner = state_.sub_items.find(image.id);
      if ((owner != state_.sub_items.end() && owner->second != entry.id) ||
          !batch_sub_items.insert(image.id).second) {
        throw StoreError("Metadata store: Image id belongs to another entry: " + std::to_string(image.id));
      }
      max_sub_item = std::max(max_sub_item, image.id);
    }
  }
  state_.next_sub_item_id = std::max(state_.next_sub_item_id, max_sub_item + 1);

  UpdateResult result;
  for (auto& entry : entries) {
    auto it = state_.entries.find(entry.id);
    if (it == state_.entries.end()) {
      BOOST_LOG_TRIVIAL(debug) << "Metadata store: Skipping update of unknown entry " << entry.id;
      continue;
    }

    assign_sub_item_ids(entry);

    std::set<SubItemId> kept;
    for (const auto& image : entry.images) {
      kept.insert(image.id);
    }
    for (const auto& image : it->second.images) {
      if (kept.count(image.id) == 0) {
        release_sub_item(image.id);
        result.released.push_back(image.id);
      }
    }
    for (const auto& image : entry.images) {
      state_.sub_items[image.id] = entry.id;
    }

    fold_tags(entry);
    it->second = entry;
    result.updated.push_back(std::move(entry));
  }

  BOOST_LOG_TRIVIAL(debug) << "Metadata store: Updated " << result.updated.size() << " of "
                           << entries.size() << " entries";
  return result;
}

DeleteResult MetadataStore::delete_entries(const std::vector<EntryId>& ids) {
  std::lock_guard<std::mutex> lock(mutex_);

  DeleteResult result;
  for (auto id : ids) {
    auto it = state_.entries.find(id);
    if (it == state_.entries.end()) {
      continue;
    }
    for (const auto& image : it->second.images) {
      release_sub_item(image.id);
      result.released.push_back(image.id);
    }
    state_.entries.erase(it);
    ++result.deleted;
  }

  BOOST_LOG_TRIVIAL(debug) << "Metadata store: Deleted " << result.deleted << " entries, "
                           << state_.free_blocks.size() << " blocks now free";
  return result;
}


//==============================================
// TAG OPERATIONS
//==============================================

std::vector<std::string> MetadataStore::find_tags(const TagQuery& query) const {
  std::vector<std::string> result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& tag : state_.tags) {
      if (!query.predicate || query.predicate(tag)) {
        result.push_back(tag);
      }
    }
  }
  sort_tags(result, query.order, query.desc);
  return result;
}


//==============================================
// BLOCK MAP
//==============================================

BlockIndex MetadataStore::allocate_block() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!state_.free_blocks.empty()) {
    BlockIndex block = state_.free_blocks.front();
    state_.free_blocks.pop_front();
    return block;
  }
  return state_.next_block_index++;
}

void MetadataStore::release_blocks(const std::vector<BlockIndex>& blocks) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_.free_blocks.insert(state_.free_blocks.end(), blocks.begin(), blocks.end());
}

bool MetadataStore::record_blocks(SubItemId sub_item, Variant variant, BlockRecord record) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (state_.sub_items.count(sub_item) == 0) {
    BOOST_LOG_TRIVIAL(warning) << "Metadata store: Image " << sub_item
                               << " no longer exists, freeing " << record.blocks.size() << " blocks";
    state_.free_blocks.insert(state_.free_blocks.end(), record.blocks.begin(), record.blocks.end());
    return false;
  }

  auto& slot = state_.blocks[sub_item];
  auto previous = slot.find(variant);
  if (previous != slot.end()) {
    const auto& old_blocks = previous->second.blocks;
    state_.free_blocks.insert(state_.free_blocks.end(), old_blocks.begin(), old_blocks.end());
  }
  slot[variant] = std::move(record);
  return true;
}

std::optional<BlockRecord> MetadataStore::find_blocks(SubItemId sub_item, Variant variant) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto slot = state_.blocks.find(sub_item);
  if (slot == state_.blocks.end()) {
    return std::nullopt;
  }
  auto record = slot->second.find(variant);
  if (record == slot->second.end()) {
    return std::nullopt;
  }
  return record->second;
}

bool MetadataStore::has_sub_item(SubItemId sub_item) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.sub_items.count(sub_item) > 0;
}


//==============================================
// CONFIGURATION
//==============================================

std::optional<Json::Value> MetadataStore::get_config(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = state_.config.find(key);
  if (it == state_.config.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MetadataStore::put_config(const std::string& key, const Json::Value& value) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_.config[key] = value;
}

bool MetadataStore::exists_config(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.config.count(key) > 0;
}


//==============================================
// GETTERS
//==============================================

EntryId MetadataStore::next_entry_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.next_entry_id;
}

SubItemId MetadataStore::next_sub_item_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.next_sub_item_id;
}

BlockIndex MetadataStore::next_block_index() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.next_block_index;
}

std::vector<BlockIndex> MetadataStore::free_blocks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<BlockIndex>(state_.free_blocks.begin(), state_.free_blocks.end());
}

std::size_t MetadataStore::entry_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.entries.size();
}


//==============================================
// UTILITY METHODS
//==============================================

void MetadataStore::fold_tags(const Entry& entry) {
  state_.tags.insert(entry.tags.begin(), entry.tags.end());
  for (const auto& image : entry.images) {
    state_.tags.insert(image.tags.begin(), image.tags.end());
  }
}

void MetadataStore::release_sub_item(SubItemId sub_item) {
  auto slot = state_.blocks.find(sub_item);
  if (slot != state_.blocks.end()) {
    for (const auto& [variant, record] : slot->second) {
      state_.free_blocks.insert(state_.free_blocks.end(), record.blocks.begin(), record.blocks.end());
    }
    state_.blocks.erase(slot);
  }
  state_.sub_items.erase(sub_item);
}

void MetadataStore::assign_sub_item_ids(Entry& entry) {
  for (auto& image : entry.images) {
    if (image.id == 0) {
      image.id = state_.next_sub_item_id++;
    }
  }
}

void MetadataStore::check_directory_exists() const {
  std::error_code ec;
  std::filesystem::create_directories(folder_, ec);
  // An existing folder is not an error
  std::error_code probe;
  if (ec && !std::filesystem::is_directory(folder_, probe)) {
    throw StoreError("Metadata store: Failed to create folder " + folder_.string() + ": " + ec.message());
  }
}

} // namespace store
} // namespace mediavault
