#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>
#include "cache/buffer_cache.hpp"
#include "crypto/codec.hpp"
#include "engine/engine_settings.hpp"
#include "store/block_storage.hpp"
#include "store/metadata_store.hpp"
#include "store/query.hpp"
#include "store/types.hpp"

namespace mediavault {
namespace engine {

using Payload = std::shared_ptr<const std::vector<uint8_t>>;

// Produces the smaller exhibition rendition from raw image bytes
using Transcoder = std::function<std::vector<uint8_t>(const std::vector<uint8_t>&)>;

// Local storage engine for one folder. Owns the catalog between connect() and
// close(); one engine per folder at a time.
class DataEngine {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  DataEngine(const std::filesystem::path& folder, const std::string& passphrase,
             Transcoder transcoder, const EngineSettings& settings = EngineSettings{});
  ~DataEngine();

  DataEngine(const DataEngine&) = delete;
  DataEngine& operator=(const DataEngine&) = delete;


  // ---- LIFECYCLE ----
  // Loads the catalog; false if the document exists but cannot be decoded
  bool connect();
  // Persists the catalog
  void close();


  // ---- ENTRY OPERATIONS ----
  std::vector<store::Entry> find_entries(const store::EntryQuery& query) const;
  std::vector<store::Entry> create_entries(std::vector<store::Entry> entries);
  std::vector<store::Entry> update_entries(std::vector<store::Entry> entries);
  std::size_t delete_entries(const std::vector<store::EntryId>& ids);
  std::size_t delete_entries(const std::vector<store::Entry>& entries);


  // ---- TAG OPERATIONS ----
  std::vector<std::string> find_tags(const store::TagQuery& query) const;


  // ---- PAYLOAD OPERATIONS ----
  // Stores the origin rendition, then the transcoded exhibition rendition.
  // The two records are written one after the other, not as a pair.
  std::future<void> save_payload(store::SubItemId sub_item, std::vector<uint8_t> raw);
  // Resolves to nullopt when no payload was recorded for the variant
  std::future<std::optional<Payload>> load_payload(store::SubItemId sub_item, store::Variant variant);


  // ---- CONFIGURATION ----
  std::optional<Json::Value> get_config(const std::string& key) const;
  void put_config(const std::string& key, const Json::Value& value);
  bool exists_config(const std::string& key) const;


  // ---- GETTERS ----
  store::MetadataStore& get_store() { return *store_; }
  cache::BufferCache<Payload>& get_cache() { return *cache_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path folder_;
  Transcoder transcoder_;
  EngineSettings settings_;

  // System components; block storage is declared last so its destructor
  // drains pending I/O while the store and cache are still alive
  std::unique_ptr<crypto::Codec> codec_;
  std::unique_ptr<store::MetadataStore> store_;
  std::unique_ptr<cache::BufferCache<Payload>> cache_;
  std::unique_ptr<store::BlockStorage> blocks_;


  // ---- PAYLOAD PIPELINE ----
  // Encrypts bytes, writes them and records the blocks under variant
  void write_variant(store::SubItemId sub_item, store::Variant variant, const std::vector<uint8_t>& raw,
                     std::function<void(std::exception_ptr)> done);
};

} // namespace engine
} // namespace mediavault
