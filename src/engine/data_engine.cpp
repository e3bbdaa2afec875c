#include "engine/data_engine.hpp"
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include "logger/logger.hpp"

namespace mediavault {
namespace engine {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

DataEngine::DataEngine(const std::filesystem::path& folder, const std::string& passphrase,
                       Transcoder transcoder, const EngineSettings& settings)
  : folder_(folder)
  , transcoder_(std::move(transcoder))
  , settings_(settings) {

  if (!transcoder_) {
    throw std::invalid_argument("Data engine: A transcoder is required");
  }

  if (!settings_.log_file.empty()) {
    logging::init_logging(settings_.log_file, settings_.log_level);
  }

  BOOST_LOG_TRIVIAL(info) << "Data engine: Initializing engine for folder: " << folder_.string();

  try {
    codec_ = std::make_unique<crypto::Codec>(passphrase);
    store_ = std::make_unique<store::MetadataStore>(folder_, *codec_);
    cache_ = std::make_unique<cache::BufferCache<Payload>>(settings_.cache_capacity);
    blocks_ = std::make_unique<store::BlockStorage>(folder_, settings_.io_threads);
    BOOST_LOG_TRIVIAL(debug) << "Data engine: All components created";
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Data engine: Failed to initialize components: " << e.what();
    throw;
  }
}

DataEngine::~DataEngine() {
  // Drain chunk tasks before the store and cache go away
  blocks_.reset();
}


//==============================================
// LIFECYCLE
//==============================================

bool DataEngine::connect() {
  BOOST_LOG_TRIVIAL(info) << "Data engine: Connecting";
  if (!store_->load()) {
    BOOST_LOG_TRIVIAL(error) << "Data engine: Catalog could not be loaded, wrong key or corrupted document";
    return false;
  }
  return true;
}

void DataEngine::close() {
  BOOST_LOG_TRIVIAL(info) << "Data engine: Closing";
  store_->save();
}


//==============================================
// ENTRY OPERATIONS
//==============================================

std::vector<store::Entry> DataEngine::find_entries(const store::EntryQuery& query) const {
  return store_->find_entries(query);
}

std::vector<store::Entry> DataEngine::create_entries(std::vector<store::Entry> entries) {
  return store_->create_entries(std::move(entries));
}

std::vector<store::Entry> DataEngine::update_entries(std::vector<store::Entry> entries) {
  auto result = store_->update_entries(std::move(entries));
  for (auto sub_item : result.released) {
    cache_->remove(sub_item);
  }
  return result.updated;
}

std::size_t DataEngine::delete_entries(const std::vector<store::EntryId>& ids) {
  auto result = store_->delete_entries(ids);
  for (auto sub_item : result.released) {
    cache_->remove(sub_item);
  }
  return result.deleted;
}

std::size_t DataEngine::delete_entries(const std::vector<store::Entry>& entries) {
  std::vector<store::EntryId> ids;
  ids.reserve(entries.size());
  for (const auto& entry : entries) {
    ids.push_back(entry.id);
  }
  return delete_entries(ids);
}


//==============================================
// TAG OPERATIONS
//==============================================

std::vector<std::string> DataEngine::find_tags(const store::TagQuery& query) const {
  return store_->find_tags(query);
}


//==============================================
// PAYLOAD OPERATIONS
//==============================================

void DataEngine::write_variant(store::SubItemId sub_item, store::Variant variant,
                               const std::vector<uint8_t>& raw,
                               std::function<void(std::exception_ptr)> done) {
  auto encrypted = std::make_shared<const std::vector<uint8_t>>(codec_->encode_payload(raw));
  const uint64_t size = encrypted->size();

  BOOST_LOG_TRIVIAL(debug) << "Data engine: Writing " << store::to_string(variant) << " of image "
                           << sub_item << " (" << size << " bytes)";

  blocks_->async_write(encrypted, [this]() { return store_->allocate_block(); },
    [this, sub_item, variant, size, done](std::exception_ptr error, std::vector<store::BlockIndex> blocks) {
      if (error) {
        // Blocks of a failed write hold nothing useful
        store_->release_blocks(blocks);
        done(error);
        return;
      }
      try {
        if (!store_->record_blocks(sub_item, variant, store::BlockRecord{blocks, size})) {
          done(std::make_exception_ptr(
              store::StoreError("Data engine: Image " + std::to_string(sub_item) + " was removed during the write")));
          return;
        }
        cache_->remove(sub_item);
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Data engine: Recording blocks of image " << sub_item << " failed: " << e.what();
        done(std::current_exception());
        return;
      }
      done(nullptr);
    });
}

std::future<void> DataEngine::save_payload(store::SubItemId sub_item, std::vector<uint8_t> raw) {
  auto promise = std::make_shared<std::promise<void>>();
  auto future = promise->get_future();

  if (!store_->has_sub_item(sub_item)) {
    BOOST_LOG_TRIVIAL(error) << "Data engine: Cannot save payload of unknown image " << sub_item;
    promise->set_exception(std::make_exception_ptr(
        store::StoreError("Data engine: Unknown image " + std::to_string(sub_item))));
    return future;
  }

  auto origin = std::make_shared<const std::vector<uint8_t>>(std::move(raw));

  write_variant(sub_item, store::Variant::Origin, *origin,
    [this, sub_item, origin, promise](std::exception_ptr error) {
      if (error) {
        promise->set_exception(error);
        return;
      }

      // The origin record stays even if the exhibition step fails. This runs
      // on an I/O thread, so every failure has to end up in the promise.
      try {
        std::vector<uint8_t> exhibition = transcoder_(*origin);
        write_variant(sub_item, store::Variant::Exhibition, exhibition,
          [sub_item, promise](std::exception_ptr error) {
            if (error) {
              promise->set_exception(error);
              return;
            }
            BOOST_LOG_TRIVIAL(info) << "Data engine: Saved payload of image " << sub_item;
            promise->set_value();
          });
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Data engine: Exhibition of image " << sub_item << " failed: " << e.what();
        promise->set_exception(std::current_exception());
      } catch (...) {
        BOOST_LOG_TRIVIAL(error) << "Data engine: Exhibition of image " << sub_item << " failed with a non-standard exception";
        promise->set_exception(std::current_exception());
      }
    });

  return future;
}

std::future<std::optional<Payload>> DataEngine::load_payload(store::SubItemId sub_item, store::Variant variant) {
  auto promise = std::make_shared<std::promise<std::optional<Payload>>>();
  auto future = promise->get_future();

  if (auto cached = cache_->get(variant, sub_item)) {
    BOOST_LOG_TRIVIAL(trace) << "Data engine: Cache hit for " << store::to_string(variant) << " of image " << sub_item;
    promise->set_value(std::move(cached));
    return future;
  }

  auto record = store_->find_blocks(sub_item, variant);
  if (!record) {
    BOOST_LOG_TRIVIAL(debug) << "Data engine: No " << store::to_string(variant) << " recorded for image " << sub_item;
    promise->set_value(std::optional<Payload>{});
    return future;
  }

  blocks_->async_read(record->blocks, record->size,
    [this, sub_item, variant, promise, read_blocks = record->blocks](std::exception_ptr error,
                                                                     std::vector<uint8_t> bytes) {
      if (error) {
        promise->set_exception(error);
        return;
      }
      try {
        Payload payload = std::make_shared<const std::vector<uint8_t>>(codec_->decode_payload(bytes));
        cache_->put(variant, sub_item, payload);
        // A delete or re-save that raced this read must not leave stale bytes cached
        auto current = store_->find_blocks(sub_item, variant);
        if (!current || current->blocks != read_blocks) {
          cache_->remove(sub_item);
        }
        promise->set_value(std::optional<Payload>(payload));
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Data engine: Decoding image " << sub_item << " failed: " << e.what();
        promise->set_exception(std::current_exception());
      }
    });

  return future;
}


//==============================================
// CONFIGURATION
//==============================================

std::optional<Json::Value> DataEngine::get_config(const std::string& key) const {
  return store_->get_config(key);
}

void DataEngine::put_config(const std::string& key, const Json::Value& value) {
  store_->put_config(key, value);
}

bool DataEngine::exists_config(const std::string& key) const {
  return store_->exists_config(key);
}

} // namespace engine
} // namespace mediavault
