#include "store/block_storage.hpp"
#include <atomic>
#include <fstream>
#include <mutex>
#include <sstream>
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>

namespace mediavault {
namespace store {

namespace {

// Shared completion state of one logical read or write. The last chunk task
// to finish invokes the handler with the first recorded error, if any.
template <typename Result, typename Handler>
struct PendingJoin {
  PendingJoin(std::size_t count, Result initial, Handler done)
    : pending(count), result(std::move(initial)), handler(std::move(done)) {}

  void fail(std::exception_ptr e) {
    std::lock_guard<std::mutex> lock(mutex);
    if (!error) error = e;
  }

  void complete() {
    if (pending.fetch_sub(1) == 1) {
      handler(error, std::move(result));
    }
  }

  std::atomic<std::size_t> pending;
  std::mutex mutex;
  std::exception_ptr error;
  Result result;
  Handler handler;
};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BlockStorage::BlockStorage(const std::filesystem::path& folder, std::size_t io_threads)
  : folder_(folder)
  , pool_(io_threads == 0 ? 1 : io_threads) {
  BOOST_LOG_TRIVIAL(info) << "Block storage: Initializing with folder: " << folder_.string()
                          << " and " << (io_threads == 0 ? 1 : io_threads) << " I/O threads";
}

BlockStorage::~BlockStorage() {
  BOOST_LOG_TRIVIAL(debug) << "Block storage: Waiting for pending chunk operations";
  pool_.join();
}


//==============================================
// LAYOUT
//==============================================

std::size_t BlockStorage::chunk_count(uint64_t length) {
  if (length == 0) {
    return 1;
  }
  return static_cast<std::size_t>((length + BLOCK_SIZE - 1) / BLOCK_SIZE);
}

std::filesystem::path BlockStorage::segment_path(uint64_t segment) const {
  std::stringstream ss;
  ss << "block-" << std::hex << (segment + SEGMENT_NAME_BASE) << ".dat";
  return folder_ / ss.str();
}

std::map<uint64_t, std::vector<BlockStorage::Chunk>> BlockStorage::group_by_segment(
    const std::vector<BlockIndex>& blocks, uint64_t length) const {
  std::map<uint64_t, std::vector<Chunk>> groups;
  const std::size_t count = blocks.size();

  for (std::size_t i = 0; i < count; ++i) {
    // Every chunk is a full block except the last, which carries the remainder
    std::size_t chunk_length = BLOCK_SIZE;
    if (i == count - 1) {
      chunk_length = static_cast<std::size_t>(length - static_cast<uint64_t>(i) * BLOCK_SIZE);
    }
    groups[blocks[i] / BLOCKS_PER_SEGMENT].push_back(Chunk{i, blocks[i], chunk_length});
  }
  return groups;
}


//==============================================
// CHUNK PROCESSING
//==============================================

void BlockStorage::write_chunk(const std::filesystem::path& file_path, const uint8_t* data,
                               const Chunk& chunk) const {
  std::fstream file(file_path, std::ios::in | std::ios::out | std::ios::binary);
  if (!file) {
    // Create without truncating; another task may have created it meanwhile
    std::ofstream create(file_path, std::ios::binary | std::ios::app);
    create.close();
    file.open(file_path, std::ios::in | std::ios::out | std::ios::binary);
  }
  if (!file) {
    throw BlockIOError("Block storage: Failed to open segment file", file_path);
  }

  if (chunk.length > 0) {
    const auto offset = static_cast<std::streamoff>((chunk.block % BLOCKS_PER_SEGMENT) * BLOCK_SIZE);
    file.seekp(offset);
    file.write(reinterpret_cast<const char*>(data + chunk.position * BLOCK_SIZE),
               static_cast<std::streamsize>(chunk.length));
    file.flush();
  }

  if (!file) {
    throw BlockIOError("Block storage: Failed to write block " + std::to_string(chunk.block), file_path);
  }
  BOOST_LOG_TRIVIAL(trace) << "Block storage: Wrote " << chunk.length << " bytes to block " << chunk.block;
}

void BlockStorage::read_chunk(const std::filesystem::path& file_path, uint8_t* out,
                              const Chunk& chunk) const {
  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    throw BlockIOError("Block storage: Failed to open segment file", file_path);
  }

  if (chunk.length > 0) {
    const auto offset = static_cast<std::streamoff>((chunk.block % BLOCKS_PER_SEGMENT) * BLOCK_SIZE);
    file.seekg(offset);
    file.read(reinterpret_cast<char*>(out + chunk.position * BLOCK_SIZE),
              static_cast<std::streamsize>(chunk.length));
    if (static_cast<std::size_t>(file.gcount()) != chunk.length) {
      throw BlockIOError("Block storage: Short read of block " + std::to_string(chunk.block), file_path);
    }
  }
  BOOST_LOG_TRIVIAL(trace) << "Block storage: Read " << chunk.length << " bytes from block " << chunk.block;
}


//==============================================
// ASYNCHRONOUS OPERATIONS
//==============================================

void BlockStorage::async_write(std::shared_ptr<const std::vector<uint8_t>> data, const Allocator& allocate,
                               WriteHandler handler) {
  const std::size_t count = chunk_count(data->size());
  std::vector<BlockIndex> blocks;
  blocks.reserve(count);

  try {
    for (std::size_t i = 0; i < count; ++i) {
      blocks.push_back(allocate());
    }
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Block storage: Block allocation failed: " << e.what();
    handler(std::current_exception(), std::move(blocks));
    return;
  }

  BOOST_LOG_TRIVIAL(debug) << "Block storage: Writing " << data->size() << " bytes into " << count << " blocks";

  auto groups = group_by_segment(blocks, data->size());
  auto join = std::make_shared<PendingJoin<std::vector<BlockIndex>, WriteHandler>>(
      count, blocks, std::move(handler));

  for (const auto& [segment, chunks] : groups) {
    const auto file_path = segment_path(segment);
    for (const auto& chunk : chunks) {
      boost::asio::post(pool_, [this, join, data, file_path, chunk]() {
        try {
          write_chunk(file_path, data->data(), chunk);
        } catch (const std::exception& e) {
          BOOST_LOG_TRIVIAL(error) << "Block storage: " << e.what();
          join->fail(std::current_exception());
        }
        join->complete();
      });
    }
  }
}

void BlockStorage::async_read(std::vector<BlockIndex> blocks, uint64_t length, ReadHandler handler) {
  if (blocks.size() != chunk_count(length)) {
    BOOST_LOG_TRIVIAL(error) << "Block storage: Block list of " << blocks.size()
                             << " entries does not match length " << length;
    handler(std::make_exception_ptr(BlockIOError("Block storage: Block list does not match payload length")),
            {});
    return;
  }

  BOOST_LOG_TRIVIAL(debug) << "Block storage: Reading " << length << " bytes from " << blocks.size() << " blocks";

  auto groups = group_by_segment(blocks, length);
  auto join = std::make_shared<PendingJoin<std::vector<uint8_t>, ReadHandler>>(
      blocks.size(), std::vector<uint8_t>(static_cast<std::size_t>(length)), std::move(handler));

  for (const auto& [segment, chunks] : groups) {
    const auto file_path = segment_path(segment);
    for (const auto& chunk : chunks) {
      boost::asio::post(pool_, [this, join, file_path, chunk]() {
        try {
          // Chunks fill disjoint ranges of the shared buffer
          read_chunk(file_path, join->result.data(), chunk);
        } catch (const std::exception& e) {
          BOOST_LOG_TRIVIAL(error) << "Block storage: " << e.what();
          join->fail(std::current_exception());
        }
        join->complete();
      });
    }
  }
}


//==============================================
// FUTURE-BASED OPERATIONS
//==============================================

std::future<std::vector<BlockIndex>> BlockStorage::write(std::vector<uint8_t> data, const Allocator& allocate) {
  auto promise = std::make_shared<std::promise<std::vector<BlockIndex>>>();
  auto future = promise->get_future();
  auto shared = std::make_shared<const std::vector<uint8_t>>(std::move(data));

  async_write(shared, allocate, [promise](std::exception_ptr error, std::vector<BlockIndex> blocks) {
    if (error) {
      promise->set_exception(error);
    } else {
      promise->set_value(std::move(blocks));
    }
  });
  return future;
}

std::future<std::vector<uint8_t>> BlockStorage::read(std::vector<BlockIndex> blocks, uint64_t length) {
  auto promise = std::make_shared<std::promise<std::vector<uint8_t>>>();
  auto future = promise->get_future();

  async_read(std::move(blocks), length, [promise](std::exception_ptr error, std::vector<uint8_t> bytes) {
    if (error) {
      promise->set_exception(error);
    } else {
      promise->set_value(std::move(bytes));
    }
  });
  return future;
}

} // namespace store
} // namespace mediavault
