#pragma once

#include <cstdint>
#include <exception>
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/asio/thread_pool.hpp>
#include "store/types.hpp"

namespace mediavault {
namespace store {

class BlockIOError : public std::runtime_error {
public:
  explicit BlockIOError(const std::string& message, const std::filesystem::path& path = {})
    : std::runtime_error(path.empty() ? message : message + ": " + path.string())
    , path_(path) {}

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

// Fixed-size block allocator over bounded segment files.
// Every chunk of a read or write runs as its own task on the I/O pool and
// opens its own file handle; the operation completes once all chunks are done.
class BlockStorage {
public:
  static constexpr std::size_t BLOCK_SIZE = 64 * 1024;       // 64KB
  static constexpr std::size_t BLOCKS_PER_SEGMENT = 1024;    // 64MB per segment file
  static constexpr uint64_t SEGMENT_NAME_BASE = 0xa;         // keeps names clear of data.db

  using Allocator = std::function<BlockIndex()>;
  // Receives the blocks that were allocated even on failure so they can be released
  using WriteHandler = std::function<void(std::exception_ptr, std::vector<BlockIndex>)>;
  using ReadHandler = std::function<void(std::exception_ptr, std::vector<uint8_t>)>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit BlockStorage(const std::filesystem::path& folder, std::size_t io_threads = 4);
  // Waits for in-flight chunk tasks
  ~BlockStorage();

  BlockStorage(const BlockStorage&) = delete;
  BlockStorage& operator=(const BlockStorage&) = delete;


  // ---- ASYNCHRONOUS OPERATIONS ----
  // Splits data into chunks, takes one block per chunk from allocate and writes
  // every chunk at its block offset. handler runs once, on an I/O thread.
  void async_write(std::shared_ptr<const std::vector<uint8_t>> data, const Allocator& allocate,
                   WriteHandler handler);
  // Reads length bytes spread over blocks, in block order
  void async_read(std::vector<BlockIndex> blocks, uint64_t length, ReadHandler handler);


  // ---- FUTURE-BASED OPERATIONS ----
  std::future<std::vector<BlockIndex>> write(std::vector<uint8_t> data, const Allocator& allocate);
  std::future<std::vector<uint8_t>> read(std::vector<BlockIndex> blocks, uint64_t length);


  // ---- LAYOUT ----
  // Number of blocks needed for length bytes (at least one)
  static std::size_t chunk_count(uint64_t length);
  std::filesystem::path segment_path(uint64_t segment) const;

private:
  // Slice of a payload bound to one block
  struct Chunk {
    std::size_t position;  // chunk order within the payload
    BlockIndex block;
    std::size_t length;
  };

  // ---- PARAMETERS ----
  std::filesystem::path folder_;
  boost::asio::thread_pool pool_;


  // ---- CHUNK PROCESSING ----
  // Groups chunks by the segment file their block lives in
  std::map<uint64_t, std::vector<Chunk>> group_by_segment(const std::vector<BlockIndex>& blocks,
                                                          uint64_t length) const;
  void write_chunk(const std::filesystem::path& file_path, const uint8_t* data, const Chunk& chunk) const;
  void read_chunk(const std::filesystem::path& file_path, uint8_t* out, const Chunk& chunk) const;
};

} // namespace store
} // namespace mediavault
