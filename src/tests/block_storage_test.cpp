#include <gtest/gtest.h>
#include <algorithm>
#include <deque>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>
#include "store/block_storage.hpp"
#include "test_utils.hpp"

using namespace mediavault::store;

class BlockStorageTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<BlockStorage> storage;
  BlockIndex next_block = 0;

  void SetUp() override {
    init_logging();
    test_dir = make_test_dir("block_storage_test");
    std::filesystem::create_directories(test_dir);
    storage = std::make_unique<BlockStorage>(test_dir, 4);
    next_block = 0;
  }

  void TearDown() override {
    storage.reset();
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  BlockStorage::Allocator counter() {
    return [this]() { return next_block++; };
  }

  // Helper: write then read back with the recorded length
  void write_and_verify(std::size_t length) {
    auto data = make_pattern(length);
    auto blocks = storage->write(data, counter()).get();
    ASSERT_EQ(blocks.size(), BlockStorage::chunk_count(length)) << "length " << length;
    auto read_back = storage->read(blocks, length).get();
    ASSERT_EQ(read_back.size(), length);
    EXPECT_EQ(read_back, data) << "Data mismatch for length " << length;
  }
};

TEST_F(BlockStorageTest, ChunkCount) {
  constexpr std::size_t B = BlockStorage::BLOCK_SIZE;
  EXPECT_EQ(BlockStorage::chunk_count(0), 1u);
  EXPECT_EQ(BlockStorage::chunk_count(1), 1u);
  EXPECT_EQ(BlockStorage::chunk_count(B), 1u);
  EXPECT_EQ(BlockStorage::chunk_count(B + 1), 2u);
  EXPECT_EQ(BlockStorage::chunk_count(2 * B), 2u);
  EXPECT_EQ(BlockStorage::chunk_count(100000), 2u);
}

TEST_F(BlockStorageTest, SegmentNaming) {
  EXPECT_EQ(storage->segment_path(0).filename().string(), "block-a.dat");
  EXPECT_EQ(storage->segment_path(5).filename().string(), "block-f.dat");
  EXPECT_EQ(storage->segment_path(6).filename().string(), "block-10.dat");
}

TEST_F(BlockStorageTest, BoundaryLengths) {
  constexpr std::size_t B = BlockStorage::BLOCK_SIZE;
  for (std::size_t length : {std::size_t{0}, std::size_t{1}, B, B + 1, 2 * B}) {
    write_and_verify(length);
  }
}

TEST_F(BlockStorageTest, HundredThousandBytes) {
  auto data = make_pattern(100000);
  auto blocks = storage->write(data, counter()).get();
  ASSERT_EQ(blocks.size(), 2u);
  EXPECT_EQ(blocks[0], 0u);
  EXPECT_EQ(blocks[1], 1u);

  // First block full, second carries the remaining 34464 bytes
  EXPECT_EQ(std::filesystem::file_size(storage->segment_path(0)), 65536u + 34464u);

  auto read_back = storage->read(blocks, 100000).get();
  EXPECT_EQ(read_back, data);
}

TEST_F(BlockStorageTest, BlocksAtAllocatedOffsets) {
  // Reversed allocation order: chunk 0 lands in block 3, chunk 1 in block 2
  std::deque<BlockIndex> pool = {3, 2};
  auto data = make_pattern(BlockStorage::BLOCK_SIZE + 10);
  auto blocks = storage->write(data, [&pool]() {
    auto block = pool.front();
    pool.pop_front();
    return block;
  }).get();
  ASSERT_EQ(blocks, (std::vector<BlockIndex>{3, 2}));

  std::ifstream file(storage->segment_path(0), std::ios::binary);
  ASSERT_TRUE(file);
  file.seekg(3 * BlockStorage::BLOCK_SIZE);
  char first = 0;
  file.read(&first, 1);
  EXPECT_EQ(static_cast<uint8_t>(first), data[0]);

  EXPECT_EQ(storage->read(blocks, data.size()).get(), data);
}

TEST_F(BlockStorageTest, SpansSegmentFiles) {
  // Start just below the segment boundary so chunks land in two files
  next_block = BlockStorage::BLOCKS_PER_SEGMENT - 1;
  auto data = make_pattern(3 * BlockStorage::BLOCK_SIZE);
  auto blocks = storage->write(data, counter()).get();
  ASSERT_EQ(blocks.size(), 3u);

  EXPECT_TRUE(std::filesystem::exists(storage->segment_path(0)));
  EXPECT_TRUE(std::filesystem::exists(storage->segment_path(1)));
  EXPECT_EQ(std::filesystem::file_size(storage->segment_path(1)), 2 * BlockStorage::BLOCK_SIZE);

  EXPECT_EQ(storage->read(blocks, data.size()).get(), data);
}

TEST_F(BlockStorageTest, OverwriteKeepsNeighbours) {
  auto first = make_pattern(2 * BlockStorage::BLOCK_SIZE, 1);
  auto first_blocks = storage->write(first, counter()).get();

  // Reuse block 0 for a different payload
  auto second = make_pattern(500, 9);
  auto second_blocks = storage->write(second, []() { return BlockIndex{0}; }).get();
  ASSERT_EQ(second_blocks, (std::vector<BlockIndex>{0}));

  EXPECT_EQ(storage->read(second_blocks, second.size()).get(), second);

  // Block 1 is untouched and the segment never shrinks
  auto tail = storage->read({1}, BlockStorage::BLOCK_SIZE).get();
  EXPECT_TRUE(std::equal(tail.begin(), tail.end(), first.begin() + BlockStorage::BLOCK_SIZE));
  EXPECT_EQ(std::filesystem::file_size(storage->segment_path(0)), 2 * BlockStorage::BLOCK_SIZE);
}

TEST_F(BlockStorageTest, ReadMissingSegmentFails) {
  auto future = storage->read({BlockStorage::BLOCKS_PER_SEGMENT * 7}, 10);
  EXPECT_THROW(future.get(), BlockIOError);
}

TEST_F(BlockStorageTest, ShortReadFails) {
  auto blocks = storage->write(make_pattern(100), counter()).get();
  // Claim more bytes than were written to the only block
  EXPECT_THROW(storage->read(blocks, 200).get(), BlockIOError);
}

TEST_F(BlockStorageTest, BlockCountMismatchFails) {
  auto blocks = storage->write(make_pattern(100), counter()).get();
  EXPECT_THROW(storage->read(blocks, 2 * BlockStorage::BLOCK_SIZE).get(), BlockIOError);
}

TEST_F(BlockStorageTest, UnwritableFolderFailsWholeWrite) {
  auto missing = test_dir / "missing" / "nested";
  BlockStorage broken(missing, 2);
  BlockIndex next = 0;
  auto future = broken.write(make_pattern(3 * BlockStorage::BLOCK_SIZE), [&next]() { return next++; });
  EXPECT_THROW(future.get(), BlockIOError);
}

TEST_F(BlockStorageTest, AllocationFailureReportsAllocatedBlocks) {
  int calls = 0;
  std::vector<BlockIndex> reported;
  std::exception_ptr reported_error;
  auto data = std::make_shared<const std::vector<uint8_t>>(make_pattern(3 * BlockStorage::BLOCK_SIZE));

  storage->async_write(data, [&calls]() -> BlockIndex {
    if (++calls == 3) throw std::runtime_error("out of blocks");
    return static_cast<BlockIndex>(calls);
  }, [&](std::exception_ptr error, std::vector<BlockIndex> blocks) {
    reported_error = error;
    reported = std::move(blocks);
  });

  // Allocation failures are reported before any I/O is issued
  ASSERT_TRUE(reported_error);
  EXPECT_EQ(reported, (std::vector<BlockIndex>{1, 2}));
}

TEST_F(BlockStorageTest, ConcurrentWrites) {
  constexpr std::size_t num_payloads = 8;
  std::vector<std::vector<uint8_t>> payloads;
  std::vector<std::future<std::vector<BlockIndex>>> futures;
  std::mutex allocator_mutex;

  for (std::size_t i = 0; i < num_payloads; ++i) {
    payloads.push_back(make_pattern(BlockStorage::BLOCK_SIZE * 2 + i * 1000, static_cast<uint8_t>(i)));
  }
  for (std::size_t i = 0; i < num_payloads; ++i) {
    futures.push_back(storage->write(payloads[i], [this, &allocator_mutex]() {
      std::lock_guard<std::mutex> lock(allocator_mutex);
      return next_block++;
    }));
  }

  for (std::size_t i = 0; i < num_payloads; ++i) {
    auto blocks = futures[i].get();
    EXPECT_EQ(storage->read(blocks, payloads[i].size()).get(), payloads[i]) << "payload " << i;
  }
}
