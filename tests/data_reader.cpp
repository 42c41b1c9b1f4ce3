#include <catch2/catch.hpp>

#include "StoreWriter.hpp"
#include <filedb/DataReader.hpp>
#include <filedb/IndexCache.hpp>
#include <filesystem>
#include <string>

using namespace filedb;
using namespace filedb_test;

static std::string payload_of(const Entry& e) {
  return std::string(e.payload.begin(), e.payload.end());
}

TEST_CASE("opening a missing store fails with OpenError") {
  auto dir = make_tmp_dir("filedb_open_");
  REQUIRE_THROWS_AS(DataReader(dir + "/nothing"), OpenError);
}

TEST_CASE("missing blob file fails with OpenError and releases the index handle") {
  auto dir = make_tmp_dir("filedb_noblob_");
  auto path = dir + "/store";
  write_raw_store(path, {0}, "");
  std::filesystem::remove(path + std::string{kDataFileSuffix});

  const size_t before = count_open_fds();
  REQUIRE_THROWS_AS(DataReader(path), OpenError);
  REQUIRE(count_open_fds() == before);
}

TEST_CASE("empty store has no entries") {
  auto dir = make_tmp_dir("filedb_empty_");
  auto path = dir + "/store";
  { StoreWriter w(path); }

  DataReader reader(path);
  REQUIRE(reader.isOpen());
  REQUIRE(reader.numEntries() == 0);
  REQUIRE(reader.length() == 0);
  REQUIRE_THROWS_AS(reader.read(0), OutOfBounds);
  REQUIRE_THROWS_AS(reader.readTimestamp(0), OutOfBounds);
}

TEST_CASE("read and readTimestamp agree on every entry") {
  auto dir = make_tmp_dir("filedb_read_");
  auto path = dir + "/store";
  {
    StoreWriter w(path);
    w.append(100, "alpha");
    w.append(150, "");
    w.append(150, "gamma-gamma");
    w.append(-7, "d");  // the reader does not check ordering
  }

  DataReader reader(path);
  REQUIRE(reader.length() == 4);

  const std::vector<std::pair<int64_t, std::string>> expected = {
    {100, "alpha"}, {150, ""}, {150, "gamma-gamma"}, {-7, "d"}
  };
  for (uint64_t i = 0; i < expected.size(); ++i) {
    Entry e = reader.read(i);
    REQUIRE(e.timestamp == expected[i].first);
    REQUIRE(payload_of(e) == expected[i].second);
    REQUIRE(reader.readTimestamp(i) == e.timestamp);
  }

  REQUIRE_THROWS_AS(reader.read(4), OutOfBounds);
  REQUIRE_THROWS_AS(reader.readTimestamp(4), OutOfBounds);
  REQUIRE_THROWS_AS(reader.read(UINT64_MAX), OutOfBounds);
}

TEST_CASE("equal consecutive locations give an empty payload, not an error") {
  auto dir = make_tmp_dir("filedb_emptypayload_");
  auto path = dir + "/store";
  write_raw_store(path, {0, 5, 3, 6, 3}, "abc");

  DataReader reader(path);
  Entry second = reader.read(1);
  REQUIRE(second.timestamp == 6);
  REQUIRE(second.payload.empty());
}

TEST_CASE("decreasing locations are reported as corruption") {
  auto dir = make_tmp_dir("filedb_corrupt_");
  auto path = dir + "/store";
  // entry 1 spans [5, 2)
  write_raw_store(path, {0, 1, 5, 2, 2, 3, 6}, "abcdef");

  DataReader reader(path);
  REQUIRE(reader.length() == 3);
  REQUIRE(reader.read(0).timestamp == 1);
  REQUIRE_THROWS_AS(reader.read(1), Corrupted);
  // timestamps stay readable
  REQUIRE(reader.readTimestamp(1) == 2);
}

TEST_CASE("an entry pointing past the blob file is reported as corruption") {
  auto dir = make_tmp_dir("filedb_shortblob_");
  auto path = dir + "/store";
  write_raw_store(path, {0, 1, 4, 2, 100}, "abcd");

  DataReader reader(path);
  REQUIRE(payload_of(reader.read(0)) == "abcd");
  REQUIRE_THROWS_AS(reader.read(1), Corrupted);
}

TEST_CASE("a huge span is reported as corruption before anything is allocated") {
  auto dir = make_tmp_dir("filedb_hugespan_");
  auto path = dir + "/store";
  write_raw_store(path, {0, 1, uint64_t{1} << 62, 2, UINT64_MAX}, "abcd");

  DataReader reader(path);
  REQUIRE_THROWS_AS(reader.read(0), Corrupted);
  // both locations above INT64_MAX
  REQUIRE_THROWS_AS(reader.read(1), Corrupted);
}

TEST_CASE("corruption messages name the store") {
  auto dir = make_tmp_dir("filedb_corruptmsg_");
  auto path = dir + "/store";
  write_raw_store(path, {0, 1, 5, 2, 2, 3, 100}, "abcdef");

  DataReader reader(path);
  REQUIRE_THROWS_WITH(reader.read(1), Catch::Contains(path));
  REQUIRE_THROWS_WITH(reader.read(2), Catch::Contains(path));
  REQUIRE_THROWS_WITH(reader.readBatch(0, 2), Catch::Contains(path));
}

TEST_CASE("a bound miss refreshes the entry count once") {
  auto dir = make_tmp_dir("filedb_grow_");
  auto path = dir + "/store";
  StoreWriter w(path);
  w.append(1, "one");

  DataReader reader(path);
  REQUIRE(reader.numEntries() == 1);

  w.append(2, "two");
  // snapshot is stale until something refreshes it
  REQUIRE(reader.numEntries() == 1);

  Entry e = reader.read(1);
  REQUIRE(e.timestamp == 2);
  REQUIRE(payload_of(e) == "two");
  REQUIRE(reader.numEntries() == 2);
}

TEST_CASE("without refresh_on_miss staleness is visible until length() is called") {
  auto dir = make_tmp_dir("filedb_stale_");
  auto path = dir + "/store";
  StoreWriter w(path);
  w.append(1, "one");

  ReaderConfig config;
  config.refresh_on_miss = false;
  DataReader reader(path, config);

  w.append(2, "two");
  w.append(3, "three");

  REQUIRE_THROWS_AS(reader.read(1), OutOfBounds);
  REQUIRE_THROWS_AS(reader.readTimestamp(2), OutOfBounds);
  REQUIRE_THROWS_AS(reader.readBatch(0, 3), OutOfBounds);

  REQUIRE(reader.length() == 3);
  REQUIRE(payload_of(reader.read(2)) == "three");
  REQUIRE(reader.readBatch(0, 3).size() == 3);
}

TEST_CASE("refreshEntryCount keeps the last count when stat fails") {
  auto dir = make_tmp_dir("filedb_refresh_");
  auto path = dir + "/store";
  {
    StoreWriter w(path);
    w.append(1, "a");
    w.append(2, "b");
  }

  DataReader reader(path);
  LengthRefresh ok = reader.refreshEntryCount();
  REQUIRE(ok.refreshed);
  REQUIRE(ok.count == 2);

  reader.close();
  REQUIRE_FALSE(reader.isOpen());

  LengthRefresh kept = reader.refreshEntryCount();
  REQUIRE_FALSE(kept.refreshed);
  REQUIRE(kept.count == 2);
  REQUIRE(reader.length() == 2);

  REQUIRE_THROWS_AS(reader.readTimestamp(0), ReadError);
  REQUIRE_THROWS_AS(reader.readBatch(0, 2), ReadError);
}

TEST_CASE("reads after close fail even when the index cache holds the entry") {
  auto dir = make_tmp_dir("filedb_closedcache_");
  auto path = dir + "/store";
  {
    StoreWriter w(path);
    w.append(1, "");
  }

  DataReader reader(path);
  REQUIRE(reader.read(0).payload.empty());
  REQUIRE(reader.indexCache().getStats().current_size == 1);

  reader.close();
  REQUIRE_THROWS_AS(reader.read(0), ReadError);
}

TEST_CASE("a moved reader owns the handles") {
  auto dir = make_tmp_dir("filedb_move_");
  auto path = dir + "/store";
  {
    StoreWriter w(path);
    w.append(5, "five");
  }

  const size_t before = count_open_fds();
  {
    DataReader first(path);
    DataReader second(std::move(first));
    REQUIRE_FALSE(first.isOpen());
    REQUIRE(second.isOpen());
    REQUIRE(payload_of(second.read(0)) == "five");

    DataReader third(path);
    third = std::move(second);
    REQUIRE(third.read(0).timestamp == 5);
  }
  REQUIRE(count_open_fds() == before);
}

TEST_CASE("repeated reads are served from the index cache") {
  auto dir = make_tmp_dir("filedb_cache_");
  auto path = dir + "/store";
  {
    StoreWriter w(path);
    for (int i = 0; i < 8; ++i) w.append(i, std::string(static_cast<size_t>(i), 'x'));
  }

  DataReader reader(path);
  reader.read(3);
  reader.read(3);
  auto stats = reader.indexCache().getStats();
  REQUIRE(stats.cache_hits == 1);
  REQUIRE(stats.cache_misses == 1);

  reader.prefetch(4, 100);  // clamped to the 4 remaining entries
  for (uint64_t i = 4; i < 8; ++i) {
    REQUIRE(reader.read(i).payload.size() == i);
  }
  stats = reader.indexCache().getStats();
  REQUIRE(stats.cache_hits == 5);
  REQUIRE(stats.current_size == 5);

  // out of range prefetch is a no-op
  reader.prefetch(8, 4);
  reader.prefetch(0, 0);
}

TEST_CASE("disabling the index cache still reads correctly") {
  auto dir = make_tmp_dir("filedb_nocache_");
  auto path = dir + "/store";
  {
    StoreWriter w(path);
    w.append(1, "x");
  }

  ReaderConfig config;
  config.index_cache_entries = 0;
  config.access_pattern = ReaderConfig::AccessPattern::SEQUENTIAL;
  DataReader reader(path, config);
  REQUIRE(payload_of(reader.read(0)) == "x");
  REQUIRE(payload_of(reader.read(0)) == "x");
  REQUIRE(reader.indexCache().getStats().current_size == 0);
}
