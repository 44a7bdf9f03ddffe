#include <gtest/gtest.h>

#include "../coordination/include/lock_store.hpp"
#include "test_utils.hpp"

#include <atomic>
#include <fstream>
#include <thread>

namespace {

class FileLockStoreTest : public ::testing::Test {
protected:
  fs::path path;

  void SetUp() override { path = unique_lock_path("store"); }

  void TearDown() override {
    std::error_code ec;
    fs::remove(path, ec);
  }

  void WriteRaw(const std::string& content) {
    std::ofstream out(path, std::ios::trunc);
    out << content;
  }
};

LockRecord sample_record() {
  LockRecord record;
  record.ownerPid        = 4242;
  record.protocolVersion = "1.2.3";
  record.servicePort     = 8989;
  record.writtenAtMs     = 1712345678901ULL;
  return record;
}

}  // namespace

TEST_F(FileLockStoreTest, ReadsBackWhatWasWritten) {
  FileLockStore store(path);
  store.Write(sample_record());

  auto record = store.Read();
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->ownerPid, 4242);
  EXPECT_EQ(record->protocolVersion, "1.2.3");
  EXPECT_EQ(record->servicePort, 8989);
  EXPECT_EQ(record->writtenAtMs, 1712345678901ULL);
}

TEST_F(FileLockStoreTest, MissingFileReadsAsAbsent) {
  FileLockStore store(path);
  EXPECT_FALSE(store.Read().has_value());
}

TEST_F(FileLockStoreTest, WriteReplacesPreviousRecord) {
  FileLockStore store(path);
  store.Write(sample_record());

  LockRecord newer = sample_record();
  newer.ownerPid        = 777;
  newer.protocolVersion = "2.0.0";
  store.Write(newer);

  auto record = store.Read();
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->ownerPid, 777);
  EXPECT_EQ(record->protocolVersion, "2.0.0");
}

TEST_F(FileLockStoreTest, WriteLeavesNoTemporaryFileBehind) {
  FileLockStore store(path);
  store.Write(sample_record());

  int entries = 0;
  for (const auto& entry : fs::directory_iterator(path.parent_path())) {
    if (entry.path().filename().string().rfind(path.filename().string(), 0) == 0) {
      ++entries;
    }
  }
  EXPECT_EQ(entries, 1);
}

TEST_F(FileLockStoreTest, RemoveIsIdempotent) {
  FileLockStore store(path);
  store.Write(sample_record());

  store.Remove();
  EXPECT_FALSE(fs::exists(path));
  EXPECT_NO_THROW(store.Remove());
  EXPECT_FALSE(store.Read().has_value());
}

TEST_F(FileLockStoreTest, CorruptFileReadsAsAbsent) {
  FileLockStore store(path);

  WriteRaw("{\"pid\": 12, \"vers");
  EXPECT_FALSE(store.Read().has_value());

  WriteRaw("");
  EXPECT_FALSE(store.Read().has_value());

  WriteRaw("not json at all");
  EXPECT_FALSE(store.Read().has_value());
}

TEST_F(FileLockStoreTest, CreatesMissingParentDirectory) {
  fs::path dir = unique_lock_path("dir");
  fs::path nested = dir / "nested" / "taskpilot.lock";

  FileLockStore store(nested);
  store.Write(sample_record());
  EXPECT_TRUE(store.Read().has_value());

  std::error_code ec;
  fs::remove_all(dir, ec);
}

TEST_F(FileLockStoreTest, WriteThroughRegularFileParentThrows) {
  WriteRaw("occupied");
  FileLockStore store(path / "taskpilot.lock");

  EXPECT_THROW(store.Write(sample_record()), std::runtime_error);
}

TEST_F(FileLockStoreTest, RemoveIfMatchesDeletesOnlyTheJudgedRecord) {
  FileLockStore store(path);
  LockRecord judged = sample_record();
  store.Write(judged);

  EXPECT_TRUE(store.RemoveIfMatches(judged));
  EXPECT_FALSE(fs::exists(path));
  EXPECT_FALSE(store.RemoveIfMatches(judged));
}

TEST_F(FileLockStoreTest, RemoveIfMatchesKeepsNewerOwner) {
  FileLockStore store(path);
  LockRecord judged = sample_record();
  LockRecord newer = sample_record();
  newer.ownerPid    = 9001;
  newer.writtenAtMs = judged.writtenAtMs + 1;
  store.Write(newer);

  EXPECT_FALSE(store.RemoveIfMatches(judged));
  auto record = store.Read();
  ASSERT_TRUE(record.has_value());
  EXPECT_TRUE(same_lock_record(*record, newer));

  // No claim file left next to the lock.
  int entries = 0;
  for (const auto& entry : fs::directory_iterator(path.parent_path())) {
    if (entry.path().filename().string().rfind(path.filename().string(), 0) == 0) {
      ++entries;
    }
  }
  EXPECT_EQ(entries, 1);
}

TEST_F(FileLockStoreTest, ConcurrentReaderNeverSeesPartialRecord) {
  // Record i has a version whose length depends on i, so a torn file cannot decode to it.
  auto record_for = [](int i) {
    LockRecord record;
    record.ownerPid        = 1000 + i;
    record.protocolVersion = "1." + std::string(static_cast<size_t>(i % 97) + 1, '7');
    record.servicePort     = static_cast<uint16_t>(1024 + i % 5000);
    record.writtenAtMs     = static_cast<uint64_t>(i);
    return record;
  };

  FileLockStore store(path);
  store.Write(record_for(0));

  constexpr int kWrites = 2000;
  std::atomic<bool> done{false};
  std::atomic<int>  reads{0};
  std::atomic<int>  missing{0};
  std::atomic<int>  foreign{0};

  std::thread reader([&]() {
    FileLockStore readerStore(path);
    while (!done) {
      auto record = readerStore.Read();
      ++reads;
      if (!record) {
        ++missing;
        continue;
      }
      int i = static_cast<int>(record->ownerPid - 1000);
      if (i < 0 || i >= kWrites || !same_lock_record(*record, record_for(i))) {
        ++foreign;
      }
    }
  });

  while (reads.load() == 0) {
    std::this_thread::yield();
  }
  for (int i = 1; i < kWrites; ++i) {
    store.Write(record_for(i));
  }
  done = true;
  reader.join();

  EXPECT_GT(reads.load(), 0);
  EXPECT_EQ(missing.load(), 0);
  EXPECT_EQ(foreign.load(), 0);

  auto last = store.Read();
  ASSERT_TRUE(last.has_value());
  EXPECT_TRUE(same_lock_record(*last, record_for(kWrites - 1)));
}

TEST(LockRecordCodec, AcceptsHandWrittenRecord) {
  auto record = decode_lock_record("  {\"pid\":99,\"version\":\"0.9.1\",\"port\":9000,\"timestamp\":5}\n");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->ownerPid, 99);
  EXPECT_EQ(record->protocolVersion, "0.9.1");
  EXPECT_EQ(record->servicePort, 9000);
  EXPECT_EQ(record->writtenAtMs, 5u);
}

TEST(LockRecordCodec, RejectsImpossibleValues) {
  EXPECT_FALSE(decode_lock_record("{\"pid\":0,\"version\":\"1\",\"port\":9000,\"timestamp\":5}"));
  EXPECT_FALSE(decode_lock_record("{\"pid\":-3,\"version\":\"1\",\"port\":9000,\"timestamp\":5}"));
  EXPECT_FALSE(decode_lock_record("{\"pid\":3,\"version\":\"\",\"port\":9000,\"timestamp\":5}"));
  EXPECT_FALSE(decode_lock_record("{\"pid\":3,\"version\":\"1\",\"port\":70000,\"timestamp\":5}"));
  EXPECT_FALSE(decode_lock_record("{\"pid\":3,\"version\":\"1\",\"port\":0,\"timestamp\":5}"));
}

TEST(LockRecordCodec, DefaultPathIsPerPort) {
  fs::path a = default_lock_path(8989);
  fs::path b = default_lock_path(9090);

  EXPECT_EQ(a.filename().string(), "taskpilot-8989.lock");
  EXPECT_NE(a, b);
  EXPECT_EQ(a.parent_path(), fs::temp_directory_path());
}
