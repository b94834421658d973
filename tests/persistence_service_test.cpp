#include "framelift/storage/persistence_service.hpp"
#include "framelift/task/task_store.hpp"

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace framelift;
using namespace framelift::test;
using namespace std::chrono_literals;

namespace {

auto versioned(std::string id, std::uint64_t version, TaskStatus status)
    -> TaskRecord {
  TaskRecord r;
  r.local_id = LocalId{std::move(id)};
  r.version = version;
  r.status = status;
  return r;
}

}  // namespace

class PersistenceServiceTest : public ::testing::Test {
protected:
  FlakyRepository repo_;
};

TEST_F(PersistenceServiceTest, FlushWritesQueuedRecords) {
  PersistenceService service(repo_, 10ms);
  service.save(versioned("a", 1, TaskStatus::Pending));
  service.save(versioned("b", 2, TaskStatus::Uploading));

  EXPECT_EQ(service.pending_count(), 2);
  EXPECT_TRUE(service.flush());
  EXPECT_EQ(service.pending_count(), 0);
  EXPECT_TRUE(repo_.row(local_id("a")).has_value());
  EXPECT_TRUE(repo_.row(local_id("b")).has_value());
}

TEST_F(PersistenceServiceTest, SavesOfOneRecordCoalesce) {
  PersistenceService service(repo_, 10ms);
  service.save(versioned("a", 1, TaskStatus::Pending));
  service.save(versioned("a", 3, TaskStatus::Converting));
  service.save(versioned("a", 2, TaskStatus::Uploading));

  EXPECT_EQ(service.pending_count(), 1);
  ASSERT_TRUE(service.flush());
  EXPECT_EQ(repo_.attempts(), 1);
  EXPECT_EQ(repo_.row(local_id("a"))->status, TaskStatus::Converting);
}

TEST_F(PersistenceServiceTest, FailedWriteStaysQueued) {
  PersistenceService service(repo_, 10ms);
  repo_.fail_next(1);
  service.save(versioned("a", 1, TaskStatus::Pending));

  EXPECT_FALSE(service.flush());
  EXPECT_EQ(service.pending_count(), 1);
  EXPECT_FALSE(repo_.row(local_id("a")).has_value());

  EXPECT_TRUE(service.flush());
  EXPECT_TRUE(repo_.row(local_id("a")).has_value());
}

TEST_F(PersistenceServiceTest, NewerSaveSupersedesFailedWrite) {
  PersistenceService service(repo_, 10ms);
  repo_.fail_next(1);
  service.save(versioned("a", 1, TaskStatus::Pending));
  EXPECT_FALSE(service.flush());

  service.save(versioned("a", 2, TaskStatus::Uploading));
  EXPECT_TRUE(service.flush());
  EXPECT_EQ(repo_.row(local_id("a"))->status, TaskStatus::Uploading);
}

TEST_F(PersistenceServiceTest, RemoveDeletesRow) {
  PersistenceService service(repo_, 10ms);
  service.save(versioned("a", 1, TaskStatus::Pending));
  ASSERT_TRUE(service.flush());

  service.remove(local_id("a"), 1);
  ASSERT_TRUE(service.flush());
  EXPECT_FALSE(repo_.row(local_id("a")).has_value());
}

TEST_F(PersistenceServiceTest, StaleSaveAfterRemoveIsDropped) {
  PersistenceService service(repo_, 10ms);
  service.save(versioned("a", 2, TaskStatus::Converting));
  ASSERT_TRUE(service.flush());

  // A snapshot taken before removal arrives after the delete was queued.
  service.remove(local_id("a"), 3);
  service.save(versioned("a", 3, TaskStatus::Completed));
  service.save(versioned("a", 2, TaskStatus::Converting));
  ASSERT_TRUE(service.flush());
  EXPECT_FALSE(repo_.row(local_id("a")).has_value());

  service.save(versioned("a", 1, TaskStatus::Pending));
  EXPECT_EQ(service.pending_count(), 0);
  ASSERT_TRUE(service.flush());
  EXPECT_FALSE(repo_.row(local_id("a")).has_value());
}

TEST_F(PersistenceServiceTest, WorkerRetriesUntilWriteLands) {
  PersistenceService service(repo_, 5ms);
  service.start();
  repo_.fail_next(3);
  service.save(versioned("a", 1, TaskStatus::Pending));

  EXPECT_TRUE(wait_until([&] { return repo_.row(local_id("a")).has_value(); }));
  EXPECT_GE(repo_.attempts(), 4);
  service.stop();
  EXPECT_EQ(service.pending_count(), 0);
}

TEST_F(PersistenceServiceTest, StopDrainsPendingWrites) {
  PersistenceService service(repo_, 1h);
  service.start();
  repo_.fail_next(1);
  service.save(versioned("a", 1, TaskStatus::Pending));
  EXPECT_TRUE(wait_until([&] { return repo_.attempts() >= 1; }));

  service.stop();
  EXPECT_TRUE(repo_.row(local_id("a")).has_value());
}

TEST_F(PersistenceServiceTest, StoreMutationsReachRepository) {
  PersistenceService service(repo_, 10ms);
  TaskStore store(&service);

  FileInfo file;
  file.path = "/videos/a.mp4";
  file.display_name = "a.mp4";
  auto rec = store.create_task(file, {});
  ASSERT_TRUE(store.update_status(rec.local_id.value(), TaskStatus::Uploading));
  ASSERT_TRUE(service.flush());

  auto row = repo_.row(rec.local_id);
  ASSERT_TRUE(row.has_value());
  EXPECT_EQ(row->status, TaskStatus::Uploading);

  ASSERT_TRUE(store.remove(rec.local_id.value()));
  ASSERT_TRUE(service.flush());
  EXPECT_FALSE(repo_.row(rec.local_id).has_value());
}
