#include "framelift/task/task_store.hpp"

#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace framelift;
using namespace framelift::test;

namespace {

auto make_file(std::string name, std::uint64_t size = 1024) -> FileInfo {
  FileInfo info;
  info.path = std::filesystem::path("/videos") / name;
  info.display_name = std::move(name);
  info.size_bytes = size;
  info.duration_seconds = 60.0;
  info.estimated_size_bytes = size / 2;
  return info;
}

}  // namespace

class TaskStoreTest : public ::testing::Test {
protected:
  auto create(std::string name = "clip.mp4") -> TaskRecord {
    return store_.create_task(make_file(std::move(name)), ConversionSettings{});
  }

  auto to_converting(const TaskRecord& rec, const std::string& remote)
      -> void {
    ASSERT_TRUE(store_.update_status(rec.local_id.value(), TaskStatus::Uploading));
    ASSERT_TRUE(store_.link_remote_id(rec.local_id, server_id(remote)));
    ASSERT_TRUE(store_.update_status(remote, TaskStatus::Converting));
  }

  TaskStore store_;
};

TEST_F(TaskStoreTest, CreateTaskStartsPending) {
  auto rec = create();

  EXPECT_FALSE(rec.local_id.empty());
  EXPECT_EQ(rec.status, TaskStatus::Pending);
  EXPECT_EQ(rec.phase, TaskPhase::None);
  EXPECT_EQ(rec.progress, 0);
  EXPECT_EQ(rec.retry_count, 0);
  EXPECT_EQ(rec.max_retries, 3);
  EXPECT_FALSE(rec.is_linked());
  EXPECT_EQ(rec.current_id(), rec.local_id.value());
  EXPECT_EQ(store_.size(), 1);
}

TEST_F(TaskStoreTest, CreatedIdsAreUnique) {
  auto a = create("a.mp4");
  auto b = create("b.mp4");
  EXPECT_NE(a.local_id, b.local_id);
  EXPECT_EQ(store_.list().size(), 2);
}

TEST_F(TaskStoreTest, LinkRemoteIdResolvesBothIds) {
  auto rec = create();
  ASSERT_TRUE(store_.link_remote_id(rec.local_id, server_id("srv-1"), "clip"));

  auto by_local = store_.find(rec.local_id.value());
  auto by_remote = store_.find("srv-1");
  ASSERT_TRUE(by_local.has_value());
  ASSERT_TRUE(by_remote.has_value());
  EXPECT_EQ(by_remote->local_id, rec.local_id);
  EXPECT_EQ(by_local->current_id(), "srv-1");
  EXPECT_EQ(by_local->task_name, "clip");
  EXPECT_TRUE(store_.find_by_server_id(server_id("srv-1")).has_value());
}

TEST_F(TaskStoreTest, LinkRemoteIdIsOneTime) {
  auto rec = create();
  ASSERT_TRUE(store_.link_remote_id(rec.local_id, server_id("srv-1")));

  EXPECT_TRUE(store_.link_remote_id(rec.local_id, server_id("srv-1")));

  auto again = store_.link_remote_id(rec.local_id, server_id("srv-2"));
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error(), make_error_code(Error::AlreadyLinked));
  EXPECT_EQ(store_.get(rec.local_id)->server_id->str(), "srv-1");
  EXPECT_FALSE(store_.find("srv-2").has_value());
}

TEST_F(TaskStoreTest, LinkRemoteIdRejectsIdOwnedByAnotherTask) {
  auto a = create("a.mp4");
  auto b = create("b.mp4");
  ASSERT_TRUE(store_.link_remote_id(a.local_id, server_id("srv-1")));

  auto r = store_.link_remote_id(b.local_id, server_id("srv-1"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::AlreadyLinked));
}

TEST_F(TaskStoreTest, UnknownIdIsNotFound) {
  auto r = store_.update_status("missing", TaskStatus::Converting);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::NotFound));
  EXPECT_FALSE(store_.update_progress("missing", 10).has_value());
  EXPECT_FALSE(store_.remove("missing").has_value());
}

TEST_F(TaskStoreTest, RepeatedStatusIsNoOp) {
  auto rec = create();
  ASSERT_TRUE(*store_.update_status(rec.local_id.value(), TaskStatus::Uploading));

  auto before = store_.get(rec.local_id)->version;
  auto again = store_.update_status(rec.local_id.value(), TaskStatus::Uploading);
  ASSERT_TRUE(again.has_value());
  EXPECT_FALSE(*again);
  EXPECT_EQ(store_.get(rec.local_id)->version, before);
}

TEST_F(TaskStoreTest, ProgressIsMonotonicWithinAttempt) {
  auto rec = create();
  to_converting(rec, "srv-1");

  EXPECT_TRUE(*store_.update_progress("srv-1", 40, 1.5, 30));
  EXPECT_FALSE(*store_.update_progress("srv-1", 25));
  EXPECT_TRUE(*store_.update_progress("srv-1", 60));

  auto got = store_.get(rec.local_id);
  EXPECT_EQ(got->progress, 60);
}

TEST_F(TaskStoreTest, ProgressIsClamped) {
  auto rec = create();
  to_converting(rec, "srv-1");

  EXPECT_TRUE(*store_.update_progress("srv-1", 150));
  EXPECT_EQ(store_.get(rec.local_id)->progress, 100);
}

TEST_F(TaskStoreTest, ProgressWhileUploadingPromotesToConverting) {
  auto rec = create();
  ASSERT_TRUE(store_.update_status(rec.local_id.value(), TaskStatus::Uploading));
  ASSERT_TRUE(store_.link_remote_id(rec.local_id, server_id("srv-1")));

  EXPECT_TRUE(*store_.update_progress("srv-1", 5));
  auto got = store_.get(rec.local_id);
  EXPECT_EQ(got->status, TaskStatus::Converting);
  EXPECT_EQ(got->phase, TaskPhase::Converting);
  EXPECT_NE(got->upload_completed_at, TimePoint{});
}

TEST_F(TaskStoreTest, ProgressIgnoredForPendingAndTerminal) {
  auto rec = create();
  EXPECT_FALSE(*store_.update_progress(rec.local_id.value(), 10));

  ASSERT_TRUE(store_.update_status(rec.local_id.value(), TaskStatus::Cancelled));
  EXPECT_FALSE(*store_.update_progress(rec.local_id.value(), 20));
  EXPECT_EQ(store_.get(rec.local_id)->progress, 0);
}

TEST_F(TaskStoreTest, CompletedSetsFullProgress) {
  auto rec = create();
  to_converting(rec, "srv-1");
  ASSERT_TRUE(store_.update_status("srv-1", TaskStatus::Completed));

  auto got = store_.get(rec.local_id);
  EXPECT_EQ(got->progress, 100);
  EXPECT_NE(got->completed_at, TimePoint{});
}

TEST_F(TaskStoreTest, TerminalStatusRejectsOtherTransitions) {
  auto rec = create();
  ASSERT_TRUE(store_.update_status(rec.local_id.value(), TaskStatus::Cancelled));

  auto r = store_.update_status(rec.local_id.value(), TaskStatus::Converting);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidTransition));
  EXPECT_EQ(store_.get(rec.local_id)->status, TaskStatus::Cancelled);
}

TEST_F(TaskStoreTest, PendingTransitionStartsNewAttempt) {
  auto rec = create();
  to_converting(rec, "srv-1");
  ASSERT_TRUE(store_.update_progress("srv-1", 70));

  ASSERT_TRUE(*store_.update_status(rec.local_id.value(), TaskStatus::Pending));
  auto got = store_.get(rec.local_id);
  EXPECT_EQ(got->status, TaskStatus::Pending);
  EXPECT_EQ(got->progress, 0);
  EXPECT_EQ(got->attempt, rec.attempt + 1);
  EXPECT_FALSE(got->is_linked());
  EXPECT_FALSE(store_.find("srv-1").has_value());
}

TEST_F(TaskStoreTest, RecordFailureConsumesRetryBudget) {
  auto rec = create();
  to_converting(rec, "srv-1");

  auto first = store_.record_failure("srv-1", "connection reset");
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(*first, FailureDisposition::Retry);

  auto got = store_.get(rec.local_id);
  EXPECT_EQ(got->retry_count, 1);
  EXPECT_EQ(got->last_error, "connection reset");
  EXPECT_NE(got->last_retry_at, TimePoint{});
  EXPECT_EQ(got->status, TaskStatus::Converting);
}

TEST_F(TaskStoreTest, RecordFailureTerminalWhenBudgetExhausted) {
  TaskStore store(nullptr, 1);
  auto rec = store.create_task(make_file("a.mp4"), {});
  ASSERT_TRUE(store.update_status(rec.local_id.value(), TaskStatus::Uploading));

  EXPECT_EQ(*store.record_failure(rec.local_id.value(), "e1"),
            FailureDisposition::Retry);
  ASSERT_TRUE(store.reset_for_retry(rec.local_id.value()));
  ASSERT_TRUE(store.update_status(rec.local_id.value(), TaskStatus::Uploading));
  EXPECT_EQ(*store.record_failure(rec.local_id.value(), "e2"),
            FailureDisposition::Terminal);

  auto got = store.get(rec.local_id);
  EXPECT_EQ(got->status, TaskStatus::Failed);
  EXPECT_EQ(got->retry_count, 1);
  EXPECT_EQ(got->last_error, "e2");
  EXPECT_LE(got->retry_count, got->max_retries);
}

TEST_F(TaskStoreTest, RecordFailureRejectedForCancelled) {
  auto rec = create();
  ASSERT_TRUE(store_.update_status(rec.local_id.value(), TaskStatus::Cancelled));

  auto r = store_.record_failure(rec.local_id.value(), "late error");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidTransition));
  EXPECT_EQ(store_.get(rec.local_id)->retry_count, 0);
}

TEST_F(TaskStoreTest, MarkFailedKeepsRetryCount) {
  auto rec = create();
  ASSERT_TRUE(store_.update_status(rec.local_id.value(), TaskStatus::Uploading));
  ASSERT_TRUE(store_.mark_failed(rec.local_id.value(), "unsupported codec"));

  auto got = store_.get(rec.local_id);
  EXPECT_EQ(got->status, TaskStatus::Failed);
  EXPECT_EQ(got->retry_count, 0);
  EXPECT_EQ(got->error_message, "unsupported codec");
}

TEST_F(TaskStoreTest, RestartOnlyFromTerminal) {
  auto rec = create();
  auto r = store_.restart(rec.local_id.value());
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidTransition));

  ASSERT_TRUE(store_.update_status(rec.local_id.value(), TaskStatus::Uploading));
  ASSERT_TRUE(store_.record_failure(rec.local_id.value(), "boom"));
  ASSERT_TRUE(store_.mark_failed(rec.local_id.value(), "boom"));
  ASSERT_TRUE(store_.restart(rec.local_id.value()));

  auto got = store_.get(rec.local_id);
  EXPECT_EQ(got->status, TaskStatus::Pending);
  EXPECT_EQ(got->retry_count, 0);
  EXPECT_TRUE(got->last_error.empty());
}

TEST_F(TaskStoreTest, RemoteCompletionAwaitingDownload) {
  auto rec = create();
  to_converting(rec, "srv-1");

  auto first = store_.mark_remote_completed("srv-1", "/dl/srv-1", true);
  ASSERT_TRUE(first.has_value());
  EXPECT_TRUE(*first);

  auto got = store_.get(rec.local_id);
  EXPECT_EQ(got->status, TaskStatus::Converting);
  EXPECT_EQ(got->phase, TaskPhase::Downloading);
  EXPECT_EQ(got->progress, 100);
  EXPECT_EQ(got->download_url, "/dl/srv-1");

  auto duplicate = store_.mark_remote_completed("srv-1", "/dl/srv-1", true);
  ASSERT_TRUE(duplicate.has_value());
  EXPECT_FALSE(*duplicate);

  ASSERT_TRUE(store_.complete_download("srv-1", "/out/clip.mp4", 42));
  got = store_.get(rec.local_id);
  EXPECT_EQ(got->status, TaskStatus::Completed);
  EXPECT_TRUE(got->is_downloaded);
  EXPECT_EQ(got->local_output_path, "/out/clip.mp4");
  EXPECT_EQ(got->output_file_size, 42);
}

TEST_F(TaskStoreTest, RemoteCompletionWithoutDownload) {
  auto rec = create();
  to_converting(rec, "srv-1");

  ASSERT_TRUE(*store_.mark_remote_completed("srv-1", "", false));
  auto got = store_.get(rec.local_id);
  EXPECT_EQ(got->status, TaskStatus::Completed);
  EXPECT_FALSE(got->is_downloaded);
}

TEST_F(TaskStoreTest, FailedDownloadKeepsCompletedStatus) {
  auto rec = create();
  to_converting(rec, "srv-1");
  ASSERT_TRUE(store_.mark_remote_completed("srv-1", "", true));

  ASSERT_TRUE(store_.fail_download("srv-1", "disk full"));
  auto got = store_.get(rec.local_id);
  EXPECT_EQ(got->status, TaskStatus::Completed);
  EXPECT_FALSE(got->is_downloaded);
  EXPECT_NE(got->error_message.find("disk full"), std::string::npos);
}

TEST_F(TaskStoreTest, CompleteDownloadRequiresDownloadPhase) {
  auto rec = create();
  auto r = store_.complete_download(rec.local_id.value(), "/out/x", 1);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidTransition));
}

TEST_F(TaskStoreTest, ListenersReceiveSnapshots) {
  std::vector<TaskRecord> seen;
  auto id = store_.subscribe([&](const TaskRecord& r) { seen.push_back(r); });

  auto rec = create();
  ASSERT_TRUE(store_.update_status(rec.local_id.value(), TaskStatus::Uploading));
  ASSERT_EQ(seen.size(), 2);
  EXPECT_EQ(seen[0].status, TaskStatus::Pending);
  EXPECT_EQ(seen[1].status, TaskStatus::Uploading);
  EXPECT_GT(seen[1].version, seen[0].version);

  store_.unsubscribe(id);
  ASSERT_TRUE(store_.update_status(rec.local_id.value(), TaskStatus::Converting));
  EXPECT_EQ(seen.size(), 2);
}

TEST_F(TaskStoreTest, RemoveDropsBothIndexes) {
  auto rec = create();
  ASSERT_TRUE(store_.link_remote_id(rec.local_id, server_id("srv-1")));
  ASSERT_TRUE(store_.remove("srv-1"));

  EXPECT_EQ(store_.size(), 0);
  EXPECT_FALSE(store_.find("srv-1").has_value());
  EXPECT_FALSE(store_.get(rec.local_id).has_value());
}

TEST_F(TaskStoreTest, PurgeFinishedKeepsActive) {
  auto done = create("done.mp4");
  auto active = create("active.mp4");
  ASSERT_TRUE(store_.update_status(done.local_id.value(), TaskStatus::Cancelled));
  ASSERT_TRUE(store_.update_status(active.local_id.value(), TaskStatus::Uploading));

  EXPECT_EQ(store_.purge_finished(std::chrono::hours(1)), 0);
  EXPECT_EQ(store_.purge_finished(std::chrono::hours(-1)), 1);
  EXPECT_TRUE(store_.get(active.local_id).has_value());
  EXPECT_FALSE(store_.get(done.local_id).has_value());
}

TEST_F(TaskStoreTest, LoadRebuildsServerIndex) {
  TaskRecord stored;
  stored.local_id = local_id("l-1");
  stored.server_id = server_id("srv-9");
  stored.status = TaskStatus::Converting;
  stored.version = 41;

  store_.load({stored});
  ASSERT_TRUE(store_.find("srv-9").has_value());

  ASSERT_TRUE(store_.update_progress("srv-9", 10));
  EXPECT_GT(store_.get(local_id("l-1"))->version, 41);
}

TEST_F(TaskStoreTest, ConcurrentProgressNeverRegresses) {
  auto rec = create();
  to_converting(rec, "srv-1");

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t] {
      for (int p = t; p <= 100; p += 4) {
        (void)store_.update_progress("srv-1", p);
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }

  EXPECT_EQ(store_.get(rec.local_id)->progress, 100);
}
