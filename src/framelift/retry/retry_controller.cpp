#include "framelift/retry/retry_controller.hpp"

#include "framelift/util/log.hpp"

namespace framelift {

RetryController::RetryController(TaskStore& store, RetryPolicy policy)
    : store_(store), policy_(policy) {
}

auto RetryController::set_requeue_callback(RequeueCallback cb) -> void {
  requeue_ = std::move(cb);
}

auto RetryController::handle_failure(std::string_view id, std::string error,
                                     FailureKind kind)
    -> Result<FailureDisposition> {
  auto rec = store_.find(id);
  if (!rec) {
    return fail(Error::NotFound);
  }
  if (rec->status == TaskStatus::Cancelled ||
      rec->status == TaskStatus::Completed) {
    log::debug("Task {} is {}, ignoring {} failure", rec->local_id,
               task_status_name(rec->status), failure_kind_name(kind));
    return FailureDisposition::Terminal;
  }

  if (kind == FailureKind::ServerRejection) {
    log::warn("Task {} rejected by server: {}", rec->local_id, error);
    if (auto r = store_.mark_failed(id, std::move(error)); !r) {
      return fail(r.error());
    }
    return FailureDisposition::Terminal;
  }

  auto disposition = store_.record_failure(id, std::move(error));
  if (!disposition) {
    return fail(disposition.error());
  }
  if (*disposition == FailureDisposition::Terminal) {
    return FailureDisposition::Terminal;
  }

  if (auto r = store_.reset_for_retry(rec->local_id.value()); !r) {
    return fail(r.error());
  }
  auto delay = retry_delay(rec->retry_count + 1, policy_);
  log::info("Task {} retry {}/{} in {}ms", rec->local_id, rec->retry_count + 1,
            rec->max_retries, delay.count());
  requeue(rec->local_id, delay);
  return FailureDisposition::Retry;
}

auto RetryController::user_retry(std::string_view id) -> Result<void> {
  auto rec = store_.find(id);
  if (!rec) {
    return fail(Error::NotFound);
  }
  if (auto r = store_.restart(id); !r) {
    log::warn("Cannot retry task {} in state {}", rec->local_id,
              task_status_name(rec->status));
    return r;
  }
  log::info("Task {} restarted by user", rec->local_id);
  requeue(rec->local_id, std::chrono::milliseconds{0});
  return ok();
}

auto RetryController::requeue(const LocalId& id,
                              std::chrono::milliseconds delay) -> void {
  if (requeue_) {
    requeue_(id, delay);
  }
}

}  // namespace framelift
