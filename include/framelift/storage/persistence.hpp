#pragma once

#include "framelift/core/error.hpp"
#include "framelift/storage/task_repository.hpp"
#include "framelift/task/task_record.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace framelift {

class Persistence : public ITaskRepository {
public:
  explicit Persistence(std::string_view db_path);
  ~Persistence() override;

  Persistence(const Persistence&) = delete;
  Persistence& operator=(const Persistence&) = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool {
    return db_ != nullptr;
  }

  [[nodiscard]] auto save_task(const TaskRecord& record) -> Result<void> override;
  [[nodiscard]] auto save_tasks_batch(const std::vector<TaskRecord>& records)
      -> Result<void>;
  [[nodiscard]] auto delete_task(const LocalId& id) -> Result<void> override;
  [[nodiscard]] auto load_tasks() -> Result<std::vector<TaskRecord>> override;

  [[nodiscard]] auto get_task(const LocalId& id) -> Result<TaskRecord>;
  [[nodiscard]] auto get_task_by_server_id(const ServerId& id)
      -> Result<TaskRecord>;
  [[nodiscard]] auto list_tasks_by_status(TaskStatus status)
      -> Result<std::vector<TaskRecord>>;
  // Removes completed, failed and cancelled rows last touched before cutoff.
  [[nodiscard]] auto delete_finished_before(TimePoint cutoff)
      -> Result<std::size_t>;

  [[nodiscard]] auto begin_transaction() -> Result<void>;
  [[nodiscard]] auto commit_transaction() -> Result<void>;
  [[nodiscard]] auto rollback_transaction() -> Result<void>;

private:
  [[nodiscard]] auto create_tables() -> Result<void>;
  [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;
  [[nodiscard]] auto prepare(const char* sql) -> Result<sqlite3_stmt*>;
  [[nodiscard]] auto query_tasks(const char* sql, std::string_view arg)
      -> Result<std::vector<TaskRecord>>;

  struct DbDeleter {
    void operator()(sqlite3* db) const;
  };

  class Statement {
  public:
    explicit Statement(sqlite3_stmt* stmt = nullptr) noexcept : stmt_(stmt) {
    }
    ~Statement();
    Statement(Statement&& other) noexcept
        : stmt_(std::exchange(other.stmt_, nullptr)) {
    }
    Statement& operator=(Statement&& other) noexcept {
      if (this != &other) {
        reset();
        stmt_ = std::exchange(other.stmt_, nullptr);
      }
      return *this;
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* {
      return stmt_;
    }
    auto reset() -> void;

  private:
    sqlite3_stmt* stmt_ = nullptr;
  };

  std::string db_path_;
  std::unique_ptr<sqlite3, DbDeleter> db_{nullptr};
};

}  // namespace framelift
