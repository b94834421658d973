#pragma once

#include "framelift/core/error.hpp"
#include "framelift/task/task_record.hpp"

#include <vector>

namespace framelift {

// Durable home of task records, one row per local id.
class ITaskRepository {
public:
  virtual ~ITaskRepository() = default;

  [[nodiscard]] virtual auto save_task(const TaskRecord& record)
      -> Result<void> = 0;
  [[nodiscard]] virtual auto delete_task(const LocalId& id) -> Result<void> = 0;
  [[nodiscard]] virtual auto load_tasks() -> Result<std::vector<TaskRecord>> = 0;
};

}  // namespace framelift
