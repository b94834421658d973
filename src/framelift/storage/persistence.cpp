#include "framelift/storage/persistence.hpp"

#include "framelift/util/log.hpp"
#include "framelift/util/util.hpp"

#include <nlohmann/json.hpp>
#include <sqlite3.h>

#include <format>
#include <utility>

namespace framelift {

namespace {

// Column order shared by the upsert and every SELECT.
constexpr auto kTaskColumns =
    "local_id, server_id, batch_id, task_name, file_path, display_name, "
    "file_size, duration, estimated_size, settings, status, phase, progress, "
    "attempt, error_message, conversion_speed, eta_seconds, created_at, "
    "upload_started_at, upload_completed_at, conversion_started_at, "
    "completed_at, updated_at, retry_count, max_retries, last_error, "
    "last_retry_at, download_url, local_output_path, is_downloaded, "
    "downloaded_at, output_file_size, archive_path, source_file_processed, "
    "version";

constexpr int kTaskColumnCount = 35;

auto col_text(sqlite3_stmt* stmt, int col) -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  return p ? p : "";
}

auto col_time(sqlite3_stmt* stmt, int col) -> TimePoint {
  auto ms = sqlite3_column_int64(stmt, col);
  return ms > 0 ? from_epoch_ms(ms) : TimePoint{};
}

auto time_value(TimePoint tp) -> std::int64_t {
  return tp == TimePoint{} ? 0 : to_epoch_ms(tp);
}

auto settings_to_json(const ConversionSettings& s) -> std::string {
  nlohmann::json j = {
      {"output_format", s.output_format},
      {"resolution", s.resolution},
      {"video_codec", s.video_codec},
      {"audio_codec", s.audio_codec},
      {"video_bitrate", s.video_bitrate},
      {"audio_bitrate", s.audio_bitrate},
      {"quality_mode", s.quality_mode},
      {"quality_value", s.quality_value},
      {"encoding_preset", s.encoding_preset},
      {"frame_rate", s.frame_rate},
      {"hardware_acceleration", s.hardware_acceleration},
      {"two_pass", s.two_pass},
      {"fast_start", s.fast_start},
      {"source_file_action", source_file_action_name(s.source_file_action)},
  };
  return j.dump();
}

auto settings_from_json(std::string_view text) -> ConversionSettings {
  ConversionSettings s;
  auto j = nlohmann::json::parse(text, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    log::warn("Stored conversion settings are unreadable, using defaults");
    return s;
  }
  s.output_format = j.value("output_format", s.output_format);
  s.resolution = j.value("resolution", s.resolution);
  s.video_codec = j.value("video_codec", s.video_codec);
  s.audio_codec = j.value("audio_codec", s.audio_codec);
  s.video_bitrate = j.value("video_bitrate", s.video_bitrate);
  s.audio_bitrate = j.value("audio_bitrate", s.audio_bitrate);
  s.quality_mode = j.value("quality_mode", s.quality_mode);
  s.quality_value = j.value("quality_value", s.quality_value);
  s.encoding_preset = j.value("encoding_preset", s.encoding_preset);
  s.frame_rate = j.value("frame_rate", s.frame_rate);
  s.hardware_acceleration =
      j.value("hardware_acceleration", s.hardware_acceleration);
  s.two_pass = j.value("two_pass", s.two_pass);
  s.fast_start = j.value("fast_start", s.fast_start);
  s.source_file_action = parse_source_file_action(
      j.value("source_file_action", std::string{"keep"}));
  return s;
}

// Sequential parameter binding; indices follow kTaskColumns.
class Binder {
public:
  explicit Binder(sqlite3_stmt* stmt) : stmt_(stmt) {}

  auto text(std::string_view v) -> Binder& {
    sqlite3_bind_text(stmt_, idx_++, v.data(), static_cast<int>(v.size()),
                      SQLITE_TRANSIENT);
    return *this;
  }
  auto optional_text(const std::optional<ServerId>& v) -> Binder& {
    if (v) {
      return text(v->value());
    }
    sqlite3_bind_null(stmt_, idx_++);
    return *this;
  }
  auto integer(std::int64_t v) -> Binder& {
    sqlite3_bind_int64(stmt_, idx_++, v);
    return *this;
  }
  auto real(double v) -> Binder& {
    sqlite3_bind_double(stmt_, idx_++, v);
    return *this;
  }
  auto time(TimePoint tp) -> Binder& {
    return integer(time_value(tp));
  }

private:
  sqlite3_stmt* stmt_;
  int idx_{1};
};

auto bind_task(sqlite3_stmt* stmt, const TaskRecord& r) -> void {
  Binder b(stmt);
  b.text(r.local_id.value())
      .optional_text(r.server_id)
      .text(r.batch_id.value())
      .text(r.task_name)
      .text(r.file.path.string())
      .text(r.file.display_name)
      .integer(static_cast<std::int64_t>(r.file.size_bytes))
      .real(r.file.duration_seconds)
      .integer(static_cast<std::int64_t>(r.file.estimated_size_bytes))
      .text(settings_to_json(r.settings))
      .text(task_status_name(r.status))
      .text(task_phase_name(r.phase))
      .integer(r.progress)
      .integer(r.attempt)
      .text(r.error_message)
      .real(r.conversion_speed)
      .integer(r.eta_seconds)
      .time(r.created_at)
      .time(r.upload_started_at)
      .time(r.upload_completed_at)
      .time(r.conversion_started_at)
      .time(r.completed_at)
      .time(r.updated_at)
      .integer(r.retry_count)
      .integer(r.max_retries)
      .text(r.last_error)
      .time(r.last_retry_at)
      .text(r.download_url)
      .text(r.local_output_path)
      .integer(r.is_downloaded ? 1 : 0)
      .time(r.downloaded_at)
      .integer(static_cast<std::int64_t>(r.output_file_size))
      .text(r.archive_path)
      .integer(r.source_file_processed ? 1 : 0)
      .integer(static_cast<std::int64_t>(r.version));
}

auto read_task(sqlite3_stmt* stmt) -> TaskRecord {
  TaskRecord r;
  int c = 0;
  r.local_id = LocalId{col_text(stmt, c++)};
  if (auto server = col_text(stmt, c++); !server.empty()) {
    r.server_id = ServerId{std::move(server)};
  }
  r.batch_id = BatchId{col_text(stmt, c++)};
  r.task_name = col_text(stmt, c++);
  r.file.path = col_text(stmt, c++);
  r.file.display_name = col_text(stmt, c++);
  r.file.size_bytes = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, c++));
  r.file.duration_seconds = sqlite3_column_double(stmt, c++);
  r.file.estimated_size_bytes =
      static_cast<std::uint64_t>(sqlite3_column_int64(stmt, c++));
  r.settings = settings_from_json(col_text(stmt, c++));
  r.status = parse_task_status(col_text(stmt, c++)).value_or(TaskStatus::Pending);
  r.phase = parse_task_phase(col_text(stmt, c++));
  r.progress = sqlite3_column_int(stmt, c++);
  r.attempt = sqlite3_column_int(stmt, c++);
  r.error_message = col_text(stmt, c++);
  r.conversion_speed = sqlite3_column_double(stmt, c++);
  r.eta_seconds = sqlite3_column_int(stmt, c++);
  r.created_at = col_time(stmt, c++);
  r.upload_started_at = col_time(stmt, c++);
  r.upload_completed_at = col_time(stmt, c++);
  r.conversion_started_at = col_time(stmt, c++);
  r.completed_at = col_time(stmt, c++);
  r.updated_at = col_time(stmt, c++);
  r.retry_count = sqlite3_column_int(stmt, c++);
  r.max_retries = sqlite3_column_int(stmt, c++);
  r.last_error = col_text(stmt, c++);
  r.last_retry_at = col_time(stmt, c++);
  r.download_url = col_text(stmt, c++);
  r.local_output_path = col_text(stmt, c++);
  r.is_downloaded = sqlite3_column_int(stmt, c++) != 0;
  r.downloaded_at = col_time(stmt, c++);
  r.output_file_size = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, c++));
  r.archive_path = col_text(stmt, c++);
  r.source_file_processed = sqlite3_column_int(stmt, c++) != 0;
  r.version = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, c++));
  return r;
}

}  // namespace

auto Persistence::DbDeleter::operator()(sqlite3* db) const -> void {
  if (db)
    sqlite3_close(db);
}

Persistence::Statement::~Statement() {
  reset();
}

auto Persistence::Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

auto Persistence::prepare(const char* sql) -> Result<sqlite3_stmt*> {
  if (!db_) {
    return fail(Error::DatabaseError);
  }
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
    log::error("Failed to prepare statement: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return stmt;
}

Persistence::Persistence(std::string_view db_path) : db_path_(db_path) {
}

Persistence::~Persistence() {
  close();
}

auto Persistence::open() -> Result<void> {
  if (db_) {
    return ok();
  }

  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open(db_path_.c_str(), &raw_db);
  if (rc != SQLITE_OK) {
    log::error("Failed to open database: {}", sqlite3_errmsg(raw_db));
    if (raw_db) {
      sqlite3_close(raw_db);
    }
    return fail(Error::DatabaseOpenFailed);
  }
  db_.reset(raw_db);
  sqlite3_busy_timeout(db_.get(), 2000);

  if (auto r = execute("PRAGMA journal_mode=WAL;"); !r) {
    log::warn("Failed to set WAL mode: {}", r.error().message());
  }
  if (auto r = execute("PRAGMA synchronous=NORMAL;"); !r) {
    log::warn("Failed to set synchronous mode: {}", r.error().message());
  }

  if (auto r = create_tables(); !r) {
    close();
    return r;
  }

  log::info("Database opened: {}", db_path_);
  return ok();
}

auto Persistence::close() -> void {
  db_.reset();
}

auto Persistence::create_tables() -> Result<void> {
  const char* sql = R"(
    CREATE TABLE IF NOT EXISTS tasks (
      local_id TEXT PRIMARY KEY,
      server_id TEXT,
      batch_id TEXT DEFAULT '',
      task_name TEXT DEFAULT '',
      file_path TEXT NOT NULL,
      display_name TEXT NOT NULL,
      file_size INTEGER DEFAULT 0,
      duration REAL DEFAULT 0,
      estimated_size INTEGER DEFAULT 0,
      settings TEXT DEFAULT '{}',
      status TEXT NOT NULL DEFAULT 'pending',
      phase TEXT NOT NULL DEFAULT 'none',
      progress INTEGER DEFAULT 0,
      attempt INTEGER DEFAULT 0,
      error_message TEXT DEFAULT '',
      conversion_speed REAL DEFAULT 0,
      eta_seconds INTEGER DEFAULT 0,
      created_at INTEGER NOT NULL,
      upload_started_at INTEGER DEFAULT 0,
      upload_completed_at INTEGER DEFAULT 0,
      conversion_started_at INTEGER DEFAULT 0,
      completed_at INTEGER DEFAULT 0,
      updated_at INTEGER DEFAULT 0,
      retry_count INTEGER DEFAULT 0,
      max_retries INTEGER DEFAULT 3,
      last_error TEXT DEFAULT '',
      last_retry_at INTEGER DEFAULT 0,
      download_url TEXT DEFAULT '',
      local_output_path TEXT DEFAULT '',
      is_downloaded INTEGER DEFAULT 0,
      downloaded_at INTEGER DEFAULT 0,
      output_file_size INTEGER DEFAULT 0,
      archive_path TEXT DEFAULT '',
      source_file_processed INTEGER DEFAULT 0,
      version INTEGER DEFAULT 0
    );

    CREATE INDEX IF NOT EXISTS idx_tasks_server_id ON tasks(server_id);
    CREATE INDEX IF NOT EXISTS idx_tasks_status ON tasks(status);
  )";

  return execute(sql);
}

auto Persistence::execute(std::string_view sql) -> Result<void> {
  if (!db_) {
    return fail(Error::DatabaseError);
  }
  char* err_msg = nullptr;
  std::string sql_str{sql};
  int rc = sqlite3_exec(db_.get(), sql_str.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    log::error("SQL error: {}", err_msg ? err_msg : "unknown");
    sqlite3_free(err_msg);
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto Persistence::save_task(const TaskRecord& record) -> Result<void> {
  static const std::string sql = [] {
    std::string placeholders = "?";
    for (int i = 1; i < kTaskColumnCount; ++i) {
      placeholders += ", ?";
    }
    return std::format(
        "INSERT OR REPLACE INTO tasks ({}) VALUES ({});", kTaskColumns,
        placeholders);
  }();

  auto result = prepare(sql.c_str());
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_task(stmt.get(), record);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    log::error("Failed to save task {}: {}", record.local_id,
               sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto Persistence::save_tasks_batch(const std::vector<TaskRecord>& records)
    -> Result<void> {
  if (auto r = begin_transaction(); !r) {
    return r;
  }
  for (const auto& record : records) {
    if (auto r = save_task(record); !r) {
      if (auto rb = rollback_transaction(); !rb) {
        log::warn("Rollback failed: {}", rb.error().message());
      }
      return r;
    }
  }
  return commit_transaction();
}

auto Persistence::delete_task(const LocalId& id) -> Result<void> {
  auto result = prepare("DELETE FROM tasks WHERE local_id = ?;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  sqlite3_bind_text(stmt.get(), 1, id.str().c_str(), -1, SQLITE_TRANSIENT);
  return sqlite3_step(stmt.get()) == SQLITE_DONE
             ? ok()
             : fail(Error::DatabaseQueryFailed);
}

auto Persistence::query_tasks(const char* sql, std::string_view arg)
    -> Result<std::vector<TaskRecord>> {
  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  if (!arg.empty()) {
    sqlite3_bind_text(stmt.get(), 1, arg.data(), static_cast<int>(arg.size()),
                      SQLITE_TRANSIENT);
  }

  std::vector<TaskRecord> records;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    records.push_back(read_task(stmt.get()));
  }
  if (rc != SQLITE_DONE) {
    log::error("Task query failed: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return records;
}

auto Persistence::load_tasks() -> Result<std::vector<TaskRecord>> {
  static const std::string sql = std::format(
      "SELECT {} FROM tasks ORDER BY created_at;", kTaskColumns);
  return query_tasks(sql.c_str(), {});
}

auto Persistence::get_task(const LocalId& id) -> Result<TaskRecord> {
  static const std::string sql =
      std::format("SELECT {} FROM tasks WHERE local_id = ?;", kTaskColumns);
  auto records = query_tasks(sql.c_str(), id.value());
  if (!records)
    return std::unexpected(records.error());
  if (records->empty())
    return fail(Error::NotFound);
  return std::move(records->front());
}

auto Persistence::get_task_by_server_id(const ServerId& id)
    -> Result<TaskRecord> {
  static const std::string sql =
      std::format("SELECT {} FROM tasks WHERE server_id = ?;", kTaskColumns);
  auto records = query_tasks(sql.c_str(), id.value());
  if (!records)
    return std::unexpected(records.error());
  if (records->empty())
    return fail(Error::NotFound);
  return std::move(records->front());
}

auto Persistence::list_tasks_by_status(TaskStatus status)
    -> Result<std::vector<TaskRecord>> {
  static const std::string sql = std::format(
      "SELECT {} FROM tasks WHERE status = ? ORDER BY created_at;",
      kTaskColumns);
  return query_tasks(sql.c_str(), task_status_name(status));
}

auto Persistence::delete_finished_before(TimePoint cutoff)
    -> Result<std::size_t> {
  constexpr auto sql = R"(
    DELETE FROM tasks
    WHERE status IN ('completed', 'failed', 'cancelled') AND updated_at < ?;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  sqlite3_bind_int64(stmt.get(), 1, to_epoch_ms(cutoff));
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return fail(Error::DatabaseQueryFailed);
  }
  return static_cast<std::size_t>(sqlite3_changes(db_.get()));
}

auto Persistence::begin_transaction() -> Result<void> {
  return execute("BEGIN TRANSACTION;");
}

auto Persistence::commit_transaction() -> Result<void> {
  return execute("COMMIT;");
}

auto Persistence::rollback_transaction() -> Result<void> {
  return execute("ROLLBACK;");
}

}  // namespace framelift
