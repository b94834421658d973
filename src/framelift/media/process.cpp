#include "framelift/media/process.hpp"

#include "framelift/util/log.hpp"

#include <sys/wait.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

namespace framelift {

namespace {

constexpr auto kPollSlice = std::chrono::milliseconds(50);

class Fd {
public:
  explicit Fd(int fd = -1) noexcept : fd_(fd) {}
  ~Fd() { reset(); }
  Fd(const Fd&) = delete;
  auto operator=(const Fd&) -> Fd& = delete;

  [[nodiscard]] auto get() const noexcept -> int { return fd_; }
  auto reset(int fd = -1) noexcept -> void {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

private:
  int fd_;
};

auto create_pipe(Fd& read_end, Fd& write_end, int flags) -> bool {
  int fds[2];
  if (pipe2(fds, flags) < 0) {
    return false;
  }
  read_end.reset(fds[0]);
  write_end.reset(fds[1]);
  return true;
}

auto get_exit_code(int status) -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

// Child side must stay async-signal-safe: everything it touches is prepared
// by the parent before vfork().
auto spawn(const char* exe, char* const* argv, int stdout_fd, int null_fd,
           int status_fd) -> pid_t {
  pid_t pid = vfork();
  if (pid != 0) {
    return pid;
  }

  setpgid(0, 0);
  dup2(null_fd, STDIN_FILENO);
  dup2(stdout_fd, STDOUT_FILENO);
  dup2(null_fd, STDERR_FILENO);

  execv(exe, argv);

  int err = errno;
  [[maybe_unused]] auto n = write(status_fd, &err, sizeof(err));
  _exit(127);
}

auto kill_group(pid_t pid) -> void {
  if (kill(-pid, SIGKILL) < 0 && errno != ESRCH) {
    log::debug("kill({}) failed: {}", -pid, std::strerror(errno));
  }
}

auto reap(pid_t pid) -> int {
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      log::warn("waitpid failed for pid {}: {}", pid, std::strerror(errno));
      return -1;
    }
  }
  return get_exit_code(status);
}

}  // namespace

auto find_executable(std::string_view program)
    -> std::optional<std::filesystem::path> {
  if (program.empty()) {
    return std::nullopt;
  }
  auto is_exec = [](const std::filesystem::path& p) {
    std::error_code ec;
    return std::filesystem::is_regular_file(p, ec) &&
           ::access(p.c_str(), X_OK) == 0;
  };

  if (program.find('/') != std::string_view::npos) {
    std::filesystem::path p{program};
    return is_exec(p) ? std::optional{p} : std::nullopt;
  }

  const char* path_env = std::getenv("PATH");
  std::string_view dirs = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
  while (!dirs.empty()) {
    auto sep = dirs.find(':');
    auto dir = dirs.substr(0, sep);
    dirs = sep == std::string_view::npos ? std::string_view{}
                                         : dirs.substr(sep + 1);
    if (dir.empty()) {
      continue;
    }
    auto candidate = std::filesystem::path{dir} / program;
    if (is_exec(candidate)) {
      return candidate;
    }
  }
  return std::nullopt;
}

auto run_process(const std::vector<std::string>& argv,
                 const ProcessOptions& options) -> Result<ProcessResult> {
  if (argv.empty()) {
    return fail(Error::InvalidArgument);
  }
  auto exe = find_executable(argv.front());
  if (!exe) {
    return fail(Error::ToolUnavailable);
  }
  if (options.cancel.is_cancelled()) {
    return fail(Error::Cancelled);
  }

  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    cargv.push_back(const_cast<char*>(arg.c_str()));
  }
  cargv.push_back(nullptr);
  std::string exe_str = exe->string();

  Fd out_read, out_write, status_read, status_write;
  if (!create_pipe(out_read, out_write, O_CLOEXEC) ||
      !create_pipe(status_read, status_write, O_CLOEXEC)) {
    log::error("Failed to create pipe: {}", std::strerror(errno));
    return fail(Error::ToolFailed);
  }
  Fd null_fd{::open("/dev/null", O_RDWR | O_CLOEXEC)};
  if (null_fd.get() < 0) {
    return fail(Error::ToolFailed);
  }

  pid_t pid = spawn(exe_str.c_str(), cargv.data(), out_write.get(),
                    null_fd.get(), status_write.get());
  if (pid < 0) {
    log::error("Failed to fork {}: {}", argv.front(), std::strerror(errno));
    return fail(Error::ToolFailed);
  }
  setpgid(pid, pid);
  out_write.reset();
  status_write.reset();
  null_fd.reset();

  int exec_errno = 0;
  if (::read(status_read.get(), &exec_errno, sizeof(exec_errno)) ==
      static_cast<ssize_t>(sizeof(exec_errno))) {
    reap(pid);
    log::warn("Failed to execute {}: {}", exe_str, std::strerror(exec_errno));
    return fail(Error::ToolUnavailable);
  }

  int flags = fcntl(out_read.get(), F_GETFL);
  fcntl(out_read.get(), F_SETFL, flags | O_NONBLOCK);

  ProcessResult result;
  result.output.reserve(io::kInitialOutputReserve);
  std::array<char, io::kReadBufferSize> buffer;
  auto deadline = std::chrono::steady_clock::now() + options.timeout;

  while (true) {
    if (options.cancel.is_cancelled()) {
      result.cancelled = true;
      break;
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      result.timed_out = true;
      break;
    }

    pollfd pfd{out_read.get(), POLLIN, 0};
    int ret = ::poll(&pfd, 1,
                     static_cast<int>(std::min(remaining, kPollSlice).count()));
    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      log::warn("poll failed: {}", std::strerror(errno));
      break;
    }
    if (ret == 0) {
      continue;
    }

    ssize_t n = ::read(out_read.get(), buffer.data(), buffer.size());
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
        continue;
      }
      break;
    }
    if (n == 0) {
      break;
    }
    result.output.append(buffer.data(), static_cast<std::size_t>(n));
    if (result.output.size() >= options.max_output) {
      result.output.resize(options.max_output);
      result.truncated = true;
      break;
    }
  }

  if (result.timed_out || result.cancelled || result.truncated) {
    kill_group(pid);
    result.exit_code = reap(pid);
    return result;
  }

  // stdout closed; give the process the rest of its budget to exit.
  while (true) {
    int status = 0;
    pid_t w = waitpid(pid, &status, WNOHANG);
    if (w == pid) {
      result.exit_code = get_exit_code(status);
      break;
    }
    if (w < 0 && errno != EINTR) {
      log::warn("waitpid failed for pid {}: {}", pid, std::strerror(errno));
      break;
    }
    if (options.cancel.is_cancelled() ||
        std::chrono::steady_clock::now() >= deadline) {
      result.cancelled = options.cancel.is_cancelled();
      result.timed_out = !result.cancelled;
      kill_group(pid);
      result.exit_code = reap(pid);
      break;
    }
    std::this_thread::sleep_for(timing::kProcessKillGrace);
  }
  return result;
}

}  // namespace framelift
