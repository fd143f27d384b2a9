#include "command_runner.hpp"

#include "../include/workshop/error.hpp"
#include "../include/workshop/log.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace workshop::command {
namespace {

constexpr const char* kTag = "command";
constexpr int kPollIntervalMs = 50;

class Fd {
public:
  Fd() = default;
  explicit Fd(int fd) : fd_(fd) {}
  Fd(const Fd&) = delete;
  Fd& operator=(const Fd&) = delete;
  Fd(Fd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
  Fd& operator=(Fd&& other) noexcept {
    if (this != &other) {
      reset();
      fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
  }
  ~Fd() { reset(); }

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  void reset() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

private:
  int fd_ = -1;
};

struct Pipe {
  Fd read;
  Fd write;
};

Pipe make_pipe(int flags) {
  int fds[2] = {-1, -1};
  if (::pipe2(fds, flags) != 0) {
    throw Error(ErrorKind::CommandFailed, std::string("pipe: ") + std::strerror(errno));
  }
  return Pipe{Fd(fds[0]), Fd(fds[1])};
}

// Splits incoming bytes into lines; the trailing partial line is kept until
// more data or EOF arrives.
class LineBuffer {
public:
  template <typename Fn>
  void append(const char* data, std::size_t size, Fn&& emit) {
    pending_.append(data, size);
    std::string::size_type start = 0;
    for (;;) {
      const auto nl = pending_.find('\n', start);
      if (nl == std::string::npos) {
        break;
      }
      std::string line = pending_.substr(start, nl - start);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      emit(line);
      start = nl + 1;
    }
    pending_.erase(0, start);
  }

  template <typename Fn>
  void flush(Fn&& emit) {
    if (!pending_.empty()) {
      emit(pending_);
      pending_.clear();
    }
  }

private:
  std::string pending_;
};

std::string join_command(const std::string& program, const std::vector<std::string>& args) {
  std::string out = program;
  for (const auto& arg : args) {
    out += ' ';
    out += arg;
  }
  return out;
}

[[noreturn]] void exec_child(const std::string& program,
                             const std::vector<std::string>& args,
                             const std::optional<std::filesystem::path>& working_dir,
                             Pipe& out,
                             Pipe& err,
                             Pipe& status) {
  int failure = 0;
  if (working_dir && ::chdir(working_dir->c_str()) != 0) {
    failure = errno;
  }
  if (failure == 0) {
    ::dup2(out.write.get(), STDOUT_FILENO);
    ::dup2(err.write.get(), STDERR_FILENO);
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::close(devnull);
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& arg : args) {
      argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    ::execvp(program.c_str(), argv.data());
    failure = errno;
  }
  // status.write is close-on-exec; reaching this point means exec failed.
  const ssize_t written = ::write(status.write.get(), &failure, sizeof(failure));
  (void)written;
  ::_exit(127);
}

} // namespace

CommandRunner::CommandRunner(OutputHandler on_output)
    : CommandRunner(std::move(on_output), Programs{}) {}

CommandRunner::CommandRunner(OutputHandler on_output, Programs programs)
    : on_output_(std::move(on_output)), programs_(std::move(programs)) {}

CommandResult CommandRunner::run(const std::string& program,
                                 const std::vector<std::string>& args,
                                 const std::optional<std::filesystem::path>& working_dir,
                                 const std::atomic<bool>& cancel) const {
  const auto command_line = join_command(program, args);
  if (on_output_) {
    on_output_("Running: " + command_line);
  }
  log::info(kTag, "running: " + command_line);

  Pipe out = make_pipe(O_CLOEXEC);
  Pipe err = make_pipe(O_CLOEXEC);
  Pipe status = make_pipe(O_CLOEXEC);

  const pid_t pid = ::fork();
  if (pid < 0) {
    throw Error(ErrorKind::CommandFailed, std::string("fork: ") + std::strerror(errno));
  }
  if (pid == 0) {
    exec_child(program, args, working_dir, out, err, status);
  }

  out.write.reset();
  err.write.reset();
  status.write.reset();

  int exec_errno = 0;
  const ssize_t got = ::read(status.read.get(), &exec_errno, sizeof(exec_errno));
  if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
    ::waitpid(pid, nullptr, 0);
    throw Error(ErrorKind::CommandFailed, command_line + ": " + std::strerror(exec_errno));
  }

  LineBuffer out_lines;
  LineBuffer err_lines;
  const auto emit_out = [this](const std::string& line) {
    if (on_output_) {
      on_output_(line);
    }
  };
  const auto emit_err = [](const std::string& line) { log::error(kTag, line); };

  char buffer[4096];
  while (out.read.valid() || err.read.valid()) {
    if (cancel.load()) {
      ::kill(pid, SIGKILL);
      ::waitpid(pid, nullptr, 0);
      log::info(kTag, "cancelled: " + command_line);
      throw Error(ErrorKind::CommandCancelled, command_line);
    }

    pollfd fds[2];
    nfds_t count = 0;
    if (out.read.valid()) {
      fds[count++] = pollfd{out.read.get(), POLLIN, 0};
    }
    if (err.read.valid()) {
      fds[count++] = pollfd{err.read.get(), POLLIN, 0};
    }

    const int ready = ::poll(fds, count, kPollIntervalMs);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      ::kill(pid, SIGKILL);
      ::waitpid(pid, nullptr, 0);
      throw Error(ErrorKind::CommandFailed, std::string("poll: ") + std::strerror(errno));
    }
    if (ready == 0) {
      continue;
    }

    for (nfds_t i = 0; i < count; ++i) {
      if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
        continue;
      }
      const bool is_out = out.read.valid() && fds[i].fd == out.read.get();
      const ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
      if (n > 0) {
        if (is_out) {
          out_lines.append(buffer, static_cast<std::size_t>(n), emit_out);
        } else {
          err_lines.append(buffer, static_cast<std::size_t>(n), emit_err);
        }
        continue;
      }
      if (n < 0 && errno == EINTR) {
        continue;
      }
      if (n < 0) {
        log::error(kTag, std::string("read: ") + std::strerror(errno));
      }
      if (is_out) {
        out_lines.flush(emit_out);
        out.read.reset();
      } else {
        err_lines.flush(emit_err);
        err.read.reset();
      }
    }
  }

  int wait_status = 0;
  if (::waitpid(pid, &wait_status, 0) != pid) {
    throw Error(ErrorKind::CommandFailed, std::string("waitpid: ") + std::strerror(errno));
  }

  CommandResult result;
  if (WIFEXITED(wait_status)) {
    result.exit_code = WEXITSTATUS(wait_status);
    result.success = result.exit_code == 0;
  }
  log::info(kTag, command_line + " exited with " + std::to_string(result.exit_code));
  return result;
}

CommandResult CommandRunner::check_dependencies(const std::filesystem::path& deps_script,
                                                const std::atomic<bool>& cancel) const {
  auto script_dir = deps_script.parent_path();
  if (script_dir.empty()) {
    script_dir = ".";
  }
  return run(programs_.python, {deps_script.string()}, script_dir, cancel);
}

CommandResult CommandRunner::check_solution(const std::filesystem::path& lesson_dir,
                                            const std::atomic<bool>& cancel) const {
  const auto compose = run(programs_.docker_compose, {"up", "-d"}, lesson_dir, cancel);
  if (!compose.success) {
    return compose;
  }
  return run(programs_.python, {"check.py"}, lesson_dir, cancel);
}

} // namespace workshop::command
