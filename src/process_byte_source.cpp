#include <cochange/process_byte_source.h>

#include <cochange/errors.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cochange {
namespace {

std::string ErrnoMessage(const std::string &what) {
  return what + ": " + std::strerror(errno);
}

void CloseFd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

} // namespace

ProcessByteSource::ProcessByteSource(std::vector<std::string> arguments,
                                     int timeout_seconds,
                                     std::shared_ptr<Logger> logger)
    : arguments_(std::move(arguments)),
      logger_(EnsureLogger(std::move(logger))) {
  if (arguments_.empty()) {
    throw std::invalid_argument("ProcessByteSource requires a command");
  }
  if (timeout_seconds > 0) {
    deadline_ = std::chrono::steady_clock::now() +
                std::chrono::seconds(timeout_seconds);
  }
  Start();
}

ProcessByteSource::~ProcessByteSource() {
  CloseDescriptors();
  if (pid_ > 0) {
    Kill();
  }
}

void ProcessByteSource::Start() {
  int stdout_pipe[2];
  int stderr_pipe[2];
  if (::pipe2(stdout_pipe, O_CLOEXEC) != 0) {
    throw HistoryExportFailed(ErrnoMessage("pipe failed"));
  }
  if (::pipe2(stderr_pipe, O_CLOEXEC) != 0) {
    ::close(stdout_pipe[0]);
    ::close(stdout_pipe[1]);
    throw HistoryExportFailed(ErrnoMessage("pipe failed"));
  }

  const auto pid = ::fork();
  if (pid < 0) {
    for (const auto fd : {stdout_pipe[0], stdout_pipe[1], stderr_pipe[0],
                          stderr_pipe[1]}) {
      ::close(fd);
    }
    throw HistoryExportFailed(ErrnoMessage("fork failed"));
  }

  if (pid == 0) {
    if (::dup2(stdout_pipe[1], STDOUT_FILENO) < 0 ||
        ::dup2(stderr_pipe[1], STDERR_FILENO) < 0) {
      _exit(127);
    }
    std::vector<char *> argv;
    argv.reserve(arguments_.size() + 1U);
    for (auto &argument : arguments_) {
      argv.push_back(argument.data());
    }
    argv.push_back(nullptr);
    ::execvp(argv[0], argv.data());
    _exit(127);
  }

  ::close(stdout_pipe[1]);
  ::close(stderr_pipe[1]);
  pid_ = pid;
  stdout_fd_ = stdout_pipe[0];
  stderr_fd_ = stderr_pipe[0];
  logger_->Log(LogLevel::kDebug, "process.start",
               {{"command", CommandLine()}, {"pid", std::to_string(pid_)}});
}

std::size_t ProcessByteSource::Read(char *buffer, std::size_t size) {
  while (stdout_fd_ >= 0) {
    int timeout_ms = -1;
    if (deadline_) {
      const auto remaining =
          std::chrono::duration_cast<std::chrono::milliseconds>(
              *deadline_ - std::chrono::steady_clock::now())
              .count();
      if (remaining <= 0) {
        timed_out_ = true;
        CloseDescriptors();
        Kill();
        throw HistoryExportFailed("Export timed out: " + CommandLine());
      }
      timeout_ms = static_cast<int>(std::min<long long>(remaining, 1000));
    }

    pollfd fds[2] = {{stdout_fd_, POLLIN, 0}, {stderr_fd_, POLLIN, 0}};
    const auto ready = ::poll(fds, stderr_fd_ >= 0 ? 2 : 1, timeout_ms);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw HistoryExportFailed(ErrnoMessage("poll failed"));
    }
    if (ready == 0) {
      continue;
    }
    if (stderr_fd_ >= 0 && (fds[1].revents & (POLLIN | POLLHUP)) != 0) {
      DrainErrorOutput();
    }
    if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
      continue;
    }

    const auto count = ::read(stdout_fd_, buffer, size);
    if (count < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw HistoryExportFailed(ErrnoMessage("read failed"));
    }
    if (count == 0) {
      CloseFd(stdout_fd_);
      return 0;
    }
    return static_cast<std::size_t>(count);
  }
  return 0;
}

void ProcessByteSource::DrainErrorOutput() {
  char chunk[4096];
  const auto count = ::read(stderr_fd_, chunk, sizeof(chunk));
  if (count < 0) {
    if (errno != EINTR) {
      CloseFd(stderr_fd_);
    }
    return;
  }
  if (count == 0) {
    CloseFd(stderr_fd_);
    return;
  }
  const auto room = kMaxErrorOutput - std::min(kMaxErrorOutput, stderr_.size());
  stderr_.append(chunk, std::min<std::size_t>(room, count));
}

void ProcessByteSource::Finish() {
  if (finished_) {
    return;
  }
  finished_ = true;
  CloseFd(stdout_fd_);
  while (stderr_fd_ >= 0) {
    DrainErrorOutput();
  }
  if (pid_ <= 0) {
    if (timed_out_) {
      throw HistoryExportFailed("Export timed out: " + CommandLine());
    }
    return;
  }

  const auto status = Wait();
  logger_->Log(LogLevel::kDebug, "process.exit",
               {{"command", CommandLine()}, {"status", std::to_string(status)}});
  if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
    return;
  }
  std::string reason;
  if (WIFEXITED(status)) {
    reason = "exit status " + std::to_string(WEXITSTATUS(status));
  } else if (WIFSIGNALED(status)) {
    reason = "signal " + std::to_string(WTERMSIG(status));
  } else {
    reason = "unknown status";
  }
  std::string message = "Export failed (" + reason + "): " + CommandLine();
  if (!stderr_.empty()) {
    message += "\n" + stderr_;
  }
  throw HistoryExportFailed(message);
}

void ProcessByteSource::CloseDescriptors() {
  CloseFd(stdout_fd_);
  CloseFd(stderr_fd_);
}

int ProcessByteSource::Wait() {
  int status = 0;
  while (::waitpid(pid_, &status, 0) < 0) {
    if (errno != EINTR) {
      pid_ = -1;
      throw HistoryExportFailed(ErrnoMessage("waitpid failed"));
    }
  }
  pid_ = -1;
  return status;
}

void ProcessByteSource::Kill() {
  ::kill(pid_, SIGKILL);
  int status = 0;
  while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
  }
  pid_ = -1;
}

std::string ProcessByteSource::CommandLine() const {
  std::string line;
  for (const auto &argument : arguments_) {
    if (!line.empty()) {
      line.push_back(' ');
    }
    line += argument;
  }
  return line;
}

StringByteSource::StringByteSource(std::string data, std::size_t chunk_size)
    : data_(std::move(data)), chunk_size_(std::max<std::size_t>(1, chunk_size)) {}

std::size_t StringByteSource::Read(char *buffer, std::size_t size) {
  const auto count =
      std::min({size, chunk_size_, data_.size() - offset_});
  std::memcpy(buffer, data_.data() + offset_, count);
  offset_ += count;
  return count;
}

void StringByteSource::Finish() {
  if (failure_) {
    throw HistoryExportFailed(*failure_);
  }
}

} // namespace cochange
