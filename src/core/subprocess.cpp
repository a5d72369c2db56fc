#include "core/subprocess.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace interview_agent::core {

namespace {

constexpr auto kTerminateGrace = std::chrono::milliseconds(500);
constexpr auto kReapPollInterval = std::chrono::milliseconds(10);

void close_fd(int& fd) noexcept {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

}  // namespace

Subprocess::Subprocess(const std::vector<std::string>& argv) {
  if (argv.empty()) {
    throw std::invalid_argument("subprocess command must not be empty");
  }

  int stdin_pipe[2]{-1, -1};
  int stdout_pipe[2]{-1, -1};
  if (pipe2(stdin_pipe, O_CLOEXEC) != 0) {
    throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
  }
  if (pipe2(stdout_pipe, O_CLOEXEC) != 0) {
    const int saved_errno = errno;
    ::close(stdin_pipe[0]);
    ::close(stdin_pipe[1]);
    throw std::runtime_error(std::string("pipe failed: ") + std::strerror(saved_errno));
  }

  std::vector<char*> raw_argv;
  raw_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    raw_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  raw_argv.push_back(nullptr);

  const pid_t pid = fork();
  if (pid < 0) {
    const int saved_errno = errno;
    ::close(stdin_pipe[0]);
    ::close(stdin_pipe[1]);
    ::close(stdout_pipe[0]);
    ::close(stdout_pipe[1]);
    throw std::runtime_error(std::string("fork failed: ") + std::strerror(saved_errno));
  }

  if (pid == 0) {
    setpgid(0, 0);
    dup2(stdin_pipe[0], STDIN_FILENO);
    dup2(stdout_pipe[1], STDOUT_FILENO);
    execvp(raw_argv[0], raw_argv.data());
    _exit(127);
  }

  ::close(stdin_pipe[0]);
  ::close(stdout_pipe[1]);
  stdin_fd_ = stdin_pipe[1];
  stdout_fd_ = stdout_pipe[0];
  child_pid_ = pid;
}

Subprocess::~Subprocess() {
  terminate();
  close_fd(stdin_fd_);
  close_fd(stdout_fd_);
}

bool Subprocess::write_all(const void* data, std::size_t size) noexcept {
  if (stdin_fd_ < 0) {
    return false;
  }

  const auto* cursor = static_cast<const char*>(data);
  while (size > 0) {
    const ssize_t written = ::write(stdin_fd_, cursor, size);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    cursor += written;
    size -= static_cast<std::size_t>(written);
  }
  return true;
}

void Subprocess::close_stdin() noexcept { close_fd(stdin_fd_); }

ssize_t Subprocess::read_some(char* buffer, std::size_t size) noexcept {
  if (stdout_fd_ < 0) {
    return -1;
  }

  while (true) {
    const ssize_t bytes_read = ::read(stdout_fd_, buffer, size);
    if (bytes_read < 0 && errno == EINTR) {
      continue;
    }
    return bytes_read;
  }
}

bool Subprocess::read_line(std::string& line) {
  char chunk[4096]{};
  while (true) {
    const std::size_t newline_pos = read_buffer_.find('\n');
    if (newline_pos != std::string::npos) {
      line = read_buffer_.substr(0, newline_pos);
      read_buffer_.erase(0, newline_pos + 1);
      return true;
    }

    const ssize_t bytes_read = read_some(chunk, sizeof(chunk));
    if (bytes_read <= 0) {
      if (read_buffer_.empty()) {
        return false;
      }
      line.swap(read_buffer_);
      read_buffer_.clear();
      return true;
    }
    read_buffer_.append(chunk, static_cast<std::size_t>(bytes_read));
  }
}

bool Subprocess::running() const noexcept {
  std::lock_guard<std::mutex> lock(pid_mutex_);
  return child_pid_ > 0;
}

void Subprocess::interrupt() noexcept {
  std::lock_guard<std::mutex> lock(pid_mutex_);
  if (child_pid_ <= 0) {
    return;
  }
  kill(-child_pid_, SIGKILL);
  kill(child_pid_, SIGKILL);
}

bool Subprocess::reap(const int options) noexcept {
  std::lock_guard<std::mutex> lock(pid_mutex_);
  if (child_pid_ <= 0) {
    return true;
  }
  pid_t result = -1;
  do {
    result = waitpid(child_pid_, nullptr, options);
  } while (result < 0 && errno == EINTR);
  if (result == 0) {
    return false;
  }
  child_pid_ = -1;
  return true;
}

void Subprocess::terminate() noexcept {
  {
    std::lock_guard<std::mutex> lock(pid_mutex_);
    if (child_pid_ <= 0) {
      return;
    }
    kill(-child_pid_, SIGTERM);
    kill(child_pid_, SIGTERM);
  }

  const auto deadline = std::chrono::steady_clock::now() + kTerminateGrace;
  while (!reap(WNOHANG)) {
    if (std::chrono::steady_clock::now() >= deadline) {
      interrupt();
      reap(0);
      return;
    }
    std::this_thread::sleep_for(kReapPollInterval);
  }
}

std::vector<std::string> split_command(const std::string& command) {
  std::vector<std::string> words;
  std::string current;
  bool in_word = false;
  char quote = '\0';

  for (const char c : command) {
    if (quote != '\0') {
      if (c == quote) {
        quote = '\0';
      } else {
        current.push_back(c);
      }
      continue;
    }

    if (c == '\'' || c == '"') {
      quote = c;
      in_word = true;
      continue;
    }

    if (c == ' ' || c == '\t') {
      if (in_word) {
        words.push_back(current);
        current.clear();
        in_word = false;
      }
      continue;
    }

    current.push_back(c);
    in_word = true;
  }

  if (quote != '\0') {
    throw std::invalid_argument("unterminated quote in command: " + command);
  }
  if (in_word) {
    words.push_back(current);
  }
  return words;
}

}  // namespace interview_agent::core
