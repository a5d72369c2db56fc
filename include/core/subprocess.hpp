#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include <sys/types.h>

namespace interview_agent::core {

// Child process with piped stdin/stdout. The child runs in its own process
// group so signals also reach anything a shell wrapper spawned.
class Subprocess {
 public:
  explicit Subprocess(const std::vector<std::string>& argv);
  ~Subprocess();

  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;

  bool write_all(const void* data, std::size_t size) noexcept;
  void close_stdin() noexcept;

  // Blocking read; returns 0 at end of stream and -1 on error.
  ssize_t read_some(char* buffer, std::size_t size) noexcept;
  bool read_line(std::string& line);

  // Kills the process group without reaping it; never blocks.
  void interrupt() noexcept;
  // SIGTERM, then SIGKILL once the grace period passes, then reaps. Bounded.
  void terminate() noexcept;

  [[nodiscard]] bool running() const noexcept;

 private:
  bool reap(int options) noexcept;

  int stdin_fd_{-1};
  int stdout_fd_{-1};
  mutable std::mutex pid_mutex_;
  pid_t child_pid_{-1};
  std::string read_buffer_{};
};

// Splits a configured command line on whitespace; single and double quotes group words.
std::vector<std::string> split_command(const std::string& command);

}  // namespace interview_agent::core
