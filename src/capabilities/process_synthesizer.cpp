#include "capabilities/synthesizer.hpp"

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/subprocess.hpp"
#include "model/errors.hpp"

namespace interview_agent::capabilities {
namespace {

constexpr std::size_t kReadChunkBytes = 16U * 1024U;

class ProcessSynthesisStream final : public SynthesisStream {
 public:
  ProcessSynthesisStream(const std::vector<std::string>& argv, const std::string& text) {
    try {
      process_ = std::make_unique<core::Subprocess>(argv);
    } catch (const std::exception& ex) {
      throw model::PlaybackError(std::string("unable to start synthesizer: ") + ex.what());
    }
    if (!process_->write_all(text.data(), text.size())) {
      throw model::PlaybackError("synthesizer did not accept text");
    }
    process_->close_stdin();
  }

  ~ProcessSynthesisStream() override {
    cancelled_.store(true);
    process_->terminate();
  }

  std::optional<model::byte_buffer> next_chunk() override {
    if (cancelled_.load()) {
      return std::nullopt;
    }

    model::byte_buffer chunk(kReadChunkBytes);
    const ssize_t bytes_read = process_->read_some(reinterpret_cast<char*>(chunk.data()), chunk.size());
    if (cancelled_.load() || bytes_read == 0) {
      return std::nullopt;
    }
    if (bytes_read < 0) {
      throw model::PlaybackError("synthesizer output read failed");
    }
    chunk.resize(static_cast<std::size_t>(bytes_read));
    return chunk;
  }

  // Called from the session thread; reaping is left to the destructor on the playback worker.
  void cancel() noexcept override {
    cancelled_.store(true);
    process_->interrupt();
  }

 private:
  std::unique_ptr<core::Subprocess> process_;
  std::atomic<bool> cancelled_{false};
};

class ProcessSynthesizer final : public Synthesizer {
 public:
  explicit ProcessSynthesizer(const core::PlaybackConfig& config) {
    try {
      argv_ = core::split_command(config.command);
    } catch (const std::invalid_argument& ex) {
      throw std::runtime_error(std::string("playback.command: ") + ex.what());
    }
  }

  std::unique_ptr<SynthesisStream> synthesize(const std::string& text) override {
    if (argv_.empty()) {
      throw model::PlaybackError("playback.command is empty");
    }
    return std::make_unique<ProcessSynthesisStream>(argv_, text);
  }

 private:
  std::vector<std::string> argv_;
};

class SilentSynthesisStream final : public SynthesisStream {
 public:
  std::optional<model::byte_buffer> next_chunk() override { return std::nullopt; }
  void cancel() noexcept override {}
};

class SilentSynthesizer final : public Synthesizer {
 public:
  std::unique_ptr<SynthesisStream> synthesize(const std::string& /*text*/) override {
    return std::make_unique<SilentSynthesisStream>();
  }
};

}  // namespace

std::unique_ptr<Synthesizer> make_process_synthesizer(const core::PlaybackConfig& config) {
  return std::make_unique<ProcessSynthesizer>(config);
}

std::unique_ptr<Synthesizer> make_silent_synthesizer() { return std::make_unique<SilentSynthesizer>(); }

}  // namespace interview_agent::capabilities
