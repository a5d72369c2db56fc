#include "capabilities/transcriber.hpp"

#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/subprocess.hpp"
#include "core/timestamp.hpp"
#include "model/errors.hpp"

namespace interview_agent::capabilities {
namespace {

void replace_all(std::string& text, const std::string& token, const std::string& value) {
  std::size_t pos = 0;
  while ((pos = text.find(token, pos)) != std::string::npos) {
    text.replace(pos, token.size(), value);
    pos += value.size();
  }
}

class ProcessTranscriberStream final : public TranscriberStream {
 public:
  explicit ProcessTranscriberStream(const std::vector<std::string>& argv) {
    try {
      process_ = std::make_unique<core::Subprocess>(argv);
    } catch (const std::exception& ex) {
      throw model::TranscriptionError(std::string("unable to start transcriber: ") + ex.what());
    }
  }

  ~ProcessTranscriberStream() override { close(); }

  void send(const model::audio_chunk& chunk) override {
    if (chunk.samples == nullptr || chunk.samples->empty()) {
      return;
    }
    if (!process_->write_all(chunk.samples->data(), chunk.samples->size())) {
      throw model::TranscriptionError("transcriber stopped accepting audio");
    }
  }

  std::optional<model::transcript_segment> read() override {
    std::string line;
    while (process_->read_line(line)) {
      if (line.empty()) {
        continue;
      }

      try {
        const auto parsed = nlohmann::json::parse(line);
        const auto type = parsed.value("type", std::string{});
        if (type != "interim" && type != "final") {
          continue;
        }
        return model::transcript_segment{
            .kind = type == "final" ? model::segment_kind::FINAL : model::segment_kind::INTERIM,
            .text = parsed.value("text", std::string{}),
            .timestamp_ns = core::monotonic_timestamp_now_ns(),
        };
      } catch (const nlohmann::json::exception& ex) {
        std::cerr << "[transcript] ignoring transcriber output: " << ex.what() << '\n';
      }
    }
    return std::nullopt;
  }

  void close() noexcept override {
    std::lock_guard<std::mutex> lock(close_mutex_);
    process_->close_stdin();
    process_->terminate();
  }

 private:
  std::unique_ptr<core::Subprocess> process_;
  std::mutex close_mutex_;
};

class ProcessTranscriber final : public Transcriber {
 public:
  explicit ProcessTranscriber(core::TranscriptionConfig config) : config_(std::move(config)) {}

  std::unique_ptr<TranscriberStream> open(const model::audio_format& format) override {
    std::string command = config_.command;
    replace_all(command, "{encoding}", format.encoding);
    replace_all(command, "{sample_rate}", std::to_string(format.sample_rate));

    std::vector<std::string> argv;
    try {
      argv = core::split_command(command);
    } catch (const std::invalid_argument& ex) {
      throw model::TranscriptionError(ex.what());
    }
    if (argv.empty()) {
      throw model::TranscriptionError("transcription.command is empty");
    }
    return std::make_unique<ProcessTranscriberStream>(argv);
  }

 private:
  core::TranscriptionConfig config_;
};

class NoneTranscriberStream final : public TranscriberStream {
 public:
  void send(const model::audio_chunk& /*chunk*/) override {}

  std::optional<model::transcript_segment> read() override {
    std::unique_lock<std::mutex> lock(mutex_);
    closed_cv_.wait(lock, [this] { return closed_; });
    return std::nullopt;
  }

  void close() noexcept override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    closed_cv_.notify_all();
  }

 private:
  std::mutex mutex_;
  std::condition_variable closed_cv_;
  bool closed_{false};
};

class NoneTranscriber final : public Transcriber {
 public:
  std::unique_ptr<TranscriberStream> open(const model::audio_format& /*format*/) override {
    return std::make_unique<NoneTranscriberStream>();
  }
};

}  // namespace

std::unique_ptr<Transcriber> make_process_transcriber(const core::TranscriptionConfig& config) {
  return std::make_unique<ProcessTranscriber>(config);
}

std::unique_ptr<Transcriber> make_none_transcriber() { return std::make_unique<NoneTranscriber>(); }

}  // namespace interview_agent::capabilities
