#pragma once

#include <stdexcept>

namespace interview_agent::model {

// Channel read/write failure or peer close; ends the session.
class ConnectionError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class TranscriptionError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class AnalysisError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class GenerationError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class PlaybackError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace interview_agent::model
