#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace interview_agent::core {

struct ServerConfig {
  std::string host{"0.0.0.0"};
  std::uint16_t port{8000};
  std::string path{"/ws/interview"};
  std::size_t io_threads{2};
  std::chrono::milliseconds keepalive_interval{60000};
};

struct SessionConfig {
  std::chrono::milliseconds screen_grace_period{30000};
  // RMS of a linear16 chunk required to interrupt speech; 0 means any chunk.
  double barge_in_min_rms{0.0};
  bool video_restores_screen{true};
  std::string opening_question{};
  // Spoken notices around a lost screen share; empty disables one.
  std::string screen_lost_prompt{
      "I noticed you stopped sharing your screen. Please reshare to continue the interview, or click End "
      "Interview to finish."};
  std::string screen_restored_prompt{"Great, I can see your screen again! Please continue where you left off."};
  std::string screen_timeout_prompt{
      "Since the screen share wasn't restored, I'll wrap up the interview now. Thank you for your presentation!"};
};

struct VisionConfig {
  double change_threshold{0.10};
  std::chrono::milliseconds min_interval{3000};
};

struct TranscriptionConfig {
  std::string command{};
  std::uint32_t max_reconnect_attempts{3};
  std::chrono::milliseconds backoff_initial{250};
  std::chrono::milliseconds retry_cooldown{5000};
  std::size_t max_buffered_bytes{10U * 1024U * 1024U};
};

struct PlaybackConfig {
  std::string command{};
  std::size_t chunk_bytes{32U * 1024U};
};

struct OllamaConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{11434};
  std::string model{"llama3.1"};
  std::string vision_model{"llava"};
  std::chrono::seconds timeout{120};
};

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  std::string key_prefix{"interview"};
  bool enabled{false};
};

struct InterviewConfig {
  ServerConfig server{};
  SessionConfig session{};
  VisionConfig vision{};
  TranscriptionConfig transcription{};
  PlaybackConfig playback{};
  OllamaConfig ollama{};
  RedisConfig redis{};
};

InterviewConfig load_interview_config(const std::string& path);

}  // namespace interview_agent::core
