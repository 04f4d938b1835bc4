#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "dictation_cpp/transcription_engine.hpp"
#include "dictation_cpp/wav_writer.hpp"

namespace dictation_cpp
{

struct SubprocessEngineConfig
{
  std::string binary_path = "whisper-cli";
  std::string model_path;
  std::string language = "en";
  int threads = 4;
  bool use_gpu = false;
  std::chrono::milliseconds timeout{60000};
};

/// 세그먼트마다 whisper.cpp CLI를 한 번 실행하는 엔진 (호출 간 상태 없음)
class SubprocessEngine : public TranscriptionEngine
{
public:
  explicit SubprocessEngine(const SubprocessEngineConfig & config);

  RecognitionResult recognize(const SpeechSegment & segment, const CancelToken & cancel) override;
  /// 실행 중인 CLI는 토큰을 폴링하므로 깨울 대기가 없다
  void cancel() override {}
  std::string engine_label() const override { return "whisper_cpp"; }
  std::string model_label() const override { return config_.model_path; }

  std::vector<std::string> command_args(
    const std::string & wav_path, const std::string & output_prefix) const;
  const SubprocessEngineConfig & config() const { return config_; }

private:
  SubprocessEngineConfig config_;
  WavWriter wav_writer_;
};

}  // namespace dictation_cpp
