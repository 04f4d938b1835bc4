#pragma once

#include <memory>
#include <string>
#include <vector>

#include "dictation_cpp/speech_detector.hpp"

namespace dictation_cpp
{

/// Silero VAD(ONNX) 기반 검출기. 16 kHz 청크를 512 샘플 프레임으로 나눠
/// 한 프레임이라도 threshold 이상이면 음성으로 판정
class SileroSpeechDetector : public SpeechDetector
{
public:
  SileroSpeechDetector();
  ~SileroSpeechDetector() override;

  SileroSpeechDetector(const SileroSpeechDetector &) = delete;
  SileroSpeechDetector & operator=(const SileroSpeechDetector &) = delete;

  bool initialize(float threshold, const std::string & model_path);
  bool is_speech(const std::vector<float> & samples) override;
  void reset() override;
  bool initialized() const;

private:
  float frame_probability(const float * frame);

  struct Impl;
  std::unique_ptr<Impl> impl_;
  float threshold_;
  bool initialized_;
};

}  // namespace dictation_cpp
