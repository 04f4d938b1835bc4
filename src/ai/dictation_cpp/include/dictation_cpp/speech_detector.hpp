#pragma once

#include <cstddef>
#include <vector>

namespace dictation_cpp
{

/// 16 kHz mono 청크에 음성이 포함되어 있는지 판별하는 인터페이스
class SpeechDetector
{
public:
  virtual ~SpeechDetector() = default;
  virtual bool is_speech(const std::vector<float> & samples) = 0;
  virtual void reset() {}
};

struct RmsDetectorConfig
{
  float rms_threshold = 0.015F;
  size_t min_samples = 512;
};

/// RMS 에너지 기반 검출기 (모델 불필요)
class RmsSpeechDetector : public SpeechDetector
{
public:
  explicit RmsSpeechDetector(const RmsDetectorConfig & config = RmsDetectorConfig());

  bool is_speech(const std::vector<float> & samples) override;
  static float rms(const std::vector<float> & samples);

private:
  RmsDetectorConfig config_;
};

}  // namespace dictation_cpp
