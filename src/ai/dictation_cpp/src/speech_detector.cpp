#include "dictation_cpp/speech_detector.hpp"

#include <cmath>

using namespace std;


namespace dictation_cpp
{

RmsSpeechDetector::RmsSpeechDetector(const RmsDetectorConfig & config)
: config_(config)
{
}

bool RmsSpeechDetector::is_speech(const vector<float> & samples)
{
  if (samples.size() < config_.min_samples) {
    return false;
  }
  return rms(samples) >= config_.rms_threshold;
}

float RmsSpeechDetector::rms(const vector<float> & samples)
{
  if (samples.empty()) {
    return 0.0F;
  }
  double energy = 0.0;
  for (const float s : samples) {
    energy += static_cast<double>(s) * static_cast<double>(s);
  }
  return static_cast<float>(sqrt(energy / static_cast<double>(samples.size())));
}

}  // namespace dictation_cpp
