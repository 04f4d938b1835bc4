#include "dictation_cpp/audio_resample.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

using namespace std;


namespace dictation_cpp
{

vector<float> downsample_to_16k(const vector<float> & input, uint32_t input_rate)
{
  if (input_rate == kTargetSampleRate) {
    return input;
  }
  if (input_rate < kTargetSampleRate) {
    return {};
  }

  const double ratio = static_cast<double>(input_rate) / static_cast<double>(kTargetSampleRate);
  const size_t output_length = static_cast<size_t>(floor(static_cast<double>(input.size()) / ratio));
  vector<float> output(output_length, 0.0F);

  size_t position = 0;
  for (size_t index = 0; index < output_length; ++index) {
    const size_t next_position = min(
      static_cast<size_t>(floor(static_cast<double>(index + 1) * ratio)), input.size());
    double sum = 0.0;
    size_t count = 0;
    for (size_t cursor = position; cursor < next_position; ++cursor) {
      sum += input[cursor];
      ++count;
    }
    output[index] = count > 0 ? static_cast<float>(sum / static_cast<double>(count)) : 0.0F;
    position = next_position;
  }
  return output;
}

float mic_sensitivity_gain(int sensitivity_percent)
{
  const int clamped = clamp(sensitivity_percent, 50, 300);
  return clamp(static_cast<float>(clamped) / 100.0F, 0.5F, 3.0F);
}

void apply_gain(vector<float> & samples, float gain)
{
  if (fabs(gain - 1.0F) < numeric_limits<float>::epsilon()) {
    return;
  }
  for (auto & sample : samples) {
    sample = clamp(sample * gain, -1.0F, 1.0F);
  }
}

vector<float> pcm16_to_float(const vector<int16_t> & pcm)
{
  vector<float> out(pcm.size());
  for (size_t i = 0; i < pcm.size(); ++i) {
    out[i] = static_cast<float>(pcm[i]) / 32768.0F;
  }
  return out;
}

}  // namespace dictation_cpp
