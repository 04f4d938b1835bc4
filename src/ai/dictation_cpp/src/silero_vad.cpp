#include "dictation_cpp/silero_vad.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <vector>

#include "onnxruntime_cxx_api.h"

using namespace std;


namespace dictation_cpp
{

namespace
{
constexpr size_t kFrameSamples = 512;
constexpr size_t kContextSamples = 64;
}  // namespace

/// Silero VAD ONNX 모델의 내부 상태 (RNN hidden state + context 버퍼)
struct SileroSpeechDetector::Impl
{
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "dictation_cpp_vad"};
  Ort::SessionOptions session_options;
  unique_ptr<Ort::Session> session;
  Ort::MemoryInfo memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeCPU);

  array<int64_t, 2> input_dims{1, kContextSamples + kFrameSamples};
  array<int64_t, 3> state_dims{2, 1, 128};
  array<int64_t, 1> sr_dims{1};
  array<int64_t, 1> sr_values{16000};

  vector<float> state = vector<float>(2 * 1 * 128, 0.0F);
  vector<float> context = vector<float>(kContextSamples, 0.0F);
  vector<float> input_buffer = vector<float>(kContextSamples + kFrameSamples, 0.0F);

  array<const char *, 3> input_names{"input", "state", "sr"};
  array<const char *, 2> output_names{"output", "stateN"};
};

SileroSpeechDetector::SileroSpeechDetector()
: impl_(make_unique<Impl>()), threshold_(0.5F), initialized_(false)
{
}

SileroSpeechDetector::~SileroSpeechDetector() = default;

bool SileroSpeechDetector::initialize(float threshold, const string & model_path)
{
  threshold_ = threshold;
  initialized_ = false;

  error_code ec;
  if (model_path.empty() || !filesystem::is_regular_file(model_path, ec)) {
    cerr << "[dictation_cpp] invalid vad_model_path: " << model_path << endl;
    return false;
  }

  impl_->session_options.SetIntraOpNumThreads(1);
  impl_->session_options.SetInterOpNumThreads(1);
  impl_->session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

  try {
    impl_->session = make_unique<Ort::Session>(
      impl_->env, model_path.c_str(), impl_->session_options);
    reset();
    initialized_ = true;
    return true;
  } catch (const Ort::Exception & e) {
    cerr << "[dictation_cpp] onnxruntime init failed: " << e.what() << endl;
    impl_->session.reset();
    return false;
  }
}

/// 청크 끝의 부족분(512 미만)은 판정에서 제외
bool SileroSpeechDetector::is_speech(const vector<float> & samples)
{
  if (!initialized_ || !impl_->session) {
    return false;
  }
  bool voiced = false;
  for (size_t offset = 0; offset + kFrameSamples <= samples.size(); offset += kFrameSamples) {
    if (frame_probability(samples.data() + offset) >= threshold_) {
      voiced = true;
    }
  }
  return voiced;
}

/// 입력 구성: [이전 context 64샘플 | 현재 프레임 512샘플] = 576샘플 → ONNX 추론
float SileroSpeechDetector::frame_probability(const float * frame)
{
  copy(impl_->context.begin(), impl_->context.end(), impl_->input_buffer.begin());
  copy(frame, frame + kFrameSamples, impl_->input_buffer.begin() + kContextSamples);

  array<Ort::Value, 3> inputs = {
    Ort::Value::CreateTensor<float>(
      impl_->memory_info, impl_->input_buffer.data(), impl_->input_buffer.size(),
      impl_->input_dims.data(), impl_->input_dims.size()),
    Ort::Value::CreateTensor<float>(
      impl_->memory_info, impl_->state.data(), impl_->state.size(),
      impl_->state_dims.data(), impl_->state_dims.size()),
    Ort::Value::CreateTensor<int64_t>(
      impl_->memory_info, impl_->sr_values.data(), impl_->sr_values.size(),
      impl_->sr_dims.data(), impl_->sr_dims.size())
  };

  try {
    auto outputs = impl_->session->Run(
      Ort::RunOptions{nullptr},
      impl_->input_names.data(),
      inputs.data(),
      inputs.size(),
      impl_->output_names.data(),
      impl_->output_names.size());

    const float prob = outputs[0].GetTensorMutableData<float>()[0];
    float * state_out = outputs[1].GetTensorMutableData<float>();
    memcpy(impl_->state.data(), state_out, impl_->state.size() * sizeof(float));
    copy(impl_->input_buffer.end() - kContextSamples, impl_->input_buffer.end(),
      impl_->context.begin());
    return prob;
  } catch (const Ort::Exception & e) {
    cerr << "[dictation_cpp] onnxruntime inference failed: " << e.what() << endl;
    return 0.0F;
  }
}

void SileroSpeechDetector::reset()
{
  fill(impl_->state.begin(), impl_->state.end(), 0.0F);
  fill(impl_->context.begin(), impl_->context.end(), 0.0F);
}

bool SileroSpeechDetector::initialized() const
{
  return initialized_;
}

}  // namespace dictation_cpp
