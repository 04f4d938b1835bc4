#include "dictation_cpp/audio_input.hpp"

#include <dictation_common/string_utils.hpp>

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

using namespace std;


namespace dictation_cpp {

namespace {
bool is_device_index(const string & value)
{
  return !value.empty() &&
         all_of(value.begin(), value.end(), [](unsigned char c) { return isdigit(c) != 0; });
}
}  // namespace

AudioInput::AudioInput()
: frame_length_(1024),
  selected_device_index_(paNoDevice),
  sample_rate_(0),
  running_(false),
  initialized_(false),
  stream_(nullptr),
  frame_buf_(1024, 0.0F)
{
}

AudioInput::~AudioInput()
{
  stop();
}

bool AudioInput::configure(const string & microphone_id, int frame_length)
{
  if (is_running()) return false;  // 실행 중 설정 변경 금지
  if (frame_length <= 0) return false;

  microphone_id_ = dictation_common::trim(microphone_id);
  frame_length_ = frame_length;
  return true;
}

bool AudioInput::supports_mono_float_(int device_index, double sample_rate) const
{
  const PaDeviceInfo* info = Pa_GetDeviceInfo(device_index);
  if (!info || info->maxInputChannels < 1) return false;

  PaStreamParameters in_params{};
  in_params.device = device_index;
  in_params.channelCount = 1;
  in_params.sampleFormat = paFloat32;
  in_params.suggestedLatency = info->defaultLowInputLatency;
  in_params.hostApiSpecificStreamInfo = nullptr;

  return Pa_IsFormatSupported(&in_params, nullptr, sample_rate) == paFormatIsSupported;
}

/// 입력 장치 선택 우선순위:
/// 1) microphone_id 인덱스  2) 이름에 microphone_id 키워드 포함  3) 시스템 기본 장치  4) 첫 입력 장치
int AudioInput::resolve_device_index_() const
{
  const int device_count = Pa_GetDeviceCount();
  if (device_count <= 0) return paNoDevice;

  auto usable = [this](int index) {
      const PaDeviceInfo* info = Pa_GetDeviceInfo(index);
      return info && supports_mono_float_(index, info->defaultSampleRate);
    };

  if (is_device_index(microphone_id_)) {
    const int index = stoi(microphone_id_);
    if (index < device_count && usable(index)) {
      return index;
    }
  } else if (!microphone_id_.empty()) {
    const string keyword = dictation_common::to_lower(microphone_id_);
    for (int i = 0; i < device_count; ++i) {
      const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
      const string name = dictation_common::to_lower(info && info->name ? info->name : "");
      if (name.find(keyword) != string::npos && usable(i)) {
        return i;
      }
    }
  }

  const int default_device = Pa_GetDefaultInputDevice();
  if (default_device != paNoDevice && usable(default_device)) {
    return default_device;
  }

  for (int i = 0; i < device_count; ++i) {
    if (usable(i)) return i;
  }
  return paNoDevice;
}

void AudioInput::set_callback(FrameCallback cb)
{
  lock_guard<mutex> lock(cb_mutex_);
  callback_ = move(cb);
}

/// PortAudio 초기화 → 디바이스 선택 → 장치 기본 레이트 mono float32 스트림 오픈 → 콜백 루프 시작
bool AudioInput::start()
{
  if (running_) return true;

  last_error_.clear();
  selected_device_index_ = paNoDevice;
  selected_device_name_.clear();

  PaError err;

  if (!initialized_) {
    err = Pa_Initialize();
    if (err != paNoError) {
      last_error_ = Pa_GetErrorText(err);
      return false;
    }
    initialized_ = true;
  }

  const int dev = resolve_device_index_();
  if (dev == paNoDevice) {
    last_error_ = "no_supported_input_device";
    return false;
  }

  const PaDeviceInfo* devInfo = Pa_GetDeviceInfo(dev);
  if (!devInfo) {
    last_error_ = "invalid_device_info";
    return false;
  }
  selected_device_index_ = dev;
  selected_device_name_ = devInfo->name ? devInfo->name : "";
  sample_rate_ = static_cast<uint32_t>(devInfo->defaultSampleRate);

  PaStreamParameters inParams;
  inParams.device = dev;
  inParams.channelCount = 1;               // mono
  inParams.sampleFormat = paFloat32;
  inParams.suggestedLatency = devInfo->defaultLowInputLatency;
  inParams.hostApiSpecificStreamInfo = nullptr;

  if (stream_) {
    Pa_CloseStream(stream_);
    stream_ = nullptr;
  }

  frame_buf_.assign(static_cast<size_t>(frame_length_), 0.0F);

  err = Pa_OpenStream(
    &stream_,
    &inParams,
    nullptr,                 // output 없음
    devInfo->defaultSampleRate,
    static_cast<unsigned long>(frame_length_),
    paNoFlag,
    &AudioInput::pa_callback,
    this
  );

  if (err != paNoError) {
    stream_ = nullptr;
    last_error_ = Pa_GetErrorText(err);
    return false;
  }

  err = Pa_StartStream(stream_);
  if (err != paNoError) {
    Pa_CloseStream(stream_);
    stream_ = nullptr;
    last_error_ = Pa_GetErrorText(err);
    return false;
  }

  running_ = true;
  return true;
}

void AudioInput::stop()
{
  running_ = false;

  if (stream_) {
    if (Pa_IsStreamActive(stream_) == 1) {
      Pa_StopStream(stream_);
    }
    Pa_CloseStream(stream_);
    stream_ = nullptr;
  }

  if (initialized_) {
    Pa_Terminate();
    initialized_ = false;
  }
}

bool AudioInput::is_running() const
{
  return running_.load();
}

int AudioInput::selected_device_index() const
{
  return selected_device_index_;
}

string AudioInput::selected_device_name() const
{
  return selected_device_name_;
}

uint32_t AudioInput::sample_rate() const
{
  return sample_rate_;
}

string AudioInput::last_error() const
{
  return last_error_;
}

int AudioInput::pa_callback(const void* input,
                            void* /*output*/,
                            unsigned long frameCount,
                            const PaStreamCallbackTimeInfo* /*timeInfo*/,
                            PaStreamCallbackFlags /*statusFlags*/,
                            void* userData)
{
  auto* self = static_cast<AudioInput*>(userData);
  if (!self || !self->running_) return paContinue;

  const size_t n = static_cast<size_t>(frameCount);
  self->frame_buf_.resize(n);
  if (!input) {
    fill(self->frame_buf_.begin(), self->frame_buf_.end(), 0.0F);
  } else {
    const float* in = static_cast<const float*>(input);
    copy(in, in + n, self->frame_buf_.begin());
  }

  AudioInput::FrameCallback cb;
  {
    lock_guard<mutex> lock(self->cb_mutex_);
    cb = self->callback_;
  }
  if (cb) {
    cb(self->frame_buf_, self->sample_rate_);
  }

  return paContinue;
}

}  // namespace dictation_cpp
