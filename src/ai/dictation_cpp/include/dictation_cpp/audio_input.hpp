#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include <portaudio.h>

namespace dictation_cpp {

/// PortAudio mono float32 캡처. 장치 기본 샘플레이트로 열고 리샘플은 파이프라인이 담당
class AudioInput {
public:
  using Frame = std::vector<float>;
  using FrameCallback = std::function<void(const Frame& frame, uint32_t sample_rate)>;

  AudioInput();
  ~AudioInput();

  /// microphone_id: 비어 있으면 기본 장치, 숫자면 장치 인덱스, 그 외는 장치 이름 키워드
  bool configure(const std::string & microphone_id, int frame_length);

  bool start();
  void stop();
  bool is_running() const;
  int selected_device_index() const;
  std::string selected_device_name() const;
  uint32_t sample_rate() const;
  std::string last_error() const;

  void set_callback(FrameCallback cb);

private:
  static int pa_callback(const void* input,
                         void* output,
                         unsigned long frameCount,
                         const PaStreamCallbackTimeInfo* timeInfo,
                         PaStreamCallbackFlags statusFlags,
                         void* userData);

  bool supports_mono_float_(int device_index, double sample_rate) const;
  int  resolve_device_index_() const;

private:
  std::string microphone_id_;
  int frame_length_;
  int selected_device_index_;
  std::string selected_device_name_;
  uint32_t sample_rate_;
  std::string last_error_;

  std::atomic<bool> running_;
  std::atomic<bool> initialized_;

  PaStream* stream_;

  std::mutex cb_mutex_;
  FrameCallback callback_;

  Frame frame_buf_;
};

}  // namespace dictation_cpp
