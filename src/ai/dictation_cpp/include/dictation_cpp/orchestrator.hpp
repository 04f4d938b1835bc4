#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "dictation_cpp/engine_runtime.hpp"
#include "dictation_cpp/insertion.hpp"
#include "dictation_cpp/segmenter.hpp"
#include "dictation_cpp/settings.hpp"
#include "dictation_cpp/state_machine.hpp"

namespace dictation_cpp
{

struct PipelineStatus
{
  DictationState state = DictationState::IDLE;
  DictationMode mode = DictationMode::PUSH_TO_TOGGLE;
  ModelProfile profile = ModelProfile::BALANCED;
  ProfileTuning tuning;
  SegmenterConfig segmenter;
  std::string engine;
  bool engine_ready = false;
  std::string last_error;
  ErrorKind last_error_kind = ErrorKind::NONE;
};

/// 청크 하나의 단계별 소요 시간 (프로파일링 활성 시에만 생성)
struct ChunkProfile
{
  uint64_t sequence_id = 0;
  double queue_ms = 0.0;
  double resample_ms = 0.0;
  double vad_ms = 0.0;
  double inference_ms = 0.0;
  double emit_ms = 0.0;
  size_t samples = 0;
  bool ok = false;
};

struct OrchestratorDiagnostics
{
  EngineDiagnostics engine;
  SessionEnvironment environment;
  std::string last_switch_error;
  size_t queue_depth = 0;
  uint64_t dropped_samples = 0;
  uint64_t silent_chunks = 0;
  uint64_t last_sequence_id = 0;
};

using RuntimeBuilder = std::function<EngineRuntime(const EngineSpec &)>;
using ProfileSink = std::function<void (const ChunkProfile &)>;

/// 받아쓰기 세션 조정자. 상태는 이 객체만 소유하고, 엔진 호출과 삽입은 상태 잠금 밖에서 수행
class Orchestrator
{
public:
  Orchestrator(
    const DictationSettings & settings,
    std::shared_ptr<InsertionAdapter> direct_adapter,
    std::shared_ptr<InsertionAdapter> clipboard_adapter,
    RuntimeBuilder runtime_builder = RuntimeBuilder());
  ~Orchestrator();

  Orchestrator(const Orchestrator &) = delete;
  Orchestrator & operator=(const Orchestrator &) = delete;

  PipelineStatus hotkey_down();
  PipelineStatus hotkey_up();
  PipelineStatus cancel();
  PipelineStatus set_mode(DictationMode mode);

  /// listening 상태에서만 처리. 세그먼트가 인식되어 삽입까지 끝나면 삽입한 텍스트를 반환
  std::optional<std::string> feed_audio(const std::vector<float> & samples, uint32_t sample_rate);

  /// 새 런타임을 잠금 밖에서 만든 뒤 준비된 경우에만 교체. 교체되면 true
  bool apply_settings(const DictationSettings & settings);

  PipelineStatus status() const;
  OrchestratorDiagnostics diagnostics() const;
  std::vector<InsertionRecord> recent_insertions() const;
  DictationSettings settings() const;

  void set_profile_sink(ProfileSink sink);
  void set_speech_detector(std::shared_ptr<SpeechDetector> detector);

private:
  PipelineStatus status_locked() const;
  void cancel_locked();
  /// 세대를 올리고 이전 세대의 인식 호출에 취소를 표시
  void next_generation_locked();
  void record_error_locked(const std::string & error, ErrorKind kind);

  RuntimeBuilder runtime_builder_;

  mutable std::mutex mutex_;
  DictationSettings settings_;
  EngineSpec engine_spec_;
  StateMachine machine_;
  Segmenter segmenter_;
  float gain_;
  uint64_t generation_;
  std::shared_ptr<CancelToken> cancel_token_;
  std::string last_transcript_;
  std::string last_error_;
  ErrorKind last_error_kind_;
  std::string last_switch_error_;
  std::shared_ptr<EngineRuntime> runtime_;
  ProfileSink profile_sink_;

  std::mutex recognition_mutex_;
  std::mutex apply_mutex_;
  std::atomic<size_t> pending_recognitions_;
  InsertionController insertion_;
};

}  // namespace dictation_cpp
