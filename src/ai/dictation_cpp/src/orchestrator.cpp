#include "dictation_cpp/orchestrator.hpp"

#include "dictation_cpp/audio_resample.hpp"
#include "dictation_cpp/postprocess.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

using namespace std;


namespace dictation_cpp
{

namespace
{

double elapsed_ms(SteadyClock::time_point from, SteadyClock::time_point to)
{
  return chrono::duration<double, milli>(to - from).count();
}

/// 생성 시점의 진단에 엔진의 현재 상태를 반영
EngineDiagnostics live_diagnostics(const EngineRuntime & runtime)
{
  EngineDiagnostics out = runtime.diagnostics;
  if (out.ready && !runtime.engine->available()) {
    out.ready = false;
    out.fallback_reason = runtime.engine->unavailable_reason();
  }
  return out;
}

}  // namespace

Orchestrator::Orchestrator(
  const DictationSettings & settings,
  shared_ptr<InsertionAdapter> direct_adapter,
  shared_ptr<InsertionAdapter> clipboard_adapter,
  RuntimeBuilder runtime_builder)
: runtime_builder_(runtime_builder ? move(runtime_builder) : RuntimeBuilder(build_engine_runtime)),
  settings_(settings),
  engine_spec_(make_engine_spec(settings)),
  machine_(settings.mode),
  segmenter_(make_segmenter_config(settings), make_shared<RmsSpeechDetector>()),
  gain_(mic_sensitivity_gain(settings.mic_sensitivity_percent)),
  generation_(0),
  cancel_token_(make_shared<CancelToken>()),
  last_error_kind_(ErrorKind::NONE),
  pending_recognitions_(0),
  insertion_(move(direct_adapter), move(clipboard_adapter), settings.clipboard_fallback)
{
  runtime_ = make_shared<EngineRuntime>(runtime_builder_(engine_spec_));
  if (!runtime_->diagnostics.ready) {
    cerr << "[dictation_cpp] engine not ready: " << runtime_->diagnostics.description << endl;
  }
}

Orchestrator::~Orchestrator()
{
  shared_ptr<EngineRuntime> runtime;
  {
    lock_guard<mutex> lock(mutex_);
    next_generation_locked();
    runtime = runtime_;
  }
  if (runtime && runtime->engine) {
    runtime->engine->cancel();
  }
  // 진행 중인 인식/삽입이 끝날 때까지 대기
  lock_guard<mutex> recognition(recognition_mutex_);
}

PipelineStatus Orchestrator::hotkey_down()
{
  lock_guard<mutex> lock(mutex_);
  const DictationState before = machine_.state();
  const DictationState after = machine_.apply(DictationEvent::HOTKEY_DOWN);
  if (before == DictationState::IDLE && after == DictationState::LISTENING) {
    // 새 세션: 이전 세션의 오디오와 중복 판정 기준을 비운다
    segmenter_.reset();
    last_transcript_.clear();
    last_error_.clear();
    last_error_kind_ = ErrorKind::NONE;
  } else if (before == DictationState::LISTENING && after == DictationState::IDLE) {
    segmenter_.reset();
  }
  return status_locked();
}

PipelineStatus Orchestrator::hotkey_up()
{
  lock_guard<mutex> lock(mutex_);
  const DictationState before = machine_.state();
  const DictationState after = machine_.apply(DictationEvent::HOTKEY_UP);
  if (before == DictationState::LISTENING && after == DictationState::IDLE) {
    segmenter_.reset();
  }
  return status_locked();
}

PipelineStatus Orchestrator::cancel()
{
  shared_ptr<EngineRuntime> runtime;
  PipelineStatus out;
  {
    lock_guard<mutex> lock(mutex_);
    const bool in_flight = machine_.state() == DictationState::TRANSCRIBING;
    cancel_locked();
    if (in_flight || pending_recognitions_.load() > 0) {
      runtime = runtime_;
    }
    out = status_locked();
  }
  // 토큰은 이미 켜졌고, 여기서는 응답을 기다리는 엔진을 깨우기만 한다 (상태 잠금 밖)
  if (runtime && runtime->engine) {
    runtime->engine->cancel();
  }
  return out;
}

PipelineStatus Orchestrator::set_mode(DictationMode mode)
{
  lock_guard<mutex> lock(mutex_);
  next_generation_locked();
  settings_.mode = mode;
  machine_.set_mode(mode);
  segmenter_.reset();
  return status_locked();
}

optional<string> Orchestrator::feed_audio(const vector<float> & samples, uint32_t sample_rate)
{
  const auto received_at = SteadyClock::now();

  unique_lock<mutex> lock(mutex_);
  if (machine_.state() != DictationState::LISTENING) {
    return nullopt;
  }
  if (sample_rate < kTargetSampleRate) {
    record_error_locked(
      "unsupported input sample rate " + std::to_string(sample_rate) + " Hz",
      ErrorKind::INPUT_RATE_UNSUPPORTED);
    return nullopt;
  }

  vector<float> resampled = downsample_to_16k(samples, sample_rate);
  apply_gain(resampled, gain_);
  const auto resampled_at = SteadyClock::now();

  optional<SpeechSegment> segment = segmenter_.push(resampled, resampled_at);
  const auto segmented_at = SteadyClock::now();
  if (!segment) {
    return nullopt;
  }

  machine_.apply(DictationEvent::SPEECH_SEGMENT_READY);
  const uint64_t generation = generation_;
  const shared_ptr<CancelToken> cancel_token = cancel_token_;
  shared_ptr<EngineRuntime> runtime = runtime_;
  const bool profiling = static_cast<bool>(profile_sink_);
  lock.unlock();

  ChunkProfile profile;
  profile.sequence_id = segment->sequence_id;
  profile.samples = segment->samples.size();
  profile.resample_ms = elapsed_ms(received_at, resampled_at);
  profile.vad_ms = elapsed_ms(resampled_at, segmented_at);

  // 세그먼트 N+1은 N의 인식과 삽입이 끝난 뒤에 처리
  ++pending_recognitions_;
  lock_guard<mutex> recognition(recognition_mutex_);
  const auto recognition_started = SteadyClock::now();
  profile.queue_ms = elapsed_ms(segmented_at, recognition_started);

  RecognitionResult result;
  bool stale = false;
  {
    lock_guard<mutex> state_lock(mutex_);
    stale = generation != generation_;
  }
  if (!stale) {
    // 확인 직후 들어온 취소도 토큰에 남아 있으므로 엔진이 시작 전에 거른다
    result = runtime->engine->recognize(*segment, *cancel_token);
  }
  const auto recognized_at = SteadyClock::now();
  profile.inference_ms = elapsed_ms(recognition_started, recognized_at);
  --pending_recognitions_;

  lock.lock();
  if (stale || generation != generation_) {
    // 취소된 세션의 늦은 결과는 버린다
    return nullopt;
  }
  if (!result.ok) {
    record_error_locked(result.error, result.error_kind);
    cancel_locked();
    if (profiling) {
      const ProfileSink sink = profile_sink_;
      lock.unlock();
      if (sink) {
        sink(profile);
      }
    }
    return nullopt;
  }

  const string normalized = normalize_transcript(result.text);
  machine_.apply(DictationEvent::TRANSCRIPTION_COMPLETE);
  if (is_duplicate_transcript(last_transcript_, normalized)) {
    machine_.apply(DictationEvent::INSERTION_COMPLETE);
    return nullopt;
  }
  last_transcript_ = normalized;
  lock.unlock();

  const InsertionRecord record = insertion_.insert(normalized);
  const auto inserted_at = SteadyClock::now();
  profile.emit_ms = elapsed_ms(recognized_at, inserted_at);
  profile.ok = true;

  lock.lock();
  if (record.status == InsertionStatus::FAILURE) {
    record_error_locked(record.error, ErrorKind::INSERTION_FAILED);
  }
  if (generation == generation_) {
    machine_.apply(DictationEvent::INSERTION_COMPLETE);
  }
  const ProfileSink sink = profiling ? profile_sink_ : ProfileSink();
  lock.unlock();

  if (sink) {
    sink(profile);
  }
  return normalized;
}

bool Orchestrator::apply_settings(const DictationSettings & settings)
{
  lock_guard<mutex> apply_lock(apply_mutex_);
  const EngineSpec spec = make_engine_spec(settings);

  bool rebuild = false;
  shared_ptr<EngineRuntime> current;
  {
    lock_guard<mutex> lock(mutex_);
    rebuild = !same_engine_spec(spec, engine_spec_);
    current = runtime_;
  }
  // 같은 설정이어도 생성 후 죽은 엔진(재시작 한도 소진 워커)은 새로 만든다
  const bool current_ready = live_diagnostics(*current).ready;
  rebuild = rebuild || !current_ready;

  // 런타임 생성(워커 기동/프리로드)은 오래 걸릴 수 있으므로 상태 잠금 밖에서
  shared_ptr<EngineRuntime> candidate;
  if (rebuild) {
    candidate = make_shared<EngineRuntime>(runtime_builder_(spec));
  }

  shared_ptr<EngineRuntime> retired;
  bool swapped = false;
  {
    lock_guard<mutex> lock(mutex_);
    if (settings.mode != settings_.mode) {
      next_generation_locked();
      machine_.set_mode(settings.mode);
      segmenter_.reset();
    }
    settings_ = settings;
    segmenter_.set_config(make_segmenter_config(settings));
    gain_ = mic_sensitivity_gain(settings.mic_sensitivity_percent);
    insertion_.set_fallback_enabled(settings.clipboard_fallback);

    if (candidate) {
      if (candidate->diagnostics.ready || !current_ready) {
        retired = move(runtime_);
        runtime_ = candidate;
        engine_spec_ = spec;
        swapped = true;
        last_switch_error_ = candidate->diagnostics.ready ? "" :
          candidate->diagnostics.fallback_reason;
      } else {
        last_switch_error_ = candidate->diagnostics.fallback_reason.empty() ?
          candidate->diagnostics.description : candidate->diagnostics.fallback_reason;
        cerr << "[dictation_cpp] engine switch failed, keeping previous engine: " <<
          last_switch_error_ << endl;
      }
    }
  }
  // retired/candidate는 여기서(잠금 밖) 해제. 진행 중인 호출이 들고 있으면 그 호출이 끝날 때 해제
  return swapped;
}

PipelineStatus Orchestrator::status() const
{
  lock_guard<mutex> lock(mutex_);
  return status_locked();
}

OrchestratorDiagnostics Orchestrator::diagnostics() const
{
  shared_ptr<EngineRuntime> runtime;
  OrchestratorDiagnostics out;
  {
    lock_guard<mutex> lock(mutex_);
    runtime = runtime_;
    out.last_switch_error = last_switch_error_;
    out.dropped_samples = segmenter_.dropped_samples();
    out.silent_chunks = segmenter_.silent_chunks();
    out.last_sequence_id = segmenter_.last_sequence_id();
  }
  out.engine = live_diagnostics(*runtime);
  out.environment = detect_session_environment();
  // 워커 엔진은 자체 대기열을 세므로 둘 중 큰 값
  out.queue_depth = max(pending_recognitions_.load(), runtime->engine->queue_depth());
  return out;
}

vector<InsertionRecord> Orchestrator::recent_insertions() const
{
  return insertion_.recent();
}

DictationSettings Orchestrator::settings() const
{
  lock_guard<mutex> lock(mutex_);
  return settings_;
}

void Orchestrator::set_profile_sink(ProfileSink sink)
{
  lock_guard<mutex> lock(mutex_);
  profile_sink_ = move(sink);
}

void Orchestrator::set_speech_detector(shared_ptr<SpeechDetector> detector)
{
  lock_guard<mutex> lock(mutex_);
  segmenter_.set_detector(move(detector));
}

PipelineStatus Orchestrator::status_locked() const
{
  PipelineStatus out;
  out.state = machine_.state();
  out.mode = machine_.mode();
  out.profile = settings_.model_profile;
  out.tuning = effective_tuning(settings_);
  out.segmenter = segmenter_.config();
  out.engine = runtime_->diagnostics.active_engine;
  out.engine_ready = runtime_->diagnostics.ready && runtime_->engine->available();
  out.last_error = last_error_;
  out.last_error_kind = last_error_kind_;
  return out;
}

void Orchestrator::cancel_locked()
{
  next_generation_locked();
  machine_.apply(DictationEvent::CANCEL);
  segmenter_.reset();
}

void Orchestrator::next_generation_locked()
{
  ++generation_;
  cancel_token_->request();
  cancel_token_ = make_shared<CancelToken>();
}

void Orchestrator::record_error_locked(const string & error, ErrorKind kind)
{
  last_error_ = error;
  last_error_kind_ = kind;
  cerr << "[dictation_cpp] " << to_string(kind) << ": " << error << endl;
}

}  // namespace dictation_cpp
