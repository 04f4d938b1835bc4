#pragma once

#include <memory>
#include <string>
#include <vector>

#include "dictation_cpp/settings.hpp"
#include "dictation_cpp/transcription_engine.hpp"

namespace dictation_cpp
{

constexpr const char * kWhisperBinaryEnv = "DICTATION_WHISPER_BIN";
constexpr const char * kFasterWhisperBinaryEnv = "DICTATION_FASTER_WHISPER_BIN";
constexpr const char * kBackendEnv = "DICTATION_WHISPER_BACKEND";
constexpr const char * kWorkerModelCacheEnv = "DICTATION_WORKER_MODEL_CACHE";
constexpr const char * kSidecarMetadataFile = "whisper-sidecar.json";

/// 엔진 런타임 생성 입력 (불변 스냅샷)
struct EngineSpec
{
  EngineKind engine = EngineKind::WHISPER_CPP;
  std::string language = "en";
  ModelProfile model_profile = ModelProfile::BALANCED;
  std::string model_path;
  BackendPreference backend_preference = BackendPreference::AUTO;
  std::string faster_whisper_model;
  ComputeType compute_type = ComputeType::AUTO;
  int beam_size = 1;
  std::string resource_dir;
  int request_timeout_ms = 30000;
  int max_restarts = 1;
};

struct EngineDiagnostics
{
  bool ready = false;
  std::string active_engine;
  std::string description;
  std::string compute_backend;
  bool using_gpu = false;
  std::string resolved_binary_path;
  std::vector<std::string> checked_binary_paths;
  std::string resolved_model_path;
  bool model_exists = false;
  std::string fallback_reason;
};

struct EngineRuntime
{
  std::shared_ptr<TranscriptionEngine> engine;
  EngineDiagnostics diagnostics;
};

/// 준비되지 않은 런타임의 자리표시 엔진. 모든 호출이 ENGINE_NOT_READY로 실패
class UnavailableEngine : public TranscriptionEngine
{
public:
  UnavailableEngine(std::string engine, std::string reason);

  RecognitionResult recognize(const SpeechSegment & segment, const CancelToken & cancel) override;
  void cancel() override {}
  std::string engine_label() const override { return "unavailable"; }
  std::string model_label() const override { return "unknown"; }
  bool available() const override { return false; }
  std::string unavailable_reason() const override { return reason_; }

private:
  std::string engine_;
  std::string reason_;
};

EngineSpec make_engine_spec(const DictationSettings & settings);
/// 두 스펙이 같은 런타임을 만드는지 (다르면 재구성 필요)
bool same_engine_spec(const EngineSpec & a, const EngineSpec & b);
EngineRuntime build_engine_runtime(const EngineSpec & spec);

std::vector<std::string> resolve_whisper_binary_candidates(const std::string & resource_dir);
std::vector<std::string> resolve_faster_whisper_binary_candidates(
  const std::string & resource_dir);
/// 존재하는 첫 후보. 디렉토리 없는 실행 파일 이름은 PATH 탐색에 맡기고 그대로 채택
std::string resolve_binary_path(const std::vector<std::string> & candidates);

bool parse_backend_env(const char * value, BackendPreference & out);
bool read_sidecar_backend(const std::string & binary_path, BackendPreference & out);
bool has_nvidia_gpu();
std::string resolve_compute_type(const std::string & device, ComputeType preference);
std::string resolve_model_cache_dir(const std::string & resource_dir);
bool is_known_faster_whisper_model_name(const std::string & name);
bool is_resolvable_faster_whisper_model(const std::string & model);
int clamp_beam_size(int beam_size);

}  // namespace dictation_cpp
