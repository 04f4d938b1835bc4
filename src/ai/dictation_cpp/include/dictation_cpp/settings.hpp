#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "dictation_cpp/state_machine.hpp"

namespace dictation_cpp
{

enum class EngineKind
{
  WHISPER_CPP,
  FASTER_WHISPER,
  STUB
};

enum class ModelProfile
{
  FAST,
  BALANCED
};

enum class BackendPreference
{
  AUTO,
  CPU,
  CUDA
};

enum class ComputeType
{
  AUTO,
  INT8,
  FLOAT16,
  FLOAT32
};

enum class HardwareTier
{
  LOW,
  MID,
  HIGH
};

/// 셸(설정 화면)에서 전달되는 설정 스냅샷. 코어는 읽기 전용으로 취급한다
struct DictationSettings
{
  std::string hotkey = "CtrlOrCmd+Shift+U";
  DictationMode mode = DictationMode::PUSH_TO_TOGGLE;
  std::string language = "en";
  ModelProfile model_profile = ModelProfile::BALANCED;
  EngineKind engine = EngineKind::WHISPER_CPP;
  std::string model_path;          // 비어 있으면 프로파일 기본 모델
  std::string microphone_id;       // 비어 있으면 기본 입력 장치
  int mic_sensitivity_percent = 170;
  int chunk_duration_ms = 0;       // 0 = 프로파일 기본값
  int partial_cadence_ms = 0;      // 0 = 프로파일 기본값
  BackendPreference backend_preference = BackendPreference::AUTO;
  std::string faster_whisper_model;
  ComputeType compute_type = ComputeType::AUTO;
  int beam_size = 1;
  bool clipboard_fallback = true;

  std::string resource_dir;
  int worker_timeout_ms = 30000;
  int worker_max_restarts = 1;
  int backlog_multiple = 5;
};

struct ProfileTuning
{
  size_t min_chunk_samples = 2048;
  int64_t partial_cadence_ms = 400;
};

ProfileTuning tuning_for_profile(ModelProfile profile);
/// 설정의 chunk/cadence override를 반영한 튜닝 값
ProfileTuning effective_tuning(const DictationSettings & settings);

HardwareTier detect_hardware_tier(unsigned int logical_cores);
ModelProfile recommended_profile_for_tier(HardwareTier tier);
int recommended_threads(ModelProfile profile, unsigned int logical_cores);

std::string default_model_relative_path(ModelProfile profile);
std::string default_faster_whisper_model(ModelProfile profile);
std::vector<std::string> resolve_model_candidates(const DictationSettings & settings);
std::string resolve_model_path(const DictationSettings & settings);

std::string to_string(EngineKind kind);
std::string to_string(ModelProfile profile);
std::string to_string(BackendPreference preference);
std::string to_string(ComputeType type);
std::string to_string(HardwareTier tier);
bool parse_engine_kind(const std::string & text, EngineKind & out);
bool parse_model_profile(const std::string & text, ModelProfile & out);
bool parse_backend_preference(const std::string & text, BackendPreference & out);
bool parse_compute_type(const std::string & text, ComputeType & out);

}  // namespace dictation_cpp
