#include "dictation_cpp/settings.hpp"

#include <dictation_common/string_utils.hpp>

#include <algorithm>
#include <filesystem>
#include <set>

using namespace std;


namespace dictation_cpp
{

namespace
{

void push_unique(vector<string> & out, set<string> & seen, const string & path)
{
  if (!path.empty() && seen.insert(path).second) {
    out.push_back(path);
  }
}

}  // namespace

ProfileTuning tuning_for_profile(ModelProfile profile)
{
  ProfileTuning tuning;
  if (profile == ModelProfile::FAST) {
    tuning.min_chunk_samples = 1024;
    tuning.partial_cadence_ms = 250;
  } else {
    tuning.min_chunk_samples = 2048;
    tuning.partial_cadence_ms = 400;
  }
  return tuning;
}

ProfileTuning effective_tuning(const DictationSettings & settings)
{
  ProfileTuning tuning = tuning_for_profile(settings.model_profile);
  if (settings.chunk_duration_ms > 0) {
    // 16 kHz 기준 1ms = 16 샘플
    tuning.min_chunk_samples = static_cast<size_t>(settings.chunk_duration_ms) * 16U;
  }
  if (settings.partial_cadence_ms > 0) {
    tuning.partial_cadence_ms = settings.partial_cadence_ms;
  }
  return tuning;
}

HardwareTier detect_hardware_tier(unsigned int logical_cores)
{
  if (logical_cores <= 4) {
    return HardwareTier::LOW;
  }
  if (logical_cores <= 8) {
    return HardwareTier::MID;
  }
  return HardwareTier::HIGH;
}

ModelProfile recommended_profile_for_tier(HardwareTier tier)
{
  return tier == HardwareTier::LOW ? ModelProfile::FAST : ModelProfile::BALANCED;
}

int recommended_threads(ModelProfile profile, unsigned int logical_cores)
{
  const int logical = logical_cores == 0 ? 4 : static_cast<int>(logical_cores);
  if (profile == ModelProfile::FAST) {
    return clamp(logical, 2, 6);
  }
  return clamp(logical, 4, 8);
}

string default_model_relative_path(ModelProfile profile)
{
  return profile == ModelProfile::FAST ?
         "models/ggml-tiny.en-q8_0.bin" : "models/ggml-base.en-q5_1.bin";
}

string default_faster_whisper_model(ModelProfile profile)
{
  return profile == ModelProfile::FAST ? "tiny.en" : "small.en";
}

/// 모델 파일 탐색 후보: 명시 경로 → resources 기준 상대 경로 → 프로파일 기본 경로
vector<string> resolve_model_candidates(const DictationSettings & settings)
{
  namespace fs = std::filesystem;
  const string default_relative = default_model_relative_path(settings.model_profile);
  const string default_file_name = fs::path(default_relative).filename().string();
  const fs::path resources(settings.resource_dir);

  vector<string> candidates;
  set<string> seen;

  if (!settings.model_path.empty()) {
    const fs::path override_path(settings.model_path);
    push_unique(candidates, seen, override_path.string());
    if (override_path.is_relative()) {
      push_unique(candidates, seen, (fs::path("resources") / override_path).string());
      if (!settings.resource_dir.empty()) {
        push_unique(candidates, seen, (resources / override_path).string());
        push_unique(candidates, seen, (resources / "resources" / override_path).string());
      }
    }
  }

  push_unique(candidates, seen, default_relative);
  push_unique(candidates, seen, (fs::path("resources") / default_relative).string());

  if (!settings.resource_dir.empty()) {
    push_unique(candidates, seen, (resources / default_relative).string());
    push_unique(candidates, seen, (resources / "resources" / default_relative).string());
    push_unique(candidates, seen, (resources / "models" / default_file_name).string());
    push_unique(candidates, seen, (resources / default_file_name).string());
  }
  return candidates;
}

string resolve_model_path(const DictationSettings & settings)
{
  const vector<string> candidates = resolve_model_candidates(settings);
  error_code ec;
  for (const auto & candidate : candidates) {
    if (std::filesystem::exists(candidate, ec)) {
      return candidate;
    }
  }
  return candidates.empty() ? default_model_relative_path(settings.model_profile) :
         candidates.front();
}

string to_string(EngineKind kind)
{
  switch (kind) {
    case EngineKind::WHISPER_CPP:
      return "whisper_cpp";
    case EngineKind::FASTER_WHISPER:
      return "faster_whisper";
    case EngineKind::STUB:
      return "stub";
    default:
      return "unknown";
  }
}

string to_string(ModelProfile profile)
{
  return profile == ModelProfile::FAST ? "fast" : "balanced";
}

string to_string(BackendPreference preference)
{
  switch (preference) {
    case BackendPreference::CPU:
      return "cpu";
    case BackendPreference::CUDA:
      return "cuda";
    default:
      return "auto";
  }
}

string to_string(ComputeType type)
{
  switch (type) {
    case ComputeType::INT8:
      return "int8";
    case ComputeType::FLOAT16:
      return "float16";
    case ComputeType::FLOAT32:
      return "float32";
    default:
      return "auto";
  }
}

string to_string(HardwareTier tier)
{
  switch (tier) {
    case HardwareTier::LOW:
      return "low";
    case HardwareTier::MID:
      return "mid";
    default:
      return "high";
  }
}

bool parse_engine_kind(const string & text, EngineKind & out)
{
  const string value = dictation_common::to_lower(dictation_common::trim(text));
  if (value == "whisper_cpp" || value == "whisper") {
    out = EngineKind::WHISPER_CPP;
  } else if (value == "faster_whisper") {
    out = EngineKind::FASTER_WHISPER;
  } else if (value == "stub") {
    out = EngineKind::STUB;
  } else {
    return false;
  }
  return true;
}

bool parse_model_profile(const string & text, ModelProfile & out)
{
  const string value = dictation_common::to_lower(dictation_common::trim(text));
  if (value == "fast") {
    out = ModelProfile::FAST;
  } else if (value == "balanced") {
    out = ModelProfile::BALANCED;
  } else {
    return false;
  }
  return true;
}

/// "gpu", "nvidia"는 cuda의 별칭
bool parse_backend_preference(const string & text, BackendPreference & out)
{
  const string value = dictation_common::to_lower(dictation_common::trim(text));
  if (value == "auto") {
    out = BackendPreference::AUTO;
  } else if (value == "cpu") {
    out = BackendPreference::CPU;
  } else if (value == "cuda" || value == "gpu" || value == "nvidia") {
    out = BackendPreference::CUDA;
  } else {
    return false;
  }
  return true;
}

bool parse_compute_type(const string & text, ComputeType & out)
{
  const string value = dictation_common::to_lower(dictation_common::trim(text));
  if (value == "auto") {
    out = ComputeType::AUTO;
  } else if (value == "int8") {
    out = ComputeType::INT8;
  } else if (value == "float16") {
    out = ComputeType::FLOAT16;
  } else if (value == "float32") {
    out = ComputeType::FLOAT32;
  } else {
    return false;
  }
  return true;
}

}  // namespace dictation_cpp
