#include "dictation_cpp/engine_runtime.hpp"

#include <dictation_common/json_utils.hpp>
#include <dictation_common/shell_utils.hpp>
#include <dictation_common/string_utils.hpp>

#include "dictation_cpp/subprocess_engine.hpp"
#include "dictation_cpp/worker_engine.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <set>
#include <thread>
#include <utility>

using namespace std;
namespace fs = std::filesystem;


namespace dictation_cpp
{

namespace
{

constexpr const char * kWhisperBinaryName = "whisper-cli";
constexpr const char * kFasterWhisperBinaryName = "faster-whisper-worker";

vector<string> binary_candidates(
  const char * env_name, const string & binary_name, const string & resource_dir)
{
  vector<string> candidates;
  const char * override_path = getenv(env_name);
  if (override_path != nullptr) {
    const string normalized = dictation_common::trim(override_path);
    if (!normalized.empty()) {
      candidates.push_back(normalized);
    }
  }

  candidates.push_back((fs::path("resources") / "bin" / binary_name).string());
  if (!resource_dir.empty()) {
    const fs::path resources(resource_dir);
    candidates.push_back((resources / "bin" / binary_name).string());
    candidates.push_back((resources / "resources" / "bin" / binary_name).string());
    candidates.push_back((resources / binary_name).string());
  }
  candidates.push_back(binary_name);

  vector<string> unique;
  set<string> seen;
  for (const auto & candidate : candidates) {
    if (seen.insert(candidate).second) {
      unique.push_back(candidate);
    }
  }
  return unique;
}

/// 환경 변수 → 사용자 선호 순. 반환값이 AUTO면 호출 측에서 자동 감지
BackendPreference effective_preference(BackendPreference preference)
{
  BackendPreference from_env = BackendPreference::AUTO;
  if (parse_backend_env(getenv(kBackendEnv), from_env)) {
    return from_env;
  }
  return preference;
}

/// cuda 요청인데 GPU가 없으면 cpu로 내리고 사유를 남긴다
bool resolve_use_gpu(
  BackendPreference preference, const string & binary_path, string & fallback_reason)
{
  const BackendPreference effective = effective_preference(preference);
  if (effective == BackendPreference::CPU) {
    return false;
  }
  if (effective == BackendPreference::CUDA) {
    if (has_nvidia_gpu()) {
      return true;
    }
    fallback_reason = "cuda requested but no nvidia gpu detected, using cpu";
    return false;
  }

  BackendPreference from_metadata = BackendPreference::AUTO;
  if (!binary_path.empty() && read_sidecar_backend(binary_path, from_metadata)) {
    return from_metadata == BackendPreference::CUDA;
  }
  return has_nvidia_gpu();
}

EngineRuntime unavailable_runtime(EngineDiagnostics diagnostics, const string & reason)
{
  EngineRuntime runtime;
  diagnostics.ready = false;
  diagnostics.description = "unavailable: " + reason;
  if (diagnostics.fallback_reason.empty()) {
    diagnostics.fallback_reason = reason;
  }
  runtime.engine = make_shared<UnavailableEngine>(diagnostics.active_engine, reason);
  runtime.diagnostics = diagnostics;
  return runtime;
}

EngineRuntime build_stub_runtime()
{
  EngineRuntime runtime;
  runtime.engine = make_shared<StubEngine>();
  runtime.diagnostics.ready = true;
  runtime.diagnostics.active_engine = "stub";
  runtime.diagnostics.description = "stub";
  runtime.diagnostics.compute_backend = "stub";
  runtime.diagnostics.resolved_model_path = "stub";
  runtime.diagnostics.model_exists = true;
  return runtime;
}

EngineRuntime build_whisper_runtime(const EngineSpec & spec)
{
  EngineDiagnostics diagnostics;
  diagnostics.active_engine = "whisper_cpp";
  diagnostics.resolved_model_path = spec.model_path;
  error_code ec;
  diagnostics.model_exists = !spec.model_path.empty() && fs::exists(spec.model_path, ec);
  diagnostics.checked_binary_paths = resolve_whisper_binary_candidates(spec.resource_dir);
  diagnostics.resolved_binary_path = resolve_binary_path(diagnostics.checked_binary_paths);

  if (!diagnostics.model_exists) {
    diagnostics.compute_backend = "unavailable";
    return unavailable_runtime(diagnostics, "model file not found: " + spec.model_path);
  }
  if (diagnostics.resolved_binary_path.empty()) {
    diagnostics.compute_backend = "unavailable";
    return unavailable_runtime(diagnostics, "whisper sidecar binary not found");
  }

  SubprocessEngineConfig config;
  config.binary_path = diagnostics.resolved_binary_path;
  config.model_path = spec.model_path;
  config.language = spec.language;
  config.threads = recommended_threads(spec.model_profile, thread::hardware_concurrency());
  config.use_gpu = resolve_use_gpu(
    spec.backend_preference, config.binary_path, diagnostics.fallback_reason);
  config.timeout = chrono::milliseconds(max(spec.request_timeout_ms, 1000));

  diagnostics.ready = true;
  diagnostics.using_gpu = config.use_gpu;
  diagnostics.compute_backend = config.use_gpu ? "cuda" : "cpu";
  diagnostics.description = "whisper sidecar (" + config.binary_path + ", backend " +
    diagnostics.compute_backend + ")";

  EngineRuntime runtime;
  runtime.engine = make_shared<SubprocessEngine>(config);
  runtime.diagnostics = diagnostics;
  return runtime;
}

EngineRuntime build_faster_whisper_runtime(const EngineSpec & spec)
{
  EngineDiagnostics diagnostics;
  diagnostics.active_engine = "faster_whisper";
  const string model = dictation_common::trim(spec.faster_whisper_model).empty() ?
    default_faster_whisper_model(spec.model_profile) :
    dictation_common::trim(spec.faster_whisper_model);
  diagnostics.resolved_model_path = model;
  diagnostics.model_exists = is_resolvable_faster_whisper_model(model);
  diagnostics.checked_binary_paths = resolve_faster_whisper_binary_candidates(spec.resource_dir);
  diagnostics.resolved_binary_path = resolve_binary_path(diagnostics.checked_binary_paths);

  const bool use_gpu = resolve_use_gpu(spec.backend_preference, "", diagnostics.fallback_reason);
  const string device = use_gpu ? "cuda" : "cpu";
  diagnostics.compute_backend = device;

  if (!diagnostics.model_exists) {
    return unavailable_runtime(
      diagnostics, "faster-whisper model target not found: " + model);
  }
  if (diagnostics.resolved_binary_path.empty()) {
    return unavailable_runtime(diagnostics, "faster-whisper worker binary not found");
  }

  WorkerClientConfig config;
  config.launch.binary_path = diagnostics.resolved_binary_path;
  config.launch.env.emplace_back(kWorkerModelCacheEnv, resolve_model_cache_dir(spec.resource_dir));
  config.model.model = model;
  config.model.device = device;
  config.model.compute_type = resolve_compute_type(device, spec.compute_type);
  config.language = spec.language;
  config.beam_size = clamp_beam_size(spec.beam_size);
  config.request_timeout = chrono::milliseconds(max(spec.request_timeout_ms, 100));
  config.max_restarts = max(spec.max_restarts, 0);

  auto client = make_shared<WorkerClient>(config);
  if (!client->start()) {
    return unavailable_runtime(
      diagnostics, "failed to start faster-whisper worker: " + client->last_error());
  }
  // 모델 캐시 워밍. 실패하면 이 런타임은 준비되지 않은 것으로 본다
  const WorkerCallResult preload = client->preload();
  if (!preload.ok) {
    client->shutdown();
    return unavailable_runtime(diagnostics, "worker preload failed: " + preload.error);
  }
  cerr << "[dictation_cpp] faster-whisper worker ready (model " << model << ", device " <<
    device << ", load " << preload.load_ms << " ms)" << endl;

  diagnostics.ready = true;
  diagnostics.using_gpu = use_gpu;
  diagnostics.description = "faster-whisper worker (" + config.launch.binary_path +
    ", device " + device + ")";

  EngineRuntime runtime;
  runtime.engine = make_shared<WorkerEngine>(client);
  runtime.diagnostics = diagnostics;
  return runtime;
}

}  // namespace

UnavailableEngine::UnavailableEngine(string engine, string reason)
: engine_(move(engine)), reason_(move(reason))
{
}

RecognitionResult UnavailableEngine::recognize(const SpeechSegment &, const CancelToken &)
{
  RecognitionResult out;
  out.engine = engine_;
  out.error = reason_;
  out.error_kind = ErrorKind::ENGINE_NOT_READY;
  return out;
}

EngineSpec make_engine_spec(const DictationSettings & settings)
{
  EngineSpec spec;
  spec.engine = settings.engine;
  spec.language = settings.language;
  spec.model_profile = settings.model_profile;
  spec.model_path = resolve_model_path(settings);
  spec.backend_preference = settings.backend_preference;
  spec.faster_whisper_model = settings.faster_whisper_model;
  spec.compute_type = settings.compute_type;
  spec.beam_size = clamp_beam_size(settings.beam_size);
  spec.resource_dir = settings.resource_dir;
  spec.request_timeout_ms = settings.worker_timeout_ms;
  spec.max_restarts = settings.worker_max_restarts;
  return spec;
}

bool same_engine_spec(const EngineSpec & a, const EngineSpec & b)
{
  return a.engine == b.engine &&
         a.language == b.language &&
         a.model_profile == b.model_profile &&
         a.model_path == b.model_path &&
         a.backend_preference == b.backend_preference &&
         a.faster_whisper_model == b.faster_whisper_model &&
         a.compute_type == b.compute_type &&
         a.beam_size == b.beam_size &&
         a.resource_dir == b.resource_dir &&
         a.request_timeout_ms == b.request_timeout_ms &&
         a.max_restarts == b.max_restarts;
}

EngineRuntime build_engine_runtime(const EngineSpec & spec)
{
  switch (spec.engine) {
    case EngineKind::STUB:
      return build_stub_runtime();
    case EngineKind::FASTER_WHISPER:
      return build_faster_whisper_runtime(spec);
    case EngineKind::WHISPER_CPP:
    default:
      return build_whisper_runtime(spec);
  }
}

vector<string> resolve_whisper_binary_candidates(const string & resource_dir)
{
  return binary_candidates(kWhisperBinaryEnv, kWhisperBinaryName, resource_dir);
}

vector<string> resolve_faster_whisper_binary_candidates(const string & resource_dir)
{
  return binary_candidates(kFasterWhisperBinaryEnv, kFasterWhisperBinaryName, resource_dir);
}

string resolve_binary_path(const vector<string> & candidates)
{
  error_code ec;
  for (const auto & candidate : candidates) {
    if (!fs::path(candidate).has_parent_path()) {
      return candidate;
    }
    if (fs::exists(candidate, ec)) {
      return candidate;
    }
  }
  return "";
}

bool parse_backend_env(const char * value, BackendPreference & out)
{
  if (value == nullptr) {
    return false;
  }
  const string normalized = dictation_common::trim(value);
  if (normalized.empty()) {
    return false;
  }
  return parse_backend_preference(normalized, out);
}

/// 바이너리 옆 whisper-sidecar.json의 "backend" 값 (빌드 시 기록된 힌트)
bool read_sidecar_backend(const string & binary_path, BackendPreference & out)
{
  const fs::path metadata = fs::path(binary_path).parent_path() / kSidecarMetadataFile;
  ifstream file(metadata);
  if (!file) {
    return false;
  }
  const string raw((istreambuf_iterator<char>(file)), istreambuf_iterator<char>());
  string backend;
  if (!dictation_common::extract_json_string_field(raw, "backend", backend)) {
    return false;
  }
  BackendPreference parsed = BackendPreference::AUTO;
  if (!parse_backend_env(backend.c_str(), parsed)) {
    return false;
  }
  out = parsed == BackendPreference::CUDA ? BackendPreference::CUDA : BackendPreference::CPU;
  return true;
}

bool has_nvidia_gpu()
{
  if (!dictation_common::command_available("nvidia-smi")) {
    return false;
  }
  return dictation_common::run_shell_command("nvidia-smi -L >/dev/null 2>&1").ok;
}

string resolve_compute_type(const string & device, ComputeType preference)
{
  switch (preference) {
    case ComputeType::INT8:
      return "int8";
    case ComputeType::FLOAT16:
      return "float16";
    case ComputeType::FLOAT32:
      return "float32";
    case ComputeType::AUTO:
    default:
      return device == "cuda" ? "float16" : "int8";
  }
}

string resolve_model_cache_dir(const string & resource_dir)
{
  vector<fs::path> candidates;
  if (!resource_dir.empty()) {
    const fs::path resources(resource_dir);
    candidates.push_back(resources / "models" / "faster-whisper-cache");
    candidates.push_back(resources / "resources" / "models" / "faster-whisper-cache");
    candidates.push_back(resources / "faster-whisper-cache");
  }
  candidates.push_back(fs::path("resources") / "models" / "faster-whisper-cache");

  error_code ec;
  for (const auto & candidate : candidates) {
    if (fs::exists(candidate, ec)) {
      return candidate.string();
    }
  }

  fs::path cache_root;
  const char * xdg = getenv("XDG_CACHE_HOME");
  const char * home = getenv("HOME");
  if (xdg != nullptr && xdg[0] != '\0') {
    cache_root = xdg;
  } else if (home != nullptr && home[0] != '\0') {
    cache_root = fs::path(home) / ".cache";
  } else {
    cache_root = fs::temp_directory_path(ec);
  }
  return (cache_root / "dictation" / "faster-whisper-cache").string();
}

bool is_known_faster_whisper_model_name(const string & name)
{
  static const set<string> kKnown = {
    "tiny", "tiny.en", "base", "base.en", "small", "small.en",
    "medium", "medium.en", "large-v1", "large-v2", "large-v3",
    "distil-large-v2", "distil-large-v3", "distil-medium.en"
  };
  return kKnown.count(name) > 0;
}

/// 모델 이름(알려진 이름, Systran/ openai/ 허브 id) 또는 로컬 경로
bool is_resolvable_faster_whisper_model(const string & model)
{
  const string normalized = dictation_common::trim(model);
  if (normalized.empty()) {
    return false;
  }
  error_code ec;
  if (fs::exists(normalized, ec)) {
    return true;
  }
  return is_known_faster_whisper_model_name(normalized) ||
         normalized.rfind("Systran/", 0) == 0 ||
         normalized.rfind("openai/", 0) == 0;
}

int clamp_beam_size(int beam_size)
{
  return clamp(beam_size, 1, 8);
}

}  // namespace dictation_cpp
