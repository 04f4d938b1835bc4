#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

#include "dictation_cpp/engine_runtime.hpp"
#include "dictation_cpp/insertion.hpp"
#include "dictation_cpp/orchestrator.hpp"
#include "dictation_cpp/settings.hpp"
#include "test_helpers.hpp"

using namespace dictation_cpp;

namespace
{

/// 테스트 동안만 환경 변수를 바꾸고 원래 값으로 복원
class ScopedEnv
{
public:
  ScopedEnv(const char * name, const std::string & value)
  : name_(name)
  {
    const char * previous = std::getenv(name);
    had_previous_ = previous != nullptr;
    if (had_previous_) {
      previous_ = previous;
    }
    setenv(name, value.c_str(), 1);
  }

  ~ScopedEnv()
  {
    if (had_previous_) {
      setenv(name_.c_str(), previous_.c_str(), 1);
    } else {
      unsetenv(name_.c_str());
    }
  }

private:
  std::string name_;
  std::string previous_;
  bool had_previous_ = false;
};

SpeechSegment make_segment()
{
  SpeechSegment segment;
  segment.sequence_id = 1;
  segment.samples = test::speech_samples(8000);
  return segment;
}

std::string responding_worker(const test::TempDir & dir, bool preload_ok)
{
  std::string body = "while IFS= read -r line; do\n";
  body += test::kExtractId;
  body += "  case \"$line\" in\n";
  body += preload_ok ?
    "    *'\"op\":\"preload\"'*) printf '{\"id\":\"%s\",\"ok\":true,\"load_ms\":3}\\n' \"$id\" ;;\n" :
    "    *'\"op\":\"preload\"'*) printf '{\"id\":\"%s\",\"ok\":false,\"error\":\"no such model\"}\\n' \"$id\" ;;\n";
  body += "    *) printf '{\"id\":\"%s\",\"ok\":true,\"text\":\"hello from worker\",\"inference_ms\":7}\\n' \"$id\" ;;\n";
  body += "  esac\n";
  body += "done\n";
  return test::write_script(dir, "faster-whisper-worker", body);
}

/// preload에는 답하지만 transcribe에는 끝내 답하지 않는 워커
std::string preload_only_worker(const test::TempDir & dir)
{
  std::string body = "while IFS= read -r line; do\n";
  body += test::kExtractId;
  body += "  case \"$line\" in\n";
  body += "    *'\"op\":\"preload\"'*) printf '{\"id\":\"%s\",\"ok\":true,\"load_ms\":3}\\n' \"$id\" ;;\n";
  body += "    *) : ;;\n";
  body += "  esac\n";
  body += "done\n";
  return test::write_script(dir, "stalled-worker", body);
}

}  // namespace

TEST(SettingsTest, ProfileTuningAndOverrides)
{
  EXPECT_EQ(tuning_for_profile(ModelProfile::FAST).min_chunk_samples, 1024U);
  EXPECT_EQ(tuning_for_profile(ModelProfile::FAST).partial_cadence_ms, 250);
  EXPECT_EQ(tuning_for_profile(ModelProfile::BALANCED).min_chunk_samples, 2048U);
  EXPECT_EQ(tuning_for_profile(ModelProfile::BALANCED).partial_cadence_ms, 400);

  DictationSettings settings;
  settings.chunk_duration_ms = 250;
  settings.partial_cadence_ms = 900;
  const ProfileTuning tuning = effective_tuning(settings);
  EXPECT_EQ(tuning.min_chunk_samples, 4000U);
  EXPECT_EQ(tuning.partial_cadence_ms, 900);
}

TEST(SettingsTest, HardwareTierAndThreads)
{
  EXPECT_EQ(detect_hardware_tier(4), HardwareTier::LOW);
  EXPECT_EQ(detect_hardware_tier(8), HardwareTier::MID);
  EXPECT_EQ(detect_hardware_tier(16), HardwareTier::HIGH);
  EXPECT_EQ(recommended_profile_for_tier(HardwareTier::LOW), ModelProfile::FAST);
  EXPECT_EQ(recommended_profile_for_tier(HardwareTier::HIGH), ModelProfile::BALANCED);

  EXPECT_EQ(recommended_threads(ModelProfile::FAST, 1), 2);
  EXPECT_EQ(recommended_threads(ModelProfile::FAST, 32), 6);
  EXPECT_EQ(recommended_threads(ModelProfile::BALANCED, 2), 4);
  EXPECT_EQ(recommended_threads(ModelProfile::BALANCED, 32), 8);
  EXPECT_EQ(recommended_threads(ModelProfile::BALANCED, 0), 4);
}

TEST(SettingsTest, ParsesEnumsCaseInsensitively)
{
  EngineKind engine = EngineKind::STUB;
  EXPECT_TRUE(parse_engine_kind("Faster_Whisper", engine));
  EXPECT_EQ(engine, EngineKind::FASTER_WHISPER);
  BackendPreference backend = BackendPreference::AUTO;
  EXPECT_TRUE(parse_backend_preference("nvidia", backend));
  EXPECT_EQ(backend, BackendPreference::CUDA);
  EXPECT_FALSE(parse_backend_preference("metal", backend));
  ComputeType compute = ComputeType::AUTO;
  EXPECT_TRUE(parse_compute_type("float16", compute));
  EXPECT_EQ(compute, ComputeType::FLOAT16);
  ModelProfile profile = ModelProfile::BALANCED;
  EXPECT_FALSE(parse_model_profile("turbo", profile));
}

TEST(SettingsTest, ModelCandidatesPreferExplicitPathThenResources)
{
  DictationSettings settings;
  settings.model_profile = ModelProfile::FAST;
  settings.model_path = "custom.bin";
  settings.resource_dir = "/opt/dictation";
  const std::vector<std::string> candidates = resolve_model_candidates(settings);
  ASSERT_FALSE(candidates.empty());
  EXPECT_EQ(candidates.front(), "custom.bin");
  EXPECT_NE(
    std::find(candidates.begin(), candidates.end(), "/opt/dictation/models/ggml-tiny.en-q8_0.bin"),
    candidates.end());
}

TEST(SettingsTest, ResolvesExistingModelFile)
{
  test::TempDir dir;
  std::filesystem::create_directories(dir.path() / "models");
  const std::string model = (dir.path() / "models" / "ggml-base.en-q5_1.bin").string();
  std::ofstream(model) << "model";

  DictationSettings settings;
  settings.resource_dir = dir.path().string();
  EXPECT_EQ(resolve_model_path(settings), model);
}

TEST(EngineRuntimeTest, HelpersFollowNamingRules)
{
  EXPECT_EQ(clamp_beam_size(0), 1);
  EXPECT_EQ(clamp_beam_size(20), 8);
  EXPECT_EQ(resolve_compute_type("cuda", ComputeType::AUTO), "float16");
  EXPECT_EQ(resolve_compute_type("cpu", ComputeType::AUTO), "int8");
  EXPECT_EQ(resolve_compute_type("cpu", ComputeType::FLOAT32), "float32");
  EXPECT_TRUE(is_resolvable_faster_whisper_model("distil-large-v3"));
  EXPECT_TRUE(is_resolvable_faster_whisper_model("Systran/faster-whisper-small"));
  EXPECT_FALSE(is_resolvable_faster_whisper_model("gigantic-v9"));
  EXPECT_FALSE(is_resolvable_faster_whisper_model("  "));
}

TEST(EngineRuntimeTest, BinaryCandidatesHonorOverrideAndBareName)
{
  ScopedEnv env(kWhisperBinaryEnv, "/custom/whisper-cli");
  const std::vector<std::string> candidates = resolve_whisper_binary_candidates("/opt/res");
  ASSERT_GE(candidates.size(), 2U);
  EXPECT_EQ(candidates.front(), "/custom/whisper-cli");
  EXPECT_EQ(candidates.back(), "whisper-cli");
  // 존재하지 않는 경로는 건너뛰고 PATH용 이름을 채택
  EXPECT_EQ(resolve_binary_path(candidates), "whisper-cli");
  EXPECT_EQ(resolve_binary_path({"/missing/a", "/missing/b"}), "");
}

TEST(EngineRuntimeTest, ReadsSidecarBackendHint)
{
  test::TempDir dir;
  const std::string binary = dir.file("whisper-cli");
  BackendPreference backend = BackendPreference::AUTO;
  EXPECT_FALSE(read_sidecar_backend(binary, backend));

  std::ofstream(dir.file(kSidecarMetadataFile)) << "{\"backend\": \"cuda\", \"version\": 2}";
  EXPECT_TRUE(read_sidecar_backend(binary, backend));
  EXPECT_EQ(backend, BackendPreference::CUDA);

  std::ofstream(dir.file(kSidecarMetadataFile)) << "{\"backend\":\"cpu\"}";
  EXPECT_TRUE(read_sidecar_backend(binary, backend));
  EXPECT_EQ(backend, BackendPreference::CPU);
}

TEST(EngineRuntimeTest, StubRuntimeIsReady)
{
  EngineSpec spec;
  spec.engine = EngineKind::STUB;
  const EngineRuntime runtime = build_engine_runtime(spec);
  EXPECT_TRUE(runtime.diagnostics.ready);
  EXPECT_EQ(runtime.diagnostics.active_engine, "stub");
  EXPECT_TRUE(runtime.engine->recognize(make_segment(), CancelToken()).ok);
}

TEST(EngineRuntimeTest, MissingWhisperModelIsNotReady)
{
  EngineSpec spec;
  spec.engine = EngineKind::WHISPER_CPP;
  spec.model_path = "/definitely/missing/ggml-base.en.bin";
  const EngineRuntime runtime = build_engine_runtime(spec);
  EXPECT_FALSE(runtime.diagnostics.ready);
  EXPECT_FALSE(runtime.diagnostics.model_exists);
  EXPECT_EQ(runtime.diagnostics.fallback_reason.rfind("model file not found", 0), 0U);

  const RecognitionResult result = runtime.engine->recognize(make_segment(), CancelToken());
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error_kind, ErrorKind::ENGINE_NOT_READY);
}

TEST(EngineRuntimeTest, WhisperRuntimeUsesOverrideBinaryOnCpu)
{
  test::TempDir dir;
  const std::string model = dir.file("model.bin");
  std::ofstream(model) << "model";
  const std::string binary = test::write_script(dir, "whisper-cli", "exit 0\n");
  ScopedEnv bin_env(kWhisperBinaryEnv, binary);
  ScopedEnv backend_env(kBackendEnv, "cpu");

  EngineSpec spec;
  spec.engine = EngineKind::WHISPER_CPP;
  spec.model_path = model;
  const EngineRuntime runtime = build_engine_runtime(spec);
  EXPECT_TRUE(runtime.diagnostics.ready);
  EXPECT_EQ(runtime.diagnostics.resolved_binary_path, binary);
  EXPECT_EQ(runtime.diagnostics.compute_backend, "cpu");
  EXPECT_FALSE(runtime.diagnostics.using_gpu);
  EXPECT_EQ(runtime.engine->engine_label(), "whisper_cpp");
}

TEST(EngineRuntimeTest, FasterWhisperRuntimeStartsAndPreloadsWorker)
{
  test::TempDir dir;
  ScopedEnv bin_env(kFasterWhisperBinaryEnv, responding_worker(dir, true));
  ScopedEnv backend_env(kBackendEnv, "cpu");

  EngineSpec spec;
  spec.engine = EngineKind::FASTER_WHISPER;
  spec.faster_whisper_model = "tiny.en";
  spec.request_timeout_ms = 5000;
  const EngineRuntime runtime = build_engine_runtime(spec);
  ASSERT_TRUE(runtime.diagnostics.ready) << runtime.diagnostics.fallback_reason;
  EXPECT_EQ(runtime.diagnostics.active_engine, "faster_whisper");
  EXPECT_EQ(runtime.diagnostics.compute_backend, "cpu");
  EXPECT_EQ(runtime.engine->model_label(), "tiny.en");

  const RecognitionResult result = runtime.engine->recognize(make_segment(), CancelToken());
  ASSERT_TRUE(result.ok) << result.error;
  EXPECT_EQ(result.text, "hello from worker");
  EXPECT_EQ(result.inference_ms, 7);
}

TEST(EngineRuntimeTest, FailedPreloadMakesRuntimeUnavailable)
{
  test::TempDir dir;
  ScopedEnv bin_env(kFasterWhisperBinaryEnv, responding_worker(dir, false));
  ScopedEnv backend_env(kBackendEnv, "cpu");

  EngineSpec spec;
  spec.engine = EngineKind::FASTER_WHISPER;
  spec.faster_whisper_model = "small.en";
  const EngineRuntime runtime = build_engine_runtime(spec);
  EXPECT_FALSE(runtime.diagnostics.ready);
  EXPECT_NE(runtime.diagnostics.fallback_reason.find("no such model"), std::string::npos);
}

TEST(EngineRuntimeTest, UnknownFasterWhisperModelIsRejected)
{
  ScopedEnv backend_env(kBackendEnv, "cpu");
  EngineSpec spec;
  spec.engine = EngineKind::FASTER_WHISPER;
  spec.faster_whisper_model = "gigantic-v9";
  const EngineRuntime runtime = build_engine_runtime(spec);
  EXPECT_FALSE(runtime.diagnostics.ready);
  EXPECT_FALSE(runtime.diagnostics.model_exists);
}

TEST(EngineRuntimeTest, SameSpecDetectsEngineRelevantChanges)
{
  DictationSettings settings;
  settings.engine = EngineKind::STUB;
  const EngineSpec a = make_engine_spec(settings);
  settings.mic_sensitivity_percent = 90;
  EXPECT_TRUE(same_engine_spec(a, make_engine_spec(settings)));
  settings.language = "de";
  EXPECT_FALSE(same_engine_spec(a, make_engine_spec(settings)));
}

TEST(EngineRuntimeTest, StalledWorkerBecomesUnavailableAfterOneRestart)
{
  test::TempDir dir;
  ScopedEnv bin_env(kFasterWhisperBinaryEnv, preload_only_worker(dir));
  ScopedEnv backend_env(kBackendEnv, "cpu");

  EngineSpec spec;
  spec.engine = EngineKind::FASTER_WHISPER;
  spec.faster_whisper_model = "tiny.en";
  spec.request_timeout_ms = 200;
  const EngineRuntime runtime = build_engine_runtime(spec);
  ASSERT_TRUE(runtime.diagnostics.ready) << runtime.diagnostics.fallback_reason;
  EXPECT_TRUE(runtime.engine->available());

  const RecognitionResult result = runtime.engine->recognize(make_segment(), CancelToken());
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error_kind, ErrorKind::ENGINE_TIMEOUT);
  EXPECT_FALSE(runtime.engine->available());
  EXPECT_NE(runtime.engine->unavailable_reason().find("timed out"), std::string::npos);

  EXPECT_EQ(
    runtime.engine->recognize(make_segment(), CancelToken()).error_kind,
    ErrorKind::ENGINE_NOT_READY);
}

TEST(EngineRuntimeTest, OrchestratorRebuildsDeadWorkerOnReapply)
{
  test::TempDir dir;
  ScopedEnv bin_env(kFasterWhisperBinaryEnv, preload_only_worker(dir));
  ScopedEnv backend_env(kBackendEnv, "cpu");

  DictationSettings settings;
  settings.engine = EngineKind::FASTER_WHISPER;
  settings.faster_whisper_model = "tiny.en";
  settings.worker_timeout_ms = 200;
  Orchestrator orchestrator(
    settings, std::make_shared<CommandInsertionAdapter>("direct", "true"), nullptr);
  ASSERT_TRUE(orchestrator.status().engine_ready);

  orchestrator.hotkey_down();
  EXPECT_FALSE(orchestrator.feed_audio(test::speech_samples(8000), 16000).has_value());
  EXPECT_EQ(orchestrator.status().last_error_kind, ErrorKind::ENGINE_TIMEOUT);
  EXPECT_FALSE(orchestrator.status().engine_ready);
  const OrchestratorDiagnostics dead = orchestrator.diagnostics();
  EXPECT_FALSE(dead.engine.ready);
  EXPECT_FALSE(dead.engine.fallback_reason.empty());

  // 같은 설정이라도 죽은 워커는 새 런타임으로 교체된다
  ScopedEnv healthy_env(kFasterWhisperBinaryEnv, responding_worker(dir, true));
  EXPECT_TRUE(orchestrator.apply_settings(settings));
  EXPECT_TRUE(orchestrator.status().engine_ready);

  orchestrator.hotkey_down();
  const auto text = orchestrator.feed_audio(test::speech_samples(8000), 16000);
  ASSERT_TRUE(text.has_value()) << orchestrator.status().last_error;
  EXPECT_EQ(*text, "Hello from worker.");
}
