#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "dictation_cpp/orchestrator.hpp"
#include "test_helpers.hpp"

using namespace dictation_cpp;

namespace
{

/// 미리 정한 결과를 돌려주는 엔진. 호출 시점에 훅을 실행할 수 있다
class FakeEngine : public TranscriptionEngine
{
public:
  explicit FakeEngine(RecognitionResult result)
  : result_(std::move(result)) {}

  RecognitionResult recognize(const SpeechSegment & segment, const CancelToken & cancel) override
  {
    ++calls;
    last_samples = segment.samples.size();
    if (on_recognize) {
      on_recognize();
    }
    saw_cancel = cancel.requested();
    if (saw_cancel) {
      return cancelled_result("fake");
    }
    return result_;
  }
  void cancel() override {}
  std::string engine_label() const override { return "fake"; }
  std::string model_label() const override { return "fake"; }
  bool available() const override { return alive.load(); }
  std::string unavailable_reason() const override
  {
    return alive.load() ? "" : "worker restart limit reached (1)";
  }

  int calls = 0;
  size_t last_samples = 0;
  bool saw_cancel = false;
  std::atomic<bool> alive{true};
  std::function<void()> on_recognize;

private:
  RecognitionResult result_;
};

/// release() 또는 cancel()이 호출될 때까지 recognize를 붙잡아 두는 엔진
class BlockingEngine : public TranscriptionEngine
{
public:
  explicit BlockingEngine(std::string text)
  : text_(std::move(text)) {}

  RecognitionResult recognize(const SpeechSegment &, const CancelToken & cancel) override
  {
    std::unique_lock<std::mutex> lock(mutex_);
    entered_ = true;
    cv_.notify_all();
    cv_.wait(lock, [this, &cancel]() {return released_ || cancelled_ || cancel.requested();});

    RecognitionResult out;
    out.engine = "blocking";
    if (cancelled_ || cancel.requested()) {
      out.error = "recognition cancelled";
      out.error_kind = ErrorKind::CANCELLED;
      return out;
    }
    out.ok = true;
    out.text = text_;
    return out;
  }

  void cancel() override
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
    cv_.notify_all();
  }

  std::string engine_label() const override { return "blocking"; }
  std::string model_label() const override { return "blocking"; }

  bool wait_entered(std::chrono::milliseconds timeout)
  {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() {return entered_;});
  }

  void release()
  {
    std::lock_guard<std::mutex> lock(mutex_);
    released_ = true;
    cv_.notify_all();
  }

private:
  std::string text_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool entered_ = false;
  bool released_ = false;
  bool cancelled_ = false;
};

class FakeAdapter : public InsertionAdapter
{
public:
  explicit FakeAdapter(bool succeed = true)
  : succeed_(succeed) {}

  bool attempt(const std::string & text, std::string & error) override
  {
    std::lock_guard<std::mutex> lock(mutex_);
    received_.push_back(text);
    if (on_attempt) {
      on_attempt();
    }
    if (!succeed_) {
      error = "adapter refused";
    }
    return succeed_;
  }
  std::string name() const override { return "fake"; }

  std::vector<std::string> received() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_;
  }

  std::function<void()> on_attempt;

private:
  bool succeed_;
  mutable std::mutex mutex_;
  std::vector<std::string> received_;
};

RecognitionResult ok_result(const std::string & text)
{
  RecognitionResult result;
  result.ok = true;
  result.engine = "fake";
  result.text = text;
  return result;
}

EngineRuntime ready_runtime(std::shared_ptr<TranscriptionEngine> engine)
{
  EngineRuntime runtime;
  runtime.engine = std::move(engine);
  runtime.diagnostics.ready = true;
  runtime.diagnostics.active_engine = runtime.engine->engine_label();
  return runtime;
}

RuntimeBuilder fixed_builder(std::shared_ptr<TranscriptionEngine> engine)
{
  return [engine](const EngineSpec &) {return ready_runtime(engine);};
}

DictationSettings stub_settings()
{
  DictationSettings settings;
  settings.engine = EngineKind::STUB;
  return settings;
}

std::vector<float> one_chunk()
{
  return test::speech_samples(8000);
}

}  // namespace

TEST(OrchestratorTest, SegmentFlowsThroughEngineAndInsertion)
{
  auto engine = std::make_shared<FakeEngine>(ok_result("  hello   world "));
  auto direct = std::make_shared<FakeAdapter>();
  Orchestrator orchestrator(stub_settings(), direct, nullptr, fixed_builder(engine));

  DictationState during_recognition = DictationState::IDLE;
  DictationState during_insertion = DictationState::IDLE;
  engine->on_recognize = [&]() {during_recognition = orchestrator.status().state;};
  direct->on_attempt = [&]() {during_insertion = orchestrator.status().state;};

  EXPECT_EQ(orchestrator.hotkey_down().state, DictationState::LISTENING);
  const auto inserted = orchestrator.feed_audio(one_chunk(), 16000);
  ASSERT_TRUE(inserted.has_value());
  EXPECT_EQ(*inserted, "Hello world.");
  EXPECT_EQ(during_recognition, DictationState::TRANSCRIBING);
  EXPECT_EQ(during_insertion, DictationState::INSERTING);
  EXPECT_EQ(orchestrator.status().state, DictationState::IDLE);
  EXPECT_EQ(engine->calls, 1);
  EXPECT_EQ(engine->last_samples, 8000U);

  const std::vector<InsertionRecord> recent = orchestrator.recent_insertions();
  ASSERT_EQ(recent.size(), 1U);
  EXPECT_EQ(recent[0].status, InsertionStatus::SUCCESS);
  EXPECT_EQ(orchestrator.diagnostics().last_sequence_id, 1U);
}

TEST(OrchestratorTest, AudioOutsideListeningIsIgnored)
{
  auto engine = std::make_shared<FakeEngine>(ok_result("hello"));
  Orchestrator orchestrator(
    stub_settings(), std::make_shared<FakeAdapter>(), nullptr, fixed_builder(engine));

  EXPECT_FALSE(orchestrator.feed_audio(one_chunk(), 16000).has_value());
  EXPECT_EQ(engine->calls, 0);

  orchestrator.hotkey_down();
  EXPECT_FALSE(orchestrator.feed_audio(std::vector<float>(8000, 0.0F), 16000).has_value());
  EXPECT_EQ(engine->calls, 0);
  EXPECT_EQ(orchestrator.status().state, DictationState::LISTENING);
  EXPECT_EQ(orchestrator.diagnostics().silent_chunks, 1U);
}

TEST(OrchestratorTest, LowSampleRateIsRejected)
{
  auto engine = std::make_shared<FakeEngine>(ok_result("hello"));
  Orchestrator orchestrator(
    stub_settings(), std::make_shared<FakeAdapter>(), nullptr, fixed_builder(engine));

  orchestrator.hotkey_down();
  EXPECT_FALSE(orchestrator.feed_audio(one_chunk(), 8000).has_value());
  const PipelineStatus status = orchestrator.status();
  EXPECT_EQ(status.last_error_kind, ErrorKind::INPUT_RATE_UNSUPPORTED);
  EXPECT_EQ(status.state, DictationState::LISTENING);
  EXPECT_EQ(engine->calls, 0);
}

TEST(OrchestratorTest, HighSampleRateIsDownsampled)
{
  auto engine = std::make_shared<FakeEngine>(ok_result("hello"));
  Orchestrator orchestrator(
    stub_settings(), std::make_shared<FakeAdapter>(), nullptr, fixed_builder(engine));

  orchestrator.hotkey_down();
  ASSERT_TRUE(orchestrator.feed_audio(test::speech_samples(24000, 48000), 48000).has_value());
  EXPECT_EQ(engine->last_samples, 8000U);
}

TEST(OrchestratorTest, RecognitionFailureReturnsToIdle)
{
  RecognitionResult failure;
  failure.error = "worker request 1 timed out";
  failure.error_kind = ErrorKind::ENGINE_TIMEOUT;
  auto engine = std::make_shared<FakeEngine>(failure);
  auto direct = std::make_shared<FakeAdapter>();
  Orchestrator orchestrator(stub_settings(), direct, nullptr, fixed_builder(engine));

  orchestrator.hotkey_down();
  EXPECT_FALSE(orchestrator.feed_audio(one_chunk(), 16000).has_value());
  const PipelineStatus status = orchestrator.status();
  EXPECT_EQ(status.state, DictationState::IDLE);
  EXPECT_EQ(status.last_error_kind, ErrorKind::ENGINE_TIMEOUT);
  EXPECT_EQ(status.last_error, "worker request 1 timed out");
  EXPECT_TRUE(direct->received().empty());

  // 다음 세션은 오류 기록을 비우고 시작
  EXPECT_EQ(orchestrator.hotkey_down().last_error_kind, ErrorKind::NONE);
}

TEST(OrchestratorTest, ClipboardFallbackAndFailureAreRecorded)
{
  auto engine = std::make_shared<FakeEngine>(ok_result("hello"));
  auto direct = std::make_shared<FakeAdapter>(false);
  auto clipboard = std::make_shared<FakeAdapter>(true);
  Orchestrator orchestrator(stub_settings(), direct, clipboard, fixed_builder(engine));

  orchestrator.hotkey_down();
  ASSERT_TRUE(orchestrator.feed_audio(one_chunk(), 16000).has_value());
  EXPECT_EQ(orchestrator.recent_insertions().front().status, InsertionStatus::FALLBACK);
  EXPECT_EQ(orchestrator.status().last_error_kind, ErrorKind::NONE);

  DictationSettings settings = stub_settings();
  settings.clipboard_fallback = false;
  EXPECT_FALSE(orchestrator.apply_settings(settings));

  orchestrator.hotkey_down();
  ASSERT_TRUE(orchestrator.feed_audio(one_chunk(), 16000).has_value());
  EXPECT_EQ(orchestrator.recent_insertions().front().status, InsertionStatus::FAILURE);
  const PipelineStatus status = orchestrator.status();
  EXPECT_EQ(status.last_error_kind, ErrorKind::INSERTION_FAILED);
  EXPECT_EQ(status.state, DictationState::IDLE);
  EXPECT_EQ(clipboard->received().size(), 1U);
}

TEST(OrchestratorTest, EmptyTranscriptInsertsNothing)
{
  auto engine = std::make_shared<FakeEngine>(ok_result("   "));
  auto direct = std::make_shared<FakeAdapter>();
  Orchestrator orchestrator(stub_settings(), direct, nullptr, fixed_builder(engine));

  orchestrator.hotkey_down();
  EXPECT_FALSE(orchestrator.feed_audio(one_chunk(), 16000).has_value());
  EXPECT_EQ(engine->calls, 1);
  EXPECT_TRUE(direct->received().empty());
  EXPECT_EQ(orchestrator.status().state, DictationState::IDLE);
}

TEST(OrchestratorTest, CancelDiscardsInFlightResult)
{
  auto engine = std::make_shared<BlockingEngine>("too late");
  auto direct = std::make_shared<FakeAdapter>();
  Orchestrator orchestrator(stub_settings(), direct, nullptr, fixed_builder(engine));

  orchestrator.hotkey_down();
  auto pending = std::async(
    std::launch::async, [&orchestrator]() {return orchestrator.feed_audio(one_chunk(), 16000);});
  ASSERT_TRUE(engine->wait_entered(std::chrono::seconds(5)));
  EXPECT_EQ(orchestrator.status().state, DictationState::TRANSCRIBING);

  EXPECT_EQ(orchestrator.cancel().state, DictationState::IDLE);
  EXPECT_FALSE(pending.get().has_value());
  EXPECT_TRUE(direct->received().empty());
  EXPECT_EQ(orchestrator.status().state, DictationState::IDLE);
  EXPECT_EQ(orchestrator.status().last_error_kind, ErrorKind::NONE);
}

TEST(OrchestratorTest, EngineSwapDuringRecognitionKeepsBothResults)
{
  auto first = std::make_shared<BlockingEngine>("first run");
  auto second = std::make_shared<FakeEngine>(ok_result("second run"));
  auto direct = std::make_shared<FakeAdapter>();
  RuntimeBuilder builder = [first, second](const EngineSpec & spec) {
      if (spec.language == "de") {
        return ready_runtime(second);
      }
      return ready_runtime(first);
    };
  Orchestrator orchestrator(stub_settings(), direct, nullptr, builder);

  orchestrator.hotkey_down();
  auto pending = std::async(
    std::launch::async, [&orchestrator]() {return orchestrator.feed_audio(one_chunk(), 16000);});
  ASSERT_TRUE(first->wait_entered(std::chrono::seconds(5)));

  DictationSettings settings = stub_settings();
  settings.language = "de";
  EXPECT_TRUE(orchestrator.apply_settings(settings));

  first->release();
  const auto first_text = pending.get();
  ASSERT_TRUE(first_text.has_value());
  EXPECT_EQ(*first_text, "First run.");

  orchestrator.hotkey_down();
  const auto second_text = orchestrator.feed_audio(one_chunk(), 16000);
  ASSERT_TRUE(second_text.has_value());
  EXPECT_EQ(*second_text, "Second run.");
  EXPECT_EQ(second->calls, 1);

  const std::vector<std::string> received = direct->received();
  ASSERT_EQ(received.size(), 2U);
  EXPECT_EQ(received[0], "First run.");
  EXPECT_EQ(received[1], "Second run.");
}

TEST(OrchestratorTest, FailedSwitchKeepsPreviousEngine)
{
  auto engine = std::make_shared<FakeEngine>(ok_result("still here"));
  RuntimeBuilder builder = [engine](const EngineSpec & spec) {
      if (spec.language == "de") {
        EngineRuntime broken;
        broken.engine = std::make_shared<UnavailableEngine>("whisper_cpp", "model missing");
        broken.diagnostics.fallback_reason = "model file not found: /nope.bin";
        return broken;
      }
      return ready_runtime(engine);
    };
  auto direct = std::make_shared<FakeAdapter>();
  Orchestrator orchestrator(stub_settings(), direct, nullptr, builder);

  DictationSettings settings = stub_settings();
  settings.language = "de";
  EXPECT_FALSE(orchestrator.apply_settings(settings));
  EXPECT_EQ(orchestrator.diagnostics().last_switch_error, "model file not found: /nope.bin");
  EXPECT_TRUE(orchestrator.status().engine_ready);

  orchestrator.hotkey_down();
  const auto text = orchestrator.feed_audio(one_chunk(), 16000);
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(*text, "Still here.");
}

TEST(OrchestratorTest, CancelReachesEngineThatAlreadyStarted)
{
  auto engine = std::make_shared<FakeEngine>(ok_result("never inserted"));
  auto direct = std::make_shared<FakeAdapter>();
  Orchestrator orchestrator(stub_settings(), direct, nullptr, fixed_builder(engine));

  // 엔진 호출이 시작된 직후의 취소도 그 호출이 받은 토큰에 보여야 한다
  engine->on_recognize = [&orchestrator]() {orchestrator.cancel();};
  orchestrator.hotkey_down();
  EXPECT_FALSE(orchestrator.feed_audio(one_chunk(), 16000).has_value());
  EXPECT_TRUE(engine->saw_cancel);
  EXPECT_TRUE(direct->received().empty());
  EXPECT_EQ(orchestrator.status().state, DictationState::IDLE);
  EXPECT_EQ(orchestrator.status().last_error_kind, ErrorKind::NONE);

  // 다음 세션은 새 토큰으로 시작
  engine->on_recognize = nullptr;
  orchestrator.hotkey_down();
  const auto text = orchestrator.feed_audio(one_chunk(), 16000);
  ASSERT_TRUE(text.has_value());
  EXPECT_FALSE(engine->saw_cancel);
  EXPECT_EQ(*text, "Never inserted.");
}

TEST(OrchestratorTest, DeadEngineIsReportedAndRebuiltWithSameSettings)
{
  auto dying = std::make_shared<FakeEngine>(ok_result("first engine"));
  auto replacement = std::make_shared<FakeEngine>(ok_result("second engine"));
  int builds = 0;
  RuntimeBuilder builder = [&builds, dying, replacement](const EngineSpec &) {
      ++builds;
      return ready_runtime(builds == 1 ? dying : replacement);
    };
  auto direct = std::make_shared<FakeAdapter>();
  Orchestrator orchestrator(stub_settings(), direct, nullptr, builder);
  EXPECT_TRUE(orchestrator.status().engine_ready);

  dying->alive = false;
  EXPECT_FALSE(orchestrator.status().engine_ready);
  const OrchestratorDiagnostics diagnostics = orchestrator.diagnostics();
  EXPECT_FALSE(diagnostics.engine.ready);
  EXPECT_EQ(diagnostics.engine.fallback_reason, "worker restart limit reached (1)");

  EXPECT_TRUE(orchestrator.apply_settings(stub_settings()));
  EXPECT_EQ(builds, 2);
  EXPECT_TRUE(orchestrator.status().engine_ready);
  EXPECT_TRUE(orchestrator.diagnostics().engine.ready);

  orchestrator.hotkey_down();
  const auto text = orchestrator.feed_audio(one_chunk(), 16000);
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(*text, "Second engine.");
  EXPECT_EQ(dying->calls, 0);

  // 살아 있는 엔진은 같은 설정으로 다시 만들지 않는다
  EXPECT_FALSE(orchestrator.apply_settings(stub_settings()));
  EXPECT_EQ(builds, 2);
}

TEST(OrchestratorTest, DiagnosticsDescribeSessionEnvironment)
{
  auto engine = std::make_shared<FakeEngine>(ok_result("hello"));
  Orchestrator orchestrator(
    stub_settings(), std::make_shared<FakeAdapter>(), nullptr, fixed_builder(engine));
  const SessionEnvironment environment = orchestrator.diagnostics().environment;
  EXPECT_FALSE(environment.os.empty());
  EXPECT_FALSE(environment.notes.empty());
}

TEST(OrchestratorTest, PushToTalkReleaseStopsListening)
{
  auto engine = std::make_shared<FakeEngine>(ok_result("hello"));
  DictationSettings settings = stub_settings();
  settings.mode = DictationMode::PUSH_TO_TALK;
  Orchestrator orchestrator(
    settings, std::make_shared<FakeAdapter>(), nullptr, fixed_builder(engine));

  EXPECT_EQ(orchestrator.hotkey_down().state, DictationState::LISTENING);
  EXPECT_EQ(orchestrator.hotkey_up().state, DictationState::IDLE);
  EXPECT_FALSE(orchestrator.feed_audio(one_chunk(), 16000).has_value());
  EXPECT_EQ(engine->calls, 0);

  EXPECT_EQ(orchestrator.set_mode(DictationMode::PUSH_TO_TOGGLE).mode, DictationMode::PUSH_TO_TOGGLE);
  orchestrator.hotkey_down();
  EXPECT_EQ(orchestrator.hotkey_up().state, DictationState::LISTENING);
}

TEST(OrchestratorTest, ProfileSinkReceivesChunkTimings)
{
  auto engine = std::make_shared<FakeEngine>(ok_result("hello"));
  Orchestrator orchestrator(
    stub_settings(), std::make_shared<FakeAdapter>(), nullptr, fixed_builder(engine));

  std::vector<ChunkProfile> profiles;
  orchestrator.set_profile_sink([&profiles](const ChunkProfile & profile) {
      profiles.push_back(profile);
    });

  orchestrator.hotkey_down();
  ASSERT_TRUE(orchestrator.feed_audio(one_chunk(), 16000).has_value());
  ASSERT_EQ(profiles.size(), 1U);
  EXPECT_EQ(profiles[0].sequence_id, 1U);
  EXPECT_EQ(profiles[0].samples, 8000U);
  EXPECT_TRUE(profiles[0].ok);
  EXPECT_GE(profiles[0].inference_ms, 0.0);
}

TEST(OrchestratorTest, StatusReflectsSettings)
{
  auto engine = std::make_shared<FakeEngine>(ok_result("hello"));
  DictationSettings settings = stub_settings();
  settings.model_profile = ModelProfile::FAST;
  Orchestrator orchestrator(
    settings, std::make_shared<FakeAdapter>(), nullptr, fixed_builder(engine));

  const PipelineStatus status = orchestrator.status();
  EXPECT_EQ(status.profile, ModelProfile::FAST);
  EXPECT_EQ(status.tuning.min_chunk_samples, 1024U);
  EXPECT_EQ(status.segmenter.min_chunk_samples, 8000U);
  EXPECT_EQ(status.segmenter.cadence_ms, 300);
  EXPECT_EQ(status.engine, "fake");
  EXPECT_TRUE(status.engine_ready);
}

TEST(OrchestratorTest, DefaultBuilderRunsStubEngine)
{
  auto direct = std::make_shared<FakeAdapter>();
  Orchestrator orchestrator(stub_settings(), direct, nullptr);

  orchestrator.hotkey_down();
  const auto text = orchestrator.feed_audio(one_chunk(), 16000);
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(*text, "Stub transcript.");
  EXPECT_EQ(orchestrator.diagnostics().engine.active_engine, "stub");
}
