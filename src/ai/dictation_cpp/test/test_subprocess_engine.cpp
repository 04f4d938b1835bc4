#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <future>
#include <string>
#include <thread>

#include "dictation_cpp/subprocess_engine.hpp"
#include "test_helpers.hpp"

using namespace dictation_cpp;

namespace
{

const char * kParseArgs =
  "while [ $# -gt 0 ]; do\n"
  "  case \"$1\" in\n"
  "    -f) wav=\"$2\"; shift ;;\n"
  "    -of) prefix=\"$2\"; shift ;;\n"
  "  esac\n"
  "  shift\n"
  "done\n";

SubprocessEngineConfig make_config(const std::string & binary)
{
  SubprocessEngineConfig config;
  config.binary_path = binary;
  config.model_path = "/models/ggml-base.en-q5_1.bin";
  config.threads = 2;
  config.timeout = std::chrono::milliseconds(5000);
  return config;
}

SpeechSegment make_segment()
{
  SpeechSegment segment;
  segment.sequence_id = 1;
  segment.samples = test::speech_samples(8000);
  return segment;
}

}  // namespace

TEST(SubprocessEngineTest, CommandArgsDisableGpuOnCpu)
{
  SubprocessEngineConfig config = make_config("whisper-cli");
  SubprocessEngine cpu(config);
  const std::vector<std::string> args = cpu.command_args("/tmp/a.wav", "/tmp/a-out");
  EXPECT_NE(std::find(args.begin(), args.end(), "-ng"), args.end());
  EXPECT_NE(std::find(args.begin(), args.end(), "--no-timestamps"), args.end());
  const auto threads = std::find(args.begin(), args.end(), "-t");
  ASSERT_NE(threads, args.end());
  EXPECT_EQ(*(threads + 1), "2");

  config.use_gpu = true;
  SubprocessEngine gpu(config);
  const std::vector<std::string> gpu_args = gpu.command_args("/tmp/a.wav", "/tmp/a-out");
  EXPECT_EQ(std::find(gpu_args.begin(), gpu_args.end(), "-ng"), gpu_args.end());
}

TEST(SubprocessEngineTest, ReadsTranscriptFileAndRemovesTempFiles)
{
  test::TempDir dir;
  const std::string record = dir.file("wav_path");
  const std::string binary = test::write_script(
    dir, "whisper-cli",
    std::string(kParseArgs) +
    "echo \"$wav\" > '" + record + "'\n"
    "printf '  hello from whisper \\n' > \"$prefix.txt\"\n"
    "echo 'progress output'\n");

  SubprocessEngine engine(make_config(binary));
  const RecognitionResult result = engine.recognize(make_segment(), CancelToken());
  ASSERT_TRUE(result.ok) << result.error;
  EXPECT_EQ(result.text, "hello from whisper");
  EXPECT_EQ(result.engine, "whisper_cpp");

  std::string wav_path = test::read_file(record);
  while (!wav_path.empty() && wav_path.back() == '\n') {
    wav_path.pop_back();
  }
  ASSERT_FALSE(wav_path.empty());
  EXPECT_FALSE(std::filesystem::exists(wav_path));
}

TEST(SubprocessEngineTest, FallsBackToStdout)
{
  test::TempDir dir;
  const std::string binary = test::write_script(dir, "whisper-cli", "echo ' from stdout '\n");

  SubprocessEngine engine(make_config(binary));
  const RecognitionResult result = engine.recognize(make_segment(), CancelToken());
  ASSERT_TRUE(result.ok) << result.error;
  EXPECT_EQ(result.text, "from stdout");
}

TEST(SubprocessEngineTest, NonZeroExitReportsStderr)
{
  test::TempDir dir;
  const std::string binary = test::write_script(
    dir, "whisper-cli", "echo 'failed to load model' >&2\nexit 3\n");

  SubprocessEngine engine(make_config(binary));
  const RecognitionResult result = engine.recognize(make_segment(), CancelToken());
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error_kind, ErrorKind::ENGINE_PROCESS_EXIT);
  EXPECT_NE(result.error.find("status 3"), std::string::npos);
  EXPECT_NE(result.error.find("failed to load model"), std::string::npos);
}

TEST(SubprocessEngineTest, EmptyOutputIsInvalidResponse)
{
  test::TempDir dir;
  const std::string binary = test::write_script(dir, "whisper-cli", "exit 0\n");

  SubprocessEngine engine(make_config(binary));
  const RecognitionResult result = engine.recognize(make_segment(), CancelToken());
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error_kind, ErrorKind::INVALID_RESPONSE);
}

TEST(SubprocessEngineTest, SlowCliTimesOut)
{
  test::TempDir dir;
  const std::string binary = test::write_script(dir, "whisper-cli", "exec sleep 5\n");

  SubprocessEngineConfig config = make_config(binary);
  config.timeout = std::chrono::milliseconds(200);
  SubprocessEngine engine(config);

  const auto started = std::chrono::steady_clock::now();
  const RecognitionResult result = engine.recognize(make_segment(), CancelToken());
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error_kind, ErrorKind::ENGINE_TIMEOUT);
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(4));
}

TEST(SubprocessEngineTest, CancelStopsRunningCli)
{
  test::TempDir dir;
  const std::string binary = test::write_script(dir, "whisper-cli", "exec sleep 5\n");

  SubprocessEngine engine(make_config(binary));
  CancelToken token;
  const auto started = std::chrono::steady_clock::now();
  auto pending = std::async(
    std::launch::async, [&engine, &token]() {return engine.recognize(make_segment(), token);});
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  token.request();
  engine.cancel();

  const RecognitionResult result = pending.get();
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error_kind, ErrorKind::CANCELLED);
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(4));
}

TEST(SubprocessEngineTest, TokenCancelledBeforeCallNeverSpawnsCli)
{
  test::TempDir dir;
  const std::string marker = dir.file("spawned");
  const std::string binary = test::write_script(
    dir, "whisper-cli", "touch '" + marker + "'\nexec sleep 5\n");

  SubprocessEngine engine(make_config(binary));
  CancelToken token;
  token.request();
  const RecognitionResult result = engine.recognize(make_segment(), token);
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error_kind, ErrorKind::CANCELLED);
  EXPECT_FALSE(std::filesystem::exists(marker));
}

TEST(SubprocessEngineTest, MissingBinaryFails)
{
  SubprocessEngine engine(make_config("/definitely/missing/whisper-cli"));
  const RecognitionResult result = engine.recognize(make_segment(), CancelToken());
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error_kind, ErrorKind::ENGINE_PROCESS_EXIT);
}

TEST(SubprocessEngineTest, EmptySegmentIsRejected)
{
  SubprocessEngine engine(make_config("whisper-cli"));
  const RecognitionResult result = engine.recognize(SpeechSegment(), CancelToken());
  EXPECT_FALSE(result.ok);
  EXPECT_FALSE(result.error.empty());
}
