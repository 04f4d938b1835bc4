#include "dictation_cpp/subprocess_engine.hpp"

#include <dictation_common/string_utils.hpp>

#include "dictation_cpp/audio_resample.hpp"
#include "dictation_cpp/child_process.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

using namespace std;


namespace dictation_cpp
{

SubprocessEngine::SubprocessEngine(const SubprocessEngineConfig & config)
: config_(config)
{
}

vector<string> SubprocessEngine::command_args(
  const string & wav_path, const string & output_prefix) const
{
  vector<string> args{
    "-m", config_.model_path,
    "-f", wav_path,
    "-l", config_.language,
    "-t", std::to_string(config_.threads),
    "-np",
    "--no-timestamps",
    "-otxt",
    "-of", output_prefix
  };
  if (!config_.use_gpu) {
    args.push_back("-ng");
  }
  return args;
}

/// 임시 WAV 작성 → CLI 실행 → <prefix>.txt(없으면 stdout)에서 결과 읽기 → 임시 파일 정리
RecognitionResult SubprocessEngine::recognize(const SpeechSegment & segment, const CancelToken & cancel)
{
  RecognitionResult out;
  out.engine = engine_label();
  if (segment.samples.empty()) {
    out.error = "cannot transcribe empty audio chunk";
    return out;
  }
  if (cancel.requested()) {
    return cancelled_result(engine_label());
  }

  const string prefix = wav_writer_.make_temp_prefix("dictation");
  const string wav_path = prefix + ".wav";
  const string output_prefix = prefix + "-out";
  const string txt_path = output_prefix + ".txt";

  if (!wav_writer_.write_float_mono(wav_path, segment.samples, kTargetSampleRate)) {
    out.error = "failed to write temp wav: " + wav_path;
    remove_files_quietly({wav_path});
    return out;
  }

  SpawnOptions options;
  options.argv.push_back(config_.binary_path);
  const vector<string> args = command_args(wav_path, output_prefix);
  options.argv.insert(options.argv.end(), args.begin(), args.end());
  options.capture_stdout = true;
  options.capture_stderr = true;

  const auto started = SteadyClock::now();
  ChildProcess child;
  if (!child.spawn(options)) {
    out.error = "failed to execute whisper cli at '" + config_.binary_path + "': " +
      child.last_error();
    out.error_kind = ErrorKind::ENGINE_NOT_READY;
    remove_files_quietly({wav_path});
    return out;
  }

  string stdout_text;
  string stderr_text;
  int exit_code = -1;
  const CollectStatus status = child.collect(
    stdout_text, stderr_text, exit_code, cancel.flag(), config_.timeout);
  out.inference_ms = chrono::duration_cast<chrono::milliseconds>(
    SteadyClock::now() - started).count();

  if (status != CollectStatus::EXITED) {
    remove_files_quietly({wav_path, txt_path});
    if (status == CollectStatus::CANCELLED) {
      out.error = "recognition cancelled";
      out.error_kind = ErrorKind::CANCELLED;
    } else if (status == CollectStatus::TIMED_OUT) {
      out.error = "whisper cli timed out";
      out.error_kind = ErrorKind::ENGINE_TIMEOUT;
    } else {
      out.error = "whisper cli failed: " + child.last_error();
      out.error_kind = ErrorKind::ENGINE_PROCESS_EXIT;
    }
    return out;
  }

  if (exit_code != 0) {
    remove_files_quietly({wav_path, txt_path});
    ostringstream oss;
    oss << "whisper cli exited with status " << exit_code;
    const string detail = dictation_common::trim(stderr_text);
    if (!detail.empty()) {
      oss << ": " << detail;
    }
    out.error = oss.str();
    out.error_kind = ErrorKind::ENGINE_PROCESS_EXIT;
    return out;
  }

  string transcript = stdout_text;
  error_code ec;
  if (filesystem::exists(txt_path, ec)) {
    ifstream txt(txt_path);
    transcript.assign(istreambuf_iterator<char>(txt), istreambuf_iterator<char>());
  }
  remove_files_quietly({wav_path, txt_path});

  out.text = dictation_common::trim(transcript);
  if (out.text.empty()) {
    out.error = "whisper cli returned empty transcript";
    out.error_kind = ErrorKind::INVALID_RESPONSE;
    return out;
  }
  out.ok = true;
  return out;
}

}  // namespace dictation_cpp
