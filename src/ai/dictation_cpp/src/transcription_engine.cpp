#include "dictation_cpp/transcription_engine.hpp"

#include <utility>

using namespace std;


namespace dictation_cpp
{

string to_string(ErrorKind kind)
{
  switch (kind) {
    case ErrorKind::NONE:
      return "none";
    case ErrorKind::INPUT_RATE_UNSUPPORTED:
      return "input_rate_unsupported";
    case ErrorKind::ENGINE_NOT_READY:
      return "engine_not_ready";
    case ErrorKind::ENGINE_TIMEOUT:
      return "engine_timeout";
    case ErrorKind::ENGINE_PROCESS_EXIT:
      return "engine_process_exit";
    case ErrorKind::INSERTION_FAILED:
      return "insertion_failed";
    case ErrorKind::INVALID_RESPONSE:
      return "invalid_response";
    case ErrorKind::CANCELLED:
      return "cancelled";
    default:
      return "unknown";
  }
}

StubEngine::StubEngine(string text)
: text_(move(text))
{
}

RecognitionResult cancelled_result(const string & engine)
{
  RecognitionResult out;
  out.engine = engine;
  out.error = "recognition cancelled";
  out.error_kind = ErrorKind::CANCELLED;
  return out;
}

RecognitionResult StubEngine::recognize(const SpeechSegment & segment, const CancelToken & cancel)
{
  if (cancel.requested()) {
    return cancelled_result("stub");
  }
  RecognitionResult out;
  out.engine = "stub";
  if (segment.samples.empty()) {
    out.error = "cannot transcribe empty audio chunk";
    return out;
  }
  out.ok = true;
  out.text = text_;
  return out;
}

}  // namespace dictation_cpp
