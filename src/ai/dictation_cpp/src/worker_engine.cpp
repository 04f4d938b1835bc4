#include "dictation_cpp/worker_engine.hpp"

#include "dictation_cpp/audio_resample.hpp"

#include <utility>

using namespace std;


namespace dictation_cpp
{

WorkerEngine::WorkerEngine(shared_ptr<WorkerClient> client)
: client_(move(client))
{
}

WorkerEngine::~WorkerEngine()
{
  if (client_) {
    client_->shutdown();
  }
}

RecognitionResult WorkerEngine::recognize(const SpeechSegment & segment, const CancelToken & cancel)
{
  RecognitionResult out;
  out.engine = engine_label();
  if (!client_) {
    out.error = "faster-whisper worker is not configured";
    out.error_kind = ErrorKind::ENGINE_NOT_READY;
    return out;
  }
  if (segment.samples.empty()) {
    out.error = "cannot transcribe empty audio chunk";
    return out;
  }
  if (cancel.requested()) {
    return cancelled_result(engine_label());
  }

  const string wav_path = wav_writer_.make_temp_prefix("dictation-fw") + ".wav";
  if (!wav_writer_.write_float_mono(wav_path, segment.samples, kTargetSampleRate)) {
    out.error = "failed to write temp wav: " + wav_path;
    remove_files_quietly({wav_path});
    return out;
  }

  const WorkerCallResult result = client_->transcribe(wav_path, &cancel);
  remove_files_quietly({wav_path});

  out.ok = result.ok;
  out.text = result.text;
  out.error = result.error;
  out.error_kind = result.error_kind;
  out.inference_ms = result.inference_ms;
  return out;
}

void WorkerEngine::cancel()
{
  if (client_) {
    client_->cancel_inflight();
  }
}

string WorkerEngine::model_label() const
{
  return client_ ? client_->config().model.model : "unknown";
}

size_t WorkerEngine::queue_depth() const
{
  return client_ ? client_->queue_depth() : 0;
}

bool WorkerEngine::available() const
{
  return client_ && !client_->unavailable();
}

string WorkerEngine::unavailable_reason() const
{
  if (!client_) {
    return "faster-whisper worker is not configured";
  }
  return client_->unavailable() ? "faster-whisper worker unavailable: " + client_->last_error() : "";
}

}  // namespace dictation_cpp
