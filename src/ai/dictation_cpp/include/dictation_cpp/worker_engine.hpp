#pragma once

#include <memory>
#include <string>

#include "dictation_cpp/transcription_engine.hpp"
#include "dictation_cpp/wav_writer.hpp"
#include "dictation_cpp/worker_client.hpp"

namespace dictation_cpp
{

/// 상주 faster-whisper 워커를 쓰는 엔진. 세그먼트를 임시 WAV로 넘기고 transcribe 요청
class WorkerEngine : public TranscriptionEngine
{
public:
  explicit WorkerEngine(std::shared_ptr<WorkerClient> client);
  ~WorkerEngine() override;

  RecognitionResult recognize(const SpeechSegment & segment, const CancelToken & cancel) override;
  void cancel() override;
  std::string engine_label() const override { return "faster_whisper"; }
  std::string model_label() const override;
  size_t queue_depth() const override;
  /// 워커가 재시작 한도를 넘겨 종료 상태가 되면 false
  bool available() const override;
  std::string unavailable_reason() const override;

  std::shared_ptr<WorkerClient> client() const { return client_; }

private:
  std::shared_ptr<WorkerClient> client_;
  WavWriter wav_writer_;
};

}  // namespace dictation_cpp
