#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include "dictation_cpp/segmenter.hpp"

namespace dictation_cpp
{

enum class ErrorKind
{
  NONE,
  INPUT_RATE_UNSUPPORTED,
  ENGINE_NOT_READY,
  ENGINE_TIMEOUT,
  ENGINE_PROCESS_EXIT,
  INSERTION_FAILED,
  INVALID_RESPONSE,
  CANCELLED
};

std::string to_string(ErrorKind kind);

struct RecognitionResult
{
  bool ok = false;
  std::string engine;
  std::string text;
  std::string error;
  ErrorKind error_kind = ErrorKind::NONE;
  int64_t inference_ms = 0;
};

/// 인식 호출 하나의 취소 표시. 호출자가 만들어 넘기며, 호출 전에 켜져도 유효하다
class CancelToken
{
public:
  CancelToken()
  : requested_(false) {}

  void request() { requested_.store(true); }
  bool requested() const { return requested_.load(); }
  const std::atomic<bool> * flag() const { return &requested_; }

private:
  std::atomic<bool> requested_;
};

/// 세그먼트 하나를 텍스트로 바꾸는 인식 엔진 공통 인터페이스
class TranscriptionEngine
{
public:
  virtual ~TranscriptionEngine() = default;

  /// cancel이 켜져 있으면 작업을 시작하지 않고 CANCELLED로 끝낸다
  virtual RecognitionResult recognize(const SpeechSegment & segment, const CancelToken & cancel) = 0;
  /// 토큰이 켜진 뒤 호출. 응답을 기다리며 잠든 recognize를 깨운다 (다른 스레드에서 호출 가능)
  virtual void cancel() = 0;
  virtual std::string engine_label() const = 0;
  virtual std::string model_label() const = 0;
  virtual size_t queue_depth() const { return 0; }
  /// 생성 후에도 계속 쓸 수 있는지 (워커 재시작 한도를 넘기면 false)
  virtual bool available() const { return true; }
  virtual std::string unavailable_reason() const { return ""; }
};

/// 시작 전에 취소된 호출의 공통 결과
RecognitionResult cancelled_result(const std::string & engine);

class StubEngine : public TranscriptionEngine
{
public:
  explicit StubEngine(std::string text = "stub transcript");

  RecognitionResult recognize(const SpeechSegment & segment, const CancelToken & cancel) override;
  void cancel() override {}
  std::string engine_label() const override { return "stub"; }
  std::string model_label() const override { return "stub"; }

private:
  std::string text_;
};

}  // namespace dictation_cpp
