#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <vector>

#include "dictation_cpp/settings.hpp"
#include "dictation_cpp/speech_detector.hpp"

namespace dictation_cpp
{

using SteadyClock = std::chrono::steady_clock;

/// 음성으로 판정되어 인식 엔진에 한 번 전달되는 16 kHz 청크
struct SpeechSegment
{
  uint64_t sequence_id = 0;
  std::vector<float> samples;
  SteadyClock::time_point ready_at;
};

struct SegmenterConfig
{
  size_t min_chunk_samples = 8000;
  int64_t cadence_ms = 400;
  size_t max_chunk_multiple = 3;
  // 과부하 시 pending 버퍼 상한 = max_chunk_samples * backlog_multiple (초과분은 오래된 쪽부터 버림)
  size_t backlog_multiple = 5;

  size_t max_chunk_samples() const { return min_chunk_samples * max_chunk_multiple; }
  size_t backlog_cap_samples() const { return max_chunk_samples() * backlog_multiple; }
};

constexpr size_t kLiveMinChunkSamples = 8000;
constexpr int64_t kLiveMinCadenceMs = 300;

/// 프로파일 튜닝 + 라이브 캡처 하한(0.5초, 300ms)을 반영한 세그먼터 설정
SegmenterConfig make_segmenter_config(const DictationSettings & settings);

class Segmenter
{
public:
  Segmenter(
    const SegmenterConfig & config,
    std::shared_ptr<SpeechDetector> detector);

  /// 샘플을 누적하고, 임계치/주기를 만족하면 청크를 잘라 음성일 때 세그먼트로 반환
  std::optional<SpeechSegment> push(
    const std::vector<float> & samples,
    SteadyClock::time_point now);

  void reset();
  void set_config(const SegmenterConfig & config);
  void set_detector(std::shared_ptr<SpeechDetector> detector);

  const SegmenterConfig & config() const { return config_; }
  size_t pending_samples() const { return pending_.size(); }
  uint64_t dropped_samples() const { return dropped_samples_; }
  uint64_t silent_chunks() const { return silent_chunks_; }
  uint64_t last_sequence_id() const { return next_sequence_id_ - 1; }

private:
  void trim_backlog();

  SegmenterConfig config_;
  std::shared_ptr<SpeechDetector> detector_;
  std::deque<float> pending_;
  std::optional<SteadyClock::time_point> last_emit_;
  uint64_t next_sequence_id_;
  uint64_t dropped_samples_;
  uint64_t silent_chunks_;
};

}  // namespace dictation_cpp
