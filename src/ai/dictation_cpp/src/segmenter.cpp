#include "dictation_cpp/segmenter.hpp"

#include <algorithm>
#include <utility>

using namespace std;


namespace dictation_cpp
{

SegmenterConfig make_segmenter_config(const DictationSettings & settings)
{
  const ProfileTuning tuning = effective_tuning(settings);
  SegmenterConfig config;
  config.min_chunk_samples = max(tuning.min_chunk_samples, kLiveMinChunkSamples);
  config.cadence_ms = max(tuning.partial_cadence_ms, kLiveMinCadenceMs);
  config.backlog_multiple = static_cast<size_t>(max(settings.backlog_multiple, 1));
  return config;
}

Segmenter::Segmenter(const SegmenterConfig & config, shared_ptr<SpeechDetector> detector)
: config_(config), detector_(move(detector)), next_sequence_id_(1),
  dropped_samples_(0), silent_chunks_(0)
{
  if (!detector_) {
    detector_ = make_shared<RmsSpeechDetector>();
  }
}

optional<SpeechSegment> Segmenter::push(
  const vector<float> & samples,
  SteadyClock::time_point now)
{
  pending_.insert(pending_.end(), samples.begin(), samples.end());

  if (pending_.size() < config_.min_chunk_samples) {
    return nullopt;
  }
  if (last_emit_ &&
    now - *last_emit_ < chrono::milliseconds(config_.cadence_ms))
  {
    trim_backlog();
    return nullopt;
  }

  // 오래된 샘플부터 최대 청크 크기만큼 잘라낸다
  const size_t chunk_size = min(pending_.size(), config_.max_chunk_samples());
  vector<float> chunk(pending_.begin(), pending_.begin() + static_cast<ptrdiff_t>(chunk_size));
  pending_.erase(pending_.begin(), pending_.begin() + static_cast<ptrdiff_t>(chunk_size));
  trim_backlog();
  last_emit_ = now;

  if (!detector_->is_speech(chunk)) {
    ++silent_chunks_;
    return nullopt;
  }

  SpeechSegment segment;
  segment.sequence_id = next_sequence_id_++;
  segment.samples = move(chunk);
  segment.ready_at = now;
  return segment;
}

void Segmenter::trim_backlog()
{
  const size_t cap = config_.backlog_cap_samples();
  if (pending_.size() <= cap) {
    return;
  }
  const size_t excess = pending_.size() - cap;
  pending_.erase(pending_.begin(), pending_.begin() + static_cast<ptrdiff_t>(excess));
  dropped_samples_ += excess;
}

void Segmenter::reset()
{
  pending_.clear();
  last_emit_.reset();
  if (detector_) {
    detector_->reset();
  }
}

void Segmenter::set_config(const SegmenterConfig & config)
{
  config_ = config;
  trim_backlog();
}

void Segmenter::set_detector(shared_ptr<SpeechDetector> detector)
{
  if (detector) {
    detector_ = move(detector);
  }
}

}  // namespace dictation_cpp
