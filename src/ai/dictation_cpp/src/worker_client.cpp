#include "dictation_cpp/worker_client.hpp"

#include <iostream>

using namespace std;


namespace dictation_cpp
{

namespace
{

bool needs_restart(ErrorKind kind)
{
  return kind == ErrorKind::ENGINE_TIMEOUT || kind == ErrorKind::ENGINE_PROCESS_EXIT;
}

}  // namespace

WorkerClient::WorkerClient(const WorkerClientConfig & config)
: config_(config), started_(false), unavailable_(false), restarts_used_(0),
  next_request_id_(1), queue_depth_(0)
{
}

WorkerClient::~WorkerClient()
{
  shutdown();
}

bool WorkerClient::start()
{
  lock_guard<mutex> lock(lifecycle_mutex_);
  if (unavailable_) {
    return false;
  }
  if (process_ && process_->running()) {
    return true;
  }
  string error;
  if (!spawn_worker(error)) {
    last_error_ = error;
    return false;
  }
  started_ = true;
  return true;
}

void WorkerClient::shutdown()
{
  unique_ptr<WorkerProcess> retired;
  {
    lock_guard<mutex> lock(lifecycle_mutex_);
    retired = move(process_);
  }
  if (retired) {
    retired->stop();
  }
  handle_exit();
}

int WorkerClient::restart_count() const
{
  lock_guard<mutex> lock(lifecycle_mutex_);
  return restarts_used_;
}

bool WorkerClient::unavailable() const
{
  return unavailable_.load();
}

bool WorkerClient::running() const
{
  lock_guard<mutex> lock(lifecycle_mutex_);
  return process_ && process_->running();
}

string WorkerClient::last_error() const
{
  lock_guard<mutex> lock(lifecycle_mutex_);
  return last_error_;
}

WorkerCallResult WorkerClient::ping()
{
  return send_request(
    [](uint64_t id) {return build_ping_request(id);},
    config_.request_timeout, false);
}

WorkerCallResult WorkerClient::preload()
{
  const WorkerModelParams params = config_.model;
  return send_request(
    [params](uint64_t id) {return build_preload_request(id, params);},
    config_.preload_timeout, false);
}

WorkerCallResult WorkerClient::transcribe(const string & audio_path, const CancelToken * cancel)
{
  ++queue_depth_;
  lock_guard<mutex> serial(transcribe_mutex_);

  WorkerCallResult result;
  const WorkerModelParams params = config_.model;
  const string language = config_.language;
  const int beam_size = config_.beam_size;
  auto build = [&](uint64_t id) {
      return build_transcribe_request(id, audio_path, language, params, beam_size);
    };

  bool retried = false;
  while (true) {
    if (cancel && cancel->requested()) {
      result = WorkerCallResult();
      result.error = "request cancelled";
      result.error_kind = ErrorKind::CANCELLED;
      break;
    }
    {
      lock_guard<mutex> lock(lifecycle_mutex_);
      string error;
      if (unavailable_) {
        result = WorkerCallResult();
        result.error = "faster-whisper worker unavailable: " + last_error_;
        result.error_kind = ErrorKind::ENGINE_NOT_READY;
        break;
      }
      // 대기 중 종료된 워커는 재시작 한도를 소모해 다시 띄운다
      if (started_ && (!process_ || !process_->running())) {
        if (!consume_restart(error)) {
          result = WorkerCallResult();
          result.error = error;
          result.error_kind = ErrorKind::ENGINE_NOT_READY;
          break;
        }
      } else if (!started_) {
        if (!spawn_worker(error)) {
          last_error_ = error;
          result = WorkerCallResult();
          result.error = error;
          result.error_kind = ErrorKind::ENGINE_NOT_READY;
          break;
        }
        started_ = true;
      }
    }

    result = send_request(build, config_.request_timeout, true, cancel);
    if (result.ok) {
      lock_guard<mutex> lock(lifecycle_mutex_);
      restarts_used_ = 0;
      break;
    }
    if (!needs_restart(result.error_kind)) {
      break;
    }

    lock_guard<mutex> lock(lifecycle_mutex_);
    last_error_ = result.error;
    string error;
    if (retried || !consume_restart(error)) {
      // 재시도까지 실패했거나 재시작 한도 소진: 이후 호출은 즉시 ENGINE_NOT_READY
      if (process_) {
        process_->stop();
      }
      unavailable_ = true;
      cerr << "[dictation_cpp] worker marked unavailable: " << result.error << endl;
      break;
    }
    retried = true;
  }

  --queue_depth_;
  return result;
}

void WorkerClient::cancel_inflight()
{
  lock_guard<mutex> lock(pending_mutex_);
  if (inflight_transcribe_id_.empty()) {
    // 재시작 구간이면 토큰으로 판정되므로 대기 중인 쪽만 깨운다
    pending_cv_.notify_all();
    return;
  }
  const auto it = pending_.find(inflight_transcribe_id_);
  if (it != pending_.end()) {
    it->second->cancelled = true;
    it->second->done = true;
    pending_.erase(it);
  }
  inflight_transcribe_id_.clear();
  pending_cv_.notify_all();
}

WorkerCallResult WorkerClient::send_request(
  const function<string(uint64_t)> & build_line,
  chrono::milliseconds timeout,
  bool track_transcribe,
  const CancelToken * cancel)
{
  WorkerCallResult out;
  auto slot = make_shared<PendingSlot>();
  string id;
  string line;
  {
    lock_guard<mutex> lock(pending_mutex_);
    const uint64_t numeric_id = next_request_id_++;
    id = std::to_string(numeric_id);
    line = build_line(numeric_id);
    pending_[id] = slot;
    if (track_transcribe) {
      inflight_transcribe_id_ = id;
    }
  }

  bool written = false;
  string write_error = "worker is not running";
  {
    lock_guard<mutex> lock(lifecycle_mutex_);
    if (process_) {
      written = process_->write_line(line);
      if (!written) {
        write_error = process_->last_error();
      }
    }
  }

  unique_lock<mutex> lock(pending_mutex_);
  const bool finished = written && pending_cv_.wait_for(
    lock, timeout, [&slot, cancel]() {return slot->done || (cancel && cancel->requested());});
  pending_.erase(id);
  if (track_transcribe && inflight_transcribe_id_ == id) {
    inflight_transcribe_id_.clear();
  }

  if (!written) {
    out.error = write_error;
    out.error_kind = ErrorKind::ENGINE_PROCESS_EXIT;
    return out;
  }
  if (!finished) {
    out.error = "worker request " + id + " timed out";
    out.error_kind = ErrorKind::ENGINE_TIMEOUT;
    return out;
  }
  if (slot->cancelled || (!slot->done && cancel && cancel->requested())) {
    out.error = "request cancelled";
    out.error_kind = ErrorKind::CANCELLED;
    return out;
  }
  if (slot->process_exit) {
    out.error = "worker exited before responding";
    out.error_kind = ErrorKind::ENGINE_PROCESS_EXIT;
    return out;
  }

  const WorkerResponse & response = slot->response;
  out.inference_ms = response.inference_ms;
  out.load_ms = response.load_ms;
  if (!response.ok) {
    out.error = response.error.empty() ? "worker reported failure" : response.error;
    out.error_kind = ErrorKind::INVALID_RESPONSE;
    return out;
  }
  out.ok = true;
  out.text = response.text;
  return out;
}

bool WorkerClient::spawn_worker(string & error)
{
  process_ = make_unique<WorkerProcess>(
    [this](const string & line) {handle_line(line);},
    [this]() {handle_exit();});
  if (!process_->start(config_.launch)) {
    error = process_->last_error();
    process_.reset();
    return false;
  }
  return true;
}

bool WorkerClient::consume_restart(string & error)
{
  if (restarts_used_ >= config_.max_restarts) {
    error = "worker restart limit reached (" + std::to_string(config_.max_restarts) + ")";
    last_error_ = error;
    unavailable_ = true;
    return false;
  }
  ++restarts_used_;
  cerr << "[dictation_cpp] restarting worker (" << restarts_used_ << "/" <<
    config_.max_restarts << ")" << endl;
  if (process_) {
    process_->stop();
  }
  handle_exit();
  if (!spawn_worker(error)) {
    last_error_ = error;
    unavailable_ = true;
    return false;
  }
  return true;
}

void WorkerClient::handle_line(const string & line)
{
  WorkerResponse response;
  if (!parse_worker_response(line, response)) {
    return;
  }
  lock_guard<mutex> lock(pending_mutex_);
  const auto it = pending_.find(response.id);
  if (it == pending_.end()) {
    return;
  }
  it->second->response = response;
  it->second->done = true;
  pending_cv_.notify_all();
}

void WorkerClient::handle_exit()
{
  lock_guard<mutex> lock(pending_mutex_);
  for (auto & entry : pending_) {
    entry.second->process_exit = true;
    entry.second->done = true;
  }
  pending_cv_.notify_all();
}

}  // namespace dictation_cpp
