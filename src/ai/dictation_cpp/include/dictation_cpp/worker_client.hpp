#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "dictation_cpp/transcription_engine.hpp"
#include "dictation_cpp/worker_process.hpp"
#include "dictation_cpp/worker_protocol.hpp"

namespace dictation_cpp
{

struct WorkerClientConfig
{
  WorkerLaunchConfig launch;
  WorkerModelParams model;
  std::string language = "en";
  int beam_size = 1;
  std::chrono::milliseconds request_timeout{30000};
  std::chrono::milliseconds preload_timeout{120000};
  int max_restarts = 1;
};

struct WorkerCallResult
{
  bool ok = false;
  std::string text;
  std::string error;
  ErrorKind error_kind = ErrorKind::NONE;
  int64_t inference_ms = 0;
  int64_t load_ms = 0;
};

/// 워커 프로토콜 클라이언트
/// - 요청 id로 응답을 매칭하므로 순서가 뒤섞인 응답도 처리
/// - transcribe는 한 번에 하나만 진행하고 나머지는 대기열에서 기다린다
/// - 타임아웃/프로세스 종료 시 재시작 후 1회 재시도, 재시작 한도를 넘으면 이후 호출은 ENGINE_NOT_READY
class WorkerClient
{
public:
  explicit WorkerClient(const WorkerClientConfig & config);
  ~WorkerClient();

  WorkerClient(const WorkerClient &) = delete;
  WorkerClient & operator=(const WorkerClient &) = delete;

  bool start();
  void shutdown();

  WorkerCallResult ping();
  WorkerCallResult preload();
  /// cancel이 켜지면 재시도 전이든 응답 대기 중이든 CANCELLED로 끝난다
  WorkerCallResult transcribe(const std::string & audio_path, const CancelToken * cancel = nullptr);
  /// 진행 중인 transcribe를 취소하고 대기를 깨운다. 이후 도착하는 응답은 버려진다
  void cancel_inflight();

  size_t queue_depth() const { return queue_depth_.load(); }
  int restart_count() const;
  bool unavailable() const;
  bool running() const;
  std::string last_error() const;
  const WorkerClientConfig & config() const { return config_; }

private:
  struct PendingSlot
  {
    bool done = false;
    bool cancelled = false;
    bool process_exit = false;
    WorkerResponse response;
  };

  WorkerCallResult send_request(
    const std::function<std::string(uint64_t)> & build_line,
    std::chrono::milliseconds timeout,
    bool track_transcribe,
    const CancelToken * cancel = nullptr);
  bool spawn_worker(std::string & error);
  bool consume_restart(std::string & error);
  void handle_line(const std::string & line);
  void handle_exit();

  WorkerClientConfig config_;

  mutable std::mutex lifecycle_mutex_;
  std::unique_ptr<WorkerProcess> process_;
  bool started_;
  std::atomic<bool> unavailable_;
  int restarts_used_;
  std::string last_error_;

  mutable std::mutex pending_mutex_;
  std::condition_variable pending_cv_;
  std::unordered_map<std::string, std::shared_ptr<PendingSlot>> pending_;
  uint64_t next_request_id_;
  std::string inflight_transcribe_id_;

  std::mutex transcribe_mutex_;
  std::atomic<size_t> queue_depth_;
};

}  // namespace dictation_cpp
