#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "dictation_cpp/child_process.hpp"

namespace dictation_cpp
{

struct WorkerLaunchConfig
{
  std::string binary_path;
  std::vector<std::string> args{"--stdio"};
  std::vector<std::pair<std::string, std::string>> env;
};

/// 상주 워커 프로세스. stdin 쓰기는 단일 writer로 직렬화하고 stdout은 전용 리스너 스레드가 줄 단위로 읽는다
class WorkerProcess
{
public:
  using LineCallback = std::function<void (const std::string &)>;
  using ExitCallback = std::function<void ()>;

  WorkerProcess(LineCallback on_line, ExitCallback on_exit);
  ~WorkerProcess();

  WorkerProcess(const WorkerProcess &) = delete;
  WorkerProcess & operator=(const WorkerProcess &) = delete;

  bool start(const WorkerLaunchConfig & config);
  /// line 끝에 개행이 없으면 붙여서 전송
  bool write_line(const std::string & line);
  /// SIGTERM → 유예 → SIGKILL 후 리스너 종료 대기. 이때는 exit 콜백을 부르지 않는다
  void stop();

  bool running() const { return running_.load(); }
  std::string last_error() const;

private:
  void listen_loop(int fd);

  LineCallback on_line_;
  ExitCallback on_exit_;
  ChildProcess child_;
  std::thread listener_;
  std::atomic<bool> running_;
  std::atomic<bool> stop_requested_;
  mutable std::mutex write_mutex_;
  std::string last_error_;
};

}  // namespace dictation_cpp
