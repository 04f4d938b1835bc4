#pragma once

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace dictation_cpp
{

struct SpawnOptions
{
  std::vector<std::string> argv;  // argv[0]은 실행 파일 (PATH 탐색)
  std::vector<std::pair<std::string, std::string>> env;
  bool pipe_stdin = false;
  bool capture_stdout = false;
  bool capture_stderr = false;    // false면 /dev/null
};

enum class CollectStatus
{
  EXITED,
  CANCELLED,
  TIMED_OUT,
  FAILED
};

/// fork/exec 기반 자식 프로세스 핸들. 소멸 시 살아 있으면 종료시킨다
class ChildProcess
{
public:
  ChildProcess();
  ~ChildProcess();

  ChildProcess(const ChildProcess &) = delete;
  ChildProcess & operator=(const ChildProcess &) = delete;

  bool spawn(const SpawnOptions & options);
  bool write_all(const std::string & data);
  void close_stdin();

  /// stdout/stderr를 끝까지 읽고 종료를 기다린다. cancel_flag가 켜지거나 timeout이 지나면 kill
  CollectStatus collect(
    std::string & out_stdout,
    std::string & out_stderr,
    int & out_exit_code,
    const std::atomic<bool> * cancel_flag,
    std::chrono::milliseconds timeout);

  /// SIGTERM → grace 동안 대기 → SIGKILL
  bool terminate(std::chrono::milliseconds grace = std::chrono::milliseconds(2000));
  bool is_alive() const;
  bool try_reap(int & out_exit_code);

  pid_t pid() const { return pid_; }
  int stdout_fd() const { return stdout_fd_; }
  const std::string & last_error() const { return last_error_; }

private:
  void close_fds();

  pid_t pid_;
  int stdin_fd_;
  int stdout_fd_;
  int stderr_fd_;
  std::string last_error_;
};

int decode_wait_status(int status);

}  // namespace dictation_cpp
