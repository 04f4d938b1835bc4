#include "dictation_cpp/child_process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <initializer_list>
#include <mutex>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char ** environ;

using namespace std;


namespace dictation_cpp
{

namespace
{

void ignore_sigpipe_once()
{
  // 죽은 워커의 stdin에 쓰면 SIGPIPE로 프로세스 전체가 종료되므로 무시하고 EPIPE로 처리
  static once_flag flag;
  call_once(flag, []() { signal(SIGPIPE, SIG_IGN); });
}

void close_fd(int & fd)
{
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

bool drain_fd(int & fd, string & out)
{
  char buffer[4096];
  const ssize_t n = read(fd, buffer, sizeof(buffer));
  if (n > 0) {
    out.append(buffer, static_cast<size_t>(n));
    return true;
  }
  if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
    return true;
  }
  close_fd(fd);
  return false;
}

}  // namespace

int decode_wait_status(int status)
{
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return status;
}

ChildProcess::ChildProcess()
: pid_(-1), stdin_fd_(-1), stdout_fd_(-1), stderr_fd_(-1)
{
}

ChildProcess::~ChildProcess()
{
  terminate(chrono::milliseconds(500));
  close_fds();
}

bool ChildProcess::spawn(const SpawnOptions & options)
{
  if (pid_ > 0 && is_alive()) {
    last_error_ = "process already running";
    return false;
  }
  if (options.argv.empty() || options.argv.front().empty()) {
    last_error_ = "empty command";
    return false;
  }
  ignore_sigpipe_once();
  close_fds();

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  auto close_pipes = [&]() {
      for (int * p : {in_pipe, out_pipe, err_pipe}) {
        close_fd(p[0]);
        close_fd(p[1]);
      }
    };
  if ((options.pipe_stdin && pipe2(in_pipe, O_CLOEXEC) != 0) ||
    (options.capture_stdout && pipe2(out_pipe, O_CLOEXEC) != 0) ||
    (options.capture_stderr && pipe2(err_pipe, O_CLOEXEC) != 0))
  {
    last_error_ = string("pipe failed: ") + strerror(errno);
    close_pipes();
    return false;
  }

  // fork 이후에는 메모리 할당을 피하기 위해 argv/envp를 미리 구성
  vector<char *> argv;
  argv.reserve(options.argv.size() + 1);
  for (const auto & arg : options.argv) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  vector<string> env_storage;
  for (char ** e = environ; e != nullptr && *e != nullptr; ++e) {
    const string entry(*e);
    bool overridden = false;
    for (const auto & kv : options.env) {
      if (entry.compare(0, kv.first.size() + 1, kv.first + "=") == 0) {
        overridden = true;
        break;
      }
    }
    if (!overridden) {
      env_storage.push_back(entry);
    }
  }
  for (const auto & kv : options.env) {
    env_storage.push_back(kv.first + "=" + kv.second);
  }
  vector<char *> envp;
  envp.reserve(env_storage.size() + 1);
  for (auto & entry : env_storage) {
    envp.push_back(const_cast<char *>(entry.c_str()));
  }
  envp.push_back(nullptr);

  const pid_t pid = fork();
  if (pid < 0) {
    last_error_ = string("fork failed: ") + strerror(errno);
    close_pipes();
    return false;
  }

  if (pid == 0) {
    const int dev_null = open("/dev/null", O_RDWR);
    dup2(options.pipe_stdin ? in_pipe[0] : dev_null, STDIN_FILENO);
    dup2(options.capture_stdout ? out_pipe[1] : dev_null, STDOUT_FILENO);
    dup2(options.capture_stderr ? err_pipe[1] : dev_null, STDERR_FILENO);
    environ = envp.data();
    execvp(argv[0], argv.data());
    _exit(127);
  }

  pid_ = pid;
  close_fd(in_pipe[0]);
  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  stdin_fd_ = in_pipe[1];
  stdout_fd_ = out_pipe[0];
  stderr_fd_ = err_pipe[0];
  last_error_.clear();
  return true;
}

bool ChildProcess::write_all(const string & data)
{
  if (stdin_fd_ < 0) {
    last_error_ = "stdin is not available";
    return false;
  }
  size_t written = 0;
  while (written < data.size()) {
    const ssize_t n = write(stdin_fd_, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      last_error_ = string("write failed: ") + strerror(errno);
      return false;
    }
    written += static_cast<size_t>(n);
  }
  return true;
}

void ChildProcess::close_stdin()
{
  close_fd(stdin_fd_);
}

CollectStatus ChildProcess::collect(
  string & out_stdout,
  string & out_stderr,
  int & out_exit_code,
  const atomic<bool> * cancel_flag,
  chrono::milliseconds timeout)
{
  if (pid_ <= 0) {
    last_error_ = "process not started";
    return CollectStatus::FAILED;
  }
  const auto deadline = chrono::steady_clock::now() + timeout;

  while (stdout_fd_ >= 0 || stderr_fd_ >= 0) {
    if (cancel_flag && cancel_flag->load()) {
      terminate(chrono::milliseconds(200));
      return CollectStatus::CANCELLED;
    }
    if (chrono::steady_clock::now() >= deadline) {
      terminate(chrono::milliseconds(200));
      return CollectStatus::TIMED_OUT;
    }

    pollfd fds[2];
    nfds_t count = 0;
    if (stdout_fd_ >= 0) {
      fds[count++] = {stdout_fd_, POLLIN, 0};
    }
    if (stderr_fd_ >= 0) {
      fds[count++] = {stderr_fd_, POLLIN, 0};
    }
    const int ready = poll(fds, count, 50);
    if (ready < 0 && errno != EINTR) {
      last_error_ = string("poll failed: ") + strerror(errno);
      terminate(chrono::milliseconds(200));
      return CollectStatus::FAILED;
    }
    for (nfds_t i = 0; ready > 0 && i < count; ++i) {
      if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
        continue;
      }
      if (fds[i].fd == stdout_fd_) {
        drain_fd(stdout_fd_, out_stdout);
      } else if (fds[i].fd == stderr_fd_) {
        drain_fd(stderr_fd_, out_stderr);
      }
    }
  }

  // 파이프가 닫힌 뒤 종료 코드 회수
  while (true) {
    if (try_reap(out_exit_code)) {
      return CollectStatus::EXITED;
    }
    if (pid_ <= 0) {
      last_error_ = "process disappeared";
      return CollectStatus::FAILED;
    }
    if (cancel_flag && cancel_flag->load()) {
      terminate(chrono::milliseconds(200));
      return CollectStatus::CANCELLED;
    }
    if (chrono::steady_clock::now() >= deadline) {
      terminate(chrono::milliseconds(200));
      return CollectStatus::TIMED_OUT;
    }
    this_thread::sleep_for(chrono::milliseconds(10));
  }
}

bool ChildProcess::try_reap(int & out_exit_code)
{
  if (pid_ <= 0) {
    return false;
  }
  int status = 0;
  const pid_t waited = waitpid(pid_, &status, WNOHANG);
  if (waited == pid_) {
    out_exit_code = decode_wait_status(status);
    pid_ = -1;
    return true;
  }
  if (waited < 0 && errno == ECHILD) {
    pid_ = -1;
  }
  return false;
}

bool ChildProcess::terminate(chrono::milliseconds grace)
{
  close_fd(stdin_fd_);
  if (pid_ <= 0) {
    return true;
  }

  if (kill(pid_, SIGTERM) != 0 && errno != ESRCH) {
    last_error_ = "failed to send SIGTERM";
  }

  const auto deadline = chrono::steady_clock::now() + grace;
  while (chrono::steady_clock::now() < deadline) {
    int status = 0;
    const pid_t waited = waitpid(pid_, &status, WNOHANG);
    if (waited == pid_ || (waited < 0 && errno == ECHILD)) {
      pid_ = -1;
      return true;
    }
    this_thread::sleep_for(chrono::milliseconds(20));
  }

  if (kill(pid_, SIGKILL) != 0 && errno != ESRCH) {
    last_error_ = "failed to send SIGKILL";
  }
  waitpid(pid_, nullptr, 0);
  pid_ = -1;
  return true;
}

bool ChildProcess::is_alive() const
{
  if (pid_ <= 0) {
    return false;
  }
  if (kill(pid_, 0) == 0) {
    return true;
  }
  return errno == EPERM;
}

void ChildProcess::close_fds()
{
  close_fd(stdin_fd_);
  close_fd(stdout_fd_);
  close_fd(stderr_fd_);
}

}  // namespace dictation_cpp
