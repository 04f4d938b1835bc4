#include "dictation_cpp/worker_process.hpp"

#include <cerrno>
#include <iostream>
#include <utility>

#include <poll.h>
#include <unistd.h>

using namespace std;


namespace dictation_cpp
{

WorkerProcess::WorkerProcess(LineCallback on_line, ExitCallback on_exit)
: on_line_(move(on_line)), on_exit_(move(on_exit)), running_(false), stop_requested_(false)
{
}

WorkerProcess::~WorkerProcess()
{
  stop();
}

bool WorkerProcess::start(const WorkerLaunchConfig & config)
{
  stop();

  SpawnOptions options;
  options.argv.push_back(config.binary_path);
  options.argv.insert(options.argv.end(), config.args.begin(), config.args.end());
  options.env = config.env;
  options.pipe_stdin = true;
  options.capture_stdout = true;
  options.capture_stderr = false;

  lock_guard<mutex> lock(write_mutex_);
  if (!child_.spawn(options)) {
    last_error_ = "failed to spawn worker '" + config.binary_path + "': " + child_.last_error();
    return false;
  }

  stop_requested_.store(false);
  running_.store(true);
  last_error_.clear();
  listener_ = thread(&WorkerProcess::listen_loop, this, child_.stdout_fd());
  return true;
}

bool WorkerProcess::write_line(const string & line)
{
  lock_guard<mutex> lock(write_mutex_);
  if (!running_.load()) {
    last_error_ = "worker is not running";
    return false;
  }
  const bool ok = line.empty() || line.back() != '\n' ?
    child_.write_all(line + "\n") : child_.write_all(line);
  if (!ok) {
    last_error_ = "failed to write worker request: " + child_.last_error();
  }
  return ok;
}

void WorkerProcess::stop()
{
  stop_requested_.store(true);
  {
    lock_guard<mutex> lock(write_mutex_);
    child_.terminate(chrono::milliseconds(1000));
  }
  if (listener_.joinable()) {
    listener_.join();
  }
  running_.store(false);
}

string WorkerProcess::last_error() const
{
  lock_guard<mutex> lock(write_mutex_);
  return last_error_;
}

void WorkerProcess::listen_loop(int fd)
{
  string buffer;
  char chunk[4096];

  while (!stop_requested_.load()) {
    pollfd pfd{fd, POLLIN, 0};
    const int ready = poll(&pfd, 1, 100);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (ready == 0) {
      continue;
    }

    const ssize_t n = read(fd, chunk, sizeof(chunk));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      break;
    }
    if (n == 0) {
      break;
    }

    buffer.append(chunk, static_cast<size_t>(n));
    size_t newline = buffer.find('\n');
    while (newline != string::npos) {
      string line = buffer.substr(0, newline);
      buffer.erase(0, newline + 1);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      if (!line.empty() && on_line_) {
        on_line_(line);
      }
      newline = buffer.find('\n');
    }
  }

  running_.store(false);
  if (!stop_requested_.load()) {
    cerr << "[dictation_cpp] worker stdout closed, process exited" << endl;
    if (on_exit_) {
      on_exit_();
    }
  }
}

}  // namespace dictation_cpp
