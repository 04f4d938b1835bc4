#pragma once

#include <cstdio>
#include <string>
#include <sys/wait.h>

#include "dictation_common/string_utils.hpp"

namespace dictation_common
{

/// 셸 명령 실행 결과
struct ShellResult
{
  bool ok = false;        ///< exit_code == 0
  int exit_code = -1;     ///< -1: popen/pclose 실패, 시그널 종료는 128 + 시그널 번호
  std::string output;     ///< stdout (max_output_bytes까지만 보관)
  bool truncated = false;
};

/// /bin/sh -c 로 명령을 실행하고 stdout을 끝까지 읽는다
/// stderr가 필요하면 명령에 2>&1을 붙인다. 보관 한도를 넘는 출력은 읽기만 하고 버림
inline ShellResult run_shell_command(const std::string & command, size_t max_output_bytes = 64 * 1024)
{
  ShellResult out;

  FILE * pipe = popen(command.c_str(), "r");
  if (!pipe) {
    return out;
  }

  char buffer[512];
  size_t n = 0;
  while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
    const size_t room = out.output.size() < max_output_bytes ?
      max_output_bytes - out.output.size() : 0;
    if (n > room) {
      out.truncated = true;
    }
    out.output.append(buffer, n < room ? n : room);
  }

  const int status = pclose(pipe);
  if (status == -1) {
    return out;
  }
  if (WIFEXITED(status)) {
    out.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    out.exit_code = 128 + WTERMSIG(status);
  } else {
    out.exit_code = status;
  }
  out.ok = out.exit_code == 0;
  return out;
}

/// PATH에서 실행 파일을 찾을 수 있는지 (command -v)
inline bool command_available(const std::string & name)
{
  if (trim(name).empty()) {
    return false;
  }
  return run_shell_command("command -v " + shell_escape_single_quote(name) + " >/dev/null 2>&1").ok;
}

}  // namespace dictation_common
