#include "dictation_cpp/insertion.hpp"

#include <dictation_common/shell_utils.hpp>
#include <dictation_common/string_utils.hpp>

#include <sys/utsname.h>

#include <cstdlib>
#include <utility>

using namespace std;


namespace dictation_cpp
{

string to_string(InsertionStatus status)
{
  switch (status) {
    case InsertionStatus::SUCCESS:
      return "success";
    case InsertionStatus::FALLBACK:
      return "fallback";
    default:
      return "failure";
  }
}

InsertionHistory::InsertionHistory(size_t capacity)
: capacity_(capacity == 0 ? 1 : capacity)
{
}

void InsertionHistory::push(const InsertionRecord & record)
{
  lock_guard<mutex> lock(mutex_);
  records_.push_front(record);
  while (records_.size() > capacity_) {
    records_.pop_back();
  }
}

vector<InsertionRecord> InsertionHistory::snapshot() const
{
  lock_guard<mutex> lock(mutex_);
  return vector<InsertionRecord>(records_.begin(), records_.end());
}

InsertionController::InsertionController(
  shared_ptr<InsertionAdapter> primary,
  shared_ptr<InsertionAdapter> secondary,
  bool fallback_enabled)
: primary_(move(primary)), secondary_(move(secondary)), fallback_enabled_(fallback_enabled)
{
}

InsertionRecord InsertionController::insert(const string & text)
{
  InsertionRecord record;
  record.text = text;

  string primary_error = "no direct insertion adapter";
  if (primary_ && primary_->attempt(text, primary_error)) {
    record.status = InsertionStatus::SUCCESS;
    history_.push(record);
    return record;
  }

  if (fallback_enabled() && secondary_) {
    string secondary_error;
    if (secondary_->attempt(text, secondary_error)) {
      record.status = InsertionStatus::FALLBACK;
      record.error = primary_error;
    } else {
      record.status = InsertionStatus::FAILURE;
      record.error = primary_error + "; fallback failed: " + secondary_error;
    }
  } else {
    record.status = InsertionStatus::FAILURE;
    record.error = primary_error;
  }
  history_.push(record);
  return record;
}

void InsertionController::set_fallback_enabled(bool enabled)
{
  lock_guard<mutex> lock(mutex_);
  fallback_enabled_ = enabled;
}

bool InsertionController::fallback_enabled() const
{
  lock_guard<mutex> lock(mutex_);
  return fallback_enabled_;
}

CommandInsertionAdapter::CommandInsertionAdapter(string name, string command)
: name_(move(name)), command_(move(command))
{
}

bool CommandInsertionAdapter::attempt(const string & text, string & error)
{
  if (dictation_common::trim(command_).empty()) {
    error = name_ + " insertion command is not configured";
    return false;
  }
  const string command = command_ + " " + dictation_common::shell_escape_single_quote(text) +
    " 2>&1";
  const dictation_common::ShellResult result = dictation_common::run_shell_command(command);
  if (!result.ok) {
    error = name_ + " insertion failed (exit " + std::to_string(result.exit_code) + ")";
    const string detail = dictation_common::trim(result.output);
    if (!detail.empty()) {
      error += ": " + detail;
    }
    return false;
  }
  return true;
}

string to_string(SessionType type)
{
  switch (type) {
    case SessionType::X11:
      return "x11";
    case SessionType::WAYLAND:
      return "wayland";
    default:
      return "unknown";
  }
}

string to_string(InjectionPermission permission)
{
  switch (permission) {
    case InjectionPermission::READY:
      return "ready";
    case InjectionPermission::NEEDS_SETUP:
      return "needs_setup";
    default:
      return "unknown";
  }
}

SessionType parse_session_type(const char * value)
{
  if (!value) {
    return SessionType::UNKNOWN;
  }
  const string lowered = dictation_common::to_lower(dictation_common::trim(value));
  if (lowered == "x11") {
    return SessionType::X11;
  }
  if (lowered == "wayland") {
    return SessionType::WAYLAND;
  }
  return SessionType::UNKNOWN;
}

SessionEnvironment describe_session_environment(const string & os, SessionType type)
{
  SessionEnvironment out;
  out.os = os;
  out.session_type = type;

  if (os == "linux") {
    if (type == SessionType::X11) {
      out.injection_permission = InjectionPermission::READY;
      out.notes.push_back("X11 session detected; global text insertion is supported.");
    } else {
      out.injection_permission = InjectionPermission::NEEDS_SETUP;
      out.notes.push_back("Non-X11 session detected; switch to X11 for supported global insertion.");
    }
  } else if (os == "darwin") {
    out.injection_permission = InjectionPermission::NEEDS_SETUP;
    out.notes.push_back("Grant Accessibility and Input Monitoring permissions for global insertion.");
  } else {
    out.notes.push_back("Unsupported OS for guaranteed insertion behavior.");
  }

  if (type == SessionType::WAYLAND) {
    out.notes.push_back("Wayland may block global text injection; use X11 for full dictation support.");
  }
  return out;
}

SessionEnvironment detect_session_environment()
{
  string os = "unknown";
  struct utsname info;
  if (uname(&info) == 0) {
    os = dictation_common::to_lower(info.sysname);
  }
  return describe_session_environment(os, parse_session_type(getenv("XDG_SESSION_TYPE")));
}

}  // namespace dictation_cpp
