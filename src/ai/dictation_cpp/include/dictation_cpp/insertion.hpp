#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dictation_cpp
{

enum class InsertionStatus
{
  SUCCESS,
  FALLBACK,
  FAILURE
};

std::string to_string(InsertionStatus status);

struct InsertionRecord
{
  std::string text;
  InsertionStatus status = InsertionStatus::FAILURE;
  std::string error;
};

/// 포커스된 앱에 텍스트를 넣는 OS 어댑터 계약
class InsertionAdapter
{
public:
  virtual ~InsertionAdapter() = default;
  /// 성공하면 true, 실패하면 error에 사유
  virtual bool attempt(const std::string & text, std::string & error) = 0;
  virtual std::string name() const = 0;
};

/// 최근 삽입 기록. 최신이 앞, 최대 capacity개
class InsertionHistory
{
public:
  explicit InsertionHistory(size_t capacity = 3);

  void push(const InsertionRecord & record);
  std::vector<InsertionRecord> snapshot() const;
  size_t capacity() const { return capacity_; }

private:
  size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<InsertionRecord> records_;
};

/// 직접 입력 → (허용 시) 클립보드 대체 입력 순서로 시도
class InsertionController
{
public:
  InsertionController(
    std::shared_ptr<InsertionAdapter> primary,
    std::shared_ptr<InsertionAdapter> secondary,
    bool fallback_enabled = true);

  InsertionRecord insert(const std::string & text);

  void set_fallback_enabled(bool enabled);
  bool fallback_enabled() const;
  std::vector<InsertionRecord> recent() const { return history_.snapshot(); }

private:
  std::shared_ptr<InsertionAdapter> primary_;
  std::shared_ptr<InsertionAdapter> secondary_;
  mutable std::mutex mutex_;
  bool fallback_enabled_;
  InsertionHistory history_;
};

enum class SessionType
{
  X11,
  WAYLAND,
  UNKNOWN
};

enum class InjectionPermission
{
  READY,
  NEEDS_SETUP,
  UNKNOWN
};

std::string to_string(SessionType type);
std::string to_string(InjectionPermission permission);

/// 전역 텍스트 입력이 가능한 데스크톱 세션인지에 대한 진단
struct SessionEnvironment
{
  std::string os;
  SessionType session_type = SessionType::UNKNOWN;
  InjectionPermission injection_permission = InjectionPermission::UNKNOWN;
  std::vector<std::string> notes;
};

/// XDG_SESSION_TYPE 값 해석 (대소문자 무시, null이면 UNKNOWN)
SessionType parse_session_type(const char * value);
SessionEnvironment describe_session_environment(const std::string & os, SessionType type);
/// uname의 OS 이름과 XDG_SESSION_TYPE으로 현재 세션 진단
SessionEnvironment detect_session_environment();

/// 설정된 셸 명령 뒤에 텍스트를 작은따옴표로 감싸 붙여 실행 (예: xdotool type --)
class CommandInsertionAdapter : public InsertionAdapter
{
public:
  CommandInsertionAdapter(std::string name, std::string command);

  bool attempt(const std::string & text, std::string & error) override;
  std::string name() const override { return name_; }

private:
  std::string name_;
  std::string command_;
};

}  // namespace dictation_cpp
