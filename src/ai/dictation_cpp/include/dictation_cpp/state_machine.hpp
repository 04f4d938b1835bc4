#pragma once

#include <string>

namespace dictation_cpp
{

enum class DictationState
{
  IDLE,
  LISTENING,
  TRANSCRIBING,
  INSERTING
};

enum class DictationMode
{
  PUSH_TO_TOGGLE,
  PUSH_TO_TALK
};

enum class DictationEvent
{
  HOTKEY_DOWN,
  HOTKEY_UP,
  SPEECH_SEGMENT_READY,
  TRANSCRIPTION_COMPLETE,
  INSERTION_COMPLETE,
  CANCEL
};

/// 상태 전이 함수. 정의되지 않은 (state, event) 조합은 현재 상태를 그대로 반환한다
DictationState transition(DictationState state, DictationMode mode, DictationEvent event);

std::string to_string(DictationState state);
std::string to_string(DictationMode mode);
std::string to_string(DictationEvent event);
bool parse_mode(const std::string & text, DictationMode & out);
bool parse_event(const std::string & text, DictationEvent & out);

class StateMachine
{
public:
  explicit StateMachine(DictationMode mode = DictationMode::PUSH_TO_TOGGLE);

  DictationState state() const;
  DictationMode mode() const;
  std::string state_string() const;

  /// 이벤트를 적용하고 전이 후 상태를 반환
  DictationState apply(DictationEvent event);
  /// 모드 변경은 진행 중인 세션을 끝내고 IDLE로 되돌린다
  void set_mode(DictationMode mode);
  void reset();

private:
  DictationState state_;
  DictationMode mode_;
};

}  // namespace dictation_cpp
