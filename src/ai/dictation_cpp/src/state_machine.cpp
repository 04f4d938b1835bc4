#include "dictation_cpp/state_machine.hpp"

#include <dictation_common/string_utils.hpp>

using namespace std;


namespace dictation_cpp
{

DictationState transition(DictationState state, DictationMode mode, DictationEvent event)
{
  switch (state) {
    case DictationState::IDLE:
      if (event == DictationEvent::HOTKEY_DOWN) {
        return DictationState::LISTENING;
      }
      return state;
    case DictationState::LISTENING:
      if (event == DictationEvent::SPEECH_SEGMENT_READY) {
        return DictationState::TRANSCRIBING;
      }
      if (event == DictationEvent::CANCEL) {
        return DictationState::IDLE;
      }
      if (mode == DictationMode::PUSH_TO_TOGGLE && event == DictationEvent::HOTKEY_DOWN) {
        return DictationState::IDLE;
      }
      if (mode == DictationMode::PUSH_TO_TALK && event == DictationEvent::HOTKEY_UP) {
        return DictationState::IDLE;
      }
      return state;
    case DictationState::TRANSCRIBING:
      if (event == DictationEvent::TRANSCRIPTION_COMPLETE) {
        return DictationState::INSERTING;
      }
      if (event == DictationEvent::CANCEL) {
        return DictationState::IDLE;
      }
      return state;
    case DictationState::INSERTING:
      if (event == DictationEvent::INSERTION_COMPLETE || event == DictationEvent::CANCEL) {
        return DictationState::IDLE;
      }
      return state;
    default:
      return state;
  }
}

string to_string(DictationState state)
{
  switch (state) {
    case DictationState::IDLE:
      return "idle";
    case DictationState::LISTENING:
      return "listening";
    case DictationState::TRANSCRIBING:
      return "transcribing";
    case DictationState::INSERTING:
      return "inserting";
    default:
      return "unknown";
  }
}

string to_string(DictationMode mode)
{
  return mode == DictationMode::PUSH_TO_TALK ? "push_to_talk" : "push_to_toggle";
}

string to_string(DictationEvent event)
{
  switch (event) {
    case DictationEvent::HOTKEY_DOWN:
      return "hotkey_down";
    case DictationEvent::HOTKEY_UP:
      return "hotkey_up";
    case DictationEvent::SPEECH_SEGMENT_READY:
      return "speech_segment_ready";
    case DictationEvent::TRANSCRIPTION_COMPLETE:
      return "transcription_complete";
    case DictationEvent::INSERTION_COMPLETE:
      return "insertion_complete";
    case DictationEvent::CANCEL:
      return "cancel";
    default:
      return "unknown";
  }
}

bool parse_mode(const string & text, DictationMode & out)
{
  const string value = dictation_common::to_lower(dictation_common::trim(text));
  if (value == "push_to_toggle" || value == "toggle") {
    out = DictationMode::PUSH_TO_TOGGLE;
    return true;
  }
  if (value == "push_to_talk" || value == "ptt") {
    out = DictationMode::PUSH_TO_TALK;
    return true;
  }
  return false;
}

bool parse_event(const string & text, DictationEvent & out)
{
  const string value = dictation_common::to_lower(dictation_common::trim(text));
  if (value == "down" || value == "hotkey_down") {
    out = DictationEvent::HOTKEY_DOWN;
  } else if (value == "up" || value == "hotkey_up") {
    out = DictationEvent::HOTKEY_UP;
  } else if (value == "cancel") {
    out = DictationEvent::CANCEL;
  } else if (value == "speech_segment_ready") {
    out = DictationEvent::SPEECH_SEGMENT_READY;
  } else if (value == "transcription_complete") {
    out = DictationEvent::TRANSCRIPTION_COMPLETE;
  } else if (value == "insertion_complete") {
    out = DictationEvent::INSERTION_COMPLETE;
  } else {
    return false;
  }
  return true;
}

StateMachine::StateMachine(DictationMode mode)
: state_(DictationState::IDLE), mode_(mode)
{
}

DictationState StateMachine::state() const
{
  return state_;
}

DictationMode StateMachine::mode() const
{
  return mode_;
}

string StateMachine::state_string() const
{
  return to_string(state_);
}

DictationState StateMachine::apply(DictationEvent event)
{
  state_ = transition(state_, mode_, event);
  return state_;
}

void StateMachine::set_mode(DictationMode mode)
{
  mode_ = mode;
  state_ = DictationState::IDLE;
}

void StateMachine::reset()
{
  state_ = DictationState::IDLE;
}

}  // namespace dictation_cpp
