#pragma once

#include <string>

namespace dictation_cpp
{

/// 공백 정리, 첫 글자 대문자화, 문장부호(.!?)가 없으면 마침표 추가
std::string normalize_transcript(const std::string & input);

/// 빈 문자열이거나 직전 전사와 대소문자 무시 동일하면 중복
bool is_duplicate_transcript(const std::string & previous, const std::string & current);

}  // namespace dictation_cpp
