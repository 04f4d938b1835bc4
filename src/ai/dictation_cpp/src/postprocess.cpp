#include "dictation_cpp/postprocess.hpp"

#include <dictation_common/string_utils.hpp>

#include <cctype>

using namespace std;


namespace dictation_cpp
{

string normalize_transcript(const string & input)
{
  string sentence = dictation_common::collapse_whitespace(input);
  if (sentence.empty()) {
    return sentence;
  }

  sentence[0] = static_cast<char>(toupper(static_cast<unsigned char>(sentence[0])));
  const char last = sentence.back();
  if (last != '.' && last != '!' && last != '?') {
    sentence.push_back('.');
  }
  return sentence;
}

bool is_duplicate_transcript(const string & previous, const string & current)
{
  const string normalized = dictation_common::to_lower(dictation_common::trim(current));
  if (normalized.empty()) {
    return true;
  }
  return dictation_common::to_lower(dictation_common::trim(previous)) == normalized;
}

}  // namespace dictation_cpp
