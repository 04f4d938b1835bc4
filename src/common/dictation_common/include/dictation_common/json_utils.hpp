#pragma once

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace dictation_common
{

/// JSON 문자열 값에 들어갈 특수문자를 이스케이프 처리
inline std::string json_escape(const std::string & value)
{
  std::string out;
  out.reserve(value.size() + 16);
  for (const char c : value) {
    switch (c) {
      case '\"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          static const char kHex[] = "0123456789abcdef";
          out += "\\u00";
          out.push_back(kHex[(c >> 4) & 0x0F]);
          out.push_back(kHex[c & 0x0F]);
        } else {
          out.push_back(c);
        }
        break;
    }
  }
  return out;
}

/// 한 줄이 JSON 객체 형태({ ... })인지 간단히 판별
inline bool looks_like_json_object(const std::string & line)
{
  size_t start = 0;
  while (start < line.size() && std::isspace(static_cast<unsigned char>(line[start])) != 0) {
    ++start;
  }
  size_t end = line.size();
  while (end > start && std::isspace(static_cast<unsigned char>(line[end - 1])) != 0) {
    --end;
  }
  return end - start >= 2 && line[start] == '{' && line[end - 1] == '}';
}

/// "field": 뒤 값의 시작 위치를 찾는다 (공백 건너뜀). 키가 값 위치에 있으면 다음 후보로 진행
inline size_t find_json_value_start(const std::string & json, const std::string & field)
{
  const std::string key = "\"" + field + "\"";
  size_t key_pos = json.find(key);
  while (key_pos != std::string::npos) {
    size_t pos = key_pos + key.size();
    while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos])) != 0) {
      ++pos;
    }
    if (pos < json.size() && json[pos] == ':') {
      ++pos;
      while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos])) != 0) {
        ++pos;
      }
      return pos < json.size() ? pos : std::string::npos;
    }
    key_pos = json.find(key, key_pos + 1);
  }
  return std::string::npos;
}

/// JSON 응답에서 특정 문자열 필드 값을 추출 (경량 파서, 외부 라이브러리 불필요)
/// "field":"value" 패턴을 찾아 이스케이프를 해제한 value를 out에 저장
inline bool extract_json_string_field(
  const std::string & json, const std::string & field, std::string & out)
{
  const size_t value_pos = find_json_value_start(json, field);
  if (value_pos == std::string::npos || json[value_pos] != '"') {
    return false;
  }

  std::string value;
  bool escaping = false;
  for (size_t i = value_pos + 1; i < json.size(); ++i) {
    const char c = json[i];
    if (escaping) {
      switch (c) {
        case '"':
        case '\\':
        case '/':
          value.push_back(c);
          break;
        case 'b':
          value.push_back('\b');
          break;
        case 'f':
          value.push_back('\f');
          break;
        case 'n':
          value.push_back('\n');
          break;
        case 'r':
          value.push_back('\r');
          break;
        case 't':
          value.push_back('\t');
          break;
        case 'u':
          // ASCII 범위(\u00XX)만 복원, 그 외는 '?'로 대체
          if (i + 4 < json.size()) {
            const std::string hex = json.substr(i + 1, 4);
            const long code = std::strtol(hex.c_str(), nullptr, 16);
            value.push_back(code > 0 && code < 0x80 ? static_cast<char>(code) : '?');
            i += 4;
          }
          break;
        default:
          value.push_back(c);
          break;
      }
      escaping = false;
      continue;
    }
    if (c == '\\') {
      escaping = true;
      continue;
    }
    if (c == '"') {
      out = value;
      return true;
    }
    value.push_back(c);
  }
  return false;
}

/// "field":true|false 값을 추출
inline bool extract_json_bool_field(
  const std::string & json, const std::string & field, bool & out)
{
  const size_t value_pos = find_json_value_start(json, field);
  if (value_pos == std::string::npos) {
    return false;
  }
  if (json.compare(value_pos, 4, "true") == 0) {
    out = true;
    return true;
  }
  if (json.compare(value_pos, 5, "false") == 0) {
    out = false;
    return true;
  }
  return false;
}

/// "field":123 형태의 정수 값을 추출 (소수부는 버림, int64 범위 밖이나 NaN이면 false)
inline bool extract_json_int_field(
  const std::string & json, const std::string & field, int64_t & out)
{
  const size_t value_pos = find_json_value_start(json, field);
  if (value_pos == std::string::npos) {
    return false;
  }
  const char * begin = json.c_str() + value_pos;
  char * end = nullptr;
  const double parsed = std::strtod(begin, &end);
  if (end == begin) {
    return false;
  }
  // 2^63은 double로 정확히 표현된다
  constexpr double kInt64Bound = 9223372036854775808.0;
  if (!(parsed >= -kInt64Bound && parsed < kInt64Bound)) {
    return false;
  }
  out = static_cast<int64_t>(parsed);
  return true;
}

}  // namespace dictation_common
