#include "dictation_cpp/worker_protocol.hpp"

#include <dictation_common/json_utils.hpp>

#include <sstream>

using namespace std;


namespace dictation_cpp
{

namespace
{

void append_model_params(ostringstream & oss, const WorkerModelParams & params)
{
  oss << ",\"model\":\"" << dictation_common::json_escape(params.model) << "\""
      << ",\"device\":\"" << dictation_common::json_escape(params.device) << "\""
      << ",\"compute_type\":\"" << dictation_common::json_escape(params.compute_type) << "\"";
}

}  // namespace

string build_ping_request(uint64_t id)
{
  ostringstream oss;
  oss << "{\"op\":\"ping\",\"id\":\"" << id << "\"}\n";
  return oss.str();
}

string build_preload_request(uint64_t id, const WorkerModelParams & params)
{
  ostringstream oss;
  oss << "{\"op\":\"preload\",\"id\":\"" << id << "\"";
  append_model_params(oss, params);
  oss << "}\n";
  return oss.str();
}

string build_transcribe_request(
  uint64_t id,
  const string & audio_path,
  const string & language,
  const WorkerModelParams & params,
  int beam_size)
{
  ostringstream oss;
  oss << "{\"op\":\"transcribe\",\"id\":\"" << id << "\""
      << ",\"audio_path\":\"" << dictation_common::json_escape(audio_path) << "\""
      << ",\"language\":\"" << dictation_common::json_escape(language) << "\"";
  append_model_params(oss, params);
  oss << ",\"beam_size\":" << beam_size << "}\n";
  return oss.str();
}

bool parse_worker_response(const string & line, WorkerResponse & out)
{
  if (!dictation_common::looks_like_json_object(line)) {
    return false;
  }

  WorkerResponse parsed;
  if (!dictation_common::extract_json_string_field(line, "id", parsed.id)) {
    // 숫자 id도 허용
    int64_t numeric_id = 0;
    if (!dictation_common::extract_json_int_field(line, "id", numeric_id)) {
      return false;
    }
    parsed.id = std::to_string(numeric_id);
  }
  if (parsed.id.empty()) {
    return false;
  }

  dictation_common::extract_json_bool_field(line, "ok", parsed.ok);
  dictation_common::extract_json_string_field(line, "text", parsed.text);
  dictation_common::extract_json_string_field(line, "error", parsed.error);
  dictation_common::extract_json_int_field(line, "inference_ms", parsed.inference_ms);
  dictation_common::extract_json_int_field(line, "load_ms", parsed.load_ms);
  out = parsed;
  return true;
}

}  // namespace dictation_cpp
