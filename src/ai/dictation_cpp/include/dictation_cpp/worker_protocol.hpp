#pragma once

#include <cstdint>
#include <string>

namespace dictation_cpp
{

/// 워커 모델 파라미터 (preload/transcribe 공통)
struct WorkerModelParams
{
  std::string model = "small.en";
  std::string device = "cpu";
  std::string compute_type = "int8";
};

struct WorkerResponse
{
  std::string id;
  bool ok = false;
  std::string text;
  std::string error;
  int64_t inference_ms = 0;
  int64_t load_ms = 0;
};

// 요청 한 줄 = JSON 객체 + '\n'
std::string build_ping_request(uint64_t id);
std::string build_preload_request(uint64_t id, const WorkerModelParams & params);
std::string build_transcribe_request(
  uint64_t id,
  const std::string & audio_path,
  const std::string & language,
  const WorkerModelParams & params,
  int beam_size);

/// 응답 한 줄 파싱. JSON 객체가 아니거나 id가 없으면 false (호출 측은 무시)
bool parse_worker_response(const std::string & line, WorkerResponse & out);

}  // namespace dictation_cpp
