#pragma once

#include <string>
#include <vector>

#include "dictation_cpp/insertion.hpp"
#include "dictation_cpp/orchestrator.hpp"

namespace dictation_cpp
{

// 토픽 발행용 JSON 직렬화
std::string status_to_json(const PipelineStatus & status);
std::string diagnostics_to_json(const OrchestratorDiagnostics & diagnostics);
std::string insertion_to_json(const InsertionRecord & record);
std::string insertions_to_json(const std::vector<InsertionRecord> & records);
std::string profile_to_json(const ChunkProfile & profile);

}  // namespace dictation_cpp
