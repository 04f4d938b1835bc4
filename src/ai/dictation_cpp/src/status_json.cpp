#include "dictation_cpp/status_json.hpp"

#include <dictation_common/json_utils.hpp>

#include <iomanip>
#include <sstream>

using namespace std;


namespace dictation_cpp
{

namespace
{

string quoted(const string & value)
{
  return "\"" + dictation_common::json_escape(value) + "\"";
}

const char * bool_text(bool value)
{
  return value ? "true" : "false";
}

}  // namespace

string status_to_json(const PipelineStatus & status)
{
  ostringstream oss;
  oss << "{\"state\":" << quoted(to_string(status.state))
      << ",\"mode\":" << quoted(to_string(status.mode))
      << ",\"profile\":" << quoted(to_string(status.profile))
      << ",\"tuning\":{\"min_chunk_samples\":" << status.tuning.min_chunk_samples
      << ",\"partial_cadence_ms\":" << status.tuning.partial_cadence_ms << "}"
      << ",\"segmenter\":{\"min_chunk_samples\":" << status.segmenter.min_chunk_samples
      << ",\"max_chunk_samples\":" << status.segmenter.max_chunk_samples()
      << ",\"cadence_ms\":" << status.segmenter.cadence_ms
      << ",\"backlog_cap_samples\":" << status.segmenter.backlog_cap_samples() << "}"
      << ",\"engine\":" << quoted(status.engine)
      << ",\"engine_ready\":" << bool_text(status.engine_ready)
      << ",\"last_error\":" << quoted(status.last_error)
      << ",\"last_error_kind\":" << quoted(to_string(status.last_error_kind))
      << "}";
  return oss.str();
}

string diagnostics_to_json(const OrchestratorDiagnostics & diagnostics)
{
  const EngineDiagnostics & engine = diagnostics.engine;
  ostringstream oss;
  oss << "{\"ready\":" << bool_text(engine.ready)
      << ",\"active_engine\":" << quoted(engine.active_engine)
      << ",\"description\":" << quoted(engine.description)
      << ",\"compute_backend\":" << quoted(engine.compute_backend)
      << ",\"using_gpu\":" << bool_text(engine.using_gpu)
      << ",\"resolved_binary_path\":" << quoted(engine.resolved_binary_path)
      << ",\"checked_binary_paths\":[";
  for (size_t i = 0; i < engine.checked_binary_paths.size(); ++i) {
    if (i > 0) {
      oss << ",";
    }
    oss << quoted(engine.checked_binary_paths[i]);
  }
  oss << "]"
      << ",\"resolved_model_path\":" << quoted(engine.resolved_model_path)
      << ",\"model_exists\":" << bool_text(engine.model_exists)
      << ",\"fallback_reason\":" << quoted(engine.fallback_reason)
      << ",\"last_switch_error\":" << quoted(diagnostics.last_switch_error)
      << ",\"queue_depth\":" << diagnostics.queue_depth
      << ",\"dropped_samples\":" << diagnostics.dropped_samples
      << ",\"silent_chunks\":" << diagnostics.silent_chunks
      << ",\"last_sequence_id\":" << diagnostics.last_sequence_id;

  const SessionEnvironment & environment = diagnostics.environment;
  oss << ",\"environment\":{\"os\":" << quoted(environment.os)
      << ",\"session_type\":" << quoted(to_string(environment.session_type))
      << ",\"input_injection_permission\":" << quoted(to_string(environment.injection_permission))
      << ",\"notes\":[";
  for (size_t i = 0; i < environment.notes.size(); ++i) {
    if (i > 0) {
      oss << ",";
    }
    oss << quoted(environment.notes[i]);
  }
  oss << "]}}";
  return oss.str();
}

string insertion_to_json(const InsertionRecord & record)
{
  ostringstream oss;
  oss << "{\"text\":" << quoted(record.text)
      << ",\"status\":" << quoted(to_string(record.status));
  if (!record.error.empty()) {
    oss << ",\"error\":" << quoted(record.error);
  }
  oss << "}";
  return oss.str();
}

string insertions_to_json(const vector<InsertionRecord> & records)
{
  string out = "[";
  for (size_t i = 0; i < records.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += insertion_to_json(records[i]);
  }
  out += "]";
  return out;
}

string profile_to_json(const ChunkProfile & profile)
{
  ostringstream oss;
  oss << fixed << setprecision(2)
      << "{\"sequence_id\":" << profile.sequence_id
      << ",\"samples\":" << profile.samples
      << ",\"queue_ms\":" << profile.queue_ms
      << ",\"resample_ms\":" << profile.resample_ms
      << ",\"vad_ms\":" << profile.vad_ms
      << ",\"inference_ms\":" << profile.inference_ms
      << ",\"emit_ms\":" << profile.emit_ms
      << ",\"ok\":" << bool_text(profile.ok)
      << "}";
  return oss.str();
}

}  // namespace dictation_cpp
