#include "dictation_cpp/dictation_node.hpp"

#include <chrono>
#include <functional>
#include <initializer_list>
#include <utility>

#include "dictation_cpp/insertion.hpp"
#include "dictation_cpp/silero_vad.hpp"
#include "dictation_cpp/status_json.hpp"

using namespace std;


namespace dictation_cpp
{

namespace
{
constexpr size_t kMaxQueuedChunks = 64;
}  // namespace

/// 노드 초기화: 파라미터 로드 → 오케스트레이터(엔진 런타임) 생성 → 토픽 연결 → 처리 스레드/캡처 시작
DictationNode::DictationNode()
: Node("dictation_node"), vad_threshold_(0.5), live_capture_enabled_(false),
  audio_sample_rate_(16000), profiling_enabled_(false), diagnostics_period_sec_(2.0),
  hotkey_topic_("/dictation/hotkey"), audio_topic_("/dictation/audio"),
  state_topic_("/dictation/state"), transcript_topic_("/dictation/transcript"),
  insertion_topic_("/dictation/insertion"), diagnostics_topic_("/dictation/diagnostics"),
  profile_topic_("/dictation/profile"), running_(true)
{
  declare_and_get_parameters();

  pub_state_ = create_publisher<std_msgs::msg::String>(state_topic_, 10);
  pub_transcript_ = create_publisher<std_msgs::msg::String>(transcript_topic_, 10);
  pub_insertion_ = create_publisher<std_msgs::msg::String>(insertion_topic_, 10);
  pub_diagnostics_ = create_publisher<std_msgs::msg::String>(diagnostics_topic_, 10);
  pub_profile_ = create_publisher<std_msgs::msg::String>(profile_topic_, 10);

  orchestrator_ = make_unique<Orchestrator>(
    settings_,
    make_shared<CommandInsertionAdapter>("direct", direct_insert_command_),
    make_shared<CommandInsertionAdapter>("clipboard", clipboard_insert_command_));
  const OrchestratorDiagnostics diagnostics = orchestrator_->diagnostics();
  if (diagnostics.engine.ready) {
    RCLCPP_INFO(get_logger(), "engine ready: %s", diagnostics.engine.description.c_str());
  } else {
    RCLCPP_WARN(
      get_logger(), "engine not ready: %s", diagnostics.engine.fallback_reason.c_str());
  }
  for (const string & note : diagnostics.environment.notes) {
    RCLCPP_INFO(
      get_logger(), "session %s (insertion %s): %s",
      to_string(diagnostics.environment.session_type).c_str(),
      to_string(diagnostics.environment.injection_permission).c_str(), note.c_str());
  }

  initialize_speech_detector();
  configure_profiling();

  sub_hotkey_ = create_subscription<std_msgs::msg::String>(
    hotkey_topic_, 10, bind(&DictationNode::on_hotkey, this, placeholders::_1));
  sub_audio_ = create_subscription<std_msgs::msg::Float32MultiArray>(
    audio_topic_, 50, bind(&DictationNode::on_audio_msg, this, placeholders::_1));

  processing_thread_ = thread(&DictationNode::processing_loop, this);
  settings_thread_ = thread(&DictationNode::settings_loop, this);

  if (live_capture_enabled_) {
    audio_input_.set_callback(
      [this](const AudioInput::Frame & frame, uint32_t sample_rate) {
        enqueue_audio(frame, sample_rate);
      });
    start_live_capture();
  }

  diagnostics_timer_ = create_wall_timer(
    chrono::milliseconds(static_cast<int64_t>(diagnostics_period_sec_ * 1000.0)),
    bind(&DictationNode::publish_diagnostics, this));

  parameter_cb_handle_ = add_on_set_parameters_callback(
    bind(&DictationNode::on_set_parameters, this, placeholders::_1));

  publish_state(orchestrator_->status());
  RCLCPP_INFO(get_logger(), "dictation_cpp node started");
}

DictationNode::~DictationNode()
{
  running_.store(false);
  audio_input_.stop();
  audio_cv_.notify_all();
  settings_cv_.notify_all();
  if (orchestrator_) {
    orchestrator_->cancel();
  }
  if (processing_thread_.joinable()) {
    processing_thread_.join();
  }
  if (settings_thread_.joinable()) {
    settings_thread_.join();
  }
  orchestrator_.reset();
}

void DictationNode::declare_and_get_parameters()
{
  declare_parameter<string>("hotkey", "CtrlOrCmd+Shift+U");
  declare_parameter<string>("mode", "push_to_toggle");
  declare_parameter<string>("language", "en");
  declare_parameter<string>("model_profile", "balanced");
  declare_parameter<string>("stt_engine", "whisper_cpp");
  declare_parameter<string>("model_path", "");
  declare_parameter<string>("microphone_id", "");
  declare_parameter<int>("mic_sensitivity_percent", 170);
  declare_parameter<int>("chunk_duration_ms", 0);
  declare_parameter<int>("partial_cadence_ms", 0);
  declare_parameter<string>("whisper_backend_preference", "auto");
  declare_parameter<string>("faster_whisper_model", "");
  declare_parameter<string>("faster_whisper_compute_type", "auto");
  declare_parameter<int>("faster_whisper_beam_size", 1);
  declare_parameter<bool>("clipboard_fallback", true);
  declare_parameter<string>("resource_dir", "");
  declare_parameter<int>("worker_timeout_ms", 30000);
  declare_parameter<int>("worker_max_restarts", 1);
  declare_parameter<int>("backlog_multiple", 5);
  declare_parameter<string>("vad_model_path", "");
  declare_parameter<double>("vad_threshold", 0.5);
  declare_parameter<bool>("live_capture_enabled", false);
  declare_parameter<int>("audio_sample_rate", 16000);
  declare_parameter<string>("direct_insert_command", "xdotool type --clearmodifiers --");
  declare_parameter<string>(
    "clipboard_insert_command",
    "sh -c 'printf %s \"$1\" | xclip -selection clipboard && "
    "xdotool key --clearmodifiers ctrl+v' dictation");
  declare_parameter<bool>("profiling_enabled", false);
  declare_parameter<double>("diagnostics_period_sec", 2.0);
  declare_parameter<string>("hotkey_topic", "/dictation/hotkey");
  declare_parameter<string>("audio_topic", "/dictation/audio");
  declare_parameter<string>("state_topic", "/dictation/state");
  declare_parameter<string>("transcript_topic", "/dictation/transcript");
  declare_parameter<string>("insertion_topic", "/dictation/insertion");
  declare_parameter<string>("diagnostics_topic", "/dictation/diagnostics");
  declare_parameter<string>("profile_topic", "/dictation/profile");

  // 알 수 없는 값은 경고 후 기본값 유지
  for (const char * name : {
      "hotkey", "mode", "language", "model_profile", "stt_engine", "model_path",
      "microphone_id", "mic_sensitivity_percent", "chunk_duration_ms", "partial_cadence_ms",
      "whisper_backend_preference", "faster_whisper_model", "faster_whisper_compute_type",
      "faster_whisper_beam_size", "clipboard_fallback", "resource_dir", "worker_timeout_ms",
      "worker_max_restarts", "backlog_multiple"})
  {
    string error;
    if (!apply_parameter(get_parameter(name), settings_, error)) {
      RCLCPP_WARN(get_logger(), "%s. keep default", error.c_str());
    }
  }

  vad_model_path_ = get_parameter("vad_model_path").as_string();
  vad_threshold_ = get_parameter("vad_threshold").as_double();
  live_capture_enabled_ = get_parameter("live_capture_enabled").as_bool();
  audio_sample_rate_ = static_cast<int>(get_parameter("audio_sample_rate").as_int());
  direct_insert_command_ = get_parameter("direct_insert_command").as_string();
  clipboard_insert_command_ = get_parameter("clipboard_insert_command").as_string();
  profiling_enabled_ = get_parameter("profiling_enabled").as_bool();
  diagnostics_period_sec_ = get_parameter("diagnostics_period_sec").as_double();
  hotkey_topic_ = get_parameter("hotkey_topic").as_string();
  audio_topic_ = get_parameter("audio_topic").as_string();
  state_topic_ = get_parameter("state_topic").as_string();
  transcript_topic_ = get_parameter("transcript_topic").as_string();
  insertion_topic_ = get_parameter("insertion_topic").as_string();
  diagnostics_topic_ = get_parameter("diagnostics_topic").as_string();
  profile_topic_ = get_parameter("profile_topic").as_string();

  if (diagnostics_period_sec_ <= 0.0) {
    diagnostics_period_sec_ = 2.0;
  }
}

/// 설정 스냅샷에 해당하는 파라미터 하나를 반영. 값이 잘못되면 false
bool DictationNode::apply_parameter(
  const rclcpp::Parameter & p, DictationSettings & settings, string & error)
{
  const string & name = p.get_name();
  const bool is_string = p.get_type() == rclcpp::ParameterType::PARAMETER_STRING;
  const bool is_int = p.get_type() == rclcpp::ParameterType::PARAMETER_INTEGER;
  const bool is_bool = p.get_type() == rclcpp::ParameterType::PARAMETER_BOOL;

  if (name == "hotkey" && is_string) {
    settings.hotkey = p.as_string();
  } else if (name == "mode" && is_string) {
    if (!parse_mode(p.as_string(), settings.mode)) {
      error = "invalid mode: " + p.as_string();
      return false;
    }
  } else if (name == "language" && is_string) {
    settings.language = p.as_string().empty() ? "en" : p.as_string();
  } else if (name == "model_profile" && is_string) {
    if (!parse_model_profile(p.as_string(), settings.model_profile)) {
      error = "invalid model_profile: " + p.as_string();
      return false;
    }
  } else if (name == "stt_engine" && is_string) {
    if (!parse_engine_kind(p.as_string(), settings.engine)) {
      error = "invalid stt_engine: " + p.as_string();
      return false;
    }
  } else if (name == "model_path" && is_string) {
    settings.model_path = p.as_string();
  } else if (name == "microphone_id" && is_string) {
    settings.microphone_id = p.as_string();
  } else if (name == "mic_sensitivity_percent" && is_int) {
    settings.mic_sensitivity_percent = static_cast<int>(p.as_int());
  } else if (name == "chunk_duration_ms" && is_int) {
    settings.chunk_duration_ms = static_cast<int>(p.as_int());
  } else if (name == "partial_cadence_ms" && is_int) {
    settings.partial_cadence_ms = static_cast<int>(p.as_int());
  } else if (name == "whisper_backend_preference" && is_string) {
    if (!parse_backend_preference(p.as_string(), settings.backend_preference)) {
      error = "invalid whisper_backend_preference: " + p.as_string();
      return false;
    }
  } else if (name == "faster_whisper_model" && is_string) {
    settings.faster_whisper_model = p.as_string();
  } else if (name == "faster_whisper_compute_type" && is_string) {
    if (!parse_compute_type(p.as_string(), settings.compute_type)) {
      error = "invalid faster_whisper_compute_type: " + p.as_string();
      return false;
    }
  } else if (name == "faster_whisper_beam_size" && is_int) {
    settings.beam_size = static_cast<int>(p.as_int());
  } else if (name == "clipboard_fallback" && is_bool) {
    settings.clipboard_fallback = p.as_bool();
  } else if (name == "resource_dir" && is_string) {
    settings.resource_dir = p.as_string();
  } else if (name == "worker_timeout_ms" && is_int) {
    if (p.as_int() <= 0) {
      error = "worker_timeout_ms must be positive";
      return false;
    }
    settings.worker_timeout_ms = static_cast<int>(p.as_int());
  } else if (name == "worker_max_restarts" && is_int) {
    if (p.as_int() < 0) {
      error = "worker_max_restarts must not be negative";
      return false;
    }
    settings.worker_max_restarts = static_cast<int>(p.as_int());
  } else if (name == "backlog_multiple" && is_int) {
    if (p.as_int() < 1) {
      error = "backlog_multiple must be at least 1";
      return false;
    }
    settings.backlog_multiple = static_cast<int>(p.as_int());
  }
  return true;
}

rcl_interfaces::msg::SetParametersResult DictationNode::on_set_parameters(
  const vector<rclcpp::Parameter> & parameters)
{
  auto result = rcl_interfaces::msg::SetParametersResult();
  result.successful = true;
  result.reason = "ok";

  DictationSettings next = settings_;
  bool microphone_changed = false;
  bool vad_changed = false;

  for (const auto & p : parameters) {
    string error;
    if (!apply_parameter(p, next, error)) {
      result.successful = false;
      result.reason = error;
      return result;
    }
    if (p.get_name() == "microphone_id") {
      microphone_changed = true;
    } else if (p.get_name() == "vad_model_path" &&
      p.get_type() == rclcpp::ParameterType::PARAMETER_STRING)
    {
      vad_model_path_ = p.as_string();
      vad_changed = true;
    } else if (p.get_name() == "vad_threshold" &&
      p.get_type() == rclcpp::ParameterType::PARAMETER_DOUBLE)
    {
      vad_threshold_ = p.as_double();
      vad_changed = true;
    } else if (p.get_name() == "audio_sample_rate" &&
      p.get_type() == rclcpp::ParameterType::PARAMETER_INTEGER)
    {
      audio_sample_rate_ = static_cast<int>(p.as_int());
    } else if (p.get_name() == "profiling_enabled" &&
      p.get_type() == rclcpp::ParameterType::PARAMETER_BOOL)
    {
      profiling_enabled_ = p.as_bool();
      configure_profiling();
    }
  }

  settings_ = next;
  {
    // 엔진 재구성은 오래 걸릴 수 있어 설정 스레드에서 적용 (마지막 요청만 유효)
    lock_guard<mutex> lock(settings_mutex_);
    pending_settings_ = next;
  }
  settings_cv_.notify_one();

  if (vad_changed) {
    initialize_speech_detector();
  }
  if (microphone_changed && live_capture_enabled_) {
    audio_input_.stop();
    start_live_capture();
  }
  return result;
}

void DictationNode::initialize_speech_detector()
{
  if (vad_model_path_.empty()) {
    orchestrator_->set_speech_detector(make_shared<RmsSpeechDetector>());
    return;
  }
  auto detector = make_shared<SileroSpeechDetector>();
  if (detector->initialize(static_cast<float>(vad_threshold_), vad_model_path_)) {
    orchestrator_->set_speech_detector(detector);
    RCLCPP_INFO(get_logger(), "silero vad loaded: %s", vad_model_path_.c_str());
  } else {
    orchestrator_->set_speech_detector(make_shared<RmsSpeechDetector>());
    RCLCPP_WARN(
      get_logger(), "silero vad unavailable (%s), using rms detector", vad_model_path_.c_str());
  }
}

bool DictationNode::start_live_capture()
{
  audio_input_.configure(settings_.microphone_id, 1024);
  if (audio_input_.start()) {
    RCLCPP_INFO(
      get_logger(), "audio input started: index=%d name=%s rate=%u",
      audio_input_.selected_device_index(),
      audio_input_.selected_device_name().c_str(),
      audio_input_.sample_rate());
    return true;
  }

  if (!settings_.microphone_id.empty()) {
    RCLCPP_WARN(
      get_logger(), "audio start failed(microphone_id=%s): %s. retrying with default device",
      settings_.microphone_id.c_str(), audio_input_.last_error().c_str());
    audio_input_.stop();
    audio_input_.configure("", 1024);
    if (audio_input_.start()) {
      RCLCPP_INFO(
        get_logger(), "audio input fallback started: index=%d name=%s",
        audio_input_.selected_device_index(),
        audio_input_.selected_device_name().c_str());
      return true;
    }
  }

  RCLCPP_ERROR(
    get_logger(), "failed to start audio input stream: %s",
    audio_input_.last_error().c_str());
  return false;
}

void DictationNode::configure_profiling()
{
  if (!orchestrator_) {
    return;
  }
  if (!profiling_enabled_) {
    orchestrator_->set_profile_sink(ProfileSink());
    return;
  }
  orchestrator_->set_profile_sink(
    [this](const ChunkProfile & profile) {
      std_msgs::msg::String msg;
      msg.data = profile_to_json(profile);
      pub_profile_->publish(msg);
    });
}

void DictationNode::on_hotkey(const std_msgs::msg::String::SharedPtr msg)
{
  DictationEvent event;
  if (!parse_event(msg->data, event)) {
    RCLCPP_WARN(get_logger(), "unknown hotkey command: %s", msg->data.c_str());
    return;
  }

  PipelineStatus status;
  switch (event) {
    case DictationEvent::HOTKEY_DOWN:
      status = orchestrator_->hotkey_down();
      break;
    case DictationEvent::HOTKEY_UP:
      status = orchestrator_->hotkey_up();
      break;
    case DictationEvent::CANCEL:
      status = orchestrator_->cancel();
      break;
    default:
      RCLCPP_WARN(get_logger(), "hotkey topic ignores event: %s", msg->data.c_str());
      return;
  }
  if (status.state != DictationState::LISTENING) {
    clear_audio_queue();
  }
  publish_state(status);
}

void DictationNode::on_audio_msg(const std_msgs::msg::Float32MultiArray::SharedPtr msg)
{
  if (audio_sample_rate_ <= 0) {
    return;
  }
  enqueue_audio(msg->data, static_cast<uint32_t>(audio_sample_rate_));
}

void DictationNode::enqueue_audio(vector<float> samples, uint32_t sample_rate)
{
  if (!running_.load()) {
    return;
  }
  {
    lock_guard<mutex> lock(audio_mutex_);
    if (audio_queue_.size() >= kMaxQueuedChunks) {
      audio_queue_.pop();
    }
    audio_queue_.push(AudioChunk{move(samples), sample_rate});
  }
  audio_cv_.notify_one();
}

void DictationNode::clear_audio_queue()
{
  lock_guard<mutex> lock(audio_mutex_);
  queue<AudioChunk> empty;
  audio_queue_.swap(empty);
}

/// 오디오 처리 전용 스레드: 인식/삽입이 오래 걸려도 핫키 콜백은 막히지 않는다
void DictationNode::processing_loop()
{
  while (running_.load()) {
    AudioChunk chunk;
    {
      unique_lock<mutex> lock(audio_mutex_);
      audio_cv_.wait_for(lock, chrono::milliseconds(100), [&]() {
        return !audio_queue_.empty() || !running_.load();
      });
      if (!running_.load()) {
        return;
      }
      if (audio_queue_.empty()) {
        continue;
      }
      chunk = move(audio_queue_.front());
      audio_queue_.pop();
    }

    const DictationState before = orchestrator_->status().state;
    const optional<string> text = orchestrator_->feed_audio(chunk.samples, chunk.sample_rate);
    const PipelineStatus after = orchestrator_->status();

    if (text) {
      std_msgs::msg::String transcript;
      transcript.data = *text;
      pub_transcript_->publish(transcript);

      const vector<InsertionRecord> recent = orchestrator_->recent_insertions();
      if (!recent.empty()) {
        std_msgs::msg::String insertion;
        insertion.data = insertion_to_json(recent.front());
        pub_insertion_->publish(insertion);
        if (recent.front().status == InsertionStatus::FAILURE) {
          RCLCPP_WARN(get_logger(), "insertion failed: %s", recent.front().error.c_str());
        }
      }
    } else if (before == DictationState::LISTENING && after.state == DictationState::IDLE &&
      !after.last_error.empty())
    {
      RCLCPP_WARN(
        get_logger(), "recognition failed (%s): %s",
        to_string(after.last_error_kind).c_str(), after.last_error.c_str());
    }
    if (before != after.state) {
      publish_state(after);
    }
  }
}

void DictationNode::settings_loop()
{
  while (running_.load()) {
    DictationSettings next;
    {
      unique_lock<mutex> lock(settings_mutex_);
      settings_cv_.wait_for(lock, chrono::milliseconds(200), [&]() {
        return pending_settings_.has_value() || !running_.load();
      });
      if (!running_.load()) {
        return;
      }
      if (!pending_settings_) {
        continue;
      }
      next = *pending_settings_;
      pending_settings_.reset();
    }

    const bool swapped = orchestrator_->apply_settings(next);
    const OrchestratorDiagnostics diagnostics = orchestrator_->diagnostics();
    if (swapped) {
      RCLCPP_INFO(get_logger(), "engine switched: %s", diagnostics.engine.description.c_str());
    } else if (!diagnostics.last_switch_error.empty()) {
      RCLCPP_WARN(
        get_logger(), "engine switch failed, keeping %s: %s",
        diagnostics.engine.active_engine.c_str(), diagnostics.last_switch_error.c_str());
    }
    publish_state(orchestrator_->status());
  }
}

void DictationNode::publish_state(const PipelineStatus & status)
{
  std_msgs::msg::String msg;
  msg.data = status_to_json(status);
  pub_state_->publish(msg);
}

void DictationNode::publish_diagnostics()
{
  std_msgs::msg::String msg;
  msg.data = diagnostics_to_json(orchestrator_->diagnostics());
  pub_diagnostics_->publish(msg);
}

}  // namespace dictation_cpp

int main(int argc, char ** argv)
{
  rclcpp::init(argc, argv);
  auto node = make_shared<dictation_cpp::DictationNode>();
  rclcpp::spin(node);
  rclcpp::shutdown();
  return 0;
}
