#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "rclcpp/rclcpp.hpp"
#include "rcl_interfaces/msg/set_parameters_result.hpp"
#include "std_msgs/msg/float32_multi_array.hpp"
#include "std_msgs/msg/string.hpp"

#include "dictation_cpp/audio_input.hpp"
#include "dictation_cpp/orchestrator.hpp"
#include "dictation_cpp/settings.hpp"

namespace dictation_cpp
{

class DictationNode : public rclcpp::Node
{
public:
  DictationNode();
  ~DictationNode() override;

private:
  struct AudioChunk
  {
    std::vector<float> samples;
    uint32_t sample_rate = 0;
  };

  void declare_and_get_parameters();
  bool apply_parameter(const rclcpp::Parameter & p, DictationSettings & settings, std::string & error);
  rcl_interfaces::msg::SetParametersResult on_set_parameters(
    const std::vector<rclcpp::Parameter> & parameters);
  void initialize_speech_detector();
  bool start_live_capture();
  void configure_profiling();

  void on_hotkey(const std_msgs::msg::String::SharedPtr msg);
  void on_audio_msg(const std_msgs::msg::Float32MultiArray::SharedPtr msg);
  void enqueue_audio(std::vector<float> samples, uint32_t sample_rate);
  void clear_audio_queue();
  void processing_loop();
  void settings_loop();

  void publish_state(const PipelineStatus & status);
  void publish_diagnostics();

  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr pub_state_;
  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr pub_transcript_;
  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr pub_insertion_;
  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr pub_diagnostics_;
  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr pub_profile_;
  rclcpp::Subscription<std_msgs::msg::String>::SharedPtr sub_hotkey_;
  rclcpp::Subscription<std_msgs::msg::Float32MultiArray>::SharedPtr sub_audio_;
  rclcpp::TimerBase::SharedPtr diagnostics_timer_;

  DictationSettings settings_;
  std::unique_ptr<Orchestrator> orchestrator_;
  AudioInput audio_input_;

  std::string vad_model_path_;
  double vad_threshold_;
  bool live_capture_enabled_;
  int audio_sample_rate_;
  std::string direct_insert_command_;
  std::string clipboard_insert_command_;
  bool profiling_enabled_;
  double diagnostics_period_sec_;
  std::string hotkey_topic_;
  std::string audio_topic_;
  std::string state_topic_;
  std::string transcript_topic_;
  std::string insertion_topic_;
  std::string diagnostics_topic_;
  std::string profile_topic_;

  std::queue<AudioChunk> audio_queue_;
  std::mutex audio_mutex_;
  std::condition_variable audio_cv_;
  std::thread processing_thread_;

  std::optional<DictationSettings> pending_settings_;
  std::mutex settings_mutex_;
  std::condition_variable settings_cv_;
  std::thread settings_thread_;

  std::atomic<bool> running_;
  OnSetParametersCallbackHandle::SharedPtr parameter_cb_handle_;
};

}  // namespace dictation_cpp
