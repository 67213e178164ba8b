#pragma once

#include <httplib.h>

#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "rcl_interfaces/msg/set_parameters_result.hpp"
#include "rclcpp/rclcpp.hpp"
#include "std_msgs/msg/string.hpp"

#include "meetscribe/api_handlers.hpp"
#include "meetscribe/batch_pipeline.hpp"
#include "meetscribe/provider_factory.hpp"
#include "meetscribe/session_engine.hpp"

namespace meetscribe
{

class MeetscribeNode : public rclcpp::Node
{
public:
  MeetscribeNode();
  ~MeetscribeNode() override;

private:
  void declare_and_get_parameters();
  void register_routes();
  void start_http_server();
  void publish_session_event(const SessionEvent & event);
  void publish_transcript(const TranscriptEvent & event);
  rcl_interfaces::msg::SetParametersResult on_set_parameters(
    const std::vector<rclcpp::Parameter> & parameters);

  std::string http_host_ = "0.0.0.0";
  int http_port_ = 8090;
  int http_threads_ = 8;
  bool diagnostics_enabled_ = false;
  std::string session_events_topic_ = "/meetscribe/session_events";
  std::string transcript_topic_ = "/meetscribe/transcript";
  int sweep_interval_ms_ = 30000;
  bool live_identification_enabled_ = true;
  int identify_interval_ms_ = 1000;
  SpeakerIdentificationConfig identification_config_;

  ProviderSettings provider_settings_;
  SessionEngineConfig engine_config_;
  EngineConfig default_engine_;
  BatchPipelineConfig pipeline_config_;
  FfmpegConverterConfig converter_config_;

  std::shared_ptr<ProviderFactory> factory_;
  std::shared_ptr<VoiceprintProvider> voiceprint_;
  std::unique_ptr<SessionEngine> engine_;
  std::shared_ptr<BatchPipeline> pipeline_;
  std::unique_ptr<ApiHandlers> api_;

  httplib::Server server_;
  std::thread server_thread_;

  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr pub_session_events_;
  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr pub_transcript_;
  rclcpp::TimerBase::SharedPtr sweep_timer_;
  rclcpp::TimerBase::SharedPtr identify_timer_;
  rclcpp::node_interfaces::OnSetParametersCallbackHandle::SharedPtr parameter_cb_handle_;
};

}  // namespace meetscribe
