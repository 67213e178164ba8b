#include "meetscribe/meetscribe_node.hpp"

#include <meetscribe_common/json_utils.hpp>
#include <meetscribe_common/shell_utils.hpp>

#include "meetscribe/json_serialization.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <functional>

using namespace std;


namespace meetscribe
{
namespace
{

void write_response(httplib::Response & res, const ApiResponse & response)
{
  res.status = response.status;
  res.set_content(meetscribe_common::to_compact_json(response.body), "application/json");
}

string env_or(const string & value, const char * primary, const char * secondary = nullptr)
{
  if (!value.empty()) {
    return value;
  }
  const char * key = getenv(primary);
  if (key) {
    return key;
  }
  if (secondary) {
    const char * fallback = getenv(secondary);
    if (fallback) {
      return fallback;
    }
  }
  return "";
}

}  // namespace

MeetscribeNode::MeetscribeNode()
: Node("meetscribe_node")
{
  declare_and_get_parameters();

  pub_session_events_ = create_publisher<std_msgs::msg::String>(session_events_topic_, 10);
  pub_transcript_ = create_publisher<std_msgs::msg::String>(transcript_topic_, 50);

  factory_ = make_shared<ProviderFactory>(provider_settings_);
  if (provider_settings_.voiceprint_enabled) {
    voiceprint_ = factory_->create_voiceprint(provider_settings_.voiceprint_backend);
  }

  auto factory = factory_;
  engine_ = make_unique<SessionEngine>(
    engine_config_,
    [factory](const EngineConfig & config) {
      return factory->create_transcription(config.backend, config.language);
    });
  engine_->set_event_callback(bind(&MeetscribeNode::publish_session_event, this, placeholders::_1));
  engine_->set_transcript_callback(bind(&MeetscribeNode::publish_transcript, this, placeholders::_1));

  pipeline_ = make_shared<BatchPipeline>(
    pipeline_config_,
    [factory](TranscriptionBackend backend, const string & language) {
      return factory->create_transcription(backend, language);
    },
    make_shared<FfmpegFormatConverter>(converter_config_),
    voiceprint_);

  ApiConfig api_config;
  api_config.diagnostics_enabled = diagnostics_enabled_;
  api_config.default_engine = default_engine_;
  api_config.batch_backend = provider_settings_.batch_backend;
  api_ = make_unique<ApiHandlers>(api_config, *engine_, pipeline_, voiceprint_);

  sweep_timer_ = create_wall_timer(
    chrono::milliseconds(sweep_interval_ms_),
    [this]() {
      const size_t evicted = engine_->sweep_idle();
      if (evicted > 0) {
        RCLCPP_INFO(get_logger(), "idle sweep stopped %zu sessions", evicted);
      }
    });

  if (voiceprint_ && live_identification_enabled_) {
    engine_->set_speaker_identifier(voiceprint_, identification_config_);
    identify_timer_ = create_wall_timer(
      chrono::milliseconds(identify_interval_ms_),
      [this]() {
        engine_->identify_speakers();
      });
  }

  parameter_cb_handle_ = add_on_set_parameters_callback(
    bind(&MeetscribeNode::on_set_parameters, this, placeholders::_1));

  register_routes();
  start_http_server();

  RCLCPP_INFO(
    get_logger(), "meetscribe node started: realtime=%s batch=%s voiceprint=%s",
    transcription_backend_string(default_engine_.backend).c_str(),
    transcription_backend_string(provider_settings_.batch_backend).c_str(),
    voiceprint_ ? voiceprint_->name().c_str() : "disabled");
}

MeetscribeNode::~MeetscribeNode()
{
  server_.stop();
  if (server_thread_.joinable()) {
    server_thread_.join();
  }
  if (engine_) {
    engine_->shutdown();
  }
}

void MeetscribeNode::declare_and_get_parameters()
{
  declare_parameter<string>("http_host", "0.0.0.0");
  declare_parameter<int>("http_port", 8090);
  declare_parameter<int>("http_threads", 8);
  declare_parameter<bool>("diagnostics_enabled", false);
  declare_parameter<string>("session_events_topic", "/meetscribe/session_events");
  declare_parameter<string>("transcript_topic", "/meetscribe/transcript");

  declare_parameter<int>("max_sessions", 10);
  declare_parameter<int>("session_timeout_ms", 3600000);
  declare_parameter<int>("terminal_retention_ms", 600000);
  declare_parameter<int>("sweep_interval_ms", 30000);
  declare_parameter<int>("max_held_bytes", 32 * 1024 * 1024);

  declare_parameter<string>("realtime_backend", "local-streaming");
  declare_parameter<string>("batch_backend", "local-batch");
  declare_parameter<string>("language", "zh");
  declare_parameter<int>("sample_rate", 16000);
  declare_parameter<string>("device", "cpu");
  declare_parameter<string>("python_executable", "python3");
  declare_parameter<string>("temp_directory", "/tmp/meetscribe");
  declare_parameter<string>("ffmpeg_path", "ffmpeg");

  declare_parameter<string>("hosted_streaming_url", "");
  declare_parameter<string>("hosted_streaming_api_key", "");
  declare_parameter<string>("hosted_streaming_model", "");
  declare_parameter<int>("hosted_streaming_connect_timeout_sec", 10);
  declare_parameter<int>("hosted_streaming_send_timeout_ms", 5000);

  declare_parameter<string>("hosted_batch_base_url", "https://api.groq.com/openai/v1");
  declare_parameter<string>("hosted_batch_api_key", "");
  declare_parameter<string>("hosted_batch_model", "whisper-large-v3");
  declare_parameter<int>("hosted_batch_timeout_sec", 120);

  declare_parameter<string>("local_streaming_engine", "funasr");
  declare_parameter<string>("local_streaming_script", "engines/funasr_service.py");
  declare_parameter<string>("local_streaming_mode", "offline");
  declare_parameter<int>("local_streaming_close_grace_ms", 3000);

  declare_parameter<string>("local_batch_engine", "whisper");
  declare_parameter<string>("local_batch_script", "engines/whisper_service.py");
  declare_parameter<string>("local_batch_model_size", "base");
  declare_parameter<int>("local_batch_timeout_ms", 600000);

  declare_parameter<bool>("voiceprint_enabled", true);
  declare_parameter<string>("voiceprint_backend", "diarization");
  declare_parameter<string>("embedding_engine", "speechbrain");
  declare_parameter<string>("embedding_script", "engines/speechbrain_service.py");
  declare_parameter<int>("embedding_dimension", 192);
  declare_parameter<string>("diarization_engine", "pyannote");
  declare_parameter<string>("diarization_script", "engines/pyannote_service.py");
  declare_parameter<int>("diarization_dimension", 512);
  declare_parameter<int>("min_speakers", 1);
  declare_parameter<int>("max_speakers", 10);
  declare_parameter<int>("required_enrollments", 1);
  declare_parameter<string>("enrollment_policy", "replace");
  declare_parameter<double>("identification_threshold", 0.7);
  declare_parameter<double>("verification_threshold", 0.75);
  declare_parameter<bool>("live_identification_enabled", true);
  declare_parameter<int>("live_identification_interval_ms", 1000);
  declare_parameter<double>("live_identification_buffer_sec", 3.0);
  declare_parameter<double>("live_identification_min_segment_sec", 1.0);
  declare_parameter<double>("live_identification_max_buffer_sec", 30.0);

  declare_parameter<double>("fusion_match_threshold", 0.75);
  declare_parameter<int>("max_sentence_chars", 200);

  http_host_ = get_parameter("http_host").as_string();
  http_port_ = static_cast<int>(get_parameter("http_port").as_int());
  http_threads_ = static_cast<int>(get_parameter("http_threads").as_int());
  diagnostics_enabled_ = get_parameter("diagnostics_enabled").as_bool();
  session_events_topic_ = get_parameter("session_events_topic").as_string();
  transcript_topic_ = get_parameter("transcript_topic").as_string();
  sweep_interval_ms_ = static_cast<int>(get_parameter("sweep_interval_ms").as_int());
  if (sweep_interval_ms_ <= 0) {
    sweep_interval_ms_ = 30000;
  }

  engine_config_.max_sessions = static_cast<size_t>(
    max<int64_t>(1, get_parameter("max_sessions").as_int()));
  engine_config_.session_timeout = chrono::milliseconds(get_parameter("session_timeout_ms").as_int());
  engine_config_.terminal_retention =
    chrono::milliseconds(get_parameter("terminal_retention_ms").as_int());
  engine_config_.max_held_bytes = static_cast<size_t>(
    max<int64_t>(0, get_parameter("max_held_bytes").as_int()));

  const string realtime_backend = get_parameter("realtime_backend").as_string();
  if (!parse_transcription_backend(realtime_backend, provider_settings_.realtime_backend)) {
    RCLCPP_WARN(
      get_logger(), "unknown realtime_backend '%s', using local-streaming",
      realtime_backend.c_str());
    provider_settings_.realtime_backend = TranscriptionBackend::LOCAL_STREAMING;
  }
  const string batch_backend = get_parameter("batch_backend").as_string();
  if (!parse_transcription_backend(batch_backend, provider_settings_.batch_backend)) {
    RCLCPP_WARN(get_logger(), "unknown batch_backend '%s', using local-batch", batch_backend.c_str());
    provider_settings_.batch_backend = TranscriptionBackend::LOCAL_BATCH;
  }

  const string language = get_parameter("language").as_string();
  const string device = get_parameter("device").as_string();
  const string python = get_parameter("python_executable").as_string();
  const string temp_directory = get_parameter("temp_directory").as_string();

  default_engine_.backend = provider_settings_.realtime_backend;
  default_engine_.language = language;
  default_engine_.sample_rate = static_cast<int>(get_parameter("sample_rate").as_int());

  HostedStreamingConfig & hosted_streaming = provider_settings_.hosted_streaming;
  hosted_streaming.url = get_parameter("hosted_streaming_url").as_string();
  hosted_streaming.api_key = env_or(
    get_parameter("hosted_streaming_api_key").as_string(), "MEETSCRIBE_ASR_API_KEY");
  hosted_streaming.model = get_parameter("hosted_streaming_model").as_string();
  hosted_streaming.language = language;
  hosted_streaming.connect_timeout_sec = get_parameter("hosted_streaming_connect_timeout_sec").as_int();
  hosted_streaming.send_timeout_ms = get_parameter("hosted_streaming_send_timeout_ms").as_int();

  HostedBatchConfig & hosted_batch = provider_settings_.hosted_batch;
  hosted_batch.base_url = get_parameter("hosted_batch_base_url").as_string();
  hosted_batch.api_key = env_or(
    get_parameter("hosted_batch_api_key").as_string(), "MEETSCRIBE_ASR_API_KEY", "OPENAI_API_KEY");
  hosted_batch.model = get_parameter("hosted_batch_model").as_string();
  hosted_batch.language = language;
  hosted_batch.timeout_sec = get_parameter("hosted_batch_timeout_sec").as_int();

  LocalStreamingConfig & local_streaming = provider_settings_.local_streaming;
  local_streaming.engine_name = get_parameter("local_streaming_engine").as_string();
  local_streaming.executable = python;
  local_streaming.base_args = {get_parameter("local_streaming_script").as_string()};
  local_streaming.language = language;
  local_streaming.mode = get_parameter("local_streaming_mode").as_string();
  local_streaming.device = device;
  local_streaming.close_grace_ms = get_parameter("local_streaming_close_grace_ms").as_int();
  local_streaming.temp_directory = temp_directory;

  LocalBatchConfig & local_batch = provider_settings_.local_batch;
  local_batch.engine_name = get_parameter("local_batch_engine").as_string();
  local_batch.executable = python;
  local_batch.base_args = {get_parameter("local_batch_script").as_string()};
  local_batch.language = language;
  local_batch.model_size = get_parameter("local_batch_model_size").as_string();
  local_batch.device = device;
  local_batch.timeout_ms = get_parameter("local_batch_timeout_ms").as_int();
  local_batch.temp_directory = temp_directory;

  provider_settings_.voiceprint_enabled = get_parameter("voiceprint_enabled").as_bool();
  const string voiceprint_backend = get_parameter("voiceprint_backend").as_string();
  if (!parse_voiceprint_backend(voiceprint_backend, provider_settings_.voiceprint_backend)) {
    RCLCPP_WARN(
      get_logger(), "unknown voiceprint_backend '%s', using diarization",
      voiceprint_backend.c_str());
    provider_settings_.voiceprint_backend = VoiceprintBackend::DIARIZATION;
  }

  EnrollmentPolicy policy = EnrollmentPolicy::REPLACE;
  const string policy_name = get_parameter("enrollment_policy").as_string();
  if (!parse_enrollment_policy(policy_name, policy)) {
    RCLCPP_WARN(get_logger(), "unknown enrollment_policy '%s', using replace", policy_name.c_str());
  }
  const int required_enrollments = static_cast<int>(
    max<int64_t>(1, get_parameter("required_enrollments").as_int()));
  MatchThresholds thresholds;
  thresholds.identification = get_parameter("identification_threshold").as_double();
  thresholds.verification = get_parameter("verification_threshold").as_double();

  live_identification_enabled_ = get_parameter("live_identification_enabled").as_bool();
  identify_interval_ms_ = static_cast<int>(get_parameter("live_identification_interval_ms").as_int());
  if (identify_interval_ms_ <= 0) {
    identify_interval_ms_ = 1000;
  }
  identification_config_.buffer_seconds =
    max(0.1, get_parameter("live_identification_buffer_sec").as_double());
  identification_config_.min_segment_seconds =
    max(0.0, get_parameter("live_identification_min_segment_sec").as_double());
  identification_config_.max_buffer_seconds = max(
    identification_config_.buffer_seconds,
    get_parameter("live_identification_max_buffer_sec").as_double());

  EmbeddingVoiceprintConfig & embedding = provider_settings_.embedding_voiceprint;
  embedding.engine_name = get_parameter("embedding_engine").as_string();
  embedding.executable = python;
  embedding.base_args = {get_parameter("embedding_script").as_string()};
  embedding.device = device;
  embedding.dimension = static_cast<size_t>(get_parameter("embedding_dimension").as_int());
  embedding.required_enrollments = required_enrollments;
  embedding.policy = policy;
  embedding.thresholds = thresholds;
  embedding.temp_directory = temp_directory;

  DiarizingVoiceprintConfig & diarizing = provider_settings_.diarizing_voiceprint;
  diarizing.engine_name = get_parameter("diarization_engine").as_string();
  diarizing.executable = python;
  diarizing.base_args = {get_parameter("diarization_script").as_string()};
  diarizing.device = device;
  diarizing.dimension = static_cast<size_t>(get_parameter("diarization_dimension").as_int());
  diarizing.min_speakers = static_cast<int>(get_parameter("min_speakers").as_int());
  diarizing.max_speakers = static_cast<int>(get_parameter("max_speakers").as_int());
  diarizing.required_enrollments = required_enrollments;
  diarizing.policy = policy;
  diarizing.thresholds = thresholds;
  diarizing.temp_directory = temp_directory;

  pipeline_config_.backend = provider_settings_.batch_backend;
  pipeline_config_.temp_directory = temp_directory;
  pipeline_config_.fusion.match_threshold = get_parameter("fusion_match_threshold").as_double();
  pipeline_config_.fusion.max_sentence_chars = static_cast<size_t>(
    max<int64_t>(1, get_parameter("max_sentence_chars").as_int()));

  converter_config_.ffmpeg_path = get_parameter("ffmpeg_path").as_string();
  converter_config_.sample_rate = static_cast<uint32_t>(default_engine_.sample_rate);
  if (!meetscribe_common::command_exists(converter_config_.ffmpeg_path)) {
    RCLCPP_WARN(
      get_logger(), "%s not found, only 16 kHz mono WAV and raw PCM uploads will be accepted",
      converter_config_.ffmpeg_path.c_str());
  }

  if (hosted_streaming.api_key.empty() &&
    provider_settings_.realtime_backend == TranscriptionBackend::HOSTED_STREAMING)
  {
    RCLCPP_WARN(get_logger(), "hosted streaming selected but no API key is configured");
  }
  if (hosted_batch.api_key.empty() &&
    provider_settings_.batch_backend == TranscriptionBackend::HOSTED_BATCH)
  {
    RCLCPP_WARN(get_logger(), "hosted batch selected but no API key is configured");
  }
}

void MeetscribeNode::register_routes()
{
  server_.Post("/sessions/create", [this](const httplib::Request & req, httplib::Response & res) {
      write_response(res, api_->create_session(req.body));
    });
  server_.Get("/sessions/stats", [this](const httplib::Request &, httplib::Response & res) {
      write_response(res, api_->session_stats());
    });
  server_.Delete(R"(/sessions/([^/]+))", [this](const httplib::Request & req, httplib::Response & res) {
      write_response(res, api_->destroy_session(req.matches[1]));
    });
  server_.Get(
    R"(/sessions/([^/]+)/status)", [this](const httplib::Request & req, httplib::Response & res) {
      write_response(res, api_->session_status(req.matches[1]));
    });
  server_.Get(
    R"(/sessions/([^/]+)/transcript)", [this](const httplib::Request & req, httplib::Response & res) {
      write_response(res, api_->session_transcript(req.matches[1]));
    });
  server_.Post(
    R"(/sessions/([^/]+)/start)", [this](const httplib::Request & req, httplib::Response & res) {
      write_response(res, api_->start_session(req.matches[1]));
    });
  server_.Post(
    R"(/sessions/([^/]+)/pause)", [this](const httplib::Request & req, httplib::Response & res) {
      write_response(res, api_->pause_session(req.matches[1]));
    });
  server_.Post(
    R"(/sessions/([^/]+)/resume)", [this](const httplib::Request & req, httplib::Response & res) {
      write_response(res, api_->resume_session(req.matches[1]));
    });
  server_.Post(
    R"(/sessions/([^/]+)/audio)", [this](const httplib::Request & req, httplib::Response & res) {
      write_response(res, api_->send_audio(req.matches[1], req.body));
    });

  server_.Post("/audio/transcribe-file", [this](const httplib::Request & req, httplib::Response & res) {
      const bool has_audio = req.has_file("audio");
      string audio;
      string filename;
      if (has_audio) {
        const auto file = req.get_file_value("audio");
        audio = file.content;
        filename = file.filename;
      }
      string speakers;
      if (req.has_file("speakers")) {
        speakers = req.get_file_value("speakers").content;
      } else if (req.has_param("speakers")) {
        speakers = req.get_param_value("speakers");
      }
      write_response(res, api_->transcribe_file(has_audio, audio, filename, speakers));
    });

  server_.Get("/health", [this](const httplib::Request &, httplib::Response & res) {
      write_response(res, api_->health());
    });

  server_.Post("/voiceprints/profiles", [this](const httplib::Request & req, httplib::Response & res) {
      write_response(res, api_->create_profile(req.body));
    });
  server_.Get("/voiceprints/profiles", [this](const httplib::Request &, httplib::Response & res) {
      write_response(res, api_->list_profiles());
    });
  server_.Post(
    R"(/voiceprints/profiles/([^/]+)/enroll)",
    [this](const httplib::Request & req, httplib::Response & res) {
      write_response(res, api_->enroll_profile(req.matches[1], req.body));
    });
  server_.Post(
    R"(/voiceprints/profiles/([^/]+)/verify)",
    [this](const httplib::Request & req, httplib::Response & res) {
      write_response(res, api_->verify_profile(req.matches[1], req.body));
    });
  server_.Post("/speakers/identify", [this](const httplib::Request & req, httplib::Response & res) {
      string audio;
      if (req.has_file("audioFile")) {
        audio = req.get_file_value("audioFile").content;
      } else if (!req.is_multipart_form_data()) {
        audio = req.body;
      }
      string candidates;
      if (req.has_file("candidates")) {
        candidates = req.get_file_value("candidates").content;
      } else if (req.has_param("candidates")) {
        candidates = req.get_param_value("candidates");
      }
      write_response(res, api_->identify_speaker(audio, candidates));
    });
  server_.Delete(
    R"(/voiceprints/profiles/([^/]+))",
    [this](const httplib::Request & req, httplib::Response & res) {
      write_response(res, api_->delete_profile(req.matches[1]));
    });

  server_.set_exception_handler(
    [this](const httplib::Request & req, httplib::Response & res, exception_ptr ep) {
      string message = "unexpected failure";
      try {
        rethrow_exception(ep);
      } catch (const exception & e) {
        message = e.what();
      }
      RCLCPP_ERROR(get_logger(), "%s %s failed: %s", req.method.c_str(), req.path.c_str(), message.c_str());
      ApiResponse response;
      response.status = 500;
      response.body = error_body(
        make_error(ErrorCode::INTERNAL_ERROR, "internal error", message), diagnostics_enabled_);
      write_response(res, response);
    });
}

void MeetscribeNode::start_http_server()
{
  const int threads = http_threads_ > 0 ? http_threads_ : 8;
  server_.new_task_queue = [threads]() {return new httplib::ThreadPool(threads);};

  if (!server_.bind_to_port(http_host_.c_str(), http_port_)) {
    RCLCPP_ERROR(get_logger(), "failed to bind http server to %s:%d", http_host_.c_str(), http_port_);
    return;
  }
  server_thread_ = thread([this]() {
        if (!server_.listen_after_bind()) {
          RCLCPP_ERROR(get_logger(), "http server stopped unexpectedly");
        }
      });
  RCLCPP_INFO(get_logger(), "http api listening on %s:%d", http_host_.c_str(), http_port_);
}

void MeetscribeNode::publish_session_event(const SessionEvent & event)
{
  std_msgs::msg::String msg;
  msg.data = meetscribe_common::to_compact_json(to_json(event));
  pub_session_events_->publish(msg);
}

void MeetscribeNode::publish_transcript(const TranscriptEvent & event)
{
  std_msgs::msg::String msg;
  msg.data = meetscribe_common::to_compact_json(to_json(event));
  pub_transcript_->publish(msg);
}

rcl_interfaces::msg::SetParametersResult MeetscribeNode::on_set_parameters(
  const vector<rclcpp::Parameter> & parameters)
{
  auto result = rcl_interfaces::msg::SetParametersResult();
  result.successful = true;
  result.reason = "ok";

  const SessionEngineConfig current = engine_->config();
  int64_t new_max_sessions = static_cast<int64_t>(current.max_sessions);
  int64_t new_timeout_ms = current.session_timeout.count();
  bool limits_changed = false;

  for (const auto & p : parameters) {
    if (p.get_name() == "max_sessions" && p.get_type() == rclcpp::ParameterType::PARAMETER_INTEGER) {
      new_max_sessions = p.as_int();
      limits_changed = true;
    } else if (p.get_name() == "session_timeout_ms" &&
      p.get_type() == rclcpp::ParameterType::PARAMETER_INTEGER)
    {
      new_timeout_ms = p.as_int();
      limits_changed = true;
    }
  }

  if (new_max_sessions < 1) {
    result.successful = false;
    result.reason = "max_sessions_must_be_positive";
    return result;
  }
  if (new_timeout_ms < 1000) {
    result.successful = false;
    result.reason = "session_timeout_ms_below_1000";
    return result;
  }
  if (limits_changed) {
    engine_->update_limits(static_cast<size_t>(new_max_sessions), chrono::milliseconds(new_timeout_ms));
  }
  return result;
}

}  // namespace meetscribe

int main(int argc, char ** argv)
{
  rclcpp::init(argc, argv);
  auto node = std::make_shared<meetscribe::MeetscribeNode>();
  rclcpp::executors::MultiThreadedExecutor executor;
  executor.add_node(node);
  executor.spin();
  rclcpp::shutdown();
  return 0;
}
