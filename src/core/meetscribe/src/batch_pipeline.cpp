#include "meetscribe/batch_pipeline.hpp"

#include "meetscribe/temp_files.hpp"

#include <meetscribe_common/string_utils.hpp>

#include "rclcpp/rclcpp.hpp"

#include <chrono>
#include <exception>
#include <utility>

using namespace std;


namespace meetscribe
{
namespace
{

rclcpp::Logger pipeline_logger()
{
  return rclcpp::get_logger("meetscribe.batch_pipeline");
}

class StageTimer
{
public:
  StageTimer(vector<StageReport> & stages, const string & stage)
  : stages_(stages), start_(chrono::steady_clock::now())
  {
    report_.stage = stage;
  }

  void finish(StageStatus status, const string & message = "")
  {
    report_.status = status;
    report_.message = message;
    report_.duration_ms = static_cast<long>(chrono::duration_cast<chrono::milliseconds>(
        chrono::steady_clock::now() - start_).count());
    stages_.push_back(report_);
  }

private:
  vector<StageReport> & stages_;
  chrono::steady_clock::time_point start_;
  StageReport report_;
};

}  // namespace

string stage_status_string(StageStatus status)
{
  switch (status) {
    case StageStatus::OK: return "ok";
    case StageStatus::SKIPPED: return "skipped";
    case StageStatus::FAILED: return "failed";
  }
  return "failed";
}

BatchPipeline::BatchPipeline(
  const BatchPipelineConfig & config,
  BatchProviderFactory factory,
  shared_ptr<FormatConverter> converter,
  shared_ptr<VoiceprintProvider> voiceprint)
: config_(config),
  factory_(std::move(factory)),
  converter_(std::move(converter)),
  voiceprint_(std::move(voiceprint))
{
}

BatchResult BatchPipeline::run(const BatchRequest & request)
{
  BatchResult out;
  if (request.audio.empty()) {
    out.status = make_error(ErrorCode::INVALID_INPUT, "audio file is empty");
    return out;
  }

  TempFileRegistry registry(config_.temp_directory);
  vector<uint8_t> audio;

  auto finish_cleanup = [&registry, &out]() {
      StageTimer stage(out.stages, "cleanup");
      const size_t failed = registry.cleanup();
      if (failed > 0) {
        RCLCPP_WARN(pipeline_logger(), "%zu temporary files could not be removed", failed);
        stage.finish(StageStatus::FAILED, to_string(failed) + " files left behind");
      } else {
        stage.finish(StageStatus::OK);
      }
    };

  // 1. format normalization
  {
    StageTimer stage(out.stages, "format");
    string ext = meetscribe_common::file_extension(request.filename);
    if (ext.empty()) {
      ext = ".wav";
    }
    const string upload = registry.write("upload", ext, request.audio);
    if (upload.empty()) {
      out.status = make_error(ErrorCode::INTERNAL_ERROR, "failed to store upload");
      stage.finish(StageStatus::FAILED, out.status.error);
      finish_cleanup();
      return out;
    }

    ConversionResult converted;
    if (converter_) {
      try {
        converted = converter_->ensure_compatible_format(upload, registry);
      } catch (const exception & e) {
        converted.status = make_error(ErrorCode::AUDIO_FORMAT_ERROR, e.what());
      }
    } else {
      converted.path = upload;
    }
    if (!converted.status.ok) {
      out.status = converted.status;
      stage.finish(StageStatus::FAILED, out.status.error);
      RCLCPP_ERROR(pipeline_logger(), "format stage failed: %s", out.status.error.c_str());
      finish_cleanup();
      return out;
    }
    if (!read_file_bytes(converted.path, audio) || audio.empty()) {
      out.status = make_error(ErrorCode::AUDIO_FORMAT_ERROR, "normalized audio is unreadable");
      stage.finish(StageStatus::FAILED, out.status.error);
      finish_cleanup();
      return out;
    }
    stage.finish(StageStatus::OK, converted.path == upload ? "already compatible" : "converted");
  }

  // 2. transcription
  {
    StageTimer stage(out.stages, "transcription");
    try {
      unique_ptr<TranscriptionProvider> provider =
        factory_ ? factory_(config_.backend, request.language) : nullptr;
      if (!provider) {
        out.transcript.status = make_error(
          ErrorCode::INTERNAL_ERROR,
          "no provider for backend " + transcription_backend_string(config_.backend));
      } else if (!provider->supports(Capability::BATCH_TRANSCRIPTION)) {
        out.transcript.status = unsupported_operation(provider->name(), "transcribe_file");
      } else {
        TranscriptionOptions options;
        options.language = request.language;
        options.filename = "audio.wav";
        out.transcript = provider->transcribe_file(audio, options);
      }
    } catch (const exception & e) {
      out.transcript.status = make_error(ErrorCode::INTERNAL_ERROR, e.what());
    }

    if (!out.transcript.status.ok) {
      out.status = out.transcript.status;
      stage.finish(StageStatus::FAILED, out.status.error);
      RCLCPP_ERROR(pipeline_logger(), "transcription stage failed: %s", out.status.error.c_str());
      finish_cleanup();
      return out;
    }
    stage.finish(StageStatus::OK, to_string(out.transcript.segments.size()) + " segments");
  }

  // 3. diarization
  DiarizationResult diarization;
  bool have_diarization = false;
  {
    StageTimer stage(out.stages, "diarization");
    if (!voiceprint_) {
      stage.finish(StageStatus::SKIPPED, "voiceprint provider disabled");
    } else if (!voiceprint_->supports(Capability::DIARIZATION)) {
      stage.finish(StageStatus::SKIPPED, voiceprint_->name() + " does not diarize");
    } else {
      try {
        diarization = voiceprint_->diarization(audio);
      } catch (const exception & e) {
        diarization.status = make_error(ErrorCode::INTERNAL_ERROR, e.what());
      }
      if (diarization.status.ok) {
        have_diarization = true;
        out.num_speakers = diarization.num_speakers;
        stage.finish(StageStatus::OK, to_string(diarization.num_speakers) + " speakers");
      } else {
        out.degraded = true;
        stage.finish(StageStatus::FAILED, diarization.status.error);
        RCLCPP_WARN(
          pipeline_logger(), "diarization failed, returning unattributed transcript: %s",
          diarization.status.error.c_str());
      }
    }
  }

  // 4. fusion
  {
    StageTimer stage(out.stages, "fusion");
    if (out.degraded) {
      out.entries = fuse_segments(out.transcript.segments, nullptr, {}, config_.fusion);
    } else {
      out.entries = fuse_segments(
        out.transcript.segments, have_diarization ? &diarization : nullptr,
        request.candidates, config_.fusion);
    }
    stage.finish(StageStatus::OK, to_string(out.entries.size()) + " entries");
  }

  // 5. cleanup
  finish_cleanup();
  RCLCPP_INFO(
    pipeline_logger(), "pipeline done: %zu entries%s", out.entries.size(),
    out.degraded ? " (degraded)" : "");
  return out;
}

}  // namespace meetscribe
