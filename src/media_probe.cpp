/**
 * @file media_probe.cpp
 * @brief MediaProbe implementation
 */

#include "video_relay/media_probe.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
}

#include <fmt/core.h>

#include "video_relay/logging.hpp"

namespace video_relay {

namespace {

/// Closes the demuxer on every exit path
struct FormatContextGuard {
  AVFormatContext *ctx = nullptr;
  ~FormatContextGuard() {
    if (ctx)
      avformat_close_input(&ctx);
  }
};

std::string av_error_string(int code) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(code, buf, sizeof(buf));
  return buf;
}

} // anonymous namespace

std::optional<MediaInfo> probe_media(const std::string &path,
                                     std::string *error) {
  auto fail = [&](std::string reason) -> std::optional<MediaInfo> {
    LOG_WARN("[Probe] {}: {}", path, reason);
    if (error)
      *error = std::move(reason);
    return std::nullopt;
  };

  FormatContextGuard guard;

  /// Open input (probes the container format)
  int ret = avformat_open_input(&guard.ctx, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    return fail(
        fmt::format("avformat_open_input failed: {}", av_error_string(ret)));
  }

  /// Find stream info (reads some packets to determine streams)
  ret = avformat_find_stream_info(guard.ctx, nullptr);
  if (ret < 0) {
    return fail(fmt::format("avformat_find_stream_info failed: {}",
                            av_error_string(ret)));
  }

  /// Find the best video stream
  int video_stream_idx =
      av_find_best_stream(guard.ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_stream_idx < 0) {
    return fail("no video stream found");
  }

  const AVCodecParameters *param =
      guard.ctx->streams[video_stream_idx]->codecpar;

  MediaInfo info;
  info.video_codec = avcodec_get_name(param->codec_id);
  info.width = param->width;
  info.height = param->height;
  info.stream_count = guard.ctx->nb_streams;
  if (guard.ctx->duration != AV_NOPTS_VALUE && guard.ctx->duration > 0) {
    info.duration_sec =
        static_cast<double>(guard.ctx->duration) / AV_TIME_BASE;
  }

  return info;
}

} // namespace video_relay
