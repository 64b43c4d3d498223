/**
 * @file remux_publisher.cpp
 * @brief RemuxPublisher implementation
 */

#include "video_relay/remux_publisher.hpp"

#include <cstdlib>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "video_relay/logging.hpp"

namespace fs = std::filesystem;

namespace video_relay {

std::string shell_quote(const std::string &arg) {
  std::string quoted = "'";
  for (char c : arg) {
    if (c == '\'')
      quoted += "'\\''";
    else
      quoted += c;
  }
  quoted += "'";
  return quoted;
}

RemuxPublisher::RemuxPublisher(fs::path outbox, std::string ffmpeg_bin)
    : outbox_(std::move(outbox)), ffmpeg_bin_(std::move(ffmpeg_bin)) {}

std::string RemuxPublisher::build_command(const std::string &input,
                                          const std::string &output) const {
  return fmt::format("{} -y -hide_banner -loglevel error -i {} "
                     "-c copy -movflags +faststart {}",
                     shell_quote(ffmpeg_bin_), shell_quote(input),
                     shell_quote(output));
}

OperationResult RemuxPublisher::upload(const std::string &item_id,
                                       const std::string &artifact_ref,
                                       const Attributes &payload,
                                       const ProgressCallback &progress,
                                       const CancellationToken &token) {
  (void)payload;

  std::error_code ec;
  if (!fs::exists(artifact_ref, ec)) {
    return OperationResult::failure(
        fmt::format("artifact {} is missing", artifact_ref),
        FailureKind::Permanent);
  }

  fs::create_directories(outbox_, ec);
  if (ec) {
    return OperationResult::failure(
        fmt::format("cannot create {}: {}", outbox_.string(), ec.message()));
  }

  const fs::path output = outbox_ / item_id;
  /// Hidden temp name keeps the extension so ffmpeg picks the same muxer
  const fs::path partial = outbox_ / ("." + item_id);

  if (token.is_cancelled())
    return OperationResult::failure("cancelled");

  if (progress)
    progress(Progress{0.0, 0.0, 0.0});

  const std::string cmd = build_command(artifact_ref, partial.string());
  LOG_INFO("[Publisher] Remuxing {}", item_id);

  int status = std::system(cmd.c_str());
  if (status != 0) {
    LOG_ERROR("[Publisher] FFmpeg failed with status {} for {}", status,
              item_id);
    fs::remove(partial, ec);
    return OperationResult::failure(
        fmt::format("ffmpeg exited with status {}", status));
  }

  const auto size = fs::file_size(partial, ec);
  if (ec || size == 0) {
    fs::remove(partial, ec);
    return OperationResult::failure(
        fmt::format("ffmpeg produced no output for {}", item_id));
  }

  fs::rename(partial, output, ec);
  if (ec) {
    return OperationResult::failure(fmt::format(
        "cannot rename {} to {}: {}", partial.string(), output.string(),
        ec.message()));
  }

  /// The staged copy is no longer needed once published
  fs::remove(artifact_ref, ec);
  if (ec)
    LOG_WARN("[Publisher] Could not remove {}: {}", artifact_ref,
             ec.message());

  if (progress)
    progress(Progress{100.0, 0.0, 0.0});

  Attributes metadata;
  metadata["published_bytes"] = std::to_string(size);
  return OperationResult::ok(output.string(), std::move(metadata));
}

} // namespace video_relay
