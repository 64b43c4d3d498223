/**
 * @file remux_publisher.hpp
 * @brief Upload stage operation: publish a staged artifact with FFmpeg
 *
 * @details Stream-copies the artifact into the outbox with the index moved to
 *          the front (-movflags +faststart), so the published file is playable
 *          while still being transferred by whatever serves the outbox.
 *
 * @note A running ffmpeg process is not interrupted on cancellation. The
 *       token is checked before launch; a late result is discarded by the
 *       worker pool.
 */

#ifndef VIDEO_RELAY_REMUX_PUBLISHER_HPP
#define VIDEO_RELAY_REMUX_PUBLISHER_HPP

#include <filesystem>
#include <string>

#include "operations.hpp"

namespace video_relay {

class RemuxPublisher : public Uploader {
public:
  /**
   * @param outbox Destination directory (created on first use)
   * @param ffmpeg_bin FFmpeg executable name or path
   */
  RemuxPublisher(std::filesystem::path outbox, std::string ffmpeg_bin);

  OperationResult upload(const std::string &item_id,
                         const std::string &artifact_ref,
                         const Attributes &payload,
                         const ProgressCallback &progress,
                         const CancellationToken &token) override;

  /// Shell command for one remux (exposed for logging and tests)
  std::string build_command(const std::string &input,
                            const std::string &output) const;

private:
  std::filesystem::path outbox_;
  std::string ffmpeg_bin_;
};

/// Quote @p arg for /bin/sh.
std::string shell_quote(const std::string &arg);

} // namespace video_relay

#endif // VIDEO_RELAY_REMUX_PUBLISHER_HPP
