/**
 * @file media_probe.hpp
 * @brief Container inspection through libavformat
 *
 * @details Opens a media file, reads its stream info and requires a video
 *          stream. Used to verify staged artifacts before they are handed to
 *          the upload stage.
 */

#ifndef VIDEO_RELAY_MEDIA_PROBE_HPP
#define VIDEO_RELAY_MEDIA_PROBE_HPP

#include <optional>
#include <string>

namespace video_relay {

/**
 * @struct MediaInfo
 * @brief Facts about the best video stream of a file.
 */
struct MediaInfo {
  double duration_sec = 0.0; //< Container duration (0 if unknown)
  std::string video_codec;   //< e.g. "h264", "hevc"
  int width = 0;
  int height = 0;
  unsigned int stream_count = 0;
};

/**
 * @brief Probe a media file.
 * @param path File to open
 * @param error Receives the reason on failure (optional)
 * @return MediaInfo, or nullopt if the file cannot be opened or has no video
 *         stream
 */
std::optional<MediaInfo> probe_media(const std::string &path,
                                     std::string *error = nullptr);

} // namespace video_relay

#endif // VIDEO_RELAY_MEDIA_PROBE_HPP
