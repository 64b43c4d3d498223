/**
 * @file local_stager.hpp
 * @brief Download stage operation: copy a detected file into staging
 *
 * @details The "download" of a local inbox file is a chunked copy into the
 *          staging directory, so that the inbox can be refilled while the
 *          upload stage works on a private copy.
 *
 *          1. Copy source_path -> staging_dir/<item_id>.part in 1 MiB chunks
 *
 *          2. Report progress and check the token between chunks
 *
 *          3. Optionally verify the copy with probe_media()
 *
 *          4. Rename to staging_dir/<item_id>; that path is the artifact ref
 */

#ifndef VIDEO_RELAY_LOCAL_STAGER_HPP
#define VIDEO_RELAY_LOCAL_STAGER_HPP

#include <cstddef>
#include <filesystem>

#include "operations.hpp"

namespace video_relay {

class LocalStager : public Downloader {
public:
  static constexpr std::size_t CHUNK_SIZE = 1 << 20;

  /**
   * @param staging_dir Created on first use
   * @param verify_media Reject copies libavformat cannot open
   */
  LocalStager(std::filesystem::path staging_dir, bool verify_media);

  OperationResult download(const std::string &item_id,
                           const Attributes &payload,
                           const ProgressCallback &progress,
                           const CancellationToken &token) override;

  const std::filesystem::path &staging_dir() const { return staging_dir_; }

private:
  std::filesystem::path staging_dir_;
  bool verify_media_;
};

} // namespace video_relay

#endif // VIDEO_RELAY_LOCAL_STAGER_HPP
