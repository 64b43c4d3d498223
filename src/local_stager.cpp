/**
 * @file local_stager.cpp
 * @brief LocalStager implementation
 */

#include "video_relay/local_stager.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "video_relay/logging.hpp"
#include "video_relay/media_probe.hpp"
#include "video_relay/system.hpp"

namespace fs = std::filesystem;

namespace video_relay {

namespace {

/// Best effort; a leftover .part file is overwritten by the next attempt
void remove_partial(const fs::path &path) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec)
    LOG_WARN("[Stager] Could not remove {}: {}", path.string(), ec.message());
}

} // anonymous namespace

LocalStager::LocalStager(fs::path staging_dir, bool verify_media)
    : staging_dir_(std::move(staging_dir)), verify_media_(verify_media) {}

OperationResult LocalStager::download(const std::string &item_id,
                                      const Attributes &payload,
                                      const ProgressCallback &progress,
                                      const CancellationToken &token) {
  auto source_it = payload.find("source_path");
  if (source_it == payload.end() || source_it->second.empty()) {
    return OperationResult::failure("payload has no source_path",
                                    FailureKind::Permanent);
  }
  const fs::path source = source_it->second;

  std::error_code ec;
  const auto total = fs::file_size(source, ec);
  if (ec) {
    return OperationResult::failure(
        fmt::format("cannot stat {}: {}", source.string(), ec.message()),
        FailureKind::Permanent);
  }

  fs::create_directories(staging_dir_, ec);
  if (ec) {
    return OperationResult::failure(fmt::format(
        "cannot create {}: {}", staging_dir_.string(), ec.message()));
  }

  const fs::path target = staging_dir_ / item_id;
  const fs::path partial = staging_dir_ / (item_id + ".part");

  std::ifstream in(source, std::ios::binary);
  if (!in) {
    return OperationResult::failure(
        fmt::format("cannot open {}", source.string()));
  }
  std::ofstream out(partial, std::ios::binary | std::ios::trunc);
  if (!out) {
    return OperationResult::failure(
        fmt::format("cannot create {}", partial.string()));
  }

  LOG_INFO("[Stager] {} -> {} ({})", source.filename().string(),
           target.string(), format_bytes(total));

  // **----- Chunked copy -----**

  std::vector<char> buffer(CHUNK_SIZE);
  std::uintmax_t copied = 0;
  const auto start = std::chrono::steady_clock::now();

  while (copied < total) {
    if (token.is_cancelled()) {
      out.close();
      remove_partial(partial);
      return OperationResult::failure("cancelled");
    }

    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize got = in.gcount();
    if (got <= 0)
      break;

    out.write(buffer.data(), got);
    if (!out) {
      out.close();
      remove_partial(partial);
      return OperationResult::failure(
          fmt::format("write to {} failed", partial.string()));
    }
    copied += static_cast<std::uintmax_t>(got);

    if (progress) {
      const double elapsed = std::chrono::duration<double>(
                                 std::chrono::steady_clock::now() - start)
                                 .count();
      Progress p;
      p.percent = total > 0 ? 100.0 * static_cast<double>(copied) /
                                  static_cast<double>(total)
                            : 100.0;
      p.rate = elapsed > 0.0 ? static_cast<double>(copied) / elapsed : 0.0;
      p.eta_sec = p.rate > 0.0
                      ? static_cast<double>(total - copied) / p.rate
                      : 0.0;
      progress(p);
    }
  }

  out.close();
  if (copied != total || !out) {
    remove_partial(partial);
    return OperationResult::failure(
        fmt::format("short copy of {}: {} of {} bytes", source.string(),
                    copied, total));
  }

  // **----- Verification -----**

  Attributes metadata;
  metadata["staged_bytes"] = std::to_string(copied);

  if (verify_media_) {
    std::string reason;
    auto info = probe_media(partial.string(), &reason);
    if (!info) {
      remove_partial(partial);
      return OperationResult::failure(
          fmt::format("{} is not a playable video: {}", item_id, reason),
          FailureKind::Permanent);
    }
    metadata["duration_sec"] = fmt::format("{:.2f}", info->duration_sec);
    metadata["video_codec"] = info->video_codec;
  }

  fs::rename(partial, target, ec);
  if (ec) {
    remove_partial(partial);
    return OperationResult::failure(fmt::format(
        "cannot rename {} to {}: {}", partial.string(), target.string(),
        ec.message()));
  }

  return OperationResult::ok(target.string(), std::move(metadata));
}

} // namespace video_relay
