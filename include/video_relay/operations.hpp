/**
 * @file operations.hpp
 * @brief Contract between the pipeline and its stage operations
 *
 * @details The pipeline does not know how an item is fetched or published.
 *          It hands a Downloader or Uploader the item, a progress callback
 *          and a cancellation token, and judges the returned OperationResult.
 *
 * @attention CONTRACT:
 *
 *   - Any failure MUST come back as success=false. An empty ref is never a
 *     success, whatever the success flag says
 *
 *   - Cancellation is cooperative: poll the token at natural checkpoints
 *     (between chunks, before launching a subprocess)
 *
 *   - Progress callbacks must be cheap; they run subscribers synchronously
 */

#ifndef VIDEO_RELAY_OPERATIONS_HPP
#define VIDEO_RELAY_OPERATIONS_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include "types.hpp"

namespace video_relay {

using ProgressCallback = std::function<void(const Progress &)>;

/**
 * @class CancellationToken
 * @brief Shared one-way cancellation flag.
 * @note Copies observe the same flag.
 */
class CancellationToken {
public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void request_cancel() { flag_->store(true); }
  bool is_cancelled() const { return flag_->load(); }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

/**
 * @enum FailureKind
 * @brief Failure class, reported for diagnostics only.
 * @note Both kinds consume the same retry budget.
 */
enum class FailureKind {
  None,
  Transient, //< Network, timeout, busy resource
  Permanent  //< Validation, not found, quota
};

const char *to_string(FailureKind kind);

/**
 * @struct OperationResult
 * @brief What a stage operation reports back.
 */
struct OperationResult {
  bool success = false;
  std::string ref;   //< Artifact (download) or published reference (upload)
  std::string error; //< Set when success is false
  FailureKind kind = FailureKind::None;
  Attributes metadata; //< Extra facts forwarded to the next stage

  /// success flag AND a non-empty reference
  bool is_definite_success() const { return success && !ref.empty(); }

  static OperationResult ok(std::string ref, Attributes metadata = {}) {
    OperationResult r;
    r.success = true;
    r.ref = std::move(ref);
    r.metadata = std::move(metadata);
    return r;
  }

  static OperationResult failure(std::string error,
                                 FailureKind kind = FailureKind::Transient) {
    OperationResult r;
    r.error = std::move(error);
    r.kind = kind;
    return r;
  }
};

/**
 * @class Downloader
 * @brief Fetches an item into a local artifact.
 */
class Downloader {
public:
  virtual ~Downloader() = default;

  /**
   * @param item_id Stable item identifier
   * @param payload Item metadata from detection
   * @return ref = artifact reference handed to the upload stage
   */
  virtual OperationResult download(const std::string &item_id,
                                   const Attributes &payload,
                                   const ProgressCallback &progress,
                                   const CancellationToken &token) = 0;
};

/**
 * @class Uploader
 * @brief Publishes a downloaded artifact.
 */
class Uploader {
public:
  virtual ~Uploader() = default;

  /**
   * @param artifact_ref Reference returned by the download stage
   * @return ref = published reference
   */
  virtual OperationResult upload(const std::string &item_id,
                                 const std::string &artifact_ref,
                                 const Attributes &payload,
                                 const ProgressCallback &progress,
                                 const CancellationToken &token) = 0;
};

} // namespace video_relay

#endif // VIDEO_RELAY_OPERATIONS_HPP
