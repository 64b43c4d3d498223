/**
 * @file main.cpp
 * @brief Entry point for the Video Relay service
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Backlog: videos already in the inbox are queued at NORMAL
 *
 *          - Watch mode: new videos are queued at HIGH until SIGINT/SIGTERM
 *
 *          - Run-once mode (RUN_ONCE=1): drain the backlog and exit
 *
 * @note The exit status is the number of items that exhausted their retries,
 *       capped at 255.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "video_relay/config.hpp"
#include "video_relay/controller.hpp"
#include "video_relay/directory_watcher.hpp"
#include "video_relay/event_bus.hpp"
#include "video_relay/local_stager.hpp"
#include "video_relay/logging.hpp"
#include "video_relay/remux_publisher.hpp"
#include "video_relay/status_sink.hpp"
#include "video_relay/system.hpp"

using namespace video_relay;

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_signal(int) { g_stop_requested = true; }

std::chrono::milliseconds seconds_to_ms(double seconds) {
  return std::chrono::milliseconds(static_cast<long>(seconds * 1000.0));
}

void print_relay_summary(const PipelineStatistics &stats,
                         const std::vector<std::string> &failed_items,
                         double wall_clock_sec) {
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================= VIDEO RELAY SUMMARY =================\n");
  fmt::print("{:<25} {:>25}\n", "Downloaded:", stats.download.completed);
  fmt::print("{:<25} {:>25}\n", "Published:", stats.upload.completed);
  fmt::print("{:<25} {:>25}\n", "Failed (download):", stats.download.failed);
  fmt::print("{:<25} {:>25}\n", "Failed (upload):", stats.upload.failed);
  fmt::print("{:<25} {:>25}\n", "Left pending:",
             stats.download.pending + stats.upload.pending);
  fmt::print("{:<25} {:>25}\n", "Run time:", format_time(wall_clock_sec));
  fmt::print(fg(fmt::color::cyan),
             "=======================================================\n");

  if (!failed_items.empty()) {
    fmt::print(fg(fmt::color::red), "Failed items:\n");
    for (const auto &item : failed_items) {
      fmt::print(fg(fmt::color::red), "  - {}\n", item);
    }
  }
  std::fflush(stdout);
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 3) {
    LOG_WARN("Usage: ./video_relay <inbox> <outbox>");
    return 1;
  }

  namespace fs = std::filesystem;
  const fs::path inbox = argv[1];
  const fs::path outbox = argv[2];

  if (!fs::is_directory(inbox)) {
    LOG_ERROR("Inbox is not a directory: {}", inbox.string());
    return 1;
  }

  std::error_code ec;
  fs::create_directories(outbox, ec);
  if (ec) {
    LOG_ERROR("Cannot create outbox {}: {}", outbox.string(), ec.message());
    return 1;
  }

  // **---- CONFIGURATION ----**

  ControllerOptions options;
  fs::path staging_dir;
  fs::path status_path;
  std::unique_ptr<StatusLog> status_log;
  size_t history_limit = 0;
  std::chrono::milliseconds watch_interval{0};
  std::chrono::milliseconds stability_delay{0};
  bool verify_media = true;
  bool run_once = false;
  std::string ffmpeg_bin;
  try {
    options.download_concurrency = static_cast<size_t>(
        resolve_concurrency(Config::download_concurrency()));
    options.upload_concurrency = static_cast<size_t>(
        resolve_concurrency(Config::upload_concurrency()));
    options.max_retries = Config::max_retries();
    options.tick_interval =
        std::chrono::milliseconds(Config::tick_interval_ms());
    options.shutdown_timeout = seconds_to_ms(Config::shutdown_timeout_sec());

    staging_dir = Config::staging_dir().empty()
                      ? outbox / ".staging"
                      : fs::path(Config::staging_dir());
    status_path = Config::status_log().empty()
                      ? outbox / "status.log"
                      : fs::path(Config::status_log());
    history_limit = static_cast<size_t>(Config::event_history_limit());
    watch_interval = seconds_to_ms(Config::watch_interval_sec());
    stability_delay = std::chrono::milliseconds(Config::stability_delay_ms());
    verify_media = Config::verify_media();
    run_once = Config::run_once();
    ffmpeg_bin = Config::ffmpeg_bin();

    status_log = std::make_unique<StatusLog>(status_path.string());
  } catch (const std::exception &e) {
    LOG_ERROR("Invalid configuration: {}", e.what());
    return 1;
  }

  LOG_INFO("Video Relay");
  LOG_INFO("Inbox: {}", inbox.string());
  LOG_INFO("Outbox: {}", outbox.string());
  LOG_INFO("Staging: {}", staging_dir.string());
  LOG_INFO("Status log: {}", status_path.string());
  LOG_INFO("Concurrency: download={} upload={}", options.download_concurrency,
           options.upload_concurrency);

  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);

  // **---- WIRING ----**

  EventBus bus(history_limit);

  std::mutex failed_mutex;
  std::vector<std::string> failed_items;
  bus.subscribe(EventType::ErrorOccurred, [&](const Event &event) {
    auto kind = event.data.attributes.find("error_kind");
    if (kind == event.data.attributes.end() ||
        kind->second != "exhausted_retries")
      return;
    std::lock_guard<std::mutex> lock(failed_mutex);
    failed_items.push_back(
        fmt::format("{}: {}", event.data.item_id, event.data.error));
  });

  LocalStager stager(staging_dir, verify_media);
  RemuxPublisher publisher(outbox, ffmpeg_bin);
  Controller controller(bus, stager, publisher, status_log.get(), options);
  DirectoryWatcher watcher(bus, inbox, watch_interval, stability_delay);

  auto run_start = std::chrono::steady_clock::now();
  controller.start();

  std::vector<Attributes> backlog = watcher.collect_backlog();
  LOG_INFO("Found {} video files already in the inbox", backlog.size());
  controller.enqueue_backlog(backlog);

  if (!run_once) {
    watcher.start();
  }

  // **---- RUN ----**

  while (!g_stop_requested.load()) {
    if (run_once && controller.is_idle())
      break;
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  if (g_stop_requested.load())
    LOG_WARN("Stop requested, shutting down");

  watcher.stop();
  bool clean = controller.shutdown();
  if (!clean)
    LOG_WARN("Some workers did not stop in time");

  double elapsed_sec = std::chrono::duration<double>(
                           std::chrono::steady_clock::now() - run_start)
                           .count();

  TimingCollector::print_summary();

  PipelineStatistics stats = controller.statistics();
  std::vector<std::string> failed_copy;
  {
    std::lock_guard<std::mutex> lock(failed_mutex);
    failed_copy = failed_items;
  }
  print_relay_summary(stats, failed_copy, elapsed_sec);

  return exit_status(stats);
}
