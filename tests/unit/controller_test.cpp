#include "video_relay/controller.hpp"

#include <cassert>
#include <atomic>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "test_support.hpp"

namespace {

using video_relay::Controller;
using video_relay::ControllerOptions;
using video_relay::EventBus;
using video_relay::EventData;
using video_relay::EventType;
using video_relay::ItemStatus;
using video_relay::OperationResult;
using video_relay::Priority;
using video_relay::TaskState;
using video_relay::testing::CountEvents;
using video_relay::testing::FakeDownloader;
using video_relay::testing::FakeUploader;
using video_relay::testing::Gate;
using video_relay::testing::MakePayload;
using video_relay::testing::RecordingSink;
using video_relay::testing::WaitUntil;

ControllerOptions FastOptions() {
  ControllerOptions options;
  options.download_concurrency = 1;
  options.upload_concurrency = 1;
  options.max_retries = 3;
  options.tick_interval = std::chrono::milliseconds(10);
  options.shutdown_timeout = std::chrono::milliseconds(2000);
  return options;
}

void Detect(EventBus &bus, const std::string &item_id) {
  EventData data;
  data.item_id = item_id;
  data.attributes = MakePayload(item_id);
  bus.publish(EventType::VideoDetected, std::move(data), "test");
}

void TestDetectedItemFlowsThroughBothStages() {
  EventBus bus;
  FakeDownloader downloader;
  FakeUploader uploader;
  RecordingSink sink;
  Controller controller(bus, downloader, uploader, &sink, FastOptions());
  controller.start();
  assert(controller.is_running());
  assert(CountEvents(bus, EventType::AppStarted) == 1);

  Detect(bus, "v1");
  assert(WaitUntil([&] { return controller.statistics().upload.completed == 1; }));
  assert(WaitUntil([&] { return controller.is_idle(); }));

  assert(uploader.ArtifactFor("v1") == "/staging/v1");
  assert(CountEvents(bus, EventType::VideoQueued, "v1") == 1);
  assert(CountEvents(bus, EventType::DownloadProgress, "v1") == 1);
  assert(WaitUntil([&] { return sink.Has("v1", ItemStatus::Completed); }));

  std::vector<ItemStatus> expected = {
      ItemStatus::Detected, ItemStatus::Downloading, ItemStatus::Downloaded,
      ItemStatus::Uploading, ItemStatus::Completed};
  assert(sink.StatusesFor("v1") == expected);

  auto stats = controller.statistics();
  assert(stats.download.completed == 1);
  assert(stats.download.pending == 0 && stats.download.processing == 0);
  assert(WaitUntil([&] {
    return CountEvents(bus, EventType::StatisticsUpdated) > 0;
  }));

  assert(controller.shutdown());
  assert(!controller.is_running());
  assert(CountEvents(bus, EventType::AppShutdown) == 1);
}

void TestUploadKeepsTheItemPriority() {
  EventBus bus;
  FakeDownloader downloader;
  FakeUploader uploader;
  Controller controller(bus, downloader, uploader, nullptr, FastOptions());
  controller.start();

  assert(controller.on_item_detected(MakePayload("fresh")));
  assert(controller.enqueue_backlog({MakePayload("old-1"),
                                     MakePayload("old-2")}) == 2);
  assert(WaitUntil([&] { return controller.statistics().upload.completed == 3; }));

  auto fresh = controller.upload_queue().find_task("fresh");
  auto old = controller.upload_queue().find_task("old-1");
  assert(fresh && old);
  assert(fresh->state == TaskState::Completed);
  assert(fresh->task.priority == Priority::High);
  assert(old->task.priority == Priority::Normal);
  assert(fresh->task.payload.at(video_relay::PRIORITY_KEY) == "1");

  controller.shutdown();
}

void TestHigherPriorityDownloadsGoFirst() {
  EventBus bus;
  FakeDownloader downloader;
  FakeUploader uploader;
  Gate gate;
  downloader.BlockOn(&gate);
  Controller controller(bus, downloader, uploader, nullptr, FastOptions());
  controller.start();

  // Occupies the only download slot until the gate opens
  controller.enqueue_backlog({MakePayload("blocker")});
  assert(WaitUntil([&] { return downloader.Active() == 1; }));

  controller.enqueue_backlog({MakePayload("backlog")});
  controller.on_item_detected(MakePayload("new"));
  gate.Open();
  assert(WaitUntil([&] { return controller.statistics().upload.completed == 3; }));

  auto started = bus.get_event_history(EventType::DownloadStarted);
  assert(started.size() == 3);
  // Most recent first
  assert(started[0].data.item_id == "backlog");
  assert(started[1].data.item_id == "new");
  assert(started[2].data.item_id == "blocker");

  controller.shutdown();
}

void TestFailedDownloadIsRetried() {
  EventBus bus;
  FakeDownloader downloader;
  FakeUploader uploader;
  RecordingSink sink;
  downloader.Script("flaky", {OperationResult::failure("timeout")});
  Controller controller(bus, downloader, uploader, &sink, FastOptions());
  controller.start();

  Detect(bus, "flaky");
  assert(WaitUntil([&] { return controller.statistics().upload.completed == 1; }));

  assert(downloader.Calls("flaky") == 2);
  auto snapshot = controller.download_queue().find_task("flaky");
  assert(snapshot && snapshot->state == TaskState::Completed);
  assert(snapshot->task.retry_count == 1);
  assert(CountEvents(bus, EventType::ErrorOccurred) == 0);
  assert(!sink.Has("flaky", ItemStatus::Failed));

  controller.shutdown();
}

void TestExhaustedRetriesAreReported() {
  EventBus bus;
  FakeDownloader downloader;
  FakeUploader uploader;
  RecordingSink sink;
  downloader.Script("doomed", {OperationResult::failure("quota exceeded"),
                               OperationResult::failure("quota exceeded")});
  ControllerOptions options = FastOptions();
  options.max_retries = 2;
  Controller controller(bus, downloader, uploader, &sink, options);
  controller.start();

  Detect(bus, "doomed");
  assert(WaitUntil([&] { return controller.statistics().download.failed == 1; }));
  assert(WaitUntil([&] { return sink.Has("doomed", ItemStatus::Failed); }));

  assert(downloader.Calls("doomed") == 2);
  assert(uploader.Calls("doomed") == 0);

  auto errors = bus.get_event_history(EventType::ErrorOccurred);
  assert(errors.size() == 1);
  assert(errors[0].data.item_id == "doomed");
  assert(errors[0].data.error == "quota exceeded");
  assert(errors[0].data.attributes.at("error_kind") == "exhausted_retries");
  assert(errors[0].data.attributes.at("stage") == "download");

  controller.shutdown();
}

void TestFailedUploadDoesNotRedownload() {
  EventBus bus;
  FakeDownloader downloader;
  FakeUploader uploader;
  uploader.Script("v6", {OperationResult::failure("503"),
                         OperationResult::failure("503"),
                         OperationResult::failure("503")});
  Controller controller(bus, downloader, uploader, nullptr, FastOptions());
  controller.start();

  Detect(bus, "v6");
  assert(WaitUntil([&] { return controller.statistics().upload.failed == 1; }));
  assert(uploader.Calls("v6") == 3);
  assert(downloader.Calls("v6") == 1);
  auto errors = bus.get_event_history(EventType::ErrorOccurred);
  assert(errors.size() == 1);
  assert(errors[0].data.attributes.at("stage") == "upload");

  controller.shutdown();
}

void TestNoFalseSuccessEndToEnd() {
  EventBus bus;
  FakeDownloader downloader;
  FakeUploader uploader;
  OperationResult hollow;
  hollow.success = true;
  downloader.Script("hollow", {hollow, hollow, hollow});
  Controller controller(bus, downloader, uploader, nullptr, FastOptions());
  controller.start();

  Detect(bus, "hollow");
  assert(WaitUntil([&] { return controller.statistics().download.failed == 1; }));
  assert(controller.statistics().download.completed == 0);
  assert(uploader.Calls("hollow") == 0);

  controller.shutdown();
}

void TestItemIsNeverInBothStagesAtOnce() {
  EventBus bus;
  FakeDownloader downloader;
  FakeUploader uploader;
  ControllerOptions options = FastOptions();
  options.download_concurrency = 3;
  options.upload_concurrency = 3;
  Controller controller(bus, downloader, uploader, nullptr, options);

  std::atomic<int> violations{0};
  uploader.on_upload = [&](const std::string &item_id) {
    auto snapshot = controller.download_queue().find_task(item_id);
    if (!snapshot || snapshot->state != TaskState::Completed)
      ++violations;
  };
  controller.start();

  for (int i = 0; i < 12; ++i) {
    Detect(bus, "item-" + std::to_string(i));
  }
  assert(WaitUntil([&] { return controller.statistics().upload.completed == 12; }));
  assert(violations.load() == 0);

  controller.shutdown();
}

void TestConcurrencyLimitIsRespected() {
  EventBus bus;
  FakeDownloader downloader;
  FakeUploader uploader;
  Gate gate;
  downloader.BlockOn(&gate);
  ControllerOptions options = FastOptions();
  options.download_concurrency = 2;
  Controller controller(bus, downloader, uploader, nullptr, options);
  controller.start();

  for (int i = 0; i < 5; ++i) {
    Detect(bus, "c" + std::to_string(i));
  }
  assert(WaitUntil([&] { return downloader.Active() == 2; }));
  // Several ticks later, still capped
  std::this_thread::sleep_for(std::chrono::milliseconds(60));
  assert(downloader.Active() == 2);
  assert(controller.statistics().download.processing == 2);
  assert(controller.statistics().download.pending == 3);

  gate.Open();
  assert(WaitUntil([&] { return controller.statistics().upload.completed == 5; }));
  assert(downloader.MaxActive() == 2);

  controller.shutdown();
}

void TestDuplicateDetectionsAreIgnored() {
  EventBus bus;
  FakeDownloader downloader;
  FakeUploader uploader;
  Controller controller(bus, downloader, uploader, nullptr, FastOptions());
  controller.start();

  Detect(bus, "twice");
  Detect(bus, "twice");
  assert(WaitUntil([&] { return controller.statistics().upload.completed == 1; }));
  assert(WaitUntil([&] { return controller.is_idle(); }));

  // Re-detection after publishing is refused too
  assert(!controller.on_item_detected(MakePayload("twice")));
  assert(downloader.Calls("twice") == 1);
  assert(uploader.Calls("twice") == 1);
  assert(CountEvents(bus, EventType::VideoQueued, "twice") == 1);

  controller.shutdown();
}

void TestCancelItemInEitherState() {
  EventBus bus;
  FakeDownloader downloader;
  FakeUploader uploader;
  RecordingSink sink;
  Gate gate;
  downloader.BlockOn(&gate);
  Controller controller(bus, downloader, uploader, &sink, FastOptions());
  controller.start();

  Detect(bus, "running");
  assert(WaitUntil([&] { return downloader.Active() == 1; }));
  Detect(bus, "waiting");

  // Pending: removed straight from the queue
  assert(controller.cancel_item("waiting"));
  assert(!controller.download_queue().contains("waiting"));
  assert(sink.Has("waiting", ItemStatus::Cancelled));

  // Running: the worker is cancelled and its result discarded
  assert(controller.cancel_item("running"));
  assert(WaitUntil([&] { return downloader.Active() == 0; }));
  assert(!controller.download_queue().contains("running"));
  assert(sink.Has("running", ItemStatus::Cancelled));
  assert(CountEvents(bus, EventType::DownloadCancelled) == 2);

  assert(!controller.cancel_item("nobody"));

  gate.Open();
  assert(WaitUntil([&] { return controller.is_idle(); }));
  assert(uploader.Calls("running") == 0);
  assert(controller.statistics().download.completed == 0);

  controller.shutdown();
}

void TestItemRemovedMidDownloadNeverUploads() {
  EventBus bus;
  FakeDownloader downloader;
  FakeUploader uploader;
  Gate gate;
  downloader.BlockOn(&gate);
  Controller controller(bus, downloader, uploader, nullptr, FastOptions());
  controller.start();

  Detect(bus, "v1");
  assert(WaitUntil([&] { return downloader.Active() == 1; }));

  // Pulled from the queue while the worker is still running
  assert(controller.download_queue().cancel_task("v1"));
  gate.Open();
  assert(WaitUntil([&] { return downloader.Active() == 0; }));
  assert(WaitUntil([&] { return controller.is_idle(); }));

  assert(!controller.download_queue().contains("v1"));
  assert(!controller.upload_queue().contains("v1"));
  assert(uploader.Calls("v1") == 0);
  assert(CountEvents(bus, EventType::DownloadCompleted) == 0);
  assert(CountEvents(bus, EventType::UploadCompleted) == 0);

  controller.shutdown();
}

void TestShutdownCancelsInFlightWorkOnce() {
  EventBus bus;
  FakeDownloader downloader;
  FakeUploader uploader;
  RecordingSink sink;
  Gate gate;
  downloader.BlockOn(&gate);
  Controller controller(bus, downloader, uploader, &sink, FastOptions());
  controller.start();

  Detect(bus, "in-flight");
  Detect(bus, "queued");
  assert(WaitUntil([&] { return downloader.Active() == 1; }));

  assert(controller.shutdown(std::chrono::milliseconds(2000)));
  assert(downloader.Active() == 0);
  assert(sink.Has("in-flight", ItemStatus::Cancelled));
  assert(!controller.download_queue().contains("in-flight"));
  assert(CountEvents(bus, EventType::AppShutdown) == 1);

  auto shutdown = bus.get_event_history(EventType::AppShutdown);
  assert(shutdown[0].data.attributes.at("clean") == "true");
  assert(shutdown[0].data.attributes.at("download_pending") == "1");

  // Idempotent, and intake is closed
  assert(controller.shutdown());
  assert(CountEvents(bus, EventType::AppShutdown) == 1);
  assert(!controller.on_item_detected(MakePayload("too-late")));
  assert(bus.subscriber_count(EventType::VideoDetected) == 0);

  gate.Open();
}

void TestExitStatusIsCapped() {
  video_relay::PipelineStatistics stats;
  assert(video_relay::exit_status(stats) == 0);

  stats.download.failed = 2;
  stats.upload.failed = 1;
  assert(video_relay::exit_status(stats) == 3);

  // 256 failures must not wrap to a zero exit status
  stats.download.failed = 200;
  stats.upload.failed = 56;
  assert(video_relay::exit_status(stats) == 255);
}

void TestDestructorShutsDown() {
  EventBus bus;
  FakeDownloader downloader;
  FakeUploader uploader;
  {
    Controller controller(bus, downloader, uploader, nullptr, FastOptions());
    controller.start();
    Detect(bus, "quick");
    assert(WaitUntil([&] { return controller.statistics().upload.completed == 1; }));
  }
  assert(CountEvents(bus, EventType::AppShutdown) == 1);
  assert(bus.subscriber_count(EventType::DownloadCompleted) == 0);
}

} // namespace

int main() {
  TestDetectedItemFlowsThroughBothStages();
  TestUploadKeepsTheItemPriority();
  TestHigherPriorityDownloadsGoFirst();
  TestFailedDownloadIsRetried();
  TestExhaustedRetriesAreReported();
  TestFailedUploadDoesNotRedownload();
  TestNoFalseSuccessEndToEnd();
  TestItemIsNeverInBothStagesAtOnce();
  TestConcurrencyLimitIsRespected();
  TestDuplicateDetectionsAreIgnored();
  TestCancelItemInEitherState();
  TestItemRemovedMidDownloadNeverUploads();
  TestShutdownCancelsInFlightWorkOnce();
  TestDestructorShutsDown();
  TestExitStatusIsCapped();

  std::cout << "video_relay_unit_controller: pass\n";
  return 0;
}
