#include "video_relay/local_stager.hpp"
#include "video_relay/media_probe.hpp"
#include "video_relay/remux_publisher.hpp"
#include "video_relay/status_sink.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "test_support.hpp"

namespace {

namespace fs = std::filesystem;

using video_relay::Attributes;
using video_relay::CancellationToken;
using video_relay::FailureKind;
using video_relay::ItemStatus;
using video_relay::LocalStager;
using video_relay::OperationResult;
using video_relay::Progress;
using video_relay::RemuxPublisher;
using video_relay::StatusLog;
using video_relay::testing::ReadFile;
using video_relay::testing::TempDir;
using video_relay::testing::WriteFile;

Attributes SourcePayload(const std::string &item_id, const fs::path &source) {
  Attributes payload;
  payload[video_relay::ITEM_ID_KEY] = item_id;
  payload["source_path"] = source.string();
  return payload;
}

std::vector<std::string> SplitTabs(const std::string &line) {
  std::vector<std::string> fields;
  std::stringstream stream(line);
  std::string field;
  while (std::getline(stream, field, '\t')) {
    fields.push_back(field);
  }
  return fields;
}

// **----- LocalStager -----**

void TestStagerCopiesInChunksWithProgress() {
  TempDir dir("stager_copy");
  const fs::path source = dir.path() / "in.mp4";
  std::string content(LocalStager::CHUNK_SIZE * 2 + 1234, '\0');
  for (size_t i = 0; i < content.size(); ++i) {
    content[i] = static_cast<char>(i % 251);
  }
  WriteFile(source, content);

  LocalStager stager(dir.path() / "staging", false);
  std::vector<Progress> updates;
  OperationResult result = stager.download(
      "in.mp4", SourcePayload("in.mp4", source),
      [&updates](const Progress &p) { updates.push_back(p); },
      CancellationToken());

  assert(result.is_definite_success());
  assert(result.ref == (dir.path() / "staging" / "in.mp4").string());
  assert(ReadFile(result.ref) == content);
  assert(!fs::exists(dir.path() / "staging" / "in.mp4.part"));
  assert(result.metadata.at("staged_bytes") == std::to_string(content.size()));

  assert(updates.size() == 3);
  assert(updates.back().percent == 100.0);
  assert(updates.front().percent < updates.back().percent);
  // The inbox copy is left alone
  assert(fs::exists(source));
}

void TestStagerRejectsPayloadWithoutSource() {
  TempDir dir("stager_nosource");
  LocalStager stager(dir.path(), false);
  Attributes payload;
  payload[video_relay::ITEM_ID_KEY] = "x";

  OperationResult result =
      stager.download("x", payload, nullptr, CancellationToken());
  assert(!result.success);
  assert(result.kind == FailureKind::Permanent);

  result = stager.download("x", SourcePayload("x", dir.path() / "missing.mp4"),
                           nullptr, CancellationToken());
  assert(!result.success);
  assert(result.kind == FailureKind::Permanent);
}

void TestStagerHonoursCancellation() {
  TempDir dir("stager_cancel");
  const fs::path source = dir.path() / "big.mp4";
  WriteFile(source, std::string(LocalStager::CHUNK_SIZE * 3, 'z'));

  LocalStager stager(dir.path() / "staging", false);
  CancellationToken token;
  OperationResult result = stager.download(
      "big.mp4", SourcePayload("big.mp4", source),
      [&token](const Progress &) { token.request_cancel(); }, token);

  assert(!result.success);
  assert(result.error == "cancelled");
  assert(!fs::exists(dir.path() / "staging" / "big.mp4"));
  assert(!fs::exists(dir.path() / "staging" / "big.mp4.part"));
}

void TestStagerVerificationRejectsNonMedia() {
  TempDir dir("stager_verify");
  const fs::path source = dir.path() / "fake.mp4";
  std::string text;
  for (int i = 0; i < 200; ++i) {
    text += "this is plain text and certainly not a video container\n";
  }
  WriteFile(source, text);

  LocalStager stager(dir.path() / "staging", true);
  OperationResult result = stager.download(
      "fake.mp4", SourcePayload("fake.mp4", source), nullptr,
      CancellationToken());

  assert(!result.success);
  assert(result.kind == FailureKind::Permanent);
  assert(!fs::exists(dir.path() / "staging" / "fake.mp4"));
  assert(!fs::exists(dir.path() / "staging" / "fake.mp4.part"));
}

void TestProbeReportsMissingFile() {
  std::string reason;
  auto info = video_relay::probe_media("/nonexistent/clip.mp4", &reason);
  assert(!info);
  assert(!reason.empty());
}

// **----- RemuxPublisher -----**

void TestPublisherCommandQuotesPaths() {
  RemuxPublisher publisher("/out", "ffmpeg");
  std::string cmd = publisher.build_command("/in/it's here.mp4", "/out/x.mp4");
  assert(cmd.find("'ffmpeg' -y -hide_banner -loglevel error") == 0);
  assert(cmd.find("-i '/in/it'\\''s here.mp4'") != std::string::npos);
  assert(cmd.find("-c copy -movflags +faststart '/out/x.mp4'") !=
         std::string::npos);

  assert(video_relay::shell_quote("plain") == "'plain'");
}

void TestPublisherPublishesAndCleansUp() {
  TempDir dir("publisher_ok");
  const fs::path artifact = dir.path() / "staged.mp4";
  WriteFile(artifact, "video bytes");

  // Stand-in for ffmpeg: copies the -i argument to the last argument
  const fs::path fake = dir.path() / "fake_ffmpeg.sh";
  WriteFile(fake, "#!/bin/sh\n"
                  "for last; do :; done\n"
                  "cp \"$6\" \"$last\"\n");
  fs::permissions(fake, fs::perms::owner_all, fs::perm_options::add);

  RemuxPublisher publisher(dir.path() / "outbox", fake.string());
  std::vector<double> percents;
  OperationResult result = publisher.upload(
      "clip.mp4", artifact.string(), {},
      [&percents](const Progress &p) { percents.push_back(p.percent); },
      CancellationToken());

  assert(result.is_definite_success());
  assert(result.ref == (dir.path() / "outbox" / "clip.mp4").string());
  assert(ReadFile(result.ref) == "video bytes");
  assert(!fs::exists(dir.path() / "outbox" / ".clip.mp4"));
  assert(!fs::exists(artifact));
  assert(percents.size() == 2);
  assert(percents.back() == 100.0);
}

void TestPublisherFailsOnNonZeroExit() {
  TempDir dir("publisher_fail");
  const fs::path artifact = dir.path() / "staged.mp4";
  WriteFile(artifact, "video bytes");

  RemuxPublisher publisher(dir.path() / "outbox", "false");
  OperationResult result = publisher.upload(
      "clip.mp4", artifact.string(), {}, nullptr, CancellationToken());

  assert(!result.success);
  assert(result.kind == FailureKind::Transient);
  assert(!fs::exists(dir.path() / "outbox" / "clip.mp4"));
  // Kept for the retry
  assert(fs::exists(artifact));
}

void TestPublisherRequiresOutput() {
  TempDir dir("publisher_empty");
  const fs::path artifact = dir.path() / "staged.mp4";
  WriteFile(artifact, "video bytes");

  // Exit status 0 without writing anything is not a success
  RemuxPublisher publisher(dir.path() / "outbox", "true");
  OperationResult result = publisher.upload(
      "clip.mp4", artifact.string(), {}, nullptr, CancellationToken());

  assert(!result.success);
  assert(result.ref.empty());
  assert(!fs::exists(dir.path() / "outbox" / "clip.mp4"));
}

void TestPublisherChecksArtifactAndToken() {
  TempDir dir("publisher_guard");
  RemuxPublisher publisher(dir.path() / "outbox", "true");

  OperationResult missing =
      publisher.upload("clip.mp4", (dir.path() / "gone.mp4").string(), {},
                       nullptr, CancellationToken());
  assert(!missing.success);
  assert(missing.kind == FailureKind::Permanent);

  const fs::path artifact = dir.path() / "staged.mp4";
  WriteFile(artifact, "video bytes");
  CancellationToken token;
  token.request_cancel();
  OperationResult cancelled =
      publisher.upload("clip.mp4", artifact.string(), {}, nullptr, token);
  assert(!cancelled.success);
  assert(cancelled.error == "cancelled");
}

// **----- StatusLog -----**

void TestStatusLogAppendsTabSeparatedLines() {
  TempDir dir("status_log");
  const fs::path path = dir.path() / "status.log";
  {
    StatusLog log(path.string());
    log.record("a.mp4", ItemStatus::Detected, "high");
    log.record("a.mp4", ItemStatus::Failed, "download:\tbad\nthing");
  }
  {
    StatusLog log(path.string());
    log.record("b.mp4", ItemStatus::Completed, "");
  }

  std::stringstream content(ReadFile(path));
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(content, line)) {
    lines.push_back(line);
  }
  assert(lines.size() == 3);

  auto first = SplitTabs(lines[0]);
  assert(first.size() == 4);
  assert(first[1] == "a.mp4");
  assert(first[2] == "detected");
  assert(first[3] == "high");

  auto second = SplitTabs(lines[1]);
  assert(second.size() == 4);
  assert(second[2] == "failed");
  assert(second[3] == "download: bad thing");

  auto third = SplitTabs(lines[2]);
  assert(third[1] == "b.mp4");
  assert(third[2] == "completed");
}

void TestStatusLogThrowsWhenUnwritable() {
  bool threw = false;
  try {
    StatusLog log("/nonexistent-dir/deeper/status.log");
  } catch (const std::runtime_error &) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestStagerCopiesInChunksWithProgress();
  TestStagerRejectsPayloadWithoutSource();
  TestStagerHonoursCancellation();
  TestStagerVerificationRejectsNonMedia();
  TestProbeReportsMissingFile();
  TestPublisherCommandQuotesPaths();
  TestPublisherPublishesAndCleansUp();
  TestPublisherFailsOnNonZeroExit();
  TestPublisherRequiresOutput();
  TestPublisherChecksArtifactAndToken();
  TestStatusLogAppendsTabSeparatedLines();
  TestStatusLogThrowsWhenUnwritable();

  std::cout << "video_relay_unit_stage_operations: pass\n";
  return 0;
}
