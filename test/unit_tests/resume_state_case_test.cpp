#include <catch2/catch_test_macros.hpp>
#include "msdl/destination_file.hpp"
#include "msdl/errors.hpp"
#include "msdl/resume_state.hpp"

#include "fake_hub.hpp"

#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace {

msdl::TransferPlan MakePlan(const fs::path& destination, const std::string& content, int ranges) {
    msdl::RemoteFile file;
    file.path = "model.bin";
    file.name = "model.bin";
    file.size = static_cast<int64_t>(content.size());
    file.sha256 = msdl_test::Sha256Of(content);
    msdl::DownloadConfig config;
    config.max_workers = ranges;
    config.chunk_threshold_bytes = 1;
    config.min_chunk_bytes = 1;
    return msdl::TransferPlanner::PlanTransfer(file, destination.string(), config);
}

nlohmann::json ReadSidecar(const fs::path& destination) {
    return nlohmann::json::parse(msdl_test::ReadFile(msdl::ResumeStateTracker::SidecarPath(destination.string())));
}

// Writes the bytes of range `index` and records it complete.
void CompleteRange(msdl::ResumeStateTracker& tracker, msdl::DestinationFile& file, const msdl::TransferPlan& plan,
                   const std::string& content, size_t index) {
    const auto& range = plan.ranges[index];
    file.WriteAt(range.start, content.data() + range.start, static_cast<size_t>(range.length()));
    file.Sync();
    tracker.RecordComplete(plan.destination, index);
}

} // namespace

TEST_CASE("Load - Fresh destination starts empty", "[resume_state]") {
    msdl_test::TempDir dir("resume_fresh");
    auto content = msdl_test::MakeContent(4000, 1);
    auto plan = MakePlan(dir.path() / "model.bin", content, 4);

    msdl::ResumeStateTracker tracker;
    auto state = tracker.Load(plan);
    REQUIRE(state.committed == std::vector<int64_t>(4, 0));
    REQUIRE_FALSE(state.resumed);
    REQUIRE(state.CommittedBytes() == 0);
}

TEST_CASE("Begin - Sidecar written before any data", "[resume_state]") {
    msdl_test::TempDir dir("resume_begin");
    auto content = msdl_test::MakeContent(4000, 2);
    auto plan = MakePlan(dir.path() / "model.bin", content, 4);

    msdl::ResumeStateTracker tracker;
    tracker.Begin(plan, tracker.Load(plan));

    auto sidecar = ReadSidecar(plan.destination);
    REQUIRE(sidecar["version"] == 1);
    REQUIRE(sidecar["remote_path"] == "model.bin");
    REQUIRE(sidecar["total_size"] == 4000);
    REQUIRE(sidecar["ranges"].size() == 4);
    REQUIRE(sidecar["ranges"][1]["start"] == 1000);
    REQUIRE(sidecar["ranges"][1]["committed"] == 0);
}

TEST_CASE("RecordComplete - Survives into the next Load", "[resume_state]") {
    msdl_test::TempDir dir("resume_reload");
    auto content = msdl_test::MakeContent(4000, 3);
    auto plan = MakePlan(dir.path() / "model.bin", content, 4);

    {
        msdl::ResumeStateTracker tracker;
        tracker.Begin(plan, tracker.Load(plan));
        auto file = msdl::DestinationFile::Open(plan.destination);
        file->Resize(plan.total_size);
        CompleteRange(tracker, *file, plan, content, 0);
        CompleteRange(tracker, *file, plan, content, 2);
    }

    msdl::ResumeStateTracker tracker;
    auto state = tracker.Load(plan);
    REQUIRE(state.resumed);
    REQUIRE(state.committed == std::vector<int64_t>{1000, 0, 1000, 0});

    auto resumed_plan = plan;
    state.ApplyTo(resumed_plan);
    REQUIRE(resumed_plan.ranges[0].state == msdl::RangeState::DONE);
    REQUIRE(resumed_plan.ranges[1].state == msdl::RangeState::PENDING);
    REQUIRE(resumed_plan.ranges[2].state == msdl::RangeState::DONE);
}

TEST_CASE("RecordProgress - Monotonic per range", "[resume_state]") {
    msdl_test::TempDir dir("resume_progress");
    auto content = msdl_test::MakeContent(4000, 4);
    auto plan = MakePlan(dir.path() / "model.bin", content, 2);

    msdl::ResumeStateTracker tracker;
    tracker.Begin(plan, tracker.Load(plan));
    tracker.RecordProgress(plan.destination, 1, 500);
    tracker.RecordProgress(plan.destination, 1, 300);
    REQUIRE(tracker.Snapshot(plan.destination) == std::vector<int64_t>{0, 500});
    REQUIRE(ReadSidecar(plan.destination)["ranges"][1]["committed"] == 500);
}

TEST_CASE("RecordComplete - Concurrent ranges all recorded", "[resume_state]") {
    msdl_test::TempDir dir("resume_concurrent");
    auto content = msdl_test::MakeContent(16000, 5);
    auto plan = MakePlan(dir.path() / "model.bin", content, 16);

    msdl::ResumeStateTracker tracker;
    tracker.Begin(plan, tracker.Load(plan));
    auto file = msdl::DestinationFile::Open(plan.destination);
    file->Resize(plan.total_size);

    std::vector<std::thread> threads;
    for (size_t i = 0; i < plan.ranges.size(); ++i) {
        threads.emplace_back([&, i] { CompleteRange(tracker, *file, plan, content, i); });
    }
    for (auto& t : threads) {
        t.join();
    }

    auto sidecar = ReadSidecar(plan.destination);
    for (size_t i = 0; i < plan.ranges.size(); ++i) {
        REQUIRE(sidecar["ranges"][i]["committed"] == plan.ranges[i].length());
    }
    REQUIRE_NOTHROW(tracker.Finalize(plan, plan.sha256));
    REQUIRE_FALSE(fs::exists(msdl::ResumeStateTracker::SidecarPath(plan.destination)));
}

TEST_CASE("Finalize - Incomplete range is an integrity error", "[resume_state]") {
    msdl_test::TempDir dir("resume_incomplete");
    auto content = msdl_test::MakeContent(2000, 6);
    auto plan = MakePlan(dir.path() / "model.bin", content, 2);

    msdl::ResumeStateTracker tracker;
    tracker.Begin(plan, tracker.Load(plan));
    auto file = msdl::DestinationFile::Open(plan.destination);
    file->Resize(plan.total_size);
    CompleteRange(tracker, *file, plan, content, 0);

    try {
        tracker.Finalize(plan, std::nullopt);
        FAIL("Finalize accepted an incomplete file");
    } catch (const msdl::DownloadException& e) {
        REQUIRE(e.kind() == msdl::ErrorKind::INTEGRITY_ERROR);
    }
    REQUIRE(fs::exists(msdl::ResumeStateTracker::SidecarPath(plan.destination)));
}

TEST_CASE("Finalize - SHA-256 mismatch keeps the file", "[resume_state]") {
    msdl_test::TempDir dir("resume_sha");
    auto content = msdl_test::MakeContent(2000, 7);
    auto plan = MakePlan(dir.path() / "model.bin", content, 1);

    msdl::ResumeStateTracker tracker;
    tracker.Begin(plan, tracker.Load(plan));
    auto file = msdl::DestinationFile::Open(plan.destination);
    file->Resize(plan.total_size);
    CompleteRange(tracker, *file, plan, content, 0);

    try {
        tracker.Finalize(plan, std::string(64, '0'));
        FAIL("Finalize accepted a wrong digest");
    } catch (const msdl::DownloadException& e) {
        REQUIRE(e.kind() == msdl::ErrorKind::INTEGRITY_ERROR);
    }
    REQUIRE(fs::exists(plan.destination));
}

TEST_CASE("Load - Changed remote size discards partial data", "[resume_state]") {
    msdl_test::TempDir dir("resume_size_changed");
    auto content = msdl_test::MakeContent(4000, 8);
    auto plan = MakePlan(dir.path() / "model.bin", content, 4);
    {
        msdl::ResumeStateTracker tracker;
        tracker.Begin(plan, tracker.Load(plan));
        auto file = msdl::DestinationFile::Open(plan.destination);
        file->Resize(plan.total_size);
        CompleteRange(tracker, *file, plan, content, 0);
    }

    auto bigger = MakePlan(dir.path() / "model.bin", msdl_test::MakeContent(5000, 8), 4);
    msdl::ResumeStateTracker tracker;
    auto state = tracker.Load(bigger);
    REQUIRE(state.CommittedBytes() == 0);
    REQUIRE_FALSE(state.resumed);
    REQUIRE_FALSE(fs::exists(bigger.destination));
    REQUIRE_FALSE(fs::exists(msdl::ResumeStateTracker::SidecarPath(bigger.destination)));
}

TEST_CASE("Load - Corrupt sidecar restarts the file", "[resume_state]") {
    msdl_test::TempDir dir("resume_corrupt");
    auto content = msdl_test::MakeContent(4000, 9);
    auto plan = MakePlan(dir.path() / "model.bin", content, 4);
    msdl_test::WriteFile(plan.destination, content.substr(0, 1000));
    msdl_test::WriteFile(msdl::ResumeStateTracker::SidecarPath(plan.destination), "{not json");

    msdl::ResumeStateTracker tracker;
    auto state = tracker.Load(plan);
    REQUIRE(state.CommittedBytes() == 0);
    REQUIRE_FALSE(fs::exists(plan.destination));
}

TEST_CASE("Load - Destination shorter than recorded progress", "[resume_state]") {
    msdl_test::TempDir dir("resume_short");
    auto content = msdl_test::MakeContent(4000, 10);
    auto plan = MakePlan(dir.path() / "model.bin", content, 4);
    {
        msdl::ResumeStateTracker tracker;
        tracker.Begin(plan, tracker.Load(plan));
        auto file = msdl::DestinationFile::Open(plan.destination);
        file->Resize(plan.total_size);
        CompleteRange(tracker, *file, plan, content, 3);
    }
    fs::resize_file(plan.destination, 2000);

    msdl::ResumeStateTracker tracker;
    auto state = tracker.Load(plan);
    REQUIRE(state.CommittedBytes() == 0);
}

TEST_CASE("Load - Existing file without sidecar is an append watermark", "[resume_state]") {
    msdl_test::TempDir dir("resume_watermark");
    auto content = msdl_test::MakeContent(4000, 11);
    auto plan = MakePlan(dir.path() / "model.bin", content, 4);
    msdl_test::WriteFile(plan.destination, content.substr(0, 1500));

    msdl::ResumeStateTracker tracker;
    auto state = tracker.Load(plan);
    REQUIRE(state.resumed);
    REQUIRE(state.committed == std::vector<int64_t>{1000, 500, 0, 0});
}

TEST_CASE("Load - Complete file without sidecar needs no transfer", "[resume_state]") {
    msdl_test::TempDir dir("resume_complete");
    auto content = msdl_test::MakeContent(4000, 12);
    auto plan = MakePlan(dir.path() / "model.bin", content, 4);
    msdl_test::WriteFile(plan.destination, content);

    msdl::ResumeStateTracker tracker;
    auto state = tracker.Load(plan);
    state.ApplyTo(plan);
    REQUIRE(plan.IsComplete());
    REQUIRE_NOTHROW(tracker.Finalize(plan, plan.sha256));
}

TEST_CASE("Load - Untracked file without a checksum is discarded", "[resume_state]") {
    msdl_test::TempDir dir("resume_untracked");
    auto content = msdl_test::MakeContent(4000, 13);
    auto plan = MakePlan(dir.path() / "model.bin", content, 4);
    plan.sha256.reset();
    msdl_test::WriteFile(plan.destination, std::string(content.size(), '\0'));

    msdl::ResumeStateTracker tracker;
    auto state = tracker.Load(plan);
    REQUIRE_FALSE(state.resumed);
    REQUIRE(state.CommittedBytes() == 0);
    REQUIRE_FALSE(fs::exists(plan.destination));
}

TEST_CASE("IsComplete - Follows recorded ranges", "[resume_state]") {
    msdl_test::TempDir dir("resume_is_complete");
    auto content = msdl_test::MakeContent(2000, 14);
    auto plan = MakePlan(dir.path() / "model.bin", content, 2);

    msdl::ResumeStateTracker tracker;
    REQUIRE_FALSE(tracker.IsComplete(plan));
    tracker.Begin(plan, tracker.Load(plan));
    auto file = msdl::DestinationFile::Open(plan.destination);
    file->Resize(plan.total_size);
    CompleteRange(tracker, *file, plan, content, 0);
    REQUIRE_FALSE(tracker.IsComplete(plan));
    CompleteRange(tracker, *file, plan, content, 1);
    REQUIRE(tracker.IsComplete(plan));
}
