#include <gtest/gtest.h>

#include <ffdl/http_client.hpp>
#include <ffdl/size_probe.hpp>
#include <ffdl/transfer.hpp>
#include <ffdl/transfer_state.hpp>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>

#include "support/mock_http_server.hpp"
#include "support/recording_observer.hpp"

using namespace ffdl;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

TEST(TransferStrategy, SelectionTable) {
	const TransferOptions opts;
	auto pick = [&](std::uint64_t size, bool ranges) {
		return TransferCoordinator::select_strategy({size, ranges}, opts);
	};
	EXPECT_EQ(pick(0, true), TransferStrategy::single_stream);
	EXPECT_EQ(pick(0, false), TransferStrategy::single_stream);
	EXPECT_EQ(pick(kMiB, true), TransferStrategy::single_stream);
	EXPECT_EQ(pick(kMiB + 1, false), TransferStrategy::single_stream);
	EXPECT_EQ(pick(500 * kMiB, false), TransferStrategy::single_stream);
	EXPECT_EQ(pick(kMiB + 1, true), TransferStrategy::chunked);
	EXPECT_EQ(pick(500 * kMiB, true), TransferStrategy::chunked);
}

TEST(SizeProbe, ReportsSizeAndRangeSupport) {
	test::MockHttpServer server;
	server.add_route("/a.zip", {.body = std::string(3000, 'x')});
	server.add_route("/b.zip",
					 {.body = std::string(1000, 'y'), .accept_ranges = false});
	SizeProbe probe(std::make_shared<net::HttpClient>(), 5s);

	auto a = probe.probe(server.url("/a.zip"));
	EXPECT_EQ(a.total_bytes, 3000u);
	EXPECT_TRUE(a.supports_ranges);

	auto b = probe.probe(server.url("/b.zip"));
	EXPECT_EQ(b.total_bytes, 1000u);
	EXPECT_FALSE(b.supports_ranges);
}

TEST(SizeProbe, DegradesToUnknownOnErrors) {
	test::MockHttpServer server;
	SizeProbe probe(std::make_shared<net::HttpClient>(), 2s);

	auto missing = probe.probe(server.url("/missing.zip"));
	EXPECT_EQ(missing.total_bytes, 0u);
	EXPECT_FALSE(missing.supports_ranges);

	auto bad = probe.probe("not a url");
	EXPECT_EQ(bad.total_bytes, 0u);
	EXPECT_FALSE(bad.supports_ranges);
}

class TransferCoordinatorTest : public ::testing::Test {
   protected:
	void SetUp() override {
		dir = fs::temp_directory_path() / "ffdl_transfer_test";
		fs::create_directories(dir);
		path = dir / (std::string(::testing::UnitTest::GetInstance()
									  ->current_test_info()
									  ->name()) +
					  ".bin");
		options.chunk_size = 512 * 1024;
		options.max_workers = 4;
		options.retry.backoff_unit = 5ms;
		options.transfer_timeout = 5s;
		options.probe_timeout = 5s;
	}

	TransferCoordinator make(std::shared_ptr<ControlFlag> flag = nullptr) {
		return TransferCoordinator(http, std::move(flag), observer, options);
	}

	std::string read_file() const {
		std::ifstream in(path, std::ios::binary);
		std::stringstream ss;
		ss << in.rdbuf();
		return ss.str();
	}

	test::MockHttpServer server;
	std::shared_ptr<net::HttpClient> http = std::make_shared<net::HttpClient>();
	std::shared_ptr<test::RecordingObserver> observer =
		std::make_shared<test::RecordingObserver>();
	TransferOptions options;
	fs::path dir;
	fs::path path;
};

TEST_F(TransferCoordinatorTest, ChunkedTransferReassemblesFile) {
	const auto payload = test::make_payload(3 * kMiB + 123, 7);
	server.add_route("/big.zip", {.body = payload});

	auto coordinator = make();
	auto report = coordinator.run(server.url("/big.zip"), path);
	ASSERT_TRUE(report) << report.error().message();

	EXPECT_EQ(report.value().strategy, TransferStrategy::chunked);
	EXPECT_EQ(report.value().bytes_written, payload.size());
	EXPECT_EQ(report.value().total_bytes, payload.size());
	EXPECT_TRUE(report.value().failed_chunks.empty());
	EXPECT_EQ(read_file(), payload);

	EXPECT_EQ(server.head_count("/big.zip"), 1u);
	EXPECT_EQ(server.get_count("/big.zip"), 7u);

	ASSERT_FALSE(observer->progress.empty());
	EXPECT_EQ(observer->progress.back().first, payload.size());
	EXPECT_EQ(observer->progress.back().second, payload.size());
	EXPECT_TRUE(observer->logged("Using chunked download with 7 chunks"));
}

TEST_F(TransferCoordinatorTest, SmallFileUsesSingleStream) {
	const auto payload = test::make_payload(200 * 1024, 3);
	server.add_route("/small.zip", {.body = payload});

	auto report = make().run(server.url("/small.zip"), path);
	ASSERT_TRUE(report);
	EXPECT_EQ(report.value().strategy, TransferStrategy::single_stream);
	EXPECT_EQ(read_file(), payload);

	auto seen = server.ranges("/small.zip");
	ASSERT_EQ(seen.size(), 1u);
	EXPECT_TRUE(seen[0].empty());
}

TEST_F(TransferCoordinatorTest, NoRangeSupportUsesSingleStream) {
	const auto payload = test::make_payload(3 * kMiB, 4);
	server.add_route("/big.zip", {.body = payload, .accept_ranges = false});

	auto report = make().run(server.url("/big.zip"), path);
	ASSERT_TRUE(report);
	EXPECT_EQ(report.value().strategy, TransferStrategy::single_stream);
	EXPECT_EQ(server.get_count("/big.zip"), 1u);
	EXPECT_EQ(read_file(), payload);
}

TEST_F(TransferCoordinatorTest, UnknownSizeIsBackfilledFromResponse) {
	const auto payload = test::make_payload(2 * kMiB, 5);
	server.add_route("/big.zip",
					 {.body = payload, .head_content_length = false});

	auto coordinator = make();
	auto report = coordinator.run(server.url("/big.zip"), path);
	ASSERT_TRUE(report);
	EXPECT_EQ(report.value().strategy, TransferStrategy::single_stream);
	EXPECT_EQ(report.value().total_bytes, payload.size());
	EXPECT_EQ(coordinator.state()->total(), payload.size());
	EXPECT_EQ(read_file(), payload);
}

TEST_F(TransferCoordinatorTest, HttpErrorFailsTransfer) {
	server.add_route("/gone.zip", {.body = "nope", .status = 404});

	auto report = make().run(server.url("/gone.zip"), path);
	ASSERT_FALSE(report);
	EXPECT_EQ(report.error(), errc::http_error);
}

TEST_F(TransferCoordinatorTest, ExhaustedChunkFailsTransfer) {
	const auto payload = test::make_payload(2 * kMiB, 6);
	server.add_route("/big.zip",
					 {.body = payload, .fail_range_start = 512 * 1024});

	auto report = make().run(server.url("/big.zip"), path);
	ASSERT_FALSE(report);
	EXPECT_EQ(report.error(), errc::incomplete_transfer);
	// Siblings still ran: 3 good chunks plus 3 attempts on the bad one
	EXPECT_EQ(server.get_count("/big.zip"), 6u);
}

TEST_F(TransferCoordinatorTest, LenientModeKeepsPartialFile) {
	const auto payload = test::make_payload(2 * kMiB, 6);
	server.add_route("/big.zip",
					 {.body = payload, .fail_range_start = 512 * 1024});
	options.fail_on_incomplete = false;

	auto report = make().run(server.url("/big.zip"), path);
	ASSERT_TRUE(report);
	ASSERT_EQ(report.value().failed_chunks.size(), 1u);
	EXPECT_EQ(report.value().failed_chunks[0],
			  (ByteRange{512 * 1024, 1024 * 1024 - 1}));
	EXPECT_EQ(report.value().bytes_written, payload.size() - 512 * 1024);

	auto written = read_file();
	ASSERT_EQ(written.size(), payload.size());
	EXPECT_EQ(written.substr(0, 512 * 1024), payload.substr(0, 512 * 1024));
	EXPECT_EQ(written.substr(kMiB), payload.substr(kMiB));
}

TEST_F(TransferCoordinatorTest, CancelStopsChunkedTransfer) {
	const auto payload = test::make_payload(4 * kMiB, 8);
	server.add_route("/slow.zip", {.body = payload,
								   .block_size = 16 * 1024,
								   .block_delay = 20ms});

	auto flag = std::make_shared<ControlFlag>();
	auto coordinator = make(flag);
	std::thread canceller([&] {
		std::this_thread::sleep_for(300ms);
		coordinator.cancel();
	});
	auto started = std::chrono::steady_clock::now();
	auto report = coordinator.run(server.url("/slow.zip"), path);
	canceller.join();

	ASSERT_FALSE(report);
	EXPECT_EQ(report.error(), errc::cancelled);
	EXPECT_TRUE(flag->is_stopped());
	EXPECT_LT(std::chrono::steady_clock::now() - started, 3s);
}

TEST_F(TransferCoordinatorTest, CancelStopsSingleStream) {
	const auto payload = test::make_payload(4 * kMiB, 9);
	server.add_route("/slow.bin", {.body = payload,
								   .accept_ranges = false,
								   .block_size = 16 * 1024,
								   .block_delay = 20ms});
	options.stream_read_block = 16 * 1024;

	auto coordinator = make();
	std::thread canceller([&] {
		std::this_thread::sleep_for(300ms);
		coordinator.cancel();
	});
	auto report = coordinator.run(server.url("/slow.bin"), path);
	canceller.join();

	ASSERT_FALSE(report);
	EXPECT_EQ(report.error(), errc::cancelled);
}

TEST_F(TransferCoordinatorTest, PausedTimeIsExcludedFromActiveTime) {
	const auto payload = test::make_payload(2 * kMiB, 10);
	server.add_route("/slow.zip", {.body = payload,
								   .block_size = 16 * 1024,
								   .block_delay = 10ms});
	options.chunk_size = 256 * 1024;
	options.chunk_read_block = 16 * 1024;

	auto coordinator = make();
	std::thread controller([&] {
		std::this_thread::sleep_for(200ms);
		coordinator.pause();
		std::this_thread::sleep_for(1500ms);
		coordinator.resume();
	});

	auto started = std::chrono::steady_clock::now();
	auto report = coordinator.run(server.url("/slow.zip"), path);
	auto wall = std::chrono::steady_clock::now() - started;
	controller.join();

	ASSERT_TRUE(report) << report.error().message();
	EXPECT_EQ(read_file(), payload);

	const auto paused = coordinator.state()->paused_duration();
	EXPECT_GE(paused, 1400ms);
	const auto active = report.value().active_time;
	EXPECT_LE(active, wall - 1300ms);
	// active + paused accounts for the whole run
	const auto gap = wall - (active + paused);
	EXPECT_LT(std::chrono::abs(gap), 300ms);
}

TEST_F(TransferCoordinatorTest, StopDuringProbeLeavesDestinationUntouched) {
	const auto payload = test::make_payload(2 * kMiB, 11);
	for (bool ranges : {true, false}) {
		SCOPED_TRACE(ranges ? "chunked" : "single stream");
		{
			std::ofstream out(path, std::ios::binary | std::ios::trunc);
			out << "previous contents";
		}
		const std::string route = ranges ? "/ranged.zip" : "/plain.zip";
		server.add_route(route, {.body = payload,
								 .accept_ranges = ranges,
								 .head_delay = 800ms});

		auto coordinator = make();
		std::thread canceller([&] {
			std::this_thread::sleep_for(200ms);
			coordinator.cancel();
		});
		auto report = coordinator.run(server.url(route), path);
		canceller.join();

		ASSERT_FALSE(report);
		EXPECT_EQ(report.error(), errc::cancelled);
		EXPECT_EQ(read_file(), "previous contents");
		EXPECT_EQ(server.get_count(route), 0u);
	}
}

TEST_F(TransferCoordinatorTest, PauseDuringProbeHoldsBackTheRequest) {
	const auto payload = test::make_payload(512 * 1024, 12);
	server.add_route("/plain.bin", {.body = payload,
									.accept_ranges = false,
									.head_delay = 300ms});

	auto coordinator = make();
	std::size_t gets_while_paused = 0;
	std::thread controller([&] {
		std::this_thread::sleep_for(100ms);
		coordinator.pause();
		std::this_thread::sleep_for(800ms);
		gets_while_paused = server.get_count("/plain.bin");
		coordinator.resume();
	});
	auto report = coordinator.run(server.url("/plain.bin"), path);
	controller.join();

	ASSERT_TRUE(report) << report.error().message();
	EXPECT_EQ(gets_while_paused, 0u);
	EXPECT_EQ(server.get_count("/plain.bin"), 1u);
	EXPECT_EQ(read_file(), payload);
}

namespace {

// Also remembers when each log line arrived
class TimedObserver : public test::RecordingObserver {
   public:
	void on_log(const std::string &message) override {
		if (message.rfind("Progress:", 0) == 0) {
			std::lock_guard lock(mutex_);
			progress_lines.push_back(std::chrono::steady_clock::now());
		}
		test::RecordingObserver::on_log(message);
	}

	std::vector<std::chrono::steady_clock::time_point> lines() const {
		std::lock_guard lock(mutex_);
		return progress_lines;
	}

   private:
	mutable std::mutex mutex_;
	std::vector<std::chrono::steady_clock::time_point> progress_lines;
};

}  // namespace

TEST_F(TransferCoordinatorTest, ProgressLogIsThrottledByTime) {
	const auto payload = test::make_payload(kMiB, 13);
	server.add_route("/slow.bin", {.body = payload,
								   .accept_ranges = false,
								   .block_size = 16 * 1024,
								   .block_delay = 20ms});
	options.stream_read_block = 16 * 1024;
	options.log_interval = 200ms;
	options.log_bytes = 64 * kMiB;

	auto timed = std::make_shared<TimedObserver>();
	TransferCoordinator coordinator(http, nullptr, timed, options);
	auto report = coordinator.run(server.url("/slow.bin"), path);
	ASSERT_TRUE(report) << report.error().message();

	const auto lines = timed->lines();
	ASSERT_GE(lines.size(), 3u);
	// The last line is the unconditional final update
	for (std::size_t i = 1; i + 1 < lines.size(); ++i) {
		EXPECT_GE(lines[i] - lines[i - 1], 180ms) << "line " << i;
	}
	EXPECT_GT(timed->progress.size(), lines.size());
}

TEST_F(TransferCoordinatorTest, ProgressLogIsThrottledByBytes) {
	const auto payload = test::make_payload(2 * kMiB, 14);
	server.add_route("/plain.bin", {.body = payload,
									.accept_ranges = false,
									.block_size = 64 * 1024,
									.block_delay = 2ms});
	options.stream_read_block = 64 * 1024;
	options.log_interval = std::chrono::hours(1);
	options.log_bytes = 512 * 1024;

	auto report = make().run(server.url("/plain.bin"), path);
	ASSERT_TRUE(report) << report.error().message();

	std::size_t lines = 0;
	for (const auto &l : observer->logs) {
		if (l.rfind("Progress:", 0) == 0) ++lines;
	}
	// One per 512 KiB crossed plus the final update
	EXPECT_GE(lines, 4u);
	EXPECT_LE(lines, 5u);
	EXPECT_GT(observer->progress.size(), lines);
}

TEST_F(TransferCoordinatorTest, ProgressIsPublishedWhileChunksAreInFlight) {
	const auto payload = test::make_payload(2 * kMiB, 15);
	server.add_route("/slow.zip", {.body = payload,
								   .block_size = 32 * 1024,
								   .block_delay = 10ms});
	options.chunk_size = 512 * 1024;
	options.chunk_read_block = 32 * 1024;
	options.max_workers = 1;

	auto report = make().run(server.url("/slow.zip"), path);
	ASSERT_TRUE(report) << report.error().message();
	EXPECT_EQ(read_file(), payload);

	const auto total = payload.size();
	std::size_t before_first_chunk = 0;
	std::size_t partial = 0;
	for (const auto &[done, all] : observer->progress) {
		EXPECT_EQ(all, total);
		if (done == 0) ++before_first_chunk;
		if (done > 0 && done < total) ++partial;
	}
	EXPECT_GE(before_first_chunk, 2u);
	EXPECT_GE(partial, 2u);
	EXPECT_EQ(observer->progress.back().first, total);
	EXPECT_EQ(observer->progress.back().second, total);

	ASSERT_FALSE(observer->speeds.empty());
	bool eta_seen = false;
	for (std::size_t i = 0; i + 1 < observer->speeds.size(); ++i) {
		if (observer->speeds[i].eta_seconds) eta_seen = true;
	}
	EXPECT_TRUE(eta_seen);
	EXPECT_FALSE(observer->speeds.back().eta_seconds);
	EXPECT_GT(observer->speeds.back().overall_bps, 0.0);
}
