// tests/test_layer3_access/workers/sharing_workers.cpp
/**
 * @file sharing_workers.cpp
 * @brief One process writes, others read the same HDF5 file at the same time.
 */
#include "sharing_workers.h"
#include "h5_test_data.h"
#include "shared_test_helpers.h"
#include "test_entrypoint.h"
#include "hsh_access.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <string_view>
#include <thread>

using namespace h5share::tests::helper;
using namespace h5share::utils;
using namespace h5share::h5;
using namespace std::chrono_literals;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace h5share::tests::worker::sharing
{

namespace
{
template <typename Fn> int run_with_access_stack(Fn &&fn, const char *name)
{
    return run_gtest_worker(std::forward<Fn>(fn), name, Logger::GetLifecycleModule(),
                            AccessConfig::GetLifecycleModule(),
                            LockingPolicy::GetLifecycleModule());
}

void hold_until_done(const std::string &done_path)
{
    signal_test_ready();
    ASSERT_TRUE(wait_for_file(done_path)) << "parent never created " << done_path;
}
} // namespace

int swmr_writer(const std::string &path, const std::string &done_path)
{
    return run_with_access_stack(
        [&]()
        {
            {
                FileOptions opts;
                opts.mode = OpenMode::WriteTruncate;
                opts.libver = LibverBound::Latest;
                File f = File::open(path, opts);
                h5data::write_scan(f.id(), "scan_1", true);
                h5data::write_scan(f.id(), "scan_2", false);
            }
            File f = File::open(path, "a", true);
            ASSERT_TRUE(f.swmr_mode());
            f.flush();
            hold_until_done(done_path);
        },
        "sharing::swmr_writer");
}

int plain_latest_writer(const std::string &path, const std::string &done_path)
{
    return run_with_access_stack(
        [&]()
        {
            FileOptions opts;
            opts.mode = OpenMode::WriteTruncate;
            opts.libver = LibverBound::Latest;
            opts.swmr = false;
            File f = File::open(path, opts);
            ASSERT_FALSE(f.swmr_mode());
            h5data::write_scan(f.id(), "scan_1", true);
            f.flush();
            hold_until_done(done_path);
        },
        "sharing::plain_latest_writer");
}

int append_check_writer(const std::string &path, const std::string &done_path)
{
    return run_with_access_stack(
        [&]()
        {
            File f = File::open(path, "a");
            h5data::write_bool(f.id(), "check", true);
            f.flush();
            hold_until_done(done_path);
        },
        "sharing::append_check_writer");
}

int delayed_complete_writer(const std::string &path)
{
    return run_with_access_stack(
        [&]()
        {
            FileOptions opts;
            opts.mode = OpenMode::WriteTruncate;
            opts.libver = LibverBound::Latest;
            {
                File f = File::open(path, opts);
                h5data::write_scan(f.id(), "scan_1", false);
            }
            signal_test_ready();
            std::this_thread::sleep_for(300ms);

            opts.mode = OpenMode::Append;
            File f = File::open(path, opts);
            h5data::write_double(f.id(), "scan_1/end_time", 2.0);
        },
        "sharing::delayed_complete_writer");
}

int fallback_reader(const std::string &path)
{
    return run_with_access_stack(
        [&]()
        {
            File f = File::open(path, "r");
            EXPECT_TRUE(f.swmr_mode()) << "plain read of a SWMR-written file should fall back";
            EXPECT_EQ(f.mode(), OpenMode::Read);

            Item scan = open_item(f, "/scan_1", default_validator, RetryPolicy{2s, 10ms});
            EXPECT_DOUBLE_EQ(Item::open(scan.id(), "end_time").read_scalar<double>(), 2.0);

            auto complete = open_top_level_items(f, default_validator, RetryPolicy{2s, 10ms});
            ASSERT_EQ(complete.size(), 1u);
            EXPECT_EQ(complete.front().name(), "scan_1");
        },
        "sharing::fallback_reader");
}

int explicit_plain_reader(const std::string &path)
{
    return run_with_access_stack(
        [&]()
        {
            try
            {
                (void)File::open(path, "r", false);
                FAIL() << "a plain read was expected to fail while the file is SWMR-written";
            }
            catch (const H5IoError &e)
            {
                EXPECT_TRUE(e.is_already_open_for_write()) << e.what();
            }
            EXPECT_EQ(LockingPolicy::instance().open_count(), 0u);
        },
        "sharing::explicit_plain_reader");
}

int fallback_fails_reader(const std::string &path)
{
    return run_with_access_stack(
        [&]()
        {
            try
            {
                (void)File::open(path, "r");
                FAIL() << "expected the open to fail while a non-SWMR writer holds the file";
            }
            catch (const H5IoError &e)
            {
                // The error of the plain attempt, not the one of the SWMR retry.
                EXPECT_EQ(e.operation(), "H5Fopen");
                EXPECT_TRUE(e.is_already_open_for_write()) << e.what();
            }
            EXPECT_EQ(LockingPolicy::instance().open_count(), 0u);
        },
        "sharing::fallback_fails_reader");
}

int check_reader(const std::string &path)
{
    if (!platform::set_env("H5SHARE_CONFIG_FILE", std::nullopt) ||
        !platform::set_env("H5SHARE_RETRY_TIMEOUT_MS", std::string("200")))
    {
        fmt::print(stderr, "cannot prepare the AccessConfig environment\n");
        return 1;
    }
    return run_with_access_stack(
        [&]()
        {
            const auto t0 = std::chrono::steady_clock::now();
            try
            {
                ItemScope scope = open_item(path, "/check");
                EXPECT_EQ(scope.item.path(), "/check");
            }
            catch (const RetryTimeoutError &e)
            {
                EXPECT_GE(std::chrono::steady_clock::now() - t0, 200ms);
                EXPECT_GE(e.attempts(), 1u);
            }
            EXPECT_EQ(LockingPolicy::instance().open_count(), 0u);
        },
        "sharing::check_reader");
}

int waiting_reader(const std::string &path)
{
    return run_with_access_stack(
        [&]()
        {
            ItemScope scope = open_item(path, "/scan_1", default_validator, RetryPolicy{10s, 20ms});
            EXPECT_THAT(scope.item.child_names(), ElementsAre("start_time", "end_time"));
            EXPECT_DOUBLE_EQ(Item::open(scope.item.id(), "end_time").read_scalar<double>(), 2.0);
        },
        "sharing::waiting_reader");
}

} // namespace h5share::tests::worker::sharing

namespace
{
struct SharingWorkerRegistrar
{
    SharingWorkerRegistrar()
    {
        register_worker_dispatcher(
            [](int argc, char **argv) -> int
            {
                if (argc < 2)
                    return -1;
                std::string_view mode = argv[1];
                auto dot = mode.find('.');
                if (dot == std::string_view::npos || mode.substr(0, dot) != "sharing")
                    return -1;
                std::string scenario(mode.substr(dot + 1));
                if (argc < 3)
                {
                    fmt::print(stderr, "sharing.{}: missing file argument\n", scenario);
                    return 1;
                }
                const std::string path = argv[2];
                const std::string done = argc > 3 ? argv[3] : std::string();
                using namespace h5share::tests::worker::sharing;
                if (scenario == "swmr_writer")
                    return swmr_writer(path, done);
                if (scenario == "plain_latest_writer")
                    return plain_latest_writer(path, done);
                if (scenario == "append_check_writer")
                    return append_check_writer(path, done);
                if (scenario == "delayed_complete_writer")
                    return delayed_complete_writer(path);
                if (scenario == "fallback_reader")
                    return fallback_reader(path);
                if (scenario == "explicit_plain_reader")
                    return explicit_plain_reader(path);
                if (scenario == "fallback_fails_reader")
                    return fallback_fails_reader(path);
                if (scenario == "check_reader")
                    return check_reader(path);
                if (scenario == "waiting_reader")
                    return waiting_reader(path);
                fmt::print(stderr, "ERROR: Unknown sharing scenario '{}'\n", scenario);
                return 1;
            });
    }
};
static SharingWorkerRegistrar g_sharing_registrar;
} // namespace
