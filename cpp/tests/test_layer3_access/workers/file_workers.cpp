// tests/test_layer3_access/workers/file_workers.cpp
/**
 * @file file_workers.cpp
 * @brief File (handle negotiator) workers running against real HDF5 files.
 */
#include "file_workers.h"
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

namespace h5share::tests::worker::file
{

namespace
{
template <typename Fn> int run_with_access_stack(Fn &&fn, const char *name)
{
    return run_gtest_worker(std::forward<Fn>(fn), name, Logger::GetLifecycleModule(),
                            AccessConfig::GetLifecycleModule(),
                            LockingPolicy::GetLifecycleModule());
}

std::string in_dir(const std::string &dir, const char *name)
{
    return (fs::path(dir) / name).string();
}

std::optional<std::string> locking_env()
{
    return platform::get_env(kFileLockingEnvVar);
}
} // namespace

int invalid_mode_is_rejected(const std::string &dir)
{
    return run_with_access_stack(
        [&]()
        {
            const auto path = in_dir(dir, "invalid_mode.h5");
            for (const char *mode : {"rw", "", "R", "r+", "w+"})
            {
                EXPECT_THROW((void)File::open(path, mode), InvalidModeError) << mode;
            }
            EXPECT_EQ(LockingPolicy::instance().open_count(), 0u);
            EXPECT_FALSE(fs::exists(path));
        },
        "file::invalid_mode_is_rejected");
}

int create_and_truncate_modes(const std::string &dir)
{
    return run_with_access_stack(
        [&]()
        {
            const auto path = in_dir(dir, "modes.h5");
            {
                File f = File::open(path, "w");
                EXPECT_EQ(f.mode(), OpenMode::WriteTruncate);
                EXPECT_EQ(f.sharing_mode(), SharingMode::Plain);
                h5data::create_group(f.id(), "scan_1");
            }
            ASSERT_TRUE(fs::exists(path));

            // Both exclusive modes refuse an existing file.
            EXPECT_THROW((void)File::open(path, "w-"), H5IoError);
            EXPECT_THROW((void)File::open(path, "x"), H5IoError);
            EXPECT_EQ(LockingPolicy::instance().open_count(), 0u);
            {
                File f = File::open(path, "r");
                EXPECT_THAT(f.root().child_names(), ElementsAre("scan_1"));
            }
            {
                File f = File::open(path, "w");
                EXPECT_TRUE(f.root().child_names().empty());
            }

            const auto fresh = in_dir(dir, "fresh.h5");
            {
                File f = File::open(fresh, "x");
                EXPECT_EQ(f.mode(), OpenMode::WriteCreateExclusive);
            }
            const auto fresh2 = in_dir(dir, "fresh2.h5");
            {
                File f = File::open(fresh2, "w-");
                EXPECT_EQ(f.mode(), OpenMode::WriteFailIfExists);
            }
            EXPECT_TRUE(fs::exists(fresh));
            EXPECT_TRUE(fs::exists(fresh2));
        },
        "file::create_and_truncate_modes");
}

int append_mode_creates_or_opens(const std::string &dir)
{
    return run_with_access_stack(
        [&]()
        {
            const auto path = in_dir(dir, "append.h5");
            ASSERT_FALSE(fs::exists(path));
            {
                File f = File::open(path, "a");
                h5data::write_int(f.id(), "counter", 1);
            }
            {
                File f = File::open(path, "a");
                EXPECT_TRUE(f.root().contains("counter"));
                h5data::write_int(f.id(), "counter_2", 2);
            }
            File f = File::open(path, "r");
            EXPECT_THAT(f.root().child_names(), ElementsAre("counter", "counter_2"));
        },
        "file::append_mode_creates_or_opens");
}

int read_missing_file_fails(const std::string &dir)
{
    return run_with_access_stack(
        [&]()
        {
            ASSERT_TRUE(platform::set_env(kFileLockingEnvVar, std::string("TRUE")));
            const auto path = in_dir(dir, "does_not_exist.h5");
            try
            {
                (void)File::open(path, "r");
                FAIL() << "expected H5IoError";
            }
            catch (const H5IoError &e)
            {
                EXPECT_EQ(e.operation(), "H5Fopen");
                EXPECT_EQ(e.path(), path);
                EXPECT_FALSE(e.records().empty());
                EXPECT_FALSE(e.is_already_open_for_write());
                EXPECT_FALSE(e.is_lock_conflict());
                EXPECT_THAT(e.what(), HasSubstr("H5Fopen failed for"));
            }
            // The failed first open put the environment back.
            EXPECT_EQ(LockingPolicy::instance().open_count(), 0u);
            EXPECT_EQ(locking_env(), std::optional<std::string>("TRUE"));
        },
        "file::read_missing_file_fails");
}

int open_count_and_idempotent_close(const std::string &dir)
{
    return run_with_access_stack(
        [&]()
        {
            auto &policy = LockingPolicy::instance();
            File a = File::open(in_dir(dir, "count_a.h5"), "w");
            File b = File::open(in_dir(dir, "count_b.h5"), "w");
            EXPECT_EQ(policy.open_count(), 2u);

            b.close();
            b.close();
            EXPECT_FALSE(b.is_open());
            EXPECT_EQ(policy.open_count(), 1u);

            File moved = std::move(a);
            EXPECT_FALSE(a.is_open());
            EXPECT_TRUE(moved.is_open());
            a.close();
            EXPECT_EQ(policy.open_count(), 1u);

            moved = File();
            EXPECT_EQ(policy.open_count(), 0u);

            {
                File scoped = File::open(in_dir(dir, "count_a.h5"), "r");
                EXPECT_EQ(policy.open_count(), 1u);
            }
            EXPECT_EQ(policy.open_count(), 0u);
        },
        "file::open_count_and_idempotent_close");
}

int file_outlives_lifecycle(const std::string &dir)
{
    return run_worker_bare(
        [&]()
        {
            ASSERT_TRUE(platform::set_env(kFileLockingEnvVar, std::nullopt));
            File kept;
            {
                File dropped;
                {
                    LifecycleGuard guard(MakeModDefList(Logger::GetLifecycleModule(),
                                                        AccessConfig::GetLifecycleModule(),
                                                        LockingPolicy::GetLifecycleModule()));
                    kept = File::open(in_dir(dir, "outlives_a.h5"), "w");
                    dropped = File::open(in_dir(dir, "outlives_b.h5"), "w");
                    EXPECT_EQ(LockingPolicy::instance().open_count(), 2u);
                    EXPECT_EQ(locking_env(), std::optional<std::string>("TRUE"));
                }
                // Shutdown forgot both handles and put the environment back.
                EXPECT_FALSE(LockingPolicy::lifecycle_initialized());
                EXPECT_EQ(locking_env(), std::nullopt);
                EXPECT_TRUE(dropped.is_open());
            }
            EXPECT_TRUE(kept.is_open());
            kept.close();
            EXPECT_FALSE(kept.is_open());
            kept.close();
            EXPECT_EQ(H5Fget_obj_count(H5F_OBJ_ALL, H5F_OBJ_FILE), 0);
            EXPECT_EQ(locking_env(), std::nullopt);
        },
        "file::file_outlives_lifecycle");
}

int default_locking_follows_mode(const std::string &dir)
{
    return run_with_access_stack(
        [&]()
        {
            ASSERT_TRUE(platform::set_env(kFileLockingEnvVar, std::nullopt));
            auto &policy = LockingPolicy::instance();
            const auto data = in_dir(dir, "locking_data.h5");
            {
                File seed = File::open(data, "w");
            }
            EXPECT_FALSE(locking_env().has_value());

            {
                File reader = File::open(data, "r");
                EXPECT_EQ(locking_env(), std::optional<std::string>("FALSE"));
                EXPECT_EQ(policy.locking_enabled(), std::optional<bool>(false));

                // A writer wants locking on while a reader holds it off.
                EXPECT_THROW((void)File::open(in_dir(dir, "locking_other.h5"), "w"),
                             ConfigurationConflictError);
                EXPECT_EQ(policy.open_count(), 1u);

                // Reads agree with the active policy.
                File second = File::open(data, "r");
                EXPECT_EQ(policy.open_count(), 2u);
            }
            EXPECT_FALSE(locking_env().has_value());

            {
                File writer = File::open(in_dir(dir, "locking_other.h5"), "a");
                EXPECT_EQ(locking_env(), std::optional<std::string>("TRUE"));
                EXPECT_THROW((void)File::open(data, "r"), ConfigurationConflictError);
            }
            EXPECT_FALSE(locking_env().has_value());
            EXPECT_EQ(policy.open_count(), 0u);
        },
        "file::default_locking_follows_mode");
}

int explicit_locking_overrides_default(const std::string &dir)
{
    return run_with_access_stack(
        [&]()
        {
            ASSERT_TRUE(platform::set_env(kFileLockingEnvVar, std::string("BEST_EFFORT")));
            const auto data = in_dir(dir, "explicit_locking.h5");
            {
                FileOptions opts;
                opts.mode = OpenMode::WriteTruncate;
                opts.enable_locking = false;
                File f = File::open(data, opts);
                EXPECT_EQ(locking_env(), std::optional<std::string>("FALSE"));
            }
            {
                FileOptions opts;
                opts.enable_locking = true;
                File reader = File::open(data, opts);
                EXPECT_EQ(locking_env(), std::optional<std::string>("TRUE"));
                // A writer using the default (locking on) joins without conflict.
                File writer = File::open(in_dir(dir, "explicit_locking_2.h5"), "w");
                EXPECT_EQ(LockingPolicy::instance().open_count(), 2u);
            }
            EXPECT_EQ(locking_env(), std::optional<std::string>("BEST_EFFORT"));
        },
        "file::explicit_locking_overrides_default");
}

int swmr_writer_switches_mode(const std::string &dir)
{
    return run_with_access_stack(
        [&]()
        {
            ASSERT_TRUE(kHasSwmr);
            const auto path = in_dir(dir, "swmr_writer.h5");
            {
                // SWMR writing needs a file created with the latest format.
                FileOptions opts;
                opts.mode = OpenMode::WriteTruncate;
                opts.libver = LibverBound::Latest;
                File f = File::open(path, opts);
                h5data::write_scan(f.id(), "scan_1", true);
            }
            {
                File f = File::open(path, "a", true);
                EXPECT_TRUE(f.swmr_mode());
                EXPECT_EQ(f.sharing_mode(), SharingMode::Swmr);
                EXPECT_EQ(locking_env(), std::optional<std::string>("TRUE"));
                f.flush();
            }
            {
                FileOptions opts;
                opts.mode = OpenMode::WriteTruncate;
                opts.swmr = true;
                opts.libver = LibverBound::V110;
                File f = File::open(path, opts);
                EXPECT_TRUE(f.swmr_mode());
            }
            {
                File f = File::open(path, "r", false);
                EXPECT_FALSE(f.swmr_mode());
            }
            EXPECT_EQ(LockingPolicy::instance().open_count(), 0u);
        },
        "file::swmr_writer_switches_mode");
}

int creation_order_tracking(const std::string &dir)
{
    return run_with_access_stack(
        [&]()
        {
            const auto tracked = in_dir(dir, "tracked.h5");
            const auto untracked = in_dir(dir, "untracked.h5");
            {
                File f = File::open(tracked, "w");
                for (const char *name : {"scan_10", "scan_2", "alpha"})
                    h5data::create_group(f.id(), name);
            }
            {
                FileOptions opts;
                opts.mode = OpenMode::WriteTruncate;
                opts.track_order = false;
                File f = File::open(untracked, opts);
                for (const char *name : {"scan_10", "scan_2", "alpha"})
                    h5data::create_group(f.id(), name);
            }
            {
                File f = File::open(tracked, "r");
                EXPECT_THAT(f.root().child_names(), ElementsAre("scan_10", "scan_2", "alpha"));
            }
            {
                File f = File::open(untracked, "r");
                EXPECT_THAT(f.root().child_names(), ElementsAre("alpha", "scan_10", "scan_2"));
            }
        },
        "file::creation_order_tracking");
}

int items_released_with_file(const std::string &dir)
{
    return run_with_access_stack(
        [&]()
        {
            const auto path = in_dir(dir, "items_with_file.h5");
            {
                File f = File::open(path, "w");
                h5data::write_scan(f.id(), "scan_1", true);
                h5data::write_int(f.id(), "check", 7);
            }
            File f = File::open(path, "r");
            Item root = f.root();
            EXPECT_EQ(root.path(), "/");
            EXPECT_EQ(root.name(), "/");
            EXPECT_EQ(root.kind(), ItemKind::Group);

            Item check = Item::open(f.id(), "check");
            EXPECT_EQ(check.kind(), ItemKind::Dataset);
            EXPECT_EQ(check.path(), "/check");
            EXPECT_EQ(check.read_scalar<int>(), 7);
            EXPECT_DOUBLE_EQ(check.read_scalar<double>(), 7.0);
            EXPECT_THROW((void)root.read_scalar<int>(), std::logic_error);

            Item scan = Item::open(f.id(), "/scan_1");
            EXPECT_EQ(scan.name(), "scan_1");
            EXPECT_TRUE(scan.contains("end_time"));
            EXPECT_FALSE(scan.contains("missing"));
            EXPECT_FALSE(check.contains("anything"));

            // Closing the file releases its objects; the item handles stay safe to drop.
            f.close();
            EXPECT_EQ(LockingPolicy::instance().open_count(), 0u);
            scan.close();
            check.close();
            root.close();
            EXPECT_FALSE(scan.is_open());
        },
        "file::items_released_with_file");
}

int open_file_retries_until_created(const std::string &dir)
{
    return run_with_access_stack(
        [&]()
        {
            const auto path = in_dir(dir, "late.h5");
            std::thread creator(
                [&]
                {
                    // Only File calls here: they serialize on the library lock, the raw
                    // h5data helpers do not.
                    std::this_thread::sleep_for(150ms);
                    File f = File::open(path, "w");
                });

            // Same locking policy as the creating thread, so the two never conflict.
            FileOptions opts;
            opts.enable_locking = true;
            const auto t0 = std::chrono::steady_clock::now();
            File f = open_file(path, opts, RetryPolicy{10s, 20ms});
            creator.join();
            EXPECT_GE(std::chrono::steady_clock::now() - t0, 100ms);
            EXPECT_TRUE(f.is_open());
        },
        "file::open_file_retries_until_created");
}

int open_file_times_out(const std::string &dir)
{
    return run_with_access_stack(
        [&]()
        {
            const auto path = in_dir(dir, "never.h5");
            const auto t0 = std::chrono::steady_clock::now();
            try
            {
                (void)open_file(path, FileOptions{}, RetryPolicy{200ms, 20ms});
                FAIL() << "expected RetryTimeoutError";
            }
            catch (const RetryTimeoutError &e)
            {
                EXPECT_GE(std::chrono::steady_clock::now() - t0, 200ms);
                EXPECT_GE(e.attempts(), 2u);
                EXPECT_THROW(e.rethrow_cause(), H5IoError);
            }
            EXPECT_EQ(LockingPolicy::instance().open_count(), 0u);
        },
        "file::open_file_times_out");
}

} // namespace h5share::tests::worker::file

namespace
{
struct FileWorkerRegistrar
{
    FileWorkerRegistrar()
    {
        register_worker_dispatcher(
            [](int argc, char **argv) -> int
            {
                if (argc < 2)
                    return -1;
                std::string_view mode = argv[1];
                auto dot = mode.find('.');
                if (dot == std::string_view::npos || mode.substr(0, dot) != "file")
                    return -1;
                std::string scenario(mode.substr(dot + 1));
                if (argc < 3)
                {
                    fmt::print(stderr, "file.{}: missing directory argument\n", scenario);
                    return 1;
                }
                const std::string dir = argv[2];
                using namespace h5share::tests::worker::file;
                if (scenario == "invalid_mode")
                    return invalid_mode_is_rejected(dir);
                if (scenario == "create_modes")
                    return create_and_truncate_modes(dir);
                if (scenario == "append_mode")
                    return append_mode_creates_or_opens(dir);
                if (scenario == "read_missing")
                    return read_missing_file_fails(dir);
                if (scenario == "open_count")
                    return open_count_and_idempotent_close(dir);
                if (scenario == "outlives_lifecycle")
                    return file_outlives_lifecycle(dir);
                if (scenario == "default_locking")
                    return default_locking_follows_mode(dir);
                if (scenario == "explicit_locking")
                    return explicit_locking_overrides_default(dir);
                if (scenario == "swmr_writer")
                    return swmr_writer_switches_mode(dir);
                if (scenario == "creation_order")
                    return creation_order_tracking(dir);
                if (scenario == "items_released")
                    return items_released_with_file(dir);
                if (scenario == "open_file_retries")
                    return open_file_retries_until_created(dir);
                if (scenario == "open_file_timeout")
                    return open_file_times_out(dir);
                fmt::print(stderr, "ERROR: Unknown file scenario '{}'\n", scenario);
                return 1;
            });
    }
};
static FileWorkerRegistrar g_file_registrar;
} // namespace
