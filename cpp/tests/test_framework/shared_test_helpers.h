// tests/test_framework/shared_test_helpers.h
#pragma once

// Must be first: defines H5SHARE_IS_POSIX before any platform-conditional includes.
#include "hsh_platform.hpp"

#include <filesystem>
namespace fs = std::filesystem;

/**
 * @file shared_test_helpers.h
 * @brief Common helpers for test cases.
 *
 * File I/O helpers, unique temporary paths, and wrappers that run test logic
 * inside a worker process with lifecycle management and exception reporting.
 */

#include "gtest/gtest.h"

// Required for run_gtest_worker: LifecycleGuard, H5SHARE_DEBUG, print_stack_trace
#include "hsh_service.hpp"

// Required for ThreadRacer
#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace h5share::tests::helper
{

/**
 * @brief Reads the entire contents of a file into a string.
 * @return True if the file was read successfully, false otherwise.
 */
bool read_file_contents(const std::string &path, std::string &out);

/**
 * @brief Counts lines of `text`, optionally only those containing `must_include`
 *        and not containing `must_exclude`.
 */
size_t count_lines(std::string_view text,
                   std::optional<std::string_view> must_include = std::nullopt,
                   std::optional<std::string_view> must_exclude = std::nullopt);

/**
 * @brief Polls a file until `expected` appears in it or `timeout` elapses.
 * @return True if the string was found.
 */
bool wait_for_string_in_file(const fs::path &path, const std::string &expected,
                             std::chrono::milliseconds timeout = std::chrono::seconds(15));

/**
 * @brief Polls until `path` exists or `timeout` elapses.
 */
bool wait_for_file(const fs::path &path,
                   std::chrono::milliseconds timeout = std::chrono::seconds(30));

/**
 * @brief A path under the temp directory that no other test run uses.
 * @param stem Base name, e.g. "swmr_fallback".
 * @param extension Including the dot, e.g. ".h5".
 */
fs::path unique_temp_path(const char *stem, const char *extension = ".h5");

/**
 * @brief Removes a file when the scope ends. Missing files are ignored.
 */
class TempFileGuard
{
  public:
    explicit TempFileGuard(fs::path path) : path_(std::move(path)) {}
    ~TempFileGuard()
    {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    TempFileGuard(const TempFileGuard &) = delete;
    TempFileGuard &operator=(const TempFileGuard &) = delete;

    const fs::path &path() const { return path_; }

  private:
    fs::path path_;
};

/**
 * @brief Wraps test logic for execution in a worker process.
 *
 * Starts the given lifecycle modules, runs `test_logic`, and reports GTest
 * assertion failures and exceptions on stderr with a "[WORKER FAILURE]" marker.
 *
 * @return 0 on success, 1 on GTest assertion failure, 2 on standard exception, 3 on unknown
 * exception.
 */
template <typename Fn, typename... Mods>
int run_gtest_worker(Fn test_logic, const char *test_name, Mods &&...mods)
{
    // ASSERT_* and EXPECT_* must throw; otherwise a failing worker still exits 0.
    ::testing::GTEST_FLAG(throw_on_failure) = true;

    h5share::utils::LifecycleGuard guard(
        h5share::utils::MakeModDefList(std::forward<Mods>(mods)...));

    try
    {
        test_logic();
    }
    catch (const ::testing::internal::GoogleTestFailureException &e)
    {
        H5SHARE_DEBUG("[WORKER FAILURE] GTest assertion failed in {}: \n{}", test_name, e.what());
        h5share::debug::print_stack_trace();
        return 1;
    }
    catch (const std::exception &e)
    {
        H5SHARE_DEBUG("[WORKER FAILURE] {} threw an exception: {}", test_name, e.what());
        h5share::debug::print_stack_trace();
        return 2;
    }
    catch (...)
    {
        H5SHARE_DEBUG("[WORKER FAILURE] {} threw an unknown exception.", test_name);
        h5share::debug::print_stack_trace();
        return 3;
    }
    return 0;
}

/**
 * @brief Wraps worker logic with NO lifecycle initialization.
 *
 * For workers that test pre-init state or drive LifecycleGuard themselves.
 */
template <typename Fn> int run_worker_bare(Fn test_logic, const char *test_name)
{
    ::testing::GTEST_FLAG(throw_on_failure) = true;

    try
    {
        test_logic();
    }
    catch (const ::testing::internal::GoogleTestFailureException &e)
    {
        H5SHARE_DEBUG("[WORKER FAILURE] GTest assertion failed in {}: \n{}", test_name, e.what());
        h5share::debug::print_stack_trace();
        return 1;
    }
    catch (const std::exception &e)
    {
        H5SHARE_DEBUG("[WORKER FAILURE] {} threw an exception: {}", test_name, e.what());
        h5share::debug::print_stack_trace();
        return 2;
    }
    catch (...)
    {
        H5SHARE_DEBUG("[WORKER FAILURE] {} threw an unknown exception.", test_name);
        h5share::debug::print_stack_trace();
        return 3;
    }
    return 0;
}

// ============================================================================
// ThreadRacer
// ============================================================================

/**
 * @brief Runs N threads released together from a barrier.
 *
 * Any exception thrown by a thread is captured; race() returns false if any
 * thread threw.
 */
class ThreadRacer
{
  public:
    explicit ThreadRacer(int n_threads) : n_threads_(n_threads) {}

    template <typename F> bool race(F fn)
    {
        exceptions_.clear();
        exceptions_.resize(static_cast<size_t>(n_threads_));

        std::atomic<int> ready_count{0};
        std::atomic<bool> start_flag{false};

        std::vector<std::thread> threads;
        threads.reserve(static_cast<size_t>(n_threads_));

        for (int i = 0; i < n_threads_; ++i)
        {
            threads.emplace_back(
                [&, i]()
                {
                    ready_count.fetch_add(1, std::memory_order_release);
                    while (!start_flag.load(std::memory_order_acquire))
                        std::this_thread::yield();
                    try
                    {
                        fn(i);
                    }
                    catch (...)
                    {
                        exceptions_[static_cast<size_t>(i)] = std::current_exception();
                    }
                });
        }

        while (ready_count.load(std::memory_order_acquire) < n_threads_)
            std::this_thread::yield();
        start_flag.store(true, std::memory_order_release);

        for (auto &t : threads)
            t.join();

        return std::all_of(exceptions_.begin(), exceptions_.end(),
                           [](const std::exception_ptr &p) { return p == nullptr; });
    }

    const std::vector<std::exception_ptr> &exceptions() const { return exceptions_; }

  private:
    int n_threads_;
    std::vector<std::exception_ptr> exceptions_;
};

/**
 * @brief Signals "ready" to the parent when H5SHARE_TEST_READY_FD is set.
 * No-op otherwise. The parent blocks in WorkerProcess::wait_for_ready().
 */
void signal_test_ready();

} // namespace h5share::tests::helper
