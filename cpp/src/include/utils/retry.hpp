#pragma once
/**
 * @file retry.hpp
 * @brief Header-only retry engine for idempotent operations.
 *
 * `retry(op, policy)` calls `op` until it returns, fails with an error that must
 * not be retried, or the policy's timeout elapses:
 *
 * - `RetryableError` (and whatever a custom classifier accepts): remembered, the
 *   engine sleeps `retry_period` (no sleep when negative), then checks the deadline.
 *   Past the deadline a `RetryTimeoutError` carrying the last cause is thrown.
 * - `ImmediateError` and `RetryTimeoutError` (from a nested retry): rethrown at once.
 * - Anything else: rethrown at once.
 *
 * There is no attempt limit; only the wall-clock timeout bounds the loop, and a
 * policy without timeout retries forever. Idempotence of `op` is the caller's
 * obligation.
 *
 * @code
 *   auto value = h5share::utils::retry([&] { return read_counter(path); },
 *                                      RetryPolicy{std::chrono::seconds(2)});
 * @endcode
 */
#include <chrono>
#include <cstddef>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

#include "utils/format_tools.hpp"

namespace h5share::utils
{

/**
 * @brief Per-call retry configuration.
 */
struct RetryPolicy
{
    /// Total wall-clock budget; std::nullopt retries indefinitely.
    std::optional<std::chrono::milliseconds> timeout{};
    /// Sleep between attempts. A negative period disables sleeping (tests).
    std::chrono::milliseconds retry_period{10};
};

/// Transient failure: the same operation may succeed when repeated unchanged.
class RetryableError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/// Failure that can never resolve by waiting; propagated without retry.
class ImmediateError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Raised when a retry deadline elapses. Carries the last retryable failure.
 */
class RetryTimeoutError : public std::runtime_error
{
  public:
    RetryTimeoutError(std::exception_ptr cause, std::size_t attempts,
                      std::chrono::milliseconds elapsed)
        : std::runtime_error(make_message(cause, attempts, elapsed)), m_cause(std::move(cause)),
          m_attempts(attempts), m_elapsed(elapsed)
    {
    }

    [[nodiscard]] const std::exception_ptr &cause() const noexcept { return m_cause; }
    [[nodiscard]] std::size_t attempts() const noexcept { return m_attempts; }
    [[nodiscard]] std::chrono::milliseconds elapsed() const noexcept { return m_elapsed; }

    /// Rethrows the last retryable failure (no-op when there is none).
    void rethrow_cause() const
    {
        if (m_cause)
            std::rethrow_exception(m_cause);
    }

    /// what() of the last retryable failure, or an empty string.
    [[nodiscard]] std::string cause_message() const { return describe(m_cause); }

  private:
    static std::string describe(const std::exception_ptr &ep)
    {
        if (!ep)
            return {};
        try
        {
            std::rethrow_exception(ep);
        }
        catch (const std::exception &e)
        {
            return e.what();
        }
        catch (...)
        {
            return "non-standard exception";
        }
    }

    static std::string make_message(const std::exception_ptr &cause, std::size_t attempts,
                                    std::chrono::milliseconds elapsed)
    {
        return fmt::format("retry timed out after {} ({} attempts); last error: {}",
                           format_tools::format_duration(elapsed), attempts,
                           cause ? describe(cause) : std::string("none"));
    }

    std::exception_ptr m_cause;
    std::size_t m_attempts;
    std::chrono::milliseconds m_elapsed;
};

/**
 * @brief Default classification: only `RetryableError` descendants are retried.
 */
struct DefaultRetryClassifier
{
    bool operator()(const std::exception_ptr &ep) const noexcept
    {
        try
        {
            std::rethrow_exception(ep);
        }
        catch (const RetryableError &)
        {
            return true;
        }
        catch (...)
        {
            return false;
        }
    }
};

/**
 * @brief Calls `op` until it succeeds, fails definitively, or `policy.timeout` elapses.
 *
 * @param op         Zero-argument idempotent callable.
 * @param policy     Timeout and retry period.
 * @param classifier `bool(const std::exception_ptr &)`; true means "retry". It is
 *                   never consulted for `ImmediateError` or `RetryTimeoutError`.
 * @return Whatever `op` returns.
 * @throws RetryTimeoutError once the deadline has passed after a retryable failure.
 */
template <typename Op, typename Classifier = DefaultRetryClassifier>
auto retry(Op &&op, const RetryPolicy &policy, Classifier classifier = Classifier{})
    -> std::invoke_result_t<Op &>
{
    using clock = std::chrono::steady_clock;
    const auto t0 = clock::now();
    std::exception_ptr last_error;
    std::size_t attempts = 0;

    while (true)
    {
        ++attempts;
        try
        {
            return op();
        }
        catch (const RetryTimeoutError &)
        {
            throw;
        }
        catch (const ImmediateError &)
        {
            throw;
        }
        catch (...)
        {
            auto ep = std::current_exception();
            if (!classifier(ep))
                throw;
            last_error = std::move(ep);
        }

        if (policy.retry_period.count() >= 0)
            std::this_thread::sleep_for(policy.retry_period);

        if (policy.timeout)
        {
            const auto elapsed =
                std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - t0);
            if (elapsed > *policy.timeout)
                throw RetryTimeoutError(last_error, attempts, elapsed);
        }
    }
}

/**
 * @brief Scoped-acquisition shape: retries `acquire`, then runs `use` exactly once.
 *
 * `acquire` returns an owning (RAII) resource. It is handed to `use` by reference and
 * released when this function returns or `use` throws. Failures inside `use` are
 * never retried.
 *
 * @return Whatever `use` returns.
 */
template <typename Acquire, typename Use, typename Classifier = DefaultRetryClassifier>
decltype(auto) retry_scoped(Acquire &&acquire, Use &&use, const RetryPolicy &policy,
                            Classifier classifier = Classifier{})
{
    auto resource = retry(std::forward<Acquire>(acquire), policy, std::move(classifier));
    return std::forward<Use>(use)(resource);
}

} // namespace h5share::utils
