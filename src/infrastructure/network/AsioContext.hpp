#pragma once

#include <asio.hpp>
#include <atomic>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace pingsweep::infra {

/**
 * @brief Manages an Asio I/O context with a thread pool for async operations.
 *
 * Provides a wrapper around asio::io_context that manages a pool of worker threads
 * for executing asynchronous I/O operations. Uses executor_work_guard to keep
 * the context running until explicitly stopped.
 *
 * @note This class is non-copyable. Every owner constructs its own instance.
 */
class AsioContext {
public:
    using SignalHandler = std::function<void(int signalNumber)>;

    /**
     * @brief Constructs an AsioContext with the specified number of threads.
     * @param threadCount Number of worker threads (defaults to hardware concurrency).
     */
    explicit AsioContext(size_t threadCount = std::thread::hardware_concurrency());

    /**
     * @brief Destructor. Stops the context and joins all threads.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Starts the I/O context and worker threads.
     *
     * Creates the work guard and spawns worker threads to process async operations.
     * Has no effect if already running.
     */
    void start();

    /**
     * @brief Stops the I/O context and joins all worker threads.
     *
     * Releases the work guard, stops the io_context, and waits for all threads to finish.
     */
    void stop();

    /**
     * @brief Stops the I/O context without joining the worker threads.
     *
     * Used on forced shutdown when a worker may be blocked indefinitely; the
     * caller is expected to terminate the process afterwards.
     */
    void abandon();

    /**
     * @brief Invokes a handler on the pool when one of the signals is delivered.
     *
     * The handler is re-armed after every delivery until stop() is called.
     */
    void onSignals(std::initializer_list<int> signalNumbers, SignalHandler handler);

    asio::io_context& getContext() { return ioContext_; }

    size_t threadCount() const { return threadCount_; }

    bool isRunning() const { return running_; }

    /**
     * @brief Posts a handler to be executed asynchronously.
     * @tparam Handler Callable type (function, lambda, etc.).
     * @param handler The handler to execute on the I/O thread pool.
     */
    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(ioContext_, std::forward<Handler>(handler));
    }

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    void waitForSignal();

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::unique_ptr<asio::signal_set> signals_;
    SignalHandler signalHandler_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    size_t threadCount_;
};

} // namespace pingsweep::infra
