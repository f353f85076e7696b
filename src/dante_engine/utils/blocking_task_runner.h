/**
 * @file blocking_task_runner.h
 * @brief Runs blocking network work off the caller's thread.
 * @details Listen windows and command round trips block for seconds. The coordinator
 *          hands them to this runner and joins the returned futures, so a host event
 *          loop calling into the engine is only held for the join.
 */
#ifndef DANTEBRIDGE_BLOCKING_TASK_RUNNER_H
#define DANTEBRIDGE_BLOCKING_TASK_RUNNER_H

#include <atomic>
#include <cstddef>
#include <future>
#include <string>
#include <type_traits>
#include <utility>

namespace dantebridge {
namespace engine {

class BlockingTaskRunner {
public:
    explicit BlockingTaskRunner(std::string name) : m_name(std::move(name)) {}

    BlockingTaskRunner(const BlockingTaskRunner&) = delete;
    BlockingTaskRunner& operator=(const BlockingTaskRunner&) = delete;

    /**
     * @brief Starts `fn` on a dedicated thread.
     * @return Future for the result. Exceptions thrown by `fn` are rethrown by `get()`.
     */
    template <typename Fn>
    std::future<std::invoke_result_t<std::decay_t<Fn>>> submit(Fn&& fn) {
        m_submitted.fetch_add(1, std::memory_order_relaxed);
        return std::async(std::launch::async, std::forward<Fn>(fn));
    }

    /// Starts `fn` and waits for it.
    template <typename Fn>
    std::invoke_result_t<std::decay_t<Fn>> run(Fn&& fn) {
        return submit(std::forward<Fn>(fn)).get();
    }

    std::size_t submitted() const { return m_submitted.load(std::memory_order_relaxed); }
    const std::string& name() const { return m_name; }

private:
    std::string m_name;
    std::atomic<std::size_t> m_submitted{0};
};

} // namespace engine
} // namespace dantebridge

#endif // DANTEBRIDGE_BLOCKING_TASK_RUNNER_H
