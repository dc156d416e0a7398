#pragma once

/**
 * @file scheduler.hpp
 * @brief Single-threaded cooperative task queue
 *
 * Tasks posted to a Scheduler never run inside post(); they run on a later
 * call to run_one() or run(). The asynchronous canonicalizer defers one step
 * per node onto this queue so that other pending work can interleave.
 *
 * A Scheduler is not thread-safe and must be driven by a single thread.
 */

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <random>

namespace jnorm {

class Scheduler {
public:
    using Task = std::function<void()>;

    /**
     * Order in which pending tasks are picked
     * - kFifo: oldest first (next-tick semantics)
     * - kLifo: newest first
     * - kShuffled: uniformly random, reproducible for a given seed
     */
    enum class Order {
        kFifo,
        kLifo,
        kShuffled
    };

    explicit Scheduler(Order order = Order::kFifo, std::uint32_t seed = 0);

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    void post(Task task);

    /**
     * @brief Run a single pending task
     * @return false if the queue was empty
     */
    bool run_one();

    /**
     * @brief Run until no task is pending, including tasks posted while running
     * @return Number of tasks executed
     */
    std::size_t run();

    [[nodiscard]] std::size_t pending() const noexcept { return m_queue.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_queue.empty(); }

private:
    [[nodiscard]] Task take_next();

    Order m_order;
    std::mt19937 m_rng;
    std::deque<Task> m_queue;
};

}  // namespace jnorm
