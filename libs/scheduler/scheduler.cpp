/**
 * @file scheduler.cpp
 * @brief Single-threaded cooperative task queue
 */

#include "jnorm/scheduler.hpp"

#include <iterator>
#include <utility>

namespace jnorm {

Scheduler::Scheduler(Order order, std::uint32_t seed)
    : m_order(order)
    , m_rng(seed)
{}

void Scheduler::post(Task task)
{
    if (task) {
        m_queue.push_back(std::move(task));
    }
}

Scheduler::Task Scheduler::take_next()
{
    Task task;
    switch (m_order) {
        case Order::kFifo:
            task = std::move(m_queue.front());
            m_queue.pop_front();
            break;
        case Order::kLifo:
            task = std::move(m_queue.back());
            m_queue.pop_back();
            break;
        case Order::kShuffled: {
            std::uniform_int_distribution<std::size_t> pick(0, m_queue.size() - 1);
            auto it = std::next(m_queue.begin(), static_cast<std::ptrdiff_t>(pick(m_rng)));
            task = std::move(*it);
            m_queue.erase(it);
            break;
        }
    }
    return task;
}

bool Scheduler::run_one()
{
    if (m_queue.empty()) {
        return false;
    }
    // Dequeue before running: the task may post more work.
    Task task = take_next();
    task();
    return true;
}

std::size_t Scheduler::run()
{
    std::size_t executed = 0;
    while (run_one()) {
        ++executed;
    }
    return executed;
}

}  // namespace jnorm
