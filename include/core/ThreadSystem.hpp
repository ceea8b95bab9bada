/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 *
 * Thread System: shared worker pool with task prioritization. Simulation
 * tick loops run on their own threads; this pool only takes short batches
 * (per-agent heading passes) that a tick loop fans out and waits on.
 */

#ifndef THREAD_SYSTEM_HPP
#define THREAD_SYSTEM_HPP

#include "core/Logger.hpp"
#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

// Platform-specific includes for thread naming
#if defined(__linux__) || defined(__APPLE__) || defined(_GNU_SOURCE)
#include <pthread.h>
#endif

namespace ShoalEngine {

// Task priority levels
enum class TaskPriority {
  Critical = 0, // Must execute ASAP
  High = 1,     // Tick-critical work (heading batches)
  Normal = 2,   // Default priority for most tasks
  Low = 3,      // Background housekeeping
  Idle = 4      // Only execute when nothing else is pending
};

// Task wrapper with priority information
struct PrioritizedTask {
  std::function<void()> task;
  TaskPriority priority{TaskPriority::Normal};
  std::chrono::steady_clock::time_point enqueueTime{
      std::chrono::steady_clock::now()};
  std::string description;

  PrioritizedTask() = default;

  PrioritizedTask(std::function<void()> t, TaskPriority p, std::string desc = "")
      : task(std::move(t)), priority(p),
        enqueueTime(std::chrono::steady_clock::now()),
        description(std::move(desc)) {}
};

/**
 * @brief Thread-safe prioritized task queue
 *
 * One FIFO deque per priority level behind a single mutex. Workers block in
 * pop() until a task arrives or the queue is stopped; higher priority levels
 * are always drained first.
 */
class TaskQueue {
public:
  static constexpr size_t PRIORITY_LEVELS =
      static_cast<size_t>(TaskPriority::Idle) + 1;

  void push(std::function<void()> task,
            TaskPriority priority = TaskPriority::Normal,
            const std::string &description = "") {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_queues[static_cast<size_t>(priority)].emplace_back(
          std::move(task), priority, description);
      ++m_size;
      ++m_totalEnqueued;
    }
    // Critical work wakes everyone, anything else wakes a single worker
    if (priority == TaskPriority::Critical) {
      m_condition.notify_all();
    } else {
      m_condition.notify_one();
    }
  }

  /**
   * @brief Enqueue a batch of tasks with a single lock acquisition
   *
   * @param tasks Tasks to enqueue (moved from)
   * @param priority Priority level for the whole batch
   * @param description Optional description for debugging
   */
  void batchPush(std::vector<std::function<void()>> &tasks,
                 TaskPriority priority = TaskPriority::Normal,
                 const std::string &description = "") {
    if (tasks.empty()) {
      return;
    }

    const size_t batchSize = tasks.size();
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      auto &queue = m_queues[static_cast<size_t>(priority)];
      for (auto &task : tasks) {
        queue.emplace_back(std::move(task), priority, description);
      }
      m_size += batchSize;
      m_totalEnqueued += batchSize;
    }

    if (batchSize > 1 || priority == TaskPriority::Critical) {
      m_condition.notify_all();
    } else {
      m_condition.notify_one();
    }
  }

  // Blocks until a task is available; returns false once stopped
  bool pop(PrioritizedTask &out) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_condition.wait(lock, [this] { return m_stopping || m_size > 0; });

    if (m_stopping) {
      return false;
    }

    for (auto &queue : m_queues) {
      if (!queue.empty()) {
        out = std::move(queue.front());
        queue.pop_front();
        --m_size;
        return true;
      }
    }
    return false;
  }

  // Drops pending tasks and releases every blocked worker
  size_t stop() {
    size_t dropped = 0;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_stopping = true;
      dropped = m_size;
      for (auto &queue : m_queues) {
        queue.clear();
      }
      m_size = 0;
    }
    m_condition.notify_all();
    return dropped;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_size;
  }

  bool isEmpty() const { return size() == 0; }

  size_t getTotalTasksEnqueued() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_totalEnqueued;
  }

private:
  std::array<std::deque<PrioritizedTask>, PRIORITY_LEVELS> m_queues{};
  mutable std::mutex m_mutex{};
  std::condition_variable m_condition{};
  size_t m_size{0};
  size_t m_totalEnqueued{0};
  bool m_stopping{false};
};

// Fixed-size pool of worker threads draining one TaskQueue
class ThreadPool {
public:
  explicit ThreadPool(size_t numThreads) {
    m_workers.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
      m_workers.emplace_back([this, i] {
#if defined(__linux__) || defined(_GNU_SOURCE)
        std::string threadName = "Worker-" + std::to_string(i);
        pthread_setname_np(pthread_self(), threadName.c_str());
#elif defined(__APPLE__)
        std::string threadName = "Worker-" + std::to_string(i);
        pthread_setname_np(threadName.c_str());
#endif
        workerThread(i);
      });
    }
  }

  ~ThreadPool() {
    size_t dropped = m_taskQueue.stop();
    if (dropped > 0) {
      THREADSYSTEM_INFO("Canceling " + std::to_string(dropped) +
                        " pending tasks during shutdown");
    }

    for (auto &worker : m_workers) {
      if (worker.joinable()) {
        worker.join();
      }
    }
    THREADSYSTEM_INFO("ThreadPool shutdown completed");
  }

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  void enqueue(std::function<void()> task,
               TaskPriority priority = TaskPriority::Normal,
               const std::string &description = "") {
    m_taskQueue.push(std::move(task), priority, description);
  }

  void batchEnqueue(std::vector<std::function<void()>> &tasks,
                    TaskPriority priority = TaskPriority::Normal,
                    const std::string &description = "") {
    m_taskQueue.batchPush(tasks, priority, description);
  }

  template <class F>
  auto enqueueWithResult(F &&f, TaskPriority priority = TaskPriority::Normal,
                         const std::string &description = "")
      -> std::future<std::invoke_result_t<F>> {
    using return_type = std::invoke_result_t<F>;

    auto task =
        std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
    std::future<return_type> result = task->get_future();
    enqueue([task]() { (*task)(); }, priority, description);
    return result;
  }

  bool busy() const {
    return !m_taskQueue.isEmpty() ||
           m_activeTasks.load(std::memory_order_relaxed) > 0;
  }

  size_t getTotalTasksEnqueued() const {
    return m_taskQueue.getTotalTasksEnqueued();
  }

  size_t getTotalTasksProcessed() const {
    return m_totalTasksProcessed.load(std::memory_order_relaxed);
  }

  size_t getQueueSize() const { return m_taskQueue.size(); }

private:
  std::vector<std::thread> m_workers;
  TaskQueue m_taskQueue;
  std::atomic<size_t> m_activeTasks{0};
  std::atomic<size_t> m_totalTasksProcessed{0};

  void workerThread(size_t threadIndex) {
    PrioritizedTask next;
    size_t tasksProcessed = 0;

    while (m_taskQueue.pop(next)) {
      m_activeTasks.fetch_add(1, std::memory_order_relaxed);
      auto taskStart = std::chrono::steady_clock::now();

      try {
        next.task();
        ++tasksProcessed;
      } catch (const std::exception &e) {
        THREADSYSTEM_ERROR("Error in worker thread " +
                           std::to_string(threadIndex) + ": " +
                           std::string(e.what()));
      } catch (...) {
        THREADSYSTEM_ERROR("Unknown error in worker thread " +
                           std::to_string(threadIndex));
      }

      m_activeTasks.fetch_sub(1, std::memory_order_relaxed);
      m_totalTasksProcessed.fetch_add(1, std::memory_order_relaxed);

      auto taskDuration = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - taskStart)
                              .count();
      if (taskDuration > 100) {
        THREADSYSTEM_WARN("Worker " + std::to_string(threadIndex) +
                          " - Slow task: " + std::to_string(taskDuration) +
                          "ms" +
                          (next.description.empty()
                               ? std::string()
                               : " (" + next.description + ")"));
      }

      next.task = nullptr;
    }

    THREADSYSTEM_INFO("Worker " + std::to_string(threadIndex) +
                      " exiting after processing " +
                      std::to_string(tasksProcessed) + " tasks");
    (void)tasksProcessed;
  }
};

// Singleton Thread System Manager
class ThreadSystem {
public:
  static ThreadSystem &Instance() {
    static ThreadSystem instance;
    return instance;
  }

  /**
   * @brief Check if the ThreadSystem has not been shut down yet
   */
  static bool Exists() {
    return !Instance().m_isShutdown.load(std::memory_order_acquire);
  }

  /**
   * @brief Initialize the worker pool
   *
   * @param customThreadCount Exact worker count (0 = hardware_concurrency - 1,
   * minimum 1)
   * @return true if the pool is running after the call
   */
  bool init(unsigned int customThreadCount = 0) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_isShutdown.load(std::memory_order_acquire)) {
      THREADSYSTEM_WARN("ThreadSystem already shut down, ignoring init request");
      return false;
    }
    if (m_threadPool) {
      return true;
    }

    if (customThreadCount > 0) {
      m_numThreads = customThreadCount;
    } else {
      unsigned int hardwareThreads = std::thread::hardware_concurrency();
      m_numThreads = (hardwareThreads > 1) ? (hardwareThreads - 1) : 1;
    }

    try {
      m_threadPool = std::make_unique<ThreadPool>(m_numThreads);
      THREADSYSTEM_INFO("ThreadSystem initialized with " +
                        std::to_string(m_numThreads) + " worker threads");
      return true;
    } catch (const std::exception &e) {
      THREADSYSTEM_ERROR("Failed to initialize ThreadSystem: " +
                         std::string(e.what()));
      m_threadPool.reset();
      return false;
    }
  }

  void clean() {
    std::unique_ptr<ThreadPool> pool;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_isShutdown.store(true, std::memory_order_release);
      pool = std::move(m_threadPool);
    }
    // Destroyed outside the lock; joins every worker
    pool.reset();
    THREADSYSTEM_INFO("ThreadSystem resources cleaned!");
  }

  ~ThreadSystem() {
    if (!m_isShutdown.load(std::memory_order_acquire)) {
      clean();
    }
  }

  // True once init() has succeeded and clean() has not run
  bool isInitialized() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threadPool != nullptr;
  }

  bool isShutdown() const {
    return m_isShutdown.load(std::memory_order_acquire);
  }

  /**
   * @brief Enqueue a fire-and-forget task
   *
   * Tasks submitted after shutdown (or before init) are dropped.
   */
  void enqueueTask(std::function<void()> task,
                   TaskPriority priority = TaskPriority::Normal,
                   const std::string &description = "") {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_threadPool) {
      THREADSYSTEM_DEBUG("Ignoring task while not running" +
                         (description.empty() ? std::string()
                                              : " (" + description + ")"));
      return;
    }
    m_threadPool->enqueue(std::move(task), priority, description);
  }

  /**
   * @brief Batch enqueue with a single queue lock
   *
   * Example usage:
   *   std::vector<std::function<void()>> tasks;
   *   for (size_t b = 0; b < batches; ++b) {
   *     tasks.push_back([&, b]() { processBatch(b); });
   *   }
   *   ThreadSystem::Instance().batchEnqueueTasks(tasks, TaskPriority::High, "Headings");
   */
  void batchEnqueueTasks(std::vector<std::function<void()>> &tasks,
                         TaskPriority priority = TaskPriority::Normal,
                         const std::string &description = "") {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_threadPool || tasks.empty()) {
      return;
    }
    m_threadPool->batchEnqueue(tasks, priority, description);
  }

  /**
   * @brief Enqueue a task and get a future for its result
   *
   * @throws std::runtime_error if the pool is not running
   */
  template <class F>
  auto enqueueTaskWithResult(F &&f, TaskPriority priority = TaskPriority::Normal,
                             const std::string &description = "")
      -> std::future<std::invoke_result_t<F>> {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_threadPool) {
      throw std::runtime_error("ThreadSystem is not running" +
                               (description.empty() ? std::string()
                                                    : ": " + description));
    }
    return m_threadPool->enqueueWithResult(std::forward<F>(f), priority,
                                           description);
  }

  bool isBusy() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threadPool && m_threadPool->busy();
  }

  unsigned int getThreadCount() const { return m_numThreads; }

  size_t getQueueSize() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threadPool ? m_threadPool->getQueueSize() : 0;
  }

  size_t getTotalTasksProcessed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threadPool ? m_threadPool->getTotalTasksProcessed() : 0;
  }

  size_t getTotalTasksEnqueued() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threadPool ? m_threadPool->getTotalTasksEnqueued() : 0;
  }

private:
  std::unique_ptr<ThreadPool> m_threadPool{nullptr};
  unsigned int m_numThreads{0};
  std::atomic<bool> m_isShutdown{false};
  mutable std::mutex m_mutex{};

  ThreadSystem(const ThreadSystem &) = delete;
  ThreadSystem &operator=(const ThreadSystem &) = delete;

  ThreadSystem() = default;
};

} // namespace ShoalEngine

#endif // THREAD_SYSTEM_HPP
