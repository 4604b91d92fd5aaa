#pragma once

#include "salescast/core/errors.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace salescast::utils {

/**
 * @class WorkerPool
 * @brief Fixed set of worker threads fed from a bounded FIFO queue.
 *
 * submit() never blocks: when the queue already holds @c queue_capacity
 * pending tasks it throws core::QueueFullError. Exceptions thrown by a task are
 * delivered through its future. The destructor stops accepting work, lets the
 * workers drain the queue and joins them.
 */
class WorkerPool {
public:
	/**
	 * @param threads Number of worker threads, at least 1.
	 * @param queue_capacity Maximum number of tasks waiting for a worker, at least 1.
	 */
	WorkerPool(std::size_t threads, std::size_t queue_capacity);
	~WorkerPool();

	WorkerPool(const WorkerPool &) = delete;
	WorkerPool &operator=(const WorkerPool &) = delete;

	template <typename F>
	std::future<std::invoke_result_t<F>> submit(F &&task) {
		using Result = std::invoke_result_t<F>;
		auto packaged = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(task));
		auto future = packaged->get_future();
		{
			std::lock_guard<std::mutex> lock(mutex_);
			if (stopping_) {
				throw std::runtime_error("WorkerPool is shutting down.");
			}
			if (queue_.size() >= queue_capacity_) {
				throw core::QueueFullError("Worker queue is full (" + std::to_string(queue_capacity_) +
				                           " pending tasks).");
			}
			queue_.emplace_back([packaged]() { (*packaged)(); });
		}
		cv_.notify_one();
		return future;
	}

	std::size_t threadCount() const {
		return workers_.size();
	}

	std::size_t queueCapacity() const {
		return queue_capacity_;
	}

	/// Tasks waiting for a worker (not counting running ones).
	std::size_t pending() const;

private:
	void workerLoop();

	std::size_t queue_capacity_;
	std::vector<std::thread> workers_;
	std::deque<std::function<void()>> queue_;
	mutable std::mutex mutex_;
	std::condition_variable cv_;
	bool stopping_ = false;
};

} // namespace salescast::utils
