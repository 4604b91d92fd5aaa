#include "salescast/utils/worker_pool.hpp"

namespace salescast::utils {

WorkerPool::WorkerPool(std::size_t threads, std::size_t queue_capacity) : queue_capacity_(queue_capacity) {
	if (threads == 0) {
		throw std::invalid_argument("WorkerPool requires at least one thread.");
	}
	if (queue_capacity == 0) {
		throw std::invalid_argument("WorkerPool requires a positive queue capacity.");
	}
	workers_.reserve(threads);
	for (std::size_t i = 0; i < threads; ++i) {
		workers_.emplace_back(&WorkerPool::workerLoop, this);
	}
}

WorkerPool::~WorkerPool() {
	{
		std::lock_guard<std::mutex> lock(mutex_);
		stopping_ = true;
	}
	cv_.notify_all();
	for (auto &worker : workers_) {
		if (worker.joinable()) {
			worker.join();
		}
	}
}

std::size_t WorkerPool::pending() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return queue_.size();
}

void WorkerPool::workerLoop() {
	while (true) {
		std::function<void()> task;
		{
			std::unique_lock<std::mutex> lock(mutex_);
			cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
			if (queue_.empty()) {
				// stopping_ and drained
				return;
			}
			task = std::move(queue_.front());
			queue_.pop_front();
		}
		// packaged_task stores any exception in the future.
		task();
	}
}

} // namespace salescast::utils
