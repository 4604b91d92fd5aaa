#pragma once

#include "salescast/core/forecast.hpp"
#include "salescast/service/forecast_orchestrator.hpp"
#include "salescast/utils/worker_pool.hpp"

#include <json/json.h>

#include <cstddef>
#include <future>
#include <memory>

namespace salescast::service {

struct ServiceOptions {
	std::size_t worker_threads = 2;
	std::size_t queue_capacity = 64;
};

/**
 * @class ForecastService
 * @brief Runs forecasts on a bounded worker pool, off the caller's thread.
 *
 * The serving layer hands requests in and gets futures back, so a slow fit
 * never blocks request handling.
 */
class ForecastService {
public:
	/// @throws std::invalid_argument If @p orchestrator is null or the options are zero.
	ForecastService(std::shared_ptr<const ForecastOrchestrator> orchestrator, ServiceOptions options = {});

	/**
	 * @brief Queues a forecast.
	 * @throws core::QueueFullError If the pool's queue is at capacity.
	 */
	std::future<core::ForecastResult> submit(ForecastRequest request);

	/**
	 * @brief Queues a forecast whose outcome is the JSON payload.
	 *
	 * Never throws for engine failures: they become a ready or eventual
	 * {"error": {"type", "message"}} payload, including a full queue.
	 */
	std::future<Json::Value> submitJson(ForecastRequest request);

	const ServiceOptions &options() const {
		return options_;
	}

	std::size_t pending() const {
		return pool_.pending();
	}

private:
	std::shared_ptr<const ForecastOrchestrator> orchestrator_;
	ServiceOptions options_;
	utils::WorkerPool pool_;
};

} // namespace salescast::service
