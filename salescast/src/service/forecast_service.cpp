#include "salescast/service/forecast_service.hpp"

#include "salescast/core/errors.hpp"
#include "salescast/io/json.hpp"
#include "salescast/utils/logging.hpp"

#include <stdexcept>
#include <utility>

namespace salescast::service {

ForecastService::ForecastService(std::shared_ptr<const ForecastOrchestrator> orchestrator, ServiceOptions options)
    : orchestrator_(std::move(orchestrator)), options_(options),
      pool_(options_.worker_threads, options_.queue_capacity) {
	if (!orchestrator_) {
		throw std::invalid_argument("ForecastService requires an orchestrator.");
	}
}

std::future<core::ForecastResult> ForecastService::submit(ForecastRequest request) {
	auto orchestrator = orchestrator_;
	return pool_.submit([orchestrator, request = std::move(request)]() { return orchestrator->forecast(request); });
}

std::future<Json::Value> ForecastService::submitJson(ForecastRequest request) {
	auto orchestrator = orchestrator_;
	try {
		return pool_.submit([orchestrator, request]() -> Json::Value {
			try {
				return io::toJson(orchestrator->forecast(request));
			} catch (const core::ForecastError &e) {
				SALESCAST_WARN("Forecast for '{}' failed: {}: {}", request.product_id, core::toString(e.reason()),
				               e.what());
				return io::failureToJson(e);
			}
		});
	} catch (const core::QueueFullError &e) {
		SALESCAST_WARN("Rejected forecast for '{}': {}", request.product_id, e.what());
		std::promise<Json::Value> rejected;
		rejected.set_value(io::failureToJson(e));
		return rejected.get_future();
	}
}

} // namespace salescast::service
