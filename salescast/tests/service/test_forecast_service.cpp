#include <catch2/catch_test_macros.hpp>

#include "common/series_helpers.hpp"
#include "salescast/core/errors.hpp"
#include "salescast/service/forecast_service.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

using namespace salescast;
using service::ForecastOrchestratorBuilder;
using service::ForecastRequest;
using service::ForecastService;
using service::ServiceOptions;
using tests::helpers::monthlyTransactions;
using tests::helpers::seasonalMonthly;

namespace {

std::shared_ptr<core::InMemoryTransactionSource> sampleStore() {
	auto store = std::make_shared<core::InMemoryTransactionSource>();
	store->record(monthlyTransactions("SKU-1", seasonalMonthly(24)));
	store->record(monthlyTransactions("SKU-2", seasonalMonthly(30, 40.0, 8.0, 0.3)));
	return store;
}

/// Holds every lookup until release() so tests can keep the workers busy.
class GatedTransactionSource : public core::TransactionSource {
public:
	explicit GatedTransactionSource(std::shared_ptr<const core::TransactionSource> inner)
	    : inner_(std::move(inner)), gate_(release_.get_future().share()) {
	}

	std::vector<core::Transaction> transactionsFor(const std::string &product_id) const override {
		++entered;
		gate_.wait();
		return inner_->transactionsFor(product_id);
	}

	void release() {
		release_.set_value();
	}

	mutable std::atomic<int> entered{0};

private:
	std::shared_ptr<const core::TransactionSource> inner_;
	std::promise<void> release_;
	std::shared_future<void> gate_;
};

} // namespace

TEST_CASE("Service runs requests on its workers", "[service]") {
	auto orchestrator = std::shared_ptr<const service::ForecastOrchestrator>(
	    ForecastOrchestratorBuilder().withTransactions(sampleStore()).build());
	ForecastService service(orchestrator, ServiceOptions{2, 8});

	auto first = service.submit(ForecastRequest{"SKU-1", "Beverages", 3, core::Granularity::Monthly});
	auto second = service.submit(ForecastRequest{"SKU-2", "Snacks", 6, core::Granularity::Monthly});

	const auto a = first.get();
	const auto b = second.get();
	REQUIRE(a.historicalCount() == 24);
	REQUIRE(a.future().size() == 3);
	REQUIRE(b.historicalCount() == 30);
	REQUIRE(b.future().size() == 6);

	auto failing = service.submit(ForecastRequest{"SKU-1", "Beverages", 12, core::Granularity::Monthly});
	REQUIRE_THROWS_AS(failing.get(), core::InvalidPeriodsError);
}

TEST_CASE("JSON submissions carry either a forecast or an error payload", "[service][json]") {
	auto orchestrator = std::shared_ptr<const service::ForecastOrchestrator>(
	    ForecastOrchestratorBuilder().withTransactions(sampleStore()).build());
	ForecastService service(orchestrator);

	const auto ok = service.submitJson(ForecastRequest{"SKU-1", "Beverages", 3, core::Granularity::Monthly}).get();
	REQUIRE(ok.isMember("forecast"));
	REQUIRE(ok["forecast"].size() == 27);
	REQUIRE(ok["periods"].asInt() == 3);

	const auto bad_periods =
	    service.submitJson(ForecastRequest{"SKU-1", "Beverages", 12, core::Granularity::Monthly}).get();
	REQUIRE(bad_periods["error"]["type"].asString() == "InvalidPeriodsError");
	REQUIRE_FALSE(bad_periods.isMember("forecast"));

	const auto unknown = service.submitJson(ForecastRequest{"SKU-404", "Beverages", 3, core::Granularity::Monthly}).get();
	REQUIRE(unknown["error"]["type"].asString() == "InsufficientHistoryError");
}

TEST_CASE("A full queue rejects new requests", "[service][error]") {
	auto gated = std::make_shared<GatedTransactionSource>(sampleStore());
	auto orchestrator = std::shared_ptr<const service::ForecastOrchestrator>(
	    ForecastOrchestratorBuilder().withTransactions(gated).build());
	ForecastService service(orchestrator, ServiceOptions{1, 1});
	const ForecastRequest request{"SKU-1", "Beverages", 3, core::Granularity::Monthly};

	auto running = service.submit(request);
	while (gated->entered.load() == 0) {
		std::this_thread::sleep_for(std::chrono::milliseconds(1));
	}
	auto queued = service.submit(request);

	bool rejected = false;
	try {
		service.submit(request);
	} catch (const core::QueueFullError &) {
		rejected = true;
	}
	auto rejected_json = service.submitJson(request);
	const bool json_ready = rejected_json.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
	const std::size_t pending = service.pending();

	gated->release();
	REQUIRE(rejected);
	REQUIRE(json_ready);
	REQUIRE(rejected_json.get()["error"]["type"].asString() == "QueueFullError");
	REQUIRE(pending == 1);
	REQUIRE(running.get().future().size() == 3);
	REQUIRE(queued.get().future().size() == 3);
}

TEST_CASE("Service validates its options", "[service][error]") {
	REQUIRE_THROWS_AS(ForecastService(nullptr), std::invalid_argument);
	auto orchestrator = std::shared_ptr<const service::ForecastOrchestrator>(
	    ForecastOrchestratorBuilder().withTransactions(sampleStore()).build());
	REQUIRE_THROWS_AS(ForecastService(orchestrator, ServiceOptions{0, 4}), std::invalid_argument);
	REQUIRE_THROWS_AS(ForecastService(orchestrator, ServiceOptions{2, 0}), std::invalid_argument);
}
