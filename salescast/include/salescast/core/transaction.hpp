#pragma once

#include "salescast/core/date.hpp"

#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace salescast::core {

/// A single sold line item.
struct Transaction {
	Date date;
	std::string product_id;
	double quantity = 0.0;
	std::string category;
};

/**
 * @class TransactionSource
 * @brief Read access to a product's transaction history.
 *
 * Returned transactions may be in any date order.
 */
class TransactionSource {
public:
	virtual ~TransactionSource() = default;

	virtual std::vector<Transaction> transactionsFor(const std::string &product_id) const = 0;
};

/// Thread-safe in-memory history, keyed by product.
class InMemoryTransactionSource : public TransactionSource {
public:
	void record(Transaction transaction) {
		std::unique_lock<std::shared_mutex> lock(mutex_);
		by_product_[transaction.product_id].push_back(std::move(transaction));
	}

	void record(const std::vector<Transaction> &transactions) {
		std::unique_lock<std::shared_mutex> lock(mutex_);
		for (const auto &transaction : transactions) {
			by_product_[transaction.product_id].push_back(transaction);
		}
	}

	std::vector<Transaction> transactionsFor(const std::string &product_id) const override {
		std::shared_lock<std::shared_mutex> lock(mutex_);
		const auto it = by_product_.find(product_id);
		if (it == by_product_.end()) {
			return {};
		}
		return it->second;
	}

private:
	mutable std::shared_mutex mutex_;
	std::unordered_map<std::string, std::vector<Transaction>> by_product_;
};

} // namespace salescast::core
