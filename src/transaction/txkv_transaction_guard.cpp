#include "transaction/txkv_transaction_guard.hpp"
#include "txkv_logger.hpp"

namespace txkv {

TransactionGuard::TransactionGuard(TransactionCoordinator& coordinator, TransactionConcurrency concurrency,
                                   TransactionIsolationLevel isolation, std::chrono::milliseconds timeout)
    : coordinator_(coordinator), tx_id_(coordinator.begin(concurrency, isolation, timeout)) {
}

TransactionGuard::~TransactionGuard() {
    if (!coordinator_.isActive(tx_id_)) {
        return;
    }
    try {
        coordinator_.rollback(tx_id_);
    } catch (const std::exception& e) {
        TXKV_LOG_ERRORF("failed to roll back tx {}: {}", tx_id_, e.what());
    }
}

} // namespace txkv
