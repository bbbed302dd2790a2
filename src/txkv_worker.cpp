#include "txkv_worker.hpp"
#include "txkv_exception.hpp"
#include "txkv_logger.hpp"
#include "txkv_utils.hpp"
#include "transaction/txkv_transaction_guard.hpp"
#include <algorithm>
#include <thread>
using namespace std;

namespace txkv {

Worker::Worker(TransactionCoordinator& coordinator, WorkerOptions options)
    : coordinator_(coordinator), options_(move(options)) {
}

vector<Key> Worker::getKeys() const {
    vector<Key> keys;
    for (Key key = options_.first_key; key <= options_.last_key; key++) {
        keys.push_back(key);
    }
    if (options_.order == KeyOrder::DESCENDING) {
        reverse(keys.begin(), keys.end());
    }
    return keys;
}

WorkerResult Worker::run() {
    WorkerResult result;
    result.name = options_.name;

    TXKV_LOG_INFOF("[{}] trying to deposit: {}", options_.name, Utils::formatAmount(options_.amount));
    while (true) {
        result.attempts++;
        try {
            runAttempt(result);
            return result;
        } catch (const TransactionDeadlockException& e) {
            result.final_state = TransactionState::FAILED_DEADLOCK;
            result.failure_message = e.what();
            result.deadlock_cycle = e.getCycle();
            TXKV_LOG_WARNINGF("[{}] deadlock detected:\n{}", options_.name, Utils::formatCycle(e.getCycle()));
        } catch (const TransactionTimeoutException& e) {
            result.final_state = TransactionState::FAILED_TIMEOUT;
            result.failure_message = e.what();
            TXKV_LOG_WARNINGF("[{}] {}", options_.name, e.what());
        } catch (const TransactionOptimisticException& e) {
            result.final_state = TransactionState::FAILED_CONFLICT;
            result.failure_message = e.what();
            TXKV_LOG_INFOF("[{}] transaction has failed due to the locks conflict", options_.name);
        } catch (const KeyNotFoundException& e) {
            // 数据缺失不是冲突，重试也无济于事
            result.final_state = coordinator_.getState(e.getTransactionId());
            result.failure_message = e.what();
            TXKV_LOG_ERRORF("[{}] {}", options_.name, e.what());
            return result;
        } catch (const TransactionException& e) {
            result.final_state = coordinator_.getState(e.getTransactionId());
            result.failure_message = e.what();
            TXKV_LOG_ERRORF("[{}] {}", options_.name, e.what());
            return result;
        }

        if (!shouldRetry(result)) {
            return result;
        }
        TXKV_LOG_INFOF("[{}] restarting transaction, attempt {}", options_.name, result.attempts + 1);
    }
}

void Worker::runAttempt(WorkerResult& result) {
    TransactionGuard tx(coordinator_, options_.concurrency, options_.isolation, options_.timeout);
    result.last_tx_id = tx.id();

    for (Key key : getKeys()) {
        Record record = tx.get(key);
        record.update(options_.amount);
        tx.put(record);
        TXKV_LOG_DEBUGF("[{}] tx {} deposited {} into {}", options_.name, tx.id(),
                        Utils::formatAmount(options_.amount), record);
        if (options_.step_pause.count() > 0) {
            this_thread::sleep_for(options_.step_pause);
        }
    }

    if (options_.commit_pause.count() > 0) {
        this_thread::sleep_for(options_.commit_pause);
    }

    tx.commit();
    result.committed = true;
    result.final_state = TransactionState::COMMITTED;
    result.failure_message.clear();
    TXKV_LOG_INFOF("[{}] tx {} committed after {} attempt(s)", options_.name, tx.id(), result.attempts);
}

bool Worker::shouldRetry(const WorkerResult& result) const {
    if (!options_.retry) {
        return false;
    }
    return options_.max_attempts == 0 || result.attempts < options_.max_attempts;
}

} // namespace txkv
