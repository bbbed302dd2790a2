#include "txkv_scenario.hpp"
#include "txkv_logger.hpp"
#include "txkv_utils.hpp"
#include "txkv_worker_pool.hpp"
#include <future>
#include <stdexcept>
using namespace std;

namespace txkv {

DepositScenario::DepositScenario(const ScenarioConfig& config, ostream& out)
    : config_(config), out_(out), lock_manager_(config.victim_policy), validator_(store_),
      coordinator_(store_, lock_manager_, validator_) {
}

ScenarioReport DepositScenario::run() {
    TXKV_LOG_INFO("running scenario: ", ConfigParser::modeToString(config_.mode));
    switch (config_.mode) {
        case ScenarioMode::DEADLOCK_DETECTION:
            return runDeadlockDetection();
        case ScenarioMode::DEADLOCK_FREE:
            return runDeadlockFree();
        case ScenarioMode::PESSIMISTIC:
            return runPessimistic();
    }
    throw invalid_argument("unknown scenario mode");
}

ScenarioReport DepositScenario::runDeadlockDetection() {
    return runConcurrentDeposits(ScenarioMode::DEADLOCK_DETECTION, TransactionConcurrency::PESSIMISTIC,
                                 TransactionIsolationLevel::REPEATABLE_READ, false);
}

ScenarioReport DepositScenario::runDeadlockFree() {
    return runConcurrentDeposits(ScenarioMode::DEADLOCK_FREE, TransactionConcurrency::OPTIMISTIC,
                                 TransactionIsolationLevel::SERIALIZABLE, true);
}

ScenarioReport DepositScenario::runPessimistic() {
    ScenarioReport report;
    report.mode = ScenarioMode::PESSIMISTIC;
    const uint64_t deadlocks_before = lock_manager_.getDeadlockCount();

    store_.clear();
    store_.put(1, Record(1, 100));
    store_.put(2, Record(2, 200));
    report.before = store_.snapshot();

    out_ << "\n>>> Cache transaction example started.\n";
    out_ << "\n>>> Accounts before deposit: \n";
    printAccounts();

    const pair<Key, double> deposits[] = {{1, 100}, {2, 200}};
    for (const auto& deposit : deposits) {
        WorkerOptions options = makeOptions("deposit-" + to_string(deposit.first), deposit.second,
                                            KeyOrder::ASCENDING);
        options.first_key = deposit.first;
        options.last_key = deposit.first;
        options.step_pause = chrono::milliseconds(0);
        options.commit_pause = chrono::milliseconds(0);
        options.concurrency = TransactionConcurrency::PESSIMISTIC;
        options.isolation = TransactionIsolationLevel::REPEATABLE_READ;

        Worker worker(coordinator_, options);
        WorkerResult result = worker.run();
        if (result.committed) {
            out_ << "\n>>> Transferred amount: $" << Utils::formatAmount(deposit.second) << "\n";
        } else {
            out_ << "\n>>> Transfer failed: " << result.failure_message << "\n";
        }
        report.workers.push_back(move(result));
    }

    out_ << "\n>>> Accounts after transfer: \n";
    printAccounts();
    out_ << ">>> Cache transaction example finished." << endl;

    report.after = store_.snapshot();
    report.deadlocks = lock_manager_.getDeadlockCount() - deadlocks_before;
    return report;
}

void DepositScenario::initAccounts(IKeyValueStore& store, size_t entries) {
    store.clear();
    for (size_t i = 1; i <= entries; i++) {
        Key key = static_cast<Key>(i);
        store.put(key, Record(key, static_cast<double>(i) * 100));
    }
}

void DepositScenario::printAccounts() {
    for (Key key : store_.getAllKeys()) {
        optional<Record> record = store_.get(key);
        if (record) {
            out_ << ">>> [" << key << "] = " << *record << "\n";
        }
    }
    out_.flush();
}

WorkerOptions DepositScenario::makeOptions(const string& name, double amount, KeyOrder order) const {
    WorkerOptions options;
    options.name = name;
    options.amount = amount;
    options.order = order;
    options.first_key = 1;
    options.last_key = static_cast<Key>(config_.entries);
    options.step_pause = config_.step_pause;
    options.commit_pause = config_.commit_pause;
    options.timeout = config_.timeout;
    options.max_attempts = config_.max_attempts;
    return options;
}

ScenarioReport DepositScenario::runConcurrentDeposits(ScenarioMode mode, TransactionConcurrency concurrency,
                                                      TransactionIsolationLevel isolation, bool retry) {
    ScenarioReport report;
    report.mode = mode;
    const uint64_t deadlocks_before = lock_manager_.getDeadlockCount();

    initAccounts(store_, config_.entries);
    report.before = store_.snapshot();

    out_ << "\n>>> Cache transaction example started.\n";
    out_ << "\n>>> Accounts before deposit: \n";
    printAccounts();

    vector<WorkerOptions> options = {
        makeOptions("ascending", 100, KeyOrder::ASCENDING),
        makeOptions("descending", 200, KeyOrder::DESCENDING),
    };
    for (auto& option : options) {
        option.concurrency = concurrency;
        option.isolation = isolation;
        option.retry = retry;
    }

    {
        WorkerThreadPool pool(options.size());
        vector<future<WorkerResult>> futures;
        for (const auto& option : options) {
            futures.push_back(pool.submit([this, option]() {
                Worker worker(coordinator_, option);
                return worker.run();
            }));
        }
        for (auto& f : futures) {
            report.workers.push_back(f.get());
        }
    }

    for (const auto& result : report.workers) {
        if (result.final_state == TransactionState::FAILED_DEADLOCK) {
            out_ << "\n>>> " << Utils::formatCycle(result.deadlock_cycle) << "\n";
        } else if (!result.committed) {
            out_ << "\n>>> [" << result.name << "] " << result.failure_message << "\n";
        }
    }

    out_ << "\n>>> Accounts after deposit: \n";
    printAccounts();

    report.after = store_.snapshot();
    report.deadlocks = lock_manager_.getDeadlockCount() - deadlocks_before;
    return report;
}

} // namespace txkv
