#include "transaction/txkv_optimistic_validator.hpp"
#include "txkv_logger.hpp"
using namespace std;

namespace txkv {

OptimisticValidator::OptimisticValidator(IKeyValueStore& store)
    : store_(store) {
}

void OptimisticValidator::begin(TransactionID tx_id, TransactionIsolationLevel isolation) {
    lock_guard<mutex> lock(tracking_mutex_);
    TransactionTracking tracking;
    tracking.isolation = isolation;
    tracking_[tx_id] = move(tracking);
}

Version OptimisticValidator::recordRead(TransactionID tx_id, Key key) {
    shared_lock<shared_mutex> commit_lock(commit_latch_);
    lock_guard<mutex> lock(tracking_mutex_);
    TransactionTracking& tracking = tracking_.at(tx_id);
    snapshotIfAbsent(tracking, key);
    tracking.read_set.insert(key);
    return tracking.snapshot_versions.at(key);
}

void OptimisticValidator::recordWrite(TransactionID tx_id, Key key, const Record& value) {
    shared_lock<shared_mutex> commit_lock(commit_latch_);
    lock_guard<mutex> lock(tracking_mutex_);
    TransactionTracking& tracking = tracking_.at(tx_id);
    // 盲写也要记下首次接触时的版本，否则无法发现写写冲突
    snapshotIfAbsent(tracking, key);
    tracking.write_set.insert_or_assign(key, value);
}

ValidationResult OptimisticValidator::validate(TransactionID tx_id) {
    // 提交的串行化点：与其他 validate 以及版本快照互斥
    unique_lock<shared_mutex> commit_lock(commit_latch_);

    TransactionTracking tracking;
    {
        lock_guard<mutex> lock(tracking_mutex_);
        auto it = tracking_.find(tx_id);
        if (it == tracking_.end()) {
            throw out_of_range("transaction " + to_string(tx_id) + " is not tracked by the validator");
        }
        tracking = move(it->second);
        tracking_.erase(it);
    }

    ValidationResult result;
    for (const auto& pair : tracking.snapshot_versions) {
        Key key = pair.first;
        if (tracking.isolation == TransactionIsolationLevel::READ_COMMITTED &&
            tracking.write_set.find(key) == tracking.write_set.end()) {
            continue;
        }
        if (currentVersion(key) != pair.second) {
            result.conflicting_keys.push_back(key);
        }
    }

    if (!result.conflicting_keys.empty()) {
        result.status = ValidationStatus::CONFLICT;
        TXKV_LOG_DEBUGF("tx {} failed validation on {} keys", tx_id, result.conflicting_keys.size());
        return result;
    }

    result.commit_version = applyLocked(tracking.write_set);
    TXKV_LOG_DEBUGF("tx {} committed {} keys at version {}", tx_id, tracking.write_set.size(), result.commit_version);
    return result;
}

Version OptimisticValidator::applyWrites(const std::map<Key, Record>& writes) {
    unique_lock<shared_mutex> commit_lock(commit_latch_);
    return applyLocked(writes);
}

bool OptimisticValidator::discard(TransactionID tx_id) {
    lock_guard<mutex> lock(tracking_mutex_);
    return tracking_.erase(tx_id) > 0;
}

Version OptimisticValidator::getVersion(Key key) const {
    shared_lock<shared_mutex> commit_lock(commit_latch_);
    return currentVersion(key);
}

Version OptimisticValidator::getGlobalVersion() const {
    shared_lock<shared_mutex> commit_lock(commit_latch_);
    return global_version_;
}

bool OptimisticValidator::isTracking(TransactionID tx_id) const {
    lock_guard<mutex> lock(tracking_mutex_);
    return tracking_.find(tx_id) != tracking_.end();
}

size_t OptimisticValidator::getTrackedCount() const {
    lock_guard<mutex> lock(tracking_mutex_);
    return tracking_.size();
}

Version OptimisticValidator::applyLocked(const std::map<Key, Record>& writes) {
    if (writes.empty()) {
        return global_version_;
    }
    Version commit_version = ++global_version_;
    store_.putAll(writes);
    for (const auto& pair : writes) {
        key_versions_[pair.first] = commit_version;
    }
    return commit_version;
}

Version OptimisticValidator::currentVersion(Key key) const {
    auto it = key_versions_.find(key);
    return it != key_versions_.end() ? it->second : 0;
}

void OptimisticValidator::snapshotIfAbsent(TransactionTracking& tracking, Key key) const {
    if (tracking.snapshot_versions.find(key) == tracking.snapshot_versions.end()) {
        tracking.snapshot_versions[key] = currentVersion(key);
    }
}

} // namespace txkv
