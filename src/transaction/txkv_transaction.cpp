#include "transaction/txkv_transaction.hpp"

namespace txkv {

Transaction::Transaction(TransactionID transaction_id, TransactionConcurrency concurrency,
                         TransactionIsolationLevel isolation, std::chrono::milliseconds timeout)
    : transaction_id_(transaction_id), concurrency_(concurrency), isolation_(isolation), timeout_(timeout) {
}

Transaction::~Transaction() {
}

std::optional<Record> Transaction::findLocal(Key key) const {
    auto write_it = write_set_.find(key);
    if (write_it != write_set_.end()) {
        return write_it->second;
    }
    auto read_it = read_cache_.find(key);
    if (read_it != read_cache_.end()) {
        return read_it->second;
    }
    return std::nullopt;
}

void Transaction::cacheRead(const Record& record) {
    read_cache_.insert_or_assign(record.getId(), record);
}

void Transaction::bufferWrite(const Record& record) {
    write_set_.insert_or_assign(record.getId(), record);
}

void Transaction::addHeldLock(Key key) {
    held_locks_.insert(key);
}

bool Transaction::holdsLock(Key key) const {
    return held_locks_.find(key) != held_locks_.end();
}

void Transaction::clearHeldLocks() {
    held_locks_.clear();
}

} // namespace txkv
