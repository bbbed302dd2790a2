#include "txkv_exception.hpp"
#include "txkv_utils.hpp"
#include <sstream>
using namespace std;

namespace txkv {

TransactionDeadlockException::TransactionDeadlockException(TransactionID tx_id, vector<WaitForEntry> cycle)
    : TransactionException(tx_id, "Transaction " + to_string(tx_id) + " was rolled back as deadlock victim.\n" +
                                      Utils::formatCycle(cycle)),
      cycle_(move(cycle)) {
}

TransactionTimeoutException::TransactionTimeoutException(TransactionID tx_id, Key key, chrono::milliseconds timeout)
    : TransactionException(tx_id, "Transaction " + to_string(tx_id) + " timed out after " +
                                      to_string(timeout.count()) + " ms waiting for lock on key " + to_string(key)),
      key_(key), timeout_(timeout) {
}

static string describeConflict(TransactionID tx_id, const vector<Key>& keys) {
    stringstream ss;
    ss << "Transaction " << tx_id << " failed optimistic validation, conflicting keys: [";
    for (size_t i = 0; i < keys.size(); i++) {
        if (i > 0) {
            ss << ", ";
        }
        ss << keys[i];
    }
    ss << "]";
    return ss.str();
}

TransactionOptimisticException::TransactionOptimisticException(TransactionID tx_id, vector<Key> conflicting_keys)
    : TransactionException(tx_id, describeConflict(tx_id, conflicting_keys)),
      conflicting_keys_(move(conflicting_keys)) {
}

KeyNotFoundException::KeyNotFoundException(TransactionID tx_id, Key key)
    : TransactionException(tx_id, "Key " + to_string(key) + " not found"),
      key_(key) {
}

} // namespace txkv
