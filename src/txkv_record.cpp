#include "txkv_record.hpp"
#include "txkv_utils.hpp"

namespace txkv {

std::string Record::toString() const {
    return "Record [id=" + std::to_string(id_) + ", balance=$" + Utils::formatAmount(balance_) + "]";
}

} // namespace txkv
