#include "Reading.hpp"
#include <unordered_map>

namespace datalogger {

std::vector<std::uint64_t> Batch::sequenceNumbers() const {
    std::vector<std::uint64_t> seqs;
    seqs.reserve(records.size());
    for (const auto& record : records) {
        seqs.push_back(record.sequenceNumber);
    }
    return seqs;
}

std::string deliveryStateToString(DeliveryState state) {
    switch (state) {
        case DeliveryState::Pending: return "pending";
        case DeliveryState::InFlight: return "inflight";
        case DeliveryState::Delivered: return "delivered";
        case DeliveryState::Failed: return "failed";
        default: return "unknown";
    }
}

DeliveryState stringToDeliveryState(const std::string& str) {
    static const std::unordered_map<std::string, DeliveryState> stateMap = {
        {"pending", DeliveryState::Pending},
        {"inflight", DeliveryState::InFlight},
        {"delivered", DeliveryState::Delivered},
        {"failed", DeliveryState::Failed}
    };

    auto it = stateMap.find(str);
    return (it != stateMap.end()) ? it->second : DeliveryState::Pending;
}

} // namespace datalogger
