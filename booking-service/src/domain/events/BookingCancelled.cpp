#include "domain/events/BookingCancelled.hpp"

namespace booking::domain {

nlohmann::json BookingCancelled::toPayload() const {
    nlohmann::json j;
    j["reason"] = reason;
    j["refund_amount"] = refundAmount.toJson();
    return j;
}

BookingCancelled BookingCancelled::fromPayload(const nlohmann::json& j, int /*schemaVersion*/) {
    BookingCancelled e;
    e.reason = j.value("reason", "");
    if (j.contains("refund_amount") && j["refund_amount"].is_object()) {
        e.refundAmount = Money::fromJson(j["refund_amount"]);
    }
    return e;
}

} // namespace booking::domain
