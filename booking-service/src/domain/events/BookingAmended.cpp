#include "domain/events/BookingAmended.hpp"

namespace booking::domain {

namespace {

template <typename T>
std::optional<T> optionalField(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<T>();
}

} // namespace

nlohmann::json BookingAmended::toPayload() const {
    nlohmann::json j = nlohmann::json::object();
    if (departDate) j["depart_date"] = *departDate;
    if (returnDate) j["return_date"] = *returnDate;
    if (checkIn) j["check_in"] = *checkIn;
    if (checkOut) j["check_out"] = *checkOut;
    if (adults) j["adults"] = *adults;
    j["reason"] = reason;
    return j;
}

BookingAmended BookingAmended::fromPayload(const nlohmann::json& j, int /*schemaVersion*/) {
    BookingAmended e;
    e.departDate = optionalField<std::string>(j, "depart_date");
    e.returnDate = optionalField<std::string>(j, "return_date");
    e.checkIn = optionalField<std::string>(j, "check_in");
    e.checkOut = optionalField<std::string>(j, "check_out");
    e.adults = optionalField<int32_t>(j, "adults");
    e.reason = j.value("reason", "");
    return e;
}

} // namespace booking::domain
