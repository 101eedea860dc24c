#include "domain/events/BookingConfirmed.hpp"

namespace booking::domain {

nlohmann::json BookingConfirmed::toPayload() const {
    nlohmann::json j;
    j["booking_id"] = bookingId;
    j["booking_type"] = toString(bookingType);
    j["offer_id"] = offerId;
    j["user_id"] = userId;
    j["user_email"] = userEmail;
    j["departure"] = departure;
    j["destination"] = destination;
    j["depart_date"] = departDate;
    j["return_date"] = returnDate;
    j["hotel_name"] = hotelName;
    j["hotel_city"] = hotelCity;
    j["check_in"] = checkIn;
    j["check_out"] = checkOut;
    j["price"] = price.toJson();
    j["adults"] = adults;
    j["payment_method"] = paymentMethod;
    return j;
}

BookingConfirmed BookingConfirmed::fromPayload(const nlohmann::json& j, int schemaVersion) {
    BookingConfirmed e;
    e.bookingId = j.at("booking_id").get<std::string>();
    e.bookingType = parseBookingType(j.value("booking_type", std::string("FLIGHT")));
    e.offerId = j.value("offer_id", "");
    e.userId = j.value("user_id", "");
    e.userEmail = j.value("user_email", "");
    e.departure = j.value("departure", "");
    e.destination = j.value("destination", "");
    e.departDate = j.value("depart_date", "");
    e.returnDate = j.value("return_date", "");
    e.hotelName = j.value("hotel_name", "");
    e.hotelCity = j.value("hotel_city", "");
    e.checkIn = j.value("check_in", "");
    e.checkOut = j.value("check_out", "");
    e.adults = j.value("adults", int32_t{1});
    e.paymentMethod = j.value("payment_method", std::string("credit_card"));

    if (schemaVersion <= 1) {
        // v1: "price": 299.99, "currency": "EUR"
        e.price = Money::fromDouble(j.value("price", 0.0), j.value("currency", std::string("EUR")));
    } else {
        e.price = Money::fromJson(j.at("price"));
    }

    return e;
}

} // namespace booking::domain
