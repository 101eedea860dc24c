#pragma once

#include "domain/Money.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/BookingStatus.hpp"
#include "domain/enums/BookingType.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>

namespace booking::domain {

/**
 * @brief Строка read model: текущее состояние бронирования
 *
 * Все поля выводятся только из payload событий своего агрегата
 * (версии 1..lastVersion). Команды её напрямую не пишут.
 */
struct BookingRow {
    std::string bookingId;
    std::string aggregateId;
    BookingType bookingType = BookingType::FLIGHT;
    BookingStatus status = BookingStatus::CONFIRMED;

    std::string offerId;
    std::string userId;
    std::string userEmail;

    std::string departure;
    std::string destination;
    std::string departDate;
    std::string returnDate;

    std::string hotelName;
    std::string hotelCity;
    std::string checkIn;
    std::string checkOut;

    Money price;
    int32_t adults = 1;
    std::string paymentMethod;

    int32_t amendmentCount = 0;
    std::string cancellationReason;
    Money refundAmount;

    Timestamp createdAt;
    Timestamp updatedAt;

    std::string lastEventId;
    int64_t lastVersion = 0;

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["booking_id"] = bookingId;
        j["aggregate_id"] = aggregateId;
        j["booking_type"] = toString(bookingType);
        j["status"] = toString(status);
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
        j["amendment_count"] = amendmentCount;
        j["cancellation_reason"] = cancellationReason;
        j["refund_amount"] = refundAmount.toJson();
        j["created_at"] = createdAt.toString();
        j["updated_at"] = updatedAt.toString();
        j["last_event_id"] = lastEventId;
        j["last_version"] = lastVersion;
        return j;
    }

    bool operator==(const BookingRow& o) const {
        return bookingId == o.bookingId
            && aggregateId == o.aggregateId
            && bookingType == o.bookingType
            && status == o.status
            && offerId == o.offerId
            && userId == o.userId
            && userEmail == o.userEmail
            && departure == o.departure
            && destination == o.destination
            && departDate == o.departDate
            && returnDate == o.returnDate
            && hotelName == o.hotelName
            && hotelCity == o.hotelCity
            && checkIn == o.checkIn
            && checkOut == o.checkOut
            && price == o.price
            && adults == o.adults
            && paymentMethod == o.paymentMethod
            && amendmentCount == o.amendmentCount
            && cancellationReason == o.cancellationReason
            && refundAmount == o.refundAmount
            && createdAt == o.createdAt
            && updatedAt == o.updatedAt
            && lastEventId == o.lastEventId
            && lastVersion == o.lastVersion;
    }

    bool operator!=(const BookingRow& o) const {
        return !(*this == o);
    }
};

} // namespace booking::domain
