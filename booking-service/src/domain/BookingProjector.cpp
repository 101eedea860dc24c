#include "domain/BookingProjector.hpp"
#include "domain/events/BookingEvent.hpp"
#include "domain/errors/BookingErrors.hpp"

namespace booking::domain {

namespace {

/**
 * @brief Свёртка одного события нужного вида
 *
 * Перегрузка есть для каждой альтернативы BookingEvent, поэтому новый вид
 * события без своей свёртки не скомпилируется.
 */
struct RowFolder {
    const std::optional<BookingRow>& current;
    const Event& event;

    BookingRow operator()(const BookingConfirmed& e) const {
        if (current) {
            fail("duplicate BookingConfirmed for existing booking " + current->bookingId);
        }

        BookingRow row;
        row.bookingId = e.bookingId;
        row.aggregateId = event.aggregateId;
        row.bookingType = e.bookingType;
        row.status = BookingStatus::CONFIRMED;
        row.offerId = e.offerId;
        row.userId = e.userId;
        row.userEmail = e.userEmail;
        row.departure = e.departure;
        row.destination = e.destination;
        row.departDate = e.departDate;
        row.returnDate = e.returnDate;
        row.hotelName = e.hotelName;
        row.hotelCity = e.hotelCity;
        row.checkIn = e.checkIn;
        row.checkOut = e.checkOut;
        row.price = e.price;
        row.adults = e.adults;
        row.paymentMethod = e.paymentMethod;
        row.refundAmount = Money(0, 0, e.price.currency);
        row.createdAt = event.timestamp;
        return row;
    }

    BookingRow operator()(const BookingAmended& e) const {
        BookingRow row = existing();
        if (isTerminal(row.status)) {
            fail("BookingAmended after terminal status " + toString(row.status));
        }

        if (e.departDate) row.departDate = *e.departDate;
        if (e.returnDate) row.returnDate = *e.returnDate;
        if (e.checkIn) row.checkIn = *e.checkIn;
        if (e.checkOut) row.checkOut = *e.checkOut;
        if (e.adults) row.adults = *e.adults;
        row.amendmentCount++;
        return row;
    }

    BookingRow operator()(const BookingCancelled& e) const {
        BookingRow row = existing();
        if (isTerminal(row.status)) {
            fail("BookingCancelled after terminal status " + toString(row.status));
        }

        row.status = BookingStatus::CANCELLED;
        row.cancellationReason = e.reason;
        row.refundAmount = e.refundAmount;
        return row;
    }

private:
    const BookingRow& existing() const {
        if (!current) {
            fail("stream does not start with BookingConfirmed");
        }
        return *current;
    }

    [[noreturn]] void fail(const std::string& reason) const {
        throw ProjectionFailureError(event.aggregateId, event.eventId, reason);
    }
};

} // namespace

BookingRow BookingProjector::apply(const std::optional<BookingRow>& current, const Event& event) {
    if (current && event.version <= current->lastVersion) {
        return *current;
    }

    int64_t expected = current ? current->lastVersion + 1 : 1;
    if (event.version != expected) {
        throw ProjectionFailureError(event.aggregateId, event.eventId,
            "version gap: expected " + std::to_string(expected) +
            ", got " + std::to_string(event.version));
    }

    BookingEvent decoded = decodeEvent(event);
    BookingRow row = std::visit(RowFolder{current, event}, decoded);

    row.updatedAt = event.timestamp;
    row.lastEventId = event.eventId;
    row.lastVersion = event.version;
    return row;
}

std::optional<BookingRow> BookingProjector::fold(std::optional<BookingRow> current,
                                                 const std::vector<Event>& events) {
    for (const auto& event : events) {
        current = apply(current, event);
    }
    return current;
}

} // namespace booking::domain
