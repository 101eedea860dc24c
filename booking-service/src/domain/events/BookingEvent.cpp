#include "domain/events/BookingEvent.hpp"
#include "domain/errors/BookingErrors.hpp"

namespace booking::domain {

std::string eventTypeOf(const BookingEvent& event) {
    return std::visit([](const auto& e) -> std::string {
        return std::decay_t<decltype(e)>::TYPE;
    }, event);
}

EventDraft toDraft(const BookingEvent& event, const std::string& commandId) {
    return std::visit([&commandId](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        EventDraft draft;
        draft.eventType = T::TYPE;
        draft.schemaVersion = T::SCHEMA_VERSION;
        draft.payload = e.toPayload();
        draft.commandId = commandId;
        return draft;
    }, event);
}

BookingEvent decodeEvent(const Event& event) {
    if (event.eventType == BookingConfirmed::TYPE) {
        return BookingConfirmed::fromPayload(event.payload, event.schemaVersion);
    }
    if (event.eventType == BookingAmended::TYPE) {
        return BookingAmended::fromPayload(event.payload, event.schemaVersion);
    }
    if (event.eventType == BookingCancelled::TYPE) {
        return BookingCancelled::fromPayload(event.payload, event.schemaVersion);
    }
    throw UnknownEventTypeError(event.eventType);
}

} // namespace booking::domain
