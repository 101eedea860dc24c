#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>

/**
 * @file BookingErrors.hpp
 * @brief Исключения командной и проекционной части
 */

namespace booking::domain {

/**
 * @brief Категория ошибки, видимая вызывающей стороне
 */
enum class ErrorKind {
    VALIDATION,
    OFFER_UNAVAILABLE,
    INVALID_STATE_TRANSITION,
    CONCURRENCY_CONFLICT,
    STORAGE,
    PROJECTION_FAILURE,
    PROVIDER,
    UNKNOWN_EVENT_TYPE,
    NOT_FOUND
};

inline std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION: return "ValidationError";
        case ErrorKind::OFFER_UNAVAILABLE: return "OfferUnavailable";
        case ErrorKind::INVALID_STATE_TRANSITION: return "InvalidStateTransition";
        case ErrorKind::CONCURRENCY_CONFLICT: return "ConcurrencyConflict";
        case ErrorKind::STORAGE: return "StorageError";
        case ErrorKind::PROJECTION_FAILURE: return "ProjectionFailure";
        case ErrorKind::PROVIDER: return "ProviderError";
        case ErrorKind::UNKNOWN_EVENT_TYPE: return "UnknownEventType";
        case ErrorKind::NOT_FOUND: return "NotFound";
        default: return "Unknown";
    }
}

/**
 * @brief Базовое исключение доменных ошибок
 */
class BookingException : public std::runtime_error {
public:
    BookingException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

    /**
     * @brief Можно ли повторить команду целиком без ручного вмешательства
     */
    virtual bool isRetryable() const { return false; }

private:
    ErrorKind kind_;
};

/**
 * @brief Неверная форма команды (до обращения к журналу)
 */
class ValidationError : public BookingException {
public:
    explicit ValidationError(const std::string& message)
        : BookingException(ErrorKind::VALIDATION, message) {}
};

class OfferUnavailableError : public BookingException {
public:
    OfferUnavailableError(const std::string& offerId, const std::string& reason)
        : BookingException(ErrorKind::OFFER_UNAVAILABLE,
                           "Offer " + offerId + " unavailable: " + reason)
        , offerId_(offerId) {}

    const std::string& offerId() const { return offerId_; }

private:
    std::string offerId_;
};

class InvalidStateTransitionError : public BookingException {
public:
    explicit InvalidStateTransitionError(const std::string& message)
        : BookingException(ErrorKind::INVALID_STATE_TRANSITION, message) {}
};

/**
 * @brief Проигрыш оптимистической блокировки
 *
 * Журнал не изменён; вызывающий должен перечитать состояние и повторить.
 */
class ConcurrencyConflictError : public BookingException {
public:
    ConcurrencyConflictError(const std::string& aggregateId, int64_t expected, int64_t actual)
        : BookingException(ErrorKind::CONCURRENCY_CONFLICT,
                           "Concurrency conflict on " + aggregateId +
                           ": expected version " + std::to_string(expected) +
                           ", actual " + std::to_string(actual))
        , aggregateId_(aggregateId)
        , expectedVersion_(expected)
        , actualVersion_(actual) {}

    const std::string& aggregateId() const { return aggregateId_; }
    int64_t expectedVersion() const { return expectedVersion_; }
    int64_t actualVersion() const { return actualVersion_; }

    bool isRetryable() const override { return true; }

private:
    std::string aggregateId_;
    int64_t expectedVersion_;
    int64_t actualVersion_;
};

/**
 * @brief Ошибка долговременного хранилища; ничего не записано
 */
class StorageError : public BookingException {
public:
    explicit StorageError(const std::string& message)
        : BookingException(ErrorKind::STORAGE, message) {}

    bool isRetryable() const override { return true; }
};

/**
 * @brief Событие записано, но свёртка в read model не удалась
 */
class ProjectionFailureError : public BookingException {
public:
    ProjectionFailureError(const std::string& aggregateId,
                           const std::string& eventId,
                           const std::string& reason)
        : BookingException(ErrorKind::PROJECTION_FAILURE,
                           "Projection failed for " + aggregateId +
                           (eventId.empty() ? std::string() : " at event " + eventId) +
                           ": " + reason)
        , aggregateId_(aggregateId)
        , eventId_(eventId) {}

    const std::string& aggregateId() const { return aggregateId_; }
    const std::string& eventId() const { return eventId_; }

private:
    std::string aggregateId_;
    std::string eventId_;
};

class ProviderError : public BookingException {
public:
    explicit ProviderError(const std::string& message)
        : BookingException(ErrorKind::PROVIDER, message) {}
};

class UnknownEventTypeError : public BookingException {
public:
    explicit UnknownEventTypeError(const std::string& eventType)
        : BookingException(ErrorKind::UNKNOWN_EVENT_TYPE, "Unknown event type: " + eventType)
        , eventType_(eventType) {}

    const std::string& eventType() const { return eventType_; }

private:
    std::string eventType_;
};

class NotFoundError : public BookingException {
public:
    explicit NotFoundError(const std::string& message)
        : BookingException(ErrorKind::NOT_FOUND, message) {}
};

} // namespace booking::domain
