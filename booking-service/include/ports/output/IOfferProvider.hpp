#pragma once

#include "domain/Offer.hpp"
#include <string>
#include <vector>

namespace booking::ports::output {

/**
 * @brief Внешний провайдер перелётов и отелей
 *
 * Ядро только проверяет предложения перед бронированием
 * и пробрасывает поиск.
 */
class IOfferProvider {
public:
    virtual ~IOfferProvider() = default;

    /**
     * @brief Проверить, что предложение ещё действует
     * @throws ProviderError провайдер недоступен или не ответил вовремя
     */
    virtual domain::OfferValidation validateOffer(const std::string& offerId) = 0;

    /**
     * @brief Поиск предложений (по возрастанию цены)
     * @throws ProviderError
     */
    virtual std::vector<domain::Offer> searchOffers(const domain::SearchCriteria& criteria) = 0;
};

} // namespace booking::ports::output
