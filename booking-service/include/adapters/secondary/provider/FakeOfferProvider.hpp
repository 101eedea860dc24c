#pragma once

#include "ports/output/IOfferProvider.hpp"
#include "domain/errors/BookingErrors.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <functional>
#include <iostream>
#include <iterator>
#include <mutex>
#include <random>
#include <thread>
#include <unordered_map>

namespace booking::adapters::secondary {

/**
 * @brief Встроенный каталог предложений вместо внешнего провайдера
 *
 * Результаты поиска детерминированы: генератор засевается критериями,
 * поэтому одинаковый запрос всегда даёт одни и те же предложения.
 * Найденные предложения регистрируются в каталоге, чтобы последующий
 * validateOffer() их видел.
 *
 * @example
 * ```cpp
 * auto provider = std::make_shared<FakeOfferProvider>("EUR");
 * provider->addOffer(offer);                  // OFR-1, 250 EUR, 2 места
 * auto v = provider->validateOffer("OFR-1");  // {valid, 250, 2}
 * ```
 */
class FakeOfferProvider : public ports::output::IOfferProvider {
public:
    static constexpr int OFFERS_PER_SEARCH = 10;
    static constexpr double BASE_PRICE = 300.0;

    explicit FakeOfferProvider(
        const std::string& currency = "EUR",
        std::chrono::milliseconds latency = std::chrono::milliseconds{0})
        : currency_(currency)
        , latency_(latency)
    {
        std::cout << "[FakeOfferProvider] Created (currency=" << currency_
                  << ", latency=" << latency_.count() << "ms)" << std::endl;
    }

    // ============================================
    // УПРАВЛЕНИЕ КАТАЛОГОМ
    // ============================================

    void addOffer(const domain::Offer& offer) {
        std::lock_guard<std::mutex> lock(mutex_);
        offers_[offer.offerId] = offer;
    }

    /**
     * @brief Изменить число свободных мест (0 — распродано)
     * @return false если предложения нет в каталоге
     */
    bool setCapacity(const std::string& offerId, int32_t capacity) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = offers_.find(offerId);
        if (it == offers_.end()) {
            return false;
        }
        it->second.capacity = capacity;
        return true;
    }

    bool removeOffer(const std::string& offerId) {
        std::lock_guard<std::mutex> lock(mutex_);
        return offers_.erase(offerId) > 0;
    }

    void setLatency(std::chrono::milliseconds latency) {
        std::lock_guard<std::mutex> lock(mutex_);
        latency_ = latency;
    }

    // ============================================
    // IOfferProvider
    // ============================================

    domain::OfferValidation validateOffer(const std::string& offerId) override {
        simulateLatency();

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = offers_.find(offerId);
        if (it == offers_.end()) {
            std::cout << "[FakeOfferProvider] Unknown offer " << offerId << std::endl;
            return domain::OfferValidation(false, domain::Money(0, 0, currency_), 0);
        }
        return domain::OfferValidation(true, it->second.price, it->second.capacity);
    }

    std::vector<domain::Offer> searchOffers(const domain::SearchCriteria& criteria) override {
        if (criteria.origin.size() < 2 || criteria.destination.size() < 2) {
            throw domain::ProviderError("origin and destination are required for search");
        }

        simulateLatency();

        std::mt19937 rng(seedFor(criteria));
        std::uniform_int_distribution<int> priceDist(0, 40000);    // центы
        std::uniform_int_distribution<int> capacityDist(0, 9);
        static const char* CARRIERS[] = {"Air France", "Lufthansa", "KLM", "Iberia", "easyJet"};

        std::vector<domain::Offer> result;
        for (int i = 1; i <= OFFERS_PER_SEARCH; ++i) {
            domain::Offer offer;
            offer.offerId = upper(criteria.origin) + "-" + upper(criteria.destination) + "-" +
                            compactDate(criteria.departDate) + "-" + std::to_string(i);
            offer.origin = criteria.origin;
            offer.destination = criteria.destination;
            offer.departDate = criteria.departDate;
            offer.returnDate = criteria.returnDate;
            offer.carrier = CARRIERS[rng() % 5];

            int cents = static_cast<int>(BASE_PRICE * 100) + priceDist(rng);
            offer.price = domain::Money(cents / 100, (cents % 100) * 10000000, currency_);
            offer.capacity = capacityDist(rng);

            if (offer.capacity < criteria.adults) continue;
            if (criteria.maxPrice && offer.price.toDouble() > *criteria.maxPrice) continue;
            result.push_back(offer);
        }

        std::sort(result.begin(), result.end(),
            [](const domain::Offer& a, const domain::Offer& b) {
                if (a.price.units != b.price.units) return a.price.units < b.price.units;
                if (a.price.nano != b.price.nano) return a.price.nano < b.price.nano;
                return a.offerId < b.offerId;
            });

        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& offer : result) {
                offers_.emplace(offer.offerId, offer);
            }
        }

        std::cout << "[FakeOfferProvider] Search " << criteria.origin << " -> "
                  << criteria.destination << ": " << result.size() << " offers" << std::endl;
        return result;
    }

private:
    std::string currency_;
    std::chrono::milliseconds latency_;
    std::mutex mutex_;
    std::unordered_map<std::string, domain::Offer> offers_;

    void simulateLatency() {
        std::chrono::milliseconds latency;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            latency = latency_;
        }
        if (latency.count() > 0) {
            std::this_thread::sleep_for(latency);
        }
    }

    static uint32_t seedFor(const domain::SearchCriteria& c) {
        std::string key = c.origin + "|" + c.destination + "|" + c.departDate + "|" + c.returnDate;
        return static_cast<uint32_t>(std::hash<std::string>{}(key));
    }

    static std::string upper(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
            [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
        return value;
    }

    static std::string compactDate(const std::string& date) {
        std::string out;
        std::copy_if(date.begin(), date.end(), std::back_inserter(out),
            [](char ch) { return ch != '-'; });
        return out;
    }
};

} // namespace booking::adapters::secondary
