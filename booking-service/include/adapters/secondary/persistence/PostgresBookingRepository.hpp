#pragma once

#include "ports/output/IBookingReadRepository.hpp"
#include "adapters/secondary/persistence/PostgresConnectionPool.hpp"
#include "domain/errors/BookingErrors.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace booking::adapters::secondary {

/**
 * @brief Read model в PostgreSQL (таблица booking_read_model)
 *
 * Ключ — booking_id, уникальный индекс на aggregate_id.
 * Суммы хранятся как units/nano, время — в микросекундах с эпохи,
 * чтобы строка после чтения совпадала с исходной побитово.
 */
class PostgresBookingRepository : public ports::output::IBookingReadRepository {
public:
    explicit PostgresBookingRepository(std::shared_ptr<PostgresConnectionPool> pool)
        : pool_(std::move(pool))
    {
        ensureSchema();
        std::cout << "[PostgresBookingRepository] Initialized" << std::endl;
    }

    void ensureSchema() {
        try {
            auto conn = pool_->acquire();
            pqxx::work txn(*conn);
            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS booking_read_model (
                    booking_id VARCHAR(64) PRIMARY KEY,
                    aggregate_id VARCHAR(128) NOT NULL UNIQUE,
                    booking_type VARCHAR(16) NOT NULL,
                    status VARCHAR(16) NOT NULL,
                    offer_id VARCHAR(128) NOT NULL,
                    user_id VARCHAR(128) NOT NULL,
                    user_email VARCHAR(256) NOT NULL DEFAULT '',
                    departure VARCHAR(64) NOT NULL DEFAULT '',
                    destination VARCHAR(64) NOT NULL DEFAULT '',
                    depart_date VARCHAR(10) NOT NULL DEFAULT '',
                    return_date VARCHAR(10) NOT NULL DEFAULT '',
                    hotel_name VARCHAR(256) NOT NULL DEFAULT '',
                    hotel_city VARCHAR(128) NOT NULL DEFAULT '',
                    check_in VARCHAR(10) NOT NULL DEFAULT '',
                    check_out VARCHAR(10) NOT NULL DEFAULT '',
                    price_units BIGINT NOT NULL,
                    price_nano INT NOT NULL,
                    currency VARCHAR(8) NOT NULL,
                    adults INT NOT NULL,
                    payment_method VARCHAR(32) NOT NULL DEFAULT '',
                    amendment_count INT NOT NULL DEFAULT 0,
                    cancellation_reason TEXT NOT NULL DEFAULT '',
                    refund_units BIGINT NOT NULL DEFAULT 0,
                    refund_nano INT NOT NULL DEFAULT 0,
                    refund_currency VARCHAR(8) NOT NULL DEFAULT '',
                    created_at_us BIGINT NOT NULL,
                    updated_at_us BIGINT NOT NULL,
                    last_event_id VARCHAR(64) NOT NULL,
                    last_version BIGINT NOT NULL
                );

                CREATE INDEX IF NOT EXISTS idx_booking_read_model_user
                ON booking_read_model(user_id);
            )");
            txn.commit();
            std::cout << "[PostgresBookingRepository] Schema ready" << std::endl;
        } catch (const domain::BookingException&) {
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresBookingRepository] ensureSchema error: " << e.what() << std::endl;
            throw domain::StorageError(std::string("Read model schema setup failed: ") + e.what());
        }
    }

    void save(const domain::BookingRow& row) override {
        try {
            auto conn = pool_->acquire();
            pqxx::work txn(*conn);
            txn.exec_params(
                "INSERT INTO booking_read_model "
                "(booking_id, aggregate_id, booking_type, status, offer_id, user_id, user_email, "
                " departure, destination, depart_date, return_date, hotel_name, hotel_city, "
                " check_in, check_out, price_units, price_nano, currency, adults, payment_method, "
                " amendment_count, cancellation_reason, refund_units, refund_nano, refund_currency, "
                " created_at_us, updated_at_us, last_event_id, last_version) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15, "
                "        $16, $17, $18, $19, $20, $21, $22, $23, $24, $25, $26, $27, $28, $29) "
                "ON CONFLICT (booking_id) DO UPDATE SET "
                "aggregate_id = EXCLUDED.aggregate_id, booking_type = EXCLUDED.booking_type, "
                "status = EXCLUDED.status, offer_id = EXCLUDED.offer_id, user_id = EXCLUDED.user_id, "
                "user_email = EXCLUDED.user_email, departure = EXCLUDED.departure, "
                "destination = EXCLUDED.destination, depart_date = EXCLUDED.depart_date, "
                "return_date = EXCLUDED.return_date, hotel_name = EXCLUDED.hotel_name, "
                "hotel_city = EXCLUDED.hotel_city, check_in = EXCLUDED.check_in, "
                "check_out = EXCLUDED.check_out, price_units = EXCLUDED.price_units, "
                "price_nano = EXCLUDED.price_nano, currency = EXCLUDED.currency, "
                "adults = EXCLUDED.adults, payment_method = EXCLUDED.payment_method, "
                "amendment_count = EXCLUDED.amendment_count, "
                "cancellation_reason = EXCLUDED.cancellation_reason, "
                "refund_units = EXCLUDED.refund_units, refund_nano = EXCLUDED.refund_nano, "
                "refund_currency = EXCLUDED.refund_currency, created_at_us = EXCLUDED.created_at_us, "
                "updated_at_us = EXCLUDED.updated_at_us, last_event_id = EXCLUDED.last_event_id, "
                "last_version = EXCLUDED.last_version",
                row.bookingId,
                row.aggregateId,
                domain::toString(row.bookingType),
                domain::toString(row.status),
                row.offerId,
                row.userId,
                row.userEmail,
                row.departure,
                row.destination,
                row.departDate,
                row.returnDate,
                row.hotelName,
                row.hotelCity,
                row.checkIn,
                row.checkOut,
                row.price.units,
                row.price.nano,
                row.price.currency,
                row.adults,
                row.paymentMethod,
                row.amendmentCount,
                row.cancellationReason,
                row.refundAmount.units,
                row.refundAmount.nano,
                row.refundAmount.currency,
                row.createdAt.toUnixMicros(),
                row.updatedAt.toUnixMicros(),
                row.lastEventId,
                row.lastVersion);
            txn.commit();
        } catch (const domain::BookingException&) {
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresBookingRepository] save error: " << e.what() << std::endl;
            throw domain::StorageError(std::string("Read model save failed: ") + e.what());
        }
    }

    std::optional<domain::BookingRow> findByBookingId(const std::string& bookingId) override {
        return single("findByBookingId",
            "SELECT * FROM booking_read_model WHERE booking_id = $1", bookingId);
    }

    std::optional<domain::BookingRow> findByAggregateId(const std::string& aggregateId) override {
        return single("findByAggregateId",
            "SELECT * FROM booking_read_model WHERE aggregate_id = $1", aggregateId);
    }

    std::vector<domain::BookingRow> findByUserId(const std::string& userId) override {
        return many("findByUserId",
            "SELECT * FROM booking_read_model WHERE user_id = $1 "
            "ORDER BY created_at_us DESC, booking_id",
            userId);
    }

    std::vector<domain::BookingRow> findAll() override {
        return many("findAll",
            "SELECT * FROM booking_read_model ORDER BY created_at_us, booking_id");
    }

    bool removeByAggregateId(const std::string& aggregateId) override {
        try {
            auto conn = pool_->acquire();
            pqxx::work txn(*conn);
            auto result = txn.exec_params(
                "DELETE FROM booking_read_model WHERE aggregate_id = $1", aggregateId);
            txn.commit();
            return result.affected_rows() > 0;
        } catch (const domain::BookingException&) {
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresBookingRepository] remove error: " << e.what() << std::endl;
            throw domain::StorageError(std::string("Read model remove failed: ") + e.what());
        }
    }

    int64_t count() override {
        try {
            auto conn = pool_->acquire();
            pqxx::work txn(*conn);
            auto result = txn.exec("SELECT COUNT(*) FROM booking_read_model");
            txn.commit();
            return result[0][0].as<int64_t>();
        } catch (const domain::BookingException&) {
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresBookingRepository] count error: " << e.what() << std::endl;
            throw domain::StorageError(std::string("Read model count failed: ") + e.what());
        }
    }

private:
    std::shared_ptr<PostgresConnectionPool> pool_;

    template <typename... Args>
    std::vector<domain::BookingRow> many(const char* operation, const std::string& sql, const Args&... params) {
        try {
            auto conn = pool_->acquire();
            pqxx::work txn(*conn);
            auto result = txn.exec_params(sql, params...);
            txn.commit();

            std::vector<domain::BookingRow> rows;
            rows.reserve(result.size());
            for (const auto& r : result) {
                rows.push_back(rowToBooking(r));
            }
            return rows;
        } catch (const domain::BookingException&) {
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresBookingRepository] " << operation << " error: " << e.what() << std::endl;
            throw domain::StorageError(std::string("Read model ") + operation + " failed: " + e.what());
        }
    }

    template <typename... Args>
    std::optional<domain::BookingRow> single(const char* operation, const std::string& sql, const Args&... params) {
        auto rows = many(operation, sql, params...);
        if (rows.empty()) {
            return std::nullopt;
        }
        return rows.front();
    }

    static domain::BookingRow rowToBooking(const pqxx::row& r) {
        domain::BookingRow row;
        row.bookingId = r["booking_id"].as<std::string>();
        row.aggregateId = r["aggregate_id"].as<std::string>();
        row.bookingType = domain::parseBookingType(r["booking_type"].as<std::string>());
        row.status = domain::parseBookingStatus(r["status"].as<std::string>());
        row.offerId = r["offer_id"].as<std::string>();
        row.userId = r["user_id"].as<std::string>();
        row.userEmail = r["user_email"].as<std::string>();
        row.departure = r["departure"].as<std::string>();
        row.destination = r["destination"].as<std::string>();
        row.departDate = r["depart_date"].as<std::string>();
        row.returnDate = r["return_date"].as<std::string>();
        row.hotelName = r["hotel_name"].as<std::string>();
        row.hotelCity = r["hotel_city"].as<std::string>();
        row.checkIn = r["check_in"].as<std::string>();
        row.checkOut = r["check_out"].as<std::string>();
        row.price = domain::Money(r["price_units"].as<int64_t>(),
                                  r["price_nano"].as<int32_t>(),
                                  r["currency"].as<std::string>());
        row.adults = r["adults"].as<int32_t>();
        row.paymentMethod = r["payment_method"].as<std::string>();
        row.amendmentCount = r["amendment_count"].as<int32_t>();
        row.cancellationReason = r["cancellation_reason"].as<std::string>();
        row.refundAmount = domain::Money(r["refund_units"].as<int64_t>(),
                                         r["refund_nano"].as<int32_t>(),
                                         r["refund_currency"].as<std::string>());
        row.createdAt = domain::Timestamp::fromUnixMicros(r["created_at_us"].as<int64_t>());
        row.updatedAt = domain::Timestamp::fromUnixMicros(r["updated_at_us"].as<int64_t>());
        row.lastEventId = r["last_event_id"].as<std::string>();
        row.lastVersion = r["last_version"].as<int64_t>();
        return row;
    }
};

} // namespace booking::adapters::secondary
