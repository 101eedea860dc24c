#pragma once

#include "ports/output/IEventLog.hpp"
#include "adapters/secondary/persistence/PostgresConnectionPool.hpp"
#include "domain/errors/BookingErrors.hpp"
#include "utils/UuidGenerator.hpp"
#include <pqxx/pqxx>
#include <algorithm>
#include <iostream>
#include <memory>

namespace booking::adapters::secondary {

/**
 * @brief Журнал событий в PostgreSQL
 *
 * Таблица booking_events: position (BIGSERIAL) — глобальный порядок,
 * (aggregate_id, version) уникальна. Время хранится в микросекундах
 * с эпохи, payload — JSONB.
 *
 * append() блокирует только свой агрегат (advisory-блокировка по
 * hashtext(aggregate_id)) на время проверки версии, так что разные
 * агрегаты не ждут друг друга. Глобальная блокировка берётся лишь
 * на вставку и фиксацию: позиции выдаются в порядке фиксации, поэтому
 * readAll() можно возобновлять с последней прочитанной позиции.
 */
class PostgresEventLog : public ports::output::IEventLog {
public:
    static constexpr int32_t AGGREGATE_LOCK_CLASS = 0x426b;
    static constexpr int64_t POSITION_LOCK_KEY = 0x426b4576;

    explicit PostgresEventLog(std::shared_ptr<PostgresConnectionPool> pool)
        : pool_(std::move(pool))
    {
        ensureSchema();
        std::cout << "[PostgresEventLog] Initialized" << std::endl;
    }

    /**
     * @brief Создать таблицу журнала, если её нет
     */
    void ensureSchema() {
        try {
            auto conn = pool_->acquire();
            pqxx::work txn(*conn);
            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS booking_events (
                    position BIGSERIAL PRIMARY KEY,
                    event_id VARCHAR(64) NOT NULL UNIQUE,
                    aggregate_id VARCHAR(128) NOT NULL,
                    event_type VARCHAR(64) NOT NULL,
                    version BIGINT NOT NULL,
                    schema_version INT NOT NULL DEFAULT 1,
                    occurred_at_us BIGINT NOT NULL,
                    payload JSONB NOT NULL,
                    command_id VARCHAR(128) NOT NULL DEFAULT '',
                    UNIQUE (aggregate_id, version)
                );

                CREATE INDEX IF NOT EXISTS idx_booking_events_command
                ON booking_events(aggregate_id, command_id);
            )");
            txn.commit();
            std::cout << "[PostgresEventLog] Schema ready" << std::endl;
        } catch (const domain::BookingException&) {
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresEventLog] ensureSchema error: " << e.what() << std::endl;
            throw domain::StorageError(std::string("Event log schema setup failed: ") + e.what());
        }
    }

    std::vector<domain::Event> append(
        const std::string& aggregateId,
        int64_t expectedVersion,
        const std::vector<domain::EventDraft>& drafts) override
    {
        try {
            auto conn = pool_->acquire();
            pqxx::work txn(*conn);

            txn.exec_params("SELECT pg_advisory_xact_lock($1, hashtext($2))",
                            AGGREGATE_LOCK_CLASS, aggregateId);

            auto head = txn.exec_params(
                "SELECT COALESCE(MAX(version), 0), COALESCE(MAX(occurred_at_us), 0) "
                "FROM booking_events WHERE aggregate_id = $1",
                aggregateId);
            int64_t actual = head[0][0].as<int64_t>();
            int64_t floorMicros = head[0][1].as<int64_t>();

            if (actual != expectedVersion) {
                std::cerr << "[PostgresEventLog] Conflict on " << aggregateId
                          << ": expected " << expectedVersion << ", actual " << actual << std::endl;
                throw domain::ConcurrencyConflictError(aggregateId, expectedVersion, actual);
            }

            // Удерживается до commit: следующая транзакция получит позицию
            // только после того, как эта станет видимой
            txn.exec_params("SELECT pg_advisory_xact_lock($1)", POSITION_LOCK_KEY);

            std::vector<domain::Event> appended;
            appended.reserve(drafts.size());
            for (size_t i = 0; i < drafts.size(); ++i) {
                const auto& draft = drafts[i];
                domain::Event event;
                event.eventId = utils::UuidGenerator::generate();
                event.aggregateId = aggregateId;
                event.eventType = draft.eventType;
                event.version = expectedVersion + static_cast<int64_t>(i) + 1;
                event.timestamp = domain::Timestamp::fromUnixMicros(
                    std::max(domain::Timestamp::now().toUnixMicros(), floorMicros));
                event.schemaVersion = draft.schemaVersion;
                event.payload = draft.payload;
                event.commandId = draft.commandId;
                floorMicros = event.timestamp.toUnixMicros();

                auto inserted = txn.exec_params(
                    "INSERT INTO booking_events "
                    "(event_id, aggregate_id, event_type, version, schema_version, "
                    " occurred_at_us, payload, command_id) "
                    "VALUES ($1, $2, $3, $4, $5, $6, $7::jsonb, $8) "
                    "RETURNING position",
                    event.eventId,
                    event.aggregateId,
                    event.eventType,
                    event.version,
                    event.schemaVersion,
                    event.timestamp.toUnixMicros(),
                    event.payload.dump(),
                    event.commandId);
                event.position = inserted[0][0].as<int64_t>();
                appended.push_back(std::move(event));
            }

            txn.commit();
            return appended;

        } catch (const domain::BookingException&) {
            throw;
        } catch (const pqxx::unique_violation& e) {
            std::cerr << "[PostgresEventLog] Version already taken on " << aggregateId
                      << ": " << e.what() << std::endl;
            throw domain::ConcurrencyConflictError(aggregateId, expectedVersion, expectedVersion + 1);
        } catch (const std::exception& e) {
            std::cerr << "[PostgresEventLog] append error: " << e.what() << std::endl;
            throw domain::StorageError(std::string("Append failed: ") + e.what());
        }
    }

    std::vector<domain::Event> read(const std::string& aggregateId, int64_t fromVersion) override {
        return query("read", [&](pqxx::work& txn) {
            return txn.exec_params(
                "SELECT " + COLUMNS + " FROM booking_events "
                "WHERE aggregate_id = $1 AND version >= $2 ORDER BY version",
                aggregateId, fromVersion);
        });
    }

    std::vector<domain::Event> readAll(int64_t fromPosition, size_t limit) override {
        return query("readAll", [&](pqxx::work& txn) {
            if (limit == 0) {
                return txn.exec_params(
                    "SELECT " + COLUMNS + " FROM booking_events "
                    "WHERE position >= $1 ORDER BY position",
                    fromPosition);
            }
            return txn.exec_params(
                "SELECT " + COLUMNS + " FROM booking_events "
                "WHERE position >= $1 ORDER BY position LIMIT $2",
                fromPosition, static_cast<int64_t>(limit));
        });
    }

    int64_t currentVersion(const std::string& aggregateId) override {
        return scalar("currentVersion",
            "SELECT COALESCE(MAX(version), 0) FROM booking_events WHERE aggregate_id = $1",
            aggregateId);
    }

    int64_t count() override {
        return scalar("count", "SELECT COUNT(*) FROM booking_events");
    }

private:
    inline static const std::string COLUMNS =
        "position, event_id, aggregate_id, event_type, version, schema_version, "
        "occurred_at_us, payload, command_id";

    std::shared_ptr<PostgresConnectionPool> pool_;

    template <typename F>
    std::vector<domain::Event> query(const char* operation, F statement) {
        try {
            auto conn = pool_->acquire();
            pqxx::work txn(*conn);
            auto result = statement(txn);
            txn.commit();

            std::vector<domain::Event> events;
            events.reserve(result.size());
            for (const auto& row : result) {
                events.push_back(rowToEvent(row));
            }
            return events;
        } catch (const domain::BookingException&) {
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresEventLog] " << operation << " error: " << e.what() << std::endl;
            throw domain::StorageError(std::string("Event log ") + operation + " failed: " + e.what());
        }
    }

    template <typename... Args>
    int64_t scalar(const char* operation, const std::string& sql, const Args&... params) {
        try {
            auto conn = pool_->acquire();
            pqxx::work txn(*conn);
            auto result = txn.exec_params(sql, params...);
            txn.commit();
            return result[0][0].as<int64_t>();
        } catch (const domain::BookingException&) {
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresEventLog] " << operation << " error: " << e.what() << std::endl;
            throw domain::StorageError(std::string("Event log ") + operation + " failed: " + e.what());
        }
    }

    static domain::Event rowToEvent(const pqxx::row& row) {
        domain::Event event;
        event.position = row["position"].as<int64_t>();
        event.eventId = row["event_id"].as<std::string>();
        event.aggregateId = row["aggregate_id"].as<std::string>();
        event.eventType = row["event_type"].as<std::string>();
        event.version = row["version"].as<int64_t>();
        event.schemaVersion = row["schema_version"].as<int>();
        event.timestamp = domain::Timestamp::fromUnixMicros(row["occurred_at_us"].as<int64_t>());
        event.payload = nlohmann::json::parse(row["payload"].as<std::string>());
        event.commandId = row["command_id"].as<std::string>();
        return event;
    }
};

} // namespace booking::adapters::secondary
