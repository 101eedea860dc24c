#pragma once

#include "ports/input/IBookingCommandService.hpp"
#include "ports/input/IBookingQueryService.hpp"
#include "ports/input/IReplayService.hpp"
#include "domain/commands/CommandValidation.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <iostream>
#include <istream>
#include <memory>
#include <ostream>
#include <string>

namespace booking::adapters::primary {

/**
 * @brief Операционный интерфейс: один JSON-запрос на строку stdin,
 *        один JSON-ответ на строку stdout
 *
 * Запрос: {"op": "...", ...}. Операции:
 * - submit  {"kind", "payload"}           — команда
 * - get     {"booking_id" | "aggregate_id"}
 * - list    {"user_id"}
 * - search  {"criteria"}
 * - history {"aggregate_id"}
 * - rebuild {"aggregate_id"?}             — без id перестраивает всё
 * - export  {"from"?, "limit"?}
 * - prune   {"older_than_seconds"}
 *
 * Ответ всегда содержит "ok"; при ошибке — "error" (вид) и "message".
 * Строки журнала компонентов начинаются с '[', ответы — с '{'.
 */
class CommandLineController {
public:
    CommandLineController(
        std::shared_ptr<ports::input::IBookingCommandService> commandService,
        std::shared_ptr<ports::input::IBookingQueryService> queryService,
        std::shared_ptr<ports::input::IReplayService> replayService
    ) : commandService_(std::move(commandService))
      , queryService_(std::move(queryService))
      , replayService_(std::move(replayService))
    {
        std::cout << "[CommandLineController] Created" << std::endl;
    }

    /**
     * @brief Читать запросы до EOF или stop()
     */
    void run(std::istream& in, std::ostream& out) {
        std::cout << "[CommandLineController] Reading requests" << std::endl;
        std::string line;
        while (!stopped_ && std::getline(in, line)) {
            if (line.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }
            out << handleLine(line) << std::endl;
        }
        std::cout << "[CommandLineController] Stopped" << std::endl;
    }

    void stop() {
        stopped_ = true;
    }

    std::string handleLine(const std::string& line) {
        nlohmann::json request;
        try {
            request = nlohmann::json::parse(line);
        } catch (const nlohmann::json::exception&) {
            return error("ValidationError", "Invalid JSON").dump();
        }
        return handle(request).dump();
    }

    nlohmann::json handle(const nlohmann::json& request) {
        if (!request.is_object() || !request.contains("op") || !request["op"].is_string()) {
            return error("ValidationError", "Request must be an object with \"op\"");
        }

        std::string op = request["op"].get<std::string>();
        try {
            if (op == "submit") return submit(request);
            if (op == "get") return get(request);
            if (op == "list") return list(request);
            if (op == "search") return search(request);
            if (op == "history") return history(request);
            if (op == "rebuild") return rebuild(request);
            if (op == "export") return exportEvents(request);
            if (op == "prune") return prune(request);
            return error("ValidationError", "Unknown op: " + op);

        } catch (const domain::BookingException& e) {
            return error(domain::toString(e.kind()), e.what());
        } catch (const nlohmann::json::exception& e) {
            return error("ValidationError", std::string("Invalid request: ") + e.what());
        } catch (const std::exception& e) {
            std::cerr << "[CommandLineController] " << op << " error: " << e.what() << std::endl;
            return error("InternalError", e.what());
        }
    }

private:
    std::shared_ptr<ports::input::IBookingCommandService> commandService_;
    std::shared_ptr<ports::input::IBookingQueryService> queryService_;
    std::shared_ptr<ports::input::IReplayService> replayService_;
    std::atomic<bool> stopped_{false};

    nlohmann::json submit(const nlohmann::json& request) {
        auto payload = request.contains("payload") ? request["payload"] : nlohmann::json::object();
        auto result = commandService_->submitCommand(request.value("kind", ""), payload);

        auto response = result.toJson();
        response["ok"] = result.outcome != domain::CommandOutcome::REJECTED;
        return response;
    }

    nlohmann::json get(const nlohmann::json& request) {
        std::optional<domain::BookingRow> row;
        std::string key;
        if (request.contains("booking_id")) {
            key = request["booking_id"].get<std::string>();
            row = queryService_->getBooking(key);
        } else {
            key = request.value("aggregate_id", "");
            row = queryService_->getBookingByAggregate(key);
        }

        if (!row) {
            return error("NotFound", "Booking not found: " + key);
        }
        return ok({{"booking", row->toJson()}});
    }

    nlohmann::json list(const nlohmann::json& request) {
        nlohmann::json bookings = nlohmann::json::array();
        for (const auto& row : queryService_->listBookings(domain::validation::userIdField(request))) {
            bookings.push_back(row.toJson());
        }
        return ok({{"bookings", bookings}});
    }

    nlohmann::json search(const nlohmann::json& request) {
        auto criteria = domain::SearchCriteria::fromJson(
            request.contains("criteria") ? request["criteria"] : request);

        nlohmann::json offers = nlohmann::json::array();
        for (const auto& offer : queryService_->searchOffers(criteria)) {
            offers.push_back(offer.toJson());
        }
        return ok({{"offers", offers}});
    }

    nlohmann::json history(const nlohmann::json& request) {
        return ok({{"events", toJson(replayService_->history(request.value("aggregate_id", "")))}});
    }

    nlohmann::json rebuild(const nlohmann::json& request) {
        if (request.contains("aggregate_id")) {
            auto row = replayService_->rebuildReadModel(request["aggregate_id"].get<std::string>());
            return ok({{"booking", row.toJson()}});
        }

        auto report = replayService_->rebuildReadModel();
        auto response = report.toJson();
        response["ok"] = report.ok();
        return response;
    }

    nlohmann::json exportEvents(const nlohmann::json& request) {
        int64_t from = request.value("from", int64_t{1});
        size_t limit = request.value("limit", size_t{0});
        return ok({{"events", toJson(replayService_->exportEvents(from, limit))}});
    }

    nlohmann::json prune(const nlohmann::json& request) {
        int64_t olderThanSeconds = request.value("older_than_seconds", int64_t{0});
        if (olderThanSeconds < 0) {
            return error("ValidationError", "older_than_seconds must not be negative");
        }
        auto cutoff = domain::Timestamp::now().addSeconds(-olderThanSeconds);
        return ok({{"removed", replayService_->pruneReadModel(cutoff)}});
    }

    static nlohmann::json toJson(const std::vector<domain::Event>& events) {
        nlohmann::json array = nlohmann::json::array();
        for (const auto& event : events) {
            array.push_back(event.toJson());
        }
        return array;
    }

    static nlohmann::json ok(nlohmann::json body) {
        body["ok"] = true;
        return body;
    }

    static nlohmann::json error(const std::string& kind, const std::string& message) {
        nlohmann::json response;
        response["ok"] = false;
        response["error"] = kind;
        response["message"] = message;
        return response;
    }
};

} // namespace booking::adapters::primary
