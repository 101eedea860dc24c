#pragma once

#include "ports/input/IBookingCommandService.hpp"
#include "ports/input/IBookingQueryService.hpp"
#include "ports/input/IReplayService.hpp"
#include "adapters/primary/CommandLineController.hpp"
#include "adapters/secondary/persistence/PostgresConnectionPool.hpp"
#include "adapters/secondary/provider/TimeoutOfferProvider.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace booking {

/**
 * @brief Booking Service Application
 *
 * Композиция через Boost.DI: хранилище (memory или postgres) выбирается
 * по BOOKING_STORAGE, провайдер всегда обёрнут в таймаут.
 *
 * Режимы запуска:
 * - без аргументов: JSON-запросы из stdin до EOF или сигнала
 * - rebuild [aggregateId]: перестроить read model
 * - export [fromPosition]: выгрузить журнал в JSON lines
 */
class BookingApp {
public:
    BookingApp();
    ~BookingApp();

    BookingApp(const BookingApp&) = delete;
    BookingApp& operator=(const BookingApp&) = delete;

    /**
     * @brief Собрать граф объектов и выполнить режим из argv
     * @return код завершения процесса
     */
    int run(int argc, char* argv[]);

    /**
     * @brief Остановить чтение запросов (вызывается из обработчика сигнала)
     */
    void stop();

    /**
     * @brief Явное завершение: остановить контроллер, пул вызовов провайдера
     *        и пул соединений
     */
    void shutdown();

private:
    std::shared_ptr<ports::input::IBookingCommandService> commandService_;
    std::shared_ptr<ports::input::IBookingQueryService> queryService_;
    std::shared_ptr<ports::input::IReplayService> replayService_;
    std::shared_ptr<adapters::primary::CommandLineController> controller_;
    std::shared_ptr<adapters::secondary::PostgresConnectionPool> pool_;
    std::shared_ptr<adapters::secondary::TimeoutOfferProvider> provider_;

    void configureInjection();

    template <typename Injector>
    void resolveServices(Injector& injector);

    int serve();
    int rebuild(const std::vector<std::string>& args);
    int exportEvents(const std::vector<std::string>& args);
};

} // namespace booking
