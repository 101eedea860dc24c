#include "BookingApp.hpp"

#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/StorageSettings.hpp"
#include "settings/ProviderSettings.hpp"

// Application
#include "application/ProjectionEngine.hpp"
#include "application/CommandPipeline.hpp"
#include "application/handlers/CreateBookingHandler.hpp"
#include "application/handlers/AmendBookingHandler.hpp"
#include "application/handlers/CancelBookingHandler.hpp"
#include "application/BookingCommandService.hpp"
#include "application/BookingQueryService.hpp"
#include "application/ReplayService.hpp"

// Secondary Adapters
#include "adapters/secondary/persistence/InMemoryEventLog.hpp"
#include "adapters/secondary/persistence/InMemoryBookingRepository.hpp"
#include "adapters/secondary/persistence/PostgresEventLog.hpp"
#include "adapters/secondary/persistence/PostgresBookingRepository.hpp"
#include "adapters/secondary/provider/FakeOfferProvider.hpp"
#include "adapters/secondary/provider/TimeoutOfferProvider.hpp"

namespace di = boost::di;

namespace booking {

BookingApp::BookingApp() {
    std::cout << "[BookingApp] Application created" << std::endl;
}

BookingApp::~BookingApp() {
    shutdown();
    std::cout << "[BookingApp] Application destroyed" << std::endl;
}

int BookingApp::run(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    configureInjection();

    if (args.empty()) {
        return serve();
    }
    if (args[0] == "rebuild") {
        return rebuild(args);
    }
    if (args[0] == "export") {
        return exportEvents(args);
    }

    std::cerr << "Usage: booking-service [rebuild [aggregateId] | export [fromPosition]]" << std::endl;
    return 2;
}

void BookingApp::stop() {
    if (controller_) {
        controller_->stop();
    }
}

void BookingApp::shutdown() {
    stop();
    if (provider_) {
        provider_->shutdown();
    }
    if (pool_) {
        pool_->shutdown();
    }
}

void BookingApp::configureInjection() {
    std::cout << "[BookingApp] Configuring Boost.DI injection..." << std::endl;

    settings::StorageSettings storage;
    settings::ProviderSettings providerSettings;

    // Провайдер собирается вручную: декоратор получает делегата, таймаут
    // и размер пула; приложение закрывает его при shutdown()
    provider_ = std::make_shared<adapters::secondary::TimeoutOfferProvider>(
        std::make_shared<adapters::secondary::FakeOfferProvider>(
            providerSettings.getCurrency(), providerSettings.getLatency()),
        providerSettings.getTimeout(),
        providerSettings.getWorkers(),
        providerSettings.getQueueCapacity());
    std::shared_ptr<ports::output::IOfferProvider> provider = provider_;

    if (storage.usePostgres()) {
        auto injector = di::make_injector(
            di::bind<settings::DbSettings>().in(di::singleton),
            di::bind<adapters::secondary::PostgresConnectionPool>().in(di::singleton),

            di::bind<ports::output::IEventLog>()
                .to<adapters::secondary::PostgresEventLog>()
                .in(di::singleton),
            di::bind<ports::output::IBookingReadRepository>()
                .to<adapters::secondary::PostgresBookingRepository>()
                .in(di::singleton),
            di::bind<ports::output::IOfferProvider>().to(provider),

            di::bind<application::ProjectionEngine>().in(di::singleton),
            di::bind<application::CommandPipeline>().in(di::singleton),

            di::bind<ports::input::IBookingCommandService>()
                .to<application::BookingCommandService>()
                .in(di::singleton),
            di::bind<ports::input::IBookingQueryService>()
                .to<application::BookingQueryService>()
                .in(di::singleton),
            di::bind<ports::input::IReplayService>()
                .to<application::ReplayService>()
                .in(di::singleton));

        pool_ = injector.create<std::shared_ptr<adapters::secondary::PostgresConnectionPool>>();
        resolveServices(injector);
        std::cout << "[BookingApp] Storage: PostgreSQL" << std::endl;
    } else {
        auto injector = di::make_injector(
            di::bind<ports::output::IEventLog>()
                .to<adapters::secondary::InMemoryEventLog>()
                .in(di::singleton),
            di::bind<ports::output::IBookingReadRepository>()
                .to<adapters::secondary::InMemoryBookingRepository>()
                .in(di::singleton),
            di::bind<ports::output::IOfferProvider>().to(provider),

            di::bind<application::ProjectionEngine>().in(di::singleton),
            di::bind<application::CommandPipeline>().in(di::singleton),

            di::bind<ports::input::IBookingCommandService>()
                .to<application::BookingCommandService>()
                .in(di::singleton),
            di::bind<ports::input::IBookingQueryService>()
                .to<application::BookingQueryService>()
                .in(di::singleton),
            di::bind<ports::input::IReplayService>()
                .to<application::ReplayService>()
                .in(di::singleton));

        resolveServices(injector);
        std::cout << "[BookingApp] Storage: in-memory" << std::endl;
    }
}

template <typename Injector>
void BookingApp::resolveServices(Injector& injector) {
    commandService_ = injector.template create<std::shared_ptr<ports::input::IBookingCommandService>>();
    queryService_ = injector.template create<std::shared_ptr<ports::input::IBookingQueryService>>();
    replayService_ = injector.template create<std::shared_ptr<ports::input::IReplayService>>();
    controller_ = injector.template create<std::shared_ptr<adapters::primary::CommandLineController>>();
}

int BookingApp::serve() {
    std::cout << "[BookingApp] Ready" << std::endl;
    controller_->run(std::cin, std::cout);
    return 0;
}

int BookingApp::rebuild(const std::vector<std::string>& args) {
    if (args.size() > 1) {
        auto row = replayService_->rebuildReadModel(args[1]);
        std::cout << row.toJson().dump() << std::endl;
        return 0;
    }

    auto report = replayService_->rebuildReadModel();
    std::cout << report.toJson().dump() << std::endl;
    return report.ok() ? 0 : 1;
}

int BookingApp::exportEvents(const std::vector<std::string>& args) {
    int64_t from = args.size() > 1 ? std::stoll(args[1]) : 1;
    for (const auto& event : replayService_->exportEvents(from, 0)) {
        std::cout << event.toJson().dump() << std::endl;
    }
    return 0;
}

} // namespace booking
