#include "RegistryApp.hpp"

// Application
#include "application/EntityStore.hpp"
#include "application/SimpleEntityFactory.hpp"
#include "domain/errors/RegistryException.hpp"

// Secondary Adapters
#include "adapters/secondary/persistence/InMemoryEntityRepository.hpp"
#include "adapters/secondary/persistence/PostgresEntityRepository.hpp"

// Ports
#include "ports/input/IEntityStore.hpp"
#include "ports/output/IEntityRepository.hpp"

// Settings
#include "settings/DbSettings.hpp"
#include "settings/StoreSettings.hpp"

#include <iomanip>
#include <iostream>

namespace di = boost::di;

namespace registry {

RegistryApp::RegistryApp()
{
    std::cout << "[RegistryApp] Application created" << std::endl;
}

RegistryApp::~RegistryApp()
{
    std::cout << "[RegistryApp] Application destroyed" << std::endl;
}

int RegistryApp::run(int argc, char* argv[])
{
    loadEnvironment(argc, argv);
    configureInjection();
    return start();
}

void RegistryApp::loadEnvironment(int argc, char* argv[])
{
    std::cout << "[RegistryApp] Loading environment..." << std::endl;

    for (int i = 1; i < argc; ++i)
    {
        std::cerr << "[RegistryApp] Ignoring argument: " << argv[i] << std::endl;
    }

    storeSettings_ = std::make_shared<settings::StoreSettings>();
    dbSettings_ = std::make_shared<settings::DbSettings>();

    std::cout << "[RegistryApp] Storage: " << storeSettings_->getStorage()
              << ", decimal scale: " << storeSettings_->getDecimalScale() << std::endl;
}

void RegistryApp::configureInjection()
{
    printStartupBanner();

    std::cout << "[RegistryApp] Configuring Boost.DI injection..." << std::endl;

    if (storeSettings_->usePostgres())
    {
        repository_ = std::make_shared<adapters::secondary::PostgresEntityRepository>(
            dbSettings_->getConnectionString());
    }
    else
    {
        repository_ = std::make_shared<adapters::secondary::InMemoryEntityRepository>();
    }

    auto injector = di::make_injector(

        // ====================================================================
        // Layer 1: Settings & Secondary Adapters
        // ====================================================================

        di::bind<settings::StoreSettings>().to(storeSettings_),

        // IEntityRepository ← выбран по REGISTRY_STORAGE
        di::bind<ports::output::IEntityRepository>().to(repository_),

        // EntityFactory ← SimpleEntityFactory (авторегистрация в конструкторе)
        di::bind<domain::EntityFactory>()
            .to<application::SimpleEntityFactory>()
            .in(di::singleton),

        // ====================================================================
        // Layer 2: Application (Input Port)
        // ====================================================================

        di::bind<ports::input::IEntityStore>()
            .to<application::EntityStore>()
            .in(di::singleton));

    store_ = injector.create<std::shared_ptr<ports::input::IEntityStore>>();

    std::cout << "[RegistryApp] DI configuration completed" << std::endl;
}

int RegistryApp::start()
{
    size_t loaded = store_->load();
    std::cout << "[RegistryApp] Loaded " << loaded << " entities" << std::endl;

    try
    {
        store_->verify();
    }
    catch (const domain::CorruptStateError &e)
    {
        std::cerr << "[RegistryApp] Verification failed: " << e.what() << std::endl;
        return 1;
    }

    std::cout << std::endl;
    std::cout << std::left << std::setw(16) << "kind"
              << std::right << std::setw(10) << "active"
              << std::setw(10) << "retired" << std::endl;
    for (const auto &[kind, stats] : store_->statistics())
    {
        std::cout << std::left << std::setw(16) << kind
                  << std::right << std::setw(10) << stats.active
                  << std::setw(10) << stats.retired << std::endl;
    }
    std::cout << std::endl;
    return 0;
}

void RegistryApp::printStartupBanner()
{
    std::cout << std::endl;
    std::cout << "╔══════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║         Entity Registry: Integrity Check             ║" << std::endl;
    std::cout << "║                                                      ║" << std::endl;
    std::cout << "║  Architecture: Hexagonal (Ports & Adapters)          ║" << std::endl;
    std::cout << "║  DI Framework: Boost.DI                              ║" << std::endl;
    std::cout << "║  Storage:      InMemory / PostgreSQL (libpqxx)       ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════╝" << std::endl;
    std::cout << std::endl;
}

} // namespace registry
