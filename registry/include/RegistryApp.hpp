#pragma once

#include <boost/di.hpp>
#include <memory>

namespace registry::ports::input {
    class IEntityStore;
}

namespace registry::ports::output {
    class IEntityRepository;
}

namespace registry::settings {
    class StoreSettings;
    class DbSettings;
}

namespace registry {

/**
 * @class RegistryApp
 * @brief Проверка сохранённого реестра сущностей
 *
 * Template Method:
 * 1. loadEnvironment() - чтение настроек из переменных окружения
 * 2. configureInjection() - настройка Boost.DI и создание EntityStore
 * 3. start() - гидратация, verify() и сводка по видам
 *
 * Архитектура: Hexagonal (Ports & Adapters)
 * - Input Port: IEntityStore
 * - Secondary Adapters: InMemoryEntityRepository, PostgresEntityRepository
 */
class RegistryApp
{
public:
    RegistryApp();
    ~RegistryApp();

    /**
     * @brief Запустить все шаги
     * @return Код завершения процесса
     */
    int run(int argc, char* argv[]);

    std::shared_ptr<ports::input::IEntityStore> store() const { return store_; }

protected:
    void loadEnvironment(int argc, char* argv[]);
    void configureInjection();
    int start();

private:
    void printStartupBanner();

    std::shared_ptr<settings::StoreSettings> storeSettings_;
    std::shared_ptr<settings::DbSettings> dbSettings_;
    std::shared_ptr<ports::output::IEntityRepository> repository_;
    std::shared_ptr<ports::input::IEntityStore> store_;
};

} // namespace registry
