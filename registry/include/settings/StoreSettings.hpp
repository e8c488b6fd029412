#pragma once

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace registry::settings
{

    /**
     * @brief Настройки реестра сущностей
     *
     * Читает параметры из переменных окружения:
     * - REGISTRY_DECIMAL_SCALE  (default: 9, 0..18) шкала decimal-полей новых записей
     * - REGISTRY_DEFAULT_ACTOR  (default: "system") актор, если вызывающий его не указал
     * - REGISTRY_STORAGE        (default: "memory") memory | postgres
     *
     * Шкала не влияет на Uid и на уже созданные записи.
     */
    class StoreSettings
    {
    public:
        static constexpr unsigned MAX_DECIMAL_SCALE = 18;

        StoreSettings()
        {
            decimalScale_ = parseScale(getEnvOrDefault("REGISTRY_DECIMAL_SCALE", "9"));
            defaultActor_ = getEnvOrDefault("REGISTRY_DEFAULT_ACTOR", "system");
            storage_ = getEnvOrDefault("REGISTRY_STORAGE", "memory");

            if (storage_ != "memory" && storage_ != "postgres")
            {
                throw std::invalid_argument("REGISTRY_STORAGE must be memory or postgres, got " + storage_);
            }
        }

        StoreSettings(unsigned decimalScale, std::string defaultActor, std::string storage = "memory")
            : decimalScale_(decimalScale), defaultActor_(std::move(defaultActor)), storage_(std::move(storage))
        {
        }

        unsigned getDecimalScale() const { return decimalScale_; }
        std::string getDefaultActor() const { return defaultActor_; }
        std::string getStorage() const { return storage_; }
        bool usePostgres() const { return storage_ == "postgres"; }

    private:
        unsigned decimalScale_;
        std::string defaultActor_;
        std::string storage_;

        static unsigned parseScale(const std::string &text)
        {
            int scale = -1;
            try
            {
                scale = std::stoi(text);
            }
            catch (const std::exception &)
            {
                throw std::invalid_argument("REGISTRY_DECIMAL_SCALE is not a number: " + text);
            }
            if (scale < 0 || scale > static_cast<int>(MAX_DECIMAL_SCALE))
            {
                throw std::invalid_argument("REGISTRY_DECIMAL_SCALE must be in 0..18, got " + text);
            }
            return static_cast<unsigned>(scale);
        }

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace registry::settings
