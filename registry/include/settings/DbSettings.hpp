#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace registry::settings
{

    /**
     * @brief Настройки подключения к PostgreSQL
     *
     * Читает параметры из переменных окружения.
     */
    class DbSettings
    {
    public:
        DbSettings()
        {
            host_ = getEnvOrDefault("REGISTRY_DB_HOST", "localhost");
            port_ = parsePort(getEnvOrDefault("REGISTRY_DB_PORT", "5432"));
            name_ = getEnvOrDefault("REGISTRY_DB_NAME", "registry_db");
            user_ = getEnvOrDefault("REGISTRY_DB_USER", "registry_user");
            password_ = getEnvOrDefault("REGISTRY_DB_PASSWORD", "registry_password");
        }

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        std::string getName() const { return name_; }
        std::string getUser() const { return user_; }
        std::string getPassword() const { return password_; }

        std::string getConnectionString() const
        {
            return "host=" + host_ + " port=" + std::to_string(port_) +
                   " dbname=" + name_ + " user=" + user_ + " password=" + password_;
        }

    private:
        std::string host_;
        int port_;
        std::string name_;
        std::string user_;
        std::string password_;

        static int parsePort(const std::string &text)
        {
            try
            {
                return std::stoi(text);
            }
            catch (const std::exception &)
            {
                throw std::invalid_argument("REGISTRY_DB_PORT is not a number: " + text);
            }
        }

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace registry::settings
