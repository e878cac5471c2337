// include/settings/DbSettings.hpp
#pragma once

#include <cstdlib>
#include <string>
#include <utility>

namespace inventory::settings
{

    /**
     * @brief Настройки подключения к PostgreSQL
     *
     * Читает параметры из переменных окружения (K8s ENV).
     * Пустой INVENTORY_DB_HOST означает работу без БД (in-memory).
     */
    class DbSettings
    {
    public:
        DbSettings()
        {
            host_ = getEnvOrDefault("INVENTORY_DB_HOST", "inventory-postgres");
            port_ = std::stoi(getEnvOrDefault("INVENTORY_DB_PORT", "5432"));
            name_ = getEnvOrDefault("INVENTORY_DB_NAME", "inventory_db");
            user_ = getEnvOrDefault("INVENTORY_DB_USER", "inventory_user");
            password_ = getEnvOrDefault("INVENTORY_DB_PASSWORD", "inventory_secret_password");
        }

        DbSettings(std::string host, int port, std::string name, std::string user, std::string password)
            : host_(std::move(host)), port_(port), name_(std::move(name)),
              user_(std::move(user)), password_(std::move(password))
        {
        }

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        std::string getName() const { return name_; }
        std::string getUser() const { return user_; }
        std::string getPassword() const { return password_; }

        bool isConfigured() const { return !host_.empty(); }

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

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace inventory::settings
