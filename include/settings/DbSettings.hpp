// include/settings/DbSettings.hpp
#pragma once

#include "settings/Env.hpp"
#include <string>

namespace newsletter::settings
{

    /**
     * @brief Подключение к PostgreSQL рассылки
     *
     * ENV: NEWSLETTER_DB_HOST, NEWSLETTER_DB_PORT, NEWSLETTER_DB_NAME,
     * NEWSLETTER_DB_USER, NEWSLETTER_DB_PASSWORD.
     * Порт проверяется так же строго, как остальные числа (1..65535).
     */
    class DbSettings
    {
    public:
        DbSettings()
            : host_(env::getOr("NEWSLETTER_DB_HOST", "newsletter-postgres")),
              port_(static_cast<int>(env::getUnsignedOr("NEWSLETTER_DB_PORT", 5432, 65535))),
              name_(env::getOr("NEWSLETTER_DB_NAME", "newsletter_db")),
              user_(env::getOr("NEWSLETTER_DB_USER", "newsletter_user")),
              password_(env::getOr("NEWSLETTER_DB_PASSWORD", ""))
        {
            if (port_ == 0)
            {
                throw std::invalid_argument("NEWSLETTER_DB_PORT: port 0 is not allowed");
            }
        }

        const std::string &getName() const { return name_; }

        /// libpq keyword/value строка; пароль добавляется только если задан
        std::string getConnectionString() const
        {
            std::string conn = "host=" + host_ +
                               " port=" + std::to_string(port_) +
                               " dbname=" + name_ +
                               " user=" + user_;
            if (!password_.empty())
            {
                conn += " password=" + password_;
            }
            return conn;
        }

    private:
        std::string host_;
        int port_;
        std::string name_;
        std::string user_;
        std::string password_;
    };

} // namespace newsletter::settings
