// adapters/primary/ResponseCapture.hpp
#pragma once

#include <IResponse.hpp>
#include "domain/SavedResponse.hpp"
#include "domain/errors/IdempotencyErrors.hpp"
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace newsletter::adapters::primary
{

    /**
     * @brief IResponse, который ничего не отправляет, а запоминает ответ
     *
     * Обработчик пишет ответ сюда, capture() отдаёт тройку
     * (status, headers, body) для сохранения в хранилище.
     *
     * Тело целиком буферизуется в памяти. Ответы больше maxBodyBytes
     * не кэшируются: capture() бросает ResponseTooLargeError.
     * Не подходит для больших файлов.
     */
    class ResponseCapture : public IResponse
    {
    public:
        explicit ResponseCapture(std::size_t maxBodyBytes) : maxBodyBytes_(maxBodyBytes) {}

        void setStatus(int code) override { status_ = code; }

        void setBody(const std::string &body) override { body_ = body; }

        // Повторные имена не перезаписываются (Set-Cookie и т.п.)
        void setHeader(const std::string &name, const std::string &value) override
        {
            headers_.push_back({name, value});
        }

        int getStatus() const { return status_; }
        std::string getBody() const { return body_; }

        /**
         * @brief Забрать записанный ответ
         * @throws ResponseTooLargeError тело больше лимита
         * @throws std::logic_error обработчик не выставил статус
         */
        domain::SavedResponse capture() const
        {
            if (status_ == 0)
            {
                throw std::logic_error("Cannot capture a response without status");
            }
            if (body_.size() > maxBodyBytes_)
            {
                throw domain::ResponseTooLargeError(body_.size(), maxBodyBytes_);
            }
            return domain::SavedResponse{status_, headers_, body_};
        }

    private:
        std::size_t maxBodyBytes_;
        int status_ = 0;
        std::vector<domain::HeaderPair> headers_;
        std::string body_;
    };

    /**
     * @brief Записать сохранённый ответ в настоящий IResponse
     *
     * Статус как есть, заголовки в исходном порядке, тело без изменений.
     *
     * Повторяющиеся имена (Set-Cookie) доходят до клиента, только если
     * res.setHeader() добавляет значение. Реализации IResponse на map
     * (как заголовки запроса в cpp-http-server-lib) оставят последнее
     * значение: в SavedResponse повторы сохранены, теряются они на выдаче.
     */
    inline void reconstruct(const domain::SavedResponse &saved, IResponse &res)
    {
        res.setStatus(saved.status);
        for (const auto &header : saved.headers)
        {
            res.setHeader(header.name, header.value);
        }
        res.setBody(saved.body);
    }

} // namespace newsletter::adapters::primary
