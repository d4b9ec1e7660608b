// adapters/primary/ChainHandler.hpp
#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/JsonError.hpp"
#include <memory>
#include <vector>
#include <iostream>

namespace newsletter::adapters::primary
{

    /**
     * @brief Цепочка middleware + обработчик
     *
     * Middleware сигналит "продолжай", оставляя статус 0.
     * Первый выставленный статус останавливает цепочку.
     */
    class ChainHandler : public IHttpHandler
    {
    public:
        explicit ChainHandler(std::vector<std::shared_ptr<IHttpHandler>> handlers)
            : handlers_(std::move(handlers)) {}

        void handle(IRequest &req, IResponse &res) override
        {
            for (auto &handler : handlers_)
            {
                handler->handle(req, res);
                if (res.getStatus() != 0)
                    return;
            }

            // до конца дошли без статуса: последний обработчик ничего не ответил
            std::cerr << "[ChainHandler] Error: chain finished with zero status" << std::endl;
            sendError(res, 500, "Internal server error");
        }

    private:
        std::vector<std::shared_ptr<IHttpHandler>> handlers_;
    };

} // namespace newsletter::adapters::primary
