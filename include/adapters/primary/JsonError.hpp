#pragma once

#include <IResponse.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace newsletter::adapters::primary
{

    // {"error": "<message>"}
    inline void sendError(IResponse &res, int status, const std::string &message)
    {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }

} // namespace newsletter::adapters::primary
