#include "adapters/secondary/HeaderCodec.hpp"
#include "domain/errors/IdempotencyErrors.hpp"
#include <nlohmann/json.hpp>

namespace newsletter::adapters::secondary
{

    std::vector<std::uint8_t> HeaderCodec::encode(const std::vector<domain::HeaderPair> &headers)
    {
        nlohmann::json pairs = nlohmann::json::array();
        for (const auto &h : headers)
        {
            std::vector<std::uint8_t> value(h.value.begin(), h.value.end());
            pairs.push_back(nlohmann::json::array({h.name, nlohmann::json::binary(std::move(value))}));
        }
        return nlohmann::json::to_cbor(pairs);
    }

    std::vector<domain::HeaderPair> HeaderCodec::decode(const std::vector<std::uint8_t> &bytes)
    {
        nlohmann::json pairs;
        try
        {
            pairs = nlohmann::json::from_cbor(bytes);
        }
        catch (const nlohmann::json::exception &e)
        {
            throw domain::StorageError(std::string("Corrupted response_headers: ") + e.what());
        }

        if (!pairs.is_array())
        {
            throw domain::StorageError("Corrupted response_headers: expected an array");
        }

        std::vector<domain::HeaderPair> headers;
        headers.reserve(pairs.size());
        for (const auto &pair : pairs)
        {
            if (!pair.is_array() || pair.size() != 2 || !pair[0].is_string() || !pair[1].is_binary())
            {
                throw domain::StorageError("Corrupted response_headers: expected [name, bytes] pairs");
            }
            const auto &value = pair[1].get_binary();
            headers.push_back({pair[0].get<std::string>(), std::string(value.begin(), value.end())});
        }
        return headers;
    }

} // namespace newsletter::adapters::secondary
