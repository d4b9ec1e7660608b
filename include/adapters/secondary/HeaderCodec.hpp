#pragma once

#include "domain/SavedResponse.hpp"
#include <cstdint>
#include <vector>

namespace newsletter::adapters::secondary
{

    /**
     * @brief Упаковка заголовков ответа в BYTEA колонку
     *
     * CBOR массив пар [name, bytes(value)]: порядок и повторы сохраняются,
     * значения не обязаны быть UTF-8.
     */
    class HeaderCodec
    {
    public:
        static std::vector<std::uint8_t> encode(const std::vector<domain::HeaderPair> &headers);

        /**
         * @throws StorageError если байты не являются закодированным списком заголовков
         */
        static std::vector<domain::HeaderPair> decode(const std::vector<std::uint8_t> &bytes);
    };

} // namespace newsletter::adapters::secondary
