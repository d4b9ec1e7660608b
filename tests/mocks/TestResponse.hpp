#pragma once

#include <IResponse.hpp>
#include <string>
#include <utility>
#include <vector>

namespace newsletter::tests::mocks
{

    /**
     * @brief IResponse для тестов: заголовки в порядке установки, с повторами
     */
    class TestResponse : public IResponse
    {
    public:
        void setStatus(int code) override { status_ = code; }
        void setBody(const std::string &body) override { body_ = body; }
        void setHeader(const std::string &name, const std::string &value) override
        {
            headers_.emplace_back(name, value);
        }

        int getStatus() const { return status_; }
        std::string getBody() const { return body_; }
        const std::vector<std::pair<std::string, std::string>> &getHeaders() const { return headers_; }

        std::string headerValue(const std::string &name) const
        {
            for (const auto &[n, v] : headers_)
            {
                if (n == name)
                    return v;
            }
            return "";
        }

    private:
        int status_ = 0;
        std::string body_;
        std::vector<std::pair<std::string, std::string>> headers_;
    };

} // namespace newsletter::tests::mocks
