#pragma once

#include "Constants.h"
#include "GatewayData.h"
#include "HttpTransport.h"
#include "Merchant.h"
#include "Notify.h"
#include "Request.h"
#include <memory>
#include <string>

namespace alipay
{
class GatewayEngine
{
  public:
    GatewayEngine(Merchant merchant,
                  std::shared_ptr<HttpTransport> transport,
                  std::string gatewayUrl = constant::kDefaultGatewayUrl);

    const Merchant &merchant() const
    {
        return merchant_;
    }
    HttpTransport &transport() const
    {
        return *transport_;
    }
    const std::string &gatewayUrl() const
    {
        return gatewayUrl_;
    }
    std::string requestUrl() const;

    GatewayData assemble(const std::string &method,
                         const std::string &bizContent) const;

    GatewayData assemble(const std::string &method,
                         const GatewayData &params) const;

    std::string buildSign(const GatewayData &data) const;

    Notify submit(const GatewayData &data,
                  const std::string &responseKey) const;

    // Throws GatewayOperationError unless the code is 10000.
    Notify commit(const GatewayData &data,
                  const std::string &responseKey) const;

    template <typename T>
    T execute(const Request<T> &request) const
    {
        const auto data = assemble(request.method, request.gatewayData);
        const auto body = post(data);
        std::string sign;
        auto result = unwrap(body, request.responseKey, sign);
        result.add(constant::SIGN, sign);
        result.add(constant::BODY, body);
        return result.template toObject<T>(StringCase::Snake);
    }

    template <typename T>
    std::string sdkExecute(const Request<T> &request) const
    {
        return assemble(request.method, request.gatewayData).toUrlEncodedBody();
    }

    static std::string responseKeyFor(const std::string &method);

  private:
    std::string post(const GatewayData &data) const;
    GatewayData unwrap(const std::string &body,
                       const std::string &responseKey,
                       std::string &sign) const;

    Merchant merchant_;
    std::shared_ptr<HttpTransport> transport_;
    std::string gatewayUrl_;
};
}  // namespace alipay
