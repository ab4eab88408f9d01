#include "GatewayEngine.h"
#include "GatewayException.h"
#include "Signer.h"
#include "../utils/PayUtils.h"
#include <algorithm>
#include <trantor/utils/Logger.h>

namespace alipay
{
GatewayEngine::GatewayEngine(Merchant merchant,
                             std::shared_ptr<HttpTransport> transport,
                             std::string gatewayUrl)
    : merchant_(std::move(merchant)),
      transport_(std::move(transport)),
      gatewayUrl_(std::move(gatewayUrl))
{
    while (!gatewayUrl_.empty() && gatewayUrl_.back() == '/')
    {
        gatewayUrl_.pop_back();
    }
    if (!transport_)
    {
        throw GatewayException("http transport is required");
    }
}

std::string GatewayEngine::requestUrl() const
{
    return gatewayUrl_ + constant::kGatewayPath + "?charset=" +
           merchant_.charset;
}

std::string GatewayEngine::responseKeyFor(const std::string &method)
{
    std::string key = method;
    std::replace(key.begin(), key.end(), '.', '_');
    return key + "_response";
}

GatewayData GatewayEngine::assemble(const std::string &method,
                                    const std::string &bizContent) const
{
    GatewayData params;
    params.add("biz_content", bizContent);
    return assemble(method, params);
}

GatewayData GatewayEngine::assemble(const std::string &method,
                                    const GatewayData &params) const
{
    Merchant merchant = merchant_;
    merchant.method = method;
    merchant.timestamp = utils::formatLocalTime("%Y-%m-%d %H:%M:%S");

    GatewayData data;
    data.add(merchant, StringCase::Snake);
    for (const auto &entry : params.entries())
    {
        if (entry.first == constant::SIGN)
        {
            continue;
        }
        data.add(entry.first, entry.second);
    }
    data.add(constant::SIGN, buildSign(data));
    return data;
}

std::string GatewayEngine::buildSign(const GatewayData &data) const
{
    std::string signature;
    std::string error;
    if (!Signer::sign(data.toCanonicalString(false), merchant_.privateKey,
                      merchant_.signType, signature, error))
    {
        LOG_ERROR << "Alipay sign failed: " << error;
        throw GatewayException("sign failed: " + error);
    }
    return signature;
}

std::string GatewayEngine::post(const GatewayData &data) const
{
    LOG_DEBUG << "Alipay request method=" << data.getStringValue("method");
    return transport_->post(requestUrl(), data.toUrlEncodedBody());
}

GatewayData GatewayEngine::unwrap(const std::string &body,
                                  const std::string &responseKey,
                                  std::string &sign) const
{
    GatewayData envelope;
    envelope.fromJson(body);
    sign = envelope.getStringValue(constant::SIGN);

    std::string payload;
    if (responseKey.empty())
    {
        const auto &entries = envelope.entries();
        auto it = std::find_if(entries.begin(), entries.end(),
                               [](const GatewayData::Entry &e) {
                                   return e.first != constant::SIGN;
                               });
        if (it == entries.end())
        {
            throw MalformedResponse("empty response envelope");
        }
        payload = it->second;
    }
    else if (envelope.exists(responseKey))
    {
        payload = envelope.getStringValue(responseKey);
    }
    else if (envelope.exists(constant::ERROR_RESPONSE))
    {
        payload = envelope.getStringValue(constant::ERROR_RESPONSE);
    }
    else
    {
        throw MalformedResponse("missing " + responseKey);
    }

    GatewayData result;
    result.fromJson(payload);
    return result;
}

Notify GatewayEngine::submit(const GatewayData &data,
                             const std::string &responseKey) const
{
    const auto body = post(data);
    std::string sign;
    auto result = unwrap(body, responseKey, sign);
    auto notify = result.toObject<Notify>(StringCase::Snake);
    notify.sign = sign;
    return notify;
}

Notify GatewayEngine::commit(const GatewayData &data,
                             const std::string &responseKey) const
{
    auto notify = submit(data, responseKey);
    if (!notify.isSuccessCode())
    {
        LOG_WARN << "Alipay " << responseKey << " failed: code=" << notify.code
                 << " sub_code=" << notify.subCode
                 << " sub_msg=" << notify.subMsg;
        throw GatewayOperationError(
            notify.subMsg.empty() ? notify.msg : notify.subMsg,
            notify.code,
            notify.subCode);
    }
    return notify;
}
}  // namespace alipay
