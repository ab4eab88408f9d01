#pragma once

#include "GatewayData.h"
#include <json/json.h>
#include <string>

namespace alipay
{
struct Merchant
{
    std::string appId;
    std::string method;
    std::string format{"JSON"};
    std::string returnUrl;
    std::string charset{"UTF-8"};
    std::string signType{"RSA2"};
    std::string timestamp;
    std::string version{"1.0"};
    std::string notifyUrl;
    std::string bizContent;

    // Never serialized.
    std::string privateKey;
    std::string alipayPublicKey;

    FieldList fields() const;

    static bool fromConfig(const Json::Value &config,
                           Merchant &merchant,
                           std::string &error);
};
}  // namespace alipay
