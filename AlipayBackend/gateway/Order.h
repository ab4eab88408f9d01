#pragma once

#include "GatewayData.h"
#include <string>

namespace alipay
{
struct Order
{
    std::string outTradeNo;
    std::string productCode;
    std::string totalAmount;
    std::string subject;
    std::string body;
    std::string timeoutExpress;
    std::string scene;
    std::string authCode;
    std::string storeId;

    FieldList fields() const;

    // Throws ValidationError.
    void validate() const;

    std::string toBizContent() const;
};
}  // namespace alipay
