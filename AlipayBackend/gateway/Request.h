#pragma once

#include "GatewayData.h"
#include <string>

namespace alipay
{
template <typename T>
struct Request
{
    using ResponseType = T;

    std::string method;
    // Empty selects the first member of the envelope other than "sign".
    std::string responseKey;
    GatewayData gatewayData;
};
}  // namespace alipay
