#include "Order.h"
#include "GatewayException.h"
#include "../utils/PayUtils.h"

namespace alipay
{
FieldList Order::fields() const
{
    return {{"outTradeNo", outTradeNo},
            {"productCode", productCode},
            {"totalAmount", totalAmount},
            {"subject", subject},
            {"body", body},
            {"timeoutExpress", timeoutExpress},
            {"scene", scene},
            {"authCode", authCode},
            {"storeId", storeId}};
}

void Order::validate() const
{
    if (outTradeNo.empty())
    {
        throw ValidationError("missing out_trade_no");
    }
    if (subject.empty())
    {
        throw ValidationError("missing subject");
    }
    int64_t fen = 0;
    if (!utils::parseAmountToFen(totalAmount, fen) || fen <= 0)
    {
        throw ValidationError("invalid total_amount: " + totalAmount);
    }
}

std::string Order::toBizContent() const
{
    GatewayData data;
    data.add(*this, StringCase::Snake);
    return utils::toJsonString(data.toJson());
}
}  // namespace alipay
