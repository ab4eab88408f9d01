#include "Auxiliary.h"
#include "Constants.h"
#include "GatewayException.h"
#include "../utils/PayUtils.h"

namespace alipay
{
const char *methodFor(AuxiliaryType type)
{
    switch (type)
    {
        case AuxiliaryType::Query:
            return constant::QUERY;
        case AuxiliaryType::Cancel:
            return constant::CANCEL;
        case AuxiliaryType::Close:
            return constant::CLOSE;
        case AuxiliaryType::Refund:
            return constant::REFUND;
        case AuxiliaryType::RefundQuery:
            return constant::REFUNDQUERY;
        case AuxiliaryType::BillDownload:
            return constant::BILLDOWNLOAD;
    }
    return "";
}

FieldList Auxiliary::fields() const
{
    return {{"outTradeNo", outTradeNo},
            {"tradeNo", tradeNo},
            {"refundAmount", refundAmount},
            {"refundReason", refundReason},
            {"outRequestNo", outRequestNo},
            {"billType", billType},
            {"billDate", billDate}};
}

void Auxiliary::validate(AuxiliaryType type) const
{
    if (type == AuxiliaryType::BillDownload)
    {
        if (billType.empty())
        {
            throw ValidationError("missing bill_type");
        }
        if (billDate.empty())
        {
            throw ValidationError("missing bill_date");
        }
        return;
    }

    if (outTradeNo.empty() && tradeNo.empty())
    {
        throw ValidationError("out_trade_no or trade_no is required");
    }

    if (type == AuxiliaryType::Refund)
    {
        int64_t fen = 0;
        if (!utils::parseAmountToFen(refundAmount, fen) || fen <= 0)
        {
            throw ValidationError("invalid refund_amount: " + refundAmount);
        }
    }
    else if (type == AuxiliaryType::RefundQuery && outRequestNo.empty())
    {
        throw ValidationError("missing out_request_no");
    }
}

std::string Auxiliary::toBizContent() const
{
    GatewayData data;
    data.add(*this, StringCase::Snake);
    return utils::toJsonString(data.toJson());
}
}  // namespace alipay
