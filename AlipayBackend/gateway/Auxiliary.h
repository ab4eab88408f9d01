#pragma once

#include "GatewayData.h"
#include <string>

namespace alipay
{
enum class AuxiliaryType
{
    Query,
    Cancel,
    Close,
    Refund,
    RefundQuery,
    BillDownload
};

const char *methodFor(AuxiliaryType type);

struct Auxiliary
{
    std::string outTradeNo;
    std::string tradeNo;
    std::string refundAmount;
    std::string refundReason;
    std::string outRequestNo;
    std::string billType;
    std::string billDate;

    FieldList fields() const;

    void validate(AuxiliaryType type) const;

    std::string toBizContent() const;
};
}  // namespace alipay
