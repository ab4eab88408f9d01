#include "Notify.h"
#include "Constants.h"
#include <unordered_map>

namespace alipay
{
namespace
{
using Member = std::string Notify::*;

const std::unordered_map<std::string, Member> &memberTable()
{
    static const std::unordered_map<std::string, Member> table = {
        {"code", &Notify::code},
        {"msg", &Notify::msg},
        {"subCode", &Notify::subCode},
        {"subMsg", &Notify::subMsg},
        {"appId", &Notify::appId},
        {"charset", &Notify::charset},
        {"version", &Notify::version},
        {"signType", &Notify::signType},
        {"sign", &Notify::sign},
        {"notifyId", &Notify::notifyId},
        {"notifyTime", &Notify::notifyTime},
        {"notifyType", &Notify::notifyType},
        {"tradeNo", &Notify::tradeNo},
        {"outTradeNo", &Notify::outTradeNo},
        {"tradeStatus", &Notify::tradeStatus},
        {"totalAmount", &Notify::totalAmount},
        {"receiptAmount", &Notify::receiptAmount},
        {"buyerId", &Notify::buyerId},
        {"buyerLogonId", &Notify::buyerLogonId},
        {"gmtPayment", &Notify::gmtPayment},
        {"refundFee", &Notify::refundFee},
        {"qrCode", &Notify::qrCode},
        {"billDownloadUrl", &Notify::billDownloadUrl}};
    return table;
}
}  // namespace

void Notify::setField(const std::string &name, const std::string &value)
{
    const auto &table = memberTable();
    auto it = table.find(name);
    if (it == table.end())
    {
        extra[name] = value;
        return;
    }
    this->*(it->second) = value;
}

bool Notify::isSuccessCode() const
{
    return code == constant::SUCCESS_CODE;
}

bool Notify::isSuccessPay() const
{
    return tradeStatus == constant::TRADE_SUCCESS ||
           tradeStatus == constant::TRADE_FINISHED;
}

bool Notify::isWaitPay() const
{
    return tradeStatus == constant::WAIT_BUYER_PAY;
}
}  // namespace alipay
