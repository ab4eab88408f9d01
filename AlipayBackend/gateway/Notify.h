#pragma once

#include <map>
#include <string>

namespace alipay
{
struct Notify
{
    std::string code;
    std::string msg;
    std::string subCode;
    std::string subMsg;

    std::string appId;
    std::string charset;
    std::string version;
    std::string signType;
    std::string sign;
    std::string notifyId;
    std::string notifyTime;
    std::string notifyType;

    std::string tradeNo;
    std::string outTradeNo;
    std::string tradeStatus;
    std::string totalAmount;
    std::string receiptAmount;
    std::string buyerId;
    std::string buyerLogonId;
    std::string gmtPayment;
    std::string refundFee;
    std::string qrCode;
    std::string billDownloadUrl;

    // Unrecognized fields, keyed by camelCase name.
    std::map<std::string, std::string> extra;

    void setField(const std::string &name, const std::string &value);

    bool isSuccessCode() const;
    bool isSuccessPay() const;
    bool isWaitPay() const;
};
}  // namespace alipay
