#pragma once

namespace alipay::constant
{
inline constexpr const char *kDefaultGatewayUrl = "https://openapi.alipay.com";
inline constexpr const char *kGatewayPath = "/gateway.do";

// Wire keys
inline constexpr const char *APP_ID = "app_id";
inline constexpr const char *VERSION = "version";
inline constexpr const char *CHARSET = "charset";
inline constexpr const char *TRADE_NO = "trade_no";
inline constexpr const char *SIGN = "sign";
inline constexpr const char *SIGN_TYPE = "sign_type";
inline constexpr const char *BODY = "body";
inline constexpr const char *FILE_TYPE = "fileType";
inline constexpr const char *ERROR_RESPONSE = "error_response";

// Result codes
inline constexpr const char *SUCCESS_CODE = "10000";
inline constexpr const char *WAIT_USER_CODE = "10003";
inline constexpr const char *UNKNOWN_CODE = "20000";

// Trade status
inline constexpr const char *WAIT_BUYER_PAY = "WAIT_BUYER_PAY";
inline constexpr const char *TRADE_SUCCESS = "TRADE_SUCCESS";
inline constexpr const char *TRADE_FINISHED = "TRADE_FINISHED";
inline constexpr const char *TRADE_CLOSED = "TRADE_CLOSED";

// Methods
inline constexpr const char *WEB = "alipay.trade.page.pay";
inline constexpr const char *WAP = "alipay.trade.wap.pay";
inline constexpr const char *APP = "alipay.trade.app.pay";
inline constexpr const char *SCAN = "alipay.trade.precreate";
inline constexpr const char *BARCODE = "alipay.trade.pay";
inline constexpr const char *QUERY = "alipay.trade.query";
inline constexpr const char *CANCEL = "alipay.trade.cancel";
inline constexpr const char *CLOSE = "alipay.trade.close";
inline constexpr const char *REFUND = "alipay.trade.refund";
inline constexpr const char *REFUNDQUERY = "alipay.trade.fastpay.refund.query";
inline constexpr const char *BILLDOWNLOAD =
    "alipay.data.dataservice.bill.downloadurl.query";

// Product codes
inline constexpr const char *FAST_INSTANT_TRADE_PAY = "FAST_INSTANT_TRADE_PAY";
inline constexpr const char *QUICK_WAP_WAY = "QUICK_WAP_WAY";
inline constexpr const char *QUICK_MSECURITY_PAY = "QUICK_MSECURITY_PAY";
inline constexpr const char *FACE_TO_FACE_PAYMENT = "FACE_TO_FACE_PAYMENT";
inline constexpr const char *BAR_CODE = "bar_code";

inline constexpr const char *PAYMENT_TIMED_OUT = "payment timed out";
}  // namespace alipay::constant
