#include "PaymentModes.h"
#include "GatewayException.h"

namespace alipay
{
GatewayData PagePayment::initOrderParameter(const char *method,
                                            const char *productCode,
                                            Order &order) const
{
    order.productCode = productCode;
    order.validate();
    return engine_.assemble(method, order.toBizContent());
}

std::string PagePayment::buildFormPayment(Order order) const
{
    const auto data = initOrderParameter(constant::WEB,
                                         constant::FAST_INSTANT_TRADE_PAY,
                                         order);
    return data.toForm(engine_.requestUrl());
}

std::string PagePayment::buildUrlPayment(Order order) const
{
    const auto data =
        initOrderParameter(constant::WAP, constant::QUICK_WAP_WAY, order);
    return engine_.requestUrl() + "&" + data.toUrlEncodedBody();
}

std::string PagePayment::buildAppPayment(Order order) const
{
    const auto data = initOrderParameter(constant::APP,
                                         constant::QUICK_MSECURITY_PAY,
                                         order);
    return data.toUrlEncodedBody();
}

std::string PagePayment::buildAppletPayment(Order order) const
{
    return buildAppPayment(std::move(order));
}

std::string ScanPayment::build(Order order) const
{
    order.validate();
    const auto data = engine_.assemble(constant::SCAN, order.toBizContent());
    const auto notify =
        engine_.commit(data, GatewayEngine::responseKeyFor(constant::SCAN));
    if (notify.qrCode.empty())
    {
        throw MalformedResponse("precreate response has no qr_code");
    }
    return notify.qrCode;
}
}  // namespace alipay
