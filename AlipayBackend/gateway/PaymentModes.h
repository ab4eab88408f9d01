#pragma once

#include "GatewayEngine.h"
#include "Order.h"
#include <string>

namespace alipay
{
class PagePayment
{
  public:
    explicit PagePayment(const GatewayEngine &engine) : engine_(engine)
    {
    }

    std::string buildFormPayment(Order order) const;
    std::string buildUrlPayment(Order order) const;
    std::string buildAppPayment(Order order) const;
    std::string buildAppletPayment(Order order) const;

  private:
    GatewayData initOrderParameter(const char *method,
                                   const char *productCode,
                                   Order &order) const;

    const GatewayEngine &engine_;
};

class ScanPayment
{
  public:
    explicit ScanPayment(const GatewayEngine &engine) : engine_(engine)
    {
    }

    std::string build(Order order) const;

  private:
    const GatewayEngine &engine_;
};
}  // namespace alipay
