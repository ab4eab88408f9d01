#pragma once

#include "GatewayData.h"
#include "GatewayEngine.h"
#include "Notify.h"
#include <string>

namespace alipay
{
class NotifyValidator
{
  public:
    explicit NotifyValidator(const GatewayEngine &engine) : engine_(engine)
    {
    }

    Notify validate(GatewayData data) const;

    // Form-encoded body as posted by the provider.
    Notify validate(const std::string &formBody) const;

  private:
    const GatewayEngine &engine_;
};
}  // namespace alipay
