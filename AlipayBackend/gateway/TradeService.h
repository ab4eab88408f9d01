#pragma once

#include "Auxiliary.h"
#include "GatewayEngine.h"
#include "Notify.h"

namespace alipay
{
class TradeService
{
  public:
    explicit TradeService(const GatewayEngine &engine) : engine_(engine)
    {
    }

    Notify query(const Auxiliary &auxiliary) const;
    Notify cancel(const Auxiliary &auxiliary) const;
    Notify close(const Auxiliary &auxiliary) const;
    Notify refund(const Auxiliary &auxiliary) const;
    Notify refundQuery(const Auxiliary &auxiliary) const;

  private:
    Notify commitAuxiliary(AuxiliaryType type,
                           const Auxiliary &auxiliary) const;

    const GatewayEngine &engine_;
};
}  // namespace alipay
