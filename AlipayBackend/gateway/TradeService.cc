#include "TradeService.h"

namespace alipay
{
Notify TradeService::query(const Auxiliary &auxiliary) const
{
    return commitAuxiliary(AuxiliaryType::Query, auxiliary);
}

Notify TradeService::cancel(const Auxiliary &auxiliary) const
{
    return commitAuxiliary(AuxiliaryType::Cancel, auxiliary);
}

Notify TradeService::close(const Auxiliary &auxiliary) const
{
    return commitAuxiliary(AuxiliaryType::Close, auxiliary);
}

Notify TradeService::refund(const Auxiliary &auxiliary) const
{
    return commitAuxiliary(AuxiliaryType::Refund, auxiliary);
}

Notify TradeService::refundQuery(const Auxiliary &auxiliary) const
{
    return commitAuxiliary(AuxiliaryType::RefundQuery, auxiliary);
}

Notify TradeService::commitAuxiliary(AuxiliaryType type,
                                     const Auxiliary &auxiliary) const
{
    auxiliary.validate(type);
    const std::string method = methodFor(type);
    const auto data = engine_.assemble(method, auxiliary.toBizContent());
    return engine_.commit(data, GatewayEngine::responseKeyFor(method));
}
}  // namespace alipay
