#include "NotifyValidator.h"
#include "Constants.h"
#include "GatewayException.h"
#include "Signer.h"
#include <trantor/utils/Logger.h>

namespace alipay
{
namespace
{
const char *const kRequiredParameters[] = {constant::APP_ID,
                                           constant::VERSION,
                                           constant::CHARSET,
                                           constant::TRADE_NO,
                                           constant::SIGN,
                                           constant::SIGN_TYPE};
}  // namespace

Notify NotifyValidator::validate(const std::string &formBody) const
{
    GatewayData data;
    data.fromUrl(formBody);
    return validate(std::move(data));
}

Notify NotifyValidator::validate(GatewayData data) const
{
    for (const char *key : kRequiredParameters)
    {
        if (data.getStringValue(key).empty())
        {
            throw MalformedResponse(std::string("missing notify parameter: ") +
                                    key);
        }
    }

    auto notify = data.toObject<Notify>(StringCase::Snake);
    data.remove(constant::SIGN);
    data.remove(constant::SIGN_TYPE);

    const auto &merchant = engine_.merchant();
    std::string error;
    if (!Signer::verify(data.toCanonicalString(false), notify.sign,
                        merchant.alipayPublicKey, merchant.signType, error))
    {
        LOG_WARN << "Alipay notify rejected, trade_no=" << notify.tradeNo
                 << ": " << error;
        throw SignatureMismatch("signature mismatch");
    }

    if (notify.appId != merchant.appId)
    {
        LOG_WARN << "Alipay notify for foreign app_id " << notify.appId;
        throw ValidationError("app_id mismatch");
    }
    return notify;
}
}  // namespace alipay
