#include "Merchant.h"
#include "Signer.h"
#include "../utils/PayUtils.h"

namespace alipay
{
namespace
{
bool loadKey(const Json::Value &config,
             const char *inlineKey,
             const char *pathKey,
             std::string &key,
             std::string &error)
{
    key = config.get(inlineKey, "").asString();
    if (!key.empty())
    {
        return true;
    }
    const std::string path = config.get(pathKey, "").asString();
    if (path.empty())
    {
        error = std::string("missing ") + inlineKey + "/" + pathKey;
        return false;
    }
    return utils::readFile(path, key, error);
}
}  // namespace

FieldList Merchant::fields() const
{
    return {{"appId", appId},
            {"method", method},
            {"format", format},
            {"returnUrl", returnUrl},
            {"charset", charset},
            {"signType", signType},
            {"timestamp", timestamp},
            {"version", version},
            {"notifyUrl", notifyUrl},
            {"bizContent", bizContent}};
}

bool Merchant::fromConfig(const Json::Value &config,
                          Merchant &merchant,
                          std::string &error)
{
    if (!utils::getRequiredString(config, "app_id", merchant.appId))
    {
        error = "missing app_id";
        return false;
    }
    merchant.signType = config.get("sign_type", "RSA2").asString();
    if (!Signer::isSupportedSignType(merchant.signType))
    {
        error = "unsupported sign_type: " + merchant.signType;
        return false;
    }
    merchant.charset = config.get("charset", "UTF-8").asString();
    merchant.format = config.get("format", "JSON").asString();
    merchant.version = config.get("version", "1.0").asString();
    merchant.notifyUrl = config.get("notify_url", "").asString();
    merchant.returnUrl = config.get("return_url", "").asString();

    if (!loadKey(config, "private_key", "private_key_path",
                 merchant.privateKey, error))
    {
        return false;
    }
    return loadKey(config, "alipay_public_key", "alipay_public_key_path",
                   merchant.alipayPublicKey, error);
}
}  // namespace alipay
