#include "AlipayPlugin.h"
#include "../gateway/GatewayException.h"
#include "../gateway/HttpTransport.h"
#include "../gateway/Merchant.h"
#include "../gateway/NotifyValidator.h"
#include <drogon/drogon.h>

void AlipayPlugin::initAndStart(const Json::Value &config)
{
    alipay::Merchant merchant;
    std::string error;
    if (!alipay::Merchant::fromConfig(config, merchant, error))
    {
        LOG_ERROR << "AlipayPlugin config error: " << error;
        return;
    }

    auto transport = std::make_shared<alipay::DrogonHttpTransport>(
        config.get("timeout_seconds", 15.0).asDouble());
    engine_ = std::make_shared<alipay::GatewayEngine>(
        std::move(merchant),
        transport,
        config.get("gateway_url", alipay::constant::kDefaultGatewayUrl)
            .asString());
    LOG_INFO << "AlipayPlugin ready, app_id=" << engine_->merchant().appId
             << " gateway=" << engine_->gatewayUrl();
}

void AlipayPlugin::shutdown()
{
    engine_.reset();
}

void AlipayPlugin::setNotifyHandler(NotifyHandler handler)
{
    notifyHandler_ = std::move(handler);
}

void AlipayPlugin::setTestEngine(
    const std::shared_ptr<alipay::GatewayEngine> &engine)
{
    engine_ = engine;
}

void AlipayPlugin::handleNotify(
    const drogon::HttpRequestPtr &req,
    std::function<void(const drogon::HttpResponsePtr &)> &&callback)
{
    // The provider only treats the literal body "success" as acknowledged.
    auto respond = [&callback](drogon::HttpStatusCode code) {
        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setStatusCode(code);
        resp->setContentTypeCode(drogon::CT_TEXT_PLAIN);
        resp->setBody(code == drogon::k200OK ? "success" : "fail");
        callback(resp);
    };

    if (!engine_)
    {
        respond(drogon::k500InternalServerError);
        return;
    }

    const std::string body = std::string(req->body());
    alipay::Notify notify;
    try
    {
        notify = alipay::NotifyValidator(*engine_).validate(body);
    }
    catch (const alipay::SignatureMismatch &)
    {
        respond(drogon::k401Unauthorized);
        return;
    }
    catch (const alipay::GatewayException &e)
    {
        LOG_WARN << "Alipay notify rejected: " << e.what();
        respond(drogon::k400BadRequest);
        return;
    }

    LOG_INFO << "Alipay notify trade_no=" << notify.tradeNo
             << " out_trade_no=" << notify.outTradeNo
             << " trade_status=" << notify.tradeStatus;
    if (notify.isSuccessPay() && notifyHandler_)
    {
        notifyHandler_(notify);
    }
    respond(drogon::k200OK);
}
