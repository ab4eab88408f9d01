#pragma once

#include <drogon/plugins/Plugin.h>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <json/json.h>
#include <functional>
#include <memory>
#include "../gateway/GatewayEngine.h"
#include "../gateway/Notify.h"

class AlipayPlugin : public drogon::Plugin<AlipayPlugin>
{
  public:
    using NotifyHandler = std::function<void(const alipay::Notify &notify)>;

    AlipayPlugin() = default;
    void initAndStart(const Json::Value &config) override;
    void shutdown() override;

    void handleNotify(
        const drogon::HttpRequestPtr &req,
        std::function<void(const drogon::HttpResponsePtr &)> &&callback);

    // Invoked for authenticated notifies reporting a paid trade.
    void setNotifyHandler(NotifyHandler handler);

    std::shared_ptr<alipay::GatewayEngine> getEngine() const
    {
        return engine_;
    }

    void setTestEngine(const std::shared_ptr<alipay::GatewayEngine> &engine);

  private:
    std::shared_ptr<alipay::GatewayEngine> engine_;
    NotifyHandler notifyHandler_;
};
