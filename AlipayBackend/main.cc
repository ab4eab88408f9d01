#include <drogon/drogon.h>
#include "plugins/AlipayPlugin.h"

int main(int argc, char *argv[])
{
    const std::string configPath = argc > 1 ? argv[1] : "./config.json";
    drogon::app().loadConfigFile(configPath);
    drogon::app().registerBeginningAdvice([]() {
        auto plugin = drogon::app().getPlugin<AlipayPlugin>();
        if (!plugin || !plugin->getEngine())
        {
            LOG_ERROR << "AlipayPlugin is not configured, notifies will be "
                         "refused";
            return;
        }
        plugin->setNotifyHandler([](const alipay::Notify &notify) {
            LOG_INFO << "Payment succeeded: out_trade_no="
                     << notify.outTradeNo << " amount=" << notify.totalAmount;
        });
    });
    drogon::app().run();
    return 0;
}
