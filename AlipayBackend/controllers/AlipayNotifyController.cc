#include "AlipayNotifyController.h"

void AlipayNotifyController::notify(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback)
{
    auto plugin = drogon::app().getPlugin<AlipayPlugin>();
    plugin->handleNotify(req, std::move(callback));
}
