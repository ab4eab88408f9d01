#pragma once

#include <drogon/HttpController.h>
#include "../plugins/AlipayPlugin.h"

using namespace drogon;

class AlipayNotifyController
    : public drogon::HttpController<AlipayNotifyController>
{
  public:
    METHOD_LIST_BEGIN
    ADD_METHOD_TO(AlipayNotifyController::notify, "/pay/notify/alipay", Post);
    METHOD_LIST_END

    void notify(const HttpRequestPtr &req,
                std::function<void(const HttpResponsePtr &)> &&callback);
};
