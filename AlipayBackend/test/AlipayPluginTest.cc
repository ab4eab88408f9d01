#include <drogon/drogon_test.h>
#include <drogon/drogon.h>
#include "GatewayTestUtils.h"
#include "../plugins/AlipayPlugin.h"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>

namespace
{
std::string signedNotifyBody(const std::string &tradeStatus,
                             const std::string &privateKey)
{
    alipay::GatewayData data;
    data.add("charset", "UTF-8");
    data.add("notify_type", "trade_status_sync");
    data.add("trade_status", tradeStatus);
    data.add("total_amount", "88.88");
    data.add("trade_no", "2026101922001400000000000001");
    data.add("app_id", "2021000000000001");
    data.add("version", "1.0");
    data.add("out_trade_no", "ORDER-1");

    std::string signature;
    std::string error;
    alipay::Signer::sign(data.toCanonicalString(false), privateKey, "RSA2",
                         signature, error);
    data.add("sign", signature);
    data.add("sign_type", "RSA2");
    return data.toUrlEncodedBody();
}

drogon::HttpResponsePtr postNotify(AlipayPlugin &plugin,
                                   const std::string &body)
{
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Post);
    req->setContentTypeCode(drogon::CT_APPLICATION_X_FORM);
    req->setBody(body);

    std::promise<drogon::HttpResponsePtr> promise;
    plugin.handleNotify(req,
                        [&promise](const drogon::HttpResponsePtr &resp) {
                            promise.set_value(resp);
                        });
    auto future = promise.get_future();
    if (future.wait_for(std::chrono::seconds(5)) != std::future_status::ready)
    {
        return nullptr;
    }
    return future.get();
}

std::shared_ptr<alipay::GatewayEngine> testEngine()
{
    return std::make_shared<alipay::GatewayEngine>(
        testutil::testMerchant(),
        std::make_shared<testutil::ScriptedTransport>());
}
}  // namespace

DROGON_TEST(AlipayPlugin_Notify_Success)
{
    AlipayPlugin plugin;
    plugin.setTestEngine(testEngine());
    std::string paidTradeNo;
    plugin.setNotifyHandler([&paidTradeNo](const alipay::Notify &notify) {
        paidTradeNo = notify.tradeNo;
    });

    const auto resp = postNotify(
        plugin,
        signedNotifyBody("TRADE_SUCCESS", testutil::alipayKeys().privatePem));
    REQUIRE(resp != nullptr);
    CHECK(resp->statusCode() == drogon::k200OK);
    CHECK(resp->body() == "success");
    CHECK(paidTradeNo == "2026101922001400000000000001");
}

DROGON_TEST(AlipayPlugin_Notify_WaitingDoesNotFireHandler)
{
    AlipayPlugin plugin;
    plugin.setTestEngine(testEngine());
    int calls = 0;
    plugin.setNotifyHandler([&calls](const alipay::Notify &) { ++calls; });

    const auto resp = postNotify(
        plugin,
        signedNotifyBody("WAIT_BUYER_PAY", testutil::alipayKeys().privatePem));
    REQUIRE(resp != nullptr);
    CHECK(resp->statusCode() == drogon::k200OK);
    CHECK(calls == 0);
}

DROGON_TEST(AlipayPlugin_Notify_Rejected)
{
    AlipayPlugin plugin;
    plugin.setTestEngine(testEngine());
    int calls = 0;
    plugin.setNotifyHandler([&calls](const alipay::Notify &) { ++calls; });

    auto resp = postNotify(
        plugin,
        signedNotifyBody("TRADE_SUCCESS", testutil::merchantKeys().privatePem));
    REQUIRE(resp != nullptr);
    CHECK(resp->statusCode() == drogon::k401Unauthorized);
    CHECK(resp->body() == "fail");

    resp = postNotify(plugin, "trade_status=TRADE_SUCCESS");
    REQUIRE(resp != nullptr);
    CHECK(resp->statusCode() == drogon::k400BadRequest);
    CHECK(resp->body() == "fail");
    CHECK(calls == 0);
}

DROGON_TEST(AlipayPlugin_Notify_NotConfigured)
{
    AlipayPlugin plugin;
    const auto resp = postNotify(plugin, "trade_status=TRADE_SUCCESS");
    REQUIRE(resp != nullptr);
    CHECK(resp->statusCode() == drogon::k500InternalServerError);
}

DROGON_TEST(AlipayPlugin_InitFromConfig)
{
    const auto keyPath = std::filesystem::temp_directory_path() /
                         ("alipay_key_" + drogon::utils::getUuid() + ".pem");
    {
        std::ofstream out(keyPath.string());
        out << testutil::merchantKeys().privatePem;
    }

    Json::Value config;
    config["app_id"] = "2021000000000001";
    config["private_key_path"] = keyPath.string();
    config["alipay_public_key"] = testutil::pemBody(
        testutil::alipayKeys().publicPem);
    config["gateway_url"] = "https://openapi-sandbox.dl.alipaydev.com/";
    config["timeout_seconds"] = 3.0;

    AlipayPlugin plugin;
    plugin.initAndStart(config);
    const auto engine = plugin.getEngine();
    REQUIRE(engine != nullptr);
    CHECK(engine->merchant().appId == "2021000000000001");
    CHECK(engine->merchant().signType == "RSA2");
    CHECK(engine->merchant().privateKey == testutil::merchantKeys().privatePem);
    CHECK(engine->requestUrl() ==
          "https://openapi-sandbox.dl.alipaydev.com/gateway.do?charset=UTF-8");
    plugin.shutdown();
    CHECK(plugin.getEngine() == nullptr);
    std::filesystem::remove(keyPath);

    Json::Value broken;
    broken["private_key"] = "x";
    AlipayPlugin unconfigured;
    unconfigured.initAndStart(broken);
    CHECK(unconfigured.getEngine() == nullptr);

    broken["app_id"] = "2021000000000001";
    broken["sign_type"] = "MD5";
    unconfigured.initAndStart(broken);
    CHECK(unconfigured.getEngine() == nullptr);
}
