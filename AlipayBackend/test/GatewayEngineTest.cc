#include <drogon/drogon_test.h>
#include "GatewayTestUtils.h"
#include "../gateway/TradeService.h"

namespace
{
struct TradeResult
{
    std::string code;
    std::string tradeNo;
    std::string sign;
    std::string body;
    std::map<std::string, std::string> others;

    void setField(const std::string &name, const std::string &value)
    {
        if (name == "code")
        {
            code = value;
        }
        else if (name == "tradeNo")
        {
            tradeNo = value;
        }
        else if (name == "sign")
        {
            sign = value;
        }
        else if (name == "body")
        {
            body = value;
        }
        else
        {
            others[name] = value;
        }
    }
};
}  // namespace

DROGON_TEST(GatewayEngine_AssembleSignsCanonicalString)
{
    auto transport = std::make_shared<testutil::ScriptedTransport>();
    alipay::GatewayEngine engine(testutil::testMerchant(), transport);

    const auto data =
        engine.assemble(alipay::constant::QUERY, R"({"trade_no":"T1"})");
    CHECK(data.getStringValue("method") == alipay::constant::QUERY);
    CHECK(data.getStringValue("app_id") == "2021000000000001");
    CHECK(!data.getStringValue("timestamp").empty());
    CHECK(data.getStringValue("biz_content") == R"({"trade_no":"T1"})");
    CHECK(data[data.size() - 1].first == alipay::constant::SIGN);

    CHECK(alipay::Signer::verify(data.toCanonicalString(false),
                                 data.getStringValue(alipay::constant::SIGN),
                                 testutil::merchantKeys().publicPem,
                                 "RSA2"));
}

DROGON_TEST(GatewayEngine_SubmittedBodyVerifies)
{
    auto transport = std::make_shared<testutil::ScriptedTransport>();
    transport->enqueue(testutil::envelope(alipay::constant::QUERY,
                                          testutil::tradePayload("TRADE_SUCCESS")));
    alipay::GatewayEngine engine(testutil::testMerchant(), transport);

    alipay::Auxiliary auxiliary;
    auxiliary.outTradeNo = "ORDER-1";
    alipay::TradeService(engine).query(auxiliary);

    REQUIRE(transport->requests.size() == 1);
    const auto &request = transport->requests[0];
    CHECK(request.url ==
          "https://openapi.alipay.com/gateway.do?charset=UTF-8");

    // The receiver rebuilds the canonical string from the decoded form.
    auto received = request.params();
    CHECK(alipay::Signer::verify(received.toCanonicalString(false),
                                 received.getStringValue("sign"),
                                 testutil::merchantKeys().publicPem,
                                 "RSA2"));
}

DROGON_TEST(GatewayEngine_CommitSuccess)
{
    auto transport = std::make_shared<testutil::ScriptedTransport>();
    transport->enqueue(testutil::envelope(alipay::constant::QUERY,
                                          testutil::tradePayload("TRADE_SUCCESS")));
    alipay::GatewayEngine engine(testutil::testMerchant(), transport);

    const auto data =
        engine.assemble(alipay::constant::QUERY, R"({"out_trade_no":"ORDER-1"})");
    alipay::Notify notify;
    CHECK_NOTHROW(notify = engine.commit(
                      data,
                      alipay::GatewayEngine::responseKeyFor(
                          alipay::constant::QUERY)));
    CHECK(notify.code == "10000");
    CHECK(notify.tradeStatus == "TRADE_SUCCESS");
    CHECK(notify.totalAmount == "88.88");
    CHECK(notify.sign == "ENVELOPESIGN");
}

DROGON_TEST(GatewayEngine_CommitFailureCarriesSubMessage)
{
    auto transport = std::make_shared<testutil::ScriptedTransport>();
    transport->enqueue(testutil::envelope(
        alipay::constant::QUERY,
        testutil::errorPayload("40004", "ACQ.TRADE_NOT_EXIST",
                               "ORDER_NOT_EXIST")));
    alipay::GatewayEngine engine(testutil::testMerchant(), transport);

    const auto data = engine.assemble(alipay::constant::QUERY, "{}");
    std::string message;
    std::string code;
    std::string subCode;
    try
    {
        engine.commit(data,
                      alipay::GatewayEngine::responseKeyFor(
                          alipay::constant::QUERY));
    }
    catch (const alipay::GatewayOperationError &e)
    {
        message = e.what();
        code = e.code();
        subCode = e.subCode();
    }
    CHECK(message == "ORDER_NOT_EXIST");
    CHECK(code == "40004");
    CHECK(subCode == "ACQ.TRADE_NOT_EXIST");
}

DROGON_TEST(GatewayEngine_ErrorResponseEnvelope)
{
    Json::Value root;
    root["error_response"] =
        testutil::errorPayload("40002", "isv.invalid-app-id", "bad app id");
    root["sign"] = "x";

    auto transport = std::make_shared<testutil::ScriptedTransport>();
    transport->enqueue(alipay::utils::toJsonString(root));
    alipay::GatewayEngine engine(testutil::testMerchant(), transport);

    const auto data = engine.assemble(alipay::constant::CLOSE, "{}");
    CHECK_THROWS_AS(engine.commit(data,
                                  alipay::GatewayEngine::responseKeyFor(
                                      alipay::constant::CLOSE)),
                    alipay::GatewayOperationError);
}

DROGON_TEST(GatewayEngine_NestedPayloadAsJsonString)
{
    Json::Value root;
    root[alipay::GatewayEngine::responseKeyFor(alipay::constant::QUERY)] =
        alipay::utils::toJsonString(testutil::tradePayload("WAIT_BUYER_PAY"));
    root["sign"] = "x";

    auto transport = std::make_shared<testutil::ScriptedTransport>();
    transport->enqueue(alipay::utils::toJsonString(root));
    alipay::GatewayEngine engine(testutil::testMerchant(), transport);

    const auto notify = engine.commit(
        engine.assemble(alipay::constant::QUERY, "{}"),
        alipay::GatewayEngine::responseKeyFor(alipay::constant::QUERY));
    CHECK(notify.isWaitPay());
}

DROGON_TEST(GatewayEngine_MalformedResponses)
{
    auto transport = std::make_shared<testutil::ScriptedTransport>();
    transport->enqueue("<html>502</html>");
    transport->enqueue(R"({"sign":"x","other_response":{"code":"10000"}})");
    transport->enqueue(R"({"alipay_trade_query_response":[1,2],"sign":"x"})");
    alipay::GatewayEngine engine(testutil::testMerchant(), transport);

    const auto key =
        alipay::GatewayEngine::responseKeyFor(alipay::constant::QUERY);
    const auto data = engine.assemble(alipay::constant::QUERY, "{}");
    CHECK_THROWS_AS(engine.commit(data, key), alipay::MalformedResponse);
    CHECK_THROWS_AS(engine.commit(data, key), alipay::MalformedResponse);
    CHECK_THROWS_AS(engine.commit(data, key), alipay::MalformedResponse);
}

DROGON_TEST(GatewayEngine_TransportFailurePropagates)
{
    auto transport = std::make_shared<testutil::ScriptedTransport>();
    transport->enqueueFailure();
    alipay::GatewayEngine engine(testutil::testMerchant(), transport);

    CHECK_THROWS_AS(
        engine.commit(engine.assemble(alipay::constant::QUERY, "{}"),
                      alipay::GatewayEngine::responseKeyFor(
                          alipay::constant::QUERY)),
        alipay::TransportError);
}

DROGON_TEST(GatewayEngine_UnusablePrivateKey)
{
    auto merchant = testutil::testMerchant();
    merchant.privateKey = "broken";
    alipay::GatewayEngine engine(merchant,
                                 std::make_shared<testutil::ScriptedTransport>());
    CHECK_THROWS_AS(engine.assemble(alipay::constant::QUERY, "{}"),
                    alipay::GatewayException);
}

DROGON_TEST(GatewayEngine_ResponseKeyAndUrls)
{
    CHECK(alipay::GatewayEngine::responseKeyFor(alipay::constant::REFUNDQUERY) ==
          "alipay_trade_fastpay_refund_query_response");

    alipay::GatewayEngine engine(testutil::testMerchant(),
                                 std::make_shared<testutil::ScriptedTransport>(),
                                 "https://openapi-sandbox.dl.alipaydev.com/");
    CHECK(engine.requestUrl() ==
          "https://openapi-sandbox.dl.alipaydev.com/gateway.do?charset=UTF-8");
}

DROGON_TEST(GatewayEngine_ExecuteMaterializesDeclaredType)
{
    Json::Value root;
    root["alipay_trade_orderinfo_sync_response"] = testutil::tradePayload("");
    root["sign"] = "ENVSIGN";
    const auto body = alipay::utils::toJsonString(root);

    auto transport = std::make_shared<testutil::ScriptedTransport>();
    transport->enqueue(body);
    alipay::GatewayEngine engine(testutil::testMerchant(), transport);

    alipay::Request<TradeResult> request;
    request.method = "alipay.trade.orderinfo.sync";
    request.gatewayData.add("biz_content", R"({"trade_no":"T1"})");

    const auto result = engine.execute(request);
    CHECK(result.code == "10000");
    CHECK(result.tradeNo == "2026101922001400000000000001");
    CHECK(result.sign == "ENVSIGN");
    CHECK(result.body == body);
    CHECK(result.others.at("outTradeNo") == "ORDER-1");

    REQUIRE(transport->requests.size() == 1);
    CHECK(transport->requests[0].method() == "alipay.trade.orderinfo.sync");
}

DROGON_TEST(GatewayEngine_SdkExecuteSignsWithoutSubmitting)
{
    auto transport = std::make_shared<testutil::ScriptedTransport>();
    alipay::GatewayEngine engine(testutil::testMerchant(), transport);

    alipay::Request<TradeResult> request;
    request.method = alipay::constant::APP;
    request.gatewayData.add("biz_content", R"({"out_trade_no":"ORDER-1"})");

    const auto query = engine.sdkExecute(request);
    CHECK(transport->requests.empty());

    alipay::GatewayData signedData;
    signedData.fromUrl(query);
    CHECK(signedData.getStringValue("method") == alipay::constant::APP);
    CHECK(alipay::Signer::verify(signedData.toCanonicalString(false),
                                 signedData.getStringValue("sign"),
                                 testutil::merchantKeys().publicPem,
                                 "RSA2"));
}
