#include "HttpTransport.h"
#include "GatewayException.h"
#include <drogon/HttpClient.h>
#include <trantor/utils/Logger.h>

namespace alipay
{
namespace
{
// Splits "https://host[:port]/path?query" into origin and path+query.
bool splitUrl(const std::string &url, std::string &origin, std::string &path)
{
    const auto schemePos = url.find("://");
    if (schemePos == std::string::npos)
    {
        return false;
    }
    const auto pathPos = url.find_first_of("/?", schemePos + 3);
    if (pathPos == std::string::npos)
    {
        origin = url;
        path = "/";
        return true;
    }
    origin = url.substr(0, pathPos);
    path = url.substr(pathPos);
    if (path[0] == '?')
    {
        path.insert(0, "/");
    }
    return true;
}
}  // namespace

DrogonHttpTransport::DrogonHttpTransport(double timeoutSeconds)
    : timeoutSeconds_(timeoutSeconds), loopThread_("AlipayHttpLoop")
{
    loopThread_.run();
}

std::string DrogonHttpTransport::post(const std::string &url,
                                      const std::string &formBody)
{
    return send(url, true, formBody);
}

std::string DrogonHttpTransport::get(const std::string &url)
{
    return send(url, false, {});
}

std::string DrogonHttpTransport::send(const std::string &url,
                                      bool isPost,
                                      const std::string &body)
{
    std::string origin;
    std::string path;
    if (!splitUrl(url, origin, path))
    {
        throw TransportError("invalid url: " + url);
    }

    auto client =
        drogon::HttpClient::newHttpClient(origin, loopThread_.getLoop());
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setPathEncode(false);
    req->setPath(path);
    if (isPost)
    {
        req->setMethod(drogon::Post);
        req->setContentTypeCode(drogon::CT_APPLICATION_X_FORM);
        req->setBody(body);
    }
    else
    {
        req->setMethod(drogon::Get);
    }
    req->addHeader("Accept", "application/json");
    req->addHeader("User-Agent", "AlipayGateway/1.0");

    auto [result, resp] = client->sendRequest(req, timeoutSeconds_);
    if (result != drogon::ReqResult::Ok || !resp)
    {
        LOG_WARN << "HTTP " << (isPost ? "POST " : "GET ") << origin
                 << " failed, ReqResult=" << static_cast<int>(result);
        throw TransportError("http request failed");
    }
    const auto status = static_cast<int>(resp->statusCode());
    if (status < 200 || status >= 300)
    {
        LOG_WARN << "HTTP " << origin << " returned status " << status;
        throw TransportError("unexpected http status: " +
                             std::to_string(status));
    }
    return std::string(resp->body());
}
}  // namespace alipay
