#include "GatewayData.h"
#include "Constants.h"
#include "GatewayException.h"
#include "../utils/PayUtils.h"
#include <drogon/HttpViewData.h>
#include <drogon/utils/Utilities.h>
#include <algorithm>
#include <memory>

namespace alipay
{
namespace
{
bool isSignatureField(const std::string &key)
{
    return key == constant::SIGN || key == constant::SIGN_TYPE;
}

std::string scalarToString(const Json::Value &value)
{
    if (value.isString())
    {
        return value.asString();
    }
    if (value.isNull())
    {
        return {};
    }
    if (value.isObject() || value.isArray() ||
        (value.isDouble() && !value.isIntegral()))
    {
        return utils::toJsonString(value);
    }
    return value.asString();
}
}  // namespace

std::vector<GatewayData::Entry>::iterator GatewayData::find(
    const std::string &key)
{
    return std::find_if(entries_.begin(), entries_.end(),
                        [&key](const Entry &e) { return e.first == key; });
}

std::vector<GatewayData::Entry>::const_iterator GatewayData::find(
    const std::string &key) const
{
    return std::find_if(entries_.begin(), entries_.end(),
                        [&key](const Entry &e) { return e.first == key; });
}

void GatewayData::add(const std::string &key, const std::string &value)
{
    auto it = find(key);
    if (it != entries_.end())
    {
        it->second = value;
        return;
    }
    entries_.emplace_back(key, value);
}

bool GatewayData::remove(const std::string &key)
{
    auto it = find(key);
    if (it == entries_.end())
    {
        return false;
    }
    entries_.erase(it);
    return true;
}

bool GatewayData::exists(const std::string &key) const
{
    return find(key) != entries_.end();
}

std::string GatewayData::getStringValue(const std::string &key) const
{
    auto it = find(key);
    if (it == entries_.end())
    {
        return {};
    }
    return it->second;
}

std::string GatewayData::toCanonicalString(bool includeSignatureFields) const
{
    std::string out;
    for (const auto &entry : entries_)
    {
        if (!includeSignatureFields && isSignatureField(entry.first))
        {
            continue;
        }
        if (!out.empty())
        {
            out.push_back('&');
        }
        out += entry.first;
        out.push_back('=');
        out += drogon::utils::urlEncodeComponent(entry.second);
    }
    return out;
}

std::string GatewayData::toUrlEncodedBody() const
{
    return toCanonicalString(true);
}

std::string GatewayData::toForm(const std::string &url) const
{
    using drogon::HttpViewData;
    std::string html = "<form id=\"gatewayform\" action=\"" +
                       HttpViewData::htmlTranslate(url) +
                       "\" method=\"POST\">";
    for (const auto &entry : entries_)
    {
        html += "<input type=\"hidden\" name=\"" +
                HttpViewData::htmlTranslate(entry.first) + "\" value=\"" +
                HttpViewData::htmlTranslate(entry.second) + "\"/>";
    }
    html += "<input type=\"submit\" style=\"display:none\"/></form>"
            "<script>document.forms['gatewayform'].submit();</script>";
    return html;
}

Json::Value GatewayData::toJson() const
{
    Json::Value root(Json::objectValue);
    for (const auto &entry : entries_)
    {
        root[entry.first] = entry.second;
    }
    return root;
}

void GatewayData::fromJson(const std::string &text)
{
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    if (text.empty() ||
        !reader->parse(text.data(), text.data() + text.size(), &root, &errors))
    {
        throw MalformedResponse("invalid json response");
    }
    fromJson(root);
}

void GatewayData::fromJson(const Json::Value &object)
{
    if (!object.isObject())
    {
        throw MalformedResponse("response is not a json object");
    }
    entries_.clear();
    for (const auto &name : object.getMemberNames())
    {
        entries_.emplace_back(name, scalarToString(object[name]));
    }
}

void GatewayData::fromUrl(const std::string &query)
{
    entries_.clear();
    std::string params = query;
    const auto questionPos = params.find('?');
    if (questionPos != std::string::npos)
    {
        params = params.substr(questionPos + 1);
    }

    size_t start = 0;
    while (start <= params.size())
    {
        auto end = params.find('&', start);
        if (end == std::string::npos)
        {
            end = params.size();
        }
        const auto pair = params.substr(start, end - start);
        if (!pair.empty())
        {
            const auto eq = pair.find('=');
            std::string key = pair.substr(0, eq);
            std::string value =
                eq == std::string::npos ? std::string() : pair.substr(eq + 1);
            // Form encoding writes spaces as '+'; a literal '+' is %2B.
            std::replace(key.begin(), key.end(), '+', ' ');
            std::replace(value.begin(), value.end(), '+', ' ');
            add(drogon::utils::urlDecode(key), drogon::utils::urlDecode(value));
        }
        start = end + 1;
    }
}
}  // namespace alipay
