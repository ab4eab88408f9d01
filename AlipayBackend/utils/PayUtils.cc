#include "PayUtils.h"
#include <cctype>
#include <fstream>
#include <iterator>
#include <trantor/utils/Date.h>

namespace alipay::utils
{
bool getRequiredString(const Json::Value &json,
                       const char *key,
                       std::string &value)
{
    if (!json.isMember(key))
    {
        return false;
    }
    if (json[key].isString())
    {
        value = json[key].asString();
        return !value.empty();
    }
    if (json[key].isNumeric())
    {
        value = json[key].asString();
        return !value.empty();
    }
    return false;
}

bool parseAmountToFen(const std::string &amount, int64_t &fen)
{
    if (amount.empty())
    {
        return false;
    }

    std::string yuanPart;
    std::string centPart;
    const auto dotPos = amount.find('.');
    if (dotPos == std::string::npos)
    {
        yuanPart = amount;
        centPart = "00";
    }
    else
    {
        yuanPart = amount.substr(0, dotPos);
        centPart = amount.substr(dotPos + 1);
    }

    if (yuanPart.empty())
    {
        yuanPart = "0";
    }

    for (char c : yuanPart)
    {
        if (!std::isdigit(static_cast<unsigned char>(c)))
        {
            return false;
        }
    }
    for (char c : centPart)
    {
        if (!std::isdigit(static_cast<unsigned char>(c)))
        {
            return false;
        }
    }

    if (centPart.size() > 2 || yuanPart.size() > 15)
    {
        return false;
    }
    if (centPart.size() == 1)
    {
        centPart.push_back('0');
    }
    if (centPart.empty())
    {
        centPart = "00";
    }

    const int64_t yuan = std::stoll(yuanPart);
    const int64_t cents = std::stoll(centPart);
    fen = yuan * 100 + cents;
    return true;
}

std::string toJsonString(const Json::Value &value)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    // Decimal amounts such as 88.88 read back unchanged.
    builder["precision"] = 15;
    return Json::writeString(builder, value);
}

bool readFile(const std::string &path, std::string &content, std::string &error)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        error = "failed to open file: " + path;
        return false;
    }
    content.assign((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());
    return true;
}

std::string formatLocalTime(const char *pattern)
{
    return trantor::Date::now().toCustomFormattedStringLocal(pattern);
}
}  // namespace alipay::utils
