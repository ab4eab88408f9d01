#include "StringCase.h"
#include <cctype>

namespace alipay
{
namespace
{
std::string camelToSnake(const std::string &name)
{
    std::string out;
    out.reserve(name.size() + 4);
    for (size_t i = 0; i < name.size(); ++i)
    {
        const auto c = static_cast<unsigned char>(name[i]);
        if (std::isupper(c))
        {
            if (i != 0)
            {
                out.push_back('_');
            }
            out.push_back(static_cast<char>(std::tolower(c)));
        }
        else
        {
            out.push_back(name[i]);
        }
    }
    return out;
}

std::string snakeToCamel(const std::string &name)
{
    std::string out;
    out.reserve(name.size());
    bool upperNext = false;
    for (char c : name)
    {
        if (c == '_')
        {
            upperNext = !out.empty();
            continue;
        }
        if (upperNext)
        {
            out.push_back(static_cast<char>(
                std::toupper(static_cast<unsigned char>(c))));
            upperNext = false;
        }
        else
        {
            out.push_back(c);
        }
    }
    return out;
}
}  // namespace

std::string toCase(const std::string &camelName, StringCase stringCase)
{
    if (camelName.empty())
    {
        return camelName;
    }
    switch (stringCase)
    {
        case StringCase::Snake:
            return camelToSnake(camelName);
        case StringCase::Pascal:
        {
            auto out = camelName;
            out[0] = static_cast<char>(
                std::toupper(static_cast<unsigned char>(out[0])));
            return out;
        }
        case StringCase::Lower:
        {
            std::string out;
            out.reserve(camelName.size());
            for (char c : camelName)
            {
                out.push_back(static_cast<char>(
                    std::tolower(static_cast<unsigned char>(c))));
            }
            return out;
        }
        case StringCase::Camel:
            break;
    }
    return camelName;
}

std::string fromCase(const std::string &wireName, StringCase stringCase)
{
    if (wireName.empty())
    {
        return wireName;
    }
    switch (stringCase)
    {
        case StringCase::Snake:
            return snakeToCamel(wireName);
        case StringCase::Pascal:
        {
            auto out = wireName;
            out[0] = static_cast<char>(
                std::tolower(static_cast<unsigned char>(out[0])));
            return out;
        }
        case StringCase::Lower:
        case StringCase::Camel:
            break;
    }
    return wireName;
}
}  // namespace alipay
