#pragma once

#include <string>

namespace alipay
{
enum class StringCase
{
    Camel,
    Snake,
    Pascal,
    Lower
};

std::string toCase(const std::string &camelName, StringCase stringCase);

// Lower is lossy; such keys come back unchanged.
std::string fromCase(const std::string &wireName, StringCase stringCase);
}  // namespace alipay
