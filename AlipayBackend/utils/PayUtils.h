#pragma once
#include <cstdint>
#include <json/json.h>
#include <string>

namespace alipay::utils
{
bool getRequiredString(const Json::Value &json,
                       const char *key,
                       std::string &value);

bool parseAmountToFen(const std::string &amount, int64_t &fen);

std::string toJsonString(const Json::Value &value);

bool readFile(const std::string &path, std::string &content, std::string &error);

// Local time rendered with a strftime pattern.
std::string formatLocalTime(const char *pattern);
}
