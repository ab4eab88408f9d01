#pragma once

#include <string>

namespace alipay
{
class Signer
{
  public:
    static bool sign(const std::string &content,
                     const std::string &privateKey,
                     const std::string &signType,
                     std::string &signatureB64,
                     std::string &error);

    // Never throws; false on any mismatch or unusable input.
    static bool verify(const std::string &content,
                       const std::string &signatureB64,
                       const std::string &publicKey,
                       const std::string &signType,
                       std::string &error);

    static bool verify(const std::string &content,
                       const std::string &signatureB64,
                       const std::string &publicKey,
                       const std::string &signType);

    static bool isSupportedSignType(const std::string &signType);
};
}  // namespace alipay
