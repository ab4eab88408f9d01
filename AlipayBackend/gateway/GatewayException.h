#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace alipay
{
class GatewayException : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

class GatewayOperationError : public GatewayException
{
  public:
    GatewayOperationError(const std::string &subMessage,
                          std::string code,
                          std::string subCode)
        : GatewayException(subMessage),
          code_(std::move(code)),
          subCode_(std::move(subCode))
    {
    }

    const std::string &code() const noexcept
    {
        return code_;
    }
    const std::string &subCode() const noexcept
    {
        return subCode_;
    }

  private:
    std::string code_;
    std::string subCode_;
};

class SignatureMismatch : public GatewayException
{
  public:
    using GatewayException::GatewayException;
};

class MalformedResponse : public GatewayException
{
  public:
    using GatewayException::GatewayException;
};

class ValidationError : public GatewayException
{
  public:
    using GatewayException::GatewayException;
};

class TransportError : public GatewayException
{
  public:
    using GatewayException::GatewayException;
};
}  // namespace alipay
