#pragma once

#include <string>
#include <trantor/net/EventLoopThread.h>

namespace alipay
{
class HttpTransport
{
  public:
    virtual ~HttpTransport() = default;

    virtual std::string post(const std::string &url,
                             const std::string &formBody) = 0;
    virtual std::string get(const std::string &url) = 0;
};

class DrogonHttpTransport : public HttpTransport
{
  public:
    explicit DrogonHttpTransport(double timeoutSeconds = 15.0);

    std::string post(const std::string &url,
                     const std::string &formBody) override;
    std::string get(const std::string &url) override;

  private:
    std::string send(const std::string &url,
                     bool isPost,
                     const std::string &body);

    double timeoutSeconds_;
    trantor::EventLoopThread loopThread_;
};
}  // namespace alipay
