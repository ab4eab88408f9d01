#pragma once

#include "Auxiliary.h"
#include "GatewayEngine.h"
#include <string>

namespace alipay
{
struct BillFile
{
    std::string url;
    std::string fileType;
    // <yyyyMMddHHmmss>.<fileType>
    std::string fileName;
    std::string content;

    bool saveTo(const std::string &directory, std::string &error) const;
};

class BillDownload
{
  public:
    explicit BillDownload(const GatewayEngine &engine) : engine_(engine)
    {
    }

    BillFile build(const Auxiliary &auxiliary) const;

  private:
    const GatewayEngine &engine_;
};
}  // namespace alipay
