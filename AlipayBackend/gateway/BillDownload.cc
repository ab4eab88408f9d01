#include "BillDownload.h"
#include "Constants.h"
#include "GatewayException.h"
#include "../utils/PayUtils.h"
#include <filesystem>
#include <fstream>
#include <trantor/utils/Logger.h>

namespace alipay
{
bool BillFile::saveTo(const std::string &directory, std::string &error) const
{
    const auto path = std::filesystem::path(directory) / fileName;
    std::ofstream out(path.string(), std::ios::binary);
    if (!out)
    {
        error = "failed to open file: " + path.string();
        return false;
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out)
    {
        error = "failed to write file: " + path.string();
        return false;
    }
    return true;
}

BillFile BillDownload::build(const Auxiliary &auxiliary) const
{
    auxiliary.validate(AuxiliaryType::BillDownload);
    const std::string method = constant::BILLDOWNLOAD;
    const auto data = engine_.assemble(method, auxiliary.toBizContent());
    const auto notify =
        engine_.commit(data, GatewayEngine::responseKeyFor(method));
    if (notify.billDownloadUrl.empty())
    {
        throw MalformedResponse("response has no bill_download_url");
    }

    BillFile file;
    file.url = notify.billDownloadUrl;

    GatewayData query;
    query.fromUrl(file.url);
    file.fileType = query.getStringValue(constant::FILE_TYPE);
    if (file.fileType.empty())
    {
        file.fileType = "zip";
    }
    file.fileName =
        utils::formatLocalTime("%Y%m%d%H%M%S") + "." + file.fileType;

    LOG_INFO << "Downloading bill " << auxiliary.billType << " "
             << auxiliary.billDate << " as " << file.fileName;
    file.content = engine_.transport().get(file.url);
    return file;
}
}  // namespace alipay
