#pragma once
#include <string>
#include "../network/proxy/proxy_config.hpp"
#include "fetchium/types.hpp"

namespace Fetchium {
namespace Download {

/**
 * @brief Unpacks a downloaded artifact into a browser directory.
 *
 * Entries are written to "<target>.extracting" and the directory is renamed to
 * the target only after every entry was written, so the target never holds a
 * partial tree. A single top-level folder ("chrome-linux/", "firefox/") is
 * stripped. For Windows Firefox installers the 7-Zip payload is cut out of the
 * setup executable and its "core/" folder becomes the browser directory.
 * Failures throw FetchError(DownloadFailed).
 */
class Extractor {
public:
    // "<dest_dir>/chromium-98.0.4758.102-linux-x86_64"
    static std::string target_dir(const ResolvedBuild& build, const std::string& dest_dir);

    // zip, tar archives and Windows installers; disk images are kept as downloaded.
    static bool can_extract(const std::string& artifact_path);

    static std::string extract(const ResolvedBuild&               build,
                               const std::string&                 artifact_path,
                               const std::string&                 dest_dir,
                               const Network::Proxy::CancelFlag&  cancel = nullptr);
};

}  // namespace Download
}  // namespace Fetchium
