#include "curl_global.hpp"

#include <spdlog/spdlog.h>

#include <shuttle/exceptions.hpp>

namespace shuttle {

void CurlGlobal::ensureInitialized()
{
    static CurlGlobal const instance;
}

CurlGlobal::CurlGlobal()
{
    if (auto const rc = curl_global_init(CURL_GLOBAL_ALL); rc != CURLE_OK) {
        throw TransportError{std::string{"curl_global_init failed: "} + curl_easy_strerror(rc)};
    }
    spdlog::debug("Initialized {}", curl_version());
}

CurlGlobal::~CurlGlobal()
{
    curl_global_cleanup();
}

}  // namespace shuttle
