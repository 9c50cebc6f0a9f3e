#ifndef SHUTTLE_CURL_GLOBAL_HPP_
#define SHUTTLE_CURL_GLOBAL_HPP_

#include <memory>

#include <curl/curl.h>

namespace shuttle {

// libcurl's process-wide setup, done once before the first easy handle
class CurlGlobal {
public:
    static void ensureInitialized();

    ~CurlGlobal();
    CurlGlobal(CurlGlobal const&) = delete;
    CurlGlobal& operator=(CurlGlobal const&) = delete;

private:
    CurlGlobal();
};

struct CurlEasyDeleter { void operator()(CURL *handle) { curl_easy_cleanup(handle); } };
using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;

struct CurlSlistDeleter { void operator()(curl_slist *list) { curl_slist_free_all(list); } };
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

}  // namespace shuttle

#endif  // SHUTTLE_CURL_GLOBAL_HPP_
