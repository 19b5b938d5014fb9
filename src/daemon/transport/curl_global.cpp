#include "transport/curl_global.hpp"

#include <curl/curl.h>
#include <mutex>
#include <print>

namespace curl_global {

namespace {

std::mutex mutex;
int refcount = 0;

} // namespace

bool acquire() {
    std::lock_guard lock(mutex);
    if (refcount == 0) {
        CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (res != CURLE_OK) {
            std::println(stderr, "curl: global init failed: {}", curl_easy_strerror(res));
            return false;
        }
    }
    ++refcount;
    return true;
}

void release() {
    std::lock_guard lock(mutex);
    if (refcount <= 0) return;
    if (--refcount == 0) {
        curl_global_cleanup();
    }
}

} // namespace curl_global
