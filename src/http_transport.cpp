/**
 * @file http_transport.cpp
 * @brief libcurl transport and query-string helpers
 */

#include "geo_estimator/http_transport.hpp"
#include <curl/curl.h>
#include <cstdio>
#include <mutex>
#include <stdexcept>

namespace geo_estimator {

// ============================================================================
// Query helpers
// ============================================================================

std::string urlEncode(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                          (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

std::string encodeQuery(const QueryParams& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty()) {
            query.push_back('&');
        }
        query += urlEncode(key);
        query.push_back('=');
        query += urlEncode(value);
    }
    return query;
}

std::string formatNumber(double value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.10g", value);
    return std::string(buffer);
}

std::string HttpRequest::fullUrl() const {
    if (params.empty()) {
        return url;
    }
    char sep = url.find('?') == std::string::npos ? '?' : '&';
    return url + sep + encodeQuery(params);
}

// ============================================================================
// libcurl callbacks
// ============================================================================

namespace {

std::once_flag g_curl_global_once;

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total);
    return total;
}

size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    size_t total = size * nitems;
    auto* headers = static_cast<std::unordered_map<std::string, std::string>*>(userp);

    std::string line(buffer, total);
    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string key = line.substr(0, colon);
        size_t start = line.find_first_not_of(" \t", colon + 1);
        size_t end = line.find_last_not_of("\r\n");
        std::string value = (start == std::string::npos || end == std::string::npos || end < start)
            ? std::string()
            : line.substr(start, end - start + 1);
        (*headers)[key] = value;
    }
    return total;
}

int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* cancel = static_cast<const CancellationToken*>(clientp);
    return (cancel != nullptr && cancel->isCancelled()) ? 1 : 0;
}

TransportError classifyCurlCode(CURLcode code) {
    switch (code) {
        case CURLE_OK:
            return TransportError::NONE;
        case CURLE_OPERATION_TIMEDOUT:
            return TransportError::TIMEOUT;
        case CURLE_ABORTED_BY_CALLBACK:
            return TransportError::CANCELLED;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return TransportError::MALFORMED;
        default:
            return TransportError::CONNECTION;
    }
}

} // namespace

// ============================================================================
// CurlHttpTransport
// ============================================================================

struct CurlHttpTransport::Pool {
    CURLSH* share = nullptr;
    std::mutex share_locks[CURL_LOCK_DATA_LAST];

    std::mutex idle_mutex;
    std::vector<CURL*> idle;

    static void lock(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
        static_cast<Pool*>(userptr)->share_locks[data].lock();
    }

    static void unlock(CURL*, curl_lock_data data, void* userptr) {
        static_cast<Pool*>(userptr)->share_locks[data].unlock();
    }

    CURL* acquire() {
        {
            std::lock_guard<std::mutex> guard(idle_mutex);
            if (!idle.empty()) {
                CURL* handle = idle.back();
                idle.pop_back();
                return handle;
            }
        }
        return curl_easy_init();
    }

    void release(CURL* handle) {
        curl_easy_reset(handle);
        std::lock_guard<std::mutex> guard(idle_mutex);
        idle.push_back(handle);
    }
};

CurlHttpTransport::CurlHttpTransport(std::string user_agent)
    : user_agent_(std::move(user_agent)), pool_(std::make_unique<Pool>()) {
    // curl_global_init is not thread-safe; run it once per process
    std::call_once(g_curl_global_once, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("curl_global_init failed");
        }
    });

    pool_->share = curl_share_init();
    if (pool_->share == nullptr) {
        throw std::runtime_error("curl_share_init failed");
    }
    curl_share_setopt(pool_->share, CURLSHOPT_LOCKFUNC, &Pool::lock);
    curl_share_setopt(pool_->share, CURLSHOPT_UNLOCKFUNC, &Pool::unlock);
    curl_share_setopt(pool_->share, CURLSHOPT_USERDATA, pool_.get());
    curl_share_setopt(pool_->share, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
    curl_share_setopt(pool_->share, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(pool_->share, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
}

CurlHttpTransport::~CurlHttpTransport() {
    for (CURL* handle : pool_->idle) {
        curl_easy_cleanup(handle);
    }
    pool_->idle.clear();
    if (pool_->share != nullptr) {
        curl_share_cleanup(pool_->share);
    }
}

HttpResponse CurlHttpTransport::get(
    const HttpRequest& request,
    std::chrono::milliseconds timeout,
    const CancellationToken* cancel
) {
    HttpResponse response;

    if (cancel != nullptr && cancel->isCancelled()) {
        response.error_kind = TransportError::CANCELLED;
        response.error = "cancelled before send";
        return response;
    }

    CURL* curl = pool_->acquire();
    if (curl == nullptr) {
        response.error_kind = TransportError::CONNECTION;
        response.error = "Failed to initialize CURL";
        return response;
    }

    std::string url = request.fullUrl();
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_SHARE, pool_->share);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, cancel);

    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : request.headers) {
        std::string header = key + ": " + value;
        header_list = curl_slist_append(header_list, header.c_str());
    }
    if (header_list != nullptr) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }

    CURLcode res = curl_easy_perform(curl);

    if (res == CURLE_OK) {
        long http_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
        response.status_code = static_cast<int>(http_code);
    } else {
        response.error_kind = classifyCurlCode(res);
        response.error = curl_easy_strerror(res);
    }

    if (header_list != nullptr) {
        curl_slist_free_all(header_list);
    }
    pool_->release(curl);

    return response;
}

} // namespace geo_estimator
