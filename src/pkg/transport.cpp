#include <zb/transport.hpp>
#include <zb/log.hpp>
#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace zb {

namespace {

struct SinkContext {
    const Transport::ChunkSink* sink;
    bool aborted = false;
};

size_t curl_write_chunk(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<SinkContext*>(userdata);
    size_t total = size * nmemb;
    if (!(*ctx->sink)(reinterpret_cast<const uint8_t*>(ptr), total)) {
        ctx->aborted = true;
        return 0;
    }
    return total;
}

Status curl_ensure_initialized() {
    static std::once_flag once;
    static CURLcode init_code = CURLE_OK;
    std::call_once(once, [] {
        init_code = curl_global_init(CURL_GLOBAL_DEFAULT);
    });
    if (init_code != CURLE_OK) {
        return ZbError{ZbError::TransportFailure,
            std::string("curl_global_init failed: ") + curl_easy_strerror(init_code)};
    }
    return ok_status();
}

} // namespace

CurlTransport::CurlTransport(TransportOptions opts) : opts_(std::move(opts)) {}

Status CurlTransport::get(const std::string& url, const ChunkSink& sink) {
    ZB_TRY(curl_ensure_initialized());

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle{
        curl_easy_init(), &curl_easy_cleanup};
    if (!handle) {
        return ZbError{ZbError::TransportFailure, "curl_easy_init failed"};
    }

    SinkContext ctx{&sink};
    char errbuf[CURL_ERROR_SIZE] = {0};

    CURL* h = handle.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(h, CURLOPT_USERAGENT, opts_.user_agent.c_str());
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, opts_.connect_timeout_s);
    curl_easy_setopt(h, CURLOPT_TIMEOUT, opts_.timeout_s);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, curl_write_chunk);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &ctx);

    log::trace("GET %s", url.c_str());
    CURLcode rc = curl_easy_perform(h);
    if (rc == CURLE_OK) return ok_status();

    std::string detail = errbuf[0] ? errbuf : curl_easy_strerror(rc);

    if (ctx.aborted) {
        return ZbError{ZbError::TransportFailure,
            "download of " + url + " aborted by receiver"};
    }
    if (rc == CURLE_OPERATION_TIMEDOUT) {
        return ZbError{ZbError::Timeout, "timed out fetching " + url + ": " + detail};
    }

    long status = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
    std::string msg = "failed to fetch " + url + ": " + detail;
    if (status >= 400) msg += " (HTTP " + std::to_string(status) + ")";
    return ZbError{ZbError::TransportFailure, msg};
}

} // namespace zb
