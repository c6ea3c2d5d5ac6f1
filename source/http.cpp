#include "iman/http.hpp"
#include "iman/logger.hpp"
#include "iman/util.hpp"
#include "iman/version.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <memory>
#include <mutex>

namespace iman {

namespace {
constexpr size_t kErrorBodySnippet = 256;
constexpr long kMaxRedirects = 5;
constexpr long kLowSpeedBytes = 64;
constexpr long kCurlBufferSize = 64 * 1024;

void globalInit() {
    static std::once_flag once;
    std::call_once(once, []() {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) logError(std::string("curl_global_init failed: ") + curl_easy_strerror(rc), "HTTP");
    });
}

struct Transfer {
    CURL* curl{nullptr};
    const DataSink* sink{nullptr};
    HttpResponse* resp{nullptr};
    std::string errorBody;
    bool sinkAborted{false};
};

// Every response in a redirect chain starts with its status line; keep the last one.
size_t onHeader(char* data, size_t size, size_t nmemb, void* userp) {
    auto* t = static_cast<Transfer*>(userp);
    const size_t len = size * nmemb;
    const std::string line(data, len);
    if (line.rfind("HTTP/", 0) == 0) {
        t->resp->headersRaw.clear();
        const auto sp1 = line.find(' ');
        const auto sp2 = sp1 == std::string::npos ? sp1 : line.find(' ', sp1 + 1);
        t->resp->statusText = sp2 == std::string::npos ? std::string() : util::trim(line.substr(sp2 + 1));
    }
    t->resp->headersRaw += line;
    return len;
}

// Only 2xx bodies reach the sink; others keep a short snippet for the error.
size_t onBody(char* data, size_t size, size_t nmemb, void* userp) {
    auto* t = static_cast<Transfer*>(userp);
    const size_t len = size * nmemb;
    long code = 0;
    curl_easy_getinfo(t->curl, CURLINFO_RESPONSE_CODE, &code);
    if (code < 200 || code >= 300) {
        if (t->errorBody.size() < kErrorBodySnippet)
            t->errorBody.append(data, std::min(len, kErrorBodySnippet - t->errorBody.size()));
        return len;
    }
    if (*t->sink && !(*t->sink)(data, len)) {
        t->sinkAborted = true;
        return 0;
    }
    return len;
}

// Reword curl failures so classifyError() sees the usual transport phrases.
std::string describeFailure(CURLcode rc, const Transfer& t, const std::string& url, const char* errbuf) {
    const std::string why = errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(rc));
    switch (rc) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return "DNS lookup failed for " + url + ": " + why;
        case CURLE_COULDNT_CONNECT:
            return "Connect failed: " + why;
        case CURLE_OPERATION_TIMEDOUT:
            return "Transfer timed out: " + why;
        case CURLE_TOO_MANY_REDIRECTS:
            return "Too many redirects fetching " + url;
        case CURLE_UNSUPPORTED_PROTOCOL:
            return "Protocol not supported: " + url;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
            return "TLS handshake failed: " + why;
        case CURLE_SEND_ERROR:
            return "Send failed: " + why;
        case CURLE_RECV_ERROR:
            return "Recv failed: " + why;
        case CURLE_PARTIAL_FILE:
            return "Short read: " + why;
        case CURLE_GOT_NOTHING:
            return "Empty HTTP response from " + url;
        case CURLE_WRITE_ERROR:
            if (t.sinkAborted) return "Sink aborted";
            return "Transport failure: " + why;
        default:
            return "Transport failure: " + why;
    }
}
} // namespace

std::string resolveUrl(const std::string& baseUrl, const std::string& location) {
    if (location.rfind("http://", 0) == 0 || location.rfind("https://", 0) == 0) return location;
    auto schemeEnd = baseUrl.find("://");
    std::string scheme = schemeEnd == std::string::npos ? "http" : baseUrl.substr(0, schemeEnd);
    if (location.rfind("//", 0) == 0) return scheme + ":" + location;
    size_t authStart = schemeEnd == std::string::npos ? 0 : schemeEnd + 3;
    size_t pathStart = baseUrl.find('/', authStart);
    std::string origin = pathStart == std::string::npos ? baseUrl : baseUrl.substr(0, pathStart);
    if (!location.empty() && location.front() == '/') return origin + location;
    std::string basePath = pathStart == std::string::npos ? "/" : baseUrl.substr(pathStart);
    auto q = basePath.find('?');
    if (q != std::string::npos) basePath = basePath.substr(0, q);
    basePath = basePath.substr(0, basePath.rfind('/') + 1);
    return origin + basePath + location;
}

bool httpGetStream(const std::string& url,
                   int timeoutSec,
                   HttpResponse& resp,
                   const DataSink& onData,
                   std::string& err)
{
    resp = HttpResponse{};
    if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
        err = "Protocol not supported: " + url;
        return false;
    }
    globalInit();
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        err = "Transport failure: curl_easy_init failed";
        return false;
    }

    const long timeout = std::max(timeoutSec, 1);
    const std::string agent = std::string("insteadman/") + appVersion();
    char errbuf[CURL_ERROR_SIZE] = {0};
    Transfer t;
    t.curl = curl.get();
    t.sink = &onData;
    t.resp = &resp;

    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, kMaxRedirects);
#if LIBCURL_VERSION_NUM >= 0x075500
    curl_easy_setopt(h, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(h, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
#else
    curl_easy_setopt(h, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
    curl_easy_setopt(h, CURLOPT_REDIR_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
#endif
    curl_easy_setopt(h, CURLOPT_USERAGENT, agent.c_str());
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
    // Byte counts must match the archive size announced by the index.
    curl_easy_setopt(h, CURLOPT_ACCEPT_ENCODING, "identity");
    curl_easy_setopt(h, CURLOPT_BUFFERSIZE, kCurlBufferSize);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, &onHeader);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &t);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, &onBody);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &t);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, timeout);
    curl_easy_setopt(h, CURLOPT_LOW_SPEED_TIME, timeout);
    curl_easy_setopt(h, CURLOPT_LOW_SPEED_LIMIT, kLowSpeedBytes);

    const CURLcode rc = curl_easy_perform(h);
    long code = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &code);
    resp.statusCode = static_cast<int>(code);
    char* effective = nullptr;
    if (curl_easy_getinfo(h, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) resp.finalUrl = effective;

    if (rc != CURLE_OK) {
        err = describeFailure(rc, t, url, errbuf);
        logDebug("GET " + url + " failed: " + err, "HTTP");
        return false;
    }
    if (code < 200 || code >= 300) {
        err = "HTTP " + std::to_string(code);
        if (!resp.statusText.empty()) err += " " + resp.statusText;
        if (!t.errorBody.empty()) err += " body: " + t.errorBody;
        return false;
    }
    if (resp.finalUrl != url) logDebug("GET " + url + " redirected to " + resp.finalUrl, "HTTP");
    return true;
}

bool httpGet(const std::string& url, int timeoutSec, HttpResponse& resp, std::string& err) {
    std::string body;
    bool ok = httpGetStream(url, timeoutSec, resp,
                            [&](const char* data, size_t len) {
                                body.append(data, len);
                                return true;
                            },
                            err);
    resp.body.swap(body);
    return ok;
}

bool fetchToString(const HttpGetFn& fetch, const std::string& url, int timeoutSec,
                   std::string& out, std::string& err) {
    out.clear();
    HttpResponse resp;
    return fetch(url, timeoutSec, resp,
                 [&](const char* data, size_t len) {
                     out.append(data, len);
                     return true;
                 },
                 err);
}

} // namespace iman
