#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace iman {

struct HttpResponse {
    int         statusCode   = 0;
    std::string statusText;
    std::string headersRaw;  // headers of the final response
    std::string body;        // only filled by httpGet (buffered)
    std::string finalUrl;    // after redirects
};

// Body sink: return false to abort the transfer.
using DataSink = std::function<bool(const char*, size_t)>;

// Transport seam used by the synchronizer and installer. Delivers the body of
// a successful (2xx) GET to onData; non-2xx fails with "HTTP <code> <text>".
using HttpGetFn = std::function<bool(const std::string& url,
                                     int timeoutSec,
                                     HttpResponse& resp,
                                     const DataSink& onData,
                                     std::string& err)>;

// Resolve a possibly relative reference (Location header, index link) against baseUrl.
std::string resolveUrl(const std::string& baseUrl, const std::string& reference);

// Streaming GET of an http:// or https:// URL through libcurl; follows up to
// 5 redirects. timeoutSec bounds name resolution plus connect, and a transfer
// that moves less than 64 bytes/s for timeoutSec seconds is aborted.
bool httpGetStream(const std::string& url,
                   int timeoutSec,
                   HttpResponse& resp,
                   const DataSink& onData,
                   std::string& err);

// Buffered GET; resp.body holds the payload.
bool httpGet(const std::string& url, int timeoutSec, HttpResponse& resp, std::string& err);

// Buffered GET through an arbitrary transport.
bool fetchToString(const HttpGetFn& fetch, const std::string& url, int timeoutSec,
                   std::string& out, std::string& err);

} // namespace iman
