#pragma once

#include "utils/cancellation.hpp"

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace printvoice {
namespace utils {

struct HttpResponse {
    long status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

struct MultipartPart {
    std::string name;
    std::string data;
    // Set for file parts only
    std::string fileName;
    std::string mimeType;
};

/**
 * Transport-level failure (DNS, connect, timeout, cancellation). HTTP error
 * statuses are not transfer errors; they come back in HttpResponse.
 */
class HttpTransferError : public std::runtime_error {
public:
    HttpTransferError(const std::string& message, bool cancelled)
        : std::runtime_error(message), cancelled_(cancelled) {}

    bool cancelled() const { return cancelled_; }

private:
    bool cancelled_;
};

/**
 * Thin blocking libcurl wrapper shared by the HTTP collaborators. Every
 * transfer polls the cancellation token and aborts once it is set.
 */
class HttpClient {
public:
    using ChunkHandler = std::function<void(const char* data, size_t size)>;

    explicit HttpClient(long timeoutMs = 30000, long connectTimeoutMs = 5000);

    HttpResponse postJson(const std::string& url,
                          const std::vector<std::string>& headers,
                          const std::string& body,
                          const CancellationToken& cancel) const;

    HttpResponse postMultipart(const std::string& url,
                               const std::vector<std::string>& headers,
                               const std::vector<MultipartPart>& parts,
                               const CancellationToken& cancel) const;

    /**
     * POST a JSON body and hand each block of a 2xx response body to
     * onChunk as it arrives. For other statuses the body is collected into
     * the returned HttpResponse instead. An exception thrown by onChunk
     * aborts the transfer and is rethrown.
     */
    HttpResponse postStreaming(const std::string& url,
                               const std::vector<std::string>& headers,
                               const std::string& body,
                               const ChunkHandler& onChunk,
                               const CancellationToken& cancel) const;

    // Call once from main before any worker thread starts
    static void globalInit();
    static void globalCleanup();

private:
    long timeoutMs_;
    long connectTimeoutMs_;
};

} // namespace utils
} // namespace printvoice
