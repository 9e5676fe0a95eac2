#include "utils/http_client.hpp"

#include <curl/curl.h>

#include <exception>
#include <memory>

namespace printvoice {
namespace utils {

namespace {

struct TransferState {
    CURL* curl = nullptr;
    std::string body;
    const HttpClient::ChunkHandler* onChunk = nullptr;
    const CancellationToken* cancel = nullptr;
    std::exception_ptr handlerError;
};

size_t writeCallback(char* data, size_t size, size_t nmemb, void* userp) {
    auto* state = static_cast<TransferState*>(userp);
    size_t total = size * nmemb;

    if (state->onChunk) {
        long status = 0;
        curl_easy_getinfo(state->curl, CURLINFO_RESPONSE_CODE, &status);
        if (status >= 200 && status < 300) {
            try {
                (*state->onChunk)(data, total);
            } catch (const std::exception&) {
                state->handlerError = std::current_exception();
                return 0;
            }
            return total;
        }
    }

    state->body.append(data, total);
    return total;
}

int progressCallback(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* state = static_cast<TransferState*>(userp);
    return (state->cancel && state->cancel->isCancelled()) ? 1 : 0;
}

struct CurlHandleDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct HeaderListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

struct MimeDeleter {
    void operator()(curl_mime* mime) const { curl_mime_free(mime); }
};

using CurlHandle = std::unique_ptr<CURL, CurlHandleDeleter>;
using HeaderList = std::unique_ptr<curl_slist, HeaderListDeleter>;
using MimeHandle = std::unique_ptr<curl_mime, MimeDeleter>;

HeaderList buildHeaders(const std::vector<std::string>& headers) {
    curl_slist* list = nullptr;
    for (const auto& header : headers) {
        list = curl_slist_append(list, header.c_str());
    }
    return HeaderList(list);
}

CurlHandle newHandle() {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw HttpTransferError("Failed to initialize CURL", false);
    }
    return curl;
}

HttpResponse perform(CURL* curl, TransferState& state, const std::string& url,
                     long timeoutMs, long connectTimeoutMs) {
    state.curl = curl;
    if (state.cancel && state.cancel->isCancelled()) {
        throw HttpTransferError("Request cancelled", true);
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &state);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeoutMs);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, connectTimeoutMs);

    CURLcode res = curl_easy_perform(curl);

    if (state.handlerError) {
        std::rethrow_exception(state.handlerError);
    }
    if (res == CURLE_ABORTED_BY_CALLBACK) {
        throw HttpTransferError("Request cancelled", true);
    }
    if (res != CURLE_OK) {
        throw HttpTransferError(std::string("HTTP request failed: ") + curl_easy_strerror(res), false);
    }

    HttpResponse response;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    response.body = std::move(state.body);
    return response;
}

} // namespace

HttpClient::HttpClient(long timeoutMs, long connectTimeoutMs)
    : timeoutMs_(timeoutMs), connectTimeoutMs_(connectTimeoutMs) {
}

void HttpClient::globalInit() {
    CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (res != CURLE_OK) {
        throw HttpTransferError(std::string("curl_global_init failed: ") + curl_easy_strerror(res), false);
    }
}

void HttpClient::globalCleanup() {
    curl_global_cleanup();
}

HttpResponse HttpClient::postJson(const std::string& url,
                                  const std::vector<std::string>& headers,
                                  const std::string& body,
                                  const CancellationToken& cancel) const {
    CurlHandle curl = newHandle();
    std::vector<std::string> allHeaders = headers;
    allHeaders.push_back("Content-Type: application/json");
    HeaderList headerList = buildHeaders(allHeaders);

    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headerList.get());

    TransferState state;
    state.cancel = &cancel;
    return perform(curl.get(), state, url, timeoutMs_, connectTimeoutMs_);
}

HttpResponse HttpClient::postMultipart(const std::string& url,
                                       const std::vector<std::string>& headers,
                                       const std::vector<MultipartPart>& parts,
                                       const CancellationToken& cancel) const {
    CurlHandle curl = newHandle();
    HeaderList headerList = buildHeaders(headers);

    MimeHandle mime(curl_mime_init(curl.get()));
    for (const auto& part : parts) {
        curl_mimepart* field = curl_mime_addpart(mime.get());
        curl_mime_name(field, part.name.c_str());
        curl_mime_data(field, part.data.data(), part.data.size());
        if (!part.fileName.empty()) {
            curl_mime_filename(field, part.fileName.c_str());
        }
        if (!part.mimeType.empty()) {
            curl_mime_type(field, part.mimeType.c_str());
        }
    }

    curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());
    if (headerList) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headerList.get());
    }

    TransferState state;
    state.cancel = &cancel;
    return perform(curl.get(), state, url, timeoutMs_, connectTimeoutMs_);
}

HttpResponse HttpClient::postStreaming(const std::string& url,
                                       const std::vector<std::string>& headers,
                                       const std::string& body,
                                       const ChunkHandler& onChunk,
                                       const CancellationToken& cancel) const {
    CurlHandle curl = newHandle();
    std::vector<std::string> allHeaders = headers;
    allHeaders.push_back("Content-Type: application/json");
    HeaderList headerList = buildHeaders(allHeaders);

    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headerList.get());

    TransferState state;
    state.cancel = &cancel;
    state.onChunk = &onChunk;
    return perform(curl.get(), state, url, timeoutMs_, connectTimeoutMs_);
}

} // namespace utils
} // namespace printvoice
