#include <sg/http_client.h>
#include <sg/log.h>
#include <curl/curl.h>
#include <mutex>

namespace sg {

namespace {

struct EasyDeleter {
    void operator()(CURL* c) const {
        if (c) curl_easy_cleanup(c);
    }
};

struct SlistDeleter {
    void operator()(curl_slist* l) const {
        if (l) curl_slist_free_all(l);
    }
};

bool ensure_curl_initialized() {
    static std::once_flag once;
    static bool ok = false;
    std::call_once(once, [] { ok = curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK; });
    return ok;
}

size_t write_response_callback(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(data, size * nmemb);
    return size * nmemb;
}

// Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* cancel = static_cast<const CancellationToken*>(clientp);
    return cancel->is_cancelled() ? 1 : 0;
}

}  // namespace

struct HttpContentQualityClient::Handle {
    std::unique_ptr<CURL, EasyDeleter> easy;
};

HttpContentQualityClient::HttpContentQualityClient(HttpClientOptions options)
    : handle_(std::make_unique<Handle>()), options_(std::move(options)) {
    if (!ensure_curl_initialized()) throw ServiceError("failed to initialize libcurl");
    handle_->easy.reset(curl_easy_init());
    if (!handle_->easy) throw ServiceError("failed to create libcurl handle");
}

HttpContentQualityClient::~HttpContentQualityClient() = default;

Dictionary HttpContentQualityClient::request_body(const AssessmentRequest& request, const std::string& model) {
    Dictionary body;
    body["model"] = model;
    body["prompt"] = request.prompt;
    body["stream"] = false;
    body["format"] = "json";
    body["context"] = request.context;
    return body;
}

std::string HttpContentQualityClient::assess(const AssessmentRequest& request, const CancellationToken& cancel) {
    CURL* curl = handle_->easy.get();
    curl_easy_reset(curl);

    const std::string payload = request_body(request, options_.model).dump();
    std::string response;

    std::unique_ptr<curl_slist, SlistDeleter> headers;
    auto append_header = [&headers](const std::string& h) {
        curl_slist* next = curl_slist_append(headers.get(), h.c_str());
        if (!next) throw ServiceError("failed to build request headers");
        headers.release();
        headers.reset(next);
    };
    append_header("Content-Type: application/json");
    append_header("Accept: application/json");
    if (!options_.api_key.empty()) append_header("Authorization: Bearer " + options_.api_key);

    curl_easy_setopt(curl, CURLOPT_URL, options_.endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_response_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options_.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &cancel);

    log::debug("POST " + options_.endpoint + " (" + std::to_string(payload.size()) + " bytes)");
    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_ABORTED_BY_CALLBACK) throw ServiceError("assessment cancelled");
    if (res == CURLE_OPERATION_TIMEDOUT) throw ServiceError("content-quality service timed out");
    if (res != CURLE_OK) throw ServiceError(std::string("content-quality service unreachable: ") + curl_easy_strerror(res));

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        throw ServiceError("content-quality service returned HTTP " + std::to_string(status));
    }
    return response;
}

HttpClientFactory::HttpClientFactory(HttpClientOptions options) : options_(std::move(options)) {}

std::unique_ptr<ContentQualityClient> HttpClientFactory::acquire() {
    if (options_.endpoint.empty()) throw ServiceError("no semantic service endpoint configured");
    return std::make_unique<HttpContentQualityClient>(options_);
}

}  // namespace sg
