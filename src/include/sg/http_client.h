#pragma once

#include <sg/semantic.h>
#include <chrono>
#include <memory>
#include <string>

namespace sg {

struct HttpClientOptions {
    std::string endpoint;  // full URL the assessment is POSTed to
    std::string api_key;   // sent as a Bearer token when not empty
    std::string model = "gpt-4o";
    std::chrono::milliseconds timeout{10000};
    std::string user_agent = "schemagate/1.0";
};

// Talks to the content-quality service over HTTP with libcurl. One instance
// owns one easy handle and is not shared between threads.
class HttpContentQualityClient : public ContentQualityClient {
  public:
    explicit HttpContentQualityClient(HttpClientOptions options);
    ~HttpContentQualityClient() override;

    HttpContentQualityClient(const HttpContentQualityClient&) = delete;
    HttpContentQualityClient& operator=(const HttpContentQualityClient&) = delete;

    std::string assess(const AssessmentRequest& request, const CancellationToken& cancel) override;

    // JSON body sent for a request.
    static Dictionary request_body(const AssessmentRequest& request, const std::string& model);

  private:
    struct Handle;
    std::unique_ptr<Handle> handle_;
    HttpClientOptions options_;
};

class HttpClientFactory : public ContentQualityClientFactory {
  public:
    explicit HttpClientFactory(HttpClientOptions options);

    std::unique_ptr<ContentQualityClient> acquire() override;

    const HttpClientOptions& options() const { return options_; }

  private:
    HttpClientOptions options_;
};

}  // namespace sg
