#pragma once
#include <atomic>
#include <memory>
#include <string>

struct HttpResponse {
    bool ok = false;        // transfer completed with HTTP 200
    long status = 0;
    std::string body;
    std::string error;
};

// Shared flag checked by in-flight transfers; set once, never reset.
class CancelToken {
public:
    void cancel() { flag_.store(true); }
    bool cancelled() const { return flag_.load(); }

private:
    std::atomic<bool> flag_{false};
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url, long timeout_ms) = 0;

    // application/x-www-form-urlencoded body with a single field.
    virtual HttpResponse post_form(const std::string& url,
                                   const std::string& field,
                                   const std::string& value,
                                   long timeout_ms) = 0;
};

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(std::shared_ptr<const CancelToken> cancel = nullptr);

    HttpResponse get(const std::string& url, long timeout_ms) override;
    HttpResponse post_form(const std::string& url,
                           const std::string& field,
                           const std::string& value,
                           long timeout_ms) override;

private:
    HttpResponse perform(const std::string& url, const std::string* form_body, long timeout_ms);

    std::shared_ptr<const CancelToken> cancel_;
};
