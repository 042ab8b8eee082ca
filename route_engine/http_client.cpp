#include "http_client.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <mutex>

using namespace std;

static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp)
{
    ((string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

// Non-zero return makes libcurl abort the transfer with CURLE_ABORTED_BY_CALLBACK.
static int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
{
    auto* token = static_cast<const CancelToken*>(clientp);
    return (token && token->cancelled()) ? 1 : 0;
}

CurlHttpClient::CurlHttpClient(shared_ptr<const CancelToken> cancel)
    : cancel_(move(cancel))
{
    static once_flag init_flag;
    call_once(init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse CurlHttpClient::get(const string& url, long timeout_ms)
{
    return perform(url, nullptr, timeout_ms);
}

HttpResponse CurlHttpClient::post_form(const string& url,
                                       const string& field,
                                       const string& value,
                                       long timeout_ms)
{
    string body = field + "=";
    CURL* curl = curl_easy_init();
    if (!curl) {
        HttpResponse res;
        res.error = "Failed to initialize curl";
        return res;
    }
    char* encoded = curl_easy_escape(curl, value.c_str(), (int)value.length());
    if (encoded) {
        body += encoded;
        curl_free(encoded);
    }
    curl_easy_cleanup(curl);
    return perform(url, &body, timeout_ms);
}

HttpResponse CurlHttpClient::perform(const string& url, const string* form_body, long timeout_ms)
{
    HttpResponse res;
    if (cancel_ && cancel_->cancelled()) {
        res.error = "cancelled";
        return res;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        res.error = "Failed to initialize curl";
        return res;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &res.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, min(timeout_ms, 2000L));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "route_engine/1.0");
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, (void*)cancel_.get());
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

    if (form_body) {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, form_body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)form_body->size());
    }

    CURLcode code = curl_easy_perform(curl);
    if (code != CURLE_OK) {
        res.error = curl_easy_strerror(code);
        curl_easy_cleanup(curl);
        return res;
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &res.status);
    curl_easy_cleanup(curl);

    res.ok = (res.status == 200);
    if (!res.ok) res.error = "HTTP error: " + to_string(res.status);
    return res;
}
