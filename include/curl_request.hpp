#pragma once

#include <curl/curl.h>
#include <string>
#include <stdexcept>

class CurlRequest {
private:
    CURL* handle;
    curl_slist* headers;
    std::string response;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
        static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
        return size * nmemb;
    }

public:
    CurlRequest() : handle(nullptr), headers(nullptr) {
        handle = curl_easy_init();
        if (!handle) {
            throw std::runtime_error("Failed to initialize CURL");
        }
        curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response);
        curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    }

    ~CurlRequest() {
        if (handle) {
            curl_easy_cleanup(handle);
        }
        if (headers) {
            curl_slist_free_all(headers);
        }
    }

    // Delete copy constructor and assignment operator
    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    void set_url(const std::string& url) {
        curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    }

    // CURLOPT_POSTFIELDS keeps the pointer; data must outlive perform().
    void set_postfields(const std::string& data) {
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, data.c_str());
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(data.size()));
    }

    void set_get_method() {
        curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
    }

    void set_timeout(long seconds) {
        curl_easy_setopt(handle, CURLOPT_TIMEOUT, seconds);
    }

    void set_user_agent(const std::string& agent) {
        curl_easy_setopt(handle, CURLOPT_USERAGENT, agent.c_str());
    }

    void add_header(const std::string& header) {
        headers = curl_slist_append(headers, header.c_str());
    }

    CURLcode perform() {
        response.clear();
        if (headers) {
            curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers);
        }
        return curl_easy_perform(handle);
    }

    long response_code() const {
        long code = 0;
        curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &code);
        return code;
    }

    const std::string& body() const {
        return response;
    }
};
