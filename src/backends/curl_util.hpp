#pragma once

#include "nodefs/error.hpp"
#include <cstddef>
#include <curl/curl.h>
#include <string>
#include <vector>

namespace nodefs {
namespace curl_util {

// CURL write callback for memory buffer
size_t write_memory_callback(void* contents, size_t size, size_t nmemb, void* userp);

// CURL write callback for string data (directory listings, headers)
size_t write_string_callback(void* contents, size_t size, size_t nmemb, void* userp);

// CURL write callback that drops the body
size_t discard_callback(void* contents, size_t size, size_t nmemb, void* userp);

// Upload source for CURLOPT_READFUNCTION
struct UploadBuffer {
    const std::byte* data = nullptr;
    size_t size = 0;
    size_t offset = 0;
};
size_t read_upload_callback(char* buffer, size_t size, size_t nitems, void* userp);

// RAII wrapper for CURL handle
class CurlHandle {
public:
    CurlHandle();
    ~CurlHandle();
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() { return curl_; }
    operator CURL*() { return curl_; }

private:
    CURL* curl_;
};

// RAII wrapper for a curl_slist (QUOTE commands, headers)
class CurlList {
public:
    CurlList() = default;
    ~CurlList();
    CurlList(const CurlList&) = delete;
    CurlList& operator=(const CurlList&) = delete;

    void append(const std::string& item);
    curl_slist* get() { return list_; }

private:
    curl_slist* list_ = nullptr;
};

// Percent-encode one path component
std::string escape(const std::string& component);

// Map a libcurl result to an FSError
// Connection-class failures become Disconnected, login failures
// PermissionDenied, missing remote files NotFound
FSError error_from_curl(CURLcode code, const std::string& url, const std::string& operation);

} // namespace curl_util
} // namespace nodefs
