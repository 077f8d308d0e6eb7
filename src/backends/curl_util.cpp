#include "curl_util.hpp"
#include <algorithm>
#include <cstring>

namespace nodefs {
namespace curl_util {

size_t write_memory_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::vector<std::byte>* buffer = static_cast<std::vector<std::byte>*>(userp);
    const std::byte* data = static_cast<const std::byte*>(contents);
    buffer->insert(buffer->end(), data, data + total_size);
    return total_size;
}

size_t write_string_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* str = static_cast<std::string*>(userp);
    str->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t discard_callback(void*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

size_t read_upload_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    UploadBuffer* upload = static_cast<UploadBuffer*>(userp);
    size_t count = std::min(size * nitems, upload->size - upload->offset);
    if (count > 0) {
        std::memcpy(buffer, upload->data + upload->offset, count);
        upload->offset += count;
    }
    return count;
}

CurlHandle::CurlHandle() : curl_(curl_easy_init()) {
    if (!curl_) {
        throw FSError(ErrorCode::IOFailure, "Failed to initialize CURL");
    }
}

CurlHandle::~CurlHandle() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

CurlList::~CurlList() {
    if (list_) {
        curl_slist_free_all(list_);
    }
}

void CurlList::append(const std::string& item) {
    curl_slist* appended = curl_slist_append(list_, item.c_str());
    if (!appended) {
        throw FSError(ErrorCode::IOFailure, "Failed to build CURL list");
    }
    list_ = appended;
}

std::string escape(const std::string& component) {
    char* escaped = curl_easy_escape(nullptr, component.c_str(), static_cast<int>(component.size()));
    if (!escaped) {
        throw FSError(ErrorCode::InvalidPath, component, "Cannot encode path component");
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

FSError error_from_curl(CURLcode code, const std::string& url, const std::string& operation) {
    std::string message = operation + " failed: " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_PARTIAL_FILE:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_GOT_NOTHING:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_SSL_CONNECT_ERROR:
            return FSError(ErrorCode::Disconnected, url, message);
        case CURLE_LOGIN_DENIED:
        case CURLE_REMOTE_ACCESS_DENIED:
            return FSError(ErrorCode::PermissionDenied, url, message);
        case CURLE_REMOTE_FILE_NOT_FOUND:
        case CURLE_FTP_COULDNT_RETR_FILE:
            return FSError(ErrorCode::NotFound, url, message);
        case CURLE_URL_MALFORMAT:
            return FSError(ErrorCode::InvalidPath, url, message);
        default:
            return FSError(ErrorCode::IOFailure, url, message);
    }
}

} // namespace curl_util
} // namespace nodefs
