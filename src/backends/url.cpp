#include "nodefs/backends/url.hpp"
#include "nodefs/error.hpp"
#include "curl_util.hpp"
#include "../log.hpp"
#include <algorithm>
#include <cstring>

namespace nodefs {

using namespace curl_util;

namespace {

constexpr uint64_t kChunkSize = 512 * 1024;

void setup_request(CurlHandle& curl, const URLConfig& config, const std::string& url) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    if (!config.username.empty()) {
        std::string userpass = config.username + ":" + config.password;
        curl_easy_setopt(curl, CURLOPT_USERPWD, userpass.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, config.connect_timeout);
    if (config.timeout > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, config.timeout);
    }
}

// Followed redirects keep credentials on the configured origin only
void follow_redirects(CurlHandle& curl, const URLConfig& config) {
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, config.max_redirects);
    curl_easy_setopt(curl, CURLOPT_UNRESTRICTED_AUTH, 0L);
}

FSError error_from_status(long status, const std::string& url) {
    std::string message = "HTTP status " + std::to_string(status);
    switch (status) {
        case 401:
        case 403:
            return FSError(ErrorCode::PermissionDenied, url, message);
        case 404:
        case 410:
            return FSError(ErrorCode::NotFound, url, message);
        case 502:
        case 503:
        case 504:
            return FSError(ErrorCode::Disconnected, url, message);
        default:
            return FSError(ErrorCode::IOFailure, url, message);
    }
}

class URLReadStream : public ReadStream {
public:
    URLReadStream(URLConfig config, std::string url)
        : config_(std::move(config)), url_(std::move(url)) {}
    ~URLReadStream() override { close(); }

    size_t read(std::byte* buffer, size_t size) override {
        if (closed_) {
            throw FSError(ErrorCode::IOFailure, url_, "Read from a closed stream");
        }
        if (position_ == buffer_.size()) {
            if (eof_ || !fetch()) {
                return 0;
            }
        }
        size_t count = std::min(size, buffer_.size() - position_);
        std::memcpy(buffer, buffer_.data() + position_, count);
        position_ += count;
        return count;
    }

    // Moves the range start; a skip past the end shows up as end of stream
    uint64_t skip(uint64_t count) override {
        uint64_t buffered = buffer_.size() - position_;
        if (count <= buffered) {
            position_ += static_cast<size_t>(count);
            return count;
        }
        buffer_.clear();
        position_ = 0;
        if (!eof_) {
            next_ += count - buffered;
            return count;
        }
        return buffered;
    }

    void close() override {
        closed_ = true;
        buffer_.clear();
        position_ = 0;
    }

private:
    bool fetch() {
        std::string range = std::to_string(next_) + "-" + std::to_string(next_ + kChunkSize - 1);

        buffer_.clear();
        position_ = 0;

        CurlHandle curl;
        setup_request(curl, config_, url_);
        follow_redirects(curl, config_);
        curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_memory_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buffer_);

        LOG_VERBOSE("[url] GET " << url_ << " bytes " << range);
        CURLcode res = curl_easy_perform(curl);
        if (res != CURLE_OK) {
            buffer_.clear();
            throw error_from_curl(res, url_, "HTTP GET");
        }

        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        if (status == 416) {
            buffer_.clear();
            eof_ = true;
            return false;
        }
        if (status == 200) {
            // Range ignored: the whole body came back
            eof_ = true;
            if (next_ >= buffer_.size()) {
                buffer_.clear();
                return false;
            }
            position_ = static_cast<size_t>(next_);
            next_ = buffer_.size();
            return true;
        }
        if (status != 206) {
            buffer_.clear();
            throw error_from_status(status, url_);
        }
        next_ += buffer_.size();
        if (buffer_.size() < kChunkSize) {
            eof_ = true;
        }
        return !buffer_.empty();
    }

    URLConfig config_;
    std::string url_;
    uint64_t next_ = 0;
    std::vector<std::byte> buffer_;
    size_t position_ = 0;
    bool eof_ = false;
    bool closed_ = false;
};

} // anonymous namespace

// ============================================================================
// URLFileSystem
// ============================================================================

std::pair<std::string, std::string> URLFileSystem::split_url(const std::string& text) {
    size_t scheme_end = text.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        throw FSError(ErrorCode::InvalidPath, text, "Not an absolute URL");
    }
    size_t path_start = text.find_first_of("/?#", scheme_end + 3);
    if (path_start == std::string::npos) {
        return {text, ""};
    }
    return {text.substr(0, path_start), text.substr(path_start)};
}

URLFileSystem::URLFileSystem(URLConfig config)
    : config_(std::move(config)), origin_(split_url(config_.base).first) {}

std::vector<NodePtr> URLFileSystem::roots() {
    auto self = std::static_pointer_cast<URLFileSystem>(shared_from_this());
    return {std::make_shared<URLNode>(self, Path(origin_))};
}

std::string URLFileSystem::build_url(const Path& path) const {
    std::string url = origin_ + "/";
    const auto& components = path.components();
    for (size_t i = 0; i < components.size(); ++i) {
        if (i > 0) url += "/";
        url += components[i];
    }
    return url;
}

// ============================================================================
// URLNode
// ============================================================================

URLNode::URLNode(std::shared_ptr<URLFileSystem> filesystem, Path path)
    : Node(filesystem, std::move(path)), url_(std::move(filesystem)) {}

NodePtr URLNode::make(Path path) const {
    return std::make_shared<URLNode>(url_, std::move(path));
}

NodePtr URLNode::parent() {
    auto up = path().parent();
    return up ? make(*up) : nullptr;
}

NodePtr URLNode::child(const std::string& name) {
    if (name.find("://") == std::string::npos) {
        return make(path().resolve(name));
    }
    auto parts = URLFileSystem::split_url(name);
    if (parts.first == url_->origin()) {
        return make(Path(url_->origin()).resolve(parts.second));
    }
    // Another origin: a separate filesystem that never sees our credentials
    URLConfig foreign;
    foreign.base = parts.first;
    foreign.connect_timeout = url_->config().connect_timeout;
    foreign.timeout = url_->config().timeout;
    foreign.max_redirects = url_->config().max_redirects;
    auto other = std::make_shared<URLFileSystem>(foreign);
    return other->resolve(Path(other->origin()).resolve(parts.second));
}

std::vector<std::string> URLNode::get_path_components() {
    return path().components();
}

URLNode::Probe URLNode::probe() {
    std::string target = url();

    CurlHandle curl;
    setup_request(curl, url_->config(), target);
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discard_callback);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        throw error_from_curl(res, target, "HTTP HEAD");
    }
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    if (status == 405 || status == 501) {
        // HEAD refused: ask for a single byte instead
        curl_easy_setopt(curl, CURLOPT_NOBODY, 0L);
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl, CURLOPT_RANGE, "0-0");
        res = curl_easy_perform(curl);
        if (res != CURLE_OK) {
            throw error_from_curl(res, target, "HTTP GET");
        }
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        if (status == 416) {
            status = 200;  // empty resource
        }
    }
    LOG_VERBOSE("[url] HEAD " << target << " -> " << status);

    Probe result;
    if (status >= 200 && status < 300) {
        result.state = State::File;
    } else if (status >= 300 && status < 400) {
        char* location = nullptr;
        curl_easy_getinfo(curl, CURLINFO_REDIRECT_URL, &location);
        if (location) {
            result.state = State::Link;
            result.location = location;
        } else {
            result.state = State::File;
        }
    } else if (status == 404 || status == 410) {
        result.state = State::Missing;
    } else {
        throw error_from_status(status, target);
    }
    return result;
}

bool URLNode::is_file() {
    Probe result = probe();
    if (result.state == State::Link) {
        return dereference(true)->require<Readable>().is_file();
    }
    return result.state == State::File;
}

bool URLNode::exists() {
    return probe().state != State::Missing;
}

std::optional<std::string> URLNode::link_target() {
    Probe result = probe();
    if (result.state != State::Link) {
        return std::nullopt;
    }
    return result.location;
}

std::unique_ptr<ReadStream> URLNode::open_for_reading() {
    if (!exists()) {
        throw FSError(ErrorCode::NotFound, url(), "No resource at URL");
    }
    return std::make_unique<URLReadStream>(url_->config(), url());
}

uint64_t URLNode::size() {
    std::string target = url();

    CurlHandle curl;
    setup_request(curl, url_->config(), target);
    follow_redirects(curl, url_->config());
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discard_callback);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        throw error_from_curl(res, target, "HTTP HEAD");
    }
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    if (status == 404 || status == 410 || status == 401 || status == 403) {
        throw error_from_status(status, target);
    }
    curl_off_t length = -1;
    curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
    if (status >= 200 && status < 300 && length >= 0) {
        return static_cast<uint64_t>(length);
    }

    LOG_VERBOSE("[url] no Content-Length for " << target << ", counting bytes");
    uint64_t total = 0;
    for (const auto& block : read_blocks()) {
        total += block.size();
    }
    return total;
}

} // namespace nodefs
