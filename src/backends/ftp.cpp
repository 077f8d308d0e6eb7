#include "nodefs/backends/ftp.hpp"
#include "nodefs/error.hpp"
#include "curl_util.hpp"
#include "../log.hpp"
#include <algorithm>
#include <cstring>
#include <sstream>

namespace nodefs {

using namespace curl_util;

namespace {

// Bytes fetched per ranged download
constexpr uint64_t kChunkSize = 512 * 1024;

// Split on '/' ignoring empty parts
std::vector<std::string> split_root(const std::string& root) {
    return Path::parse(root).components();
}

void setup_request(CurlHandle& curl, const FTPFileSystem& ftp, const std::string& url) {
    const FTPConfig& config = ftp.config();
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    if (!config.username.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERPWD, ftp.build_userpass().c_str());
    }
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, config.connect_timeout);
    if (config.timeout > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, config.timeout);
    }
}

// The server's way of saying "no such file or folder here"
bool is_missing(CURLcode res) {
    return res == CURLE_REMOTE_FILE_NOT_FOUND ||
           res == CURLE_FTP_COULDNT_RETR_FILE ||
           res == CURLE_REMOTE_ACCESS_DENIED;
}

class FTPReadStream : public ReadStream {
public:
    FTPReadStream(std::shared_ptr<FTPFileSystem> ftp, Path path, uint64_t total)
        : ftp_(std::move(ftp)), path_(std::move(path)), url_(ftp_->build_url(path_)), total_(total) {}
    ~FTPReadStream() override { close(); }

    size_t read(std::byte* buffer, size_t size) override {
        if (closed_) {
            throw FSError(ErrorCode::IOFailure, url_, "Read from a closed stream");
        }
        if (position_ == buffer_.size()) {
            if (next_ >= total_ || !fetch()) {
                return 0;
            }
        }
        size_t count = std::min(size, buffer_.size() - position_);
        std::memcpy(buffer, buffer_.data() + position_, count);
        position_ += count;
        return count;
    }

    uint64_t skip(uint64_t count) override {
        uint64_t buffered = buffer_.size() - position_;
        if (count <= buffered) {
            position_ += static_cast<size_t>(count);
            return count;
        }
        buffer_.clear();
        position_ = 0;
        uint64_t rest = std::min(count - buffered, total_ - next_);
        next_ += rest;
        return buffered + rest;
    }

    void close() override {
        closed_ = true;
        buffer_.clear();
        position_ = 0;
    }

private:
    // Download the next range; false when the server had nothing left
    bool fetch() {
        uint64_t last = std::min(next_ + kChunkSize, total_) - 1;
        std::string range = std::to_string(next_) + "-" + std::to_string(last);

        buffer_.clear();
        position_ = 0;

        CurlHandle curl;
        setup_request(curl, *ftp_, url_);
        curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_memory_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buffer_);

        LOG_VERBOSE("[ftp] downloading " << url_ << " bytes " << range);
        CURLcode res = curl_easy_perform(curl);
        if (res != CURLE_OK) {
            buffer_.clear();
            throw error_from_curl(res, url_, "FTP download");
        }
        next_ += buffer_.size();
        return !buffer_.empty();
    }

    std::shared_ptr<FTPFileSystem> ftp_;
    Path path_;
    std::string url_;
    uint64_t total_;
    uint64_t next_ = 0;  // offset of the next range to fetch
    std::vector<std::byte> buffer_;
    size_t position_ = 0;
    bool closed_ = false;
};

class FTPWriteStream : public WriteStream {
public:
    using WriteStream::write;

    FTPWriteStream(std::shared_ptr<FTPFileSystem> ftp, Path path)
        : ftp_(std::move(ftp)), url_(ftp_->build_url(path)) {}
    ~FTPWriteStream() override { close(); }

    void write(const std::byte* data, size_t size) override {
        if (closed_) {
            throw FSError(ErrorCode::IOFailure, url_, "Write to a closed stream");
        }
        upload(*ftp_, url_, data, size, true);
    }

    void close() override { closed_ = true; }

    // STOR (append = false) or APPE one buffer
    static void upload(const FTPFileSystem& ftp, const std::string& url,
                       const std::byte* data, size_t size, bool append) {
        UploadBuffer source;
        source.data = data;
        source.size = size;

        CurlHandle curl;
        setup_request(curl, ftp, url);
        curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(curl, CURLOPT_APPEND, append ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_upload_callback);
        curl_easy_setopt(curl, CURLOPT_READDATA, &source);
        curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(size));

        LOG_VERBOSE("[ftp] uploading " << size << " bytes to " << url << (append ? " (append)" : ""));
        CURLcode res = curl_easy_perform(curl);
        if (res != CURLE_OK) {
            throw error_from_curl(res, url, "FTP upload");
        }
    }

private:
    std::shared_ptr<FTPFileSystem> ftp_;
    std::string url_;
    bool closed_ = false;
};

} // anonymous namespace

// ============================================================================
// FTPFileSystem
// ============================================================================

FTPFileSystem::FTPFileSystem(FTPConfig config)
    : config_(std::move(config)) {}

std::string FTPFileSystem::name() const {
    std::string name = "ftp://";
    if (!config_.username.empty()) {
        name += config_.username + "@";
    }
    return name + config_.ip + ":" + std::to_string(config_.port);
}

std::vector<NodePtr> FTPFileSystem::roots() {
    auto self = std::static_pointer_cast<FTPFileSystem>(shared_from_this());
    return {std::make_shared<FTPNode>(self, Path(endpoint()))};
}

std::string FTPFileSystem::endpoint() const {
    return "ftp://" + config_.ip + ":" + std::to_string(config_.port);
}

std::string FTPFileSystem::build_url(const Path& path, bool folder) const {
    std::string url = endpoint() + "/";

    std::vector<std::string> parts = split_root(config_.root);
    for (const auto& component : path.components()) {
        parts.push_back(component);
    }
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) url += "/";
        url += escape(parts[i]);
    }

    if (folder && url.back() != '/') {
        url += "/";
    }
    return url;
}

std::string FTPFileSystem::remote_path(const Path& path) const {
    std::vector<std::string> parts = split_root(config_.root);
    for (const auto& component : path.components()) {
        parts.push_back(component);
    }
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += "/";
        result += parts[i];
    }
    return result.empty() ? "." : result;
}

std::string FTPFileSystem::build_userpass() const {
    return config_.username + ":" + config_.password;
}

// ============================================================================
// FTPNode
// ============================================================================

FTPNode::FTPNode(std::shared_ptr<FTPFileSystem> filesystem, Path path)
    : Node(filesystem, std::move(path)), ftp_(std::move(filesystem)) {}

NodePtr FTPNode::make(Path path) const {
    return std::make_shared<FTPNode>(ftp_, std::move(path));
}

NodePtr FTPNode::parent() {
    auto up = path().parent();
    return up ? make(*up) : nullptr;
}

NodePtr FTPNode::child(const std::string& name) {
    return make(path().resolve(name));
}

std::vector<std::string> FTPNode::get_path_components() {
    return path().components();
}

std::optional<uint64_t> FTPNode::remote_size() {
    std::string url = ftp_->build_url(path());

    CurlHandle curl;
    setup_request(curl, *ftp_, url);
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discard_callback);

    CURLcode res = curl_easy_perform(curl);
    if (is_missing(res)) {
        LOG_VERBOSE("[ftp] no file at " << url << ": " << curl_easy_strerror(res));
        return std::nullopt;
    }
    if (res != CURLE_OK) {
        throw error_from_curl(res, url, "FTP SIZE");
    }
    curl_off_t length = -1;
    curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
    if (length < 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(length);
}

std::optional<std::vector<std::string>> FTPNode::child_names() {
    std::string url = ftp_->build_url(path(), true);

    CurlHandle curl;
    std::string listing;
    setup_request(curl, *ftp_, url);
    curl_easy_setopt(curl, CURLOPT_DIRLISTONLY, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_string_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &listing);

    LOG_VERBOSE("[ftp] listing " << url);
    CURLcode res = curl_easy_perform(curl);
    if (is_missing(res)) {
        return std::nullopt;
    }
    if (res != CURLE_OK) {
        throw error_from_curl(res, url, "FTP NLST");
    }

    // One name per line; some servers prefix the listed folder
    std::vector<std::string> names;
    std::istringstream iss(listing);
    std::string line;
    while (std::getline(iss, line)) {
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n' || line.back() == '/')) {
            line.pop_back();
        }
        size_t slash = line.find_last_of('/');
        if (slash != std::string::npos) {
            line = line.substr(slash + 1);
        }
        if (!line.empty() && line != "." && line != "..") {
            names.push_back(line);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool FTPNode::is_file() {
    return remote_size().has_value() && !is_folder();
}

bool FTPNode::is_folder() {
    std::string url = ftp_->build_url(path(), true);

    CurlHandle curl;
    setup_request(curl, *ftp_, url);
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discard_callback);

    CURLcode res = curl_easy_perform(curl);
    if (is_missing(res)) {
        return false;
    }
    if (res != CURLE_OK) {
        throw error_from_curl(res, url, "FTP CWD");
    }
    return true;
}

bool FTPNode::exists() {
    return is_folder() || remote_size().has_value();
}

std::unique_ptr<ReadStream> FTPNode::open_for_reading() {
    if (is_folder()) {
        throw FSError(ErrorCode::IOFailure, path().str(), "Cannot read a folder");
    }
    auto total = remote_size();
    if (!total) {
        throw FSError(ErrorCode::NotFound, ftp_->build_url(path()), "File not found on FTP server");
    }
    return std::make_unique<FTPReadStream>(ftp_, path(), *total);
}

uint64_t FTPNode::size() {
    if (is_folder()) {
        uint64_t total = 0;
        for (const auto& child : children()) {
            total += child->require<Sizable>().size();
        }
        return total;
    }
    return remote_size().value_or(0);
}

std::unique_ptr<WriteStream> FTPNode::open_for_writing(bool append) {
    if (!append) {
        // Create or truncate before the first chunk arrives
        FTPWriteStream::upload(*ftp_, ftp_->build_url(path()), nullptr, 0, false);
    }
    return std::make_unique<FTPWriteStream>(ftp_, path());
}

void FTPNode::quote(const std::vector<std::string>& commands, const std::string& operation) {
    std::string url = ftp_->build_url(Path(ftp_->endpoint()), true);
    CurlList list;
    for (const auto& command : commands) {
        list.append(command);
    }

    CurlHandle curl;
    setup_request(curl, *ftp_, url);
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl, CURLOPT_QUOTE, list.get());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discard_callback);

    LOG_VERBOSE("[ftp] " << operation << " " << path().str());
    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_QUOTE_ERROR) {
        // The command was refused; work out why from the server's view
        if (!exists()) {
            throw FSError(ErrorCode::NotFound, path().str(), operation + " refused: no such file or folder");
        }
        throw FSError(ErrorCode::IOFailure, path().str(), operation + " refused by server");
    }
    if (res != CURLE_OK) {
        throw error_from_curl(res, url, operation);
    }
}

void FTPNode::create_folder() {
    if (exists()) {
        throw FSError(ErrorCode::AlreadyExists, path().str(), "Folder already exists");
    }
    auto up = parent();
    if (up && !up->require<Readable>().is_folder()) {
        throw FSError(ErrorCode::NotFound, up->path().str(), "Parent folder does not exist");
    }
    quote({"MKD " + ftp_->remote_path(path())}, "MKD");
}

void FTPNode::link_to(const std::string& target) {
    throw FSError(ErrorCode::UnsupportedOperation, path().str(),
        "FTP servers cannot create links (to '" + target + "')");
}

void FTPNode::delete_just_this_thing() {
    bool folder = is_folder();
    if (!folder && !remote_size()) {
        throw FSError(ErrorCode::NotFound, path().str(), "Nothing to delete");
    }
    quote({(folder ? "RMD " : "DELE ") + ftp_->remote_path(path())}, folder ? "RMD" : "DELE");
}

void FTPNode::rename_to(Node& destination) {
    FTPNode* target = dynamic_cast<FTPNode*>(&destination);
    if (!target || target->filesystem()->name() != filesystem()->name()) {
        Writable::rename_to(destination);
        return;
    }
    if (target->exists()) {
        throw FSError(ErrorCode::AlreadyExists, target->path().str(), "Rename destination already exists");
    }
    quote({"RNFR " + ftp_->remote_path(path()), "RNTO " + ftp_->remote_path(target->path())}, "RNFR/RNTO");
}

} // namespace nodefs
