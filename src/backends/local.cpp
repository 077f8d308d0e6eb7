#include "nodefs/backends/local.hpp"
#include "nodefs/error.hpp"
#include "../log.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <fstream>
#include <map>
#include <mntent.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/xattr.h>
#include <unistd.h>

namespace nodefs {

namespace fs = std::filesystem;

namespace {

class LocalReadStream : public ReadStream {
public:
    LocalReadStream(const fs::path& native, const std::string& display)
        : in_(native, std::ios::binary), display_(display) {
        if (!in_) {
            throw error_from_errno(errno, display_, "open for reading");
        }
    }
    ~LocalReadStream() override { close(); }

    size_t read(std::byte* buffer, size_t size) override {
        if (!in_.is_open()) {
            throw FSError(ErrorCode::IOFailure, display_, "Read from a closed stream");
        }
        in_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(size));
        if (in_.bad()) {
            throw error_from_errno(errno, display_, "read");
        }
        return static_cast<size_t>(in_.gcount());
    }

    uint64_t skip(uint64_t count) override {
        if (in_.eof()) {
            return 0;
        }
        std::streamoff start = in_.tellg();
        in_.seekg(0, std::ios::end);
        std::streamoff end = in_.tellg();
        uint64_t available = end > start ? static_cast<uint64_t>(end - start) : 0;
        uint64_t skipped = std::min(count, available);
        in_.seekg(start + static_cast<std::streamoff>(skipped), std::ios::beg);
        if (!in_) {
            throw FSError(ErrorCode::IOFailure, display_, "Seek failed");
        }
        return skipped;
    }

    void close() override {
        if (in_.is_open()) {
            in_.close();
        }
    }

private:
    std::ifstream in_;
    std::string display_;
};

class LocalWriteStream : public WriteStream {
public:
    using WriteStream::write;

    LocalWriteStream(const fs::path& native, const std::string& display, bool append)
        : out_(native, std::ios::binary | (append ? std::ios::app : std::ios::trunc)),
          display_(display) {
        if (!out_) {
            throw error_from_errno(errno, display_, "open for writing");
        }
    }
    ~LocalWriteStream() override {
        if (out_.is_open()) {
            out_.close();
            if (!out_) {
                LOG_WARN("[nodefs] Closing " << display_ << " failed");
            }
        }
    }

    void write(const std::byte* data, size_t size) override {
        out_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        if (!out_) {
            throw error_from_errno(errno, display_, "write");
        }
    }

    void flush() override {
        out_.flush();
        if (!out_) {
            throw error_from_errno(errno, display_, "flush");
        }
    }

    void close() override {
        if (!out_.is_open()) {
            return;
        }
        out_.close();
        if (!out_) {
            throw error_from_errno(errno, display_, "close");
        }
    }

private:
    std::ofstream out_;
    std::string display_;
};

// /proc/self/mounts escapes blanks and backslashes as \ooo
std::string unescape_mount_field(const std::string& text) {
    std::string result;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\\' && i + 3 < text.size()) {
            const std::string digits = text.substr(i + 1, 3);
            if (std::all_of(digits.begin(), digits.end(),
                    [](char c) { return c >= '0' && c <= '7'; })) {
                result += static_cast<char>(std::stoi(digits, nullptr, 8));
                i += 3;
                continue;
            }
        }
        result += text[i];
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// LocalFileSystem
// ============================================================================

std::shared_ptr<LocalFileSystem> local_filesystem() {
    static std::shared_ptr<LocalFileSystem> instance = std::make_shared<LocalFileSystem>();
    return instance;
}

std::vector<NodePtr> LocalFileSystem::roots() {
    return {std::make_shared<LocalNode>(shared_from_this(), Path("/"))};
}

NodePtr LocalFileSystem::node(const fs::path& native) {
    return resolve(native.string());
}

std::vector<MountPointPtr> LocalFileSystem::mountpoints() {
    // Later entries mounted over the same folder hide earlier ones
    std::map<std::string, MountPointPtr> by_location;
    auto self = shared_from_this();

    FILE* table = setmntent("/proc/self/mounts", "r");
    if (table) {
        struct mntent entry;
        char buffer[4096];
        while (getmntent_r(table, &entry, buffer, sizeof(buffer))) {
            std::string location = unescape_mount_field(entry.mnt_dir);
            std::string device_name = unescape_mount_field(entry.mnt_fsname);
            NodePtr device;
            if (!device_name.empty() && device_name[0] == '/') {
                device = resolve(Path::parse(device_name));
            }
            by_location[location] = std::make_shared<LocalMountPoint>(
                self, resolve(Path::parse(location)), device, device_name, entry.mnt_type);
        }
        endmntent(table);
    } else {
        LOG_WARN("[nodefs] Cannot read /proc/self/mounts, assuming a single mount at /");
    }

    if (by_location.find("/") == by_location.end()) {
        by_location["/"] = std::make_shared<LocalMountPoint>(self, root());
    }

    std::vector<MountPointPtr> result;
    for (auto& item : by_location) {
        result.push_back(std::move(item.second));
    }
    return result;
}

NodePtr LocalFileSystem::temporary_directory() {
    std::error_code ec;
    fs::path temp = fs::temp_directory_path(ec);
    if (ec) {
        return nullptr;
    }
    return resolve(Path::parse(temp.string()));
}

std::optional<DiskUsage> LocalMountPoint::usage() {
    struct statvfs info;
    std::string native = location()->path().str();
    if (::statvfs(native.c_str(), &info) != 0) {
        throw error_from_errno(errno, native, "statvfs");
    }
    DiskUsage usage;
    usage.space.total = static_cast<uint64_t>(info.f_blocks) * info.f_frsize;
    usage.space.used = static_cast<uint64_t>(info.f_blocks - info.f_bfree) * info.f_frsize;
    usage.space.available = static_cast<uint64_t>(info.f_bavail) * info.f_frsize;
    if (info.f_files > 0) {
        Usage inodes;
        inodes.total = info.f_files;
        inodes.used = info.f_files - info.f_ffree;
        inodes.available = info.f_favail;
        usage.inodes = inodes;
    }
    return usage;
}

// ============================================================================
// LocalNode
// ============================================================================

LocalNode::LocalNode(std::shared_ptr<FileSystem> filesystem, Path path)
    : Node(std::move(filesystem), std::move(path)) {}

NodePtr LocalNode::make(Path path) const {
    return std::make_shared<LocalNode>(filesystem(), std::move(path));
}

NodePtr LocalNode::parent() {
    auto up = path().parent();
    if (!up) {
        return nullptr;
    }
    return make(*up);
}

NodePtr LocalNode::child(const std::string& name) {
    return make(path().resolve(name));
}

std::vector<std::string> LocalNode::get_path_components() {
    return path().components();
}

std::string LocalNode::get_xattr(const std::string& name) {
    std::string native = path().str();
    ssize_t length = ::getxattr(native.c_str(), name.c_str(), nullptr, 0);
    if (length < 0) {
        throw error_from_errno(errno, native, "getxattr " + name);
    }
    std::string value(static_cast<size_t>(length), '\0');
    length = ::getxattr(native.c_str(), name.c_str(), &value[0], value.size());
    if (length < 0) {
        throw error_from_errno(errno, native, "getxattr " + name);
    }
    value.resize(static_cast<size_t>(length));
    return value;
}

void LocalNode::set_xattr(const std::string& name, const std::string& value) {
    std::string native = path().str();
    if (::setxattr(native.c_str(), name.c_str(), value.data(), value.size(), 0) != 0) {
        throw error_from_errno(errno, native, "setxattr " + name);
    }
}

void LocalNode::delete_xattr(const std::string& name) {
    std::string native = path().str();
    if (::removexattr(native.c_str(), name.c_str()) != 0) {
        throw error_from_errno(errno, native, "removexattr " + name);
    }
}

std::vector<std::string> LocalNode::list_xattrs() {
    std::string native = path().str();
    ssize_t length = ::listxattr(native.c_str(), nullptr, 0);
    if (length < 0) {
        throw error_from_errno(errno, native, "listxattr");
    }
    std::string buffer(static_cast<size_t>(length), '\0');
    length = ::listxattr(native.c_str(), &buffer[0], buffer.size());
    if (length < 0) {
        throw error_from_errno(errno, native, "listxattr");
    }
    // NUL-separated names
    std::vector<std::string> names;
    size_t start = 0;
    for (size_t i = 0; i < static_cast<size_t>(length); ++i) {
        if (buffer[i] == '\0') {
            if (i > start) {
                names.push_back(buffer.substr(start, i - start));
            }
            start = i + 1;
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::optional<std::vector<std::string>> LocalNode::child_names() {
    if (!is_folder()) {
        return std::nullopt;
    }
    std::vector<std::string> names;
    std::error_code ec;
    for (auto it = fs::directory_iterator(native(), ec); !ec && it != fs::directory_iterator();
         it.increment(ec)) {
        names.push_back(it->path().filename().string());
    }
    if (ec) {
        throw error_from_errno(ec.value(), path().str(), "list folder");
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool LocalNode::is_file() {
    std::error_code ec;
    return fs::is_regular_file(native(), ec);
}

bool LocalNode::is_folder() {
    std::error_code ec;
    return fs::is_directory(native(), ec);
}

bool LocalNode::exists() {
    std::error_code ec;
    auto status = fs::symlink_status(native(), ec);
    return fs::exists(status);
}

std::optional<std::string> LocalNode::link_target() {
    std::error_code ec;
    if (!fs::is_symlink(fs::symlink_status(native(), ec))) {
        return std::nullopt;
    }
    fs::path target = fs::read_symlink(native(), ec);
    if (ec) {
        throw error_from_errno(ec.value(), path().str(), "readlink");
    }
    return target.string();
}

std::unique_ptr<ReadStream> LocalNode::open_for_reading() {
    if (is_folder()) {
        throw FSError(ErrorCode::IOFailure, path().str(), "Cannot read a folder");
    }
    return std::make_unique<LocalReadStream>(native(), path().str());
}

uint64_t LocalNode::size() {
    if (is_folder()) {
        uint64_t total = 0;
        for (const auto& child : children()) {
            total += child->require<Sizable>().size();
        }
        return total;
    }
    if (is_file()) {
        std::error_code ec;
        uintmax_t bytes = fs::file_size(native(), ec);
        if (ec) {
            throw error_from_errno(ec.value(), path().str(), "stat");
        }
        return static_cast<uint64_t>(bytes);
    }
    // Broken link or special file
    return 0;
}

void LocalNode::change_to() {
    std::error_code ec;
    fs::current_path(native(), ec);
    if (ec) {
        throw error_from_errno(ec.value(), path().str(), "chdir");
    }
}

NodePtr LocalNode::current_working() {
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) {
        throw error_from_errno(ec.value(), path().str(), "getcwd");
    }
    return make(Path::parse(cwd.string()));
}

std::unique_ptr<WriteStream> LocalNode::open_for_writing(bool append) {
    return std::make_unique<LocalWriteStream>(native(), path().str(), append);
}

void LocalNode::create_folder() {
    std::string native_path = path().str();
    if (::mkdir(native_path.c_str(), 0777) != 0) {
        throw error_from_errno(errno, native_path, "mkdir");
    }
}

void LocalNode::link_to(const std::string& target) {
    std::string native_path = path().str();
    if (::symlink(target.c_str(), native_path.c_str()) != 0) {
        throw error_from_errno(errno, native_path, "symlink");
    }
}

void LocalNode::delete_just_this_thing() {
    std::string native_path = path().str();
    std::error_code ec;
    bool folder = fs::is_directory(fs::symlink_status(native(), ec));
    int result = folder ? ::rmdir(native_path.c_str()) : ::unlink(native_path.c_str());
    if (result != 0) {
        throw error_from_errno(errno, native_path, folder ? "rmdir" : "unlink");
    }
}

void LocalNode::rename_to(Node& destination) {
    LocalNode* target = dynamic_cast<LocalNode*>(&destination);
    if (!target || target->filesystem()->name() != filesystem()->name()) {
        Writable::rename_to(destination);
        return;
    }
    if (target->exists()) {
        throw FSError(ErrorCode::AlreadyExists, target->path().str(), "Rename destination already exists");
    }
    std::string from = path().str();
    std::string to = target->path().str();
    if (::rename(from.c_str(), to.c_str()) != 0) {
        if (errno == EXDEV) {
            LOG_VERBOSE("[nodefs] " << from << " -> " << to << " crosses devices, copying");
            Writable::rename_to(destination);
            return;
        }
        throw error_from_errno(errno, from, "rename");
    }
}

} // namespace nodefs
