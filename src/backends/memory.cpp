#include "nodefs/backends/memory.hpp"
#include "nodefs/error.hpp"
#include "../log.hpp"
#include <algorithm>
#include <cstring>

namespace nodefs {

namespace {

constexpr int kMaxLinkHops = 40;

class MemoryReadStream : public ReadStream {
public:
    MemoryReadStream(std::shared_ptr<MemoryFileSystem> session, Path path)
        : session_(std::move(session)), path_(std::move(path)) {}
    ~MemoryReadStream() override { close(); }

    size_t read(std::byte* buffer, size_t size) override {
        if (closed_) {
            throw FSError(ErrorCode::IOFailure, path_.str(), "Read from a closed stream");
        }
        size_t got = session_->store()->read(session_->session(), path_, offset_, buffer, size);
        offset_ += got;
        return got;
    }

    uint64_t skip(uint64_t count) override {
        uint64_t total = session_->store()->size(session_->session(), path_);
        uint64_t skipped = offset_ < total ? std::min(count, total - offset_) : 0;
        offset_ += skipped;
        return skipped;
    }

    void close() override { closed_ = true; }

private:
    std::shared_ptr<MemoryFileSystem> session_;
    Path path_;
    uint64_t offset_ = 0;
    bool closed_ = false;
};

class MemoryWriteStream : public WriteStream {
public:
    using WriteStream::write;

    MemoryWriteStream(std::shared_ptr<MemoryFileSystem> session, Path path)
        : session_(std::move(session)), path_(std::move(path)) {}
    ~MemoryWriteStream() override { close(); }

    void write(const std::byte* data, size_t size) override {
        if (closed_) {
            throw FSError(ErrorCode::IOFailure, path_.str(), "Write to a closed stream");
        }
        session_->store()->append(session_->session(), path_, data, size);
    }

    void close() override { closed_ = true; }

private:
    std::shared_ptr<MemoryFileSystem> session_;
    Path path_;
    bool closed_ = false;
};

} // anonymous namespace

// ============================================================================
// MemoryStore
// ============================================================================

MemoryStore::MemoryStore(std::string name) : name_(std::move(name)) {
    Entry root;
    root.kind = Kind::Folder;
    entries_[Path("/")] = root;
}

std::shared_ptr<MemoryStore> MemoryStore::create(std::string name) {
    return std::shared_ptr<MemoryStore>(new MemoryStore(std::move(name)));
}

std::shared_ptr<MemoryFileSystem> MemoryStore::connect() {
    std::lock_guard<std::mutex> guard(lock_);
    ++sessions_;
    LOG_VERBOSE("[memory] " << name_ << ": session " << sessions_ << " at epoch " << epoch_);
    return std::make_shared<MemoryFileSystem>(shared_from_this(), epoch_);
}

void MemoryStore::disconnect_all() {
    std::lock_guard<std::mutex> guard(lock_);
    ++epoch_;
    countdown_ = 0;
}

void MemoryStore::fail_after(size_t calls) {
    std::lock_guard<std::mutex> guard(lock_);
    countdown_ = calls + 1;
}

void MemoryStore::set_permissions(const Path& path, bool readable, bool writable) {
    std::lock_guard<std::mutex> guard(lock_);
    Entry* entry = find(path);
    if (!entry) {
        throw FSError(ErrorCode::NotFound, path.str(), "No such entry");
    }
    entry->readable = readable;
    entry->writable = writable;
}

size_t MemoryStore::session_count() const {
    std::lock_guard<std::mutex> guard(lock_);
    return sessions_;
}

size_t MemoryStore::round_trips() const {
    std::lock_guard<std::mutex> guard(lock_);
    return round_trips_;
}

void MemoryStore::check_session(uint64_t session, const Path& path) {
    ++round_trips_;
    if (countdown_ > 0 && --countdown_ == 0) {
        ++epoch_;
    }
    if (session != epoch_) {
        throw FSError(ErrorCode::Disconnected, path.str(), "Session with memory:" + name_ + " was severed");
    }
}

MemoryStore::Entry* MemoryStore::find(const Path& path) {
    auto it = entries_.find(path);
    return it == entries_.end() ? nullptr : &it->second;
}

MemoryStore::Entry* MemoryStore::find_following(const Path& path, Path* resolved) {
    Path current = path;
    for (int hops = 0; hops < kMaxLinkHops; ++hops) {
        Entry* entry = find(current);
        if (!entry || entry->kind != Kind::Link) {
            if (resolved) *resolved = current;
            return entry;
        }
        auto folder = current.parent();
        current = (folder ? *folder : current).resolve(entry->link_target);
    }
    throw FSError(ErrorCode::BrokenLink, path.str(), "Too many levels of links");
}

MemoryStore::Entry& MemoryStore::require(const Path& path, bool follow_links) {
    Entry* entry = follow_links ? find_following(path) : find(path);
    if (!entry) {
        throw FSError(ErrorCode::NotFound, path.str(), "No such file or folder");
    }
    return *entry;
}

void MemoryStore::require_parent_folder(const Path& path) {
    auto folder = path.parent();
    if (!folder) {
        throw FSError(ErrorCode::AlreadyExists, path.str(), "The root always exists");
    }
    Entry* entry = find_following(*folder);
    if (!entry) {
        throw FSError(ErrorCode::NotFound, folder->str(), "Parent folder does not exist");
    }
    if (entry->kind != Kind::Folder) {
        throw FSError(ErrorCode::NotAFolder, folder->str(), "Parent is not a folder");
    }
    if (!entry->writable) {
        throw FSError(ErrorCode::PermissionDenied, folder->str(), "Parent folder is read-only");
    }
}

std::optional<MemoryStore::Kind> MemoryStore::stat(uint64_t session, const Path& path, bool follow_links) {
    std::lock_guard<std::mutex> guard(lock_);
    check_session(session, path);
    Entry* entry = follow_links ? find_following(path) : find(path);
    if (!entry) {
        return std::nullopt;
    }
    return entry->kind;
}

std::optional<std::string> MemoryStore::read_link(uint64_t session, const Path& path) {
    std::lock_guard<std::mutex> guard(lock_);
    check_session(session, path);
    Entry* entry = find(path);
    if (!entry || entry->kind != Kind::Link) {
        return std::nullopt;
    }
    return entry->link_target;
}

std::optional<std::vector<std::string>> MemoryStore::list(uint64_t session, const Path& path) {
    std::lock_guard<std::mutex> guard(lock_);
    check_session(session, path);
    Path folder;
    Entry* entry = find_following(path, &folder);
    if (!entry || entry->kind != Kind::Folder) {
        return std::nullopt;
    }
    if (!entry->readable) {
        throw FSError(ErrorCode::PermissionDenied, path.str(), "Folder is not readable");
    }
    std::vector<std::string> names;
    for (const auto& item : entries_) {
        auto up = item.first.parent();
        if (up && *up == folder) {
            names.push_back(item.first.name());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

size_t MemoryStore::read(uint64_t session, const Path& path, uint64_t offset, std::byte* buffer, size_t size) {
    std::lock_guard<std::mutex> guard(lock_);
    check_session(session, path);
    Entry& entry = require(path, true);
    if (entry.kind == Kind::Folder) {
        throw FSError(ErrorCode::IOFailure, path.str(), "Cannot read a folder");
    }
    if (!entry.readable) {
        throw FSError(ErrorCode::PermissionDenied, path.str(), "File is not readable");
    }
    if (offset >= entry.data.size() || size == 0) {
        return 0;
    }
    size_t count = static_cast<size_t>(std::min<uint64_t>(size, entry.data.size() - offset));
    std::memcpy(buffer, entry.data.data() + offset, count);
    return count;
}

uint64_t MemoryStore::size(uint64_t session, const Path& path) {
    std::lock_guard<std::mutex> guard(lock_);
    check_session(session, path);
    return require(path, true).data.size();
}

void MemoryStore::open_file(uint64_t session, const Path& path, bool truncate) {
    std::lock_guard<std::mutex> guard(lock_);
    check_session(session, path);
    Entry* entry = find_following(path);
    if (entry) {
        if (entry->kind == Kind::Folder) {
            throw FSError(ErrorCode::IOFailure, path.str(), "Cannot write a folder");
        }
        if (!entry->writable) {
            throw FSError(ErrorCode::PermissionDenied, path.str(), "File is read-only");
        }
        if (truncate) {
            entry->data.clear();
        }
        return;
    }
    if (find(path)) {
        throw FSError(ErrorCode::BrokenLink, path.str(), "Cannot write through a broken link");
    }
    require_parent_folder(path);
    entries_[path] = Entry();
}

void MemoryStore::append(uint64_t session, const Path& path, const std::byte* data, size_t size) {
    std::lock_guard<std::mutex> guard(lock_);
    check_session(session, path);
    Entry& entry = require(path, true);
    if (entry.kind != Kind::File) {
        throw FSError(ErrorCode::IOFailure, path.str(), "Not a file");
    }
    if (!entry.writable) {
        throw FSError(ErrorCode::PermissionDenied, path.str(), "File is read-only");
    }
    entry.data.insert(entry.data.end(), data, data + size);
}

void MemoryStore::make_folder(uint64_t session, const Path& path) {
    std::lock_guard<std::mutex> guard(lock_);
    check_session(session, path);
    if (find(path)) {
        throw FSError(ErrorCode::AlreadyExists, path.str(), "Entry already exists");
    }
    require_parent_folder(path);
    Entry entry;
    entry.kind = Kind::Folder;
    entries_[path] = entry;
}

void MemoryStore::make_link(uint64_t session, const Path& path, const std::string& target) {
    std::lock_guard<std::mutex> guard(lock_);
    check_session(session, path);
    if (find(path)) {
        throw FSError(ErrorCode::AlreadyExists, path.str(), "Entry already exists");
    }
    require_parent_folder(path);
    Entry entry;
    entry.kind = Kind::Link;
    entry.link_target = target;
    entries_[path] = entry;
}

void MemoryStore::remove(uint64_t session, const Path& path) {
    std::lock_guard<std::mutex> guard(lock_);
    check_session(session, path);
    Entry& entry = require(path, false);
    if (path.is_root()) {
        throw FSError(ErrorCode::PermissionDenied, path.str(), "Cannot delete the root");
    }
    if (!entry.writable) {
        throw FSError(ErrorCode::PermissionDenied, path.str(), "Entry is read-only");
    }
    if (entry.kind == Kind::Folder) {
        for (const auto& item : entries_) {
            if (path.is_ancestor_of(item.first)) {
                throw FSError(ErrorCode::IOFailure, path.str(), "Folder is not empty");
            }
        }
    }
    entries_.erase(path);
}

void MemoryStore::check_folder(uint64_t session, const Path& path) {
    std::lock_guard<std::mutex> guard(lock_);
    check_session(session, path);
    if (require(path, true).kind != Kind::Folder) {
        throw FSError(ErrorCode::NotAFolder, path.str(), "Not a folder");
    }
}

std::string MemoryStore::get_xattr(uint64_t session, const Path& path, const std::string& name) {
    std::lock_guard<std::mutex> guard(lock_);
    check_session(session, path);
    Entry& entry = require(path, true);
    auto it = entry.xattrs.find(name);
    if (it == entry.xattrs.end()) {
        throw FSError(ErrorCode::NotFound, path.str(), "No extended attribute '" + name + "'");
    }
    return it->second;
}

void MemoryStore::set_xattr(uint64_t session, const Path& path, const std::string& name,
                            const std::string& value) {
    std::lock_guard<std::mutex> guard(lock_);
    check_session(session, path);
    Entry& entry = require(path, true);
    if (!entry.writable) {
        throw FSError(ErrorCode::PermissionDenied, path.str(), "Entry is read-only");
    }
    entry.xattrs[name] = value;
}

void MemoryStore::delete_xattr(uint64_t session, const Path& path, const std::string& name) {
    std::lock_guard<std::mutex> guard(lock_);
    check_session(session, path);
    Entry& entry = require(path, true);
    if (entry.xattrs.erase(name) == 0) {
        throw FSError(ErrorCode::NotFound, path.str(), "No extended attribute '" + name + "'");
    }
}

std::vector<std::string> MemoryStore::list_xattrs(uint64_t session, const Path& path) {
    std::lock_guard<std::mutex> guard(lock_);
    check_session(session, path);
    std::vector<std::string> names;
    for (const auto& item : require(path, true).xattrs) {
        names.push_back(item.first);
    }
    return names;
}

// ============================================================================
// MemoryFileSystem
// ============================================================================

MemoryFileSystem::MemoryFileSystem(std::shared_ptr<MemoryStore> store, uint64_t session)
    : store_(std::move(store)), session_(session), working_("/") {}

std::vector<NodePtr> MemoryFileSystem::roots() {
    auto self = std::static_pointer_cast<MemoryFileSystem>(shared_from_this());
    return {std::make_shared<MemoryNode>(self, Path("/"))};
}

// ============================================================================
// MemoryNode
// ============================================================================

MemoryNode::MemoryNode(std::shared_ptr<MemoryFileSystem> filesystem, Path path)
    : Node(filesystem, std::move(path)), session_(std::move(filesystem)) {}

NodePtr MemoryNode::make(Path path) const {
    return std::make_shared<MemoryNode>(session_, std::move(path));
}

NodePtr MemoryNode::parent() {
    auto up = path().parent();
    return up ? make(*up) : nullptr;
}

NodePtr MemoryNode::child(const std::string& name) {
    return make(path().resolve(name));
}

std::vector<std::string> MemoryNode::get_path_components() {
    return path().components();
}

std::string MemoryNode::get_xattr(const std::string& name) {
    return store().get_xattr(session_->session(), path(), name);
}

void MemoryNode::set_xattr(const std::string& name, const std::string& value) {
    store().set_xattr(session_->session(), path(), name, value);
}

void MemoryNode::delete_xattr(const std::string& name) {
    store().delete_xattr(session_->session(), path(), name);
}

std::vector<std::string> MemoryNode::list_xattrs() {
    return store().list_xattrs(session_->session(), path());
}

std::optional<std::vector<std::string>> MemoryNode::child_names() {
    return store().list(session_->session(), path());
}

bool MemoryNode::is_file() {
    return store().stat(session_->session(), path(), true) == MemoryStore::Kind::File;
}

bool MemoryNode::is_folder() {
    return store().stat(session_->session(), path(), true) == MemoryStore::Kind::Folder;
}

bool MemoryNode::exists() {
    return store().stat(session_->session(), path(), false).has_value();
}

std::optional<std::string> MemoryNode::link_target() {
    return store().read_link(session_->session(), path());
}

std::unique_ptr<ReadStream> MemoryNode::open_for_reading() {
    // Zero-byte read checks existence, type and permissions up front
    store().read(session_->session(), path(), 0, nullptr, 0);
    return std::make_unique<MemoryReadStream>(session_, path());
}

uint64_t MemoryNode::size() {
    auto kind = store().stat(session_->session(), path(), true);
    if (kind == MemoryStore::Kind::Folder) {
        uint64_t total = 0;
        for (const auto& child : children()) {
            total += child->require<Sizable>().size();
        }
        return total;
    }
    if (kind == MemoryStore::Kind::File) {
        return store().size(session_->session(), path());
    }
    return 0;
}

void MemoryNode::change_to() {
    store().check_folder(session_->session(), path());
    session_->set_working(path());
}

NodePtr MemoryNode::current_working() {
    store().check_folder(session_->session(), session_->working());
    return make(session_->working());
}

std::unique_ptr<WriteStream> MemoryNode::open_for_writing(bool append) {
    store().open_file(session_->session(), path(), !append);
    return std::make_unique<MemoryWriteStream>(session_, path());
}

void MemoryNode::create_folder() {
    store().make_folder(session_->session(), path());
}

void MemoryNode::link_to(const std::string& target) {
    store().make_link(session_->session(), path(), target);
}

void MemoryNode::delete_just_this_thing() {
    store().remove(session_->session(), path());
}

} // namespace nodefs
