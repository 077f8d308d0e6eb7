#include "nodefs/reconnect.hpp"
#include "log.hpp"

namespace nodefs {

namespace {

class ProxyReadStream : public ReadStream {
public:
    ProxyReadStream(std::shared_ptr<ReconnectingFileSystem> proxy, std::shared_ptr<ProxyNode> node,
                    std::unique_ptr<ReadStream> inner, uint64_t generation)
        : proxy_(std::move(proxy)), node_(std::move(node)), inner_(std::move(inner)),
          generation_(generation) {}
    ~ProxyReadStream() override = default;

    size_t read(std::byte* buffer, size_t size) override {
        return proxy_->invoke([&](FileSystem& backend, uint64_t generation) {
            if (generation != generation_) {
                reopen(backend, generation);
            }
            size_t got = inner_->read(buffer, size);
            offset_ += got;
            return got;
        });
    }

    uint64_t skip(uint64_t count) override {
        return proxy_->invoke([&](FileSystem& backend, uint64_t generation) {
            if (generation != generation_) {
                reopen(backend, generation);
            }
            uint64_t skipped = inner_->skip(count);
            offset_ += skipped;
            return skipped;
        });
    }

    void close() override {
        if (inner_) {
            inner_->close();
        }
    }

private:
    // Fresh stream on the rebuilt backend, positioned after the delivered bytes
    void reopen(FileSystem& backend, uint64_t generation) {
        LOG_WARN("[reconnect] reopening " << node_->describe() << " at offset " << offset_);
        inner_.reset();
        inner_ = node_->underlying(backend, generation)->require<Readable>().open_for_reading();
        generation_ = generation;
        uint64_t skipped = inner_->skip(offset_);
        if (skipped != offset_) {
            throw FSError(ErrorCode::IOFailure, node_->path().str(),
                "File shrank across reconnect: " + std::to_string(skipped) + " of "
                + std::to_string(offset_) + " bytes available");
        }
    }

    std::shared_ptr<ReconnectingFileSystem> proxy_;
    std::shared_ptr<ProxyNode> node_;
    std::unique_ptr<ReadStream> inner_;
    uint64_t generation_;
    uint64_t offset_ = 0;  // bytes delivered to the caller
};

class ProxyWriteStream : public WriteStream {
public:
    using WriteStream::write;

    ProxyWriteStream(std::shared_ptr<ReconnectingFileSystem> proxy, std::shared_ptr<ProxyNode> node,
                     std::unique_ptr<WriteStream> inner, uint64_t generation, uint64_t base)
        : proxy_(std::move(proxy)), node_(std::move(node)), inner_(std::move(inner)),
          generation_(generation), base_(base) {}
    ~ProxyWriteStream() override = default;

    void write(const std::byte* data, size_t size) override {
        proxy_->invoke([&](FileSystem& backend, uint64_t generation) {
            size_t landed = 0;
            if (generation != generation_) {
                landed = reopen(backend, generation, size);
            }
            inner_->write(data + landed, size - landed);
            acknowledged_ += size;
        });
    }

    void flush() override {
        proxy_->invoke([&](FileSystem& backend, uint64_t generation) {
            if (generation != generation_) {
                reopen(backend, generation, 0);
            }
            inner_->flush();
        });
    }

    void close() override {
        if (inner_) {
            inner_->close();
        }
    }

private:
    // Reopen in append mode; returns how much of the pending chunk already landed
    size_t reopen(FileSystem& backend, uint64_t generation, size_t pending) {
        NodePtr target = node_->underlying(backend, generation);
        inner_.reset();
        inner_ = target->require<Writable>().open_for_writing(true);
        generation_ = generation;

        if (backend.in_flight_writes() == InFlightWrites::Discarded) {
            LOG_WARN("[reconnect] reopened " << node_->describe() << " after "
                     << acknowledged_ << " acknowledged bytes");
            return 0;
        }

        Sizable* sizable = target->as<Sizable>();
        if (!sizable) {
            LOG_WARN("[reconnect] " << node_->describe() << ": the interrupted write of "
                     << pending << " bytes may be duplicated");
            return 0;
        }
        uint64_t expected = base_ + acknowledged_;
        uint64_t actual = sizable->size();
        if (actual < expected) {
            throw FSError(ErrorCode::IOFailure, node_->path().str(),
                "Acknowledged bytes lost across reconnect: " + std::to_string(actual)
                + " present, " + std::to_string(expected) + " expected");
        }
        uint64_t landed = actual - expected;
        if (landed > pending) {
            throw FSError(ErrorCode::IOFailure, node_->path().str(),
                "File grew by " + std::to_string(landed) + " bytes across reconnect, more than the "
                + std::to_string(pending) + " in flight");
        }
        LOG_WARN("[reconnect] reopened " << node_->describe() << ": " << landed << " of "
                 << pending << " in-flight bytes had landed");
        return static_cast<size_t>(landed);
    }

    std::shared_ptr<ReconnectingFileSystem> proxy_;
    std::shared_ptr<ProxyNode> node_;
    std::unique_ptr<WriteStream> inner_;
    uint64_t generation_;
    uint64_t base_;               // file size when the stream was opened
    uint64_t acknowledged_ = 0;   // bytes written through this stream
};

} // anonymous namespace

// ============================================================================
// ReconnectingFileSystem
// ============================================================================

std::shared_ptr<ReconnectingFileSystem> ReconnectingFileSystem::wrap(Factory factory) {
    return std::shared_ptr<ReconnectingFileSystem>(new ReconnectingFileSystem(std::move(factory)));
}

ReconnectingFileSystem::ReconnectingFileSystem(Factory factory)
    : factory_(std::move(factory)) {
    backend_ = factory_();
    if (!backend_) {
        throw FSError(ErrorCode::IOFailure, "Filesystem factory returned nothing");
    }
    name_ = backend_->name();
    LOG_VERBOSE("[reconnect] wrapping " << name_);
}

std::pair<FileSystemPtr, uint64_t> ReconnectingFileSystem::current() const {
    std::lock_guard<std::mutex> guard(lock_);
    return {backend_, generation_};
}

ReconnectingFileSystem::State ReconnectingFileSystem::state() const {
    std::lock_guard<std::mutex> guard(lock_);
    return state_;
}

uint64_t ReconnectingFileSystem::generation() const {
    std::lock_guard<std::mutex> guard(lock_);
    return generation_;
}

size_t ReconnectingFileSystem::reconnect_count() const {
    std::lock_guard<std::mutex> guard(lock_);
    return reconnects_;
}

void ReconnectingFileSystem::on_disconnect(const FSError& error, uint64_t observed) {
    LOG_WARN("[reconnect] " << name_ << " disconnected: " << error.what());
    reconnect(observed);
}

void ReconnectingFileSystem::reconnect(uint64_t observed) {
    std::lock_guard<std::mutex> guard(lock_);
    if (generation_ != observed) {
        // Rebuilt by another caller while we waited
        return;
    }
    state_ = State::Reconnecting;
    FileSystemPtr fresh;
    try {
        fresh = factory_();
    } catch (const std::exception& e) {
        state_ = State::Connected;
        LOG_ERROR("[reconnect] rebuilding " << name_ << " failed: " << e.what());
        throw;
    }
    if (!fresh) {
        state_ = State::Connected;
        throw FSError(ErrorCode::IOFailure, name_, "Filesystem factory returned nothing");
    }
    if (working_) {
        try {
            fresh->resolve(*working_)->require<WorkingDirectory>().change_to();
        } catch (const FSError& e) {
            state_ = State::Connected;
            LOG_ERROR("[reconnect] restoring working folder " << working_->str() << " on " << name_
                      << " failed: " << e.what());
            throw;
        }
    }
    backend_ = std::move(fresh);
    ++generation_;
    ++reconnects_;
    state_ = State::Connected;
    LOG_WARN("[reconnect] " << name_ << " rebuilt (generation " << generation_ << ")");
}

void ReconnectingFileSystem::remember_working(const Path& path) {
    std::lock_guard<std::mutex> guard(lock_);
    working_ = path;
}

NodePtr ReconnectingFileSystem::wrap_node(const NodePtr& node, uint64_t generation) {
    if (!node) {
        return nullptr;
    }
    auto self = std::static_pointer_cast<ReconnectingFileSystem>(shared_from_this());
    return std::make_shared<ProxyNode>(self, node, generation);
}

std::vector<NodePtr> ReconnectingFileSystem::roots() {
    return invoke([&](FileSystem& backend, uint64_t generation) {
        std::vector<NodePtr> result;
        for (const auto& root : backend.roots()) {
            result.push_back(wrap_node(root, generation));
        }
        return result;
    });
}

NodePtr ReconnectingFileSystem::resolve(const Path& path) {
    return invoke([&](FileSystem& backend, uint64_t generation) {
        return wrap_node(backend.resolve(path), generation);
    });
}

std::vector<MountPointPtr> ReconnectingFileSystem::mountpoints() {
    auto self = std::static_pointer_cast<ReconnectingFileSystem>(shared_from_this());
    return invoke([&](FileSystem& backend, uint64_t generation) {
        std::vector<MountPointPtr> result;
        for (const auto& mount : backend.mountpoints()) {
            result.push_back(std::make_shared<ProxyMountPoint>(self, *mount, generation));
        }
        return result;
    });
}

NodePtr ReconnectingFileSystem::temporary_directory() {
    return invoke([&](FileSystem& backend, uint64_t generation) {
        return wrap_node(backend.temporary_directory(), generation);
    });
}

bool ReconnectingFileSystem::is_disconnection(const FSError& error) const {
    return current().first->is_disconnection(error);
}

InFlightWrites ReconnectingFileSystem::in_flight_writes() const {
    return current().first->in_flight_writes();
}

// ============================================================================
// ProxyNode
// ============================================================================

ProxyNode::ProxyNode(std::shared_ptr<ReconnectingFileSystem> proxy, NodePtr target, uint64_t generation)
    : Node(proxy, target->path()),
      proxy_(std::move(proxy)),
      capabilities_(target->capabilities()),
      target_(std::move(target)),
      generation_(generation) {}

NodePtr ProxyNode::underlying(FileSystem& backend, uint64_t generation) {
    std::lock_guard<std::mutex> guard(lock_);
    if (generation != generation_) {
        target_ = backend.resolve(path());
        generation_ = generation;
    }
    return target_;
}

NodePtr ProxyNode::target() {
    auto live = proxy_->current();
    return underlying(*live.first, live.second);
}

NodePtr ProxyNode::parent() {
    return call<Hierarchy>([&](Hierarchy& node, uint64_t generation) {
        return proxy_->wrap_node(node.parent(), generation);
    });
}

NodePtr ProxyNode::child(const std::string& name) {
    return call<Hierarchy>([&](Hierarchy& node, uint64_t generation) {
        return proxy_->wrap_node(node.child(name), generation);
    });
}

std::vector<std::string> ProxyNode::get_path_components() {
    return call<Hierarchy>([&](Hierarchy& node, uint64_t) {
        return node.get_path_components();
    });
}

std::string ProxyNode::get_xattr(const std::string& name) {
    return call<ExtendedAttributes>([&](ExtendedAttributes& node, uint64_t) {
        return node.get_xattr(name);
    });
}

void ProxyNode::set_xattr(const std::string& name, const std::string& value) {
    call<ExtendedAttributes>([&](ExtendedAttributes& node, uint64_t) {
        node.set_xattr(name, value);
    });
}

void ProxyNode::delete_xattr(const std::string& name) {
    call<ExtendedAttributes>([&](ExtendedAttributes& node, uint64_t) {
        node.delete_xattr(name);
    });
}

std::vector<std::string> ProxyNode::list_xattrs() {
    return call<ExtendedAttributes>([&](ExtendedAttributes& node, uint64_t) {
        return node.list_xattrs();
    });
}

std::optional<std::vector<std::string>> ProxyNode::child_names() {
    return call<Listable>([&](Listable& node, uint64_t) {
        return node.child_names();
    });
}

bool ProxyNode::is_file() {
    return call<Readable>([&](Readable& node, uint64_t) { return node.is_file(); });
}

bool ProxyNode::is_folder() {
    return call<Readable>([&](Readable& node, uint64_t) { return node.is_folder(); });
}

bool ProxyNode::exists() {
    return call<Readable>([&](Readable& node, uint64_t) { return node.exists(); });
}

std::optional<std::string> ProxyNode::link_target() {
    return call<Readable>([&](Readable& node, uint64_t) { return node.link_target(); });
}

std::unique_ptr<ReadStream> ProxyNode::open_for_reading() {
    auto self = std::static_pointer_cast<ProxyNode>(shared_from_this());
    return call<Readable>([&](Readable& node, uint64_t generation) -> std::unique_ptr<ReadStream> {
        return std::make_unique<ProxyReadStream>(proxy_, self, node.open_for_reading(), generation);
    });
}

uint64_t ProxyNode::size() {
    return call<Sizable>([&](Sizable& node, uint64_t) { return node.size(); });
}

void ProxyNode::change_to() {
    call<WorkingDirectory>([&](WorkingDirectory& node, uint64_t) { node.change_to(); });
    proxy_->remember_working(path());
}

NodePtr ProxyNode::current_working() {
    return call<WorkingDirectory>([&](WorkingDirectory& node, uint64_t generation) {
        return proxy_->wrap_node(node.current_working(), generation);
    });
}

std::unique_ptr<WriteStream> ProxyNode::open_for_writing(bool append) {
    auto self = std::static_pointer_cast<ProxyNode>(shared_from_this());
    return proxy_->invoke([&](FileSystem& backend, uint64_t generation) -> std::unique_ptr<WriteStream> {
        NodePtr node = underlying(backend, generation);
        // Reconciling in-flight bytes needs the size the stream started from
        uint64_t base = 0;
        Sizable* sizable = node->as<Sizable>();
        if (append && sizable && backend.in_flight_writes() == InFlightWrites::MayPersist) {
            Readable* readable = node->as<Readable>();
            if (!readable || readable->exists()) {
                base = sizable->size();
            }
        }
        auto inner = node->require<Writable>().open_for_writing(append);
        return std::make_unique<ProxyWriteStream>(proxy_, self, std::move(inner), generation, base);
    });
}

void ProxyNode::create_folder() {
    call<Writable>([&](Writable& node, uint64_t) { node.create_folder(); });
}

void ProxyNode::link_to(const std::string& target) {
    call<Writable>([&](Writable& node, uint64_t) { node.link_to(target); });
}

void ProxyNode::delete_just_this_thing() {
    call<Writable>([&](Writable& node, uint64_t) { node.delete_just_this_thing(); });
}

void ProxyNode::rename_to(Node& destination) {
    ProxyNode* other = dynamic_cast<ProxyNode*>(&destination);
    if (!other || other->proxy_ != proxy_) {
        Writable::rename_to(destination);
        return;
    }
    proxy_->invoke([&](FileSystem& backend, uint64_t generation) {
        NodePtr to = other->underlying(backend, generation);
        underlying(backend, generation)->require<Writable>().rename_to(*to);
    });
}

// ============================================================================
// ProxyMountPoint
// ============================================================================

ProxyMountPoint::ProxyMountPoint(std::shared_ptr<ReconnectingFileSystem> proxy, const MountPoint& mount,
                                 uint64_t generation)
    : MountPoint(proxy, proxy->wrap_node(mount.location(), generation),
                 proxy->wrap_node(mount.device(), generation), mount.device_name(), mount.type()),
      proxy_(std::move(proxy)) {}

std::optional<DiskUsage> ProxyMountPoint::usage() {
    return proxy_->invoke([&](FileSystem& backend, uint64_t) -> std::optional<DiskUsage> {
        for (const auto& mount : backend.mountpoints()) {
            if (mount->location() && mount->location()->path() == location()->path()) {
                return mount->usage();
            }
        }
        return std::nullopt;
    });
}

} // namespace nodefs
