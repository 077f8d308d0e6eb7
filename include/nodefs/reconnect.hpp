#pragma once

#include "nodefs/capabilities.hpp"
#include "nodefs/filesystem.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <utility>

namespace nodefs {

// FileSystem that rebuilds an unreliable backend on disconnection
// Wraps a factory producing fresh backend instances. Every proxy operation
// runs through invoke(): the call goes to the live backend, and when the
// backend classifies the failure as a disconnection the backend is rebuilt
// once and the call re-issued once. Any other failure, or a second
// disconnection, reaches the caller unchanged.
//
//   auto fs = ReconnectingFileSystem::wrap([] {
//       return std::make_shared<FTPFileSystem>(config);
//   });
//   fs->resolve("/data/big.bin")->require<Readable>().hash();
//
// Nodes, mountpoints and streams handed out by the proxy survive rebuilds:
// nodes re-resolve their path on the new backend, read streams reopen and
// skip to the bytes already delivered, write streams reopen in append mode.
class ReconnectingFileSystem : public FileSystem {
public:
    using Factory = std::function<FileSystemPtr()>;

    enum class State { Connected, Reconnecting };

    // Builds the first backend immediately; its failure propagates
    static std::shared_ptr<ReconnectingFileSystem> wrap(Factory factory);

    // Name of the wrapped endpoint, so proxy nodes equal backend nodes
    std::string name() const override { return name_; }
    std::vector<NodePtr> roots() override;
    NodePtr resolve(const Path& path) override;
    using FileSystem::resolve;
    std::vector<MountPointPtr> mountpoints() override;
    NodePtr temporary_directory() override;
    bool is_disconnection(const FSError& error) const override;
    InFlightWrites in_flight_writes() const override;

    State state() const;
    uint64_t generation() const;
    size_t reconnect_count() const;

    // Live backend and the generation it belongs to
    std::pair<FileSystemPtr, uint64_t> current() const;

    // Run fn(backend, generation), rebuilding and retrying once on disconnection
    template <typename Fn>
    auto invoke(Fn&& fn) {
        auto live = current();
        try {
            return fn(*live.first, live.second);
        } catch (const FSError& e) {
            if (!live.first->is_disconnection(e)) {
                throw;
            }
            on_disconnect(e, live.second);
        }
        live = current();
        return fn(*live.first, live.second);
    }

    // Rebuild the backend unless it was already rebuilt since `observed`
    // Callers that lose the race wait on the lock and reuse the new backend.
    void reconnect(uint64_t observed);

    // Proxy for a node produced by the backend of `generation`
    NodePtr wrap_node(const NodePtr& node, uint64_t generation);

    // Working folder set through this proxy, re-entered on every rebuilt backend
    void remember_working(const Path& path);

protected:
    // Proxy nodes are built for any path the backend accepts
    bool speculative_nodes() const override { return true; }

private:
    explicit ReconnectingFileSystem(Factory factory);

    void on_disconnect(const FSError& error, uint64_t observed);

    Factory factory_;
    std::string name_;
    mutable std::mutex lock_;
    FileSystemPtr backend_;
    uint64_t generation_ = 0;
    State state_ = State::Connected;
    size_t reconnects_ = 0;
    std::optional<Path> working_;
};

// Node of a ReconnectingFileSystem
// Exposes exactly the capability set of the node it stands for.
class ProxyNode : public Node,
                  public Hierarchy,
                  public ExtendedAttributes,
                  public Listable,
                  public Readable,
                  public Sizable,
                  public WorkingDirectory,
                  public Writable {
public:
    ProxyNode(std::shared_ptr<ReconnectingFileSystem> proxy, NodePtr target, uint64_t generation);

    CapabilitySet capabilities() const override { return capabilities_; }

    // Underlying node for the live backend
    NodePtr target();

    // Hierarchy
    NodePtr parent() override;
    NodePtr child(const std::string& name) override;
    std::vector<std::string> get_path_components() override;

    // ExtendedAttributes
    std::string get_xattr(const std::string& name) override;
    void set_xattr(const std::string& name, const std::string& value) override;
    void delete_xattr(const std::string& name) override;
    std::vector<std::string> list_xattrs() override;

    // Listable
    std::optional<std::vector<std::string>> child_names() override;

    // Readable
    bool is_file() override;
    bool is_folder() override;
    bool exists() override;
    std::optional<std::string> link_target() override;
    std::unique_ptr<ReadStream> open_for_reading() override;

    // Sizable
    uint64_t size() override;

    // WorkingDirectory
    void change_to() override;
    NodePtr current_working() override;

    // Writable
    std::unique_ptr<WriteStream> open_for_writing(bool append = false) override;
    void create_folder() override;
    void link_to(const std::string& target) override;
    void delete_just_this_thing() override;
    void rename_to(Node& destination) override;

    // Node for this path on the given backend, re-resolved when the generation moved
    NodePtr underlying(FileSystem& backend, uint64_t generation);

private:
    template <typename C, typename Fn>
    auto call(Fn&& fn) {
        return proxy_->invoke([&](FileSystem& backend, uint64_t generation) {
            NodePtr node = underlying(backend, generation);
            return fn(node->require<C>(), generation);
        });
    }

    std::shared_ptr<ReconnectingFileSystem> proxy_;
    CapabilitySet capabilities_;
    std::mutex lock_;
    NodePtr target_;
    uint64_t generation_;
};

// MountPoint of a ReconnectingFileSystem
class ProxyMountPoint : public MountPoint {
public:
    ProxyMountPoint(std::shared_ptr<ReconnectingFileSystem> proxy, const MountPoint& mount,
                    uint64_t generation);

    // Usage of the matching mountpoint on the live backend
    std::optional<DiskUsage> usage() override;

private:
    std::shared_ptr<ReconnectingFileSystem> proxy_;
};

} // namespace nodefs
