#pragma once

#include "nodefs/node.hpp"
#include "nodefs/path.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nodefs {

class FileSystem;

// Utilization of one resource (bytes or inodes)
struct Usage {
    uint64_t total = 0;
    uint64_t used = 0;
    uint64_t available = 0;  // available to unprivileged users

    uint64_t free() const { return total - used; }
};

struct DiskUsage {
    Usage space;
    std::optional<Usage> inodes;  // not every platform has inodes
};

// Association of a mounted hierarchy's root with its backing device
class MountPoint {
public:
    MountPoint(std::shared_ptr<FileSystem> filesystem, NodePtr location, NodePtr device = nullptr,
               std::string device_name = "", std::string type = "");
    virtual ~MountPoint() = default;

    const std::shared_ptr<FileSystem>& filesystem() const { return filesystem_; }

    // Node at which the hierarchy is mounted
    const NodePtr& location() const { return location_; }

    // Backing device node; nullptr when the platform exposes none
    const NodePtr& device() const { return device_; }

    // Textual device ("/dev/sda1", "tmpfs"); may be empty
    const std::string& device_name() const { return device_name_; }

    // Filesystem type ("ext4", "nfs"); may be empty
    const std::string& type() const { return type_; }

    // Space/inode usage when the backend reports it
    virtual std::optional<DiskUsage> usage() { return std::nullopt; }

private:
    std::shared_ptr<FileSystem> filesystem_;
    NodePtr location_;
    NodePtr device_;
    std::string device_name_;
    std::string type_;
};

using MountPointPtr = std::shared_ptr<MountPoint>;

// What a backend guarantees about a write interrupted by a disconnect
enum class InFlightWrites {
    Discarded,  // a failed write left nothing behind
    MayPersist  // some or all of a failed write may have landed
};

// Backend-scoped authority over roots, mountpoints and path resolution
// Instances are shared (std::shared_ptr) by every node they produce.
class FileSystem : public std::enable_shared_from_this<FileSystem> {
public:
    virtual ~FileSystem() = default;

    // Identity key: equal names denote the same hierarchy set
    // ("local", "ftp://user@host:21", "memory:scratch", "https://example.org")
    virtual std::string name() const = 0;

    // Nodes without a parent, one per distinct hierarchy
    virtual std::vector<NodePtr> roots() = 0;

    // First root
    NodePtr root();

    // Walk from the matching root by Hierarchy::child
    // Throws NotFound when no root matches, or when a component is missing and
    // the backend cannot construct nodes for nonexistent paths
    virtual NodePtr resolve(const Path& path);

    // Absolute text under one of the roots, or relative to the current
    // working node when the root supports WorkingDirectory
    NodePtr resolve(const std::string& text);

    // Default: one mountpoint per root, without device
    virtual std::vector<MountPointPtr> mountpoints();

    // Folder for temporary files, or nullptr
    virtual NodePtr temporary_directory() { return nullptr; }

    // Backend classification of connectivity failures
    virtual bool is_disconnection(const FSError& error) const {
        return error.code() == ErrorCode::Disconnected;
    }

    virtual InFlightWrites in_flight_writes() const { return InFlightWrites::Discarded; }

protected:
    FileSystem() = default;

    // Whether nodes can be built for paths that don't exist
    virtual bool speculative_nodes() const { return true; }
};

using FileSystemPtr = std::shared_ptr<FileSystem>;

} // namespace nodefs
