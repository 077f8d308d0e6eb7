#pragma once

#include "nodefs/capabilities.hpp"
#include "nodefs/filesystem.hpp"
#include <filesystem>

namespace nodefs {

// The process's own POSIX hierarchy
// One instance per process (local_filesystem()); nodes are built for any
// path, existing or not, since existence is a separate predicate.
class LocalFileSystem : public FileSystem {
public:
    LocalFileSystem() = default;

    std::string name() const override { return "local"; }
    std::vector<NodePtr> roots() override;

    // One per entry of /proc/self/mounts; always includes "/"
    std::vector<MountPointPtr> mountpoints() override;

    NodePtr temporary_directory() override;

    // Node for a native pathname, relative names against the working folder
    NodePtr node(const std::filesystem::path& native);
};

std::shared_ptr<LocalFileSystem> local_filesystem();

class LocalMountPoint : public MountPoint {
public:
    using MountPoint::MountPoint;

    // statvfs() of the mount location
    std::optional<DiskUsage> usage() override;
};

class LocalNode : public Node,
                  public Hierarchy,
                  public ExtendedAttributes,
                  public Listable,
                  public Readable,
                  public Sizable,
                  public WorkingDirectory,
                  public Writable {
public:
    LocalNode(std::shared_ptr<FileSystem> filesystem, Path path);

    std::filesystem::path native() const { return std::filesystem::path(path().str()); }

    // Hierarchy
    NodePtr parent() override;
    NodePtr child(const std::string& name) override;
    std::vector<std::string> get_path_components() override;

    // ExtendedAttributes (Linux xattr namespaces, e.g. "user.origin")
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

    // rename(2) within the local hierarchy, copy + delete across devices
    void rename_to(Node& destination) override;

private:
    NodePtr make(Path path) const;
};

} // namespace nodefs
