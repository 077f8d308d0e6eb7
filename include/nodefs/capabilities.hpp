#pragma once

#include "nodefs/digest.hpp"
#include "nodefs/node.hpp"
#include "nodefs/sequence.hpp"
#include "nodefs/stream.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nodefs {

class MountPoint;

// Capability interfaces
// Each interface declares the primitives a backend must supply (pure virtual)
// and derived operations computed generically from them. Derived operations
// that need another interface look it up on the node at runtime and fail with
// UnsupportedOperation when it is absent. Primitive failures propagate
// unchanged; nothing here retries.

// ----------------------------------------------------------------------------
// Hierarchy
// ----------------------------------------------------------------------------
class Hierarchy {
public:
    static constexpr Capability kCapability = Capability::Hierarchy;

    virtual ~Hierarchy() = default;

    // Parent node, or nullptr iff this node is one of its filesystem's roots
    virtual NodePtr parent() = 0;

    // Node for name below this one; name may contain '/', "." and ".."
    // (use safe_child() for untrusted names)
    virtual NodePtr child(const std::string& name) = 0;

    // Components below the root marker
    virtual std::vector<std::string> get_path_components() = 0;

    // Ancestors nearest first; self first when including_self is set
    std::vector<NodePtr> get_ancestors(bool including_self = false);
    std::vector<NodePtr> ancestors() { return get_ancestors(); }

    bool ancestor_of(Node& other, bool including_self = false);
    bool descendent_of(Node& other, bool including_self = false);

    // Rendered path: root marker followed by the components
    std::string get_path(char separator = '/');
    std::vector<std::string> path_components() { return get_path_components(); }

    // Last path component, empty for a root
    std::string name();

    bool same_as(Node& other);

    NodePtr sibling(const std::string& name);

    // child(name) that must stay strictly below this node
    // Throws FSError(PathEscape) for names like "../../etc"
    NodePtr safe_child(const std::string& name);

    // MountPoint whose location is the nearest ancestor-or-self
    std::shared_ptr<MountPoint> mountpoint();
    bool is_mount();
};

// ----------------------------------------------------------------------------
// ExtendedAttributes
// ----------------------------------------------------------------------------
class ExtendedAttributes {
public:
    static constexpr Capability kCapability = Capability::ExtendedAttributes;

    virtual ~ExtendedAttributes() = default;

    // Throws FSError(NotFound) when the attribute is not set
    virtual std::string get_xattr(const std::string& name) = 0;
    virtual void set_xattr(const std::string& name, const std::string& value) = 0;
    virtual void delete_xattr(const std::string& name) = 0;
    virtual std::vector<std::string> list_xattrs() = 0;

    bool has_xattr(const std::string& name);

    // Throws FSError(NotFound) when the attribute is not set
    void check_xattr(const std::string& name);

    // Replace target's attributes with a copy of ours
    void copy_xattrs_to(ExtendedAttributes& target);
};

// ----------------------------------------------------------------------------
// Listable
// ----------------------------------------------------------------------------
enum class Visit {
    Yield,        // yield the node and descend into it
    YieldOnly,    // yield the node, don't descend
    DescendOnly,  // don't yield the node, descend into it
    Skip          // neither
};

using RecurseFilter = std::function<Visit(const NodePtr&)>;

class Listable {
public:
    static constexpr Capability kCapability = Capability::Listable;

    virtual ~Listable() = default;

    // Sorted child names; no value when this node is not a folder
    virtual std::optional<std::vector<std::string>> child_names() = 0;

    // Children in child_names() order; empty for non-folders
    Sequence<NodePtr> children();

    // Nodes below this one matching a '/'-separated pattern
    // Per component: '*' any run, '?' one character, "**" any number of levels
    Sequence<NodePtr> glob(const std::string& pattern);

    // Depth-first walk, parents before their children
    // Links to folders are walked through; a cycle of links never ends.
    Sequence<NodePtr> recurse(RecurseFilter filter = nullptr, bool include_self = true);

    // Filter for recurse() that yields links without walking through them
    static Visit stop_at_links(const NodePtr& node);
};

// ----------------------------------------------------------------------------
// Readable
// ----------------------------------------------------------------------------
struct CopyOptions {
    bool overwrite = false;         // delete an existing destination first
    bool dereference_links = true;  // copy link targets instead of the links
    bool copy_xattrs = false;       // copy extended attributes when both ends support them
};

class Readable {
public:
    static constexpr Capability kCapability = Capability::Readable;
    static constexpr size_t kDefaultBlockSize = 16384;

    virtual ~Readable() = default;

    // is_file/is_folder look through links; exists is true for broken links
    virtual bool is_file() = 0;
    virtual bool is_folder() = 0;
    virtual bool exists() = 0;

    // Target text when this node is a link
    virtual std::optional<std::string> link_target() = 0;

    virtual std::unique_ptr<ReadStream> open_for_reading() = 0;

    bool is_directory() { return is_folder(); }
    bool is_link() { return link_target().has_value(); }

    // Referent of this link (self when not a link), resolved against the parent
    NodePtr dereference(bool recursive = false);

    bool is_broken();
    bool valid();

    // Throw NotFound when missing, NotAFile / NotAFolder when the wrong kind
    void check_file();
    void check_folder();

    // Whole contents in memory
    Block read();
    std::string read_string();

    // Stream open for the lifetime of the returned sequence
    Sequence<Block> read_blocks(size_t block_size = kDefaultBlockSize);

    // Lowercase hex digest of the contents, streamed block by block
    std::string hash(const std::string& algorithm = "md5");
    std::string hash(Digest& digest);

    void copy_to(Node& destination, const CopyOptions& options = CopyOptions());

    // copy_to(folder.child(name())); returns the new node
    NodePtr copy_into(Node& folder, const CopyOptions& options = CopyOptions());

private:
    NodePtr dereference_bounded(bool recursive, int hops);
};

// ----------------------------------------------------------------------------
// Sizable
// ----------------------------------------------------------------------------
class Sizable {
public:
    static constexpr Capability kCapability = Capability::Sizable;

    virtual ~Sizable() = default;

    // Byte count; folders report the recursive sum of their contents
    virtual uint64_t size() = 0;
};

// ----------------------------------------------------------------------------
// WorkingDirectory
// ----------------------------------------------------------------------------
class WorkingScope;

class WorkingDirectory {
public:
    static constexpr Capability kCapability = Capability::WorkingDirectory;

    virtual ~WorkingDirectory() = default;

    virtual void change_to() = 0;

    // Current node of this node's process/session
    virtual NodePtr current_working() = 0;

    void cd() { change_to(); }

    // Switch to this node until the returned scope ends
    WorkingScope as_working();
};

// Restores the previous working node on destruction
class WorkingScope {
public:
    WorkingScope(NodePtr target, NodePtr previous);
    ~WorkingScope();

    WorkingScope(WorkingScope&& other) noexcept;
    WorkingScope& operator=(WorkingScope&&) = delete;
    WorkingScope(const WorkingScope&) = delete;
    WorkingScope& operator=(const WorkingScope&) = delete;

    const NodePtr& target() const { return target_; }
    const NodePtr& previous() const { return previous_; }

    // Restore now; unlike the destructor this reports failures
    void restore();

private:
    NodePtr target_;
    NodePtr previous_;
};

// ----------------------------------------------------------------------------
// Writable
// ----------------------------------------------------------------------------
class Writable {
public:
    static constexpr Capability kCapability = Capability::Writable;

    virtual ~Writable() = default;

    // Truncates unless append is set; creates the file when missing
    virtual std::unique_ptr<WriteStream> open_for_writing(bool append = false) = 0;

    // AlreadyExists when something is at this path; NotFound when the parent is missing
    virtual void create_folder() = 0;

    virtual void link_to(const std::string& target) = 0;

    // Remove a file, link or empty folder
    virtual void delete_just_this_thing() = 0;

    // Move to destination; default copies then removes the source
    // Backends override for native renames within one filesystem
    virtual void rename_to(Node& destination);

    void append(const std::string& data);
    void append(const Block& data);
    void write(const std::string& data);
    void write(const Block& data);

    // Delete this node; folders are emptied child by child first
    // Fail-fast and non-atomic: a failure leaves what was already deleted deleted
    void remove(bool ignore_missing = false);

    void mkdir(bool silent = false);
    void mkdirs(bool silent = false);

    // Create a uniquely named folder below this one
    NodePtr create_temporary_folder(const std::string& prefix = "tmp");
};

} // namespace nodefs
