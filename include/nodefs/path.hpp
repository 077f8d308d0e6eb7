#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace nodefs {

// Location of a node within one filesystem
// A root marker ("/" on POSIX, "ftp://host:21" for a remote endpoint) plus an
// ordered list of components. Immutable; every operation returns a new Path.
//
//   Path p = Path::parse("/usr/share/doc");
//   p.components()  -> {"usr", "share", "doc"}
//   p.join("README") -> "/usr/share/doc/README"
class Path {
public:
    Path() = default;
    explicit Path(std::string root, std::vector<std::string> components = {});

    // Split text on '/' below the given root marker
    // Empty and "." components are dropped; ".." is kept as a component
    // (use resolve() for lexical normalization)
    static Path parse(const std::string& text, const std::string& root = "/");

    const std::string& root() const { return root_; }
    const std::vector<std::string>& components() const { return components_; }

    // Empty component sequence denotes a root
    bool is_root() const { return components_.empty(); }

    // Last component, empty for a root
    std::string name() const;

    // Path one level up; no value for a root
    std::optional<Path> parent() const;

    Path join(const std::string& component) const;

    // Apply a relative path ("a/b", "../c", "./d") lexically
    // A leading '/' restarts from this path's root; ".." never climbs past it
    Path resolve(const std::string& relative) const;

    // Strict prefix with an equal root marker
    bool is_ancestor_of(const Path& other) const;

    // Components of this path below the given ancestor
    // Throws FSError(InvalidPath) if ancestor is neither this path nor an ancestor of it
    std::vector<std::string> relative_to(const Path& ancestor) const;

    // Root marker followed by the components joined with separator
    std::string str(char separator = '/') const;

    bool operator==(const Path& other) const {
        return root_ == other.root_ && components_ == other.components_;
    }
    bool operator!=(const Path& other) const { return !(*this == other); }
    bool operator<(const Path& other) const;

    size_t hash() const;

private:
    std::string root_;
    std::vector<std::string> components_;
};

} // namespace nodefs

namespace std {
template <>
struct hash<nodefs::Path> {
    size_t operator()(const nodefs::Path& path) const { return path.hash(); }
};
} // namespace std
