#pragma once

#include <string>

namespace nodefs {

// Textual node address
// Supports:
//   - Named filesystems: "@archive/data/run.bin", "@archive" (its root)
//   - URLs: "https://example.org/file.txt"
//   - Local paths: "/home/user/file.txt", "relative/file.txt"
class Address {
public:
    enum class Kind { Local, Named, URL };

    Address() = default;

    static Address parse(const std::string& text);

    Kind kind() const { return kind_; }
    bool has_name() const { return kind_ == Kind::Named; }
    bool is_url() const { return kind_ == Kind::URL; }

    // Filesystem name without the '@' ("archive"); empty unless named
    const std::string& name() const { return name_; }

    // Path text: "/data/run.bin" for named addresses, the URL for URLs
    const std::string& path() const { return path_; }

    std::string to_string() const;

    bool empty() const { return kind_ == Kind::Local && path_.empty(); }

private:
    Kind kind_ = Kind::Local;
    std::string name_;
    std::string path_;
};

} // namespace nodefs
