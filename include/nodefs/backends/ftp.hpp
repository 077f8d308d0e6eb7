#pragma once

#include "nodefs/capabilities.hpp"
#include "nodefs/filesystem.hpp"

namespace nodefs {

// FTP backend configuration
struct FTPConfig {
    std::string host;      // Logical host name (for identification)
    std::string ip;        // IP address or hostname
    std::string username;
    std::string password;
    int port = 21;
    std::string root;      // Root path on FTP server, relative to the login folder
    long connect_timeout = 10;  // seconds
    long timeout = 0;           // seconds per request, 0 = none
};

// FTP server reached with libcurl, one connection per request
// Reads fetch bounded byte ranges so a reader can resume at any offset;
// writes upload each chunk with APPE, so a chunk interrupted by a dropped
// connection may have partly landed (InFlightWrites::MayPersist).
class FTPFileSystem : public FileSystem {
public:
    explicit FTPFileSystem(FTPConfig config);

    // "ftp://user@ip:port"
    std::string name() const override;
    // Single root whose marker is the endpoint()
    std::vector<NodePtr> roots() override;
    InFlightWrites in_flight_writes() const override { return InFlightWrites::MayPersist; }

    const FTPConfig& config() const { return config_; }

    // "ftp://ip:port", without credentials
    std::string endpoint() const;

    // URL of a node; folders get a trailing '/'
    std::string build_url(const Path& path, bool folder = false) const;

    // Server-side pathname for QUOTE commands
    std::string remote_path(const Path& path) const;

    std::string build_userpass() const;

private:
    FTPConfig config_;
};

class FTPNode : public Node,
                public Hierarchy,
                public Listable,
                public Readable,
                public Sizable,
                public Writable {
public:
    FTPNode(std::shared_ptr<FTPFileSystem> filesystem, Path path);

    // Hierarchy
    NodePtr parent() override;
    NodePtr child(const std::string& name) override;
    std::vector<std::string> get_path_components() override;

    // Listable
    std::optional<std::vector<std::string>> child_names() override;

    // Readable (FTP has no links: link_target() is always empty)
    bool is_file() override;
    bool is_folder() override;
    bool exists() override;
    std::optional<std::string> link_target() override { return std::nullopt; }
    std::unique_ptr<ReadStream> open_for_reading() override;

    // Sizable
    uint64_t size() override;

    // Writable
    std::unique_ptr<WriteStream> open_for_writing(bool append = false) override;
    void create_folder() override;
    void link_to(const std::string& target) override;
    void delete_just_this_thing() override;

    // RNFR/RNTO within one server
    void rename_to(Node& destination) override;

private:
    NodePtr make(Path path) const;

    // SIZE of a file; no value when the path is not a file
    std::optional<uint64_t> remote_size();

    void quote(const std::vector<std::string>& commands, const std::string& operation);

    std::shared_ptr<FTPFileSystem> ftp_;
};

} // namespace nodefs
