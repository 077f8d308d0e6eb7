#pragma once

#include "nodefs/capabilities.hpp"
#include "nodefs/filesystem.hpp"
#include <utility>

namespace nodefs {

// URL backend configuration
struct URLConfig {
    std::string base;      // "https://example.org"; only the origin is used
    std::string username;  // optional HTTP credentials for this origin only
    std::string password;
    long connect_timeout = 10;  // seconds
    long timeout = 0;           // seconds per request, 0 = none
    long max_redirects = 10;
};

// One HTTP(S) origin reached with libcurl
// The root marker of every path is the origin ("https://example.org").
// Redirect responses are links whose target is the Location URL; a target on
// another origin resolves into a separate, credential-less URLFileSystem.
class URLFileSystem : public FileSystem {
public:
    explicit URLFileSystem(URLConfig config);

    // The origin, e.g. "https://example.org"
    std::string name() const override { return origin_; }
    std::vector<NodePtr> roots() override;

    const URLConfig& config() const { return config_; }
    const std::string& origin() const { return origin_; }

    std::string build_url(const Path& path) const;

    // Split an absolute URL into origin and the rest ("/a/b?q")
    // Throws FSError(InvalidPath) when text has no scheme
    static std::pair<std::string, std::string> split_url(const std::string& text);

private:
    URLConfig config_;
    std::string origin_;
};

class URLNode : public Node,
                public Hierarchy,
                public Readable,
                public Sizable {
public:
    URLNode(std::shared_ptr<URLFileSystem> filesystem, Path path);

    // Hierarchy; an absolute URL as name addresses that URL directly
    NodePtr parent() override;
    NodePtr child(const std::string& name) override;
    std::vector<std::string> get_path_components() override;

    // Readable; URLs are never folders
    bool is_file() override;
    bool is_folder() override { return false; }
    bool exists() override;
    std::optional<std::string> link_target() override;
    std::unique_ptr<ReadStream> open_for_reading() override;

    // Content-Length, or the byte count of a full download when absent
    uint64_t size() override;

    std::string url() const { return url_->build_url(path()); }

private:
    enum class State { Missing, File, Link };
    struct Probe {
        State state = State::Missing;
        std::string location;
    };

    // HEAD without following redirects
    Probe probe();

    NodePtr make(Path path) const;

    std::shared_ptr<URLFileSystem> url_;
};

} // namespace nodefs
