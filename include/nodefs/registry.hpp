#pragma once

#include "nodefs/address.hpp"
#include "nodefs/filesystem.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace nodefs {

class MemoryStore;

// Named filesystems loaded from a YAML config
//
// Config format:
//   filesystems:
//     scratch:
//       type: local
//     archive:
//       type: ftp
//       host: archive
//       ip: 192.168.0.10
//       port: 21            # optional
//       username: user
//       password: pass
//       root: exports       # optional
//       timeout: 30         # optional, seconds
//       reconnect: true     # optional, any type
//     docs:
//       type: url
//       base: https://example.org
//     mem:
//       type: memory
class Registry {
public:
    Registry() = default;

    // Load from YAML config file; throws FSError(ConfigError)
    explicit Registry(const std::string& config_path);

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    void load_config(const std::string& config_path);

    // Register (or replace) a filesystem under a name
    void add(const std::string& name, FileSystemPtr filesystem);

    // Throws FSError(NotFound) for an unknown name
    FileSystemPtr get(const std::string& name) const;

    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;
    size_t size() const { return filesystems_.size(); }

    // Store behind a "memory" filesystem, or nullptr
    std::shared_ptr<MemoryStore> memory_store(const std::string& name) const;

    // Node for "@name/path", a URL, or a local path
    NodePtr resolve(const std::string& address) const;
    NodePtr resolve(const Address& address) const;

private:
    std::map<std::string, FileSystemPtr> filesystems_;
    std::map<std::string, std::shared_ptr<MemoryStore>> stores_;
};

} // namespace nodefs
