#include "nodefs/registry.hpp"
#include "nodefs/backends/ftp.hpp"
#include "nodefs/backends/local.hpp"
#include "nodefs/backends/memory.hpp"
#include "nodefs/backends/url.hpp"
#include "nodefs/reconnect.hpp"
#include "nodefs/error.hpp"
#include "log.hpp"
#include <yaml-cpp/yaml.h>

namespace nodefs {

Registry::Registry(const std::string& config_path) {
    load_config(config_path);
}

void Registry::load_config(const std::string& config_path) {
    YAML::Node config;
    try {
        config = YAML::LoadFile(config_path);
    } catch (const YAML::Exception& e) {
        throw FSError(ErrorCode::ConfigError, config_path,
            std::string("Failed to load config: ") + e.what());
    }

    if (!config["filesystems"]) {
        LOG_WARN("[nodefs] No 'filesystems' section in " << config_path);
        return;
    }

    for (const auto& item : config["filesystems"]) {
        std::string name;
        try {
            name = item.first.as<std::string>();
            const auto& fs_config = item.second;
            std::string type = fs_config["type"].as<std::string>();
            bool reconnect = fs_config["reconnect"].as<bool>(false);

            ReconnectingFileSystem::Factory factory;
            if (type == "local") {
                factory = [] { return local_filesystem(); };
                LOG_INFO("[nodefs] Filesystem '" << name << "': local");

            } else if (type == "memory") {
                auto store = MemoryStore::create(name);
                stores_[name] = store;
                factory = [store] { return store->connect(); };
                LOG_INFO("[nodefs] Filesystem '" << name << "': memory");

            } else if (type == "ftp") {
                FTPConfig ftp_config;
                ftp_config.host = fs_config["host"].as<std::string>(name);
                ftp_config.ip = fs_config["ip"].as<std::string>();
                ftp_config.username = fs_config["username"].as<std::string>("");
                ftp_config.password = fs_config["password"].as<std::string>("");
                ftp_config.port = fs_config["port"].as<int>(21);
                ftp_config.root = fs_config["root"].as<std::string>("");
                ftp_config.connect_timeout = fs_config["connect_timeout"].as<long>(10);
                ftp_config.timeout = fs_config["timeout"].as<long>(0);
                factory = [ftp_config] { return std::make_shared<FTPFileSystem>(ftp_config); };
                LOG_INFO("[nodefs] Filesystem '" << name << "': ftp " << ftp_config.host
                         << " (" << ftp_config.ip << ":" << ftp_config.port << ")");

            } else if (type == "url") {
                URLConfig url_config;
                url_config.base = fs_config["base"].as<std::string>();
                url_config.username = fs_config["username"].as<std::string>("");
                url_config.password = fs_config["password"].as<std::string>("");
                url_config.connect_timeout = fs_config["connect_timeout"].as<long>(10);
                url_config.timeout = fs_config["timeout"].as<long>(0);
                url_config.max_redirects = fs_config["max_redirects"].as<long>(10);
                factory = [url_config] { return std::make_shared<URLFileSystem>(url_config); };
                LOG_INFO("[nodefs] Filesystem '" << name << "': url " << url_config.base);

            } else {
                LOG_WARN("[nodefs] Unknown filesystem type '" << type << "' for '" << name << "'");
                continue;
            }

            if (reconnect) {
                add(name, ReconnectingFileSystem::wrap(factory));
                LOG_INFO("[nodefs] Filesystem '" << name << "' reconnects on disconnection");
            } else {
                add(name, factory());
            }
        } catch (const YAML::Exception& e) {
            throw FSError(ErrorCode::ConfigError, config_path,
                "Invalid entry '" + name + "': " + e.what());
        }
    }

    LOG_INFO("[nodefs] Initialized with " << filesystems_.size() << " filesystem(s)");
}

void Registry::add(const std::string& name, FileSystemPtr filesystem) {
    if (!filesystem) {
        throw FSError(ErrorCode::ConfigError, "Filesystem '" + name + "' is null");
    }
    filesystems_[name] = std::move(filesystem);
}

FileSystemPtr Registry::get(const std::string& name) const {
    auto it = filesystems_.find(name);
    if (it == filesystems_.end()) {
        throw FSError(ErrorCode::NotFound, "@" + name, "No filesystem named '" + name + "'");
    }
    return it->second;
}

bool Registry::contains(const std::string& name) const {
    return filesystems_.count(name) > 0;
}

std::vector<std::string> Registry::names() const {
    std::vector<std::string> result;
    result.reserve(filesystems_.size());
    for (const auto& entry : filesystems_) {
        result.push_back(entry.first);
    }
    return result;
}

std::shared_ptr<MemoryStore> Registry::memory_store(const std::string& name) const {
    auto it = stores_.find(name);
    return it == stores_.end() ? nullptr : it->second;
}

NodePtr Registry::resolve(const std::string& address) const {
    return resolve(Address::parse(address));
}

NodePtr Registry::resolve(const Address& address) const {
    switch (address.kind()) {
        case Address::Kind::Named: {
            FileSystemPtr filesystem = get(address.name());
            return filesystem->resolve(filesystem->root()->path().resolve(address.path()));
        }
        case Address::Kind::URL: {
            auto parts = URLFileSystem::split_url(address.path());
            // Reuse a configured filesystem for the same origin and its credentials
            for (const auto& entry : filesystems_) {
                if (entry.second->name() == parts.first) {
                    return entry.second->resolve(Path(parts.first).resolve(parts.second));
                }
            }
            URLConfig url_config;
            url_config.base = parts.first;
            auto filesystem = std::make_shared<URLFileSystem>(url_config);
            return filesystem->resolve(Path(parts.first).resolve(parts.second));
        }
        case Address::Kind::Local:
        default:
            return local_filesystem()->resolve(address.path());
    }
}

} // namespace nodefs
