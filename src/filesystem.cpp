#include "nodefs/filesystem.hpp"
#include "nodefs/capabilities.hpp"

namespace nodefs {

MountPoint::MountPoint(std::shared_ptr<FileSystem> filesystem, NodePtr location, NodePtr device,
                       std::string device_name, std::string type)
    : filesystem_(std::move(filesystem)),
      location_(std::move(location)),
      device_(std::move(device)),
      device_name_(std::move(device_name)),
      type_(std::move(type)) {}

NodePtr FileSystem::root() {
    auto all = roots();
    if (all.empty()) {
        throw FSError(ErrorCode::NotFound, name(), "Filesystem has no roots");
    }
    return all.front();
}

NodePtr FileSystem::resolve(const Path& path) {
    // Apply "." and ".." before walking so the walk never leaves the root
    std::string relative;
    for (const auto& component : path.components()) {
        if (!relative.empty()) relative += "/";
        relative += component;
    }
    Path normalized = Path(path.root()).resolve(relative);

    NodePtr node;
    for (const auto& candidate : roots()) {
        if (candidate->path().root() == normalized.root()) {
            node = candidate;
            break;
        }
    }
    if (!node) {
        throw FSError(ErrorCode::NotFound, path.str(),
            "No root of " + name() + " matches '" + normalized.root() + "'");
    }

    for (const auto& component : normalized.components()) {
        node = node->require<Hierarchy>().child(component);
        if (!speculative_nodes()) {
            Readable* readable = node->as<Readable>();
            if (readable && !readable->exists()) {
                throw FSError(ErrorCode::NotFound, node->path().str(), "No such file or folder");
            }
        }
    }
    return node;
}

NodePtr FileSystem::resolve(const std::string& text) {
    for (const auto& candidate : roots()) {
        const std::string& marker = candidate->path().root();
        if (!marker.empty() && text.compare(0, marker.size(), marker) == 0) {
            return resolve(Path::parse(text, marker));
        }
    }

    // Relative text: start from the session's current working node
    NodePtr base = root();
    if (WorkingDirectory* working = base->as<WorkingDirectory>()) {
        base = working->current_working();
    }
    return resolve(base->path().resolve(text));
}

std::vector<MountPointPtr> FileSystem::mountpoints() {
    std::vector<MountPointPtr> result;
    for (const auto& location : roots()) {
        result.push_back(std::make_shared<MountPoint>(shared_from_this(), location));
    }
    return result;
}

} // namespace nodefs
