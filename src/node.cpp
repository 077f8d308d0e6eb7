#include "nodefs/node.hpp"
#include "nodefs/capabilities.hpp"
#include "nodefs/filesystem.hpp"

namespace nodefs {

const char* capability_to_string(Capability capability) {
    switch (capability) {
        case Capability::Hierarchy:          return "Hierarchy";
        case Capability::ExtendedAttributes: return "ExtendedAttributes";
        case Capability::Listable:           return "Listable";
        case Capability::Readable:           return "Readable";
        case Capability::Sizable:            return "Sizable";
        case Capability::WorkingDirectory:   return "WorkingDirectory";
        case Capability::Writable:           return "Writable";
        default:                             return "Unknown";
    }
}

std::string CapabilitySet::to_string() const {
    static const Capability all[] = {
        Capability::Hierarchy, Capability::ExtendedAttributes, Capability::Listable,
        Capability::Readable, Capability::Sizable, Capability::WorkingDirectory,
        Capability::Writable,
    };
    std::string result;
    for (Capability capability : all) {
        if (has(capability)) {
            if (!result.empty()) result += ",";
            result += capability_to_string(capability);
        }
    }
    return result;
}

Node::Node(std::shared_ptr<FileSystem> filesystem, Path path)
    : filesystem_(std::move(filesystem)), path_(std::move(path)) {}

CapabilitySet Node::capabilities() const {
    CapabilitySet set;
    if (dynamic_cast<const Hierarchy*>(this)) set.add(Capability::Hierarchy);
    if (dynamic_cast<const ExtendedAttributes*>(this)) set.add(Capability::ExtendedAttributes);
    if (dynamic_cast<const Listable*>(this)) set.add(Capability::Listable);
    if (dynamic_cast<const Readable*>(this)) set.add(Capability::Readable);
    if (dynamic_cast<const Sizable*>(this)) set.add(Capability::Sizable);
    if (dynamic_cast<const WorkingDirectory*>(this)) set.add(Capability::WorkingDirectory);
    if (dynamic_cast<const Writable*>(this)) set.add(Capability::Writable);
    return set;
}

std::string Node::describe() const {
    return filesystem_->name() + ":" + path_.str();
}

bool Node::operator==(const Node& other) const {
    if (this == &other) {
        return true;
    }
    return path_ == other.path_ && filesystem_->name() == other.filesystem_->name();
}

size_t NodeHash::operator()(const NodePtr& node) const {
    if (!node) return 0;
    size_t seed = node->path().hash();
    seed ^= std::hash<std::string>()(node->filesystem()->name()) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    return seed;
}

bool NodeEqual::operator()(const NodePtr& a, const NodePtr& b) const {
    if (!a || !b) return a == b;
    return *a == *b;
}

} // namespace nodefs
