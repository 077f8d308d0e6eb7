#pragma once

#include "nodefs/error.hpp"
#include "nodefs/path.hpp"
#include <cstddef>
#include <memory>
#include <string>

namespace nodefs {

class FileSystem;
class Node;
using NodePtr = std::shared_ptr<Node>;

// The seven capability interfaces a node type may implement
enum class Capability : unsigned {
    Hierarchy          = 1u << 0,
    ExtendedAttributes = 1u << 1,
    Listable           = 1u << 2,
    Readable           = 1u << 3,
    Sizable            = 1u << 4,
    WorkingDirectory   = 1u << 5,
    Writable           = 1u << 6
};

const char* capability_to_string(Capability capability);

class CapabilitySet {
public:
    CapabilitySet() = default;

    bool has(Capability capability) const {
        return (bits_ & static_cast<unsigned>(capability)) != 0;
    }
    CapabilitySet& add(Capability capability) {
        bits_ |= static_cast<unsigned>(capability);
        return *this;
    }
    bool empty() const { return bits_ == 0; }
    bool operator==(const CapabilitySet& other) const { return bits_ == other.bits_; }
    bool operator!=(const CapabilitySet& other) const { return bits_ != other.bits_; }

    // "Hierarchy,Readable,..." in declaration order
    std::string to_string() const;

private:
    unsigned bits_ = 0;
};

// A single addressable location within a FileSystem
// Backends derive their node type from Node plus the capability interfaces
// (nodefs/capabilities.hpp) they implement. Generic code asks for a
// capability at runtime:
//
//   if (auto* listable = node->as<Listable>()) { ... }
//   node->require<Readable>().read();   // throws UnsupportedOperation if absent
//
// Identity is the path plus the owning filesystem's name(), so two nodes for
// the same path on two instances of the same endpoint compare equal.
class Node : public std::enable_shared_from_this<Node> {
public:
    virtual ~Node() = default;

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    const Path& path() const { return path_; }
    const std::shared_ptr<FileSystem>& filesystem() const { return filesystem_; }

    // Capabilities this node exposes
    // Default probes the interfaces the dynamic type implements; wrappers
    // (reconnecting proxy nodes) narrow it to what the wrapped node supports.
    virtual CapabilitySet capabilities() const;

    template <typename C>
    C* as() {
        if (!capabilities().has(C::kCapability)) {
            return nullptr;
        }
        return dynamic_cast<C*>(this);
    }

    template <typename C>
    C& require() {
        C* capability = as<C>();
        if (!capability) {
            throw FSError(ErrorCode::UnsupportedOperation, path_.str(),
                std::string("Node does not support ") + capability_to_string(C::kCapability));
        }
        return *capability;
    }

    NodePtr self() { return shared_from_this(); }

    // "<filesystem name>:<path>" for logs and error messages
    std::string describe() const;

    bool operator==(const Node& other) const;
    bool operator!=(const Node& other) const { return !(*this == other); }

protected:
    Node(std::shared_ptr<FileSystem> filesystem, Path path);

private:
    std::shared_ptr<FileSystem> filesystem_;
    Path path_;
};

// Hash/equality functors for containers of NodePtr keyed by identity
struct NodeHash {
    size_t operator()(const NodePtr& node) const;
};

struct NodeEqual {
    bool operator()(const NodePtr& a, const NodePtr& b) const;
};

} // namespace nodefs
