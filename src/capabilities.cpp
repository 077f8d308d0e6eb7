#include "nodefs/capabilities.hpp"
#include "nodefs/filesystem.hpp"
#include "log.hpp"
#include <algorithm>
#include <random>
#include <regex>
#include <unordered_set>
#include <utility>

namespace nodefs {

namespace {

// Longest chain of links followed before giving up (matches Linux MAXSYMLINKS)
constexpr int kMaxLinkHops = 40;

constexpr int kTemporaryFolderAttempts = 20;

// Every capability interface is mixed into a Node subclass
template <typename C>
Node& node_of(C* capability) {
    Node* node = dynamic_cast<Node*>(capability);
    if (!node) {
        throw FSError(ErrorCode::UnsupportedOperation,
            std::string(capability_to_string(C::kCapability)) + " is not attached to a node");
    }
    return *node;
}

// Convert one glob component to a regex
// * matches any run of characters, ? a single character
std::regex component_regex(const std::string& pattern) {
    std::string regex_str;
    regex_str.reserve(pattern.size() * 2);

    for (char c : pattern) {
        switch (c) {
            case '*':
                regex_str += ".*";
                break;
            case '?':
                regex_str += ".";
                break;
            case '.':
            case '+':
            case '(':
            case ')':
            case '[':
            case ']':
            case '{':
            case '}':
            case '^':
            case '$':
            case '|':
            case '\\':
                regex_str += '\\';
                regex_str += c;
                break;
            default:
                regex_str += c;
                break;
        }
    }
    return std::regex(regex_str);
}

std::string random_suffix(size_t length) {
    static const char alphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789_";
    static thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_int_distribution<size_t> pick(0, sizeof(alphabet) - 2);
    std::string suffix;
    for (size_t i = 0; i < length; ++i) {
        suffix += alphabet[pick(engine)];
    }
    return suffix;
}

} // anonymous namespace

// ============================================================================
// Hierarchy
// ============================================================================

std::vector<NodePtr> Hierarchy::get_ancestors(bool including_self) {
    std::vector<NodePtr> result;
    NodePtr current = including_self ? node_of(this).self() : parent();
    while (current) {
        result.push_back(current);
        current = current->require<Hierarchy>().parent();
    }
    return result;
}

bool Hierarchy::ancestor_of(Node& other, bool including_self) {
    Hierarchy* other_hierarchy = other.as<Hierarchy>();
    if (!other_hierarchy) {
        return false;
    }
    return other_hierarchy->descendent_of(node_of(this), including_self);
}

bool Hierarchy::descendent_of(Node& other, bool including_self) {
    for (const auto& ancestor : get_ancestors(including_self)) {
        if (*ancestor == other) {
            return true;
        }
    }
    return false;
}

std::string Hierarchy::get_path(char separator) {
    Node& node = node_of(this);
    return Path(node.path().root(), get_path_components()).str(separator);
}

std::string Hierarchy::name() {
    auto components = get_path_components();
    return components.empty() ? std::string() : components.back();
}

bool Hierarchy::same_as(Node& other) {
    return node_of(this) == other;
}

NodePtr Hierarchy::sibling(const std::string& name) {
    NodePtr up = parent();
    if (!up) {
        throw FSError(ErrorCode::NotFound, node_of(this).path().str(), "A root has no siblings");
    }
    return up->require<Hierarchy>().child(name);
}

NodePtr Hierarchy::safe_child(const std::string& name) {
    NodePtr result = child(name);
    if (!ancestor_of(*result)) {
        throw FSError(ErrorCode::PathEscape, node_of(this).path().str(),
            "Child name '" + name + "' escapes its parent");
    }
    return result;
}

std::shared_ptr<MountPoint> Hierarchy::mountpoint() {
    Node& node = node_of(this);
    auto mounts = node.filesystem()->mountpoints();
    for (const auto& ancestor : get_ancestors(true)) {
        for (const auto& mount : mounts) {
            if (mount->location() && mount->location()->path() == ancestor->path()) {
                return mount;
            }
        }
    }
    return nullptr;
}

bool Hierarchy::is_mount() {
    auto mount = mountpoint();
    return mount && mount->location()->path() == node_of(this).path();
}

// ============================================================================
// ExtendedAttributes
// ============================================================================

bool ExtendedAttributes::has_xattr(const std::string& name) {
    auto names = list_xattrs();
    return std::find(names.begin(), names.end(), name) != names.end();
}

void ExtendedAttributes::check_xattr(const std::string& name) {
    if (!has_xattr(name)) {
        throw FSError(ErrorCode::NotFound, node_of(this).path().str(),
            "No extended attribute '" + name + "'");
    }
}

void ExtendedAttributes::copy_xattrs_to(ExtendedAttributes& target) {
    for (const auto& name : target.list_xattrs()) {
        target.delete_xattr(name);
    }
    for (const auto& name : list_xattrs()) {
        target.set_xattr(name, get_xattr(name));
    }
}

// ============================================================================
// Listable
// ============================================================================

Sequence<NodePtr> Listable::children() {
    NodePtr node = node_of(this).self();
    auto names = std::make_shared<std::optional<std::vector<std::string>>>();
    auto index = std::make_shared<size_t>(0);
    auto listed = std::make_shared<bool>(false);

    // Names are fetched on the first pull, child nodes built one at a time
    return Sequence<NodePtr>([node, names, index, listed]() -> std::optional<NodePtr> {
        if (!*listed) {
            *names = node->require<Listable>().child_names();
            *listed = true;
        }
        if (!*names || *index >= (*names)->size()) {
            return std::nullopt;
        }
        return node->require<Hierarchy>().child((**names)[(*index)++]);
    });
}

Sequence<NodePtr> Listable::glob(const std::string& pattern) {
    struct Part {
        bool any_depth;
        std::regex regex;
    };
    auto parts = std::make_shared<std::vector<Part>>();
    const Path parsed = Path::parse(pattern);
    for (const auto& component : parsed.components()) {
        if (component == "**") {
            parts->push_back({true, std::regex()});
        } else {
            parts->push_back({false, component_regex(component)});
        }
    }

    // Pending (node, index of the next pattern component) pairs
    using Frame = std::pair<NodePtr, size_t>;
    auto stack = std::make_shared<std::vector<Frame>>();
    auto yielded = std::make_shared<std::unordered_set<Path>>();
    stack->emplace_back(node_of(this).self(), 0);

    return Sequence<NodePtr>([parts, stack, yielded]() -> std::optional<NodePtr> {
        while (!stack->empty()) {
            Frame frame = std::move(stack->back());
            stack->pop_back();
            NodePtr node = frame.first;
            size_t index = frame.second;

            if (index == parts->size()) {
                if (yielded->insert(node->path()).second) {
                    return node;
                }
                continue;
            }

            const Part& part = (*parts)[index];
            Listable* listable = node->as<Listable>();
            if (!listable) {
                continue;
            }
            auto names = listable->child_names();
            if (!names) {
                continue;
            }

            Hierarchy& hierarchy = node->require<Hierarchy>();
            // Push in reverse so children pop in listing order
            for (auto it = names->rbegin(); it != names->rend(); ++it) {
                if (part.any_depth) {
                    stack->emplace_back(hierarchy.child(*it), index);
                } else if (std::regex_match(*it, part.regex)) {
                    stack->emplace_back(hierarchy.child(*it), index + 1);
                }
            }
            if (part.any_depth) {
                stack->emplace_back(node, index + 1);
            }
        }
        return std::nullopt;
    });
}

Visit Listable::stop_at_links(const NodePtr& node) {
    Readable* readable = node->as<Readable>();
    return readable && readable->is_link() ? Visit::YieldOnly : Visit::Yield;
}

Sequence<NodePtr> Listable::recurse(RecurseFilter filter, bool include_self) {
    NodePtr root = node_of(this).self();
    auto pending = std::make_shared<std::vector<Sequence<NodePtr>>>();
    auto started = std::make_shared<bool>(false);

    auto descend = [pending](const NodePtr& node) {
        Listable* listable = node->as<Listable>();
        if (!listable) {
            return;
        }
        pending->push_back(listable->children());
    };

    return Sequence<NodePtr>([root, filter, include_self, pending, started, descend]()
                             -> std::optional<NodePtr> {
        auto visit = [&](const NodePtr& node) -> bool {
            Visit decision = filter ? filter(node) : Visit::Yield;
            if (decision == Visit::Yield || decision == Visit::DescendOnly) {
                descend(node);
            }
            return decision == Visit::Yield || decision == Visit::YieldOnly;
        };

        if (!*started) {
            *started = true;
            if (include_self) {
                if (visit(root)) {
                    return root;
                }
            } else {
                descend(root);
            }
        }

        while (!pending->empty()) {
            auto child = pending->back().next();
            if (!child) {
                pending->pop_back();
                continue;
            }
            if (visit(*child)) {
                return *child;
            }
        }
        return std::nullopt;
    });
}

// ============================================================================
// Readable
// ============================================================================

NodePtr Readable::dereference(bool recursive) {
    return dereference_bounded(recursive, 0);
}

NodePtr Readable::dereference_bounded(bool recursive, int hops) {
    Node& node = node_of(this);
    auto target = link_target();
    if (!target) {
        return node.self();
    }
    if (hops >= kMaxLinkHops) {
        throw FSError(ErrorCode::BrokenLink, node.path().str(), "Too many levels of links");
    }
    // Relative targets are relative to the folder holding the link
    NodePtr parent = node.require<Hierarchy>().parent();
    if (!parent) {
        throw FSError(ErrorCode::BrokenLink, node.path().str(), "Link at a root has no parent");
    }
    NodePtr referent = parent->require<Hierarchy>().child(*target);
    if (!recursive) {
        return referent;
    }
    Readable* next = referent->as<Readable>();
    if (!next) {
        return referent;
    }
    return next->dereference_bounded(true, hops + 1);
}

bool Readable::is_broken() {
    if (!is_link()) {
        return false;
    }
    try {
        return !dereference(true)->require<Readable>().exists();
    } catch (const FSError& e) {
        if (e.code() == ErrorCode::BrokenLink) {
            return true;
        }
        throw;
    }
}

bool Readable::valid() {
    return exists() && !is_broken();
}

void Readable::check_file() {
    if (!is_file()) {
        Node& node = node_of(this);
        if (exists()) {
            throw FSError(ErrorCode::NotAFile, node.path().str(), "Not a file");
        }
        throw FSError(ErrorCode::NotFound, node.path().str(), "File does not exist");
    }
}

void Readable::check_folder() {
    if (!is_folder()) {
        Node& node = node_of(this);
        if (exists()) {
            throw FSError(ErrorCode::NotAFolder, node.path().str(), "Not a folder");
        }
        throw FSError(ErrorCode::NotFound, node.path().str(), "Folder does not exist");
    }
}

Block Readable::read() {
    auto stream = open_for_reading();
    Block data;
    while (true) {
        Block block = stream->read_block(kDefaultBlockSize);
        if (block.empty()) {
            break;
        }
        data.insert(data.end(), block.begin(), block.end());
    }
    stream->close();
    return data;
}

std::string Readable::read_string() {
    Block data = read();
    return std::string(reinterpret_cast<const char*>(data.data()), data.size());
}

Sequence<Block> Readable::read_blocks(size_t block_size) {
    // Opened now so a missing file fails here, not on first iteration
    std::shared_ptr<ReadStream> stream(open_for_reading());
    return Sequence<Block>([stream, block_size]() -> std::optional<Block> {
        Block block = stream->read_block(block_size);
        if (block.empty()) {
            stream->close();
            return std::nullopt;
        }
        return block;
    });
}

std::string Readable::hash(const std::string& algorithm) {
    auto digest = make_digest(algorithm);
    return hash(*digest);
}

std::string Readable::hash(Digest& digest) {
    for (const auto& block : read_blocks()) {
        digest.update(block.data(), block.size());
    }
    return digest.hexdigest();
}

void Readable::copy_to(Node& destination, const CopyOptions& options) {
    Node& node = node_of(this);
    Readable& dest_readable = destination.require<Readable>();
    Writable& dest_writable = destination.require<Writable>();

    if (dest_readable.exists()) {
        if (!options.overwrite) {
            throw FSError(ErrorCode::AlreadyExists, destination.path().str(),
                "Copy destination already exists");
        }
        dest_writable.remove();
    }

    NodePtr source = options.dereference_links ? dereference(true) : node.self();
    Readable& source_readable = source->require<Readable>();

    if (!options.dereference_links && source_readable.is_link()) {
        dest_writable.link_to(*source_readable.link_target());
    } else if (source_readable.is_folder()) {
        dest_writable.create_folder();
        for (const auto& child : source->require<Listable>().children()) {
            child->require<Readable>().copy_into(destination, options);
        }
    } else if (source_readable.is_file()) {
        auto out = dest_writable.open_for_writing();
        for (const auto& block : source_readable.read_blocks()) {
            out->write(block);
        }
        out->close();
    } else {
        throw FSError(ErrorCode::NotFound, source->path().str(), "Copy source does not exist");
    }

    if (options.copy_xattrs) {
        ExtendedAttributes* from = source->as<ExtendedAttributes>();
        ExtendedAttributes* to = destination.as<ExtendedAttributes>();
        if (from && to) {
            from->copy_xattrs_to(*to);
        }
    }
}

NodePtr Readable::copy_into(Node& folder, const CopyOptions& options) {
    std::string name = node_of(this).require<Hierarchy>().name();
    NodePtr target = folder.require<Hierarchy>().child(name);
    copy_to(*target, options);
    return target;
}

// ============================================================================
// WorkingDirectory
// ============================================================================

WorkingScope WorkingDirectory::as_working() {
    NodePtr previous = current_working();
    change_to();
    return WorkingScope(node_of(this).self(), std::move(previous));
}

WorkingScope::WorkingScope(NodePtr target, NodePtr previous)
    : target_(std::move(target)), previous_(std::move(previous)) {}

WorkingScope::WorkingScope(WorkingScope&& other) noexcept
    : target_(std::move(other.target_)), previous_(std::move(other.previous_)) {}

WorkingScope::~WorkingScope() {
    if (!previous_) {
        return;
    }
    try {
        restore();
    } catch (const FSError& e) {
        LOG_WARN("[nodefs] Failed to restore working folder " << previous_->describe()
                 << ": " << e.what());
    }
}

void WorkingScope::restore() {
    if (!previous_) {
        return;
    }
    previous_->require<WorkingDirectory>().change_to();
    previous_.reset();
}

// ============================================================================
// Writable
// ============================================================================

void Writable::rename_to(Node& destination) {
    CopyOptions options;
    options.dereference_links = false;
    node_of(this).require<Readable>().copy_to(destination, options);
    remove();
}

void Writable::append(const std::string& data) {
    auto out = open_for_writing(true);
    out->write(data);
    out->close();
}

void Writable::append(const Block& data) {
    auto out = open_for_writing(true);
    out->write(data);
    out->close();
}

void Writable::write(const std::string& data) {
    auto out = open_for_writing(false);
    out->write(data);
    out->close();
}

void Writable::write(const Block& data) {
    auto out = open_for_writing(false);
    out->write(data);
    out->close();
}

void Writable::remove(bool ignore_missing) {
    Node& node = node_of(this);
    Readable& readable = node.require<Readable>();

    if (!readable.exists()) {
        if (ignore_missing) {
            return;
        }
        throw FSError(ErrorCode::NotFound, node.path().str(), "Nothing to delete");
    }

    // Links are removed themselves, never emptied
    if (!readable.is_link() && readable.is_folder()) {
        Listable& listable = node.require<Listable>();
        Hierarchy& hierarchy = node.require<Hierarchy>();
        auto names = listable.child_names();
        if (names) {
            for (const auto& name : *names) {
                hierarchy.child(name)->require<Writable>().remove();
            }
        }
    }
    delete_just_this_thing();
}

void Writable::mkdir(bool silent) {
    try {
        create_folder();
    } catch (const FSError& e) {
        if (e.code() != ErrorCode::AlreadyExists || !silent) {
            throw;
        }
        Readable* readable = node_of(this).as<Readable>();
        if (readable && !readable->is_folder()) {
            throw;
        }
    }
}

void Writable::mkdirs(bool silent) {
    Node& node = node_of(this);
    Hierarchy* hierarchy = node.as<Hierarchy>();
    NodePtr parent = hierarchy ? hierarchy->parent() : nullptr;
    if (parent) {
        Readable* parent_readable = parent->as<Readable>();
        if (!parent_readable || !parent_readable->exists()) {
            parent->require<Writable>().mkdirs(true);
        }
    }
    mkdir(silent);
}

NodePtr Writable::create_temporary_folder(const std::string& prefix) {
    Node& node = node_of(this);
    Hierarchy& hierarchy = node.require<Hierarchy>();
    for (int attempt = 0; attempt < kTemporaryFolderAttempts; ++attempt) {
        NodePtr candidate = hierarchy.child(prefix + random_suffix(8));
        try {
            candidate->require<Writable>().create_folder();
            return candidate;
        } catch (const FSError& e) {
            if (e.code() != ErrorCode::AlreadyExists) {
                throw;
            }
        }
    }
    throw FSError(ErrorCode::AlreadyExists, node.path().str(),
        "No usable temporary folder name found");
}

} // namespace nodefs
