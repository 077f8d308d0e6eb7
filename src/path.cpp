#include "nodefs/path.hpp"
#include "nodefs/error.hpp"
#include <algorithm>

namespace nodefs {

namespace {

std::vector<std::string> split_components(const std::string& text) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('/', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        std::string part = text.substr(start, end - start);
        if (!part.empty() && part != ".") {
            parts.push_back(std::move(part));
        }
        start = end + 1;
    }
    return parts;
}

} // anonymous namespace

Path::Path(std::string root, std::vector<std::string> components)
    : root_(std::move(root)), components_(std::move(components)) {}

Path Path::parse(const std::string& text, const std::string& root) {
    std::string remaining = text;
    if (!root.empty() && remaining.compare(0, root.size(), root) == 0) {
        remaining = remaining.substr(root.size());
    }
    return Path(root, split_components(remaining));
}

std::string Path::name() const {
    if (components_.empty()) {
        return "";
    }
    return components_.back();
}

std::optional<Path> Path::parent() const {
    if (components_.empty()) {
        return std::nullopt;
    }
    std::vector<std::string> up(components_.begin(), components_.end() - 1);
    return Path(root_, std::move(up));
}

Path Path::join(const std::string& component) const {
    std::vector<std::string> joined = components_;
    joined.push_back(component);
    return Path(root_, std::move(joined));
}

Path Path::resolve(const std::string& relative) const {
    std::vector<std::string> result;
    if (relative.empty() || relative[0] != '/') {
        result = components_;
    }

    for (auto& part : split_components(relative)) {
        if (part == "..") {
            // ".." at a root stays at the root
            if (!result.empty()) {
                result.pop_back();
            }
        } else {
            result.push_back(std::move(part));
        }
    }
    return Path(root_, std::move(result));
}

bool Path::is_ancestor_of(const Path& other) const {
    if (root_ != other.root_ || components_.size() >= other.components_.size()) {
        return false;
    }
    return std::equal(components_.begin(), components_.end(), other.components_.begin());
}

std::vector<std::string> Path::relative_to(const Path& ancestor) const {
    if (ancestor != *this && !ancestor.is_ancestor_of(*this)) {
        throw FSError(ErrorCode::InvalidPath, str(),
            "Path is not below " + ancestor.str());
    }
    return std::vector<std::string>(components_.begin() + ancestor.components_.size(),
                                    components_.end());
}

std::string Path::str(char separator) const {
    std::string result = root_;
    for (size_t i = 0; i < components_.size(); ++i) {
        if (i > 0 || result.empty() || result.back() != separator) {
            result += separator;
        }
        result += components_[i];
    }
    return result;
}

bool Path::operator<(const Path& other) const {
    if (root_ != other.root_) {
        return root_ < other.root_;
    }
    return components_ < other.components_;
}

size_t Path::hash() const {
    // boost::hash_combine style mixing
    size_t seed = std::hash<std::string>()(root_);
    for (const auto& component : components_) {
        seed ^= std::hash<std::string>()(component) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    }
    return seed;
}

} // namespace nodefs
