#include "nodefs/address.hpp"
#include "nodefs/error.hpp"
#include <cctype>

namespace nodefs {

namespace {

// "scheme://" with an alphanumeric scheme
bool looks_like_url(const std::string& text) {
    size_t pos = text.find("://");
    if (pos == std::string::npos || pos == 0) {
        return false;
    }
    for (size_t i = 0; i < pos; ++i) {
        char c = text[i];
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

Address Address::parse(const std::string& text) {
    Address address;

    if (text.empty()) {
        return address;
    }

    if (text[0] == '@') {
        size_t slash_pos = text.find('/');
        if (slash_pos != std::string::npos) {
            // @name/path
            address.name_ = text.substr(1, slash_pos - 1);
            address.path_ = text.substr(slash_pos);
        } else {
            // Just @name: its root
            address.name_ = text.substr(1);
            address.path_ = "/";
        }
        if (address.name_.empty()) {
            throw FSError(ErrorCode::InvalidPath, text, "Missing filesystem name after '@'");
        }
        address.kind_ = Kind::Named;
        return address;
    }

    if (looks_like_url(text)) {
        address.kind_ = Kind::URL;
        address.path_ = text;
        return address;
    }

    address.path_ = text;
    return address;
}

std::string Address::to_string() const {
    if (kind_ == Kind::Named) {
        return "@" + name_ + path_;
    }
    return path_;
}

} // namespace nodefs
