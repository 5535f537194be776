#include "store/name.h"

#include <algorithm>
#include <cctype>
#include <vector>

namespace layerstore {

namespace {

enum class PartKind { Host, Namespace, Model, Tag };

constexpr size_t kMaxHostLength = 350;
constexpr size_t kMaxPartLength = 80;

bool isAlnum(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

bool isValidPart(PartKind kind, const std::string& part) {
    if (part.empty()) return false;
    const size_t max_len = kind == PartKind::Host ? kMaxHostLength : kMaxPartLength;
    if (part.size() > max_len) return false;

    for (size_t i = 0; i < part.size(); ++i) {
        const char c = part[i];
        if (isAlnum(c)) continue;
        // every part, host included, starts with [A-Za-z0-9_]
        if (i == 0 && c != '_') return false;
        switch (c) {
            case '_':
            case '-':
                break;
            case '.':
                if (kind == PartKind::Namespace) return false;
                break;
            case ':':
                // only the host may carry a port
                if (kind != PartKind::Host) return false;
                break;
            default:
                return false;
        }
    }
    return true;
}

// Split at the last occurrence of sep. Returns false if sep is absent.
bool cutLast(std::string& s, char sep, std::string& tail) {
    auto pos = s.rfind(sep);
    if (pos == std::string::npos) return false;
    tail = s.substr(pos + 1);
    s = s.substr(0, pos);
    return true;
}

std::string toLowerAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : path) {
        if (c == '/' || c == '\\') {
            parts.push_back(current);
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    parts.push_back(current);
    return parts;
}

}  // namespace

Name::Name(std::string host, std::string ns, std::string model, std::string tag)
    : host_(std::move(host)), namespace_(std::move(ns)), model_(std::move(model)), tag_(std::move(tag)) {}

Name Name::parseBare(const std::string& text) {
    Name n;
    std::string s = text;

    // '/' never appears in a tag, so a ':' after the last '/' starts the tag
    const auto colon = s.rfind(':');
    const auto slash = s.rfind('/');
    if (colon != std::string::npos && (slash == std::string::npos || colon > slash)) {
        cutLast(s, ':', n.tag_);
    }

    if (!cutLast(s, '/', n.model_)) {
        n.model_ = s;
        return n;
    }
    if (!cutLast(s, '/', n.namespace_)) {
        n.namespace_ = s;
        return n;
    }

    const auto scheme = s.find("://");
    n.host_ = scheme == std::string::npos ? s : s.substr(scheme + 3);
    return n;
}

Name Name::parse(const std::string& s) {
    Name n = parseBare(s);
    if (n.host_.empty()) n.host_ = kDefaultHost;
    if (n.namespace_.empty()) n.namespace_ = kDefaultNamespace;
    if (n.tag_.empty()) n.tag_ = kDefaultTag;
    return n;
}

Name Name::fromFilepath(const std::string& relative) {
    auto parts = splitPath(relative);
    if (parts.size() != 4) return Name{};
    Name n(parts[0], parts[1], parts[2], parts[3]);
    if (!n.isFullyQualified()) return Name{};
    return n;
}

bool Name::isFullyQualified() const {
    return isValidPart(PartKind::Host, host_) &&
           isValidPart(PartKind::Namespace, namespace_) &&
           isValidPart(PartKind::Model, model_) &&
           isValidPart(PartKind::Tag, tag_);
}

bool Name::isValid() const {
    return isFullyQualified();
}

bool Name::isZero() const {
    return host_.empty() && namespace_.empty() && model_.empty() && tag_.empty();
}

std::string Name::filepath() const {
    return toLowerAscii(host_ + "/" + namespace_ + "/" + model_ + "/" + tag_);
}

std::string Name::toString() const {
    std::string out;
    if (!host_.empty()) out += host_ + "/";
    if (!namespace_.empty()) out += namespace_ + "/";
    out += model_;
    if (!tag_.empty()) out += ":" + tag_;
    return out;
}

std::string Name::displayShortest() const {
    std::string out;
    if (toLowerAscii(host_) != kDefaultHost) {
        out += host_ + "/" + namespace_ + "/";
    } else if (toLowerAscii(namespace_) != kDefaultNamespace) {
        out += namespace_ + "/";
    }
    out += model_ + ":" + tag_;
    return out;
}

}  // namespace layerstore
