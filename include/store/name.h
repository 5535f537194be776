// name.h - four-part model names (host/namespace/model:tag)
#pragma once

#include <string>
#include <tuple>

namespace layerstore {

/// Structured model name.
///
/// Text form:  [host/][namespace/]model[:tag]
/// Path form:  host/namespace/model/tag (relative to the manifest root)
class Name {
public:
    static constexpr const char* kDefaultHost = "registry.ollama.ai";
    static constexpr const char* kDefaultNamespace = "library";
    static constexpr const char* kDefaultTag = "latest";

    Name() = default;
    Name(std::string host, std::string ns, std::string model, std::string tag);

    /// Parse text form, filling missing parts with defaults.
    static Name parse(const std::string& s);

    /// Parse text form without defaults (missing parts stay empty).
    static Name parseBare(const std::string& s);

    /// Rebuild a name from a path relative to the manifest root.
    /// Returns an empty Name unless the path has exactly four parts.
    static Name fromFilepath(const std::string& relative);

    /// All four parts present and valid.
    bool isFullyQualified() const;

    /// Usable as a storage key.
    bool isValid() const;

    bool isZero() const;

    /// Relative storage path (lowercase). Only meaningful when fully qualified.
    std::string filepath() const;

    /// host/namespace/model:tag
    std::string toString() const;

    /// Shortest text form that parses back to this name.
    std::string displayShortest() const;

    const std::string& host() const { return host_; }
    const std::string& ns() const { return namespace_; }
    const std::string& model() const { return model_; }
    const std::string& tag() const { return tag_; }

    bool operator==(const Name& other) const { return key() == other.key(); }
    bool operator!=(const Name& other) const { return !(*this == other); }
    bool operator<(const Name& other) const { return key() < other.key(); }

private:
    std::tuple<const std::string&, const std::string&, const std::string&, const std::string&> key() const {
        return std::tie(host_, namespace_, model_, tag_);
    }

    std::string host_;
    std::string namespace_;
    std::string model_;
    std::string tag_;
};

}  // namespace layerstore
