#pragma once

#include <sg/dictionary.h>
#include <string>
#include <vector>

namespace sg {

// A single segment of a field path: an object key or an array index.
class PathToken {
  public:
    enum class Type { Key, Index };

    static PathToken makeKey(const std::string& key);
    static PathToken makeIndex(int index);

    bool isKey() const { return type_ == Type::Key; }
    bool isIndex() const { return type_ == Type::Index; }

    const std::string& asKey() const;
    int asIndex() const;

    bool operator==(const PathToken& rhs) const {
        return type_ == rhs.type_ && key_ == rhs.key_ && index_ == rhs.index_;
    }
    bool operator!=(const PathToken& rhs) const { return !(*this == rhs); }

  private:
    PathToken(Type type, const std::string& key, int index);

    Type type_;
    std::string key_;
    int index_;
};

// Ordered locator from the payload root down to one node.
class FieldPath {
  public:
    FieldPath() = default;

    FieldPath child(const std::string& key) const;
    FieldPath child(int index) const;

    const std::vector<PathToken>& tokens() const { return tokens_; }
    size_t size() const { return tokens_.size(); }
    bool empty() const { return tokens_.empty(); }

    // Dotted display form: "order.items.1.price"; the root is "root".
    std::string to_string() const;

    // JSON array of keys (strings) and indices (integers).
    Dictionary to_dictionary() const;

    bool operator==(const FieldPath& rhs) const { return tokens_ == rhs.tokens_; }
    bool operator!=(const FieldPath& rhs) const { return !(*this == rhs); }

  private:
    std::vector<PathToken> tokens_;
};

}  // namespace sg
