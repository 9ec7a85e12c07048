#include <sg/field_path.h>
#include <stdexcept>

namespace sg {

PathToken PathToken::makeKey(const std::string& key) {
    return PathToken(Type::Key, key, -1);
}

PathToken PathToken::makeIndex(int index) {
    return PathToken(Type::Index, "", index);
}

PathToken::PathToken(Type type, const std::string& key, int index) : type_(type), key_(key), index_(index) {}

const std::string& PathToken::asKey() const {
    if (type_ != Type::Key) {
        throw std::logic_error("PathToken is not a key");
    }
    return key_;
}

int PathToken::asIndex() const {
    if (type_ != Type::Index) {
        throw std::logic_error("PathToken is not an index");
    }
    return index_;
}

FieldPath FieldPath::child(const std::string& key) const {
    FieldPath out = *this;
    out.tokens_.push_back(PathToken::makeKey(key));
    return out;
}

FieldPath FieldPath::child(int index) const {
    FieldPath out = *this;
    out.tokens_.push_back(PathToken::makeIndex(index));
    return out;
}

std::string FieldPath::to_string() const {
    if (tokens_.empty()) return "root";
    std::string out;
    for (auto const& t : tokens_) {
        if (!out.empty()) out.push_back('.');
        out += t.isKey() ? t.asKey() : std::to_string(t.asIndex());
    }
    return out;
}

Dictionary FieldPath::to_dictionary() const {
    Dictionary out = Dictionary::array();
    for (auto const& t : tokens_) {
        if (t.isKey())
            out.push_back(Dictionary(t.asKey()));
        else
            out.push_back(Dictionary(t.asIndex()));
    }
    return out;
}

}  // namespace sg
