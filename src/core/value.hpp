#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "nlohmann/json.hpp"

namespace runbox {

using Json = nlohmann::ordered_json;
using Bytes = std::vector<std::uint8_t>;

class Value;

using Sequence = std::vector<Value>;
// Insertion-ordered string keyed mapping.
using Mapping = std::vector<std::pair<std::string, Value>>;

// A host object that is not a plain payload (Date, Map, class instance...).
// Carried through the result tree untouched; the snapshot is what the
// object serializes to.
struct Opaque {
    std::string type_name;
    std::shared_ptr<const Json> snapshot;

    bool operator==(const Opaque& other) const {
        return type_name == other.type_name && snapshot == other.snapshot;
    }
    bool operator!=(const Opaque& other) const {
        return !(*this == other);
    }
};

class Value {
public:
    using Storage = std::variant<
        std::nullptr_t,
        bool,
        std::int64_t,
        double,
        std::string,
        Sequence,
        Mapping,
        Bytes,
        Opaque>;

    Value() : storage_(nullptr) {}
    Value(std::nullptr_t) : storage_(nullptr) {}
    Value(bool value) : storage_(value) {}
    Value(int value) : storage_(static_cast<std::int64_t>(value)) {}
    Value(std::int64_t value) : storage_(value) {}
    Value(double value) : storage_(value) {}
    Value(const char* value) : storage_(std::string(value)) {}
    Value(std::string value) : storage_(std::move(value)) {}
    Value(Sequence value) : storage_(std::move(value)) {}
    Value(Mapping value) : storage_(std::move(value)) {}
    Value(Bytes value) : storage_(std::move(value)) {}
    Value(Opaque value) : storage_(std::move(value)) {}

    bool IsNull() const { return std::holds_alternative<std::nullptr_t>(storage_); }
    bool IsBool() const { return std::holds_alternative<bool>(storage_); }
    bool IsInteger() const { return std::holds_alternative<std::int64_t>(storage_); }
    bool IsNumber() const { return std::holds_alternative<double>(storage_); }
    bool IsString() const { return std::holds_alternative<std::string>(storage_); }
    bool IsSequence() const { return std::holds_alternative<Sequence>(storage_); }
    bool IsMapping() const { return std::holds_alternative<Mapping>(storage_); }
    bool IsBinary() const { return std::holds_alternative<Bytes>(storage_); }
    bool IsOpaque() const { return std::holds_alternative<Opaque>(storage_); }

    bool AsBool() const { return std::get<bool>(storage_); }
    std::int64_t AsInteger() const { return std::get<std::int64_t>(storage_); }
    double AsNumber() const { return std::get<double>(storage_); }
    const std::string& AsString() const { return std::get<std::string>(storage_); }
    const Sequence& AsSequence() const { return std::get<Sequence>(storage_); }
    const Mapping& AsMapping() const { return std::get<Mapping>(storage_); }
    const Bytes& AsBinary() const { return std::get<Bytes>(storage_); }
    const Opaque& AsOpaque() const { return std::get<Opaque>(storage_); }

    const Storage& storage() const { return storage_; }

    // Returns the value stored under key in a mapping, or nullptr.
    const Value* Find(const std::string& key) const;

    // Binary renders as a data URI, Opaque as its snapshot, non-finite
    // numbers as null.
    Json ToJson() const;
    static Value FromJson(const Json& json);

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    Storage storage_;
};

}  // namespace runbox
