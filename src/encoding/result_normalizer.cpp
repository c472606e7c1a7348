#include "encoding/result_normalizer.hpp"

#include <utility>

#include "encoding/mime_sniffer.hpp"

namespace runbox::encoding {

Value NormalizeResult(const Value& value) {
    if (value.IsBinary()) {
        return Value(EncodeDataUri(value.AsBinary()));
    }
    if (value.IsSequence()) {
        Sequence items;
        items.reserve(value.AsSequence().size());
        for (const auto& item : value.AsSequence()) {
            items.push_back(NormalizeResult(item));
        }
        return Value(std::move(items));
    }
    if (value.IsMapping()) {
        Mapping entries;
        entries.reserve(value.AsMapping().size());
        for (const auto& [key, item] : value.AsMapping()) {
            entries.emplace_back(key, NormalizeResult(item));
        }
        return Value(std::move(entries));
    }
    return value;
}

Value NormalizeResult(Value&& value) {
    if (value.IsBinary() || value.IsSequence() || value.IsMapping()) {
        return NormalizeResult(static_cast<const Value&>(value));
    }
    return std::move(value);
}

}  // namespace runbox::encoding
