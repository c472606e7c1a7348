#include "core/value.hpp"

#include <cmath>
#include <limits>
#include <type_traits>

#include "encoding/mime_sniffer.hpp"

namespace runbox {

const Value* Value::Find(const std::string& key) const {
    if (!IsMapping()) {
        return nullptr;
    }
    for (const auto& [name, value] : AsMapping()) {
        if (name == key) {
            return &value;
        }
    }
    return nullptr;
}

Json Value::ToJson() const {
    return std::visit([](const auto& item) -> Json {
        using T = std::decay_t<decltype(item)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return Json(nullptr);
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(item)) {
                return Json(nullptr);
            }
            return Json(item);
        } else if constexpr (std::is_same_v<T, Sequence>) {
            Json json = Json::array();
            for (const auto& element : item) {
                json.push_back(element.ToJson());
            }
            return json;
        } else if constexpr (std::is_same_v<T, Mapping>) {
            Json json = Json::object();
            for (const auto& [key, value] : item) {
                json[key] = value.ToJson();
            }
            return json;
        } else if constexpr (std::is_same_v<T, Bytes>) {
            return Json(encoding::EncodeDataUri(item));
        } else if constexpr (std::is_same_v<T, Opaque>) {
            return item.snapshot ? *item.snapshot : Json(nullptr);
        } else {
            return Json(item);
        }
    }, storage_);
}

Value Value::FromJson(const Json& json) {
    switch (json.type()) {
        case Json::value_t::null:
        case Json::value_t::discarded:
            return Value();
        case Json::value_t::boolean:
            return Value(json.get<bool>());
        case Json::value_t::number_integer:
            return Value(json.get<std::int64_t>());
        case Json::value_t::number_unsigned: {
            const auto value = json.get<std::uint64_t>();
            if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return Value(static_cast<double>(value));
            }
            return Value(static_cast<std::int64_t>(value));
        }
        case Json::value_t::number_float:
            return Value(json.get<double>());
        case Json::value_t::string:
            return Value(json.get<std::string>());
        case Json::value_t::array: {
            Sequence items;
            items.reserve(json.size());
            for (const auto& element : json) {
                items.push_back(FromJson(element));
            }
            return Value(std::move(items));
        }
        case Json::value_t::object: {
            Mapping entries;
            entries.reserve(json.size());
            for (auto it = json.begin(); it != json.end(); ++it) {
                entries.emplace_back(it.key(), FromJson(it.value()));
            }
            return Value(std::move(entries));
        }
        case Json::value_t::binary: {
            const auto& binary = json.get_binary();
            return Value(Bytes(binary.begin(), binary.end()));
        }
    }
    return Value();
}

bool Value::operator==(const Value& other) const {
    return storage_ == other.storage_;
}

}  // namespace runbox
