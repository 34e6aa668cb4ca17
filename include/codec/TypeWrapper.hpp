#pragma once

#include "codec/Codec.hpp"

#include <limits>
#include <string>
#include <type_traits>
#include <utility>

namespace stash::codec {

namespace detail {

template <typename T>
bool fitsIntegral(const nlohmann::json& j) {
    using Unsigned = nlohmann::json::number_unsigned_t;
    using Signed = nlohmann::json::number_integer_t;
    constexpr auto max = static_cast<Unsigned>(std::numeric_limits<T>::max());

    if (j.is_number_unsigned()) return j.get<Unsigned>() <= max;

    const auto v = j.get<Signed>();
    if (v < 0) return std::is_signed_v<T> && v >= static_cast<Signed>(std::numeric_limits<T>::min());
    return static_cast<Unsigned>(v) <= max;
}

// nlohmann converts freely between booleans, integers and floats; a stored
// value of another kind, or an integer outside T's range, is a decode failure.
template <typename T>
T getStrict(const nlohmann::json& j) {
    if constexpr (std::is_same_v<T, bool>) {
        if (!j.is_boolean()) throw DecodeError(std::string("expected boolean, got ") + j.type_name());
    } else if constexpr (std::is_integral_v<T>) {
        if (!j.is_number_integer()) throw DecodeError(std::string("expected integer, got ") + j.type_name());
        if (!fitsIntegral<T>(j)) throw DecodeError("integer " + j.dump() + " is out of range for the requested type");
    } else if constexpr (std::is_floating_point_v<T>) {
        if (!j.is_number()) throw DecodeError(std::string("expected number, got ") + j.type_name());
    }
    return j.get<T>();
}

}

// One-field envelope, {"object": value}, for values the codec cannot place at
// the document root on their own (bare scalars under a strict JsonCodec).
template <typename T>
struct TypeWrapper {
    T object;
};

template <typename T>
void to_json(nlohmann::json& j, const TypeWrapper<T>& w) {
    j = nlohmann::json::object();
    j["object"] = w.object;
}

template <typename T>
void from_json(const nlohmann::json& j, TypeWrapper<T>& w) {
    if (!j.is_object() || j.size() != 1 || !j.contains("object"))
        throw DecodeError("document is not a type wrapper envelope");
    w.object = detail::getStrict<T>(j.at("object"));
}

namespace detail {

template <typename T>
std::vector<uint8_t> encodeDocument(const Codec& codec, const T& value) {
    nlohmann::json document;
    try {
        document = value;
    } catch (const nlohmann::json::exception& e) {
        throw EncodeError(e.what());
    }
    return codec.encode(document);
}

}

// The value type must map to one fixed document shape; a type whose document
// can be either a scalar or a container (nlohmann::json itself) would make the
// direct and wrapped decodes ambiguous.
template <typename T>
concept Storable = !std::is_same_v<std::remove_cvref_t<T>, nlohmann::json>
    && std::is_default_constructible_v<T>;

// Encodes the value directly, retrying inside a TypeWrapper when the codec
// rejects the bare document. Throws EncodeError if both attempts fail.
template <Storable T>
std::vector<uint8_t> encodeValue(const Codec& codec, const T& value) {
    try {
        return detail::encodeDocument(codec, value);
    } catch (const EncodeError& direct) {
        try {
            return detail::encodeDocument(codec, TypeWrapper<T>{value});
        } catch (const EncodeError& wrapped) {
            throw EncodeError(std::string(direct.what()) + "; wrapped: " + wrapped.what());
        }
    }
}

// Decodes bytes as T, then as TypeWrapper<T>. Throws DecodeError if the bytes
// do not parse or neither shape matches.
template <Storable T>
T decodeValue(const Codec& codec, const std::vector<uint8_t>& bytes) {
    const auto document = codec.decode(bytes);

    std::string direct;
    try {
        return detail::getStrict<T>(document);
    } catch (const nlohmann::json::exception& e) {
        direct = e.what();
    } catch (const DecodeError& e) {
        direct = e.what();
    }

    try {
        return std::move(document.get<TypeWrapper<T>>().object);
    } catch (const nlohmann::json::exception& wrapped) {
        throw DecodeError(direct + "; wrapped: " + wrapped.what());
    } catch (const DecodeError& wrapped) {
        throw DecodeError(direct + "; wrapped: " + wrapped.what());
    }
}

}
