#pragma once

#include <reflect>

#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <type_traits>

/**
 * Reflection-driven JSON mapping for plain config aggregates.
 *
 * Field names come from qlibs/reflect, values go through nlohmann::json. Config
 * structs only declare members with default initializers; a JSON document may
 * set any subset of them.
 *
 *   struct Limits { int workers = 32; double drain = 0.25; };
 *   nlohmann::json j = ReflectSerializer::to_json(Limits{});
 *   Limits limits = ReflectSerializer::from_json<Limits>(j);
 *
 * Enums are written by enumerator name. Empty optionals are omitted.
 */
namespace ReflectSerializer {

template <typename T>
inline constexpr bool is_optional_v = false;
template <typename T>
inline constexpr bool is_optional_v<std::optional<T>> = true;

template <typename E>
E enumFromName(const std::string& name)
{
    for (const auto& [value, enumeratorName] : reflect::enumerators<E>) {
        if (enumeratorName == name) {
            return static_cast<E>(value);
        }
    }
    throw std::runtime_error("unknown enumerator '" + name + "'");
}

// Member names of T.
template <typename T>
std::set<std::string> fieldNames()
{
    std::set<std::string> names;
    const T probe{};
    reflect::for_each([&](auto I) { names.emplace(reflect::member_name<I>(probe)); }, probe);
    return names;
}

// Keys of `j` that do not name a member of T. Usually a typo in a config file.
template <typename T>
std::set<std::string> unknownKeys(const nlohmann::json& j)
{
    std::set<std::string> unknown;
    if (!j.is_object()) {
        return unknown;
    }
    const std::set<std::string> known = fieldNames<T>();
    for (const auto& item : j.items()) {
        if (!known.contains(item.key())) {
            unknown.insert(item.key());
        }
    }
    return unknown;
}

template <typename T>
nlohmann::json to_json(const T& obj)
{
    nlohmann::json j = nlohmann::json::object();
    reflect::for_each(
        [&](auto I) {
            const std::string key(reflect::member_name<I>(obj));
            const auto& field = reflect::get<I>(obj);
            using Field = std::remove_cvref_t<decltype(field)>;

            if constexpr (is_optional_v<Field>) {
                if (field) {
                    j[key] = *field;
                }
            }
            else if constexpr (std::is_enum_v<Field>) {
                j[key] = std::string(reflect::enum_name(field));
            }
            else {
                j[key] = field;
            }
        },
        obj);
    return j;
}

/**
 * Builds a T from `j`. Absent or null keys keep the member's default; a key of
 * the wrong type throws nlohmann::json::exception.
 */
template <typename T>
T from_json(const nlohmann::json& j)
{
    T obj{};
    reflect::for_each(
        [&](auto I) {
            const std::string key(reflect::member_name<I>(obj));
            const auto it = j.find(key);
            if (it == j.end() || it->is_null()) {
                return;
            }

            auto& field = reflect::get<I>(obj);
            using Field = std::remove_cvref_t<decltype(field)>;

            if constexpr (is_optional_v<Field>) {
                field = it->template get<typename Field::value_type>();
            }
            else if constexpr (std::is_enum_v<Field>) {
                field = enumFromName<Field>(it->template get<std::string>());
            }
            else {
                field = it->template get<Field>();
            }
        },
        obj);
    return obj;
}

} // namespace ReflectSerializer
