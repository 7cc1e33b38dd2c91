#pragma once

#include <utility>
#include <variant>

namespace AntSim {

/**
 * Value-or-error return type for operations that can fail recoverably.
 *
 * Example:
 *   Result<ColonyConfig, std::string> r = ConfigLoader::load<ColonyConfig>("colony.json");
 *   if (r.isError()) { SLOG_WARN("{}", r.errorValue()); }
 */
template <typename T, typename E>
class Result {
public:
    static Result okay(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result error(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    bool isValue() const { return storage_.index() == 0; }
    bool isError() const { return storage_.index() == 1; }

    T& value() { return std::get<0>(storage_); }
    const T& value() const { return std::get<0>(storage_); }

    E& errorValue() { return std::get<1>(storage_); }
    const E& errorValue() const { return std::get<1>(storage_); }

    T valueOr(T fallback) const { return isValue() ? std::get<0>(storage_) : std::move(fallback); }

private:
    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> index, V&& v) : storage_(index, std::forward<V>(v))
    {}

    std::variant<T, E> storage_;
};

} // namespace AntSim
