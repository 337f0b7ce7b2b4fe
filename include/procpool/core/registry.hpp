#pragma once

/**
 * @file registry.hpp
 * @brief Name-addressable table of functions that workers can run
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include "procpool/core/value.hpp"

namespace procpool {

/**
 * @brief Type-erased call: decoded arguments in, encoded result out
 */
using Invoker = std::function<Value(const ValueList&)>;

/**
 * @brief Maps plain functions to stable names
 *
 * A function pointer means nothing to another process, so jobs carry the
 * function's registered name instead. Workers are forked from the submitting
 * process and inherit the registry as it was at fork time: register every
 * function before creating a pool.
 */
class FunctionRegistry {
public:
    FunctionRegistry() = default;

    FunctionRegistry(const FunctionRegistry&) = delete;
    FunctionRegistry& operator=(const FunctionRegistry&) = delete;

    /**
     * @brief Process-wide registry used by PROCPOOL_REGISTER and by default pools
     */
    static FunctionRegistry& global();

    /**
     * @brief Register a plain function under a name
     * @throws std::invalid_argument if the name is taken by another function
     */
    template<typename R, typename... Params>
    void add(const std::string& name, R (*fn)(Params...)) {
        static_assert(std::is_void_v<R> || is_value_type_v<R>,
                      "return type cannot cross a process boundary");
        static_assert((is_value_type_v<std::decay_t<Params>> && ...),
                      "parameter type cannot cross a process boundary");

        Invoker invoker = [fn](const ValueList& args) -> Value {
            if (args.size() != sizeof...(Params)) {
                throw std::invalid_argument(
                    "expected " + std::to_string(sizeof...(Params)) +
                    " arguments, got " + std::to_string(args.size())
                );
            }
            return call(fn, args, std::index_sequence_for<Params...>{});
        };

        add_invoker(name, key_of(fn), std::move(invoker));
    }

    /**
     * @brief Registered name of a function, if any
     */
    template<typename R, typename... Params>
    [[nodiscard]] std::optional<std::string> name_of(R (*fn)(Params...)) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = names_.find(key_of(fn));
        if (it == names_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] std::size_t size() const;

    /**
     * @brief Run a registered function
     * @throws std::out_of_range for an unknown name; whatever the function throws
     */
    Value invoke(const std::string& name, const ValueList& args) const;

    /**
     * @brief Hold the registry lock across fork() so the child never
     *        inherits it locked
     */
    [[nodiscard]] std::unique_lock<std::mutex> lock_for_fork() const {
        return std::unique_lock<std::mutex>(mutex_);
    }

private:
    template<typename R, typename... Params, std::size_t... I>
    static Value call(R (*fn)(Params...), const ValueList& args, std::index_sequence<I...>) {
        if constexpr (std::is_void_v<R>) {
            fn(from_value<std::decay_t<Params>>(args[I])...);
            return Value{};
        } else {
            return to_value(fn(from_value<std::decay_t<Params>>(args[I])...));
        }
    }

    template<typename R, typename... Params>
    static std::uintptr_t key_of(R (*fn)(Params...)) noexcept {
        return reinterpret_cast<std::uintptr_t>(fn);
    }

    void add_invoker(const std::string& name, std::uintptr_t key, Invoker invoker);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Invoker> invokers_;
    std::unordered_map<std::string, std::uintptr_t> keys_;
    std::unordered_map<std::uintptr_t, std::string> names_;
};

namespace detail {

template<typename Fn>
bool register_global(const char* name, Fn fn) {
    FunctionRegistry::global().add(name, fn);
    return true;
}

} // namespace detail

} // namespace procpool

#define PROCPOOL_CONCAT_IMPL(a, b) a##b
#define PROCPOOL_CONCAT(a, b) PROCPOOL_CONCAT_IMPL(a, b)

/**
 * @brief Register a function in the global registry at static-init time
 */
#define PROCPOOL_REGISTER(fn) \
    [[maybe_unused]] static const bool PROCPOOL_CONCAT(procpool_registered_, __LINE__) = \
        ::procpool::detail::register_global(#fn, &fn)
