/**
 * @file registry.cpp
 * @brief Function registry implementation
 */

#include "procpool/core/registry.hpp"

namespace procpool {

FunctionRegistry& FunctionRegistry::global() {
    static FunctionRegistry registry;
    return registry;
}

void FunctionRegistry::add_invoker(const std::string& name, std::uintptr_t key, Invoker invoker) {
    if (name.empty()) {
        throw std::invalid_argument("function name must not be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto existing = keys_.find(name);
    if (existing != keys_.end()) {
        if (existing->second == key) {
            return;  // Same function registered twice
        }
        throw std::invalid_argument("function name already registered: " + name);
    }

    invokers_.emplace(name, std::move(invoker));
    keys_.emplace(name, key);
    names_.emplace(key, name);
}

bool FunctionRegistry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return invokers_.count(name) > 0;
}

std::size_t FunctionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return invokers_.size();
}

Value FunctionRegistry::invoke(const std::string& name, const ValueList& args) const {
    Invoker invoker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = invokers_.find(name);
        if (it == invokers_.end()) {
            throw std::out_of_range("unknown function: " + name);
        }
        invoker = it->second;
    }
    // User code runs unlocked
    return invoker(args);
}

} // namespace procpool
