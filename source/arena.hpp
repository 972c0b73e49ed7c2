#pragma once

#include <memory>
#include <utility>
#include <vector>

// Everything created through make<T>() is owned by a per-type arena and lives until the process exits. Nodes,
// runtime objects and environments refer to each other through plain pointers.
template<typename T>
auto arena() -> std::vector<std::unique_ptr<T>>&
{
    static std::vector<std::unique_ptr<T>> owned;
    return owned;
}

template<typename T, typename... Args>
auto make(Args&&... args) -> T*
{
    auto& owned = arena<T>();
    owned.push_back(std::make_unique<T>(std::forward<Args>(args)...));
    return owned.back().get();
}
