#pragma once

#include <any>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>

namespace lbhttp {

    /// @brief Typed key into a ContextMap. Two keys are the same key when
    /// their names match.
    template <typename T>
    struct ContextKey {
        std::string name;
    };

    /**
     * @brief Request-scoped key/value bag that travels with a request through
     * filters, the client and the connection.
     */
    class ContextMap {
       public:
        template <typename T>
        void put(ContextKey<T> const& key, T value) {
            entries_[key.name] = std::move(value);
        }

        /// @brief Insert only if the key is not present yet.
        /// @return true if the value was inserted.
        template <typename T>
        bool put_if_absent(ContextKey<T> const& key, T value) {
            return entries_.try_emplace(key.name, std::move(value)).second;
        }

        /// @return The stored value, or nullptr if absent or of another type.
        template <typename T>
        const T* get(ContextKey<T> const& key) const {
            auto it = entries_.find(key.name);
            if (it == entries_.end()) return nullptr;
            return std::any_cast<T>(&it->second);
        }

        template <typename T>
        bool contains(ContextKey<T> const& key) const {
            return entries_.find(key.name) != entries_.end();
        }

        template <typename T>
        bool remove(ContextKey<T> const& key) {
            return entries_.erase(key.name) > 0;
        }

        std::size_t size() const noexcept { return entries_.size(); }
        bool empty() const noexcept { return entries_.empty(); }

       private:
        std::unordered_map<std::string, std::any> entries_;
    };

}  // namespace lbhttp
