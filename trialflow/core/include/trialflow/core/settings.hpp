#pragma once

#include <trialflow/core/value.hpp>

#include <cstdint>
#include <string>

namespace trialflow::core {

/// @brief Key/value configuration node with a single-parent override chain.
/// @ingroup core_settings
///
/// Each node stores its own table and an optional, non-owning pointer to
/// a parent node. Lookups walk from the node up through its ancestors and
/// return the first match, so a trial's settings shadow its block's, which
/// shadow the session's. Writes always land on the node they are called on.
///
/// Nothing is cached: changing a session-level value after blocks and
/// trials exist is visible through every descendant on the next lookup.
///
/// The parent is fixed at construction. The owner hierarchy
/// (Session -> Block -> Trial) guarantees the parent outlives the child.
///
/// @code
/// Settings session(Object{{"a", 1}});
/// Settings block(Object{{"b", 2}}, &session);
/// Settings trial(Object{{"a", 3}}, &block);
/// trial.get("a").as_int();   // 3
/// trial.get("b").as_int();   // 2
/// block.get("a").as_int();   // 1
/// @endcode
///
/// @see Session::settings, Block::settings, Trial::settings
class Settings {
public:
    /// @brief Construct an empty root node.
    Settings() = default;

    /// @brief Construct a node with initial values and an optional parent.
    /// @param table  Initial key/value pairs owned by this node.
    /// @param parent Node consulted when a key is absent here (may be nullptr).
    explicit Settings(Object table, const Settings* parent = nullptr);

    /// @brief Construct an empty node chained to @p parent.
    /// @param parent Node consulted for every lookup (must outlive this node).
    explicit Settings(const Settings* parent);

    /// @brief Resolve @p key through this node and its ancestors.
    /// @param key Setting name.
    /// @return Reference to the first matching value.
    /// @throws KeyNotFoundError if no node in the chain holds @p key.
    [[nodiscard]] const Value& get(const std::string& key) const;

    /// @brief Resolve @p key, returning @p fallback if it is absent everywhere.
    [[nodiscard]] Value get_or(const std::string& key, Value fallback) const;

    /// @name Typed lookups
    /// @brief Resolve then convert; throw KeyNotFoundError or ValueTypeError.
    /// @{
    [[nodiscard]] bool get_bool(const std::string& key) const { return get(key).as_bool(); }
    [[nodiscard]] int64_t get_int(const std::string& key) const { return get(key).as_int(); }
    [[nodiscard]] double get_double(const std::string& key) const { return get(key).as_double(); }
    [[nodiscard]] const std::string& get_string(const std::string& key) const { return get(key).as_string(); }
    [[nodiscard]] const Array& get_array(const std::string& key) const { return get(key).as_array(); }
    [[nodiscard]] const Object& get_object(const std::string& key) const { return get(key).as_object(); }
    /// @}

    /// @brief Returns true if @p key resolves anywhere in the chain.
    [[nodiscard]] bool contains(const std::string& key) const;

    /// @brief Returns true if @p key is stored on this node itself.
    [[nodiscard]] bool contains_local(const std::string& key) const;

    /// @brief Store @p value under @p key on this node (never on an ancestor).
    void set(const std::string& key, Value value);

    /// @brief Remove @p key from this node. Ancestors are untouched.
    /// @return True if the key was present on this node.
    bool erase(const std::string& key);

    /// @brief Replace this node's own table, keeping the parent link.
    void assign(Object table);

    /// @brief This node's own entries, excluding inherited ones.
    [[nodiscard]] const Object& table() const noexcept { return table_; }

    /// @brief The parent node, or nullptr for a root.
    [[nodiscard]] const Settings* parent() const noexcept { return parent_; }

private:
    [[nodiscard]] const Value* find(const std::string& key) const;

    Object table_;
    const Settings* parent_{nullptr};
};

} // namespace trialflow::core
