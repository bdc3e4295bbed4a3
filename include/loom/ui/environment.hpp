#pragma once

/// @file environment.hpp
/// @brief Inherited configuration propagated top-down through the view tree

#include "types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <utility>

namespace loom_ui {

// =============================================================================
// EnvironmentValues
// =============================================================================

/// Opaque handle of the window a tree is displayed in
using WindowHandle = std::uint64_t;

/// Every key a view can read from its environment
struct EnvironmentValues {
    Font font;
    ColorScheme color_scheme = ColorScheme::Light;
    Orientation layout_orientation = Orientation::Vertical;
    StackAlignment layout_alignment = StackAlignment::Center;
    int layout_spacing = 10;
    Color foreground_color = Color::black();
    WindowHandle window = 0;
    double window_scale_factor = 1.0;
    /// Backend the tree is being rendered by; set by the view graph
    IBackend* backend = nullptr;
    /// Invoked by stateful views when their state changes
    std::function<void()> on_state_change;
};

// =============================================================================
// Environment
// =============================================================================

/// Immutable, copy-on-write view of `EnvironmentValues`.
///
/// Copies of an environment share one value set. `with` copies that set once,
/// overrides a single key and keeps the scope base; every other key reads the
/// same as in the source. `cleared` restores a key from the scope base, which is the
/// environment that `scoped()` was last called on (the root values for a
/// freshly constructed environment).
///
/// @code
/// auto env = Environment{}.scoped();
/// auto big = env.with(&EnvironmentValues::font, Font::system(20));
/// big.font().size;                                   // 20
/// big.cleared(&EnvironmentValues::font).font().size; // 12
/// @endcode
class Environment {
public:
    Environment();
    explicit Environment(EnvironmentValues values);

    /// Copy with one key overridden
    template<typename T, typename U>
    [[nodiscard]] Environment with(T EnvironmentValues::*key, U&& value) const {
        auto values = std::make_shared<EnvironmentValues>(*m_values);
        (*values).*key = std::forward<U>(value);
        return Environment(std::move(values), m_scope);
    }

    /// Copy with one key restored to the scope base's value
    template<typename T>
    [[nodiscard]] Environment cleared(T EnvironmentValues::*key) const {
        auto values = std::make_shared<EnvironmentValues>(*m_values);
        (*values).*key = (*m_scope).*key;
        return Environment(std::move(values), m_scope);
    }

    /// Start a new override scope rooted at the current values
    [[nodiscard]] Environment scoped() const {
        return Environment(m_values, m_values);
    }

    [[nodiscard]] const EnvironmentValues& values() const noexcept { return *m_values; }
    [[nodiscard]] const EnvironmentValues* operator->() const noexcept { return m_values.get(); }

    [[nodiscard]] const Font& font() const noexcept { return m_values->font; }
    [[nodiscard]] ColorScheme color_scheme() const noexcept { return m_values->color_scheme; }
    [[nodiscard]] Orientation layout_orientation() const noexcept { return m_values->layout_orientation; }
    [[nodiscard]] StackAlignment layout_alignment() const noexcept { return m_values->layout_alignment; }
    [[nodiscard]] int layout_spacing() const noexcept { return m_values->layout_spacing; }
    [[nodiscard]] const Color& foreground_color() const noexcept { return m_values->foreground_color; }
    [[nodiscard]] WindowHandle window() const noexcept { return m_values->window; }
    [[nodiscard]] double window_scale_factor() const noexcept { return m_values->window_scale_factor; }
    [[nodiscard]] IBackend* backend() const noexcept { return m_values->backend; }

    /// Notify the owner of the tree that view state changed
    void notify_state_change() const;

    /// True when both environments share the same storage
    [[nodiscard]] bool shares_storage_with(const Environment& other) const noexcept {
        return m_values == other.m_values;
    }

private:
    Environment(std::shared_ptr<const EnvironmentValues> values, std::shared_ptr<const EnvironmentValues> scope)
        : m_values(std::move(values)), m_scope(std::move(scope)) {}

    std::shared_ptr<const EnvironmentValues> m_values;
    std::shared_ptr<const EnvironmentValues> m_scope;
};

} // namespace loom_ui
