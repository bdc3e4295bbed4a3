#pragma once

/// @file binding.hpp
/// @brief Two-way reference to a value owned elsewhere

#include <functional>
#include <memory>
#include <utility>

namespace loom_ui {

/// A getter/setter pair. Controls read their current value through `get()`
/// and report user edits through `set()`.
template<typename T>
class Binding {
public:
    Binding(std::function<T()> getter, std::function<void(const T&)> setter)
        : m_get(std::move(getter)), m_set(std::move(setter)) {}

    /// A binding that always reads `value` and ignores writes
    [[nodiscard]] static Binding constant(T value) {
        return Binding([value]() { return value; }, [](const T&) {});
    }

    /// A binding over a value shared with the caller
    [[nodiscard]] static Binding shared(std::shared_ptr<T> storage) {
        return Binding([storage]() { return *storage; },
                       [storage](const T& value) { *storage = value; });
    }

    [[nodiscard]] T get() const { return m_get(); }
    void set(const T& value) const { m_set(value); }

private:
    std::function<T()> m_get;
    std::function<void(const T&)> m_set;
};

} // namespace loom_ui
