/// @file environment.cpp
/// @brief Environment implementation

#include <loom/ui/environment.hpp>

namespace loom_ui {

Environment::Environment()
    : Environment(EnvironmentValues{}) {}

Environment::Environment(EnvironmentValues values) {
    m_values = std::make_shared<const EnvironmentValues>(std::move(values));
    m_scope = m_values;
}

void Environment::notify_state_change() const {
    if (m_values->on_state_change) {
        m_values->on_state_change();
    }
}

} // namespace loom_ui
