#ifndef LAMINA_SERVICES_HPP
#define LAMINA_SERVICES_HPP

#include "lamina/util/assert.hpp"
#include "lamina/util/severity.hpp"

#include "lamina/diagnostic.hpp"
#include "lamina/fwd.hpp"

namespace lamina {

struct Logger {
private:
    Severity m_min_severity;

public:
    [[nodiscard]]
    constexpr explicit Logger(Severity min_severity)
    {
        set_min_severity(min_severity);
    }

    constexpr virtual ~Logger() = default;

    [[nodiscard]]
    constexpr Severity get_min_severity() const
    {
        return m_min_severity;
    }

    constexpr void set_min_severity(Severity severity)
    {
        LAMINA_ASSERT(severity <= Severity::none);
        m_min_severity = severity;
    }

    [[nodiscard]]
    constexpr bool can_log(Severity severity) const
    {
        return severity >= m_min_severity;
    }

    /// @brief Emits `diagnostic` if its severity is at least the minimum severity.
    constexpr void log(Severity severity, std::u8string_view id, std::u8string_view message)
    {
        LAMINA_DEBUG_ASSERT(severity_is_emittable(severity));
        if (can_log(severity)) {
            (*this)({ .severity = severity, .id = id, .message = message });
        }
    }

    constexpr virtual void operator()(Diagnostic diagnostic) = 0;
};

struct Ignorant_Logger final : Logger {
    using Logger::Logger;

    void operator()(Diagnostic) final { }
};

inline constinit Ignorant_Logger ignorant_logger { Severity::none };

} // namespace lamina

#endif
