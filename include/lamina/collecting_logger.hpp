#ifndef LAMINA_COLLECTING_LOGGER_HPP
#define LAMINA_COLLECTING_LOGGER_HPP

#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>
#include <vector>

#include "lamina/util/severity.hpp"

#include "lamina/diagnostic.hpp"
#include "lamina/services.hpp"

namespace lamina {

struct Collected_Diagnostic {
    Severity severity;
    std::pmr::u8string id;
    std::pmr::u8string message;

    [[nodiscard]]
    Collected_Diagnostic(const Diagnostic& d, std::pmr::memory_resource* const memory)
        : severity { d.severity }
        , id { d.id, memory }
        , message { d.message, memory }
    {
    }
};

/// @brief A `Logger` which stores every diagnostic it receives.
struct Collecting_Logger final : Logger {
    std::pmr::vector<Collected_Diagnostic> diagnostics;

    [[nodiscard]]
    explicit Collecting_Logger(
        std::pmr::memory_resource* const memory,
        Severity min_severity = Severity::min
    )
        : Logger { min_severity }
        , diagnostics { memory }
    {
    }

    void operator()(const Diagnostic diagnostic) final
    {
        std::pmr::memory_resource* const memory = diagnostics.get_allocator().resource();
        diagnostics.emplace_back(diagnostic, memory);
    }

    [[nodiscard]]
    bool nothing_logged() const
    {
        return diagnostics.empty();
    }

    [[nodiscard]]
    bool was_logged(const std::u8string_view id) const
    {
        return std::ranges::find(diagnostics, id, &Collected_Diagnostic::id) != diagnostics.end();
    }

    [[nodiscard]]
    std::size_t count(const std::u8string_view id) const
    {
        return std::size_t(std::ranges::count(diagnostics, id, &Collected_Diagnostic::id));
    }
};

} // namespace lamina

#endif
