#ifndef LAMINA_CONFLICT_RESOLVER_HPP
#define LAMINA_CONFLICT_RESOLVER_HPP

#include <cstddef>
#include <memory_resource>
#include <span>
#include <string_view>
#include <vector>

#include "lamina/util/result.hpp"

#include "lamina/annotation_error.hpp"
#include "lamina/fwd.hpp"
#include "lamina/services.hpp"
#include "lamina/settings.hpp"
#include "lamina/span.hpp"

namespace lamina {

enum struct Conflict_Strategy : Default_Underlying {
    /// @brief Among overlapping candidates of equal priority, keep the longest.
    max,
    /// @brief Among overlapping candidates of equal priority, keep the shortest.
    min,
    /// @brief Keep every candidate that is not overlapped by a candidate of better priority.
    all,
};

[[nodiscard]]
constexpr std::u8string_view conflict_strategy_name(Conflict_Strategy strategy)
{
    using enum Conflict_Strategy;
    switch (strategy) {
        LAMINA_ENUM_STRING_CASE8(max);
        LAMINA_ENUM_STRING_CASE8(min);
        LAMINA_ENUM_STRING_CASE8(all);
    }
    LAMINA_ASSERT_UNREACHABLE(u8"Invalid strategy.");
}

struct Resolve_Options {
    Conflict_Strategy strategy = Conflict_Strategy::max;
    /// @brief The attribute holding the priority of each annotation,
    /// where lower values take precedence.
    /// If empty, all candidates have equal priority.
    std::u8string_view priority_attribute = default_priority_attribute;
    /// @brief If `true`, annotations at the same location with the same priority are all kept.
    /// Otherwise, only the first of them is kept.
    bool keep_equal = true;
};

/// @brief A candidate span for conflict resolution.
struct Prioritized_Span {
    Span location;
    /// @brief Lower values take precedence.
    double priority;
};

/// @brief Resolves conflicts between overlapping `candidates`.
/// Among candidates sharing a location, only those with the best priority are kept,
/// and if `keep_equal` is `false`, only the first of those.
/// A candidate is dropped if it overlaps a kept candidate of strictly better priority.
/// Of the remaining overlapping candidates, `max` keeps the longest and `min` the shortest,
/// preferring the leftmost on equal length, while `all` keeps all of them.
/// @return The indices of the kept candidates, sorted by location,
/// and among equal locations, by index.
[[nodiscard]]
std::pmr::vector<std::size_t> resolve_span_conflicts(
    std::span<const Prioritized_Span> candidates,
    Conflict_Strategy strategy,
    bool keep_equal,
    std::pmr::memory_resource* memory
);

/// @brief Resolves conflicts between the spans of `layer`,
/// where each annotation is a candidate with the priority stored in
/// `options.priority_attribute`.
/// Exact duplicate annotations at one location are removed.
/// The input layer is never modified.
/// @return A new layer with the same schema and text, containing the surviving annotations.
/// Fails with `missing_priority_attribute` if an annotation has no priority,
/// and with `invalid_priority` if a priority is not a number.
[[nodiscard]]
Result<Layer, Annotation_Error> resolve_conflicts(
    const Layer& layer,
    const Resolve_Options& options,
    std::pmr::memory_resource* memory,
    Logger& logger = ignorant_logger
);

} // namespace lamina

#endif
