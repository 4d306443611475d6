#ifndef LAMINA_DIAGNOSTIC_HPP
#define LAMINA_DIAGNOSTIC_HPP

#include <string_view>

#include "lamina/util/severity.hpp"

#include "lamina/fwd.hpp"

namespace lamina {

struct Diagnostic {
    /// @brief The severity of the diagnostic.
    /// `severity_is_emittable(severity)` shall be `true`.
    Severity severity;
    /// @brief The id of the diagnostic,
    /// which is a non-empty string containing a
    /// dot-separated sequence of identifier for this diagnostic.
    std::u8string_view id;
    /// @brief The diagnostic message.
    std::u8string_view message;
};

namespace diagnostic {

// LAYER LIFECYCLE =================================================================================

/// @brief A layer was attached to a text.
inline constexpr std::u8string_view layer_attach = u8"layer.attach";

/// @brief An attempt to attach a layer to a text was rejected,
/// leaving the text unchanged.
inline constexpr std::u8string_view layer_attach_rejected = u8"layer.attach.rejected";

/// @brief A layer was removed from a text.
inline constexpr std::u8string_view layer_remove = u8"layer.remove";

// CONFLICT RESOLUTION =============================================================================

/// @brief Summary of a conflict resolution run,
/// stating how many spans and annotations were kept.
inline constexpr std::u8string_view conflicts_resolved = u8"conflicts.resolved";

// TAGGING =========================================================================================

/// @brief A tagger produced and attached its layer.
inline constexpr std::u8string_view tagger_run = u8"tagger.run";

/// @brief A tagger failed to produce a valid layer.
inline constexpr std::u8string_view tagger_failed = u8"tagger.failed";

/// @brief A retagger left its layer (or a layer depending on it) inconsistent,
/// so the change was discarded.
inline constexpr std::u8string_view retagger_inconsistent = u8"retagger.inconsistent";

// SERIALIZATION ===================================================================================

/// @brief A layer or text record could not be converted because it is malformed
/// or violates an invariant.
inline constexpr std::u8string_view record_malformed = u8"record.malformed";

} // namespace diagnostic

} // namespace lamina

#endif
