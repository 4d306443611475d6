#include <algorithm>
#include <cmath>
#include <cstddef>
#include <memory_resource>
#include <numeric>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "lamina/util/assert.hpp"
#include "lamina/util/result.hpp"
#include "lamina/util/strings.hpp"

#include "lamina/annotation.hpp"
#include "lamina/conflict_resolver.hpp"
#include "lamina/diagnostic.hpp"
#include "lamina/layer.hpp"
#include "lamina/services.hpp"

namespace lamina {

namespace {

/// @brief The candidates at one location which survive the comparison among themselves.
struct Location_Group {
    Span location;
    double priority;
    std::pmr::vector<std::size_t> members;
};

[[nodiscard]]
std::pmr::vector<Location_Group> group_by_location(
    std::span<const Prioritized_Span> candidates,
    bool keep_equal,
    std::pmr::memory_resource* memory
)
{
    std::pmr::vector<std::size_t> order(candidates.size(), memory);
    std::iota(order.begin(), order.end(), std::size_t(0));
    std::ranges::stable_sort(order, {}, [&](std::size_t i) { return candidates[i].location; });

    std::pmr::vector<Location_Group> result { memory };
    for (const std::size_t i : order) {
        const Prioritized_Span& candidate = candidates[i];
        if (result.empty() || result.back().location != candidate.location) {
            result.push_back({ candidate.location, candidate.priority,
                               std::pmr::vector<std::size_t>(1, i, memory) });
            continue;
        }
        Location_Group& group = result.back();
        if (candidate.priority < group.priority) {
            group.priority = candidate.priority;
            group.members.assign(1, i);
        }
        else if (candidate.priority == group.priority && keep_equal) {
            group.members.push_back(i);
        }
    }
    return result;
}

/// @brief Marks the groups which are not overlapped by a group of strictly better priority
/// that survives itself.
/// Groups are visited in order of priority,
/// so equal priorities never eliminate each other.
[[nodiscard]]
std::pmr::vector<bool>
select_by_priority(std::span<const Location_Group> groups, std::pmr::memory_resource* memory)
{
    std::pmr::vector<std::size_t> by_priority(groups.size(), memory);
    std::iota(by_priority.begin(), by_priority.end(), std::size_t(0));
    std::ranges::stable_sort(by_priority, {}, [&](std::size_t g) { return groups[g].priority; });

    std::pmr::vector<bool> survives(groups.size(), false, memory);
    std::pmr::vector<std::size_t> committed { memory };

    for (std::size_t level_begin = 0; level_begin < by_priority.size();) {
        const double level = groups[by_priority[level_begin]].priority;
        std::size_t level_end = level_begin;
        do {
            ++level_end;
        } while (level_end < by_priority.size() && groups[by_priority[level_end]].priority == level);

        for (std::size_t k = level_begin; k < level_end; ++k) {
            const Location_Group& group = groups[by_priority[k]];
            survives[by_priority[k]] = std::ranges::none_of(committed, [&](std::size_t c) {
                return groups[c].location.overlaps(group.location);
            });
        }
        for (std::size_t k = level_begin; k < level_end; ++k) {
            if (survives[by_priority[k]]) {
                committed.push_back(by_priority[k]);
            }
        }
        level_begin = level_end;
    }
    return survives;
}

} // namespace

std::pmr::vector<std::size_t> resolve_span_conflicts(
    std::span<const Prioritized_Span> candidates,
    Conflict_Strategy strategy,
    bool keep_equal,
    std::pmr::memory_resource* memory
)
{
    const std::pmr::vector<Location_Group> groups
        = group_by_location(candidates, keep_equal, memory);
    const std::pmr::vector<bool> survives = select_by_priority(groups, memory);

    std::pmr::vector<std::size_t> kept_groups { memory };
    if (strategy == Conflict_Strategy::all) {
        for (std::size_t g = 0; g < groups.size(); ++g) {
            if (survives[g]) {
                kept_groups.push_back(g);
            }
        }
    }
    else {
        // Groups are sorted by location, so one sweep suffices:
        // an overlapping group replaces the pending one only if it is strictly longer (max)
        // or strictly shorter (min).
        std::optional<std::size_t> pending;
        for (std::size_t g = 0; g < groups.size(); ++g) {
            if (!survives[g]) {
                continue;
            }
            if (pending && groups[g].location.overlaps(groups[*pending].location)) {
                const std::size_t length = groups[g].location.length();
                const std::size_t pending_length = groups[*pending].location.length();
                const bool replaces = strategy == Conflict_Strategy::max ? length > pending_length
                                                                         : length < pending_length;
                if (replaces) {
                    pending = g;
                }
                continue;
            }
            if (pending) {
                kept_groups.push_back(*pending);
            }
            pending = g;
        }
        if (pending) {
            kept_groups.push_back(*pending);
        }
    }

    std::pmr::vector<std::size_t> result { memory };
    for (const std::size_t g : kept_groups) {
        result.insert(result.end(), groups[g].members.begin(), groups[g].members.end());
    }
    return result;
}

Result<Layer, Annotation_Error> resolve_conflicts(
    const Layer& layer,
    const Resolve_Options& options,
    std::pmr::memory_resource* memory,
    Logger& logger
)
{
    struct Candidate_Source {
        std::size_t entry;
        const Annotation* annotation;
    };

    const std::span<const Span_Entry> spans = layer.spans();
    std::pmr::vector<Prioritized_Span> candidates { memory };
    std::pmr::vector<Candidate_Source> sources { memory };

    for (std::size_t i = 0; i < spans.size(); ++i) {
        const Span_Entry& entry = spans[i];
        for (std::size_t a = 0; a < entry.annotations.size(); ++a) {
            const Annotation& annotation = entry.annotations[a];
            const auto previous = std::span { entry.annotations }.first(a);
            if (std::ranges::find(previous, annotation) != previous.end()) {
                continue;
            }

            double priority = 0;
            if (!options.priority_attribute.empty()) {
                const Attribute_Value* const value = annotation.find(options.priority_attribute);
                if (!value || value->is_null()) {
                    return Annotation_Error::missing_priority_attribute;
                }
                const std::optional<double> number = value->as_number();
                if (!number || std::isnan(*number)) {
                    return Annotation_Error::invalid_priority;
                }
                priority = *number;
            }
            candidates.push_back({ entry.location(), priority });
            sources.push_back({ i, &annotation });
        }
    }

    const std::pmr::vector<std::size_t> kept
        = resolve_span_conflicts(candidates, options.strategy, options.keep_equal, memory);

    std::pmr::vector<Span_Entry> entries { layer.get_memory() };
    for (const std::size_t k : kept) {
        const Candidate_Source& source = sources[k];
        if (entries.empty() || entries.back().location() != candidates[k].location) {
            entries.emplace_back(Base_Span { spans[source.entry].base_span }, layer.get_memory());
        }
        entries.back().annotations.push_back(*source.annotation);
    }

    Layer result = layer.empty_copy();
    if (auto replaced = result.replace_spans(std::move(entries)); !replaced) {
        return replaced.error().code;
    }

    if (logger.can_log(Severity::debug)) {
        std::pmr::u8string message { memory };
        message += u8"Resolved conflicts in layer \"";
        message += layer.get_name();
        message += u8"\" using strategy ";
        message += conflict_strategy_name(options.strategy);
        message += u8": kept ";
        append_number(message, kept.size());
        message += u8" of ";
        append_number(message, candidates.size());
        message += u8" candidates.";
        logger.log(Severity::debug, diagnostic::conflicts_resolved, message);
    }
    return result;
}

} // namespace lamina
