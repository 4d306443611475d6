#ifndef LAMINA_SPAN_HPP
#define LAMINA_SPAN_HPP

#include <algorithm>
#include <compare>
#include <cstddef>
#include <memory_resource>
#include <span>
#include <vector>

#include "lamina/util/assert.hpp"
#include "lamina/util/result.hpp"

#include "lamina/annotation_error.hpp"
#include "lamina/fwd.hpp"

namespace lamina {

/// @brief A half-open interval `[start, end)` of code units in a text.
/// Spans are ordered by `(start, end)`.
struct Span {
    std::size_t start;
    std::size_t end;

    [[nodiscard]]
    constexpr std::size_t length() const noexcept
    {
        return end - start;
    }

    /// @brief Returns `true` if both spans share at least one code unit.
    [[nodiscard]]
    constexpr bool overlaps(const Span& other) const noexcept
    {
        return start < other.end && other.start < end;
    }

    [[nodiscard]]
    constexpr bool contains(const Span& other) const noexcept
    {
        return start <= other.start && other.end <= end;
    }

    [[nodiscard]]
    friend constexpr auto operator<=>(const Span&, const Span&) = default;
    [[nodiscard]]
    friend constexpr bool operator==(const Span&, const Span&) = default;
};

/// @brief Creates a span `[start, end)`.
/// Fails with `invalid_range` if `start >= end` or either bound is negative.
[[nodiscard]]
constexpr Result<Span, Annotation_Error> make_span(Integer start, Integer end)
{
    if (start < 0 || end < 0 || start >= end) {
        return Annotation_Error::invalid_range;
    }
    return Span { std::size_t(start), std::size_t(end) };
}

/// @brief Returns `true` if `children` is non-empty,
/// every child is a valid span,
/// and every child starts at or after the end of the previous one.
[[nodiscard]]
constexpr bool children_are_contiguous(std::span<const Span> children) noexcept
{
    if (children.empty()) {
        return false;
    }
    for (std::size_t i = 0; i < children.size(); ++i) {
        if (children[i].start >= children[i].end) {
            return false;
        }
        if (i != 0 && children[i].start < children[i - 1].end) {
            return false;
        }
    }
    return true;
}

/// @brief The location of a span entry in a layer.
/// For elementary spans, `children` is empty.
/// For enveloping spans, `location` is `[children.front().start, children.back().end)`.
struct Base_Span {
    Span location;
    std::pmr::vector<Span> children;

    [[nodiscard]]
    explicit Base_Span(Span location, std::pmr::memory_resource* memory)
        : location { location }
        , children { memory }
    {
    }

    [[nodiscard]]
    explicit Base_Span(std::pmr::vector<Span>&& children)
        : location { children.front().start, children.back().end }
        , children { std::move(children) }
    {
        LAMINA_DEBUG_ASSERT(children_are_contiguous(this->children));
    }

    [[nodiscard]]
    bool is_enveloping() const noexcept
    {
        return !children.empty();
    }

    [[nodiscard]]
    std::size_t start() const noexcept
    {
        return location.start;
    }

    [[nodiscard]]
    std::size_t end() const noexcept
    {
        return location.end;
    }

    [[nodiscard]]
    friend bool operator==(const Base_Span& x, const Base_Span& y)
    {
        return x.location == y.location
            && std::ranges::equal(x.children, y.children);
    }
};

/// @brief Creates the base span of an enveloping span from its children.
/// Fails with `non_contiguous_children` if the children are empty, unordered, or overlapping.
[[nodiscard]]
inline Result<Base_Span, Annotation_Error>
make_enveloping_span(std::span<const Span> children, std::pmr::memory_resource* memory)
{
    if (!children_are_contiguous(children)) {
        return Annotation_Error::non_contiguous_children;
    }
    return Base_Span { std::pmr::vector<Span>(children.begin(), children.end(), memory) };
}

} // namespace lamina

#endif
