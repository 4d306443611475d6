#ifndef LAMINA_ANNOTATION_ERROR_HPP
#define LAMINA_ANNOTATION_ERROR_HPP

#include <cstddef>
#include <limits>
#include <memory_resource>
#include <string>
#include <string_view>

#include "lamina/util/assert.hpp"

#include "lamina/fwd.hpp"

namespace lamina {

enum struct Annotation_Error : Default_Underlying {
    /// @brief A span was created with `start >= end` or with a negative bound.
    invalid_range,
    /// @brief The text of a span was requested, but its layer is not attached to a `Text`.
    unbound,
    /// @brief An attribute was requested or given that the layer does not declare.
    unknown_attribute,
    /// @brief An unambiguous layer already contains a span at the given location.
    duplicate_span,
    /// @brief The attributes of an annotation do not match the declared attributes.
    attribute_mismatch,
    /// @brief A span index or position is not within the layer.
    index_out_of_range,
    /// @brief A selection produced no spans where that is not permitted.
    empty_selection,
    /// @brief The children of an enveloping span are empty, unordered, or overlapping.
    non_contiguous_children,
    /// @brief A span of a parent-attached layer does not equal any span of its parent.
    no_matching_parent_span,
    /// @brief A child of an enveloping span does not equal any span of the enveloped layer.
    no_matching_enveloped_span,
    /// @brief A span of a fragment layer does not lie inside any span of its base layer.
    no_matching_fragment_base,
    /// @brief The operation is not available for the topology of the layer.
    wrong_topology,
    /// @brief A layer name is not an identifier or is reserved.
    invalid_layer_name,
    /// @brief An attribute name is not an identifier.
    invalid_attribute_name,
    /// @brief An attribute name was declared more than once.
    duplicate_attribute_name,
    /// @brief A text already contains a layer with the same name.
    layer_name_collision,
    /// @brief The base layer of a dependent layer is not attached to the text.
    missing_dependency,
    /// @brief A layer cannot be removed because other layers depend on it.
    dependent_layers_exist,
    /// @brief A layer is already attached to a different text.
    already_bound,
    /// @brief Spans are not strictly increasing by location.
    unsorted_spans,
    /// @brief A candidate span has no value for the priority attribute.
    missing_priority_attribute,
    /// @brief The value of the priority attribute is not a number.
    invalid_priority,
    /// @brief A record does not have the expected structure.
    malformed_record,
    /// @brief A pattern given to a tagger is not a valid regular expression.
    invalid_pattern,
    /// @brief A layer violates one of its invariants.
    inconsistent,
};

[[nodiscard]]
constexpr std::u8string_view annotation_error_name(Annotation_Error e)
{
    using enum Annotation_Error;
    switch (e) {
        LAMINA_ENUM_STRING_CASE8(invalid_range);
        LAMINA_ENUM_STRING_CASE8(unbound);
        LAMINA_ENUM_STRING_CASE8(unknown_attribute);
        LAMINA_ENUM_STRING_CASE8(duplicate_span);
        LAMINA_ENUM_STRING_CASE8(attribute_mismatch);
        LAMINA_ENUM_STRING_CASE8(index_out_of_range);
        LAMINA_ENUM_STRING_CASE8(empty_selection);
        LAMINA_ENUM_STRING_CASE8(non_contiguous_children);
        LAMINA_ENUM_STRING_CASE8(no_matching_parent_span);
        LAMINA_ENUM_STRING_CASE8(no_matching_enveloped_span);
        LAMINA_ENUM_STRING_CASE8(no_matching_fragment_base);
        LAMINA_ENUM_STRING_CASE8(wrong_topology);
        LAMINA_ENUM_STRING_CASE8(invalid_layer_name);
        LAMINA_ENUM_STRING_CASE8(invalid_attribute_name);
        LAMINA_ENUM_STRING_CASE8(duplicate_attribute_name);
        LAMINA_ENUM_STRING_CASE8(layer_name_collision);
        LAMINA_ENUM_STRING_CASE8(missing_dependency);
        LAMINA_ENUM_STRING_CASE8(dependent_layers_exist);
        LAMINA_ENUM_STRING_CASE8(already_bound);
        LAMINA_ENUM_STRING_CASE8(unsorted_spans);
        LAMINA_ENUM_STRING_CASE8(missing_priority_attribute);
        LAMINA_ENUM_STRING_CASE8(invalid_priority);
        LAMINA_ENUM_STRING_CASE8(malformed_record);
        LAMINA_ENUM_STRING_CASE8(invalid_pattern);
        LAMINA_ENUM_STRING_CASE8(inconsistent);
    }
    LAMINA_ASSERT_UNREACHABLE(u8"Invalid error code.");
}

[[nodiscard]]
constexpr std::u8string_view annotation_error_message(Annotation_Error e)
{
    using enum Annotation_Error;
    switch (e) {
    case invalid_range: return u8"The start of a span must be nonnegative and less than its end.";
    case unbound: return u8"The layer is not attached to a text.";
    case unknown_attribute: return u8"The attribute is not declared by the layer.";
    case duplicate_span: return u8"The layer already contains a span at this location.";
    case attribute_mismatch:
        return u8"The attributes of the annotation do not match the declared attributes.";
    case index_out_of_range: return u8"The index is out of range.";
    case empty_selection: return u8"The selection is empty.";
    case non_contiguous_children:
        return u8"The children of an enveloping span must be nonempty, ordered, "
               u8"and non-overlapping.";
    case no_matching_parent_span: return u8"The span does not equal any span of the parent layer.";
    case no_matching_enveloped_span:
        return u8"A child span does not equal any span of the enveloped layer.";
    case no_matching_fragment_base: return u8"The span does not lie inside any base span.";
    case wrong_topology: return u8"The operation is not supported by the topology of the layer.";
    case invalid_layer_name: return u8"The layer name is not a valid, unreserved identifier.";
    case invalid_attribute_name: return u8"The attribute name is not a valid identifier.";
    case duplicate_attribute_name: return u8"The attribute is declared more than once.";
    case layer_name_collision: return u8"The text already contains a layer with this name.";
    case missing_dependency: return u8"The base layer is not attached to the text.";
    case dependent_layers_exist: return u8"Other layers depend on this layer.";
    case already_bound: return u8"The layer is already attached to another text.";
    case unsorted_spans: return u8"The spans are not strictly increasing by location.";
    case missing_priority_attribute: return u8"The candidate span has no priority.";
    case invalid_priority: return u8"The priority of the candidate span is not a number.";
    case malformed_record: return u8"The record does not have the expected structure.";
    case invalid_pattern: return u8"The pattern is not a valid regular expression.";
    case inconsistent: return u8"The layer violates its invariants.";
    }
    LAMINA_ASSERT_UNREACHABLE(u8"Invalid error code.");
}

/// @brief The first violated invariant found by an audit of a layer or by importing a record.
struct Consistency_Error {
    static constexpr std::size_t no_span_index = std::numeric_limits<std::size_t>::max();

    Annotation_Error code;
    /// @brief The index of the offending span entry,
    /// or `no_span_index` if the violation does not concern one particular span.
    std::size_t span_index = no_span_index;
    std::pmr::u8string message;

    [[nodiscard]]
    friend bool operator==(const Consistency_Error&, const Consistency_Error&)
        = default;
};

} // namespace lamina

#endif
