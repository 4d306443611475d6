#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>
#include <utility>

#include "lamina/util/result.hpp"
#include "lamina/util/strings.hpp"

#include "lamina/annotation_error.hpp"
#include "lamina/layer.hpp"
#include "lamina/span.hpp"
#include "lamina/text.hpp"

namespace lamina {

Consistency_Error
Layer::make_consistency_error(Annotation_Error code, std::size_t span_index) const
{
    std::pmr::u8string message { m_memory };
    message += u8"Layer \"";
    message += m_name;
    message += u8"\": ";
    message += annotation_error_message(code);
    if (span_index != Consistency_Error::no_span_index) {
        const Span& location = m_spans[span_index].location();
        message += u8" (span [";
        append_number(message, location.start);
        message += u8", ";
        append_number(message, location.end);
        message += u8") at index ";
        append_number(message, span_index);
        message += u8')';
    }
    return { .code = code, .span_index = span_index, .message = std::move(message) };
}

Result<void, Consistency_Error> Layer::check_span_consistency() const
{
    return check_span_consistency(m_text);
}

Result<void, Consistency_Error> Layer::check_span_consistency(const Text* text) const
{
    for (std::size_t i = 0; i < m_spans.size(); ++i) {
        const Span_Entry& entry = m_spans[i];
        const Span& location = entry.location();

        if (location.start >= location.end) {
            return make_consistency_error(Annotation_Error::invalid_range, i);
        }
        if (text && location.end > text->get_text().size()) {
            return make_consistency_error(Annotation_Error::invalid_range, i);
        }
        if (i != 0) {
            const Span& previous = m_spans[i - 1].location();
            if (previous == location) {
                return make_consistency_error(Annotation_Error::duplicate_span, i);
            }
            if (location < previous) {
                return make_consistency_error(Annotation_Error::unsorted_spans, i);
            }
        }

        const Base_Span& base_span = entry.base_span;
        if (m_topology == Topology_Kind::enveloping) {
            if (!base_span.is_enveloping() || !children_are_contiguous(base_span.children)
                || location != Span { base_span.children.front().start,
                                      base_span.children.back().end }) {
                return make_consistency_error(Annotation_Error::non_contiguous_children, i);
            }
        }
        else if (base_span.is_enveloping()) {
            return make_consistency_error(Annotation_Error::wrong_topology, i);
        }

        if (entry.annotations.empty() || (!m_ambiguous && entry.annotations.size() != 1)) {
            return make_consistency_error(Annotation_Error::inconsistent, i);
        }
        for (const Annotation& annotation : entry.annotations) {
            if (annotation.size() != m_attributes.size()) {
                return make_consistency_error(Annotation_Error::attribute_mismatch, i);
            }
            for (const String& attribute : m_attributes) {
                if (!annotation.contains(attribute)) {
                    return make_consistency_error(Annotation_Error::attribute_mismatch, i);
                }
            }
        }
    }

    if (!text || m_topology == Topology_Kind::independent) {
        return {};
    }
    const Layer* const base = text->find_layer(m_base);
    if (!base) {
        return make_consistency_error(
            Annotation_Error::missing_dependency, Consistency_Error::no_span_index
        );
    }
    return check_alignment_with(*base);
}

Result<void, Consistency_Error> Layer::check_alignment_with(const Layer& base) const
{
    for (std::size_t i = 0; i < m_spans.size(); ++i) {
        if (auto aligned = check_alignment_with_base(base, m_topology, m_spans[i].base_span);
            !aligned) {
            return make_consistency_error(aligned.error(), i);
        }
    }
    return {};
}

} // namespace lamina
