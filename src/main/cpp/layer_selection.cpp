#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "lamina/util/assert.hpp"
#include "lamina/util/function_ref.hpp"
#include "lamina/util/result.hpp"

#include "lamina/annotation_error.hpp"
#include "lamina/attribute_value.hpp"
#include "lamina/layer.hpp"

namespace lamina {

namespace {

[[nodiscard]]
const Attribute_Value& value_of(const Annotation& annotation, std::u8string_view name)
{
    // Annotations of a consistent layer hold every declared attribute.
    const Attribute_Value* const result = annotation.find(name);
    LAMINA_ASSERT(result);
    return *result;
}

} // namespace

Result<Layer, Annotation_Error>
Layer::make_selection(std::pmr::vector<Span_Entry>&& spans, Selection selection) const
{
    if (spans.empty() && selection == Selection::forbid_empty) {
        return Annotation_Error::empty_selection;
    }
    Layer result = empty_copy();
    result.m_spans = std::move(spans);
    return result;
}

Result<Layer, Annotation_Error> Layer::slice(
    std::ptrdiff_t first,
    std::ptrdiff_t last,
    std::ptrdiff_t step,
    Selection selection
) const
{
    if (step <= 0) {
        return Annotation_Error::index_out_of_range;
    }
    const auto size = std::ptrdiff_t(m_spans.size());
    const auto to_position = [size](std::ptrdiff_t i) {
        return std::clamp(i < 0 ? i + size : i, std::ptrdiff_t { 0 }, size);
    };

    const std::ptrdiff_t begin = to_position(first);
    const std::ptrdiff_t end = to_position(last);

    std::pmr::vector<Span_Entry> result { m_memory };
    // Advancing only while more than `step` positions remain cannot overflow.
    for (std::ptrdiff_t i = begin; i < end; i += step) {
        result.push_back(m_spans[std::size_t(i)]);
        if (end - i <= step) {
            break;
        }
    }
    return make_selection(std::move(result), selection);
}

Result<Layer, Annotation_Error>
Layer::select(std::span<const std::size_t> indices, Selection selection) const
{
    std::pmr::vector<std::size_t> sorted(indices.begin(), indices.end(), m_memory);
    std::ranges::sort(sorted);
    const auto duplicates = std::ranges::unique(sorted);
    sorted.erase(duplicates.begin(), duplicates.end());

    if (!sorted.empty() && sorted.back() >= m_spans.size()) {
        return Annotation_Error::index_out_of_range;
    }

    std::pmr::vector<Span_Entry> result { m_memory };
    result.reserve(sorted.size());
    for (const std::size_t i : sorted) {
        result.push_back(m_spans[i]);
    }
    return make_selection(std::move(result), selection);
}

Result<Layer, Annotation_Error> Layer::mask(std::span<const bool> flags, Selection selection) const
{
    if (flags.size() != m_spans.size()) {
        return Annotation_Error::index_out_of_range;
    }
    std::pmr::vector<Span_Entry> result { m_memory };
    for (std::size_t i = 0; i < m_spans.size(); ++i) {
        if (flags[i]) {
            result.push_back(m_spans[i]);
        }
    }
    return make_selection(std::move(result), selection);
}

Result<Layer, Annotation_Error>
Layer::filter(Function_Ref<bool(const Span_View&)> predicate, Selection selection) const
{
    std::pmr::vector<Span_Entry> result { m_memory };
    for (std::size_t i = 0; i < m_spans.size(); ++i) {
        if (predicate(Span_View { *this, i })) {
            result.push_back(m_spans[i]);
        }
    }
    return make_selection(std::move(result), selection);
}

Result<Attribute_Column, Annotation_Error> Layer::attribute_list(std::u8string_view name) const
{
    if (!declares(name)) {
        return Annotation_Error::unknown_attribute;
    }

    if (!m_ambiguous) {
        Attribute_List result { m_memory };
        result.reserve(m_spans.size());
        for (const Span_Entry& entry : m_spans) {
            result.push_back(value_of(entry.annotations.front(), name));
        }
        return Attribute_Column { std::in_place_index<0>, std::move(result) };
    }

    Ambiguous_Attribute_List result { m_memory };
    result.reserve(m_spans.size());
    for (const Span_Entry& entry : m_spans) {
        std::pmr::vector<Attribute_Value>& row = result.emplace_back();
        for (const Annotation& annotation : entry.annotations) {
            row.push_back(value_of(annotation, name));
        }
    }
    return Attribute_Column { std::in_place_index<1>, std::move(result) };
}

Result<std::pmr::vector<std::pmr::vector<Attribute_Value>>, Annotation_Error>
Layer::attribute_tuples(std::span<const std::u8string_view> names) const
{
    for (const std::u8string_view name : names) {
        if (!declares(name)) {
            return Annotation_Error::unknown_attribute;
        }
    }

    std::pmr::vector<std::pmr::vector<Attribute_Value>> result { m_memory };
    for (const Span_Entry& entry : m_spans) {
        for (const Annotation& annotation : entry.annotations) {
            std::pmr::vector<Attribute_Value>& tuple = result.emplace_back();
            tuple.reserve(names.size());
            for (const std::u8string_view name : names) {
                tuple.push_back(value_of(annotation, name));
            }
        }
    }
    return result;
}

Result<std::pmr::vector<Value_Count>, Annotation_Error>
Layer::count_values(std::u8string_view name) const
{
    if (!declares(name)) {
        return Annotation_Error::unknown_attribute;
    }

    std::pmr::vector<Value_Count> result { m_memory };
    for (const Span_Entry& entry : m_spans) {
        for (const Annotation& annotation : entry.annotations) {
            const Attribute_Value& value = value_of(annotation, name);
            const auto it = std::ranges::find(result, value, &Value_Count::value);
            if (it != result.end()) {
                ++it->count;
            }
            else {
                result.push_back({ value, 1 });
            }
        }
    }
    return result;
}

} // namespace lamina
