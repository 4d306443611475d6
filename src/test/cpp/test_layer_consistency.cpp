#include <cstddef>
#include <initializer_list>
#include <memory_resource>
#include <string_view>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "lamina/annotation.hpp"
#include "lamina/annotation_error.hpp"
#include "lamina/attribute_value.hpp"
#include "lamina/layer.hpp"
#include "lamina/span.hpp"
#include "lamina/text.hpp"

#include "layer_builders.hpp"

namespace lamina {
namespace {

[[nodiscard]]
Span_Entry make_entry(Span span, std::size_t annotation_count = 1)
{
    std::pmr::memory_resource* const memory = std::pmr::get_default_resource();
    Span_Entry result { Base_Span { span, memory }, memory };
    for (std::size_t i = 0; i < annotation_count; ++i) {
        result.annotations.emplace_back(memory);
    }
    return result;
}

[[nodiscard]]
std::pmr::vector<Span_Entry> make_entries(std::initializer_list<Span> spans)
{
    std::pmr::vector<Span_Entry> result;
    for (const Span& span : spans) {
        result.push_back(make_entry(span));
    }
    return result;
}

TEST(Layer_Consistency, replace_spans)
{
    Layer words = make_words({ { 0, 4 } });
    ASSERT_TRUE(words.replace_spans(make_entries({ { 0, 4 }, { 4, 5 }, { 6, 12 } })));
    const std::vector<Span> expected { { 0, 4 }, { 4, 5 }, { 6, 12 } };
    EXPECT_EQ(locations(words), expected);
    EXPECT_TRUE(words.check_span_consistency());
}

TEST(Layer_Consistency, replace_spans_rejects_violations)
{
    Layer words = make_words({ { 0, 4 } });
    const std::vector<Span> original { { 0, 4 } };

    const auto expect_rejected
        = [&](std::pmr::vector<Span_Entry>&& entries, Annotation_Error code, std::size_t index) {
              const Result<void, Consistency_Error> result = words.replace_spans(std::move(entries));
              ASSERT_FALSE(result);
              EXPECT_EQ(result.error().code, code);
              EXPECT_EQ(result.error().span_index, index);
              EXPECT_EQ(locations(words), original);
          };

    expect_rejected(make_entries({ { 4, 5 }, { 0, 4 } }), Annotation_Error::unsorted_spans, 1);
    expect_rejected(make_entries({ { 0, 4 }, { 0, 4 } }), Annotation_Error::duplicate_span, 1);
    expect_rejected(make_entries({ { 0, 4 }, { 6, 6 } }), Annotation_Error::invalid_range, 1);

    std::pmr::vector<Span_Entry> no_annotation;
    no_annotation.push_back(make_entry({ 0, 4 }, 0));
    expect_rejected(std::move(no_annotation), Annotation_Error::inconsistent, 0);

    std::pmr::vector<Span_Entry> two_annotations;
    two_annotations.push_back(make_entry({ 0, 4 }, 2));
    expect_rejected(std::move(two_annotations), Annotation_Error::inconsistent, 0);

    constexpr Span children[] { { 0, 4 }, { 4, 5 } };
    std::pmr::vector<Span_Entry> enveloping;
    enveloping.emplace_back(*make_enveloping_span(children, std::pmr::get_default_resource()),
                            std::pmr::get_default_resource());
    enveloping.back().annotations.emplace_back(std::pmr::get_default_resource());
    expect_rejected(std::move(enveloping), Annotation_Error::wrong_topology, 0);
}

TEST(Layer_Consistency, attribute_mismatch)
{
    constexpr std::u8string_view attributes[] { u8"lemma" };
    Layer morph = make_layer({ .name = u8"morph", .attributes = attributes });

    const Result<void, Consistency_Error> result = morph.replace_spans(make_entries({ { 0, 4 } }));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Annotation_Error::attribute_mismatch);
    EXPECT_TRUE(morph.empty());
}

TEST(Layer_Consistency, message_names_layer_and_span)
{
    Layer words = make_words({ { 0, 4 } });
    const Result<void, Consistency_Error> result
        = words.replace_spans(make_entries({ { 6, 12 }, { 4, 5 } }));
    ASSERT_FALSE(result);

    const std::u8string_view message = result.error().message;
    EXPECT_TRUE(message.starts_with(u8"Layer \"words\": "));
    EXPECT_NE(message.find(u8"(span [4, 5) at index 1)"), std::u8string_view::npos);
}

TEST(Layer_Consistency, enveloping_location_must_match_children)
{
    Layer sentences
        = make_layer({ .name = u8"sentences", .topology = Topology::enveloping(u8"words") });
    constexpr Span children[] { { 0, 4 }, { 4, 5 } };
    std::pmr::vector<Span_Entry> entries;
    Span_Entry& entry = entries.emplace_back(
        *make_enveloping_span(children, std::pmr::get_default_resource()),
        std::pmr::get_default_resource()
    );
    entry.annotations.emplace_back(std::pmr::get_default_resource());
    entry.base_span.location = { 0, 6 };

    const Result<void, Consistency_Error> result = sentences.replace_spans(std::move(entries));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Annotation_Error::non_contiguous_children);
}

TEST(Layer_Consistency, bound_alignment)
{
    std::pmr::monotonic_buffer_resource memory;
    Text text { sample_text, &memory };
    add_words(text);

    constexpr std::u8string_view attributes[] { u8"lemma" };
    Layer morph = make_layer(
        { .name = u8"morph", .attributes = attributes, .topology = Topology::parent(u8"words") },
        &memory
    );
    ASSERT_TRUE(morph.add_span({ 0, 4 }));
    ASSERT_TRUE(morph.add_span({ 6, 12 }));
    ASSERT_TRUE(text.add_layer(std::move(morph)));

    const Layer& attached = **text.layer(u8"morph");
    EXPECT_TRUE(attached.check_span_consistency());
    EXPECT_TRUE(text.check_dependents(u8"words"));
}

TEST(Layer_Consistency, copies_of_attached_layers_are_independent)
{
    std::pmr::monotonic_buffer_resource memory;
    Text text { sample_text, &memory };
    add_words(text);

    Layer morph = make_layer({ .name = u8"morph", .topology = Topology::parent(u8"words") }, &memory);
    ASSERT_TRUE(morph.add_span({ 0, 4 }));
    ASSERT_TRUE(text.add_layer(std::move(morph)));

    const Layer& words = **text.layer(u8"words");
    Layer copy = words.empty_copy();
    EXPECT_TRUE(copy.is_bound());

    // The copy is not part of the text, so morph does not constrain it.
    ASSERT_TRUE(copy.replace_spans(make_entries({ { 4, 5 } })));
    EXPECT_EQ(words.size(), 7);
    EXPECT_TRUE(text.check_dependents(u8"words"));
}

TEST(Layer_Consistency, check_has_no_side_effects)
{
    std::pmr::monotonic_buffer_resource memory;
    Text text { sample_text, &memory };
    add_words(text);

    constexpr std::u8string_view attributes[] { u8"lemma" };
    Layer morph = make_layer(
        { .name = u8"morph", .attributes = attributes, .topology = Topology::parent(u8"words") },
        &memory
    );
    const Attribute tere[] { { u8"lemma", u8"tere" } };
    ASSERT_TRUE(morph.add_span({ 0, 4 }, tere));
    ASSERT_TRUE(morph.add_span({ 6, 12 }));
    ASSERT_TRUE(text.add_layer(std::move(morph)));

    const Layer& attached = **text.layer(u8"morph");
    const Layer before = attached;
    EXPECT_TRUE(attached.check_span_consistency());
    EXPECT_TRUE(attached.check_span_consistency());
    EXPECT_EQ(attached, before);
    EXPECT_EQ(locations(attached), locations(before));
}

} // namespace
} // namespace lamina
