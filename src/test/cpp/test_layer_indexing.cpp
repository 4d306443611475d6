#include <algorithm>
#include <cstddef>
#include <limits>
#include <memory_resource>
#include <string_view>
#include <variant>
#include <vector>

#include <gtest/gtest.h>

#include "lamina/annotation_error.hpp"
#include "lamina/attribute_value.hpp"
#include "lamina/layer.hpp"
#include "lamina/span.hpp"

#include "layer_builders.hpp"

namespace lamina {
namespace {

constexpr std::u8string_view morph_attributes[] { u8"lemma", u8"partofspeech" };

/// @brief Creates an unambiguous `morph` layer for the words of `sample_text`.
[[nodiscard]]
Layer make_morph()
{
    Layer result = make_layer({ .name = u8"morph", .attributes = morph_attributes });
    const auto add = [&](Span span, std::u8string_view lemma, std::u8string_view partofspeech) {
        const Attribute attributes[] { { String { u8"lemma" }, Attribute_Value { lemma } },
                                       { String { u8"partofspeech" },
                                         Attribute_Value { partofspeech } } };
        EXPECT_TRUE(result.add_span(span, attributes));
    };
    add({ 0, 4 }, u8"tere", u8"I");
    add({ 4, 5 }, u8",", u8"Z");
    add({ 6, 12 }, u8"maailm", u8"S");
    add({ 12, 13 }, u8"!", u8"Z");
    add({ 14, 20 }, u8"kuidas", u8"D");
    return result;
}

TEST(Layer_Indexing, at)
{
    const Layer morph = make_morph();
    EXPECT_EQ(morph.at(0)->location(), (Span { 0, 4 }));
    EXPECT_EQ(morph.at(-1)->location(), (Span { 14, 20 }));
    EXPECT_EQ(morph.at(-5)->location(), (Span { 0, 4 }));
    EXPECT_EQ(morph.at(5).error(), Annotation_Error::index_out_of_range);
    EXPECT_EQ(morph.at(-6).error(), Annotation_Error::index_out_of_range);
}

TEST(Layer_Indexing, find)
{
    const Layer morph = make_morph();
    EXPECT_EQ(morph.find({ 6, 12 }), 2);
    EXPECT_FALSE(morph.find({ 6, 11 }));
    EXPECT_EQ(morph.find_containing({ 7, 9 }), 2);
    EXPECT_FALSE(morph.find_containing({ 5, 7 }));
}

TEST(Layer_Indexing, slice)
{
    const Layer morph = make_morph();

    const Result<Layer, Annotation_Error> middle = morph.slice(1, 4);
    ASSERT_TRUE(middle);
    const std::vector<Span> expected_middle { { 4, 5 }, { 6, 12 }, { 12, 13 } };
    EXPECT_EQ(locations(*middle), expected_middle);
    EXPECT_EQ(middle->get_name(), u8"morph");

    const Result<Layer, Annotation_Error> stepped = morph.slice(0, 100, 2);
    ASSERT_TRUE(stepped);
    const std::vector<Span> expected_stepped { { 0, 4 }, { 6, 12 }, { 14, 20 } };
    EXPECT_EQ(locations(*stepped), expected_stepped);

    const Result<Layer, Annotation_Error> tail = morph.slice(-2, 5);
    ASSERT_TRUE(tail);
    const std::vector<Span> expected_tail { { 12, 13 }, { 14, 20 } };
    EXPECT_EQ(locations(*tail), expected_tail);

    EXPECT_TRUE(morph.slice(3, 1)->empty());
    EXPECT_EQ(morph.slice(3, 1, 1, Selection::forbid_empty).error(), Annotation_Error::empty_selection);
    EXPECT_EQ(morph.slice(0, 5, 0).error(), Annotation_Error::index_out_of_range);
}

TEST(Layer_Indexing, slice_with_huge_step)
{
    const Layer morph = make_morph();
    constexpr auto max_step = std::numeric_limits<std::ptrdiff_t>::max();

    const Result<Layer, Annotation_Error> single = morph.slice(1, 5, max_step);
    ASSERT_TRUE(single);
    const std::vector<Span> expected { { 4, 5 } };
    EXPECT_EQ(locations(*single), expected);

    const Result<Layer, Annotation_Error> from_end = morph.slice(-1, max_step, max_step);
    ASSERT_TRUE(from_end);
    const std::vector<Span> expected_last { { 14, 20 } };
    EXPECT_EQ(locations(*from_end), expected_last);
}

TEST(Layer_Indexing, select)
{
    const Layer morph = make_morph();

    constexpr std::size_t indices[] { 4, 0, 4 };
    const Result<Layer, Annotation_Error> selected = morph.select(indices);
    ASSERT_TRUE(selected);
    const std::vector<Span> expected { { 0, 4 }, { 14, 20 } };
    EXPECT_EQ(locations(*selected), expected);

    constexpr std::size_t out_of_range[] { 1, 5 };
    EXPECT_EQ(morph.select(out_of_range).error(), Annotation_Error::index_out_of_range);

    EXPECT_TRUE(morph.select({})->empty());
    EXPECT_EQ(morph.select({}, Selection::forbid_empty).error(), Annotation_Error::empty_selection);
}

TEST(Layer_Indexing, mask)
{
    const Layer morph = make_morph();

    constexpr bool flags[] { true, false, false, true, false };
    const Result<Layer, Annotation_Error> masked = morph.mask(flags);
    ASSERT_TRUE(masked);
    const std::vector<Span> expected { { 0, 4 }, { 12, 13 } };
    EXPECT_EQ(locations(*masked), expected);

    constexpr bool too_short[] { true, false };
    EXPECT_EQ(morph.mask(too_short).error(), Annotation_Error::index_out_of_range);
}

TEST(Layer_Indexing, filter)
{
    const Layer morph = make_morph();

    auto is_punctuation = [](const Span_View& span) {
        const Result<const Attribute_Value*, Annotation_Error> value = span.get(u8"partofspeech");
        return value && **value == Attribute_Value { u8"Z" };
    };
    const Result<Layer, Annotation_Error> punctuation = morph.filter(is_punctuation);
    ASSERT_TRUE(punctuation);
    const std::vector<Span> expected { { 4, 5 }, { 12, 13 } };
    EXPECT_EQ(locations(*punctuation), expected);

    auto nothing = [](const Span_View&) { return false; };
    EXPECT_EQ(
        morph.filter(nothing, Selection::forbid_empty).error(), Annotation_Error::empty_selection
    );
}

TEST(Layer_Indexing, attribute_list)
{
    const Layer morph = make_morph();

    const Result<Attribute_Column, Annotation_Error> column = morph.attribute_list(u8"lemma");
    ASSERT_TRUE(column);
    const auto* const list = std::get_if<Attribute_List>(&*column);
    ASSERT_TRUE(list);
    ASSERT_EQ(list->size(), 5);
    EXPECT_EQ((*list)[2], Attribute_Value { u8"maailm" });

    EXPECT_EQ(morph.attribute_list(u8"form").error(), Annotation_Error::unknown_attribute);
}

TEST(Layer_Indexing, attribute_list_ambiguous)
{
    Layer morph
        = make_layer({ .name = u8"morph", .attributes = morph_attributes, .ambiguous = true });
    const Attribute interjection[] { { u8"lemma", u8"tere" }, { u8"partofspeech", u8"I" } };
    const Attribute noun[] { { u8"lemma", u8"tere" }, { u8"partofspeech", u8"S" } };
    ASSERT_TRUE(morph.add_span({ 0, 4 }, interjection));
    ASSERT_TRUE(morph.add_span({ 0, 4 }, noun));
    ASSERT_TRUE(morph.add_span({ 6, 12 }, noun));

    const Result<Attribute_Column, Annotation_Error> column = morph.attribute_list(u8"partofspeech");
    ASSERT_TRUE(column);
    const auto* const rows = std::get_if<Ambiguous_Attribute_List>(&*column);
    ASSERT_TRUE(rows);
    ASSERT_EQ(rows->size(), 2);
    ASSERT_EQ((*rows)[0].size(), 2);
    EXPECT_EQ((*rows)[0][0], Attribute_Value { u8"I" });
    EXPECT_EQ((*rows)[0][1], Attribute_Value { u8"S" });
    EXPECT_EQ((*rows)[1].size(), 1);
}

TEST(Layer_Indexing, attribute_tuples)
{
    const Layer morph = make_morph();

    constexpr std::u8string_view names[] { u8"partofspeech", u8"lemma" };
    const auto tuples = morph.attribute_tuples(names);
    ASSERT_TRUE(tuples);
    ASSERT_EQ(tuples->size(), 5);
    ASSERT_EQ((*tuples)[1].size(), 2);
    EXPECT_EQ((*tuples)[1][0], Attribute_Value { u8"Z" });
    EXPECT_EQ((*tuples)[1][1], Attribute_Value { u8"," });

    constexpr std::u8string_view unknown[] { u8"lemma", u8"form" };
    EXPECT_EQ(morph.attribute_tuples(unknown).error(), Annotation_Error::unknown_attribute);
}

TEST(Layer_Indexing, count_values)
{
    const Layer morph = make_morph();

    const auto counts = morph.count_values(u8"partofspeech");
    ASSERT_TRUE(counts);
    const std::vector<Value_Count> expected {
        { Attribute_Value { u8"I" }, 1 },
        { Attribute_Value { u8"Z" }, 2 },
        { Attribute_Value { u8"S" }, 1 },
        { Attribute_Value { u8"D" }, 1 },
    };
    EXPECT_TRUE(std::ranges::equal(*counts, expected));
}

} // namespace
} // namespace lamina
