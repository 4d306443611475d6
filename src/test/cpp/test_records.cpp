#include <memory>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "lamina/annotation_error.hpp"
#include "lamina/attribute_value.hpp"
#include "lamina/collecting_logger.hpp"
#include "lamina/diagnostic.hpp"
#include "lamina/json.hpp"
#include "lamina/layer.hpp"
#include "lamina/records.hpp"
#include "lamina/text.hpp"

#include "layer_builders.hpp"

namespace lamina {
namespace {

constexpr std::u8string_view lemma_attributes[] { u8"lemma" };
constexpr std::u8string_view morph_attributes[] { u8"lemma", u8"pos" };

struct Records_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Collecting_Logger logger { &memory };
    Text text { sample_text, &memory, logger };

    [[nodiscard]]
    json::Value load(std::u8string_view source)
    {
        std::optional<json::Value> result = json::load(source, &memory);
        EXPECT_TRUE(result);
        return result ? std::move(*result) : json::Value {};
    }

    [[nodiscard]]
    std::pmr::u8string write(const json::Value& value)
    {
        std::pmr::u8string out { &memory };
        json::write(out, value);
        return out;
    }

    [[nodiscard]]
    Annotation_Error layer_error(std::u8string_view source)
    {
        const Result<Layer, Consistency_Error> result = record_to_layer(load(source), &memory);
        EXPECT_FALSE(result);
        return result ? Annotation_Error::inconsistent : result.error().code;
    }

    [[nodiscard]]
    Layer make_morph()
    {
        const Attribute default_pos[] { { u8"pos", u8"X" } };
        Layer result = make_layer(
            { .name = u8"morph",
              .attributes = morph_attributes,
              .topology = Topology::parent(u8"words"),
              .ambiguous = true,
              .default_values = default_pos },
            &memory
        );
        const Attribute tere[] { { u8"lemma", u8"tere" }, { u8"pos", u8"I" } };
        const Attribute maailm_noun[] { { u8"lemma", u8"maailm" }, { u8"pos", u8"S" } };
        const Attribute maailm_other[] { { u8"lemma", u8"maailm" }, { u8"pos", 3 } };
        const Attribute kuidas[] { { u8"lemma", u8"kuidas" } };
        EXPECT_TRUE(result.add_span({ 0, 4 }, tere));
        EXPECT_TRUE(result.add_span({ 6, 12 }, maailm_noun));
        EXPECT_TRUE(result.add_span({ 6, 12 }, maailm_other));
        EXPECT_TRUE(result.add_span({ 14, 20 }, kuidas));
        return result;
    }

    [[nodiscard]]
    Layer make_sentences()
    {
        Layer result = make_layer(
            { .name = u8"sentences", .topology = Topology::enveloping(u8"words") }, &memory
        );
        constexpr Span first[] { { 0, 4 }, { 4, 5 }, { 6, 12 }, { 12, 13 } };
        constexpr Span second[] { { 14, 20 }, { 21, 27 }, { 27, 28 } };
        EXPECT_TRUE(result.add_enveloping_span(first));
        EXPECT_TRUE(result.add_enveloping_span(second));
        return result;
    }

    [[nodiscard]]
    Layer make_syllables()
    {
        Layer result = make_layer(
            { .name = u8"syllables",
              .attributes = lemma_attributes,
              .topology = Topology::fragment(u8"words") },
            &memory
        );
        const Attribute stressed[] { { u8"lemma", true } };
        const Attribute weight[] { { u8"lemma", 0.5 } };
        EXPECT_TRUE(result.add_span({ 0, 2 }, stressed));
        EXPECT_TRUE(result.add_span({ 2, 4 }, weight));
        return result;
    }

    void add_all_layers()
    {
        add_words(text);
        ASSERT_TRUE(text.add_layer(make_morph()));
        ASSERT_TRUE(text.add_layer(make_sentences()));
        ASSERT_TRUE(text.add_layer(make_syllables()));
    }
};

TEST_F(Records_Test, layer_record_format)
{
    const Layer words = make_words({ { 0, 4 }, { 6, 12 } });
    EXPECT_EQ(
        write(layer_to_record(words, &memory)),
        u8R"({"name":"words","attributes":[],"parent":null,"enveloping":null,)"
        u8R"("fragment":null,"ambiguous":false,"default_values":{},)"
        u8R"("spans":[{"base_span":[0,4],"annotations":[{}]},)"
        u8R"({"base_span":[6,12],"annotations":[{}]}]})"
    );
}

TEST_F(Records_Test, dependent_layer_record_format)
{
    const Layer sentences = make_sentences();
    const std::pmr::u8string written = write(layer_to_record(sentences, &memory));
    EXPECT_NE(written.find(u8R"("enveloping":"words")"), std::u8string_view::npos);
    EXPECT_NE(
        written.find(u8R"("base_span":[[0,4],[4,5],[6,12],[12,13]])"), std::u8string_view::npos
    );

    const Layer morph = make_morph();
    const std::pmr::u8string morph_written = write(layer_to_record(morph, &memory));
    EXPECT_NE(
        morph_written.find(u8R"("default_values":{"lemma":null,"pos":"X"})"),
        std::u8string_view::npos
    );
    EXPECT_NE(
        morph_written.find(u8R"({"lemma":"kuidas","pos":"X"})"), std::u8string_view::npos
    );
}

TEST_F(Records_Test, layer_round_trip)
{
    const Layer layers[] { make_words({ { 0, 4 }, { 6, 12 } }), make_morph(), make_sentences(),
                           make_syllables() };
    for (const Layer& layer : layers) {
        const Result<Layer, Consistency_Error> restored
            = record_to_layer(layer_to_record(layer, &memory), &memory);
        ASSERT_TRUE(restored);
        EXPECT_EQ(*restored, layer);
        EXPECT_FALSE(restored->is_bound());
    }
}

TEST_F(Records_Test, layer_round_trip_through_json_text)
{
    const Layer morph = make_morph();
    const std::pmr::u8string written = write(layer_to_record(morph, &memory));
    const Result<Layer, Consistency_Error> restored = record_to_layer(load(written), &memory);
    ASSERT_TRUE(restored);
    EXPECT_EQ(*restored, morph);

    const Attribute_Value* const pos = (*restored)[1].annotations()[1].find(u8"pos");
    ASSERT_NE(pos, nullptr);
    EXPECT_EQ(*pos, Attribute_Value { 3 });
}

TEST_F(Records_Test, text_round_trip)
{
    add_all_layers();
    text.meta().push_back({ String { u8"source", &memory }, Attribute_Value { u8"test" } });
    text.meta().push_back({ String { u8"year", &memory }, Attribute_Value { 2024 } });

    const json::Value record = text_to_record(text, &memory);
    const Result<std::unique_ptr<Text>, Consistency_Error> restored
        = record_to_text(load(write(record)), &memory, logger);
    ASSERT_TRUE(restored);

    const Text& copy = **restored;
    EXPECT_EQ(copy.get_text(), sample_text);
    EXPECT_EQ(copy.meta(), text.meta());
    EXPECT_EQ(copy.layer_names(&memory), text.layer_names(&memory));
    for (const Layer& layer : text.layers()) {
        const Layer* const restored_layer = copy.find_layer(layer.get_name());
        ASSERT_NE(restored_layer, nullptr);
        EXPECT_EQ(*restored_layer, layer);
        EXPECT_EQ(restored_layer->get_text(), &copy);
    }
    EXPECT_EQ(text_to_record(copy, &memory), record);
}

TEST_F(Records_Test, text_record_filter)
{
    add_all_layers();
    const json::Value record = text_to_record(text, &memory);

    auto without_morph = [](std::u8string_view name) { return name != u8"morph"; };
    const Result<std::unique_ptr<Text>, Consistency_Error> partial
        = record_to_text(record, &memory, logger, without_morph);
    ASSERT_TRUE(partial);
    const std::pmr::vector<std::u8string_view> expected { u8"words", u8"sentences", u8"syllables" };
    EXPECT_EQ((*partial)->layer_names(&memory), expected);

    auto without_words = [](std::u8string_view name) { return name != u8"words"; };
    const Result<std::unique_ptr<Text>, Consistency_Error> empty
        = record_to_text(record, &memory, logger, without_words);
    ASSERT_TRUE(empty);
    EXPECT_TRUE((*empty)->layers().empty());
}

TEST_F(Records_Test, unsorted_spans)
{
    EXPECT_EQ(
        layer_error(
            u8R"({"name":"words","attributes":[],"parent":null,"enveloping":null,)"
            u8R"("fragment":null,"ambiguous":false,"default_values":{},)"
            u8R"("spans":[{"base_span":[6,12],"annotations":[{}]},)"
            u8R"({"base_span":[0,4],"annotations":[{}]}]})"
        ),
        Annotation_Error::unsorted_spans
    );
}

TEST_F(Records_Test, annotation_attributes_must_match)
{
    EXPECT_EQ(
        layer_error(
            u8R"({"name":"morph","attributes":["lemma"],"parent":null,"enveloping":null,)"
            u8R"("fragment":null,"ambiguous":false,"default_values":{"lemma":null},)"
            u8R"("spans":[{"base_span":[0,4],"annotations":[{}]}]})"
        ),
        Annotation_Error::malformed_record
    );
    EXPECT_EQ(
        layer_error(
            u8R"({"name":"morph","attributes":["lemma"],"parent":null,"enveloping":null,)"
            u8R"("fragment":null,"ambiguous":false,"default_values":{"lemma":null},)"
            u8R"("spans":[{"base_span":[0,4],"annotations":[{"lemma":"a","pos":"S"}]}]})"
        ),
        Annotation_Error::malformed_record
    );
    // Same attributes, but not in declaration order.
    EXPECT_EQ(
        layer_error(
            u8R"({"name":"morph","attributes":["lemma","pos"],"parent":null,"enveloping":null,)"
            u8R"("fragment":null,"ambiguous":false,"default_values":{"lemma":null,"pos":null},)"
            u8R"("spans":[{"base_span":[0,4],"annotations":[{"pos":"S","lemma":"a"}]}]})"
        ),
        Annotation_Error::malformed_record
    );
}

TEST_F(Records_Test, default_values_must_cover_declared_attributes)
{
    EXPECT_EQ(
        layer_error(
            u8R"({"name":"morph","attributes":["lemma"],"parent":null,"enveloping":null,)"
            u8R"("fragment":null,"ambiguous":false,"default_values":{},"spans":[]})"
        ),
        Annotation_Error::malformed_record
    );
    EXPECT_EQ(
        layer_error(
            u8R"({"name":"morph","attributes":["lemma","pos"],"parent":null,"enveloping":null,)"
            u8R"("fragment":null,"ambiguous":false,"default_values":{"pos":"X","lemma":null},)"
            u8R"("spans":[]})"
        ),
        Annotation_Error::malformed_record
    );
}

TEST_F(Records_Test, canonical_record_is_written_back_unchanged)
{
    constexpr std::u8string_view source
        = u8R"({"name":"morph","attributes":["lemma","pos"],"parent":null,"enveloping":null,)"
          u8R"("fragment":null,"ambiguous":true,"default_values":{"lemma":null,"pos":"X"},)"
          u8R"("spans":[{"base_span":[0,4],"annotations":[{"lemma":"tere","pos":"I"},)"
          u8R"({"lemma":"tere","pos":"X"}]}]})";
    const Result<Layer, Consistency_Error> layer = record_to_layer(load(source), &memory);
    ASSERT_TRUE(layer);
    EXPECT_EQ(write(layer_to_record(*layer, &memory)), source);
}

TEST_F(Records_Test, malformed_layer_records)
{
    // Unknown member.
    EXPECT_EQ(
        layer_error(
            u8R"({"name":"words","attributes":[],"parent":null,"enveloping":null,)"
            u8R"("fragment":null,"ambiguous":false,"default_values":{},"spans":[],"extra":1})"
        ),
        Annotation_Error::malformed_record
    );
    // Missing member.
    EXPECT_EQ(
        layer_error(
            u8R"({"name":"words","attributes":[],"parent":null,"enveloping":null,)"
            u8R"("ambiguous":false,"default_values":{},"spans":[]})"
        ),
        Annotation_Error::malformed_record
    );
    // Two base layers.
    EXPECT_EQ(
        layer_error(
            u8R"({"name":"x","attributes":[],"parent":"words","enveloping":"words",)"
            u8R"("fragment":null,"ambiguous":false,"default_values":{},"spans":[]})"
        ),
        Annotation_Error::malformed_record
    );
    // Non-scalar attribute value.
    EXPECT_EQ(
        layer_error(
            u8R"({"name":"morph","attributes":["lemma"],"parent":null,"enveloping":null,)"
            u8R"("fragment":null,"ambiguous":false,"default_values":{"lemma":null},)"
            u8R"("spans":[{"base_span":[0,4],"annotations":[{"lemma":[1]}]}]})"
        ),
        Annotation_Error::malformed_record
    );
    EXPECT_EQ(layer_error(u8"[]"), Annotation_Error::malformed_record);
}

TEST_F(Records_Test, invalid_spans_in_records)
{
    EXPECT_EQ(
        layer_error(
            u8R"({"name":"words","attributes":[],"parent":null,"enveloping":null,)"
            u8R"("fragment":null,"ambiguous":false,"default_values":{},)"
            u8R"("spans":[{"base_span":[4,4],"annotations":[{}]}]})"
        ),
        Annotation_Error::invalid_range
    );
    EXPECT_EQ(
        layer_error(
            u8R"({"name":"sentences","attributes":[],"parent":null,"enveloping":"words",)"
            u8R"("fragment":null,"ambiguous":false,"default_values":{},)"
            u8R"("spans":[{"base_span":[[0,4],[2,5]],"annotations":[{}]}]})"
        ),
        Annotation_Error::non_contiguous_children
    );
    EXPECT_EQ(
        layer_error(
            u8R"({"name":"words","attributes":[],"parent":null,"enveloping":null,)"
            u8R"("fragment":null,"ambiguous":false,"default_values":{},)"
            u8R"("spans":[{"base_span":[0,4],"annotations":[{},{}]}]})"
        ),
        Annotation_Error::inconsistent
    );
}

TEST_F(Records_Test, invalid_layer_schema_in_record)
{
    EXPECT_EQ(
        layer_error(
            u8R"({"name":"text","attributes":[],"parent":null,"enveloping":null,)"
            u8R"("fragment":null,"ambiguous":false,"default_values":{},"spans":[]})"
        ),
        Annotation_Error::invalid_layer_name
    );
}

TEST_F(Records_Test, malformed_text_record_is_logged)
{
    const Result<std::unique_ptr<Text>, Consistency_Error> result
        = record_to_text(load(u8R"({"text":"abc","meta":{}})"), &memory, logger);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Annotation_Error::malformed_record);
    EXPECT_TRUE(logger.was_logged(diagnostic::record_malformed));
}

TEST_F(Records_Test, text_record_with_missing_base_layer)
{
    const Result<std::unique_ptr<Text>, Consistency_Error> result = record_to_text(
        load(
            u8R"({"text":"abc","meta":{},"layers":[)"
            u8R"({"name":"morph","attributes":[],"parent":"words","enveloping":null,)"
            u8R"("fragment":null,"ambiguous":false,"default_values":{},"spans":[]}]})"
        ),
        &memory, logger
    );
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Annotation_Error::missing_dependency);
    EXPECT_TRUE(logger.was_logged(diagnostic::layer_attach_rejected));
}

} // namespace
} // namespace lamina
