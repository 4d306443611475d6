#ifndef LAMINA_TEST_LAYER_BUILDERS_HPP
#define LAMINA_TEST_LAYER_BUILDERS_HPP

#include <cstddef>
#include <initializer_list>
#include <memory_resource>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "lamina/annotation.hpp"
#include "lamina/attribute_value.hpp"
#include "lamina/layer.hpp"
#include "lamina/span.hpp"
#include "lamina/text.hpp"

namespace lamina {

/// @brief Creates a layer from a schema which is known to be valid.
[[nodiscard]]
inline Layer make_layer(
    const Layer_Schema& schema,
    std::pmr::memory_resource* memory = std::pmr::get_default_resource()
)
{
    return *Layer::create(schema, memory);
}

/// @brief Returns the locations of all span entries of `layer`.
[[nodiscard]]
inline std::vector<Span> locations(const Layer& layer)
{
    std::vector<Span> result;
    for (const Span_Entry& entry : layer.spans()) {
        result.push_back(entry.location());
    }
    return result;
}

/// @brief Returns the location of every annotation of `layer`,
/// so that a location with two annotations is listed twice.
[[nodiscard]]
inline std::vector<Span> annotation_locations(const Layer& layer)
{
    std::vector<Span> result;
    for (const Span_Entry& entry : layer.spans()) {
        for (std::size_t i = 0; i < entry.annotations.size(); ++i) {
            result.push_back(entry.location());
        }
    }
    return result;
}

/// @brief Creates an independent `words` layer without attributes
/// which has one span for each of the given locations.
[[nodiscard]]
inline Layer make_words(std::initializer_list<Span> spans, std::u8string_view name = u8"words")
{
    Layer result = make_layer({ .name = name });
    for (const Span& span : spans) {
        [[maybe_unused]] const auto added = result.add_span(span);
    }
    return result;
}

inline constexpr std::u8string_view sample_text = u8"Tere, maailm! Kuidas läheb?";

/// @brief Attaches a `words` layer to a text holding `sample_text`,
/// with one span per word and punctuation mark.
inline void add_words(Text& text)
{
    // "Tere" "," "maailm" "!" "Kuidas" "läheb" "?"
    [[maybe_unused]] const auto attached = text.add_layer(make_words({
        { 0, 4 },
        { 4, 5 },
        { 6, 12 },
        { 12, 13 },
        { 14, 20 },
        { 21, 27 },
        { 27, 28 },
    }));
}

} // namespace lamina

#endif
