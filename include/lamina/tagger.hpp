#ifndef LAMINA_TAGGER_HPP
#define LAMINA_TAGGER_HPP

#include <memory_resource>
#include <span>
#include <string_view>
#include <vector>

#include "lamina/util/result.hpp"

#include "lamina/annotation_error.hpp"
#include "lamina/fwd.hpp"
#include "lamina/layer.hpp"

namespace lamina {

/// @brief Produces a new layer from a text and the layers it depends on.
struct Tagger {
    [[nodiscard]]
    Tagger() = default;
    Tagger(const Tagger&) = delete;
    Tagger& operator=(const Tagger&) = delete;

    virtual ~Tagger() = default;

    [[nodiscard]]
    virtual std::u8string_view get_output_layer() const = 0;

    [[nodiscard]]
    virtual std::span<const std::u8string_view> get_output_attributes() const = 0;

    /// @brief Returns the names of the layers which must be attached before tagging,
    /// in the order in which they are passed to `make_layer`.
    [[nodiscard]]
    virtual std::span<const std::u8string_view> get_input_layers() const = 0;

    /// @brief Creates the output layer.
    /// `inputs` holds one layer per name of `get_input_layers()`, in the same order.
    [[nodiscard]]
    virtual Result<Layer, Annotation_Error> make_layer(
        const Text& text,
        std::span<const Layer* const> inputs,
        std::pmr::memory_resource* memory
    ) = 0;
};

/// @brief Runs `tagger` on `text` and attaches the produced layer.
/// Fails with `missing_dependency` if an input layer is missing,
/// and with `attribute_mismatch` if the produced layer
/// does not have the declared name and attributes.
/// On failure, `text` is left unchanged.
Result<void, Consistency_Error> tag(Tagger& tagger, Text& text, std::pmr::memory_resource* memory);

/// @brief Changes the spans of an already attached layer.
struct Retagger {
    [[nodiscard]]
    Retagger() = default;
    Retagger(const Retagger&) = delete;
    Retagger& operator=(const Retagger&) = delete;

    virtual ~Retagger() = default;

    [[nodiscard]]
    virtual std::u8string_view get_layer_name() const = 0;

    [[nodiscard]]
    virtual std::span<const std::u8string_view> get_input_layers() const = 0;

    /// @brief Changes `spans`, which is a copy of the spans of the layer.
    virtual Result<void, Annotation_Error> change_layer(
        const Text& text,
        std::span<const Layer* const> inputs,
        std::pmr::vector<Span_Entry>& spans
    ) = 0;
};

/// @brief Runs `retagger` on its layer in `text`.
/// The retagger works on a copy of the spans,
/// which only replaces the spans of the layer once the layer
/// and the layers depending on it pass their consistency audit.
/// On failure, `text` is left unchanged.
Result<void, Consistency_Error>
retag(Retagger& retagger, Text& text, std::pmr::memory_resource* memory);

} // namespace lamina

#endif
