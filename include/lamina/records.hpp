#ifndef LAMINA_RECORDS_HPP
#define LAMINA_RECORDS_HPP

#include <memory>
#include <memory_resource>
#include <string_view>

#include "lamina/util/function_ref.hpp"
#include "lamina/util/result.hpp"

#include "lamina/annotation_error.hpp"
#include "lamina/fwd.hpp"
#include "lamina/json.hpp"
#include "lamina/layer.hpp"
#include "lamina/services.hpp"

namespace lamina {

/// @brief Converts `layer` into its record form:
/// an object with the members
/// `name`, `attributes`, `parent`, `enveloping`, `fragment`, `ambiguous`, `default_values`,
/// and `spans`, in this order.
/// Each span record holds a `base_span`,
/// which is `[start, end]` for elementary spans and `[[start, end], ...]` for enveloping spans,
/// and a list of `annotations`, each being an object from attribute names to values.
[[nodiscard]]
json::Value layer_to_record(const Layer& layer, std::pmr::memory_resource* memory);

/// @brief Converts a record produced by `layer_to_record` back into an unbound layer.
/// The record is validated strictly: spans have to be sorted,
/// and every annotation has to hold exactly the declared attributes.
[[nodiscard]]
Result<Layer, Consistency_Error>
record_to_layer(const json::Value& record, std::pmr::memory_resource* memory);

/// @brief Converts `text` into an object with the members `text`, `meta`, and `layers`,
/// where `layers` holds the records of all layers in attachment order.
[[nodiscard]]
json::Value text_to_record(const Text& text, std::pmr::memory_resource* memory);

/// @brief Converts a record produced by `text_to_record` back into a text.
/// Layers are attached in record order.
[[nodiscard]]
Result<std::unique_ptr<Text>, Consistency_Error> record_to_text(
    const json::Value& record,
    std::pmr::memory_resource* memory,
    Logger& logger = ignorant_logger
);

/// @brief Like `record_to_text`, but only attaches the layers for which
/// `layer_filter` returns `true`.
/// A layer is skipped when the layer it depends on is skipped.
[[nodiscard]]
Result<std::unique_ptr<Text>, Consistency_Error> record_to_text(
    const json::Value& record,
    std::pmr::memory_resource* memory,
    Logger& logger,
    Function_Ref<bool(std::u8string_view)> layer_filter
);

} // namespace lamina

#endif
