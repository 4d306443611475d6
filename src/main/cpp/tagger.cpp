#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lamina/util/result.hpp"
#include "lamina/util/severity.hpp"

#include "lamina/annotation_error.hpp"
#include "lamina/diagnostic.hpp"
#include "lamina/layer.hpp"
#include "lamina/services.hpp"
#include "lamina/tagger.hpp"
#include "lamina/text.hpp"

namespace lamina {

namespace {

[[nodiscard]]
Consistency_Error make_tagging_error(
    Annotation_Error code,
    std::u8string_view what,
    std::u8string_view layer,
    std::pmr::memory_resource* memory
)
{
    std::pmr::u8string message { memory };
    message += what;
    message += u8" for layer \"";
    message += layer;
    message += u8"\" failed: ";
    message += annotation_error_message(code);
    return { .code = code, .message = std::move(message) };
}

[[nodiscard]]
Result<std::pmr::vector<const Layer*>, Annotation_Error> gather_inputs(
    const Text& text,
    std::span<const std::u8string_view> names,
    std::pmr::memory_resource* memory
)
{
    std::pmr::vector<const Layer*> result { memory };
    result.reserve(names.size());
    for (const std::u8string_view name : names) {
        const Layer* const layer = text.find_layer(name);
        if (!layer) {
            return Annotation_Error::missing_dependency;
        }
        result.push_back(layer);
    }
    return result;
}

[[nodiscard]]
bool has_declared_schema(const Layer& layer, const Tagger& tagger)
{
    return layer.get_name() == tagger.get_output_layer()
        && std::ranges::equal(layer.get_attributes(), tagger.get_output_attributes());
}

} // namespace

Result<void, Consistency_Error> tag(Tagger& tagger, Text& text, std::pmr::memory_resource* memory)
{
    Logger& logger = text.get_logger();
    const std::u8string_view output = tagger.get_output_layer();
    const auto fail = [&](Consistency_Error&& error) -> Result<void, Consistency_Error> {
        logger.log(Severity::error, diagnostic::tagger_failed, error.message);
        return std::move(error);
    };

    Result<std::pmr::vector<const Layer*>, Annotation_Error> inputs
        = gather_inputs(text, tagger.get_input_layers(), memory);
    if (!inputs) {
        return fail(make_tagging_error(inputs.error(), u8"Tagging", output, memory));
    }

    Result<Layer, Annotation_Error> produced = tagger.make_layer(text, *inputs, memory);
    if (!produced) {
        return fail(make_tagging_error(produced.error(), u8"Tagging", output, memory));
    }
    if (!has_declared_schema(*produced, tagger)) {
        return fail(
            make_tagging_error(Annotation_Error::attribute_mismatch, u8"Tagging", output, memory)
        );
    }

    if (auto attached = text.add_layer(std::move(*produced)); !attached) {
        return fail(std::move(attached).error());
    }

    if (logger.can_log(Severity::debug)) {
        std::pmr::u8string message { memory };
        message += u8"Tagged layer \"";
        message += output;
        message += u8"\".";
        logger.log(Severity::debug, diagnostic::tagger_run, message);
    }
    return {};
}

Result<void, Consistency_Error>
retag(Retagger& retagger, Text& text, std::pmr::memory_resource* memory)
{
    Logger& logger = text.get_logger();
    const std::u8string_view name = retagger.get_layer_name();

    Layer* const layer = text.find_mutable_layer(name);
    if (!layer) {
        return make_tagging_error(Annotation_Error::missing_dependency, u8"Retagging", name, memory);
    }
    Result<std::pmr::vector<const Layer*>, Annotation_Error> inputs
        = gather_inputs(text, retagger.get_input_layers(), memory);
    if (!inputs) {
        return make_tagging_error(inputs.error(), u8"Retagging", name, memory);
    }

    const std::span<const Span_Entry> current = layer->spans();
    std::pmr::vector<Span_Entry> spans(current.begin(), current.end(), memory);
    if (auto changed = retagger.change_layer(text, *inputs, spans); !changed) {
        return make_tagging_error(changed.error(), u8"Retagging", name, memory);
    }

    if (auto replaced = layer->replace_spans(std::move(spans)); !replaced) {
        logger.log(Severity::error, diagnostic::retagger_inconsistent, replaced.error().message);
        return replaced;
    }
    return {};
}

} // namespace lamina
