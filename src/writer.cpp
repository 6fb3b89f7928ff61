#include "writer.hpp"

#include <format>

#include <spdlog/spdlog.h>

#include "json_ld.hpp"
#include "options.hpp"

namespace jsonld
{

std::string_view variantName(Variant v)
{
    switch(v)
    {
    case Variant::COMPACT_PRETTY: return "JSON-LD compact pretty";
    case Variant::COMPACT_FLAT: return "JSON-LD compact flat";
    case Variant::EXPAND_PRETTY: return "JSON-LD expand pretty";
    case Variant::EXPAND_FLAT: return "JSON-LD expand flat";
    case Variant::FLATTEN_PRETTY: return "JSON-LD flatten pretty";
    case Variant::FLATTEN_FLAT: return "JSON-LD flatten flat";
    case Variant::FRAME_PRETTY: return "JSON-LD frame pretty";
    case Variant::FRAME_FLAT: return "JSON-LD frame flat";
    }
    return "JSON-LD unknown";
}

E<JsonLDWriter> JsonLDWriter::create(Variant variant,
                                     TransformerInterface& transformer)
{
    OutputForm form;
    bool pretty;
    switch(variant)
    {
    case Variant::COMPACT_PRETTY:
    case Variant::COMPACT_FLAT:
        form = OutputForm::COMPACT;
        pretty = variant == Variant::COMPACT_PRETTY;
        break;
    case Variant::EXPAND_PRETTY:
    case Variant::EXPAND_FLAT:
        form = OutputForm::EXPAND;
        pretty = variant == Variant::EXPAND_PRETTY;
        break;
    case Variant::FLATTEN_PRETTY:
    case Variant::FLATTEN_FLAT:
        form = OutputForm::FLATTEN;
        pretty = variant == Variant::FLATTEN_PRETTY;
        break;
    case Variant::FRAME_PRETTY:
    case Variant::FRAME_FLAT:
        form = OutputForm::FRAME;
        pretty = variant == Variant::FRAME_PRETTY;
        break;
    default:
        return std::unexpected(configurationError(std::format(
            "Unexpected output format {}", static_cast<int>(variant))));
    }
    spdlog::debug("Created {} writer.", variantName(variant));
    return JsonLDWriter(form, pretty, transformer);
}

E<std::string> JsonLDWriter::write(
    const DatasetInterface& dataset, const PrefixMap& prefixes,
    std::string_view base_uri, const SerializationConfig& config) const
{
    DO_OR_RETURN(checkConfig(output_form, config));
    TransformerOptions opts = resolveOptions(base_uri,
                                             config.transformer_options);

    ASSIGN_OR_RETURN(JsonValue expanded, transformer.fromRDF(dataset, opts));
    ASSIGN_OR_RETURN(JsonValue result, dispatcher.dispatch(
        output_form, std::move(expanded), dataset, prefixes, config, opts));
    ASSIGN_OR_RETURN(std::string text, dumpJson(result, is_pretty));
    text += '\n';
    return text;
}

E<void> JsonLDWriter::write(
    std::ostream& out, const DatasetInterface& dataset,
    const PrefixMap& prefixes, std::string_view base_uri,
    const SerializationConfig& config) const
{
    ASSIGN_OR_RETURN(std::string text,
                     write(dataset, prefixes, base_uri, config));
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.flush();
    if(!out)
    {
        return std::unexpected(ioError("Failed to write JSON-LD output"));
    }
    return {};
}

} // namespace jsonld
