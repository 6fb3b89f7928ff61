#include "dispatcher.hpp"

#include <format>

#include <spdlog/spdlog.h>

#include "context_builder.hpp"

namespace jsonld
{

E<void> checkConfig(OutputForm form, const SerializationConfig& config)
{
    switch(form)
    {
    case OutputForm::EXPAND:
    case OutputForm::COMPACT:
    case OutputForm::FLATTEN:
        return {};
    case OutputForm::FRAME:
        if(!config.frame.has_value())
        {
            return std::unexpected(configurationError(
                "No frame object found in configuration"));
        }
        return {};
    }
    return std::unexpected(configurationError(std::format(
        "Unexpected output form {}", static_cast<int>(form))));
}

JsonValue substituteContext(JsonValue result,
                            const std::optional<JsonValue>& substitution)
{
    if(!substitution.has_value())
    {
        return result;
    }
    if(!result.is_object() || !result.contains(KEY_CONTEXT))
    {
        spdlog::debug("Output has no @context to substitute.");
        return result;
    }
    result[KEY_CONTEXT] = *substitution;
    return result;
}

Context FormatDispatcher::contextFor(const DatasetInterface& dataset,
                                     const PrefixMap& prefixes,
                                     const SerializationConfig& config) const
{
    if(config.explicit_context.has_value())
    {
        spdlog::debug("Using the configured JSON-LD context.");
        return *config.explicit_context;
    }
    return buildContext(dataset.defaultGraph(), prefixes,
                        config.prefer_prefixed_properties);
}

E<JsonValue> FormatDispatcher::dispatch(
    OutputForm form, JsonValue expanded, const DatasetInterface& dataset,
    const PrefixMap& prefixes, const SerializationConfig& config,
    const TransformerOptions& opts) const
{
    DO_OR_RETURN(checkConfig(form, config));

    switch(form)
    {
    case OutputForm::EXPAND:
        return expanded;
    case OutputForm::FRAME:
        return transformer.frame(expanded, *config.frame, opts);
    case OutputForm::COMPACT:
    {
        Context ctx = contextFor(dataset, prefixes, config);
        ASSIGN_OR_RETURN(JsonValue result,
                         transformer.compact(expanded, ctx, opts));
        return substituteContext(std::move(result),
                                 config.context_substitution);
    }
    case OutputForm::FLATTEN:
    {
        Context ctx = contextFor(dataset, prefixes, config);
        ASSIGN_OR_RETURN(JsonValue result,
                         transformer.flatten(expanded, ctx, opts));
        return substituteContext(std::move(result),
                                 config.context_substitution);
    }
    }
    // checkConfig() has rejected anything else already.
    return std::unexpected(configurationError("Unexpected output form"));
}

} // namespace jsonld
