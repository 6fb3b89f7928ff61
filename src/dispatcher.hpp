#pragma once

#include <optional>

#include "config.hpp"
#include "error.hpp"
#include "json_ld.hpp"
#include "options.hpp"
#include "prefix_map.hpp"
#include "rdf.hpp"
#include "transformer.hpp"

namespace jsonld
{

enum class OutputForm { EXPAND, COMPACT, FLATTEN, FRAME };

// Fail if “config” cannot produce “form”. Nothing is transformed.
E<void> checkConfig(OutputForm form, const SerializationConfig& config);

// Replace the value of “@context” in “result” with “substitution”.
// Results that are not objects, or have no “@context”, are returned
// unchanged.
JsonValue substituteContext(JsonValue result,
                            const std::optional<JsonValue>& substitution);

// Turns the expanded form of a dataset into the requested output
// form.
class FormatDispatcher
{
public:
    explicit FormatDispatcher(TransformerInterface& transformer)
            : transformer(transformer) {}

    // “expanded” is the result of TransformerInterface::fromRDF() on
    // “dataset”.
    E<JsonValue> dispatch(OutputForm form, JsonValue expanded,
                          const DatasetInterface& dataset,
                          const PrefixMap& prefixes,
                          const SerializationConfig& config,
                          const TransformerOptions& opts) const;

private:
    Context contextFor(const DatasetInterface& dataset,
                       const PrefixMap& prefixes,
                       const SerializationConfig& config) const;

    TransformerInterface& transformer;
};

} // namespace jsonld
