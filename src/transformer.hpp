#pragma once

#include "error.hpp"
#include "json_ld.hpp"
#include "options.hpp"
#include "rdf.hpp"

namespace jsonld
{

// A JSON-LD processor. Implementations report every processing failure
// as a TransformError.
class TransformerInterface
{
public:
    virtual ~TransformerInterface() = default;

    // Convert a dataset into expanded JSON-LD. The result is the input
    // of every other operation.
    virtual E<JsonValue> fromRDF(const DatasetInterface& dataset,
                                 const TransformerOptions& opts) = 0;
    virtual E<JsonValue> compact(const JsonValue& input,
                                 const JsonValue& context,
                                 const TransformerOptions& opts) = 0;
    virtual E<JsonValue> expand(const JsonValue& input,
                                const TransformerOptions& opts) = 0;
    virtual E<JsonValue> flatten(const JsonValue& input,
                                 const JsonValue& context,
                                 const TransformerOptions& opts) = 0;
    virtual E<JsonValue> frame(const JsonValue& input, const JsonValue& frame,
                               const TransformerOptions& opts) = 0;
};

} // namespace jsonld
