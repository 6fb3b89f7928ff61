#pragma once

#include <ostream>
#include <string>
#include <string_view>

#include "config.hpp"
#include "dispatcher.hpp"
#include "error.hpp"
#include "prefix_map.hpp"
#include "rdf.hpp"
#include "transformer.hpp"

namespace jsonld
{

// Output form plus layout, as chosen by the caller.
enum class Variant
{
    COMPACT_PRETTY,
    COMPACT_FLAT,
    EXPAND_PRETTY,
    EXPAND_FLAT,
    FLATTEN_PRETTY,
    FLATTEN_FLAT,
    FRAME_PRETTY,
    FRAME_FLAT,
    // The default.
    JSONLD = COMPACT_PRETTY,
};

std::string_view variantName(Variant v);

// Writes a dataset as JSON-LD text. The output form and layout are
// fixed at creation, so a writer can be shared between threads as long
// as the transformer and the data allow concurrent reads.
class JsonLDWriter
{
public:
    static E<JsonLDWriter> create(Variant variant,
                                  TransformerInterface& transformer);

    OutputForm form() const { return output_form; }
    bool pretty() const { return is_pretty; }

    // The JSON-LD text, always ending with a single newline.
    E<std::string> write(const DatasetInterface& dataset,
                         const PrefixMap& prefixes, std::string_view base_uri,
                         const SerializationConfig& config) const;
    // Nothing is written to “out” unless the whole transformation
    // succeeds.
    E<void> write(std::ostream& out, const DatasetInterface& dataset,
                  const PrefixMap& prefixes, std::string_view base_uri,
                  const SerializationConfig& config) const;

private:
    JsonLDWriter(OutputForm form, bool pretty,
                 TransformerInterface& transformer)
            : output_form(form), is_pretty(pretty), dispatcher(transformer),
              transformer(transformer) {}

    OutputForm output_form;
    bool is_pretty;
    FormatDispatcher dispatcher;
    TransformerInterface& transformer;
};

} // namespace jsonld
