#include "options.hpp"

namespace jsonld
{

TransformerOptions resolveOptions(
    std::string_view base_uri,
    const std::optional<TransformerOptions>& caller_options)
{
    if(caller_options.has_value())
    {
        return *caller_options;
    }

    TransformerOptions opts;
    opts.base = base_uri;
    opts.use_namespaces = true;
    opts.use_native_types = true;
    opts.compact_arrays = true;
    return opts;
}

} // namespace jsonld
