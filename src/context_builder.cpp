#include "context_builder.hpp"

#include <string>

#include <spdlog/spdlog.h>

namespace jsonld
{

namespace {

std::string termFor(const Node& predicate, const PrefixMap& prefixes,
                    bool prefer_prefixed)
{
    if(prefer_prefixed)
    {
        if(auto curie = prefixes.abbreviate(predicate.value);
           curie.has_value())
        {
            return *std::move(curie);
        }
    }
    std::string local = predicate.localName();
    if(local.empty())
    {
        // No usable local name, e.g. “http://example.org/”.
        return predicate.value;
    }
    return local;
}

JsonValue termDefinition(const Node& predicate, const Node& object)
{
    if(object.isIRI() || object.isBlank())
    {
        return typedTerm(predicate.value, KEY_ID);
    }
    if(!object.datatype.empty() && object.datatype != vocab::RDF_LANG_STRING &&
       object.datatype != vocab::XSD_STRING)
    {
        return typedTerm(predicate.value, object.datatype);
    }
    return predicate.value;
}

} // namespace

Context buildContext(std::span<const Triple> triples,
                     const PrefixMap& prefixes, bool prefer_prefixed)
{
    Context ctx = Context::object();
    for(const Triple& t: triples)
    {
        if(t.predicate.value == vocab::RDF_TYPE)
        {
            continue;
        }
        std::string term = termFor(t.predicate, prefixes, prefer_prefixed);
        if(ctx.contains(term))
        {
            continue;
        }
        ctx[term] = termDefinition(t.predicate, t.object);
    }

    for(const auto& [prefix, iri]: prefixes.entries())
    {
        if(prefix.empty() || ctx.contains(prefix))
        {
            continue;
        }
        ctx[prefix] = iri;
    }

    spdlog::debug("Derived a JSON-LD context with {} entries from {} triples.",
                  ctx.size(), triples.size());
    return ctx;
}

Context buildContext(const DatasetInterface& dataset, bool prefer_prefixed)
{
    return buildContext(dataset.defaultGraph(), dataset.prefixMapping(),
                        prefer_prefixed);
}

} // namespace jsonld
