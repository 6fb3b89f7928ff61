#include "rdf.hpp"

#include <algorithm>

namespace jsonld
{

Node Node::iri(std::string_view iri)
{
    return {IRI, std::string(iri), "", ""};
}

Node Node::blank(std::string_view label)
{
    return {BLANK, std::string(label), "", ""};
}

Node Node::literal(std::string_view lexical)
{
    return {LITERAL, std::string(lexical), "", ""};
}

Node Node::typedLiteral(std::string_view lexical, std::string_view datatype)
{
    return {LITERAL, std::string(lexical), std::string(datatype), ""};
}

Node Node::langLiteral(std::string_view lexical, std::string_view lang)
{
    return {LITERAL, std::string(lexical), vocab::RDF_LANG_STRING,
            std::string(lang)};
}

std::string Node::localName() const
{
    if(type != IRI)
    {
        return "";
    }
    size_t sep = value.find_last_of("#/:");
    if(sep == std::string::npos)
    {
        return value;
    }
    return value.substr(sep + 1);
}

void MemoryDataset::add(Triple t)
{
    default_graph.push_back(std::move(t));
}

void MemoryDataset::add(const Node& graph, Triple t)
{
    auto it = std::find_if(named_graphs.begin(), named_graphs.end(),
                           [&](const NamedGraph& g) { return g.name == graph; });
    if(it == named_graphs.end())
    {
        named_graphs.push_back({graph, {std::move(t)}});
    }
    else
    {
        it->triples.push_back(std::move(t));
    }
}

} // namespace jsonld
