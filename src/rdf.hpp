#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "prefix_map.hpp"

namespace jsonld
{

namespace vocab
{
constexpr char RDF_TYPE[] = "http://www.w3.org/1999/02/22-rdf-syntax-ns#type";
constexpr char RDF_LANG_STRING[] =
    "http://www.w3.org/1999/02/22-rdf-syntax-ns#langString";
constexpr char XSD_STRING[] = "http://www.w3.org/2001/XMLSchema#string";
constexpr char XSD_INTEGER[] = "http://www.w3.org/2001/XMLSchema#integer";
} // namespace vocab

struct Node
{
    enum Type { IRI, BLANK, LITERAL };

    Type type = IRI;
    // The IRI, the blank node label, or the lexical form of a literal.
    std::string value;
    // Only literals have these. An empty datatype is a plain literal.
    std::string datatype;
    std::string lang;

    static Node iri(std::string_view iri);
    static Node blank(std::string_view label);
    static Node literal(std::string_view lexical);
    static Node typedLiteral(std::string_view lexical,
                             std::string_view datatype);
    static Node langLiteral(std::string_view lexical, std::string_view lang);

    bool isIRI() const { return type == IRI; }
    bool isBlank() const { return type == BLANK; }
    bool isLiteral() const { return type == LITERAL; }

    // For IRIs, the part after the last “#”, “/” or “:”. Empty for
    // everything else.
    std::string localName() const;

    bool operator==(const Node&) const = default;
};

struct Triple
{
    Node subject;
    Node predicate;
    Node object;

    bool operator==(const Triple&) const = default;
};

struct NamedGraph
{
    Node name;
    std::vector<Triple> triples;
};

class DatasetInterface
{
public:
    virtual ~DatasetInterface() = default;

    // Triples of the default graph, in iteration order.
    virtual const std::vector<Triple>& defaultGraph() const = 0;
    virtual const std::vector<NamedGraph>& namedGraphs() const = 0;
    // Prefixes declared by the data itself.
    virtual const PrefixMap& prefixMapping() const = 0;
};

// Append-only dataset. Iteration follows insertion order.
class MemoryDataset : public DatasetInterface
{
public:
    MemoryDataset() = default;

    void add(Triple t);
    void add(const Node& graph, Triple t);
    PrefixMap& prefixes() { return prefix_map; }

    const std::vector<Triple>& defaultGraph() const override
    {
        return default_graph;
    }
    const std::vector<NamedGraph>& namedGraphs() const override
    {
        return named_graphs;
    }
    const PrefixMap& prefixMapping() const override { return prefix_map; }

private:
    std::vector<Triple> default_graph;
    std::vector<NamedGraph> named_graphs;
    PrefixMap prefix_map;
};

} // namespace jsonld
