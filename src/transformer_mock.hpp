#pragma once

#include <gmock/gmock.h>

#include "transformer.hpp"

namespace jsonld
{

class TransformerMock : public TransformerInterface
{
public:
    MOCK_METHOD(E<JsonValue>, fromRDF,
                (const DatasetInterface&, const TransformerOptions&),
                (override));
    MOCK_METHOD(E<JsonValue>, compact,
                (const JsonValue&, const JsonValue&, const TransformerOptions&),
                (override));
    MOCK_METHOD(E<JsonValue>, expand,
                (const JsonValue&, const TransformerOptions&), (override));
    MOCK_METHOD(E<JsonValue>, flatten,
                (const JsonValue&, const JsonValue&, const TransformerOptions&),
                (override));
    MOCK_METHOD(E<JsonValue>, frame,
                (const JsonValue&, const JsonValue&, const TransformerOptions&),
                (override));
};

} // namespace jsonld
