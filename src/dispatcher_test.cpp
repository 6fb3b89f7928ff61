#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "dispatcher.hpp"
#include "error.hpp"
#include "test_utils.hpp"
#include "transformer_mock.hpp"

using namespace jsonld;
using ::testing::_;
using ::testing::Eq;
using ::testing::Return;
using ::testing::StrictMock;

class FormatDispatcherTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        dataset.add({Node::iri("http://example.org/Alice"),
                     Node::iri("http://example.org/name"),
                     Node::literal("Alice")});
        prefixes.add("ex", "http://example.org/");
        expanded = JsonValue::parse(R"([{"@id": "http://example.org/Alice"}])");
    }

    MemoryDataset dataset;
    PrefixMap prefixes;
    JsonValue expanded;
    TransformerOptions opts;
    StrictMock<TransformerMock> transformer;
};

TEST_F(FormatDispatcherTest, ExpandReturnsInputUnchanged)
{
    FormatDispatcher d(transformer);
    ASSIGN_OR_FAIL(JsonValue result, d.dispatch(
        OutputForm::EXPAND, expanded, dataset, prefixes, {}, opts));
    EXPECT_EQ(result, expanded);
}

TEST_F(FormatDispatcherTest, CompactWithDerivedContext)
{
    Context expected_ctx = {{"name", "http://example.org/name"},
                            {"ex", "http://example.org/"}};
    JsonValue compacted = {{"@context", expected_ctx}, {"name", "Alice"}};
    EXPECT_CALL(transformer, compact(Eq(expanded), Eq(expected_ctx), _))
        .WillOnce(Return(E<JsonValue>(compacted)));

    FormatDispatcher d(transformer);
    ASSIGN_OR_FAIL(JsonValue result, d.dispatch(
        OutputForm::COMPACT, expanded, dataset, prefixes, {}, opts));
    EXPECT_EQ(result, compacted);
}

TEST_F(FormatDispatcherTest, CompactWithPrefixedProperties)
{
    SerializationConfig config;
    config.prefer_prefixed_properties = true;
    Context expected_ctx = {{"ex:name", "http://example.org/name"},
                            {"ex", "http://example.org/"}};
    JsonValue compacted = {{"@context", expected_ctx}, {"ex:name", "Alice"}};
    EXPECT_CALL(transformer, compact(Eq(expanded), Eq(expected_ctx), _))
        .WillOnce(Return(E<JsonValue>(compacted)));

    FormatDispatcher d(transformer);
    ASSIGN_OR_FAIL(JsonValue result, d.dispatch(
        OutputForm::COMPACT, expanded, dataset, prefixes, config, opts));
    EXPECT_EQ(result, compacted);
}

TEST_F(FormatDispatcherTest, FlattenWithExplicitContext)
{
    SerializationConfig config;
    config.explicit_context = JsonValue{{"n", "http://example.org/name"}};
    JsonValue flattened = {{"@context", *config.explicit_context},
                           {"@graph", JsonValue::array()}};
    EXPECT_CALL(transformer,
                flatten(Eq(expanded), Eq(*config.explicit_context), _))
        .WillOnce(Return(E<JsonValue>(flattened)));

    FormatDispatcher d(transformer);
    ASSIGN_OR_FAIL(JsonValue result, d.dispatch(
        OutputForm::FLATTEN, expanded, dataset, prefixes, config, opts));
    EXPECT_EQ(result, flattened);
}

TEST_F(FormatDispatcherTest, ExplicitNullContextIsPassedOn)
{
    SerializationConfig config;
    config.explicit_context = JsonValue();
    EXPECT_CALL(transformer, compact(Eq(expanded), Eq(JsonValue()), _))
        .WillOnce(Return(E<JsonValue>(expanded)));

    FormatDispatcher d(transformer);
    ASSIGN_OR_FAIL(JsonValue result, d.dispatch(
        OutputForm::COMPACT, expanded, dataset, prefixes, config, opts));
    EXPECT_EQ(result, expanded);
}

TEST_F(FormatDispatcherTest, SubstitutesContext)
{
    SerializationConfig config;
    config.context_substitution = "http://example.org/context.jsonld";
    JsonValue compacted = {{"@id", "http://example.org/Alice"},
                           {"@context", {{"name", "http://example.org/name"}}},
                           {"name", "Alice"}};
    EXPECT_CALL(transformer, compact(_, _, _))
        .WillOnce(Return(E<JsonValue>(compacted)));

    FormatDispatcher d(transformer);
    ASSIGN_OR_FAIL(JsonValue result, d.dispatch(
        OutputForm::COMPACT, expanded, dataset, prefixes, config, opts));
    EXPECT_EQ(result.dump(),
              R"({"@id":"http://example.org/Alice",)"
              R"("@context":"http://example.org/context.jsonld",)"
              R"("name":"Alice"})");
}

TEST_F(FormatDispatcherTest, SubstitutesContextAfterFlatten)
{
    SerializationConfig config;
    config.context_substitution = "http://example.org/context.jsonld";
    JsonValue flattened = JsonValue::parse(
        R"({"@context": {"name": "http://example.org/name"},)"
        R"( "@graph": [{"@id": "http://example.org/Alice", "name": "Alice"}]})");
    EXPECT_CALL(transformer, flatten(Eq(expanded), _, _))
        .WillOnce(Return(E<JsonValue>(flattened)));

    FormatDispatcher d(transformer);
    ASSIGN_OR_FAIL(JsonValue result, d.dispatch(
        OutputForm::FLATTEN, expanded, dataset, prefixes, config, opts));
    EXPECT_EQ(result["@context"], "http://example.org/context.jsonld");
    EXPECT_EQ(result["@graph"], flattened["@graph"]);
    EXPECT_EQ(result.size(), 2);
}

TEST_F(FormatDispatcherTest, ExpandIgnoresContextSubstitution)
{
    SerializationConfig config;
    config.context_substitution = "http://example.org/context.jsonld";
    FormatDispatcher d(transformer);
    ASSIGN_OR_FAIL(JsonValue result, d.dispatch(
        OutputForm::EXPAND, expanded, dataset, prefixes, config, opts));
    EXPECT_EQ(result, expanded);
}

TEST_F(FormatDispatcherTest, FrameIgnoresContextSubstitution)
{
    SerializationConfig config;
    config.frame = JsonValue{{"@type", "http://example.org/Person"}};
    config.context_substitution = "http://example.org/context.jsonld";
    JsonValue framed = JsonValue::parse(
        R"({"@context": {"ex": "http://example.org/"}, "@graph": []})");
    EXPECT_CALL(transformer, frame(Eq(expanded), Eq(*config.frame), _))
        .WillOnce(Return(E<JsonValue>(framed)));

    FormatDispatcher d(transformer);
    ASSIGN_OR_FAIL(JsonValue result, d.dispatch(
        OutputForm::FRAME, expanded, dataset, prefixes, config, opts));
    EXPECT_EQ(result, framed);
    EXPECT_EQ(result["@context"]["ex"], "http://example.org/");
}

TEST_F(FormatDispatcherTest, FrameUsesConfiguredFrame)
{
    SerializationConfig config;
    config.frame = JsonValue{{"@type", "http://example.org/Person"}};
    JsonValue framed = {{"@graph", JsonValue::array()}};
    EXPECT_CALL(transformer, frame(Eq(expanded), Eq(*config.frame), _))
        .WillOnce(Return(E<JsonValue>(framed)));

    FormatDispatcher d(transformer);
    ASSIGN_OR_FAIL(JsonValue result, d.dispatch(
        OutputForm::FRAME, expanded, dataset, prefixes, config, opts));
    EXPECT_EQ(result, framed);
}

TEST_F(FormatDispatcherTest, FrameWithoutFrameFails)
{
    // The strict mock fails the test on any call.
    FormatDispatcher d(transformer);
    auto result = d.dispatch(OutputForm::FRAME, expanded, dataset, prefixes,
                             {}, opts);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(std::holds_alternative<ConfigurationError>(result.error()));
    EXPECT_EQ(errorMsg(result.error()),
              "No frame object found in configuration");
}

TEST_F(FormatDispatcherTest, UnexpectedFormFails)
{
    FormatDispatcher d(transformer);
    auto result = d.dispatch(static_cast<OutputForm>(42), expanded, dataset,
                             prefixes, {}, opts);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(std::holds_alternative<ConfigurationError>(result.error()));
}

TEST_F(FormatDispatcherTest, PropagatesTransformError)
{
    EXPECT_CALL(transformer, flatten(_, _, _))
        .WillOnce(Return(E<JsonValue>(std::unexpected(
            transformError("loading remote context failed")))));

    SerializationConfig config;
    config.context_substitution = "http://example.org/context.jsonld";
    FormatDispatcher d(transformer);
    auto result = d.dispatch(OutputForm::FLATTEN, expanded, dataset, prefixes,
                             config, opts);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(std::holds_alternative<TransformError>(result.error()));
    EXPECT_EQ(errorMsg(result.error()), "loading remote context failed");
}

TEST(SubstituteContext, ReplacesOnlyContext)
{
    JsonValue result = JsonValue::parse(
        R"({"@context": {"a": "http://a/"}, "@graph": [{"@id": "http://a/x"}]})");
    JsonValue before_graph = result["@graph"];
    JsonValue out = substituteContext(result, JsonValue("http://a/ctx"));
    EXPECT_EQ(out["@context"], "http://a/ctx");
    EXPECT_EQ(out["@graph"].dump(), before_graph.dump());
    EXPECT_EQ(out.size(), 2);
}

TEST(SubstituteContext, IgnoresOtherShapes)
{
    JsonValue no_context = {{"@id", "http://a/x"}};
    EXPECT_EQ(substituteContext(no_context, JsonValue("ctx")), no_context);

    JsonValue array = JsonValue::array({1, 2});
    EXPECT_EQ(substituteContext(array, JsonValue("ctx")), array);

    JsonValue with_context = {{"@context", "old"}};
    EXPECT_EQ(substituteContext(with_context, std::nullopt), with_context);
}
