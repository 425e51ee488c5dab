//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json.cpp
// Purpose: Tests for the JSON value model, parser/serializer and JSON-RPC envelopes
//==========================================================================================================

#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>
#include <string>

#include "mcpgw/JSONRPCTypes.h"

using namespace mcpgw;

TEST(JsonParse, ScalarsAndContainers) {
    JSONValue v = ParseJSON(" {\"a\": [1, 2.5, \"x\", true, null], \"b\": {\"c\": -7}} ");
    ASSERT_TRUE(v.isObject());
    const JSONValue* a = FindField(v, "a");
    ASSERT_NE(a, nullptr);
    ASSERT_TRUE(a->isArray());
    const auto& arr = std::get<JSONValue::Array>(a->value);
    ASSERT_EQ(arr.size(), 5u);
    EXPECT_EQ(std::get<int64_t>(arr[0]->value), 1);
    EXPECT_DOUBLE_EQ(std::get<double>(arr[1]->value), 2.5);
    EXPECT_EQ(std::get<std::string>(arr[2]->value), "x");
    EXPECT_TRUE(std::get<bool>(arr[3]->value));
    EXPECT_TRUE(arr[4]->isNull());
    EXPECT_EQ(GetIntField(*FindField(v, "b"), "c"), -7);
}

TEST(JsonParse, StringEscapesAndUnicode) {
    JSONValue v = ParseJSON("\"tab\\t quote\\\" slash\\/ e\\u00e9 smile\\ud83d\\ude00\"");
    EXPECT_EQ(std::get<std::string>(v.value), "tab\t quote\" slash/ e\xC3\xA9 smile\xF0\x9F\x98\x80");
}

TEST(JsonParse, MalformedInputThrows) {
    EXPECT_THROW(ParseJSON("{"), std::runtime_error);
    EXPECT_THROW(ParseJSON("{\"a\" 1}"), std::runtime_error);
    EXPECT_THROW(ParseJSON("[1,]"), std::runtime_error);
    EXPECT_THROW(ParseJSON("{} extra"), std::runtime_error);
    EXPECT_THROW(ParseJSON("\"\\ud83d\""), std::runtime_error);
    EXPECT_THROW(ParseJSON(""), std::runtime_error);
    EXPECT_THROW(ParseJSON(std::string(300, '[') + std::string(300, ']')), std::runtime_error);
}

TEST(JsonParse, HugeIntegerDegradesToDouble) {
    JSONValue v = ParseJSON("123456789012345678901234567890");
    EXPECT_TRUE(std::holds_alternative<double>(v.value));
}

TEST(JsonSerialize, EscapesControlCharacters) {
    JSONValue::Object obj;
    SetField(obj, "k", JSONValue(std::string("line\nnext\x01")));
    EXPECT_EQ(SerializeJSON(JSONValue(obj)), "{\"k\":\"line\\nnext\\u0001\"}");
}

TEST(JsonSerialize, NonFiniteDoubleIsNull) {
    EXPECT_EQ(SerializeJSON(JSONValue(std::numeric_limits<double>::infinity())), "null");
    EXPECT_EQ(SerializeJSON(JSONValue(0.5)), "0.5");
}

TEST(JsonFields, AccessorsIgnoreWrongTypes) {
    JSONValue v = ParseJSON("{\"s\":\"x\",\"n\":3,\"f\":1.5}");
    EXPECT_EQ(GetStringField(v, "s"), std::optional<std::string>("x"));
    EXPECT_FALSE(GetStringField(v, "n").has_value());
    EXPECT_FALSE(GetIntField(v, "f").has_value());
    EXPECT_EQ(FindField(v, "missing"), nullptr);
    EXPECT_EQ(FindField(JSONValue(static_cast<int64_t>(1)), "s"), nullptr);
}

TEST(JsonRpc, RequestRoundTripKeepsIdType) {
    JSONValue::Object params;
    SetField(params, "name", JSONValue("echo"));
    JSONRPCRequest req(static_cast<int64_t>(7), "tools/call", JSONValue(params));

    JSONRPCRequest parsed;
    ASSERT_TRUE(parsed.Deserialize(req.Serialize()));
    ASSERT_TRUE(std::holds_alternative<int64_t>(parsed.id));
    EXPECT_EQ(std::get<int64_t>(parsed.id), 7);
    EXPECT_EQ(parsed.method, "tools/call");
    ASSERT_TRUE(parsed.params.has_value());
    EXPECT_EQ(GetStringField(*parsed.params, "name"), std::optional<std::string>("echo"));
}

TEST(JsonRpc, RequestWithoutIdIsNotARequest) {
    JSONRPCRequest parsed;
    EXPECT_FALSE(parsed.Deserialize("{\"jsonrpc\":\"2.0\",\"method\":\"ping\"}"));
    EXPECT_FALSE(parsed.Deserialize("{\"jsonrpc\":\"2.0\",\"id\":{},\"method\":\"ping\"}"));
    EXPECT_FALSE(parsed.Deserialize("[]"));
}

TEST(JsonRpc, ErrorResponseShape) {
    auto resp = CreateErrorResponse(std::string("r1"), JSONRPCErrorCodes::SessionExpired, "Session expired");
    JSONValue v = ParseJSON(resp->Serialize());
    EXPECT_EQ(GetStringField(v, "id"), std::optional<std::string>("r1"));
    const JSONValue* err = FindField(v, "error");
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(GetIntField(*err, "code"), JSONRPCErrorCodes::SessionExpired);
    EXPECT_EQ(GetStringField(*err, "message"), std::optional<std::string>("Session expired"));
    EXPECT_EQ(FindField(v, "result"), nullptr);
}

TEST(JsonRpc, NullIdSerializesAsNull) {
    auto resp = CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError, "Parse error");
    JSONValue v = ParseJSON(resp->Serialize());
    const JSONValue* id = FindField(v, "id");
    ASSERT_NE(id, nullptr);
    EXPECT_TRUE(id->isNull());
    EXPECT_EQ(IdToString(resp->id), "");
}

TEST(JsonRpc, ToValueCarriesEnvelope) {
    JSONRPCResponse resp(std::string("a"), JSONValue(true));
    JSONValue v = resp.ToValue();
    EXPECT_EQ(GetStringField(v, "jsonrpc"), std::optional<std::string>("2.0"));
    EXPECT_EQ(GetStringField(v, "id"), std::optional<std::string>("a"));
    const JSONValue* result = FindField(v, "result");
    ASSERT_NE(result, nullptr);
    EXPECT_TRUE(std::get<bool>(result->value));
}
