//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_schema_registry.cpp
// Purpose: Descriptor parsing, paged discovery and argument validation
//==========================================================================================================

#include <gtest/gtest.h>

#include "lmcp/ProtocolClient.h"
#include "lmcp/SchemaRegistry.h"
#include "lmcp/errors/Errors.h"
#include "support/FakeToolServer.h"

using namespace lmcp;
using lmcp::testing::FakeToolServer;
using lmcp::testing::MakeToolJson;

namespace {

std::unique_ptr<ProtocolClient> readyClient(FakeToolServer& server) {
    ClientOptions o;
    o.handshakeTimeout = std::chrono::milliseconds(1000);
    o.requestTimeout = std::chrono::milliseconds(2000);
    o.readerPollInterval = std::chrono::milliseconds(10);
    auto client = std::make_unique<ProtocolClient>(server.TakeClientTransport(), o);
    client->Connect(LaunchDescriptor::FromCommandLine("fake-server"));
    client->Handshake();
    return client;
}

} // namespace

TEST(SchemaRegistryParse, InputSchemaForm) {
    ToolDescriptor d = SchemaRegistry::ParseToolDescriptor(ParseJSON(R"({
        "name": "search",
        "description": "Full text search",
        "inputSchema": {
            "type": "object",
            "properties": {
                "query": {"type": "string", "description": "terms"},
                "limit": {"type": "integer"}
            },
            "required": ["query"]
        }
    })"));
    EXPECT_EQ(d.name, "search");
    EXPECT_EQ(d.description, "Full text search");
    ASSERT_EQ(d.parameters.size(), 2u);
    EXPECT_TRUE(d.parameters.at("query").required);
    EXPECT_EQ(d.parameters.at("query").type, "string");
    EXPECT_EQ(d.parameters.at("query").description, "terms");
    EXPECT_FALSE(d.parameters.at("limit").required);
    EXPECT_EQ(d.RequiredParameters(), std::vector<std::string>{"query"});
    EXPECT_TRUE(d.inputSchema.isObject());
}

TEST(SchemaRegistryParse, FlatParametersForm) {
    ToolDescriptor d = SchemaRegistry::ParseToolDescriptor(ParseJSON(R"({
        "name": "copy",
        "parameters": {
            "src": {"type": "string", "required": true},
            "dst": {"type": "string", "required": true},
            "force": {"type": "boolean"}
        }
    })"));
    EXPECT_EQ(d.description, "");
    EXPECT_EQ(d.RequiredParameters(), (std::vector<std::string>{"dst", "src"}));
    const JSONValue* required = d.inputSchema.find("required");
    ASSERT_NE(required, nullptr);
    ASSERT_TRUE(required->isArray());
    EXPECT_EQ(std::get<JSONValue::Array>(required->value).size(), 2u);
}

TEST(SchemaRegistryParse, RequiredNameWithoutPropertyIsStillRequired) {
    ToolDescriptor d = SchemaRegistry::ParseToolDescriptor(ParseJSON(
        R"({"name":"t","inputSchema":{"type":"object","required":["id"]}})"));
    ASSERT_EQ(d.parameters.count("id"), 1u);
    EXPECT_TRUE(d.parameters.at("id").required);
    EXPECT_EQ(d.parameters.at("id").type, "");
}

TEST(SchemaRegistryParse, ToolWithoutParameters) {
    ToolDescriptor d = SchemaRegistry::ParseToolDescriptor(ParseJSON(R"({"name":"now"})"));
    EXPECT_TRUE(d.parameters.empty());
    EXPECT_TRUE(d.RequiredParameters().empty());
}

TEST(SchemaRegistryParse, MalformedEntriesRaiseDiscoveryError) {
    const char* bad[] = {
        R"("just a string")",
        R"({"description":"no name"})",
        R"({"name":""})",
        R"({"name":42})",
        R"({"name":"t","inputSchema":"object"})",
        R"({"name":"t","inputSchema":{"properties":[]}})",
        R"({"name":"t","inputSchema":{"required":"a"}})",
        R"({"name":"t","inputSchema":{"required":[1]}})",
        R"({"name":"t","inputSchema":{"properties":{"a":5}}})",
        R"({"name":"t","parameters":[]})",
    };
    for (const char* text : bad) {
        EXPECT_THROW(SchemaRegistry::ParseToolDescriptor(ParseJSON(text)), errors::DiscoveryError) << text;
    }
}

TEST(SchemaRegistryParse, DiscoveryErrorCarriesEntry) {
    try {
        SchemaRegistry::ParseToolDescriptor(ParseJSON(R"({"description":"no name"})"));
        FAIL() << "expected DiscoveryError";
    } catch (const errors::DiscoveryError& e) {
        ASSERT_TRUE(e.Payload().has_value());
        EXPECT_EQ(GetString(*e.Payload(), "description"), std::optional<std::string>("no name"));
    }
}

TEST(SchemaRegistryParse, ResourceDescriptor) {
    ResourceDescriptor r = SchemaRegistry::ParseResourceDescriptor(
        ParseJSON(R"({"uri":"file:///a.txt","mimeType":"text/plain"})"));
    EXPECT_EQ(r.uri, "file:///a.txt");
    EXPECT_EQ(r.name, "file:///a.txt");
    EXPECT_EQ(r.mimeType, std::optional<std::string>("text/plain"));
    EXPECT_FALSE(r.description.has_value());
    EXPECT_THROW(SchemaRegistry::ParseResourceDescriptor(ParseJSON(R"({"name":"x"})")), errors::DiscoveryError);
}

TEST(SchemaRegistryValidate, StrictReportsFirstMissingParameter) {
    ToolDescriptor d = SchemaRegistry::ParseToolDescriptor(MakeToolJson("move", {"to", "from"}, {"mode"}));
    try {
        SchemaRegistry::ValidateArguments(d, MakeObject({{"to", JSONValue("x")}}), validation::ValidationMode::Strict);
        FAIL() << "expected MissingParameterError";
    } catch (const errors::MissingParameterError& e) {
        EXPECT_EQ(e.ToolName(), "move");
        EXPECT_EQ(e.Parameter(), "from");
    }
    EXPECT_NO_THROW(SchemaRegistry::ValidateArguments(
        d, MakeObject({{"to", JSONValue("x")}, {"from", JSONValue("y")}, {"extra", JSONValue(1)}}),
        validation::ValidationMode::Strict));
}

TEST(SchemaRegistryValidate, OffModeLetsMissingParametersThrough) {
    ToolDescriptor d = SchemaRegistry::ParseToolDescriptor(MakeToolJson("move", {"to", "from"}));
    EXPECT_NO_THROW(SchemaRegistry::ValidateArguments(d, MakeObject(), validation::ValidationMode::Off));
}

TEST(SchemaRegistryValidate, NonObjectArgumentsAreRejected) {
    ToolDescriptor d = SchemaRegistry::ParseToolDescriptor(MakeToolJson("t"));
    EXPECT_THROW(SchemaRegistry::ValidateArguments(d, MakeArray(), validation::ValidationMode::Strict),
                 errors::ValidationError);
    EXPECT_THROW(SchemaRegistry::ValidateArguments(d, JSONValue(), validation::ValidationMode::Off),
                 errors::ValidationError);
}

TEST(ValidationMode, ParseAcceptsAliases) {
    EXPECT_EQ(validation::parseMode("STRICT"), validation::ValidationMode::Strict);
    EXPECT_EQ(validation::parseMode("off"), validation::ValidationMode::Off);
    EXPECT_EQ(validation::parseMode("Lenient"), validation::ValidationMode::Off);
    EXPECT_FALSE(validation::parseMode("sometimes").has_value());
}

TEST(SchemaRegistryDiscovery, CachesToolsInServerOrder) {
    FakeToolServer server;
    server.SetTools(MakeArray({MakeToolJson("zeta", {"a"}), MakeToolJson("alpha")}));
    auto client = readyClient(server);

    SchemaRegistry registry;
    EXPECT_FALSE(registry.HasTools());
    auto tools = registry.DiscoverTools(*client);
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].name, "zeta");
    EXPECT_EQ(tools[1].name, "alpha");
    EXPECT_TRUE(registry.HasTools());
    ASSERT_TRUE(registry.GetTool("zeta").has_value());
    EXPECT_EQ(registry.GetTool("zeta")->RequiredParameters(), std::vector<std::string>{"a"});
    EXPECT_FALSE(registry.GetTool("missing").has_value());

    registry.Invalidate();
    EXPECT_FALSE(registry.HasTools());
    EXPECT_TRUE(registry.Tools().empty());
}

TEST(SchemaRegistryDiscovery, EmptyToolListIsCached) {
    FakeToolServer server;
    auto client = readyClient(server);
    SchemaRegistry registry;
    EXPECT_TRUE(registry.DiscoverTools(*client).empty());
    EXPECT_TRUE(registry.HasTools());
}

TEST(SchemaRegistryDiscovery, FollowsCursorAcrossPages) {
    FakeToolServer server;
    server.On(Methods::ListTools, [](const JSONRPCRequest& req) {
        auto cursor = req.params ? GetString(*req.params, "cursor") : std::nullopt;
        if (!cursor) {
            return MakeObject({{"tools", MakeArray({MakeToolJson("one")})}, {"nextCursor", JSONValue("p2")}});
        }
        if (*cursor == "p2") {
            return MakeObject({{"tools", MakeArray({MakeToolJson("two")})}, {"nextCursor", JSONValue("p3")}});
        }
        return MakeObject({{"tools", MakeArray({MakeToolJson("three")})}});
    });
    auto client = readyClient(server);

    SchemaRegistry registry;
    auto tools = registry.DiscoverTools(*client);
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(tools[2].name, "three");
    EXPECT_EQ(server.Count(Methods::ListTools), 3);
}

TEST(SchemaRegistryDiscovery, RepeatedCursorFails) {
    FakeToolServer server;
    server.On(Methods::ListTools, [](const JSONRPCRequest&) {
        return MakeObject({{"tools", MakeArray()}, {"nextCursor", JSONValue("again")}});
    });
    auto client = readyClient(server);
    SchemaRegistry registry;
    EXPECT_THROW(registry.DiscoverTools(*client), errors::DiscoveryError);
    EXPECT_EQ(server.Count(Methods::ListTools), 2);
    EXPECT_FALSE(registry.HasTools());
}

TEST(SchemaRegistryDiscovery, DuplicateNamesLeaveCacheUntouched) {
    FakeToolServer server;
    server.SetTools(MakeArray({MakeToolJson("only")}));
    auto client = readyClient(server);
    SchemaRegistry registry;
    registry.DiscoverTools(*client);

    server.SetTools(MakeArray({MakeToolJson("dup"), MakeToolJson("dup")}));
    EXPECT_THROW(registry.DiscoverTools(*client), errors::DiscoveryError);
    ASSERT_EQ(registry.Tools().size(), 1u);
    EXPECT_EQ(registry.Tools()[0].name, "only");
}

TEST(SchemaRegistryDiscovery, ResultWithoutToolsArrayFails) {
    FakeToolServer server;
    server.On(Methods::ListTools, [](const JSONRPCRequest&) { return MakeObject({{"items", MakeArray()}}); });
    auto client = readyClient(server);
    SchemaRegistry registry;
    EXPECT_THROW(registry.DiscoverTools(*client), errors::DiscoveryError);
}

TEST(SchemaRegistryDiscovery, ServerErrorPropagates) {
    FakeToolServer server;
    server.On(Methods::ListTools, [](const JSONRPCRequest&) -> JSONValue {
        throw errors::ProtocolError(JSONRPCErrorCodes::InternalError, "index unavailable");
    });
    auto client = readyClient(server);
    SchemaRegistry registry;
    EXPECT_THROW(registry.DiscoverTools(*client), errors::ProtocolError);
}

TEST(SchemaRegistryDiscovery, Resources) {
    FakeToolServer server;
    server.On(Methods::ListResources, [](const JSONRPCRequest&) {
        return MakeObject({{"resources", MakeArray({
            MakeObject({{"uri", JSONValue("memo://a")}, {"name", JSONValue("a")}}),
            MakeObject({{"uri", JSONValue("memo://b")}, {"description", JSONValue("second")}})
        })}});
    });
    auto client = readyClient(server);
    SchemaRegistry registry;
    auto resources = registry.DiscoverResources(*client);
    ASSERT_EQ(resources.size(), 2u);
    EXPECT_EQ(resources[1].name, "memo://b");
    ASSERT_TRUE(registry.GetResource("memo://a").has_value());
    EXPECT_EQ(registry.GetResource("memo://a")->name, "a");
    EXPECT_EQ(registry.GetResource("memo://b")->description, std::optional<std::string>("second"));
}

TEST(SchemaRegistryDiscovery, AcceptsBareArrayOfFlatEntries) {
    FakeToolServer server;
    server.On(Methods::ListTools, [](const JSONRPCRequest&) {
        return ParseJSON(R"([{"name":"ls","parameters":{"path":{"type":"string","required":true}}}])");
    });
    auto client = readyClient(server);
    SchemaRegistry registry;
    auto tools = registry.DiscoverTools(*client);
    ASSERT_EQ(tools.size(), 1u);
    EXPECT_EQ(tools[0].RequiredParameters(), std::vector<std::string>{"path"});
}
