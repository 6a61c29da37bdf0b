/*
 * Unit tests for typed tool calls
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <catch2/catch.hpp>
#include "ILanguageModel.hpp"
#include "TestHelpers.hpp"

#include <memory>
#include <string>

namespace {

struct WeatherQuery {
    std::string city;
    int days{0};

    static std::string name() { return "weather_query"; }
    static std::string description() { return "Extract the city and forecast length"; }

    static Json::Value schema()
    {
        return parse_json(R"({
            "type": "object",
            "properties": {
                "city": {"type": "string"},
                "days": {"type": "integer"}
            },
            "required": ["city", "days"]
        })").value();
    }

    static WeatherQuery from_json(const Json::Value& value)
    {
        return WeatherQuery{value["city"].asString(), value["days"].asInt()};
    }
};

class ToolUnsupportedModel : public FakeLanguageModel {
public:
    ToolUnsupportedModel() : FakeLanguageModel("plain", "fake") {}

    std::future<Json::Value> use_any_tool(LanguageModelRequest /*request*/,
                                          std::string /*tool_name*/,
                                          std::string /*tool_description*/,
                                          Json::Value /*schema*/) const override
    {
        std::promise<Json::Value> result;
        result.set_exception(std::make_exception_ptr(
            LlmError(LlmErrorCode::UnsupportedOperation, "no tool support")));
        return result.get_future();
    }
};

LanguageModelRequest weather_request()
{
    LanguageModelRequest request;
    request.messages.push_back({Role::User, "What's the weather in Oslo for the next 3 days?"});
    return request;
}

} // namespace

TEST_CASE("use_tool returns the typed result and passes the tool definition through") {
    FakeLanguageModel model("llama3", "fake");
    model.tool_result = parse_json(R"({"city": "Oslo", "days": 3})").value();

    const WeatherQuery query = use_tool<WeatherQuery>(model, weather_request()).get();

    REQUIRE(query.city == "Oslo");
    REQUIRE(query.days == 3);
    REQUIRE(model.last_tool_name() == "weather_query");
    REQUIRE(model.last_tool_schema() == WeatherQuery::schema());
}

TEST_CASE("use_tool rejects output that violates the schema") {
    FakeLanguageModel model("llama3", "fake");
    model.tool_result = parse_json(R"({"city": "Oslo", "days": "three"})").value();

    try {
        use_tool<WeatherQuery>(model, weather_request()).get();
        FAIL("expected an LlmError");
    } catch (const LlmError& ex) {
        REQUIRE(ex.code() == LlmErrorCode::SchemaViolation);
        REQUIRE(std::string(ex.what()).find("$.days") != std::string::npos);
    }
}

TEST_CASE("use_tool propagates unsupported tool calling") {
    ToolUnsupportedModel model;

    auto pending = use_tool<WeatherQuery>(model, weather_request());
    try {
        pending.get();
        FAIL("expected an LlmError");
    } catch (const LlmError& ex) {
        REQUIRE(ex.code() == LlmErrorCode::UnsupportedOperation);
    }
}
