// SPDX-License-Identifier: Apache-2.0
#include <llm/OpenAiProvider.hpp>

#include <httplib.h>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <format>
#include <thread>

using namespace zesbe;

namespace
{

/// @brief A local HTTP server on an ephemeral port, stopped on destruction.
class TestServer
{
  public:
    httplib::Server server;

    void start()
    {
        _port = server.bind_to_any_port("127.0.0.1");
        _thread = std::thread([this] { server.listen_after_bind(); });
        server.wait_until_ready();
    }

    ~TestServer()
    {
        server.stop();
        if (_thread.joinable())
            _thread.join();
    }

    [[nodiscard]] auto port() const -> int { return _port; }
    [[nodiscard]] auto baseUrl() const -> std::string { return std::format("http://127.0.0.1:{}/v1", _port); }

  private:
    int _port = 0;
    std::thread _thread;
};

auto drain(EventStream& stream) -> std::vector<StreamEvent>
{
    auto events = std::vector<StreamEvent> {};
    while (auto event = stream.next())
        events.push_back(std::move(*event));
    return events;
}

auto simpleRequest() -> ChatRequest
{
    auto request = ChatRequest {};
    request.messages = { Message { .role = Role::User, .content = "hello" } };
    return request;
}

auto sseFrame(const nlohmann::json& frame) -> std::string
{
    return std::format("data: {}\n\n", frame.dump());
}

} // namespace

TEST_CASE("splitBaseUrl separates origin and path prefix", "[openai]")
{
    CHECK(splitBaseUrl("https://api.openai.com/v1")
          == BaseUrl { .origin = "https://api.openai.com", .pathPrefix = "/v1" });
    CHECK(splitBaseUrl("http://localhost:11434/v1/")
          == BaseUrl { .origin = "http://localhost:11434", .pathPrefix = "/v1" });
    CHECK(splitBaseUrl("https://openrouter.ai/api/v1")
          == BaseUrl { .origin = "https://openrouter.ai", .pathPrefix = "/api/v1" });
    CHECK(splitBaseUrl("http://127.0.0.1:8080") == BaseUrl { .origin = "http://127.0.0.1:8080", .pathPrefix = "" });
    CHECK(splitBaseUrl("http://host//") == BaseUrl { .origin = "http://host", .pathPrefix = "" });
}

TEST_CASE("splitBaseUrl rejects unusable URLs", "[openai]")
{
    CHECK(splitBaseUrl("api.openai.com/v1").error().code == ErrorCode::InvalidArgument);
    CHECK(splitBaseUrl("ftp://example.com").error().code == ErrorCode::InvalidArgument);
    CHECK(splitBaseUrl("https:///v1").error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("OpenAiProvider create validates the base URL", "[openai]")
{
    auto const bad = OpenAiProvider::create(OpenAiProviderConfig { .baseUrl = "not a url" });
    REQUIRE(!bad.has_value());
    CHECK(bad.error().code == ErrorCode::InvalidArgument);

    auto const good = OpenAiProvider::create(
        OpenAiProviderConfig { .baseUrl = "https://api.deepseek.com/v1", .apiKey = "", .defaultModel = "deepseek-chat" });
    REQUIRE(good.has_value());
    CHECK((*good)->defaultModel() == "deepseek-chat");
    CHECK((*good)->endpoint().pathPrefix == "/v1");
}

TEST_CASE("OpenAiProvider streams text and tool calls from the endpoint", "[openai][http]")
{
    auto received = nlohmann::json {};
    auto authorization = std::string {};
    auto accept = std::string {};

    auto server = TestServer {};
    server.server.Post("/v1/chat/completions", [&](const httplib::Request& req, httplib::Response& res) {
        received = nlohmann::json::parse(req.body);
        authorization = req.get_header_value("Authorization");
        accept = req.get_header_value("Accept");

        auto body = std::string {};
        body += sseFrame({ { "choices", { { { "delta", { { "content", "Reading " } } } } } } });
        body += sseFrame({ { "choices", { { { "delta", { { "content", "now." } } } } } } });
        body += sseFrame({ { "choices",
                             { { { "delta",
                                   { { "tool_calls",
                                       { { { "index", 0 },
                                           { "id", "call_7" },
                                           { "function", { { "name", "read_file" }, { "arguments", "{\"pa" } } } } } } } } } } } });
        body += sseFrame({ { "choices",
                             { { { "delta",
                                   { { "tool_calls",
                                       { { { "index", 0 }, { "function", { { "arguments", "th\":\"a.txt\"}" } } } } } } } },
                                 { "finish_reason", "tool_calls" } } } } });
        body += "data: [DONE]\n\n";
        res.set_content(body, "text/event-stream");
    });
    server.start();

    auto provider = OpenAiProvider::create(
        OpenAiProviderConfig { .baseUrl = server.baseUrl(), .apiKey = "sk-test", .defaultModel = "test-model" });
    REQUIRE(provider.has_value());

    auto request = simpleRequest();
    request.tools = { ToolDefinition { .name = "read_file", .description = "Read a file", .parameters = {} } };

    auto stream = (*provider)->chatStream(request);
    auto const events = drain(*stream);

    REQUIRE(events.size() == 4);
    CHECK(std::get<TextFragment>(events[0]).text == "Reading ");
    CHECK(std::get<TextFragment>(events[1]).text == "now.");
    auto const& call = std::get<ToolCallEvent>(events[2]).call;
    CHECK(call.id == "call_7");
    CHECK(call.name == "read_file");
    CHECK(call.arguments == nlohmann::json { { "path", "a.txt" } });
    CHECK(std::holds_alternative<StreamDone>(events[3]));

    CHECK(received["model"] == "test-model");
    CHECK(received["stream"] == true);
    CHECK(received["messages"][0]["content"] == "hello");
    CHECK(received["tools"][0]["function"]["name"] == "read_file");
    CHECK(authorization == "Bearer sk-test");
    CHECK(accept == "text/event-stream");
}

TEST_CASE("OpenAiProvider reports a non-2xx status as an endpoint error", "[openai][http]")
{
    auto authorization = std::string { "unset" };

    auto server = TestServer {};
    server.server.Post("/v1/chat/completions", [&](const httplib::Request& req, httplib::Response& res) {
        authorization = req.get_header_value("Authorization");
        res.status = 401;
        res.set_content(R"({"error":{"message":"invalid api key"}})", "application/json");
    });
    server.start();

    auto provider = OpenAiProvider::create(OpenAiProviderConfig { .baseUrl = server.baseUrl() });
    REQUIRE(provider.has_value());

    auto stream = (*provider)->chatStream(simpleRequest());
    auto const events = drain(*stream);

    REQUIRE(events.size() == 1);
    auto const& error = std::get<StreamError>(events[0]).error;
    CHECK(error.code == ErrorCode::EndpointError);
    CHECK(error.httpStatus == 401);
    CHECK(error.message.find("invalid api key") != std::string::npos);
    CHECK(authorization.empty());
}

TEST_CASE("OpenAiProvider chat returns a complete response", "[openai][http]")
{
    auto streamFlag = nlohmann::json {};

    auto server = TestServer {};
    server.server.Post("/v1/chat/completions", [&](const httplib::Request& req, httplib::Response& res) {
        streamFlag = nlohmann::json::parse(req.body)["stream"];
        res.set_content(R"({"id":"r1","model":"m","choices":[{"message":{"role":"assistant","content":"Hi!"},)"
                        R"("finish_reason":"stop"}],"usage":{"prompt_tokens":3,"completion_tokens":2,"total_tokens":5}})",
                        "application/json");
    });
    server.start();

    auto provider = OpenAiProvider::create(OpenAiProviderConfig { .baseUrl = server.baseUrl() });
    REQUIRE(provider.has_value());

    auto response = (*provider)->chat(simpleRequest());
    REQUIRE(response.has_value());
    CHECK(response->content == "Hi!");
    CHECK(response->finishReason == FinishReason::Stop);
    CHECK(!response->hasToolCalls());
    REQUIRE(response->usage.has_value());
    CHECK(response->usage->totalTokens == 5);
    CHECK(streamFlag == false);
}

TEST_CASE("OpenAiProvider chat reports endpoint errors with their status", "[openai][http]")
{
    auto server = TestServer {};
    server.server.Post("/v1/chat/completions", [](const httplib::Request&, httplib::Response& res) {
        res.status = 503;
        res.set_content("overloaded", "text/plain");
    });
    server.start();

    auto provider = OpenAiProvider::create(OpenAiProviderConfig { .baseUrl = server.baseUrl() });
    REQUIRE(provider.has_value());

    auto response = (*provider)->chat(simpleRequest());
    REQUIRE(!response.has_value());
    CHECK(response.error().code == ErrorCode::EndpointError);
    CHECK(response.error().httpStatus == 503);
    CHECK(response.error().message == "overloaded");
}

TEST_CASE("OpenAiProvider reports an unreachable endpoint as a transport error", "[openai][http]")
{
    // Run a server once, then stop it so nothing listens on its port.
    auto port = 0;
    {
        auto probe = TestServer {};
        probe.start();
        port = probe.port();
    }

    auto provider = OpenAiProvider::create(OpenAiProviderConfig {
        .baseUrl = std::format("http://127.0.0.1:{}/v1", port),
        .apiKey = "",
        .defaultModel = "m",
        .connectTimeout = std::chrono::seconds(2),
    });
    REQUIRE(provider.has_value());

    auto stream = (*provider)->chatStream(simpleRequest());
    auto const events = drain(*stream);

    REQUIRE(events.size() == 1);
    CHECK(std::get<StreamError>(events[0]).error.code == ErrorCode::TransportError);
}

TEST_CASE("OpenAiProvider stream can be cancelled while the endpoint is silent", "[openai][http]")
{
    auto release = std::atomic<bool> { false };

    auto server = TestServer {};
    server.server.Post("/v1/chat/completions", [&](const httplib::Request&, httplib::Response& res) {
        res.set_chunked_content_provider("text/event-stream", [&](size_t, httplib::DataSink& sink) {
            auto const frame = sseFrame({ { "choices", { { { "delta", { { "content", "thinking" } } } } } } });
            sink.write(frame.data(), frame.size());
            for (auto i = 0; i < 500 && !release.load(); ++i)
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            sink.done();
            return true;
        });
    });
    server.start();

    auto provider = OpenAiProvider::create(OpenAiProviderConfig { .baseUrl = server.baseUrl() });
    REQUIRE(provider.has_value());

    auto stream = (*provider)->chatStream(simpleRequest());

    auto first = stream->next();
    REQUIRE(first.has_value());
    CHECK(std::get<TextFragment>(*first).text == "thinking");

    auto const started = std::chrono::steady_clock::now();
    stream->cancel();
    auto last = stream->next();
    auto const elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(last.has_value());
    CHECK(std::get<StreamError>(*last).error.code == ErrorCode::Cancelled);
    CHECK(elapsed < std::chrono::seconds(3));

    release.store(true);
}

TEST_CASE("OpenAiProvider sends tool output that is not valid UTF-8", "[openai][http]")
{
    auto contents = std::vector<nlohmann::json> {};

    auto server = TestServer {};
    server.server.Post("/v1/chat/completions", [&](const httplib::Request& req, httplib::Response& res) {
        auto const body = nlohmann::json::parse(req.body);
        contents.push_back(body["messages"]);
        if (body["stream"] == true)
        {
            res.set_content(sseFrame({ { "choices", { { { "delta", { { "content", "ok" } } } } } } }) + "data: [DONE]\n\n",
                            "text/event-stream");
        }
        else
        {
            res.set_content(R"({"choices":[{"message":{"role":"assistant","content":"ok"},"finish_reason":"stop"}]})",
                            "application/json");
        }
    });
    server.start();

    auto provider = OpenAiProvider::create(OpenAiProviderConfig { .baseUrl = server.baseUrl() });
    REQUIRE(provider.has_value());

    auto request = ChatRequest {};
    request.messages = {
        Message { .role = Role::User, .content = "caf\xe9?" },
        Message { .role = Role::Assistant,
                  .content = "",
                  .toolCalls = { ToolCallRequest { .id = "c1", .name = "read_file", .arguments = { { "path", "x" } } } } },
        Message { .role = Role::Tool, .content = "abc\xff", .toolCallId = "c1" },
        Message { .role = Role::Tool, .content = "price: \xe2\x82", .toolCallId = "c1" },
    };

    auto stream = (*provider)->chatStream(request);
    auto const events = drain(*stream);
    REQUIRE(events.size() == 2);
    CHECK(std::get<TextFragment>(events[0]).text == "ok");
    CHECK(std::holds_alternative<StreamDone>(events[1]));

    auto const response = (*provider)->chat(request);
    REQUIRE(response.has_value());
    CHECK(response->content == "ok");

    REQUIRE(contents.size() == 2);
    for (const auto& messages: contents)
    {
        CHECK(messages[0]["content"] == "caf\xef\xbf\xbd?");
        CHECK(messages[2]["content"] == "abc\xef\xbf\xbd");
        CHECK(messages[3]["content"].get<std::string>().starts_with("price: "));
    }
}
