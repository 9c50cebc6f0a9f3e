#include <catch2/catch.hpp>

#include <memory>
#include <string>
#include <vector>

#include <shuttle/body.hpp>
#include <shuttle/client.hpp>
#include <shuttle/curl_transport.hpp>
#include <shuttle/exceptions.hpp>
#include <shuttle/logging_middleware.hpp>
#include <shuttle/scripted_transport.hpp>
#include <shuttle/transport_factory.hpp>

namespace {

// Appends its name to a shared trace on the way in and on the way out
class TracingMiddleware : public Middleware {
public:
    TracingMiddleware(std::string name, std::vector<std::string>& trace)
        : name_{std::move(name)}, trace_{trace}
    {
    }

    auto process(Request const& request, Next const& next) -> Response override
    {
        trace_.push_back(">" + name_);
        auto response = next(request.withAddedHeader("X-Trace", name_));
        trace_.push_back("<" + name_);
        return response.withAddedHeader("X-Trace", name_);
    }

private:
    std::string name_;
    std::vector<std::string>& trace_;
};

class ShortCircuitMiddleware : public Middleware {
public:
    auto process(Request const&, Next const&) -> Response override
    {
        return Response{204};
    }
};

// Answers 401 itself unless the request carries an API key
class ApiKeyMiddleware : public Middleware {
public:
    auto process(Request const& request, Next const& next) -> Response override
    {
        if (!request.hasHeader("X-Api-Key")) {
            return Response{401};
        }
        return next(request);
    }
};

auto makeScripted(std::vector<ScriptedTransport::Entry> entries)
{
    return std::make_shared<ScriptedTransport>(std::move(entries));
}

// Answers with the request it received, so tests can look at it
auto makeEcho()
{
    auto transport = std::make_shared<ScriptedTransport>();
    for (int i = 0; i < 4; ++i) {
        transport->enqueue([](Request const& request) {
            auto response = Response{200}
                .withHeader("X-Method", request.method())
                .withHeader("X-Url", request.url().toAbsoluteString())
                .withHeader("X-Version", toString(request.version()));
            for (auto const& header : request.headers()) {
                for (auto const& value : header.values) {
                    response = response.withAddedHeader("Echo-" + header.name, value);
                }
            }
            return response;
        });
    }
    return transport;
}

}  // namespace

TEST_CASE("Client/default handler", "[client]") {
    Client const client;

    REQUIRE(client.handler());
    REQUIRE(std::dynamic_pointer_cast<CurlTransport>(client.handler()));
    REQUIRE(client.config().httpVersion() == HttpVersion::VERSION_1_1);
    REQUIRE_FALSE(client.config().baseUrl());
}

TEST_CASE("Client/scripted responses", "[client]") {
    auto const transport = makeScripted({
        Response{200, std::make_shared<BufferStream>("OK"), Headers{{"Content-Type", "text/plain"}}},
        Response{201, std::make_shared<BufferStream>("Created")},
    });
    Client client{ClientConfig::Builder{}.handler(transport).build()};

    auto const first = client.get("http://example.com");
    REQUIRE(first.statusCode() == 200);
    REQUIRE(first.body()->getContents() == "OK");
    REQUIRE(first.headerLine("Content-Type") == "text/plain");

    auto const second = client.post("http://example.com", std::make_shared<BufferBody>("foo"));
    REQUIRE(second.statusCode() == 201);
    REQUIRE(second.body()->getContents() == "Created");

    REQUIRE(transport->remaining() == 0);
    REQUIRE_THROWS_AS(client.get("http://example.com"), QueueExhaustedError);
}

TEST_CASE("Client/configuration errors", "[client]") {

    SECTION("null handler") {
        REQUIRE_THROWS_AS(Client{ClientConfig::Builder{}.handler(nullptr).build()}, ConfigurationError);
    }

    SECTION("unknown handler name") {
        REQUIRE_THROWS_AS(Client{ClientConfig::Builder{}.handlerName("carrier-pigeon").build()}, ConfigurationError);
    }

    SECTION("null middleware") {
        auto const config = ClientConfig::Builder{}
            .handler(std::make_shared<ScriptedTransport>())
            .middleware(nullptr)
            .build();
        REQUIRE_THROWS_AS(Client{config}, ConfigurationError);
    }

    SECTION("unknown version") {
        REQUIRE_THROWS_AS(ClientConfig::Builder{}.httpVersion("0.9"), UnknownVersionError);
    }
}

TEST_CASE("Client/handler by name", "[client]") {
    auto const transport = makeScripted({Response{202}});
    TransportFactory::registerCreator("scripted-for-test", [transport] { return transport; });

    Client client{ClientConfig::Builder{}.handlerName("scripted-for-test").build()};

    REQUIRE(client.handler() == transport);
    REQUIRE(client.get("http://example.com").statusCode() == 202);

    SECTION("curl is always registered") {
        REQUIRE(std::dynamic_pointer_cast<CurlTransport>(TransportFactory::create("curl")));
        REQUIRE_FALSE(TransportFactory::create("carrier-pigeon"));
    }
}

TEST_CASE("Client/debug", "[client]") {
    auto const transport = std::make_shared<ScriptedTransport>();

    Client const quiet{ClientConfig::Builder{}.handler(transport).build()};
    REQUIRE_FALSE(transport->debug());

    Client const loud{ClientConfig::Builder{}.handler(transport).debug(true).build()};
    REQUIRE(transport->debug());
}

TEST_CASE("Client/middleware order", "[client]") {
    std::vector<std::string> trace;
    auto const transport = makeEcho();
    auto const config = ClientConfig::Builder{}
        .handler(transport)
        .middleware(std::make_shared<TracingMiddleware>("a", trace))
        .middleware(std::make_shared<TracingMiddleware>("b", trace))
        .middleware(std::make_shared<TracingMiddleware>("c", trace))
        .build();
    Client client{config};

    auto const response = client.get("http://example.com/");

    REQUIRE(trace == std::vector<std::string>{">a", ">b", ">c", "<c", "<b", "<a"});
    REQUIRE(response.headerLine("Echo-X-Trace") == "a, b, c");
    REQUIRE(response.headerLine("X-Trace") == "c, b, a");
}

TEST_CASE("Client/middleware short circuit", "[client]") {
    std::vector<std::string> trace;
    auto const transport = makeScripted({Response{200}});
    auto const config = ClientConfig::Builder{}
        .handler(transport)
        .middleware(std::make_shared<TracingMiddleware>("outer", trace))
        .middleware(std::make_shared<ShortCircuitMiddleware>())
        .middleware(std::make_shared<TracingMiddleware>("inner", trace))
        .build();
    Client client{config};

    REQUIRE(client.get("http://example.com/").statusCode() == 204);
    REQUIRE(trace == std::vector<std::string>{">outer", "<outer"});
    REQUIRE(transport->remaining() == 1);
}

TEST_CASE("Client/logging and conditional auth", "[client]") {
    auto const transport = makeScripted({Response{200, std::make_shared<BufferStream>("secret")}});
    auto const config = ClientConfig::Builder{}
        .handler(transport)
        .middleware(std::make_shared<LoggingMiddleware>())
        .middleware(std::make_shared<ApiKeyMiddleware>())
        .build();
    Client client{config};

    SECTION("missing key never reaches the transport") {
        auto const response = client.get("http://example.com/private");
        REQUIRE(response.statusCode() == 401);
        REQUIRE(transport->remaining() == 1);
    }

    SECTION("key present reaches the transport") {
        RequestOptions options;
        options.headers.emplace_back("X-Api-Key", "k3y");
        auto const response = client.get("http://example.com/private", options);

        REQUIRE(response.statusCode() == 200);
        REQUIRE(response.body()->getContents() == "secret");
        REQUIRE(transport->remaining() == 0);
    }
}

TEST_CASE("Client/compilePipeline", "[client]") {
    auto const pipeline = Client::compilePipeline({}, [](Request const& request) {
        return Response{200}.withHeader("X-Method", request.method());
    });

    REQUIRE(pipeline(Request{"PUT", Url{"http://example.com"}}).headerLine("X-Method") == "PUT");
}

TEST_CASE("Client/request building", "[client]") {
    auto const transport = makeEcho();

    SECTION("base url is prepended to string targets") {
        Client client{ClientConfig::Builder{}.handler(transport).baseUrl("https://api.example.com/v1").build()};

        REQUIRE(client.get("/items?page=2").headerLine("X-Url") == "https://api.example.com/v1/items?page=2");
        REQUIRE(client.request("GET", Url{"http://other.example.com/x"}).headerLine("X-Url")
                == "http://other.example.com/x");
    }

    SECTION("verbs") {
        Client client{ClientConfig::Builder{}.handler(transport).build()};

        REQUIRE(client.del("http://example.com/").headerLine("X-Method") == "DELETE");
        REQUIRE(client.head("http://example.com/").headerLine("X-Method") == "HEAD");
        REQUIRE(client.options("http://example.com/").headerLine("X-Method") == "OPTIONS");
        REQUIRE(client.request("purge", "http://example.com/").headerLine("X-Method") == "PURGE");
    }

    SECTION("version comes from the configuration") {
        Client client{ClientConfig::Builder{}.handler(transport).httpVersion("2").build()};
        REQUIRE(client.get("https://example.com/").headerLine("X-Version") == "2");
    }

    SECTION("default user agent") {
        Client client{ClientConfig::Builder{}.handler(transport).build()};
        auto const response = client.get("http://example.com/");

        REQUIRE(response.headerLine("Echo-User-Agent") == Client::defaultUserAgent());
        REQUIRE(Client::defaultUserAgent().rfind("Shuttle/1.0 C++/", 0) == 0);
    }

    SECTION("configured headers and per-call overrides") {
        auto const config = ClientConfig::Builder{}
            .handler(transport)
            .header("User-Agent", "custom/2.0")
            .header("Accept", "text/html")
            .header("Accept", "application/json")
            .header("X-Team", "core")
            .build();
        Client client{config};

        RequestOptions options;
        options.headers.emplace_back("x-team", "edge");
        auto const response = client.get("http://example.com/", options);

        REQUIRE(response.headerLine("Echo-User-Agent") == "custom/2.0");
        REQUIRE(response.headerLine("Echo-Accept") == "text/html, application/json");
        REQUIRE(response.headers().get("Echo-X-Team") == std::vector<std::string>{"edge"});
    }

    SECTION("content type follows the body") {
        Client client{ClientConfig::Builder{}.handler(transport).build()};

        auto const json = client.post("http://example.com/", std::make_shared<JsonBody>(R"({"a":1})"));
        REQUIRE(json.headerLine("Echo-Content-Type") == "application/json");

        RequestOptions options;
        options.headers.emplace_back("Content-Type", "application/vnd.api+json");
        auto const custom = client.put("http://example.com/", std::make_shared<JsonBody>("{}"), options);
        REQUIRE(custom.headerLine("Echo-Content-Type") == "application/vnd.api+json");

        auto const raw = client.patch("http://example.com/", std::make_shared<BufferStream>("raw"));
        REQUIRE_FALSE(raw.hasHeader("Echo-Content-Type"));
    }
}

TEST_CASE("Client/error propagation", "[client]") {
    auto const transport = makeScripted({
        ScriptedTransport::Responder{[](Request const&) -> Response {
            throw TransportError{"connection refused"};
        }},
    });
    Client client{ClientConfig::Builder{}.handler(transport).build()};

    REQUIRE_THROWS_WITH(client.get("http://example.com/"), "connection refused");
}
