#include <mux/mux>

#include <array>
#include <cctype>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace std::literals;

namespace {
    auto get(const mux::handler& handler, std::string_view target) -> std::string {
        auto exchange = mux::exchange("GET", target);
        return exchange.dispatch(handler).body;
    }

    auto recorder(
        std::vector<std::string>& events,
        std::string name
    ) -> mux::middleware {
        return [&events, name](mux::handler_ptr next) {
            return mux::make_handler([&events, name, next](
                mux::request& req,
                mux::response& res
            ) {
                events.push_back(name + "-before");
                next->handle(req, res);
                events.push_back(name + "-after");
            });
        };
    }
}

TEST(Builder, Handle) {
    auto calls = 0;

    const auto handler = mux::builder()
        .handle("/hello", [&calls]() {
            ++calls;
            return "world"sv;
        })
        .finalize();

    EXPECT_EQ("world", get(*handler, "/hello"));
    EXPECT_EQ(1, calls);
}

TEST(Builder, PathParameter) {
    const auto handler = mux::builder()
        .handle("/hello/{name}", [](mux::request& req) {
            return std::string(req.params.at("name"));
        })
        .finalize();

    EXPECT_EQ("mux", get(*handler, "/hello/mux"));
}

TEST(Builder, MiddlewareOrder) {
    auto events = std::vector<std::string>();

    const auto handler = mux::builder()
        .use(recorder(events, "m1"))
        .use(recorder(events, "m2"))
        .handle("/test", [&events](mux::response& res) {
            events.push_back("handler");
            res.status = 200;
        })
        .finalize();

    get(*handler, "/test");

    const auto expected = std::vector<std::string> {
        "m1-before",
        "m2-before",
        "handler",
        "m2-after",
        "m1-after"
    };

    EXPECT_EQ(expected, events);
}

TEST(Builder, MiddlewareWrapsUnmatchedRequests) {
    auto events = std::vector<std::string>();

    const auto handler = mux::builder()
        .use(recorder(events, "m1"))
        .finalize();

    auto exchange = mux::exchange("GET", "/missing");
    exchange.dispatch(*handler);

    EXPECT_EQ(404, exchange.response.status);
    EXPECT_EQ(2u, events.size());
}

TEST(Builder, MiddlewareShortCircuit) {
    auto reached = false;

    const auto handler = mux::builder()
        .use([](mux::handler_ptr next) {
            return mux::make_handler([](mux::response& res) {
                res.status = 401;
            });
        })
        .handle("/secret", [&reached]() { reached = true; })
        .finalize();

    auto exchange = mux::exchange("GET", "/secret");
    exchange.dispatch(*handler);

    EXPECT_EQ(401, exchange.response.status);
    EXPECT_FALSE(reached);
}

TEST(Builder, Mount) {
    const auto api = mux::builder()
        .handle("/ping", [](mux::request& req) {
            return fmt::format("pong {}", req.path);
        })
        .finalize();

    const auto handler = mux::builder()
        .mount("/api/", api)
        .finalize();

    EXPECT_EQ("pong /ping", get(*handler, "/api/ping"));
}

TEST(Builder, MountPrefixRewritesToRoot) {
    const auto api = mux::builder()
        .handle("/{$}", []() { return "index"sv; })
        .finalize();

    const auto handler = mux::builder()
        .mount("/api/", api)
        .finalize();

    EXPECT_EQ("index", get(*handler, "/api"));
    EXPECT_EQ("index", get(*handler, "/api/"));
}

TEST(Builder, MountNotFound) {
    const auto api = mux::builder()
        .handle("/ping", []() { return "pong"sv; })
        .finalize();

    const auto handler = mux::builder()
        .mount("/api/", api)
        .finalize();

    auto exchange = mux::exchange("GET", "/api/missing");
    exchange.dispatch(*handler);

    EXPECT_EQ(404, exchange.response.status);
}

TEST(Builder, MountRestoresRequest) {
    auto path = std::string();

    const auto api = mux::builder()
        .handle("/items/{id}", []() {})
        .finalize();

    const auto handler = mux::builder()
        .use([&path](mux::handler_ptr next) {
            return mux::make_handler([&path, next](
                mux::request& req,
                mux::response& res
            ) {
                next->handle(req, res);
                path = req.path;
                EXPECT_TRUE(req.params.empty());
            });
        })
        .mount("/api/", api)
        .finalize();

    get(*handler, "/api/items/7");

    EXPECT_EQ("/api/items/7", path);
}

TEST(Builder, NestedMounts) {
    const auto v1 = mux::builder()
        .get("/users/{id}", [](mux::request& req) {
            return fmt::format("user {}", req.params.at("id"));
        })
        .finalize();

    const auto api = mux::builder()
        .mount("/v1/", v1)
        .finalize();

    const auto handler = mux::builder()
        .mount("/api/", api)
        .handle("/", []() { return "home"sv; })
        .finalize();

    EXPECT_EQ("user 42", get(*handler, "/api/v1/users/42"));
    EXPECT_EQ("home", get(*handler, "/about"));
}

TEST(Builder, ParameterNamesAtSamePosition) {
    const auto handler = mux::builder()
        .get("/users/{id}", [](mux::request& req) {
            return fmt::format("user {}", req.params.at("id"));
        })
        .get("/users/{name}/posts", [](mux::request& req) {
            return fmt::format("posts by {}", req.params.at("name"));
        })
        .get("/items/{id}", [](mux::request& req) {
            return fmt::format("get {}", req.params.at("id"));
        })
        .del("/items/{itemId}", [](mux::request& req) {
            return fmt::format("delete {}", req.params.at("itemId"));
        })
        .finalize();

    EXPECT_EQ("user 7", get(*handler, "/users/7"));
    EXPECT_EQ("posts by ann", get(*handler, "/users/ann/posts"));
    EXPECT_EQ("get 3", get(*handler, "/items/3"));

    auto exchange = mux::exchange("DELETE", "/items/3");
    exchange.dispatch(*handler);

    EXPECT_EQ("delete 3", exchange.response.body);
}

TEST(Builder, ChainedConfiguration) {
    const auto handler = mux::builder()
        .handle("/foo", []() { return "bar"sv; })
        .use([](mux::handler_ptr next) {
            return mux::make_handler([next](
                mux::request& req,
                mux::response& res
            ) {
                res.headers.insert_or_assign("x-test", "ok");
                next->handle(req, res);
            });
        })
        .finalize();

    auto exchange = mux::exchange("GET", "/foo");
    exchange.dispatch(*handler);

    EXPECT_EQ("ok", exchange.response.headers.at("x-test"));
    EXPECT_EQ("bar", exchange.response.body);
}

TEST(Builder, RegistrationOrderIrrelevant) {
    const auto api = mux::builder()
        .handle("/ping", []() { return "pong"sv; })
        .finalize();

    const auto hello = [](mux::request& req) {
        return std::string(req.params.at("name"));
    };

    auto first = mux::builder();
    first
        .handle("/hello/{name}", hello)
        .handle("/hello/world", []() { return "exact"sv; })
        .mount("/api/", api);

    auto second = mux::builder();
    second
        .mount("/api/", api)
        .handle("/hello/world", []() { return "exact"sv; })
        .handle("/hello/{name}", hello);

    for (const auto& handler : {first.finalize(), second.finalize()}) {
        EXPECT_EQ("exact", get(*handler, "/hello/world"));
        EXPECT_EQ("there", get(*handler, "/hello/there"));
        EXPECT_EQ("pong", get(*handler, "/api/ping"));
    }
}

TEST(Builder, MethodShorthands) {
    const auto handler = mux::builder()
        .get("/item", []() { return "get"sv; })
        .post("/item", []() { return "post"sv; })
        .put("/item", []() { return "put"sv; })
        .patch("/item", []() { return "patch"sv; })
        .del("/item", []() { return "delete"sv; })
        .finalize();

    for (const auto method : {"GET", "POST", "PUT", "PATCH", "DELETE"}) {
        auto exchange = mux::exchange(method, "/item");
        exchange.dispatch(*handler);

        auto expected = std::string(method);
        for (auto& c : expected) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }

        EXPECT_EQ(expected, exchange.response.body);
    }
}

TEST(Builder, MemberFunctionHandler) {
    struct counter {
        int value = 0;

        auto increment() -> int {
            return ++value == 1 ? 201 : 200;
        }
    };

    auto c = counter();

    const auto handler = mux::builder()
        .post("/count", c, &counter::increment)
        .finalize();

    auto exchange = mux::exchange("POST", "/count");
    exchange.dispatch(*handler);

    EXPECT_EQ(201, exchange.response.status);
    EXPECT_EQ(1, c.value);
}

TEST(Builder, DuplicatePatternFailsAtFinalize) {
    auto builder = mux::builder();

    EXPECT_NO_THROW(
        builder
            .handle("GET /users", []() {})
            .handle("GET /users", []() {})
    );

    EXPECT_THROW(builder.finalize(), mux::configuration_error);
}

TEST(Builder, DistinctMethodsDoNotCollide) {
    auto builder = mux::builder();

    builder
        .handle("GET /users", []() {})
        .handle("POST /users", []() {});

    EXPECT_NO_THROW(builder.finalize());
}

TEST(Builder, MalformedPatternFailsAtFinalize) {
    auto builder = mux::builder();

    builder.handle("/users/{id", []() {});

    EXPECT_THROW(builder.finalize(), mux::configuration_error);
}

TEST(Builder, MountCollidesWithPattern) {
    const auto api = mux::builder().finalize();

    auto builder = mux::builder();

    builder
        .handle("/api/", []() {})
        .mount("/api/", api);

    EXPECT_THROW(builder.finalize(), mux::configuration_error);
}

TEST(Builder, InvalidMountPrefix) {
    const auto api = mux::builder().finalize();

    for (const auto prefix : {"api/", "GET /api/", "/users/{id}/", ""}) {
        auto builder = mux::builder();
        builder.mount(prefix, api);

        EXPECT_THROW(builder.finalize(), mux::configuration_error) << prefix;
    }
}

TEST(Builder, FinalizeOnce) {
    auto builder = mux::builder();
    builder.handle("/", []() {});

    EXPECT_NO_THROW(builder.finalize());
    EXPECT_THROW(builder.finalize(), mux::configuration_error);
}

TEST(Builder, LaterAdditionsHaveNoEffect) {
    auto builder = mux::builder();
    builder.handle("/before", []() { return "before"sv; });

    const auto handler = builder.finalize();

    auto events = std::vector<std::string>();

    builder
        .handle("/after", []() { return "after"sv; })
        .use(recorder(events, "late"));

    auto exchange = mux::exchange("GET", "/after");
    exchange.dispatch(*handler);

    EXPECT_EQ(404, exchange.response.status);
    EXPECT_EQ("before", get(*handler, "/before"));
    EXPECT_TRUE(events.empty());
}

TEST(Builder, ConcurrentRequests) {
    const auto handler = mux::builder()
        .use(mux::recovery())
        .get("/echo/{value}", [](mux::request& req) {
            return std::string(req.params.at("value"));
        })
        .finalize();

    constexpr auto thread_count = 8;
    constexpr auto iterations = 200;

    auto failures = std::array<int, thread_count>();
    auto threads = std::vector<std::thread>();

    for (auto t = 0; t < thread_count; ++t) {
        threads.emplace_back([&handler, &failures, t]() {
            for (auto i = 0; i < iterations; ++i) {
                const auto value = fmt::format("{}-{}", t, i);
                const auto target = fmt::format("/echo/{}", value);

                if (get(*handler, target) != value) ++failures[t];
            }
        });
    }

    for (auto& thread : threads) thread.join();

    for (const auto count : failures) EXPECT_EQ(0, count);
}
