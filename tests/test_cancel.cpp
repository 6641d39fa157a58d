#include <catch2/catch.hpp>
#include "cancel.hpp"
#include <atomic>
#include <thread>

using namespace manax;

TEST_CASE("CancelToken: starts uncancelled", "[cancel]") {
    CancelToken token;
    REQUIRE_FALSE(token.cancelled());
}

TEST_CASE("CancelToken: callbacks run once on cancel", "[cancel]") {
    CancelToken token;
    int a = 0, b = 0;
    token.add_callback([&a] { a++; });
    token.add_callback([&b] { b++; });

    token.cancel();
    token.cancel();

    REQUIRE(token.cancelled());
    REQUIRE(a == 1);
    REQUIRE(b == 1);
}

TEST_CASE("CancelToken: late registration runs immediately", "[cancel]") {
    CancelToken token;
    token.cancel();

    int calls = 0;
    uint64_t id = token.add_callback([&calls] { calls++; });
    REQUIRE(calls == 1);
    REQUIRE(id == 0);
}

TEST_CASE("CancelToken: removed callback is not run", "[cancel]") {
    CancelToken token;
    int calls = 0;
    uint64_t id = token.add_callback([&calls] { calls++; });
    token.remove_callback(id);
    token.cancel();
    REQUIRE(calls == 0);
}

TEST_CASE("CancelRegistration: deregisters on destruction", "[cancel]") {
    CancelToken token;
    int calls = 0;
    {
        CancelRegistration reg(&token, [&calls] { calls++; });
    }
    token.cancel();
    REQUIRE(calls == 0);
}

TEST_CASE("CancelRegistration: null token is a no-op", "[cancel]") {
    int calls = 0;
    CancelRegistration reg(nullptr, [&calls] { calls++; });
    reg.reset();
    REQUIRE(calls == 0);
}

TEST_CASE("CancelToken: cancel from another thread", "[cancel]") {
    CancelToken token;
    std::atomic<bool> fired{false};
    CancelRegistration reg(&token, [&fired] { fired.store(true); });

    std::thread t([&token] { token.cancel(); });
    t.join();

    REQUIRE(token.cancelled());
    REQUIRE(fired.load());
}
