#include <catch2/catch_test_macros.hpp>

#include <shardfetch/fetch/fetcher.hpp>

#include "../../support/fake_transport.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace shardfetch::fetch;
using shardfetch::test_support::bytesOf;
using shardfetch::test_support::FakeResource;
using shardfetch::test_support::FakeTransport;
using shardfetch::test_support::textOf;

namespace {

struct ProgressLog {
    std::mutex mu;
    std::vector<std::pair<std::int64_t, std::int64_t>> events;

    AggregateProgressCallback callback() {
        return [this](std::int64_t loaded, std::int64_t total) {
            std::lock_guard<std::mutex> lk(mu);
            events.emplace_back(loaded, total);
        };
    }
};

FakeResource slowResource(std::string_view body, std::chrono::milliseconds perChunk) {
    FakeResource r;
    r.body = bytesOf(body);
    r.chunkSize = 5;
    r.delay = perChunk;
    return r;
}

// Builds a fetcher over a FakeTransport the test keeps a pointer to.
struct Harness {
    explicit Harness(bool withCache = false, int maxParallel = 4) {
        auto t = std::make_unique<FakeTransport>();
        transport = t.get();
        std::unique_ptr<ICacheStore> store;
        if (withCache) {
            store = makeInMemoryCacheStore("test");
            cache = store.get();
        }
        FetcherConfig cfg;
        cfg.maxParallel = maxParallel;
        fetcher = makeResourceFetcherWithDependencies(cfg, std::move(t), std::move(store));
    }

    FakeTransport* transport{nullptr};
    ICacheStore* cache{nullptr};
    std::unique_ptr<IResourceFetcher> fetcher;
};

} // namespace

TEST_CASE("ResourceFetcher: three parts with two workers", "[fetch][scheduler]") {
    Harness h;
    h.transport->add("a", slowResource(std::string(10, 'a'), std::chrono::milliseconds(5)));
    h.transport->add("b", slowResource(std::string(20, 'b'), std::chrono::milliseconds(5)));
    h.transport->add("c", slowResource(std::string(30, 'c'), std::chrono::milliseconds(5)));

    ProgressLog log;
    auto outcome = h.fetcher->fetchResources({"a", "b", "c"}, 2, log.callback());

    REQUIRE(outcome.ok());
    REQUIRE_FALSE(outcome.isSingle());
    auto parts = std::move(outcome).takeParts();
    REQUIRE(parts.size() == 3);
    CHECK(textOf(parts[0]) == std::string(10, 'a'));
    CHECK(textOf(parts[1]) == std::string(20, 'b'));
    CHECK(textOf(parts[2]) == std::string(30, 'c'));

    CHECK(h.transport->probeCalls.load() == 3);
    CHECK(h.transport->maxInFlight.load() <= 2);

    REQUIRE_FALSE(log.events.empty());
    for (const auto& ev : log.events)
        CHECK(ev.second == 60);
    CHECK(log.events.back() == std::pair<std::int64_t, std::int64_t>{60, 60});
    CHECK(std::is_sorted(log.events.begin(), log.events.end(),
                         [](const auto& l, const auto& r) { return l.first < r.first; }));
}

TEST_CASE("ResourceFetcher: payload shape", "[fetch][scheduler]") {
    Harness h;
    h.transport->add("only", "single-part");

    SECTION("Exactly one identifier yields a single buffer") {
        auto outcome = h.fetcher->fetchResources({"only"}, 5);
        REQUIRE(outcome.ok());
        REQUIRE(outcome.isSingle());
        CHECK(textOf(std::get<ByteBuffer>(outcome.payload)) == "single-part");
        CHECK(h.transport->maxInFlight.load() == 1);
    }

    SECTION("fetchResource is the single-identifier form") {
        auto outcome = h.fetcher->fetchResource("only");
        REQUIRE(outcome.ok());
        REQUIRE(outcome.isSingle());
        CHECK(textOf(std::get<ByteBuffer>(outcome.payload)) == "single-part");
    }

    SECTION("Empty input is an empty list and no error") {
        auto outcome = h.fetcher->fetchResources({}, 3, [](std::int64_t, std::int64_t) {});
        CHECK(outcome.ok());
        CHECK_FALSE(outcome.isSingle());
        CHECK(std::get<std::vector<ByteBuffer>>(outcome.payload).empty());
        CHECK(h.transport->probeCalls.load() == 0);
        CHECK(h.transport->fetchCalls.load() == 0);
    }
}

TEST_CASE("ResourceFetcher: one worker completes in input order", "[fetch][scheduler]") {
    Harness h;
    std::vector<ResourceIdentifier> ids;
    for (int i = 0; i < 6; ++i) {
        ids.push_back("p" + std::to_string(i));
        h.transport->add(ids.back(), "body-" + std::to_string(i));
    }

    SECTION("maxParallel = 1") {
        auto outcome = h.fetcher->fetchResources(ids, 1);
        REQUIRE(outcome.ok());
        CHECK(h.transport->startOrder() == std::vector<std::string>(ids.begin(), ids.end()));
        CHECK(h.transport->maxInFlight.load() == 1);
    }

    SECTION("Non-positive maxParallel is treated as one worker") {
        auto outcome = h.fetcher->fetchResources(ids, 0);
        REQUIRE(outcome.ok());
        CHECK(h.transport->maxInFlight.load() == 1);
        auto parts = std::move(outcome).takeParts();
        REQUIRE(parts.size() == ids.size());
        CHECK(textOf(parts[5]) == "body-5");
    }
}

TEST_CASE("ResourceFetcher: enough workers run parts side by side", "[fetch][scheduler]") {
    Harness h;
    std::vector<ResourceIdentifier> ids{"w", "x", "y", "z"};
    for (const auto& id : ids)
        h.transport->add(id, slowResource(std::string(20, 'q'), std::chrono::milliseconds(25)));

    auto outcome = h.fetcher->fetchResources(ids, 8);
    REQUIRE(outcome.ok());
    CHECK(h.transport->maxInFlight.load() >= 2);
    CHECK(h.transport->maxInFlight.load() <= 4);
    CHECK(h.transport->fetchCalls.load() == 4);
}

TEST_CASE("ResourceFetcher: cache interaction", "[fetch][scheduler][cache]") {
    Harness h(/*withCache=*/true);

    SECTION("Cached part skips the transport and reports no progress") {
        auto seed = bytesOf("from-cache");
        REQUIRE(h.cache->store("x", seed).ok());
        h.transport->add("x", "from-network");

        ProgressLog log;
        auto outcome = h.fetcher->fetchResources({"x"}, 2, log.callback());
        REQUIRE(outcome.ok());
        REQUIRE(outcome.isSingle());
        CHECK(textOf(std::get<ByteBuffer>(outcome.payload)) == "from-cache");
        CHECK(h.transport->fetchCalls.load() == 0);
        CHECK(log.events.empty());
    }

    SECTION("Fetched parts are served from cache on the next call") {
        h.transport->add("a", "alpha");
        h.transport->add("b", "beta");
        REQUIRE(h.fetcher->fetchResources({"a", "b"}, 2).ok());
        REQUIRE(h.transport->fetchCalls.load() == 2);

        auto again = h.fetcher->fetchResources({"a", "b"}, 2);
        REQUIRE(again.ok());
        CHECK(h.transport->fetchCalls.load() == 2);
        auto parts = std::move(again).takeParts();
        CHECK(textOf(parts[0]) == "alpha");
        CHECK(textOf(parts[1]) == "beta");
    }

    SECTION("Mixed cached and uncached parts") {
        auto seed = bytesOf("12345");
        REQUIRE(h.cache->store("cached", seed).ok());
        h.transport->add("cached", "12345");
        h.transport->add("fresh", "abcdefghij");

        ProgressLog log;
        auto outcome = h.fetcher->fetchResources({"cached", "fresh"}, 2, log.callback());
        REQUIRE(outcome.ok());
        CHECK(h.transport->fetchesOf("cached") == 0);
        CHECK(h.transport->fetchesOf("fresh") == 1);
        // The probe still counts the cached part, so loaded stops short of total.
        REQUIRE_FALSE(log.events.empty());
        CHECK(log.events.back() == std::pair<std::int64_t, std::int64_t>{10, 15});
    }
}

TEST_CASE("ResourceFetcher: a failing part", "[fetch][scheduler][errors]") {
    Harness h;
    h.transport->add("a", "aaaa");
    FakeResource bad;
    bad.body = bytesOf("bbbbbbbb");
    bad.fetchError = Error{ErrorCode::TransferFailed, "connection reset"};
    h.transport->add("b", bad);
    h.transport->add("c", "cccc");

    SECTION("Error reported, other parts kept") {
        auto outcome = h.fetcher->fetchResources({"a", "b", "c"}, 2);
        REQUIRE_FALSE(outcome.ok());
        CHECK(outcome.error->code == ErrorCode::TransferFailed);
        auto parts = std::move(outcome).takeParts();
        REQUIRE(parts.size() == 3);
        CHECK(textOf(parts[0]) == "aaaa");
        CHECK(parts[1].empty());
        CHECK(textOf(parts[2]) == "cccc");
    }

    SECTION("Completion is tracked per part") {
        auto outcome = h.fetcher->fetchResources({"a", "b", "c"}, 2);
        REQUIRE_FALSE(outcome.ok());
        CHECK(outcome.completed == std::vector<bool>{true, false, true});
    }

    SECTION("A zero-byte part still counts as complete next to a failure") {
        h.transport->add("empty", "");
        auto outcome = h.fetcher->fetchResources({"empty", "b"}, 1);
        REQUIRE_FALSE(outcome.ok());
        REQUIRE(outcome.completed.size() == 2);
        CHECK(outcome.completed[0]);
        CHECK_FALSE(outcome.completed[1]);
        auto parts = std::move(outcome).takeParts();
        CHECK(parts[0].empty());
    }

    SECTION("Failing part alone still yields a single empty buffer") {
        auto outcome = h.fetcher->fetchResources({"b"}, 1);
        REQUIRE_FALSE(outcome.ok());
        REQUIRE(outcome.isSingle());
        CHECK(std::get<ByteBuffer>(outcome.payload).empty());
    }
}

TEST_CASE("ResourceFetcher: probe failures stop the call early", "[fetch][scheduler][errors]") {
    Harness h;
    h.transport->add("a", "aaaa");
    FakeResource noLength;
    noLength.body = bytesOf("zz");
    noLength.omitLength = true;
    h.transport->add("z", noLength);

    SECTION("Progress requested: size probe failure fails before any transfer") {
        ProgressLog log;
        auto outcome = h.fetcher->fetchResources({"a", "z"}, 2, log.callback());
        REQUIRE_FALSE(outcome.ok());
        CHECK(outcome.error->code == ErrorCode::SizeUnavailable);
        CHECK(h.transport->fetchCalls.load() == 0);
        CHECK(log.events.empty());
        auto parts = std::move(outcome).takeParts();
        REQUIRE(parts.size() == 2);
        CHECK(parts[0].empty());
        CHECK(parts[1].empty());
    }

    SECTION("No progress requested: no probe at all") {
        auto outcome = h.fetcher->fetchResources({"a", "z"}, 2);
        REQUIRE(outcome.ok());
        CHECK(h.transport->probeCalls.load() == 0);
    }
}

TEST_CASE("ResourceFetcher: argument and callback errors", "[fetch][scheduler][errors]") {
    Harness h;
    h.transport->add("a", "aaaa");

    SECTION("Empty identifier is rejected up front") {
        auto outcome = h.fetcher->fetchResources({"a", ""}, 2);
        REQUIRE_FALSE(outcome.ok());
        CHECK(outcome.error->code == ErrorCode::InvalidArgument);
        CHECK(h.transport->fetchCalls.load() == 0);
    }

    SECTION("Throwing progress callback becomes an Unknown error") {
        auto outcome = h.fetcher->fetchResources(
            {"a"}, 1, [](std::int64_t, std::int64_t) { throw std::runtime_error("ui gone"); });
        REQUIRE_FALSE(outcome.ok());
        CHECK(outcome.error->code == ErrorCode::Unknown);
    }

    SECTION("Non-standard exception from a progress callback becomes an Unknown error") {
        auto outcome =
            h.fetcher->fetchResources({"a"}, 1, [](std::int64_t, std::int64_t) { throw 42; });
        REQUIRE_FALSE(outcome.ok());
        CHECK(outcome.error->code == ErrorCode::Unknown);
        REQUIRE(outcome.completed.size() == 1);
        CHECK_FALSE(outcome.completed[0]);
    }

    SECTION("Transport throwing a non-std type while reporting a length") {
        FakeResource throwing;
        throwing.body = bytesOf("tt");
        throwing.throwOnLength = true;
        h.transport->add("t", throwing);

        ProgressLog log;
        auto outcome = h.fetcher->fetchResources({"a", "t"}, 2, log.callback());
        REQUIRE_FALSE(outcome.ok());
        CHECK(outcome.error->code == ErrorCode::Unknown);
        CHECK(h.transport->fetchCalls.load() == 0);
        CHECK(outcome.completed == std::vector<bool>{false, false});
    }
}

TEST_CASE("ResourceFetcher: transport without declared totals", "[fetch][scheduler][progress]") {
    Harness h;
    FakeResource r;
    r.body = bytesOf("0123456789abcdef");
    r.declareTotal = false;
    h.transport->add("u", r);

    ProgressLog log;
    auto outcome = h.fetcher->fetchResources({"u"}, 1, log.callback());
    REQUIRE(outcome.ok());
    REQUIRE_FALSE(log.events.empty());
    CHECK(log.events.back() == std::pair<std::int64_t, std::int64_t>{16, 16});
}

TEST_CASE("ResourceFetcher: config is kept", "[fetch][scheduler]") {
    Harness h(false, 7);
    CHECK(h.fetcher->config().maxParallel == 7);
    CHECK(h.fetcher->config().cache.nameSpace == kDefaultCacheNamespace);
}

TEST_CASE("joinParts: concatenates in order", "[fetch][join]") {
    std::vector<ByteBuffer> parts{bytesOf("ab"), bytesOf(""), bytesOf("cde")};
    CHECK(textOf(joinParts(parts)) == "abcde");
    CHECK(joinParts({}).empty());
}
