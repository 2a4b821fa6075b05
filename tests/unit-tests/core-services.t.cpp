#include "boost-test.hpp"

#include "core/Config.hpp"
#include "core/EventBus.hpp"
#include "core/ThreadPool.hpp"

#include "temp-dir-fixture.hpp"

#include <atomic>
#include <memory>
#include <stdexcept>
#include <vector>

namespace ferry::core::tests {

namespace fs = std::filesystem;
using ferry::tests::TempDirFixture;

BOOST_AUTO_TEST_SUITE(TestEventBus)

BOOST_AUTO_TEST_CASE(DeliversToNamedSubscribers)
{
    EventBus bus;
    auto received = std::make_shared<std::vector<std::string>>();

    auto status = bus.subscribe("download.status", [received](const json& data) {
        received->push_back(data.value("download_id", ""));
    });
    auto other = bus.subscribe("download.restarted", [received](const json&) {
        received->push_back("restart");
    });

    bus.emit("download.status", {{"download_id", "a"}});
    bus.emit("download.status", {{"download_id", "b"}});
    bus.emit("unrelated");

    BOOST_REQUIRE_EQUAL(received->size(), 2);
    BOOST_CHECK_EQUAL((*received)[0], "a");
    BOOST_CHECK_EQUAL((*received)[1], "b");
    BOOST_CHECK_NE(status->getId(), other->getId());
}

BOOST_AUTO_TEST_CASE(Unsubscribe)
{
    EventBus bus;
    auto count = std::make_shared<std::atomic<int>>(0);

    auto subscription = bus.subscribe("download.status", [count](const json&) { ++*count; });
    bus.emit("download.status");
    bus.unsubscribe(subscription);
    bus.emit("download.status");

    BOOST_CHECK_EQUAL(count->load(), 1);
    BOOST_CHECK(!subscription->isActive());

    BOOST_CHECK_NO_THROW(bus.unsubscribe(subscription));
    BOOST_CHECK_NO_THROW(bus.unsubscribe(nullptr));
}

BOOST_AUTO_TEST_CASE(ThrowingSubscriberIsIsolated)
{
    EventBus bus;
    auto count = std::make_shared<std::atomic<int>>(0);

    auto failing = bus.subscribe("download.status", [](const json&) {
        throw std::runtime_error("subscriber failure");
    });
    auto counting = bus.subscribe("download.status", [count](const json&) { ++*count; });

    BOOST_CHECK_NO_THROW(bus.emit("download.status"));
    BOOST_CHECK_EQUAL(count->load(), 1);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(TestThreadPool)

BOOST_AUTO_TEST_CASE(RunsSubmittedJobs)
{
    ThreadPool pool(2);
    BOOST_CHECK_EQUAL(pool.size(), 2);

    auto sum = pool.submit([](int a, int b) { return a + b; }, 2, 3);
    BOOST_CHECK_EQUAL(sum.get(), 5);

    auto failing = pool.submit([]() -> int { throw std::runtime_error("job failure"); });
    BOOST_CHECK_THROW(failing.get(), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(DrainsQueueOnDestruction)
{
    auto done = std::make_shared<std::atomic<int>>(0);
    {
        ThreadPool pool(1);
        for (int i = 0; i < 20; ++i) {
            pool.submit([done] { ++*done; });
        }
    }
    BOOST_CHECK_EQUAL(done->load(), 20);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(TestConfig, TempDirFixture)

BOOST_AUTO_TEST_CASE(LoadMergesOverDefaults)
{
    auto& config = Config::instance();
    config.setDefaults();

    fs::path file = root / "config.json";
    writeFile(file, R"({"downloads": {"maxConcurrent": 9, "retry": {"maxAttempts": 2}}})");

    BOOST_REQUIRE(config.load(file.string()));
    BOOST_CHECK_EQUAL(config.get<int>("downloads.maxConcurrent", 0), 9);
    BOOST_CHECK_EQUAL(config.get<int>("downloads.retry.maxAttempts", 0), 2);
    BOOST_CHECK_EQUAL(config.get<int>("downloads.retry.baseDelayMs", 0), 1000);
    BOOST_CHECK_EQUAL(config.get<std::string>("log.level", ""), "warn");

    // Mistyped values fall back to the caller's default
    config.set("downloads.maxConcurrent", std::string("many"));
    BOOST_CHECK_EQUAL(config.get<int>("downloads.maxConcurrent", 4), 4);

    config.setDefaults();
}

BOOST_AUTO_TEST_CASE(LoadRejectsMissingAndMalformed)
{
    auto& config = Config::instance();
    config.setDefaults();

    BOOST_CHECK(!config.load((root / "absent.json").string()));

    writeFile(root / "broken.json", "{\"downloads\": ");
    BOOST_CHECK(!config.load((root / "broken.json").string()));
    BOOST_CHECK_EQUAL(config.get<int>("downloads.maxConcurrent", 0), 4);
}

BOOST_AUTO_TEST_CASE(SaveWritesCurrentValues)
{
    auto& config = Config::instance();
    config.setDefaults();
    config.set("downloads.maxRestarts", 7);

    fs::path file = root / "nested" / "config.json";
    BOOST_REQUIRE(config.save(file.string()));
    config.setDefaults();

    auto saved = json::parse(readFile(file));
    BOOST_CHECK_EQUAL(saved["downloads"]["maxRestarts"].get<int>(), 7);

    BOOST_REQUIRE(config.load(file.string()));
    BOOST_CHECK_EQUAL(config.get<int>("downloads.maxRestarts", 0), 7);
    config.setDefaults();
}

BOOST_AUTO_TEST_SUITE_END()

} // namespace ferry::core::tests
