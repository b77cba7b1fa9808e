#include "engine/ArchiveFetcher.hpp"
#include "engine/JobStore.hpp"
#include "utils/Json.hpp"

#include "TestUtils.hpp"

#include <format>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <doctest/doctest.h>
#include <yyjson.h>

namespace
{

using hm::engine::ArchiveEvent;
using hm::engine::ArchiveEventType;
using hm::engine::FetcherOptions;
using hm::engine::FetchStatus;

std::filesystem::path const kFirstDir = "/archives/first";
std::filesystem::path const kSecondDir = "/archives/second";

struct FetcherFixture
{
    explicit FetcherFixture(
        std::string_view tag,
        hm::engine::StoreBackend backend = hm::engine::StoreBackend::File)
        : root(hm::test::make_temp_root(tag)),
          fs(std::make_shared<hm::test::FakeArchiveFileSystem>()),
          store(hm::engine::make_job_store(
              backend, backend == hm::engine::StoreBackend::File ? root / "web"
                                                                  : root))
    {
        REQUIRE(store);
        fs->add_directory(kFirstDir);
        fs->add_directory(kSecondDir);
    }

    ~FetcherFixture()
    {
        fetcher.reset();
        store.reset();
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    hm::engine::ArchiveFetcher &make(FetcherOptions options = {},
                                     bool two_locations = false)
    {
        if (two_locations)
        {
            return make_at({kFirstDir, kSecondDir}, options);
        }
        return make_at({kFirstDir}, options);
    }

    hm::engine::ArchiveFetcher &
    make_at(std::vector<std::filesystem::path> const &dirs,
            FetcherOptions options)
    {
        std::vector<hm::engine::RefreshLocation> locations;
        for (auto const &dir : dirs)
        {
            locations.push_back({dir, fs});
        }
        fetcher = hm::engine::ArchiveFetcher::create(
            std::move(locations), store,
            [this](ArchiveEvent const &event) { events.push_back(event); },
            options);
        REQUIRE(fetcher);
        return *fetcher;
    }

    std::size_t listed_jobs() const
    {
        auto combined = store->get("/jobs/overview");
        if (!combined)
        {
            return 0;
        }
        auto doc = hm::json::Document::parse(*combined);
        return yyjson_arr_size(yyjson_obj_get(doc.root(), "jobs"));
    }

    std::filesystem::path root;
    std::shared_ptr<hm::test::FakeArchiveFileSystem> fs;
    std::shared_ptr<hm::engine::JobStore> store;
    std::unique_ptr<hm::engine::ArchiveFetcher> fetcher;
    std::vector<ArchiveEvent> events;
};

ArchiveEvent created(std::string id)
{
    return {std::move(id), ArchiveEventType::Created};
}

ArchiveEvent deleted(std::string id)
{
    return {std::move(id), ArchiveEventType::Deleted};
}

} // namespace

TEST_CASE("fetcher rejects invalid retention limits")
{
    FetcherFixture fixture("fetcher-config");
    std::vector<hm::engine::RefreshLocation> locations{{kFirstDir, fixture.fs}};

    for (int retained : {0, -2, -100})
    {
        CAPTURE(retained);
        auto status = FetchStatus::Ok;
        FetcherOptions options;
        options.retained_jobs = retained;
        CHECK_FALSE(hm::engine::ArchiveFetcher::create(locations, fixture.store,
                                                       nullptr, options, &status));
        CHECK(status == FetchStatus::InvalidConfiguration);
    }

    auto status = FetchStatus::InvalidConfiguration;
    CHECK_FALSE(hm::engine::ArchiveFetcher::create({}, fixture.store, nullptr,
                                                   {}, &status));
    CHECK(status == FetchStatus::InvalidConfiguration);
    CHECK_FALSE(hm::engine::ArchiveFetcher::create(locations, nullptr, nullptr,
                                                   {}, &status));

    for (int retained : {-1, 1, 50})
    {
        CAPTURE(retained);
        FetcherOptions options;
        options.retained_jobs = retained;
        CHECK(hm::engine::ArchiveFetcher::create(locations, fixture.store,
                                                 nullptr, options, &status));
        CHECK(status == FetchStatus::Ok);
    }
}

TEST_CASE("fetcher publishes an empty listing before the first cycle")
{
    FetcherFixture fixture("fetcher-initial");
    fixture.make();
    CHECK(fixture.store->get("/jobs/overview") == R"({"jobs":[]})");
}

TEST_CASE("fetcher ingests new archives once")
{
    FetcherFixture fixture("fetcher-ingest");
    auto const first = hm::test::job_id(1);
    auto const second = hm::test::job_id(2);
    fixture.fs->add_job(kFirstDir, first);
    fixture.fs->add(kFirstDir, "not-a-job", "{}");
    fixture.fs->add_job(kFirstDir, second);
    auto &fetcher = fixture.make();

    auto report = fetcher.fetch_archives();
    CHECK(report.completed);
    CHECK(report.created == 2);
    CHECK(report.deleted == 0);
    CHECK(fixture.events ==
          std::vector<ArchiveEvent>{created(first), created(second)});
    CHECK(fetcher.cache_state().size() == 2);
    CHECK(fixture.store->exists(first));
    CHECK(fixture.store->get("/jobs/" + first + "/vertices") ==
          R"({"vertices":[]})");
    CHECK(fixture.listed_jobs() == 2);

    // Nothing changed, so nothing happens.
    fixture.events.clear();
    report = fetcher.fetch_archives();
    CHECK(report.completed);
    CHECK(report.created == 0);
    CHECK(fixture.events.empty());
    CHECK(fetcher.cache_state().size() == 2);
    CHECK(fixture.listed_jobs() == 2);
}

TEST_CASE("deleted archives are evicted only when expiration is enabled")
{
    auto const first = hm::test::job_id(1);
    auto const second = hm::test::job_id(2);

    SUBCASE("enabled")
    {
        FetcherFixture fixture("fetcher-expire-on");
        fixture.fs->add_job(kFirstDir, first);
        fixture.fs->add_job(kFirstDir, second);
        FetcherOptions options;
        options.cleanup_expired_jobs = true;
        auto &fetcher = fixture.make(options);
        fetcher.fetch_archives();

        fixture.events.clear();
        fixture.fs->erase(kFirstDir, first);
        auto report = fetcher.fetch_archives();
        CHECK(report.deleted == 1);
        CHECK(fixture.events == std::vector<ArchiveEvent>{deleted(first)});
        CHECK_FALSE(fetcher.cache_state().contains(kFirstDir, first));
        CHECK_FALSE(fixture.store->exists(first));
        CHECK_FALSE(fixture.store->get("/jobs/" + first));
        CHECK(fixture.listed_jobs() == 1);

        // Deleted once, reported once.
        fixture.events.clear();
        fetcher.fetch_archives();
        CHECK(fixture.events.empty());
    }

    SUBCASE("disabled")
    {
        FetcherFixture fixture("fetcher-expire-off");
        fixture.fs->add_job(kFirstDir, first);
        auto &fetcher = fixture.make();
        fetcher.fetch_archives();

        fixture.events.clear();
        fixture.fs->erase(kFirstDir, first);
        auto report = fetcher.fetch_archives();
        CHECK(report.deleted == 0);
        CHECK(fixture.events.empty());
        CHECK(fetcher.cache_state().contains(kFirstDir, first));
        CHECK(fixture.store->exists(first));
    }
}

TEST_CASE("expired jobs are reported in directory order")
{
    FetcherFixture fixture("fetcher-expire-order");
    auto const a = hm::test::job_id(1);
    auto const b = hm::test::job_id(2);
    auto const c = hm::test::job_id(3);
    auto const d = hm::test::job_id(4);
    // Listing order differs from id order on purpose.
    fixture.fs->add_job(kSecondDir, d);
    fixture.fs->add_job(kSecondDir, b);
    fixture.fs->add_job(kFirstDir, c);
    fixture.fs->add_job(kFirstDir, a);
    FetcherOptions options;
    options.cleanup_expired_jobs = true;
    auto &fetcher = fixture.make_at({kSecondDir, kFirstDir}, options);
    fetcher.fetch_archives();
    REQUIRE(fetcher.cache_state().size() == 4);

    fixture.events.clear();
    for (auto const &id : {a, c})
    {
        fixture.fs->erase(kFirstDir, id);
    }
    for (auto const &id : {b, d})
    {
        fixture.fs->erase(kSecondDir, id);
    }
    auto report = fetcher.fetch_archives();
    CHECK(report.deleted == 4);
    CHECK(fixture.events == std::vector<ArchiveEvent>{deleted(b), deleted(d),
                                                      deleted(a), deleted(c)});
    CHECK(fetcher.cache_state().size() == 0);
}

TEST_CASE("unreachable directories keep their jobs")
{
    FetcherFixture fixture("fetcher-unreachable");
    auto const first = hm::test::job_id(1);
    auto const second = hm::test::job_id(2);
    fixture.fs->add_job(kFirstDir, first);
    fixture.fs->add_job(kSecondDir, second);
    FetcherOptions options;
    options.cleanup_expired_jobs = true;
    auto &fetcher = fixture.make(options, true);
    fetcher.fetch_archives();
    REQUIRE(fetcher.cache_state().size() == 2);

    fixture.events.clear();
    fixture.fs->set_unreachable(kFirstDir, true);
    auto const third = hm::test::job_id(3);
    fixture.fs->add_job(kSecondDir, third);
    auto report = fetcher.fetch_archives();
    CHECK(report.completed);
    CHECK(report.unreachable_locations == 1);
    CHECK(report.deleted == 0);
    CHECK(fixture.events == std::vector<ArchiveEvent>{created(third)});
    CHECK(fetcher.cache_state().contains(kFirstDir, first));
    CHECK(fixture.store->exists(first));
    CHECK(fixture.listed_jobs() == 3);

    // Back online: nothing was lost, nothing is re-ingested.
    fixture.events.clear();
    fixture.fs->set_unreachable(kFirstDir, false);
    report = fetcher.fetch_archives();
    CHECK(report.unreachable_locations == 0);
    CHECK(fixture.events.empty());
}

TEST_CASE("archives beyond the retention limit are deleted at the source")
{
    auto const a = hm::test::job_id(1);
    auto const b = hm::test::job_id(2);
    auto const c = hm::test::job_id(3);
    auto const d = hm::test::job_id(4);

    SUBCASE("never ingested when over the limit from the start")
    {
        FetcherFixture fixture("fetcher-limit-initial");
        for (auto const &id : {a, b, c, d})
        {
            fixture.fs->add_job(kFirstDir, id);
        }
        FetcherOptions options;
        options.retained_jobs = 2;
        auto &fetcher = fixture.make(options);

        auto report = fetcher.fetch_archives();
        CHECK(report.created == 2);
        CHECK(report.deleted == 2);
        CHECK(fixture.events == std::vector<ArchiveEvent>{created(a), created(b),
                                                          deleted(c), deleted(d)});
        CHECK(fixture.fs->count(kFirstDir) == 2);
        CHECK_FALSE(fixture.store->exists(c));
        CHECK_FALSE(fixture.store->exists(d));
        CHECK(fixture.listed_jobs() == 2);
    }

    SUBCASE("cached jobs pushed past the limit are evicted")
    {
        FetcherFixture fixture("fetcher-limit-evict");
        fixture.fs->add_job(kFirstDir, a);
        fixture.fs->add_job(kFirstDir, b);
        FetcherOptions options;
        options.retained_jobs = 2;
        auto &fetcher = fixture.make(options);
        fetcher.fetch_archives();

        fixture.events.clear();
        fixture.fs->prepend(kFirstDir, c, hm::test::make_job_bundle(c));
        auto report = fetcher.fetch_archives();
        CHECK(report.created == 1);
        CHECK(report.deleted == 1);
        CHECK(fixture.events == std::vector<ArchiveEvent>{created(c), deleted(b)});
        CHECK(fixture.fs->count(kFirstDir) == 2);
        CHECK_FALSE(fetcher.cache_state().contains(kFirstDir, b));
        CHECK_FALSE(fixture.store->exists(b));
        CHECK(fixture.listed_jobs() == 2);
    }

    SUBCASE("undeletable archives are not reported every cycle")
    {
        FetcherFixture fixture("fetcher-limit-read-only");
        for (auto const &id : {a, b, c, d})
        {
            fixture.fs->add_job(kFirstDir, id);
        }
        fixture.fs->set_read_only(kFirstDir, true);
        FetcherOptions options;
        options.retained_jobs = 2;
        auto &fetcher = fixture.make(options);

        auto report = fetcher.fetch_archives();
        CHECK(report.completed);
        CHECK(report.created == 2);
        CHECK(report.deleted == 0);
        CHECK(fixture.events ==
              std::vector<ArchiveEvent>{created(a), created(b)});
        CHECK(fixture.fs->count(kFirstDir) == 4);
        CHECK(fetcher.cache_state().size() == 2);

        fixture.events.clear();
        report = fetcher.fetch_archives();
        CHECK(report.deleted == 0);
        CHECK(fixture.events.empty());
        CHECK(fetcher.cache_state().size() == 2);
        CHECK(fixture.listed_jobs() == 2);
    }

    SUBCASE("an undeletable cached job pushed past the limit is evicted once")
    {
        FetcherFixture fixture("fetcher-limit-read-only-cached");
        fixture.fs->add_job(kFirstDir, a);
        fixture.fs->add_job(kFirstDir, b);
        FetcherOptions options;
        options.retained_jobs = 2;
        auto &fetcher = fixture.make(options);
        fetcher.fetch_archives();

        fixture.events.clear();
        fixture.fs->set_read_only(kFirstDir, true);
        fixture.fs->prepend(kFirstDir, c, hm::test::make_job_bundle(c));
        auto report = fetcher.fetch_archives();
        CHECK(report.deleted == 1);
        CHECK(fixture.events == std::vector<ArchiveEvent>{created(c), deleted(b)});
        CHECK(fixture.fs->count(kFirstDir) == 3);
        CHECK_FALSE(fixture.store->exists(b));

        fixture.events.clear();
        report = fetcher.fetch_archives();
        CHECK(report.deleted == 0);
        CHECK(fixture.events.empty());
        CHECK(fetcher.cache_state().size() == 2);
    }

    SUBCASE("limit ignored when size cleanup is off")
    {
        FetcherFixture fixture("fetcher-limit-off");
        for (auto const &id : {a, b, c})
        {
            fixture.fs->add_job(kFirstDir, id);
        }
        FetcherOptions options;
        options.retained_jobs = 1;
        options.cleanup_beyond_limit = false;
        auto &fetcher = fixture.make(options);
        CHECK(fetcher.fetch_archives().created == 3);
        CHECK(fixture.fs->count(kFirstDir) == 3);
    }

    SUBCASE("limit applies per directory")
    {
        FetcherFixture fixture("fetcher-limit-per-dir");
        fixture.fs->add_job(kFirstDir, a);
        fixture.fs->add_job(kFirstDir, b);
        fixture.fs->add_job(kSecondDir, c);
        fixture.fs->add_job(kSecondDir, d);
        FetcherOptions options;
        options.retained_jobs = 1;
        auto &fetcher = fixture.make(options, true);
        auto report = fetcher.fetch_archives();
        CHECK(report.created == 2);
        CHECK(fixture.events == std::vector<ArchiveEvent>{created(a), created(c),
                                                          deleted(b), deleted(d)});
        CHECK(fixture.fs->count(kFirstDir) == 1);
        CHECK(fixture.fs->count(kSecondDir) == 1);
    }
}

TEST_CASE("a failing archive does not affect the others")
{
    FetcherFixture fixture("fetcher-containment");
    auto const broken = hm::test::job_id(1);
    auto const good = hm::test::job_id(2);
    auto const other = hm::test::job_id(3);
    fixture.fs->add(kFirstDir, broken, "{\"archive\": [");
    fixture.fs->add_job(kFirstDir, good);
    fixture.fs->add_job(kSecondDir, other);
    auto &fetcher = fixture.make({}, true);

    auto report = fetcher.fetch_archives();
    CHECK(report.completed);
    CHECK(report.failed_ingestions == 1);
    CHECK(fixture.events ==
          std::vector<ArchiveEvent>{created(good), created(other)});
    CHECK_FALSE(fetcher.cache_state().contains(kFirstDir, broken));
    CHECK_FALSE(fixture.store->exists(broken));

    // Failed archives are retried every cycle.
    fixture.events.clear();
    fixture.fs->add_job(kFirstDir, broken);
    report = fetcher.fetch_archives();
    CHECK(report.failed_ingestions == 0);
    CHECK(fixture.events == std::vector<ArchiveEvent>{created(broken)});
    CHECK(fixture.listed_jobs() == 3);
}

TEST_CASE("a partially written job is rolled back")
{
    FetcherFixture fixture("fetcher-rollback");
    auto const id = hm::test::job_id(1);
    fixture.fs->add(kFirstDir, id,
                    hm::test::make_bundle({
                        {"/jobs/overview", hm::test::job_overview_json(id)},
                        {"/jobs/" + id, "{}"},
                        {"/jobs/" + id + "/../../escape", "{}"},
                    }));
    auto &fetcher = fixture.make();

    auto report = fetcher.fetch_archives();
    CHECK(report.failed_ingestions == 1);
    CHECK(fixture.events.empty());
    CHECK_FALSE(fixture.store->exists(id));
    CHECK_FALSE(fixture.store->get("/jobs/" + id));
    CHECK(fixture.store->list_overviews().empty());
}

TEST_CASE("re-ingestion removes leftovers of an earlier attempt")
{
    struct Backend
    {
        hm::engine::StoreBackend backend;
        std::string_view tag;
    };
    for (auto const &backend :
         {Backend{hm::engine::StoreBackend::File, "fetcher-residue-file"},
          Backend{hm::engine::StoreBackend::KvStore, "fetcher-residue-kv"}})
    {
        CAPTURE(backend.tag);
        FetcherFixture fixture(backend.tag, backend.backend);
        auto const id = hm::test::job_id(1);
        auto const stale = "/jobs/" + id + "/stale";
        REQUIRE(fixture.store->put(id, stale, "{}"));
        fixture.fs->add_job(kFirstDir, id);
        auto &fetcher = fixture.make();

        auto report = fetcher.fetch_archives();
        CHECK(report.created == 1);
        CHECK(fixture.events == std::vector<ArchiveEvent>{created(id)});
        CHECK_FALSE(fixture.store->get(stale));
        CHECK(fixture.store->get("/jobs/" + id + "/vertices") ==
              R"({"vertices":[]})");
        CHECK(fixture.listed_jobs() == 1);
    }
}

TEST_CASE("documents of other jobs are ignored")
{
    FetcherFixture fixture("fetcher-foreign");
    auto const id = hm::test::job_id(1);
    auto const foreign = hm::test::job_id(2);
    fixture.fs->add(kFirstDir, id,
                    hm::test::make_bundle({
                        {"/jobs/overview", hm::test::job_overview_json(id)},
                        {"/jobs/" + id, "{}"},
                        {"/jobs/" + foreign, "{}"},
                    }));
    auto &fetcher = fixture.make();
    CHECK(fetcher.fetch_archives().created == 1);
    CHECK(fixture.store->get("/jobs/" + id) == "{}");
    CHECK_FALSE(fixture.store->get("/jobs/" + foreign));
}

TEST_CASE("legacy overviews are migrated during ingestion")
{
    FetcherFixture fixture("fetcher-legacy");
    auto const id = hm::test::job_id(1);
    auto const legacy = std::format(
        R"({{"finished":[{{"jid":"{}","name":"legacy","state":"FINISHED",)"
        R"("start-time":1,"end-time":3,"duration":2,"last-modification":3,)"
        R"("tasks":{{"total":3,"pending":3,"running":0,"finished":0,)"
        R"("canceling":0,"canceled":0,"failed":0}}}}]}})",
        id);
    fixture.fs->add(kFirstDir, id,
                    hm::test::make_bundle({{"/joboverview", legacy},
                                           {"/jobs/" + id, "{}"}}));
    auto &fetcher = fixture.make();
    CHECK(fetcher.fetch_archives().created == 1);

    auto overviews = fixture.store->list_overviews();
    REQUIRE(overviews.size() == 1);
    auto doc = hm::json::Document::parse(overviews.front().json);
    auto *job = yyjson_arr_get_first(yyjson_obj_get(doc.root(), "jobs"));
    CHECK(hm::json::get_string(job, "jid") == id);
    auto *tasks = yyjson_obj_get(job, "tasks");
    CHECK(hm::json::get_int64(tasks, "scheduled") == 3);
    CHECK(fixture.listed_jobs() == 1);

    SUBCASE("an invalid legacy overview fails the archive")
    {
        auto const broken = hm::test::job_id(2);
        fixture.fs->add(kFirstDir, broken,
                        hm::test::make_bundle(
                            {{"/joboverview", R"({"finished":[]})"}}));
        auto report = fetcher.fetch_archives();
        CHECK(report.failed_ingestions == 1);
        CHECK_FALSE(fixture.store->exists(broken));
    }
}

TEST_CASE("a job in two directories is mirrored once")
{
    FetcherFixture fixture("fetcher-duplicate");
    auto const id = hm::test::job_id(1);
    fixture.fs->add_job(kFirstDir, id);
    fixture.fs->add_job(kSecondDir, id);
    FetcherOptions options;
    options.cleanup_expired_jobs = true;
    auto &fetcher = fixture.make(options, true);

    fetcher.fetch_archives();
    CHECK(fixture.events == std::vector<ArchiveEvent>{created(id)});
    CHECK(fetcher.cache_state().contains(kFirstDir, id));
    CHECK(fetcher.cache_state().contains(kSecondDir, id));
    CHECK(fixture.listed_jobs() == 1);

    fixture.events.clear();
    fixture.fs->erase(kFirstDir, id);
    fetcher.fetch_archives();
    CHECK(fixture.events.empty());
    CHECK(fixture.store->exists(id));

    fixture.fs->erase(kSecondDir, id);
    fetcher.fetch_archives();
    CHECK(fixture.events == std::vector<ArchiveEvent>{deleted(id)});
    CHECK_FALSE(fixture.store->exists(id));
}

TEST_CASE("a throwing listener does not abort the cycle")
{
    FetcherFixture fixture("fetcher-listener");
    auto const first = hm::test::job_id(1);
    auto const second = hm::test::job_id(2);
    fixture.fs->add_job(kFirstDir, first);
    fixture.fs->add_job(kFirstDir, second);

    std::vector<std::string> seen;
    auto fetcher = hm::engine::ArchiveFetcher::create(
        {{kFirstDir, fixture.fs}}, fixture.store,
        [&seen](ArchiveEvent const &event)
        {
            seen.push_back(event.job_id);
            throw std::runtime_error("listener failure");
        },
        {});
    REQUIRE(fetcher);
    auto report = fetcher->fetch_archives();
    CHECK(report.completed);
    CHECK(seen == std::vector<std::string>{first, second});
    CHECK(fetcher->cache_state().size() == 2);
}
