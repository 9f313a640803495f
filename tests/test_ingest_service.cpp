// tests/test_ingest_service.cpp
#include <cstdlib>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>

#include "ingest_service.hpp"
#include "memory_sink.hpp"
#include "util.hpp"
#include "wire.hpp"

using json = nlohmann::json;

struct IngestFixture : ::testing::Test
{
    JobStore      store;
    MemorySink    sink;
    IngestService svc{store, &sink, "http://collector.test/"};

    static std::string chunk_body(const std::string &job, int index, int total, const std::string &bytes)
    {
        ChunkMessage m;
        m.job_id   = job;
        m.index    = index;
        m.total    = total;
        m.is_last  = index == total - 1;
        m.bytes    = bytes;
        m.metadata = {{"url", "http://example.com"}, {"title", "T"}};
        return encode_message(m);
    }
    static std::string fin_body(const std::string &job, int total)
    {
        return encode_message(FinalizationMessage{job, total});
    }
};

TEST_F(IngestFixture, ChunkReply202)
{
    HttpReply r = svc.ingest(chunk_body("job_1", 0, 2, "ab"));
    EXPECT_EQ(r.status, 202);
    EXPECT_EQ(r.body["jobId"], "job_1");
    EXPECT_EQ(r.body["trackUrl"], "http://collector.test/jobs/job_1");
    EXPECT_EQ(r.body["chunkReceived"], 1);
    EXPECT_EQ(r.body["totalChunks"], 2);
    EXPECT_EQ(r.body["isComplete"], false);
    EXPECT_TRUE(sink.captures.empty());
}

TEST_F(IngestFixture, CompletionDeliversOnceToSink)
{
    svc.ingest(chunk_body("job_2", 1, 2, "cd"));
    HttpReply r = svc.ingest(chunk_body("job_2", 0, 2, "ab"));
    EXPECT_EQ(r.status, 202);
    EXPECT_EQ(r.body["chunkReceived"], 1);
    EXPECT_EQ(r.body["isComplete"], true);
    ASSERT_EQ(sink.captures.size(), 1u);
    EXPECT_EQ(sink.captures[0].payload, "abcd");
    EXPECT_EQ(sink.captures[0].metadata["title"], "T");

    // A repeat of the last chunk does not deliver again.
    svc.ingest(chunk_body("job_2", 0, 2, "ab"));
    EXPECT_EQ(sink.captures.size(), 1u);
}

TEST_F(IngestFixture, FinalizationReply200)
{
    svc.ingest(chunk_body("job_3", 0, 1, "x"));
    HttpReply r = svc.ingest(fin_body("job_3", 1));
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.body["status"], "finalized");
    EXPECT_EQ(r.body["chunksReceived"], 1);
    EXPECT_EQ(r.body["totalExpected"], 1);

    HttpReply s = svc.job_status("job_3");
    EXPECT_EQ(s.status, 200);
    EXPECT_EQ(s.body["status"], "finalized");
    EXPECT_EQ(s.body["finalized"], true);
}

TEST_F(IngestFixture, FinalizationUnknownJob404)
{
    HttpReply r = svc.ingest(fin_body("job_missing", 2));
    EXPECT_EQ(r.status, 404);
    EXPECT_EQ(r.body["error"], "Not Found");
    EXPECT_TRUE(r.body.contains("message"));
}

TEST_F(IngestFixture, StatusUnknownJob404)
{
    HttpReply r = svc.job_status("job_never");
    EXPECT_EQ(r.status, 404);
}

TEST_F(IngestFixture, StatusWhileReceiving)
{
    svc.ingest(chunk_body("job_4", 2, 3, "c"));
    HttpReply s = svc.job_status("job_4");
    EXPECT_EQ(s.status, 200);
    EXPECT_EQ(s.body["jobId"], "job_4");
    EXPECT_EQ(s.body["status"], "receiving");
    EXPECT_EQ(s.body["chunksReceived"], 1);
    EXPECT_EQ(s.body["totalExpected"], 3);
    EXPECT_EQ(s.body["finalized"], false);
}

TEST_F(IngestFixture, ValidationFailures400)
{
    HttpReply r = svc.ingest("{not json");
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(r.body["error"], "Bad Request");

    r = svc.ingest(R"({"version":"0","jobId":"j"})");
    EXPECT_EQ(r.status, 400);

    svc.ingest(chunk_body("job_5", 0, 2, "a"));
    r = svc.ingest(chunk_body("job_5", 1, 3, "b"));
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(svc.job_status("job_5").body["chunksReceived"], 1);
}

TEST_F(IngestFixture, WrappingIndexDoesNotOverwriteChunkZero)
{
    svc.ingest(chunk_body("job_5w", 0, 2, "real"));
    json j                          = json::parse(chunk_body("job_5w", 1, 2, "fake"));
    j["transfer"]["chunk"]["index"] = 4294967296LL;
    HttpReply r                     = svc.ingest(j.dump());
    EXPECT_EQ(r.status, 400);

    svc.ingest(chunk_body("job_5w", 1, 2, "tail"));
    ASSERT_EQ(sink.captures.size(), 1u);
    EXPECT_EQ(sink.captures[0].payload, "realtail");
}

TEST_F(IngestFixture, BadBase64Is400)
{
    json j       = json::parse(chunk_body("job_5b", 0, 1, "x"));
    j["payload"] = "AB=C";
    EXPECT_EQ(svc.ingest(j.dump()).status, 400);
    EXPECT_EQ(svc.job_status("job_5b").status, 404);
}

TEST_F(IngestFixture, BearerTokenPassesThrough)
{
    HttpReply r = svc.ingest(chunk_body("job_6", 0, 1, "x"), "Bearer secret");
    EXPECT_EQ(r.status, 202);
    ASSERT_EQ(sink.captures.size(), 1u);
    EXPECT_TRUE(sink.captures[0].auth_token_used);

    r = svc.ingest(chunk_body("job_7", 0, 1, "x"), "Basic dXNlcjpwdw==");
    EXPECT_EQ(r.status, 401);
    EXPECT_EQ(r.body["error"], "Unauthorized");
    EXPECT_EQ(svc.job_status("job_7").status, 404);
}

TEST_F(IngestFixture, SinkFailureIs500AndResendDelivers)
{
    sink.fail_next = true;
    HttpReply r    = svc.ingest(chunk_body("job_8", 0, 1, "x"));
    EXPECT_EQ(r.status, 500);
    EXPECT_EQ(r.body["error"], "Internal Server Error");
    EXPECT_TRUE(sink.captures.empty());

    HttpReply s = svc.job_status("job_8");
    EXPECT_EQ(s.body["status"], "complete");
    EXPECT_EQ(s.body["delivered"], false);
    EXPECT_EQ(store.payload("job_8"), std::string("x"));

    // The client resends the chunk after the 500.
    r = svc.ingest(chunk_body("job_8", 0, 1, "x"));
    EXPECT_EQ(r.status, 202);
    EXPECT_EQ(r.body["isComplete"], true);
    ASSERT_EQ(sink.captures.size(), 1u);
    EXPECT_EQ(sink.captures[0].payload, "x");
    EXPECT_EQ(svc.job_status("job_8").body["delivered"], true);

    // Delivered captures are not kept in memory or stored twice.
    EXPECT_FALSE(store.payload("job_8").has_value());
    svc.ingest(chunk_body("job_8", 0, 1, "x"));
    EXPECT_EQ(sink.captures.size(), 1u);
}

TEST_F(IngestFixture, FinalizationRetriesFailedDelivery)
{
    svc.ingest(chunk_body("job_8f", 0, 2, "ab"));
    sink.fail_next = true;
    EXPECT_EQ(svc.ingest(chunk_body("job_8f", 1, 2, "cd")).status, 500);
    EXPECT_TRUE(sink.captures.empty());

    HttpReply f = svc.ingest(fin_body("job_8f", 2));
    EXPECT_EQ(f.status, 200);
    EXPECT_EQ(f.body["status"], "finalized");
    ASSERT_EQ(sink.captures.size(), 1u);
    EXPECT_EQ(sink.captures[0].payload, "abcd");
    EXPECT_EQ(svc.job_status("job_8f").body["delivered"], true);
}

TEST_F(IngestFixture, FinalizationReports500WhenSinkStillFails)
{
    sink.fail_next = true;
    EXPECT_EQ(svc.ingest(chunk_body("job_8g", 0, 1, "z")).status, 500);
    sink.fail_next = true;
    EXPECT_EQ(svc.ingest(fin_body("job_8g", 1)).status, 500);
    EXPECT_EQ(svc.job_status("job_8g").body["delivered"], false);

    EXPECT_EQ(svc.ingest(fin_body("job_8g", 1)).status, 200);
    ASSERT_EQ(sink.captures.size(), 1u);
    EXPECT_EQ(sink.captures[0].payload, "z");
}

TEST_F(IngestFixture, HealthInfoStats)
{
    svc.ingest(chunk_body("job_9", 0, 2, "x"));
    HttpReply h = svc.health();
    EXPECT_EQ(h.status, 200);
    EXPECT_EQ(h.body["status"], "ok");
    EXPECT_EQ(h.body["activeJobs"], 1);

    EXPECT_EQ(svc.info().body["endpoints"]["ingest"], "POST /ingest");

    svc.ingest(chunk_body("job_10", 0, 1, "y"));
    HttpReply s = svc.stats();
    EXPECT_EQ(s.body["totalSnapshots"], 1);
    EXPECT_EQ(s.body["database"], "memory");
}

TEST(IngestService, WorksWithoutSink)
{
    JobStore      store;
    IngestService svc(store, nullptr, "http://h");
    ChunkMessage  m;
    m.job_id = "job_ns";
    m.total  = 1;
    m.bytes  = "z";
    EXPECT_EQ(svc.ingest(encode_message(m)).status, 202);
    EXPECT_EQ(store.payload("job_ns"), std::string("z"));
    EXPECT_EQ(svc.stats().body["totalSnapshots"], 0);
}

struct EnvGuard
{
    std::string key, old_val;
    bool        had = false;
    explicit EnvGuard(const char *k) : key(k)
    {
        const char *v = std::getenv(k);
        if (v)
        {
            had     = true;
            old_val = v;
        }
    }
    void set(const std::string &v) const { ::setenv(key.c_str(), v.c_str(), 1); }
    ~EnvGuard()
    {
        if (had)
            ::setenv(key.c_str(), old_val.c_str(), 1);
        else
            ::unsetenv(key.c_str());
    }
};

TEST(CollectorConfig, FromEnv)
{
    EnvGuard port("COLLECTOR_PORT"), ret("COLLECTOR_RETENTION_S"), ttl("COLLECTOR_INCOMPLETE_TTL_S");
    port.set("8123");
    ret.set("5");
    ttl.set("not-a-number");

    CollectorConfig cfg = collector_config_from_env();
    EXPECT_EQ(cfg.port, 8123);
    EXPECT_EQ(cfg.limits.retention.count(), 5);
    EXPECT_EQ(cfg.limits.incomplete_ttl.count(), 1800);
}
