/**
 * \file
 * Tests for elasticstream library.
 */
#include <gtest/gtest.h>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <stdexcept>
#include <ctime>
#include <cpr/cpr.h>

#include "elasticstream/logging.h"
#include "elasticstream/client.h"
#include "elasticstream/data-stream.h"

/// Let test to access internal client functions.
#include "client-impl.h"
/// Let test to access internal data stream functions.
#include "data-stream-impl.h"
/// Mocked cluster.
#include "http-mock.h"

namespace {


/// Simple log callback for elasticstream library.
void logCallback(elasticstream::LogLevel logLevel, const std::string &msg) {
    if (logLevel != elasticstream::LogLevel::DEBUG) {
        std::cout << "LOG " << elasticstream::logLevelName(logLevel) << ": " << msg << std::endl;
    }
}


} // anonymous namespace


namespace elasticstream {


httpmock::TestEnvironment<httpmock::MockServerHolder> *mockServerEnv = nullptr;


class ElasticstreamTest: public ::testing::Test {
  protected:
    void SetUp() override {
        getHttpMock().reset();
    }

    /// Client authenticated against the mocked cluster.
    std::shared_ptr<Client> createClient() {
        return std::make_shared<Client>(
                getMockedHosts(), Client::BasicAuthOption(MOCK_USERNAME, MOCK_PASSWORD));
    }
};


TEST_F(ElasticstreamTest, hostUrlNormalization) {
    ASSERT_EQ("http://elastic1.host:9200/", normalizeHostUrl("http://elastic1.host:9200"));
    ASSERT_EQ("http://elastic1.host:9200/", normalizeHostUrl("http://elastic1.host:9200/"));
    ASSERT_EQ("https://host/prefix/", normalizeHostUrl("https://host/prefix"));
    ASSERT_THROW(normalizeHostUrl(""), std::invalid_argument);
    const std::vector<std::string> noHosts;
    ASSERT_THROW(Client elasticClient(noHosts), std::invalid_argument);
}


TEST_F(ElasticstreamTest, hostsFailed) {
    Client elasticClient({"http://127.0.0.1:1/", "http://127.0.0.1:2/"});
    ASSERT_THROW(elasticClient.clusterHealth(), ConnectionException);
}


TEST_F(ElasticstreamTest, failoverToLiveHost) {
    // the first host is chosen randomly, so start at the dead one at least sometimes
    for (int i = 0; i < 10; ++i) {
        getHttpMock().reset();
        Client elasticClient({"http://127.0.0.1:1/", getMockedHosts().front()},
                             Client::BasicAuthOption(MOCK_USERNAME, MOCK_PASSWORD));
        ASSERT_EQ(200, elasticClient.clusterHealth().status_code);
        ASSERT_EQ(1UL, getHttpMock().getCalls().size());
    }
}


TEST_F(ElasticstreamTest, clientSendsCredentials) {
    std::shared_ptr<Client> elasticClient = createClient();
    cpr::Response r = elasticClient->clusterHealth();
    ASSERT_EQ(200, r.status_code);

    HTTPMock::CallData lastCallData = getHttpMock().getLastCallData();
    ASSERT_EQ("/_cluster/health", lastCallData.url);
    ASSERT_EQ("GET", lastCallData.method);
    ASSERT_EQ(MOCK_AUTHORIZATION, lastCallData.authorization);

    // without credentials the cluster refuses the request
    Client anonymousClient(getMockedHosts());
    r = anonymousClient.clusterHealth();
    ASSERT_EQ(401, r.status_code);
}


TEST_F(ElasticstreamTest, clientUrlPaths) {
    std::shared_ptr<Client> elasticClient = createClient();
    HTTPMock &httpMock = getHttpMock();

    ASSERT_EQ(200, elasticClient->getDataStream("logs").status_code);
    ASSERT_EQ("/_data_stream/logs", httpMock.getLastCallData().url);

    ASSERT_EQ(200, elasticClient->putIndexTemplate("new-template", "{}").status_code);
    ASSERT_EQ("/_index_template/new-template", httpMock.getLastCallData().url);
    ASSERT_EQ("PUT", httpMock.getLastCallData().method);
    ASSERT_EQ("{}", httpMock.getLastCallData().data);

    ASSERT_EQ(200, elasticClient->createDataStream("new").status_code);
    ASSERT_EQ("/_data_stream/new", httpMock.getLastCallData().url);
    ASSERT_EQ("PUT", httpMock.getLastCallData().method);

    ASSERT_EQ(200, elasticClient->rollover("new").status_code);
    ASSERT_EQ("/new/_rollover", httpMock.getLastCallData().url);
    ASSERT_EQ("POST", httpMock.getLastCallData().method);

    ASSERT_EQ(200, elasticClient->getIndex(".ds-logs-000001").status_code);
    ASSERT_EQ("/.ds-logs-000001", httpMock.getLastCallData().url);

    ASSERT_EQ(200, elasticClient->deleteIndex(".ds-logs-000001").status_code);
    ASSERT_EQ("/.ds-logs-000001", httpMock.getLastCallData().url);
    ASSERT_EQ("DELETE", httpMock.getLastCallData().method);

    ASSERT_THROW(elasticClient->getIndex(""), std::invalid_argument);
    ASSERT_THROW(elasticClient->rollover(""), std::invalid_argument);
}


TEST_F(ElasticstreamTest, indexTemplateBody) {
    ASSERT_EQ("logs-template", indexTemplateName("logs"));
    ASSERT_EQ("{\"data_stream\":{},\"index_patterns\":\"logs\",\"priority\":100}",
              createIndexTemplateBody("logs", 100));
}


TEST_F(ElasticstreamTest, errorTypeParsing) {
    std::string errorType;
    ASSERT_TRUE(parseErrorType(
            "{\"error\": {\"root_cause\": [], \"type\": \"resource_already_exists_exception\","
            " \"reason\": \"data_stream [logs] already exists\"}, \"status\": 400}",
            errorType));
    ASSERT_EQ("resource_already_exists_exception", errorType);

    ASSERT_FALSE(parseErrorType("Bad Request", errorType));
    ASSERT_FALSE(parseErrorType("{\"error\": \"plain text\"}", errorType));
    ASSERT_FALSE(parseErrorType("{\"acknowledged\": true}", errorType));
}


TEST_F(ElasticstreamTest, descriptorParsing) {
    std::vector<std::string> indexNames;
    ASSERT_TRUE(parseBackingIndexNames(
            "{\"data_streams\": [{\"name\": \"logs\", \"indices\": ["
            "{\"index_name\": \".ds-logs-000001\", \"index_uuid\": \"a\"},"
            "{\"index_name\": \".ds-logs-000002\", \"index_uuid\": \"b\"}]}]}",
            indexNames));
    ASSERT_EQ((std::vector<std::string>{".ds-logs-000001", ".ds-logs-000002"}), indexNames);

    ASSERT_TRUE(parseBackingIndexNames(
            "{\"data_streams\": [{\"name\": \"logs\", \"indices\": []}]}", indexNames));
    ASSERT_TRUE(indexNames.empty());

    ASSERT_FALSE(parseBackingIndexNames("{\"data_streams\": []}", indexNames));
    ASSERT_FALSE(parseBackingIndexNames("{\"data_streams\": [{\"name\": \"logs\"}]}",
                                        indexNames));
    ASSERT_FALSE(parseBackingIndexNames(
            "{\"data_streams\": [{\"indices\": [{\"index_uuid\": \"a\"}]}]}", indexNames));
    ASSERT_FALSE(parseBackingIndexNames("[1, 2]", indexNames));
}


TEST_F(ElasticstreamTest, creationDateParsing) {
    std::int64_t creationTime = 0;
    ASSERT_TRUE(parseCreationDate(
            "{\"idx\": {\"settings\": {\"index\": {\"creation_date\": \"1700000000999\"}}}}",
            "idx", creationTime));
    ASSERT_EQ(1700000000999, creationTime);

    ASSERT_TRUE(parseCreationDate(
            "{\"idx\": {\"settings\": {\"index\": {\"creation_date\": 1600000000000}}}}",
            "idx", creationTime));
    ASSERT_EQ(1600000000000, creationTime);

    ASSERT_FALSE(parseCreationDate(
            "{\"idx\": {\"settings\": {\"index\": {\"creation_date\": \"yesterday\"}}}}",
            "idx", creationTime));
    ASSERT_FALSE(parseCreationDate(
            "{\"idx\": {\"settings\": {\"index\": {}}}}", "idx", creationTime));
    ASSERT_FALSE(parseCreationDate(
            "{\"other\": {\"settings\": {\"index\": {\"creation_date\": \"1\"}}}}",
            "idx", creationTime));
    // out of int64 range
    ASSERT_FALSE(parseCreationDate(
            "{\"idx\": {\"settings\": {\"index\": "
            "{\"creation_date\": 18446744073709551615}}}}",
            "idx", creationTime));
    ASSERT_FALSE(parseCreationDate(
            "{\"idx\": {\"settings\": {\"index\": "
            "{\"creation_date\": \"18446744073709551615\"}}}}",
            "idx", creationTime));
    ASSERT_FALSE(parseCreationDate(
            "{\"idx\": {\"settings\": {\"index\": {\"creation_date\": 1600000000000.5}}}}",
            "idx", creationTime));
    ASSERT_EQ(1600000000000, creationTime);
}


TEST_F(ElasticstreamTest, retentionBoundary) {
    const std::int64_t now = 1700000000000;
    const std::int64_t week = 7 * MILLISECONDS_PER_DAY;
    // index exactly of retention age is kept
    ASSERT_FALSE(exceedsRetention(now - week, now, 7));
    // fraction of second over the retention period is enough
    ASSERT_TRUE(exceedsRetention(now - week - 1, now, 7));
    ASSERT_TRUE(exceedsRetention(now - week - 500, now, 7));
    ASSERT_FALSE(exceedsRetention(now - week + 1, now, 7));
    ASSERT_TRUE(exceedsRetention(now - 1, now, 0));
    ASSERT_FALSE(exceedsRetention(now, now, 0));
}


TEST_F(ElasticstreamTest, checkConnection) {
    DataStreamAdmin admin(createClient());
    ASSERT_NO_THROW(admin.checkConnection());

    DataStreamAdmin wrongPassword(getMockedHosts(), MOCK_USERNAME, "wrong");
    ASSERT_THROW(wrongPassword.checkConnection(), ConnectionException);

    DataStreamAdmin unreachable({"http://127.0.0.1:1/"}, MOCK_USERNAME, MOCK_PASSWORD);
    ASSERT_THROW(unreachable.checkConnection(), ConnectionException);
}


TEST_F(ElasticstreamTest, exists) {
    DataStreamAdmin admin(getMockedHosts(), MOCK_USERNAME, MOCK_PASSWORD);
    ASSERT_TRUE(admin.exists("logs"));
    ASSERT_FALSE(admin.exists("missing"));
    // server error is reported as non-existing data stream as well
    ASSERT_FALSE(admin.exists("broken"));
    ASSERT_THROW(admin.exists(""), std::invalid_argument);
}


TEST_F(ElasticstreamTest, create) {
    LogRecorder logRecorder;
    DataStreamAdmin admin(createClient(), logRecorder.callback());
    HTTPMock &httpMock = getHttpMock();

    ASSERT_EQ(Outcome::DONE, admin.create("metrics"));
    ASSERT_TRUE(httpMock.hasTemplate("metrics-template"));
    ASSERT_TRUE(admin.exists("metrics"));

    const std::vector<HTTPMock::CallData> calls = httpMock.getCalls();
    ASSERT_LE(2UL, calls.size());
    ASSERT_EQ("PUT", calls[0].method);
    ASSERT_EQ("/_index_template/metrics-template", calls[0].url);
    ASSERT_EQ("{\"data_stream\":{},\"index_patterns\":\"metrics\",\"priority\":100}",
              calls[0].data);
    ASSERT_EQ("PUT", calls[1].method);
    ASSERT_EQ("/_data_stream/metrics", calls[1].url);

    ASSERT_TRUE(logRecorder.contains(LogLevel::INFO, "Created index template metrics-template"));
    ASSERT_TRUE(logRecorder.contains(LogLevel::INFO, "Created data stream metrics"));
}


TEST_F(ElasticstreamTest, createIsIdempotent) {
    LogRecorder logRecorder;
    DataStreamAdmin admin(createClient(), logRecorder.callback());
    HTTPMock &httpMock = getHttpMock();

    ASSERT_EQ(Outcome::DONE, admin.create("metrics"));
    const std::size_t callsBefore = httpMock.getCalls().size();

    ASSERT_EQ(Outcome::ALREADY_EXISTS, admin.create("metrics"));
    ASSERT_TRUE(logRecorder.contains(LogLevel::INFO, "Data stream metrics already exists"));

    // template upsert and data stream creation, nothing else
    const std::vector<HTTPMock::CallData> calls = httpMock.getCalls();
    ASSERT_EQ(callsBefore + 2, calls.size());
    ASSERT_EQ("PUT", calls.back().method);
    ASSERT_EQ("/_data_stream/metrics", calls.back().url);

    // data stream existing before the first call
    ASSERT_EQ(Outcome::ALREADY_EXISTS, admin.create("logs"));
    ASSERT_EQ(2UL, httpMock.getBackingIndices("logs").size());
}


TEST_F(ElasticstreamTest, createFailures) {
    LogRecorder logRecorder;
    DataStreamAdmin admin(createClient(), logRecorder.callback());
    HTTPMock &httpMock = getHttpMock();

    try {
        admin.create("forbidden");
        FAIL() << "ResponseException expected";
    } catch (const ResponseException &ex) {
        ASSERT_EQ(403, ex.getStatusCode());
        ASSERT_NE(std::string::npos, ex.getBody().find("security_exception"));
    }
    // data stream creation was not attempted
    ASSERT_EQ("/_index_template/forbidden-template", httpMock.getLastCallData().url);

    // 400 other than "already exists" is a failure
    try {
        admin.create("invalid");
        FAIL() << "ResponseException expected";
    } catch (const ResponseException &ex) {
        ASSERT_EQ(400, ex.getStatusCode());
    }

    ASSERT_THROW(admin.create(""), std::invalid_argument);
}


TEST_F(ElasticstreamTest, rollover) {
    LogRecorder logRecorder;
    DataStreamAdmin admin(createClient(), logRecorder.callback());
    HTTPMock &httpMock = getHttpMock();

    ASSERT_EQ(Outcome::DONE, admin.rollover("logs"));
    ASSERT_EQ(3UL, httpMock.getBackingIndices("logs").size());
    ASSERT_EQ("POST", httpMock.getLastCallData().method);
    ASSERT_EQ("/logs/_rollover", httpMock.getLastCallData().url);
    ASSERT_TRUE(logRecorder.contains(LogLevel::INFO, "Rolled over data stream logs"));
}


TEST_F(ElasticstreamTest, rolloverMissingDataStream) {
    LogRecorder logRecorder;
    DataStreamAdmin admin(createClient(), logRecorder.callback());
    HTTPMock &httpMock = getHttpMock();

    ASSERT_EQ(Outcome::NOT_FOUND, admin.rollover("missing"));
    ASSERT_TRUE(logRecorder.contains(LogLevel::ERROR, "Data stream missing does not exist"));

    // only the existence check was sent
    const std::vector<HTTPMock::CallData> calls = httpMock.getCalls();
    ASSERT_EQ(1UL, calls.size());
    ASSERT_EQ("GET", calls[0].method);
    ASSERT_EQ("/_data_stream/missing", calls[0].url);
}


TEST_F(ElasticstreamTest, deleteIndex) {
    LogRecorder logRecorder;
    DataStreamAdmin admin(createClient(), logRecorder.callback());
    HTTPMock &httpMock = getHttpMock();

    admin.deleteIndex(".ds-logs-000002");
    ASSERT_EQ(std::vector<std::string>{".ds-logs-000002"}, httpMock.getDeletedIndices());
    ASSERT_TRUE(logRecorder.contains(LogLevel::INFO, "Deleted index .ds-logs-000002"));

    try {
        admin.deleteIndex(".ds-logs-000002");
        FAIL() << "ResponseException expected";
    } catch (const ResponseException &ex) {
        ASSERT_EQ(404, ex.getStatusCode());
    }
}


TEST_F(ElasticstreamTest, backingIndices) {
    LogRecorder logRecorder;
    DataStreamAdmin admin(createClient(), logRecorder.callback());
    const std::int64_t now = static_cast<std::int64_t>(std::time(nullptr)) * 1000;

    const std::vector<BackingIndex> indices = admin.backingIndices("logs");
    ASSERT_EQ(2UL, indices.size());
    ASSERT_EQ(".ds-logs-000001", indices[0].name);
    ASSERT_NEAR(now - 8 * MILLISECONDS_PER_DAY, indices[0].creationTime, 5000);
    ASSERT_EQ(".ds-logs-000002", indices[1].name);
    ASSERT_NEAR(now - MILLISECONDS_PER_DAY, indices[1].creationTime, 5000);

    ASSERT_THROW(admin.backingIndices("missing"), ResponseException);
    ASSERT_THROW(admin.backingIndices("corrupt"), ResponseException);
    ASSERT_THROW(admin.creationTime(".ds-missing-000001"), ResponseException);
}


TEST_F(ElasticstreamTest, cleanOldIndices) {
    LogRecorder logRecorder;
    DataStreamAdmin admin(createClient(), logRecorder.callback());
    HTTPMock &httpMock = getHttpMock();

    ASSERT_EQ(Outcome::DONE, admin.cleanOldIndices("logs", 7));
    ASSERT_EQ(std::vector<std::string>{".ds-logs-000001"}, httpMock.getDeletedIndices());
    ASSERT_EQ(std::vector<std::string>{".ds-logs-000002"}, httpMock.getBackingIndices("logs"));

    ASSERT_TRUE(logRecorder.contains(LogLevel::INFO, "Deleting index .ds-logs-000001"));
    ASSERT_FALSE(logRecorder.contains(LogLevel::INFO, "Deleting index .ds-logs-000002"));
    // completion is the last message
    ASSERT_FALSE(logRecorder.getRecords().empty());
    ASSERT_EQ("Finished cleaning data stream logs", logRecorder.getRecords().back().second);

    // nothing more to delete, completion is logged anyway
    ASSERT_EQ(Outcome::DONE, admin.cleanOldIndices("logs", 7));
    ASSERT_EQ(1UL, httpMock.getDeletedIndices().size());
    ASSERT_EQ("Finished cleaning data stream logs", logRecorder.getRecords().back().second);
}


TEST_F(ElasticstreamTest, cleanWithZeroRetention) {
    LogRecorder logRecorder;
    DataStreamAdmin admin(createClient(), logRecorder.callback());
    HTTPMock &httpMock = getHttpMock();

    ASSERT_EQ(Outcome::DONE, admin.cleanOldIndices("logs", 0));
    ASSERT_EQ(2UL, httpMock.getDeletedIndices().size());
    ASSERT_TRUE(httpMock.getBackingIndices("logs").empty());
}


TEST_F(ElasticstreamTest, cleanMissingDataStream) {
    LogRecorder logRecorder;
    DataStreamAdmin admin(createClient(), logRecorder.callback());
    HTTPMock &httpMock = getHttpMock();

    ASSERT_EQ(Outcome::NOT_FOUND, admin.cleanOldIndices("missing", 7));
    ASSERT_TRUE(logRecorder.contains(LogLevel::ERROR, "Data stream missing does not exist"));
    ASSERT_EQ(1UL, httpMock.getCalls().size());
    ASSERT_TRUE(httpMock.getDeletedIndices().empty());

    // unreadable descriptor aborts the cleanup
    ASSERT_THROW(admin.cleanOldIndices("corrupt", 7), ResponseException);
}


TEST_F(ElasticstreamTest, injectedLogCallback) {
    LogRecorder injected;
    LogRecorder global;
    setLogFunction(global.callback());

    DataStreamAdmin admin(createClient(), injected.callback());
    admin.checkConnection();
    setLogFunction(logCallback);

    ASSERT_TRUE(injected.contains(LogLevel::INFO, "Connection to Elasticsearch successful"));
    ASSERT_FALSE(global.contains(LogLevel::INFO, "Connection to Elasticsearch successful"));
}


}  // namespace elasticstream


int main(int argc, char *argv[]) {
    elasticstream::setLogFunction(logCallback);
    ::testing::InitGoogleTest(&argc, argv);

    ::testing::Environment * const env = ::testing::AddGlobalTestEnvironment(
            httpmock::createMockServerEnvironment<elasticstream::HTTPMock>(
                    elasticstream::MOCK_PORT));

    // set global env pointer
    elasticstream::mockServerEnv =
        dynamic_cast<httpmock::TestEnvironment<httpmock::MockServerHolder> *>(env);

    return RUN_ALL_TESTS();
}
