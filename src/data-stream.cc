/**
 * \file
 * Implementation of the data stream administration.
 */

#include "data-stream-impl.h"

#include <chrono>
#include <cstdlib>
#include <cerrno>
#include <cpr/cpr.h>
#include <json/json.h>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include "logging-impl.h"
#include "elasticstream/client.h"


namespace {


/// Check the data stream name is usable in url path.
void validateDataStreamName(const std::string &dataStreamName) {
    if (dataStreamName.empty()) {
        throw std::invalid_argument("Data stream name can not be empty.");
    }
}


/// Parse elastic json \p result into \p root. Return false on malformed json.
bool parseJson(const std::string &result, Json::Value &root) {
    Json::Reader reader;
    // parse elastic json result without comments (false at the end)
    return reader.parse(result, root, false) && root.isObject();
}


} // anonymous namespace


namespace elasticstream {


const int DataStreamAdmin::INDEX_TEMPLATE_PRIORITY = 100;


std::string indexTemplateName(const std::string &dataStreamName) {
    return dataStreamName + "-template";
}


std::string createIndexTemplateBody(const std::string &dataStreamName, int priority) {
    Json::Value body(Json::objectValue);
    body["index_patterns"] = dataStreamName;
    body["data_stream"] = Json::Value(Json::objectValue);
    body["priority"] = priority;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, body);
}


bool parseErrorType(const std::string &result, std::string &errorType) {
    Json::Value root;
    if (!parseJson(result, root)) {
        return false;
    }

    // Expected response:
    // {"error": {"root_cause": [...], "type": string, "reason": string}, "status": 400}
    const Json::Value &error = root["error"];
    if (!error.isObject()) {
        return false;
    }
    const Json::Value &type = error["type"];
    if (!type.isString()) {
        return false;
    }
    errorType = type.asString();
    return true;
}


bool parseBackingIndexNames(const std::string &result, std::vector<std::string> &indexNames) {
    Json::Value root;
    if (!parseJson(result, root)) {
        return false;
    }

    // Expected response:
    // {"data_streams": [
    //     {"name": string,
    //      "timestamp_field": {"name": "@timestamp"},
    //      "indices": [{"index_name": string, "index_uuid": string}],
    //      "generation": int,
    //      ...}
    //  ]}
    const Json::Value &dataStreams = root["data_streams"];
    if (!dataStreams.isArray() || dataStreams.empty()) {
        return false;
    }
    const Json::Value &dataStream = dataStreams[0];
    if (!dataStream.isObject() || !dataStream["indices"].isArray()) {
        return false;
    }

    std::vector<std::string> names;
    for (const Json::Value &index: dataStream["indices"]) {
        if (!index.isObject() || !index["index_name"].isString()) {
            return false;
        }
        names.push_back(index["index_name"].asString());
    }
    indexNames.swap(names);
    return true;
}


bool parseCreationDate(const std::string &result, const std::string &indexName,
                       std::int64_t &creationTime)
{
    Json::Value root;
    if (!parseJson(result, root)) {
        return false;
    }

    // Expected response:
    // {"<indexName>": {
    //     "aliases": {}, "mappings": {},
    //     "settings": {"index": {"creation_date": "1700000000000", ...}}}}
    const Json::Value &index = root[indexName];
    if (!index.isObject() || !index["settings"].isObject()) {
        return false;
    }
    const Json::Value &indexSettings = index["settings"]["index"];
    if (!indexSettings.isObject()) {
        return false;
    }

    const Json::Value &creationDate = indexSettings["creation_date"];
    std::int64_t creationMs = 0;
    if (creationDate.isString()) {
        // elastic sends all settings as strings
        const std::string value = creationDate.asString();
        char *end = nullptr;
        errno = 0;
        const long long parsed = std::strtoll(value.c_str(), &end, 10);
        if (value.empty() || *end != '\0' || errno == ERANGE) {
            return false;
        }
        creationMs = parsed;
    } else if (creationDate.isInt64()) {
        creationMs = creationDate.asInt64();
    } else {
        return false;
    }

    creationTime = creationMs;
    return true;
}


bool exceedsRetention(std::int64_t creationTime, std::int64_t now,
                      std::uint32_t retentionPeriodDays)
{
    return now - creationTime
        > static_cast<std::int64_t>(retentionPeriodDays) * MILLISECONDS_PER_DAY;
}


void DataStreamAdmin::Implementation::log(LogLevel logLevel, const std::string &message) const {
    if (logCallback) {
        logCallback(logLevel, message);
    } else {
        elasticstream::log(logLevel, message);
    }
}


void DataStreamAdmin::Implementation::raiseForStatus(
        const cpr::Response &response, const std::string &request) const
{
    if (response.status_code / 100 == 2) {
        return;
    }
    log(LogLevel::DEBUG, fmt::format("{} failed, response text: {}", request, response.text));
    throw ResponseException(
            fmt::format("{} failed with HTTP status {}.", request, response.status_code),
            response.status_code, response.text);
}


DataStreamAdmin::DataStreamAdmin(const std::shared_ptr<Client> &client,
                                 LogCallback logCallback)
  : impl(new Implementation(client, std::move(logCallback)))
{}


DataStreamAdmin::DataStreamAdmin(const std::vector<std::string> &hostUrlList,
                                 const std::string &username,
                                 const std::string &password,
                                 LogCallback logCallback)
  : impl(new Implementation(
              std::make_shared<Client>(hostUrlList, Client::BasicAuthOption(username, password)),
              std::move(logCallback)))
{}


DataStreamAdmin::DataStreamAdmin(DataStreamAdmin &&) = default;


DataStreamAdmin::~DataStreamAdmin() {}


void DataStreamAdmin::checkConnection() {
    const cpr::Response r = impl->client->clusterHealth();
    if (r.status_code / 100 != 2) {
        throw ConnectionException(
                fmt::format("Cluster health check failed with HTTP status {}.", r.status_code));
    }
    impl->log(LogLevel::INFO, "Connection to Elasticsearch successful");
}


bool DataStreamAdmin::exists(const std::string &dataStreamName) {
    validateDataStreamName(dataStreamName);
    // 404 is not distinguished from other failures here
    return impl->client->getDataStream(dataStreamName).status_code == 200;
}


Outcome DataStreamAdmin::create(const std::string &dataStreamName) {
    validateDataStreamName(dataStreamName);

    const std::string templateName = indexTemplateName(dataStreamName);
    cpr::Response r = impl->client->putIndexTemplate(
            templateName, createIndexTemplateBody(dataStreamName, INDEX_TEMPLATE_PRIORITY));
    impl->raiseForStatus(r, "PUT _index_template/" + templateName);
    impl->log(LogLevel::INFO, fmt::format("Created index template {}", templateName));

    r = impl->client->createDataStream(dataStreamName);
    if (r.status_code == 400) {
        std::string errorType;
        if (parseErrorType(r.text, errorType)
            && errorType == "resource_already_exists_exception")
        {
            impl->log(LogLevel::INFO,
                      fmt::format("Data stream {} already exists", dataStreamName));
            return Outcome::ALREADY_EXISTS;
        }
    }
    impl->raiseForStatus(r, "PUT _data_stream/" + dataStreamName);
    impl->log(LogLevel::INFO, fmt::format("Created data stream {}", dataStreamName));
    return Outcome::DONE;
}


Outcome DataStreamAdmin::rollover(const std::string &dataStreamName) {
    if (!exists(dataStreamName)) {
        impl->log(LogLevel::ERROR, fmt::format("Data stream {} does not exist", dataStreamName));
        return Outcome::NOT_FOUND;
    }

    const cpr::Response r = impl->client->rollover(dataStreamName);
    impl->raiseForStatus(r, "POST " + dataStreamName + "/_rollover");
    impl->log(LogLevel::INFO, fmt::format("Rolled over data stream {}", dataStreamName));
    return Outcome::DONE;
}


void DataStreamAdmin::deleteIndex(const std::string &indexName) {
    const cpr::Response r = impl->client->deleteIndex(indexName);
    impl->raiseForStatus(r, "DELETE " + indexName);
    impl->log(LogLevel::INFO, fmt::format("Deleted index {}", indexName));
}


std::int64_t DataStreamAdmin::creationTime(const std::string &indexName) {
    const cpr::Response r = impl->client->getIndex(indexName);
    impl->raiseForStatus(r, "GET " + indexName);

    std::int64_t created = 0;
    if (!parseCreationDate(r.text, indexName, created)) {
        throw ResponseException(
                fmt::format("Response of GET {} has no creation date.", indexName),
                r.status_code, r.text);
    }
    return created;
}


std::vector<BackingIndex> DataStreamAdmin::backingIndices(const std::string &dataStreamName) {
    validateDataStreamName(dataStreamName);

    const cpr::Response r = impl->client->getDataStream(dataStreamName);
    impl->raiseForStatus(r, "GET _data_stream/" + dataStreamName);

    std::vector<std::string> indexNames;
    if (!parseBackingIndexNames(r.text, indexNames)) {
        throw ResponseException(
                fmt::format("Response of GET _data_stream/{} has unexpected format.",
                            dataStreamName),
                r.status_code, r.text);
    }
    impl->log(LogLevel::INFO, fmt::format("Found indices [{}] for data stream {}",
                                          fmt::join(indexNames, ", "), dataStreamName));

    // settings are requested one index after another
    std::vector<BackingIndex> indices;
    indices.reserve(indexNames.size());
    for (const std::string &indexName: indexNames) {
        indices.push_back(BackingIndex{indexName, creationTime(indexName)});
    }
    return indices;
}


Outcome DataStreamAdmin::cleanOldIndices(const std::string &dataStreamName,
                                         std::uint32_t retentionPeriodDays)
{
    if (!exists(dataStreamName)) {
        impl->log(LogLevel::ERROR, fmt::format("Data stream {} does not exist", dataStreamName));
        return Outcome::NOT_FOUND;
    }

    const std::vector<BackingIndex> indices = backingIndices(dataStreamName);
    const std::int64_t now = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    for (const BackingIndex &index: indices) {
        if (exceedsRetention(index.creationTime, now, retentionPeriodDays)) {
            impl->log(LogLevel::INFO, fmt::format("Deleting index {}, age: {:.3f} seconds",
                                                  index.name, (now - index.creationTime) / 1000.0));
            deleteIndex(index.name);
        }
    }

    impl->log(LogLevel::INFO, fmt::format("Finished cleaning data stream {}", dataStreamName));
    return Outcome::DONE;
}


const std::shared_ptr<Client> &DataStreamAdmin::getClient() const {
    return impl->client;
}


}  // namespace elasticstream
