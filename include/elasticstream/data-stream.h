/**
 * \file
 * Administration of Elasticsearch data streams: creation, rollover and
 * retention based removal of backing indices.
 */

#pragma once

#include <string>
#include <memory>
#include <vector>
#include <cstdint>
#include "elasticstream/logging.h"


/// The elasticstream namespace
namespace elasticstream {


// Forward Client class existence.
class Client;


/// Backing index of a data stream.
struct BackingIndex {
    /// Name of the concrete index (i.e. ".ds-logs-2024.01.01-000001").
    std::string name;
    /// Creation time of the index [ms since epoch].
    std::int64_t creationTime;
};


/// How an administrative operation has ended when it did not throw.
enum class Outcome {
    /// Requested change was made.
    DONE            = 0,
    /// Data stream to create was already there, nothing was changed.
    ALREADY_EXISTS  = 1,
    /// Data stream to operate on does not exist, nothing was changed.
    NOT_FOUND       = 2
};


/**
 * Class for administration of data streams in one Elasticsearch cluster.
 *
 * Every operation performs its requests synchronously, one by one. Store
 * errors are propagated as ResponseException, unreachable cluster as
 * ConnectionException. Missing data stream on rollover or cleanup is only
 * logged (LogLevel::ERROR) and reported as Outcome::NOT_FOUND.
 */
class DataStreamAdmin {
    class Implementation;
    /// Hidden implementation and data holder.
    std::unique_ptr<Implementation> impl;

  public:
    /// Priority of the index templates created for data streams.
    static const int INDEX_TEMPLATE_PRIORITY;

    /**
     * Initialize administrator using already configured Client class.
     * \param client initialized Client object.
     * \param logCallback receives log messages of the administrator. Global
     *        callback set by setLogFunction() is used if empty.
     */
    explicit DataStreamAdmin(const std::shared_ptr<Client> &client,
                             LogCallback logCallback = LogCallback());

    /**
     * Initialize administrator and create Client instance for specified
     * hostUrlList using HTTP Basic authentication.
     * \param hostUrlList list of URLs of Elastic nodes in one cluster.
     * \param username user name for HTTP Basic authentication.
     * \param password password for HTTP Basic authentication.
     * \param logCallback see above.
     */
    DataStreamAdmin(const std::vector<std::string> &hostUrlList,
                    const std::string &username,
                    const std::string &password,
                    LogCallback logCallback = LogCallback());

    DataStreamAdmin(DataStreamAdmin &&);

    ~DataStreamAdmin();

    /**
     * Check the cluster responds to health request with 2xx status.
     * \throws ConnectionException if the cluster is unreachable or the status is not 2xx.
     */
    void checkConnection();

    /**
     * Return true if data stream \p dataStreamName exists. Any response other
     * than 200 (not only 404) is considered as non-existing data stream.
     */
    bool exists(const std::string &dataStreamName);

    /**
     * Create (or update) index template "<dataStreamName>-template" and create
     * data stream \p dataStreamName.
     * \return Outcome::DONE or Outcome::ALREADY_EXISTS.
     * \throws ResponseException if template or data stream creation fails.
     */
    Outcome create(const std::string &dataStreamName);

    /**
     * Roll data stream over to a new backing index.
     * \return Outcome::DONE or Outcome::NOT_FOUND.
     * \throws ResponseException if rollover fails.
     */
    Outcome rollover(const std::string &dataStreamName);

    /**
     * Delete single concrete index.
     * \throws ResponseException if the index could not be deleted.
     */
    void deleteIndex(const std::string &indexName);

    /**
     * Delete backing indices of \p dataStreamName older than
     * \p retentionPeriodDays days. Index exactly of retention age is kept.
     * \return Outcome::DONE or Outcome::NOT_FOUND.
     * \throws ResponseException if any of the requests fails.
     */
    Outcome cleanOldIndices(const std::string &dataStreamName,
                            std::uint32_t retentionPeriodDays);

    /**
     * Return current backing indices of the data stream with their creation time.
     * \throws ResponseException if the data stream or index can not be read.
     */
    std::vector<BackingIndex> backingIndices(const std::string &dataStreamName);

    /**
     * Return creation time [ms since epoch] of index \p indexName.
     * \throws ResponseException if index settings can not be read.
     */
    std::int64_t creationTime(const std::string &indexName);

    /// Return Client class with current config.
    const std::shared_ptr<Client> &getClient() const;
};


}  // namespace elasticstream
