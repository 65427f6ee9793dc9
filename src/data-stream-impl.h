/**
 * \file
 * Implementation of data stream administration.
 */

#pragma once

#include "elasticstream/data-stream.h"

#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include "elasticstream/client.h"


// Forward cpr::Response existence.
namespace cpr {
    class Response;
}


namespace elasticstream {


/// Number of milliseconds in one retention day.
constexpr std::int64_t MILLISECONDS_PER_DAY = 24 * 60 * 60 * 1000LL;


/// Return name of the index template belonging to data stream \p dataStreamName.
std::string indexTemplateName(const std::string &dataStreamName);


/**
 * Create body of the index template for data stream \p dataStreamName.
 *
 * Something like that is produced for call:
 * \code
 *   createIndexTemplateBody("logs", 100);
 *   {"data_stream":{},"index_patterns":"logs","priority":100}
 * \endcode
 */
std::string createIndexTemplateBody(const std::string &dataStreamName, int priority);


/**
 * Read error type (["error"]["type"]) from Elasticsearch error response.
 * \return true if \p result contained the error type.
 */
bool parseErrorType(const std::string &result, std::string &errorType);


/**
 * Read names of the backing indices from data stream descriptor
 * (["data_streams"][0]["indices"][*]["index_name"]).
 * \return true on success.
 */
bool parseBackingIndexNames(const std::string &result, std::vector<std::string> &indexNames);


/**
 * Read creation time of index from get index response
 * ([indexName]["settings"]["index"]["creation_date"], ms since epoch).
 * \param creationTime creation time [ms since epoch].
 * \return true on success.
 */
bool parseCreationDate(const std::string &result, const std::string &indexName,
                       std::int64_t &creationTime);


/// Return true if index created at \p creationTime [ms] is older than retention period at \p now [ms].
bool exceedsRetention(std::int64_t creationTime, std::int64_t now,
                      std::uint32_t retentionPeriodDays);


class DataStreamAdmin::Implementation {
    /// Client holder
    std::shared_ptr<Client> client;
    /// Log messages receiver, global log function is used if empty.
    LogCallback logCallback;

    // allow DataStreamAdmin to access private members
    friend class DataStreamAdmin;

  public:
    Implementation(std::shared_ptr<Client> elasticClient, LogCallback logCallback)
      : client(std::move(elasticClient)), logCallback(std::move(logCallback))
    {
        if (!client) {
            throw std::invalid_argument("Valid Client instance is required.");
        }
    }

  private:
    /// Pass \p message to the log callback.
    void log(LogLevel logLevel, const std::string &message) const;

    /**
     * Throw ResponseException when \p response status code is not 2xx.
     * \param request request description used in exception message (i.e. "DELETE logs").
     */
    void raiseForStatus(const cpr::Response &response, const std::string &request) const;
};


}  // namespace elasticstream
