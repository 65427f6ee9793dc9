/**
 * \file
 * Command line of the data-stream-admin tool.
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include <stdexcept>
#include <elasticstream/logging.h>
#include <elasticstream/client.h>


namespace elasticstream {


class DataStreamAdmin;


/// Command line tool namespace
namespace cli {


/// Raised for invalid command line, before any request is sent.
class UsageError: public std::runtime_error {
  public:
    explicit UsageError(const std::string &message) : std::runtime_error(message) {}
};


/// Actions the tool can perform.
enum class Action {
    CREATE      = 0,
    ROLLOVER    = 1,
    CLEAN       = 2
};


/// Validated command line.
struct Options {
    Action action = Action::CREATE;
    std::string dataStream;
    std::vector<std::string> hostUrlList;
    std::string username;
    std::string password;
    /// Meaningful for Action::CLEAN only.
    std::uint32_t retentionPeriodDays = 0;
    std::int32_t timeoutMs = 6000;
    /// 0 keeps the connect timeout of the http library.
    std::int32_t connectTimeoutMs = 0;
    bool insecure = false;
    std::string caInfo;
    std::string certFile;
    std::string keyFile;
    std::string keyPassword;
    std::string proxy;
    bool verbose = false;
};


/// Usage message shown by --help.
extern const char *const USAGE;


/**
 * Convert action name to Action.
 * \throws UsageError on unknown action.
 */
Action parseAction(const std::string &name);


/// Split comma separated list of node URLs, skipping empty items.
std::vector<std::string> splitHostUrls(const std::string &urls);


/**
 * Build Options from parsed command line flags and \p positional arguments
 * left by gflags::ParseCommandLineFlags().
 * \throws UsageError if an argument is missing or invalid.
 */
Options readOptions(const std::vector<std::string> &positional);


/**
 * Create SSL option of the Client. Certificate and host name verification
 * stays enabled unless Options::insecure is set.
 */
Client::SSLOption createSslOption(const Options &options);


/// Create option routing both http and https requests through \p proxy.
Client::ProxiesOption createProxiesOption(const std::string &proxy);


/// Create Client configured by \p options (credentials, timeouts, TLS, proxy).
std::shared_ptr<Client> createClient(const Options &options);


/// Log callback writing "time - LEVEL - message" lines to stderr.
LogCallback stderrLogCallback(bool verbose);


/**
 * Check the connection and perform the action selected by \p options.
 * Failures are propagated as exceptions.
 * \return process exit status.
 */
int run(const Options &options, DataStreamAdmin &admin);


/**
 * Entry point of the tool. Parse command line \p argv, then log to stderr
 * and perform the action.
 * \return 0 on success, 1 if the action has failed and 2 on invalid command line.
 */
int execute(int argc, char *argv[]);


}  // namespace cli
}  // namespace elasticstream
