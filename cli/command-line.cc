/**
 * \file
 * Command line flags and action dispatch of the data-stream-admin tool.
 */

#include "command-line.h"

#include <ctime>
#include <cstdio>
#include <sstream>
#include <exception>
#include <gflags/gflags.h>
#include <fmt/core.h>
#include <fmt/chrono.h>
#include <elasticstream/client.h>
#include <elasticstream/data-stream.h>


// Flags may be written with dashes too, i.e. --data-stream.
DEFINE_string(data_stream, "", "Name of the data stream (required)");
DEFINE_string(url, "", "Elasticsearch URL, comma separated list for more nodes "
                       "of one cluster (required)");
DEFINE_string(username, "", "User name for HTTP Basic authentication (required)");
DEFINE_string(password, "", "Password for HTTP Basic authentication (required)");
DEFINE_int32(retention_period, -1, "Retention period in days (required for clean)");
DEFINE_int32(timeout_ms, 6000, "Request timeout in milliseconds");
DEFINE_int32(connect_timeout_ms, 0, "Connect timeout in milliseconds, 0 for default");
DEFINE_bool(insecure, false, "Do not verify TLS certificate and host name of the nodes");
DEFINE_string(ca_info, "", "Path to CA bundle used to verify the nodes");
DEFINE_string(cert_file, "", "Path to client certificate");
DEFINE_string(key_file, "", "Path to client certificate key");
DEFINE_string(key_password, "", "Password of the client certificate key");
DEFINE_string(proxy, "", "Proxy used for both http and https connections");
DEFINE_bool(verbose, false, "Log every request sent to the cluster");


namespace {


/// Throw UsageError if required string flag \p value is empty.
void requireFlag(const std::string &value, const char *flagName) {
    if (value.empty()) {
        throw elasticstream::cli::UsageError(
                fmt::format("--{} is required", flagName));
    }
}


} // anonymous namespace


namespace elasticstream {
namespace cli {


const char *const USAGE =
    "Elasticsearch data stream management.\n"
    "\n"
    "Usage: data-stream-admin {create,rollover,clean} --data-stream=NAME --url=URL\n"
    "                         --username=USER --password=PASSWORD [--retention-period=DAYS]\n"
    "\n"
    "  create    create index template <NAME>-template and data stream NAME\n"
    "  rollover  roll data stream over to a new backing index\n"
    "  clean     delete backing indices older than --retention-period days";


Action parseAction(const std::string &name) {
    if (name == "create") {
        return Action::CREATE;
    } else if (name == "rollover") {
        return Action::ROLLOVER;
    } else if (name == "clean") {
        return Action::CLEAN;
    }
    throw UsageError(fmt::format(
            "invalid action '{}' (choose from 'create', 'rollover', 'clean')", name));
}


std::vector<std::string> splitHostUrls(const std::string &urls) {
    std::vector<std::string> hostUrlList;
    std::istringstream in(urls);
    std::string url;
    while (std::getline(in, url, ',')) {
        if (!url.empty()) {
            hostUrlList.push_back(url);
        }
    }
    return hostUrlList;
}


Options readOptions(const std::vector<std::string> &positional) {
    if (positional.empty()) {
        throw UsageError("the following arguments are required: action");
    }
    if (positional.size() > 1) {
        throw UsageError(fmt::format("unrecognized argument '{}'", positional[1]));
    }

    Options options;
    options.action = parseAction(positional.front());

    requireFlag(FLAGS_data_stream, "data-stream");
    requireFlag(FLAGS_url, "url");
    requireFlag(FLAGS_username, "username");
    requireFlag(FLAGS_password, "password");

    options.dataStream = FLAGS_data_stream;
    options.hostUrlList = splitHostUrls(FLAGS_url);
    if (options.hostUrlList.empty()) {
        throw UsageError("--url does not contain any URL");
    }
    options.username = FLAGS_username;
    options.password = FLAGS_password;

    if (options.action == Action::CLEAN) {
        const gflags::CommandLineFlagInfo info =
            gflags::GetCommandLineFlagInfoOrDie("retention_period");
        if (info.is_default) {
            throw UsageError("--retention-period is required for the 'clean' action");
        }
        if (FLAGS_retention_period < 0) {
            throw UsageError("--retention-period can not be negative");
        }
        options.retentionPeriodDays = static_cast<std::uint32_t>(FLAGS_retention_period);
    }

    if (FLAGS_timeout_ms <= 0) {
        throw UsageError("--timeout-ms has to be positive");
    }
    if (FLAGS_connect_timeout_ms < 0) {
        throw UsageError("--connect-timeout-ms can not be negative");
    }
    options.timeoutMs = FLAGS_timeout_ms;
    options.connectTimeoutMs = FLAGS_connect_timeout_ms;

    options.insecure = FLAGS_insecure;
    options.caInfo = FLAGS_ca_info;
    options.certFile = FLAGS_cert_file;
    options.keyFile = FLAGS_key_file;
    options.keyPassword = FLAGS_key_password;
    options.proxy = FLAGS_proxy;
    options.verbose = FLAGS_verbose;
    return options;
}


Client::SSLOption createSslOption(const Options &options) {
    Client::SSLOption sslOption;
    if (options.insecure) {
        sslOption.setSslOption(Client::SSLOption::VerifyHost{false});
        sslOption.setSslOption(Client::SSLOption::VerifyPeer{false});
    }
    if (!options.caInfo.empty()) {
        sslOption.setSslOption(Client::SSLOption::CaInfo{options.caInfo});
    }
    if (!options.certFile.empty()) {
        sslOption.setSslOption(Client::SSLOption::CertFile{options.certFile});
    }
    if (!options.keyFile.empty()) {
        sslOption.setSslOption(
                Client::SSLOption::KeyFile{options.keyFile, options.keyPassword});
    }
    return sslOption;
}


Client::ProxiesOption createProxiesOption(const std::string &proxy) {
    return Client::ProxiesOption({{"http", proxy}, {"https", proxy}});
}


std::shared_ptr<Client> createClient(const Options &options) {
    std::shared_ptr<Client> client = std::make_shared<Client>(
            options.hostUrlList,
            Client::TimeoutOption{options.timeoutMs},
            Client::BasicAuthOption{options.username, options.password},
            createSslOption(options));

    if (options.connectTimeoutMs > 0) {
        client->setClientOption(Client::ConnectTimeoutOption{options.connectTimeoutMs});
    }
    if (!options.proxy.empty()) {
        client->setClientOption(createProxiesOption(options.proxy));
    }
    return client;
}


LogCallback stderrLogCallback(bool verbose) {
    return [verbose](LogLevel logLevel, const std::string &message) {
        if (logLevel == LogLevel::DEBUG && !verbose) {
            return;
        }
        fmt::print(stderr, "{:%Y-%m-%d %H:%M:%S} - {} - {}\n",
                   fmt::localtime(std::time(nullptr)), logLevelName(logLevel), message);
    };
}


int run(const Options &options, DataStreamAdmin &admin) {
    admin.checkConnection();

    switch (options.action) {
        case Action::CREATE:
            admin.create(options.dataStream);
            break;
        case Action::ROLLOVER:
            admin.rollover(options.dataStream);
            break;
        case Action::CLEAN:
            admin.cleanOldIndices(options.dataStream, options.retentionPeriodDays);
            break;
    }
    return 0;
}


int execute(int argc, char *argv[]) {
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    const std::vector<std::string> positional(argv + 1, argv + argc);
    Options options;
    try {
        options = readOptions(positional);
    } catch (const UsageError &ex) {
        fmt::print(stderr, "{}\n\n{}: error: {}\n",
                   USAGE, gflags::ProgramInvocationShortName(), ex.what());
        return 2;
    }

    const LogCallback logCallback = stderrLogCallback(options.verbose);
    // library internals (i.e. Client requests) log through the global callback
    setLogFunction(logCallback);

    if (options.insecure) {
        logCallback(LogLevel::WARNING, "TLS certificate verification is disabled");
    }

    try {
        DataStreamAdmin admin(createClient(options), logCallback);
        return run(options, admin);
    } catch (const std::exception &ex) {
        logCallback(LogLevel::FATAL, ex.what());
    }
    return 1;
}


}  // namespace cli
}  // namespace elasticstream
