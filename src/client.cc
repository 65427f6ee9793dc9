/**
 * \file
 * Implementation of the Elasticsearch Client. Responsible for performing
 * management requests on Elasticsearch cluster.
 */

#include "client-impl.h"

#include <memory>
#include <cpr/cpr.h>
#include "logging-impl.h"

#ifndef __GNUC__
#undef DELETE
#endif

namespace {


/**
 * Return url path made of \p name followed by \p suffix.
 * \throws std::invalid_argument if \p name is empty.
 */
std::string namedUrlPath(const std::string &argumentName, const std::string &name,
                         const std::string &suffix = std::string())
{
    if (name.empty()) {
        throw std::invalid_argument("Argument " + argumentName + " can not be empty.");
    }
    return name + suffix;
}


/// Name of the \p method for log messages.
const char *methodName(elasticstream::Client::HTTPMethod method) {
    using HTTPMethod = elasticstream::Client::HTTPMethod;
    switch (method) {
        case HTTPMethod::GET:    return "GET";
        case HTTPMethod::POST:   return "POST";
        case HTTPMethod::PUT:    return "PUT";
        case HTTPMethod::DELETE: return "DELETE";
    }
    return "UNKNOWN";
}


} // anonymous namespace


namespace elasticstream {


std::string normalizeHostUrl(const std::string &hostUrl) {
    if (hostUrl.empty()) {
        throw std::invalid_argument("Host URL can not be empty.");
    }
    if (hostUrl.back() == '/') {
        return hostUrl;
    }
    return hostUrl + "/";
}


void Client::TimeoutOption::accept(Implementation &impl) const {
    impl.visit(*this);
}

void Client::ConnectTimeoutOption::accept(Implementation &impl) const {
    impl.visit(*this);
}

void Client::BasicAuthOption::accept(Implementation &impl) const {
    impl.visit(*this);
}


Client::ProxiesOption::ProxiesOption(
        const std::initializer_list<std::pair<const std::string, std::string>> &proxies)
    : impl(new Client::ProxiesOption::ProxiesOptionImplementation(proxies))
{}

Client::ProxiesOption::ProxiesOption(ProxiesOption &&) = default;
Client::ProxiesOption::~ProxiesOption() = default;

void Client::ProxiesOption::accept(Implementation &impl) const {
    impl.visit(*this);
}


Client::SSLOption::SSLOption(): impl(new SSLOptionImplementation()) {}
Client::SSLOption::SSLOption(SSLOption &&) = default;
Client::SSLOption::~SSLOption() = default;

void Client::SSLOption::setSslOption(const SSLOptionType &opt) {
    impl->setSslOption(opt);
}

void Client::SSLOption::accept(Implementation &impl) const {
    impl.visit(*this);
}

void Client::SSLOption::CertFile::accept(SSLOptionImplementation &impl) const {
    impl.visit(*this);
}

void Client::SSLOption::KeyFile::accept(SSLOptionImplementation &impl) const {
    impl.visit(*this);
}

void Client::SSLOption::CaInfo::accept(SSLOptionImplementation &impl) const {
    impl.visit(*this);
}

void Client::SSLOption::VerifyHost::accept(SSLOptionImplementation &impl) const {
    impl.visit(*this);
}

void Client::SSLOption::VerifyPeer::accept(SSLOptionImplementation &impl) const {
    impl.visit(*this);
}


Client::Client(const std::vector<std::string> &hostUrlList,
               std::int32_t timeout)
  : impl(new Implementation(hostUrlList, timeout))
{}

Client::Client(Client &&) = default;

Client::~Client() {}


void Client::setClientOption(const ClientOption &opt) {
    impl->setClientOption(opt);
}


cpr::Response Client::performRequest(
        HTTPMethod method, const std::string &urlPath, const std::string &body)
{
   return impl->performRequest(method, urlPath, body);
}


bool Client::Implementation::performRequestOnCurrentHost(Client::HTTPMethod method,
                                                         const std::string &urlPath,
                                                         const std::string &body,
                                                         cpr::Response &response)
{
    const std::string entireUrl = hostUrlList[currentHostIndex] + urlPath;
    session.SetUrl(cpr::Url(entireUrl));
    cpr::Header header;
    if (!body.empty()) {
        header["Content-Type"] = "application/json; charset=utf-8";
    }
    session.SetHeader(header);
    session.SetBody(cpr::Body(body));

    LOG(LogLevel::DEBUG, "Called {}: {}", methodName(method), urlPath);
    switch (method) {
        case Client::HTTPMethod::GET:
            response = session.Get();
            break;
        case Client::HTTPMethod::POST:
            response = session.Post();
            break;
        case Client::HTTPMethod::PUT:
            response = session.Put();
            break;
        case Client::HTTPMethod::DELETE:
            response = session.Delete();
            break;
    }

    LOG(LogLevel::DEBUG, "Host returned {} in {} s for {} {}.", response.status_code,
        response.elapsed, methodName(method), entireUrl);

    LOG(LogLevel::DEBUG, "Host response text: {}", response.text);

    if (response.error) {
        LOG(LogLevel::WARNING, "Request error: {}", response.error.message);
    }
    // Return false if current node failed for request from following reasons.
    // Status code = 0 means, that it is not possible to connect to Elastic node.
    // Status code = 503 means that Elastic node is temporarily unavailable.
    if (response.status_code == 0 || response.status_code == 503) {
        LOG(LogLevel::WARNING, "Host on URL '{}' is unavailable.", entireUrl);
        return false;
    }
    return true;
}


cpr::Response Client::Implementation::performRequest(
        Client::HTTPMethod method, const std::string &urlPath, const std::string &body)
{
    bool isSuccessful = false;
    cpr::Response response;
    while (!isSuccessful) {
        isSuccessful = performRequestOnCurrentHost(method, urlPath, body, response);
        if (!isSuccessful && !failCurrentHostAndIterateNext()) {
            throw ConnectionException("All hosts failed for request.");
        }
    }
    // Reset failCounter if any host successfuly responds.
    failCounter = 0;
    return response;
}


cpr::Response Client::clusterHealth() {
    return impl->performRequest(HTTPMethod::GET, "_cluster/health");
}


cpr::Response Client::getDataStream(const std::string &dataStreamName) {
    return impl->performRequest(
            HTTPMethod::GET, "_data_stream/" + namedUrlPath("dataStreamName", dataStreamName));
}


cpr::Response Client::createDataStream(const std::string &dataStreamName) {
    return impl->performRequest(
            HTTPMethod::PUT, "_data_stream/" + namedUrlPath("dataStreamName", dataStreamName));
}


cpr::Response Client::putIndexTemplate(const std::string &templateName,
                                       const std::string &body)
{
    return impl->performRequest(
            HTTPMethod::PUT, "_index_template/" + namedUrlPath("templateName", templateName),
            body);
}


cpr::Response Client::rollover(const std::string &dataStreamName) {
    return impl->performRequest(
            HTTPMethod::POST, namedUrlPath("dataStreamName", dataStreamName, "/_rollover"));
}


cpr::Response Client::getIndex(const std::string &indexName) {
    return impl->performRequest(HTTPMethod::GET, namedUrlPath("indexName", indexName));
}


cpr::Response Client::deleteIndex(const std::string &indexName) {
    return impl->performRequest(HTTPMethod::DELETE, namedUrlPath("indexName", indexName));
}


void Client::Implementation::visit(const TimeoutOption &opt) {
    session.SetTimeout(cpr::Timeout{opt.getValue()});
}

void Client::Implementation::visit(const ConnectTimeoutOption &opt) {
    session.SetConnectTimeout(cpr::ConnectTimeout{opt.getValue()});
}

void Client::Implementation::visit(const BasicAuthOption &opt) {
    session.SetAuth(cpr::Authentication{opt.username, opt.password, cpr::AuthMode::BASIC});
}

void Client::Implementation::visit(const ProxiesOption &opt) {
    session.SetProxies(opt.impl->getProxies());
}

void Client::Implementation::visit(const SSLOption &opt) {
    session.SetSslOptions(opt.impl->getOptions());
}

void Client::SSLOption::SSLOptionImplementation::visit(const CertFile &certFile) {
    sslOptions.SetOption(cpr::ssl::CertFile{std::string{certFile.path}});
}

void Client::SSLOption::SSLOptionImplementation::visit(const KeyFile &keyFile) {
    sslOptions.SetOption(cpr::ssl::KeyFile(keyFile.path, keyFile.password));
}

void Client::SSLOption::SSLOptionImplementation::visit(const CaInfo &caBundle) {
    sslOptions.SetOption(cpr::ssl::CaInfo(std::string{caBundle.path}));
}

void Client::SSLOption::SSLOptionImplementation::visit(const VerifyHost &opt) {
    sslOptions.SetOption(cpr::ssl::VerifyHost{opt.verify});
}

void Client::SSLOption::SSLOptionImplementation::visit(const VerifyPeer &opt) {
    sslOptions.SetOption(cpr::ssl::VerifyPeer{opt.verify});
}


}  // namespace elasticstream
