/**
 * \file
 * Module of Elasticsearch Client. Responsible for performing management requests
 * on Elasticsearch cluster.
 */

#pragma once

#include <string>
#include <memory>
#include <cstdint>
#include <stdexcept>
#include <vector>
#include <utility>
#include <initializer_list>
#include <type_traits>

#ifndef __GNUC__
#undef DELETE
#endif

// Forward cpr::Response existence.
namespace cpr {
    class Response;
}


/// The elasticstream namespace
namespace elasticstream {


/// Raised when no node of the cluster could be reached (or the cluster is not healthy).
class ConnectionException: public std::runtime_error {
  public:
    explicit ConnectionException(const std::string &message) : std::runtime_error(message) {}
};


/// Raised when the cluster answered with a status code the caller can not accept.
class ResponseException: public std::runtime_error {
    long statusCode;
    std::string body;

  public:
    ResponseException(const std::string &message, long statusCode, std::string body)
      : std::runtime_error(message), statusCode(statusCode), body(std::move(body))
    {}

    /// HTTP status code returned by the node.
    long getStatusCode() const {
        return statusCode;
    }

    /// Response text returned by the node.
    const std::string &getBody() const {
        return body;
    }
};


/// Class for managing Elasticsearch connection in one Elasticsearch cluster
class Client {
    class Implementation;
    /// Hidden implementation and data holder.
    std::unique_ptr<Implementation> impl;

  public:
    /// Enum for kinds of supported HTTP methods in performRequest.
    enum class HTTPMethod {
        GET     = 0,
        POST    = 1,
        PUT     = 2,
        DELETE  = 3
    };

    /// Abstract class for various options passed to Client constructor.
    struct ClientOption {
        virtual ~ClientOption() {}
        /**
         * Method to set option to the Client (internal impl).
         * Set (derived) option specific settings to the implementation.
         */
        virtual void accept(Implementation &) const = 0;
    };

    /// Helper class holding single value for ClientOption implementations.
    template <typename T>
    struct ClientOptionValue: public ClientOption {
        T value;

        explicit ClientOptionValue(const T& value): value(value) {}
        explicit ClientOptionValue(T&& value): value(std::move(value)) {}
        ClientOptionValue(ClientOptionValue &&) = default;
        virtual ~ClientOptionValue() = default;

        T getValue() const {
            return value;
        }
    };

    /// The timeout [ms] setting for client connection.
    struct TimeoutOption: public ClientOptionValue<std::int32_t> {
        explicit TimeoutOption(std::int32_t timeoutMs)
            : ClientOptionValue(timeoutMs) {}
      protected:
        void accept(Implementation &) const override;
    };

    /// The connection timeout [ms] for client.
    struct ConnectTimeoutOption: public ClientOptionValue<std::int32_t> {
        explicit ConnectTimeoutOption(std::int32_t timeoutMs)
            : ClientOptionValue(timeoutMs) {}
      protected:
        void accept(Implementation &) const override;
    };

    /// HTTP Basic credentials sent with every request.
    struct BasicAuthOption: public ClientOption {
        BasicAuthOption(std::string username, std::string password)
            : username(std::move(username)), password(std::move(password))
        {}
        std::string username;
        std::string password;
      protected:
        void accept(Implementation &) const override;
    };

    /// Proxies option for client connection.
    struct ProxiesOption: public ClientOption {
        /// Implementation hidden from public interface.
        class ProxiesOptionImplementation;
        std::unique_ptr<ProxiesOptionImplementation> impl;

        /**
         * Set proxies to the client connection.
         * \param proxies List of proxies consisting of the pair <protocol, proxy_url>.
         */
        explicit ProxiesOption(
                const std::initializer_list<std::pair<const std::string, std::string>> &proxies);
        ProxiesOption(ProxiesOption &&);
        ~ProxiesOption();
      protected:
        void accept(Implementation &) const override;
    };

    /// Options to setup SSL for client connection.
    struct SSLOption: public ClientOption {
        /// Implementation hidden from public interface.
        class SSLOptionImplementation;
        std::unique_ptr<SSLOptionImplementation> impl;

        SSLOption();
        SSLOption(SSLOption &&);
        ~SSLOption();

        /**
         * Construct SSLOptions with various SSLOptionType options.
         * All arguments passed to it must be base of SSLOptionType.
         * If same types are passed, the last one overwrites preceeding one.
         */
        template <typename... T>
        SSLOption(T... args): SSLOption() {
            optSetter(std::move(args)...);
        }

        /// Abstract base class for specific SSL options.
        struct SSLOptionType {
            virtual ~SSLOptionType() {}
            /// Visitor initiation to setup specific option by derived classes.
            virtual void accept(SSLOptionImplementation &) const = 0;
        };

        /// Path to the certificate.
        struct CertFile: public SSLOptionType {
            explicit CertFile(std::string path): path(std::move(path)) {}
            void accept(SSLOptionImplementation &) const override;
            std::string path;
        };

        /// Path to the certificate key file.
        struct KeyFile: public SSLOptionType {
            explicit KeyFile(std::string path, std::string password = {})
                : path(std::move(path)), password(std::move(password))
            {}
            void accept(SSLOptionImplementation &) const override;
            std::string path;
            std::string password;
        };

        /// Path to the custom CA bundle.
        struct CaInfo: public SSLOptionType {
            explicit CaInfo(std::string path): path(std::move(path)) {}
            void accept(SSLOptionImplementation &) const override;
            std::string path;
        };

        /// Flag whether to verify host.
        struct VerifyHost: public SSLOptionType {
            explicit VerifyHost(bool verify): verify(verify) {}
            void accept(SSLOptionImplementation &) const override;
            bool verify;
        };

        /// Flag whether to verify peer.
        struct VerifyPeer: public SSLOptionType {
            explicit VerifyPeer(bool verify): verify(verify) {}
            void accept(SSLOptionImplementation &) const override;
            bool verify;
        };

        /// Set single option - see SSLOptionType derived structs above.
        void setSslOption(const SSLOptionType &);

      protected:
        void accept(Implementation &) const override;

        /// Helper method to setup ssl options with SSLOptionType instances.
        template <typename T>
        void optSetter(T&& t) {
            static_assert(std::is_base_of<SSLOptionType, typename std::decay<T>::type>::value,
                          "Record must be derived from SSLOptionType");
            setSslOption(std::forward<T>(t));
        }

        /// Helper method to setup ssl options with SSLOptionType instances.
        template<typename T, typename... TRest>
        void optSetter(T&& t, TRest&&... ts) {
            static_assert(std::is_base_of<SSLOptionType, typename std::decay<T>::type>::value,
                          "Record must be derived from SSLOptionType");
            optSetter(std::forward<T>(t));
            optSetter(std::move(ts)...);
        }
    };


    /**
     * Initialize the Client.
     * \param hostUrlList  Vector of URLs of Elasticsearch nodes in one Elasticsearch cluster.
     *  Missing trailing "/" is appended to each URL.
     * \param timeout      Elastic node request timeout [ms].
     *
     * \throws std::invalid_argument if \p hostUrlList is empty.
     */
    explicit Client(const std::vector<std::string> &hostUrlList,
                    std::int32_t timeout = 6000);

    /**
     * Initialize the Client.
     *
     * Variadic arguments derived from ClientOption can be passed to it.
     * The later option overwrites the preceeding one for same object types passed into it.
     * \param hostUrlList   Vector of URLs of Elasticsearch nodes in one Elasticsearch cluster.
     */
    template <typename... Opts>
    Client(const std::vector<std::string> &hostUrlList,
           Opts&&... opts)
        : Client(hostUrlList)
    {
        optionConstructHelper(std::forward<Opts>(opts)...);
    }

    Client(Client &&);

    ~Client();

    /**
     * Set single option derived from ClientOption to the client.
     * \param opt Option to set. Has to be base of ClientOption.
     */
    void setClientOption(const ClientOption &opt);

    /**
     * Perform request on nodes until some node responds. Every node is tried
     * at most once. Throws exception if all nodes has failed to respond.
     * \param method one of Client::HTTPMethod.
     * \param urlPath part of URL immediately behind "scheme://host/".
     * \param body Elasticsearch request body.
     *
     * \return cpr::Response if any of node responds to request.
     * \throws ConnectionException if all hosts in cluster failed to respond.
     */
    cpr::Response performRequest(HTTPMethod method,
                                 const std::string &urlPath,
                                 const std::string &body);

    /**
     * Query cluster health (GET _cluster/health).
     * \throws ConnectionException if all hosts in cluster failed to respond.
     */
    cpr::Response clusterHealth();

    /**
     * Get data stream descriptor (GET _data_stream/{name}).
     * \throws std::invalid_argument if \p dataStreamName is empty.
     * \throws ConnectionException if all hosts in cluster failed to respond.
     */
    cpr::Response getDataStream(const std::string &dataStreamName);

    /**
     * Create data stream (PUT _data_stream/{name}). Matching index template
     * has to exist already.
     * \throws std::invalid_argument if \p dataStreamName is empty.
     * \throws ConnectionException if all hosts in cluster failed to respond.
     */
    cpr::Response createDataStream(const std::string &dataStreamName);

    /**
     * Create or replace composable index template (PUT _index_template/{name}).
     * \param templateName name of the template.
     * \param body template definition (json).
     * \throws std::invalid_argument if \p templateName is empty.
     * \throws ConnectionException if all hosts in cluster failed to respond.
     */
    cpr::Response putIndexTemplate(const std::string &templateName,
                                   const std::string &body);

    /**
     * Roll data stream (or alias) over to a new backing index (POST {name}/_rollover).
     * \throws std::invalid_argument if \p dataStreamName is empty.
     * \throws ConnectionException if all hosts in cluster failed to respond.
     */
    cpr::Response rollover(const std::string &dataStreamName);

    /**
     * Get index definition including its settings (GET {index}).
     * \throws std::invalid_argument if \p indexName is empty.
     * \throws ConnectionException if all hosts in cluster failed to respond.
     */
    cpr::Response getIndex(const std::string &indexName);

    /**
     * Delete one concrete index (DELETE {index}).
     * \throws std::invalid_argument if \p indexName is empty.
     * \throws ConnectionException if all hosts in cluster failed to respond.
     */
    cpr::Response deleteIndex(const std::string &indexName);

  private:
    /// Helper method to setup client with ClientOption options.
    template <typename T>
    void optionConstructHelper(T&& opt) {
        static_assert(std::is_base_of<ClientOption, typename std::decay<T>::type>::value,
                      "Record must be derived from ClientOption");
        setClientOption(std::forward<T>(opt));
    }

    /// Helper method to setup client with ClientOption options.
    template <typename T, typename... TRest>
    void optionConstructHelper(T&& opt, TRest&&... rest) {
        static_assert(std::is_base_of<ClientOption, typename std::decay<T>::type>::value,
                      "Record must be derived from ClientOption");
        optionConstructHelper(std::forward<T>(opt));
        optionConstructHelper(std::forward<TRest>(rest)...);
    }
};


} // namespace elasticstream
