#ifndef UPNP_SCAN_HTTP_CLIENT_HPP
#define UPNP_SCAN_HTTP_CLIENT_HPP

#include <chrono>
#include <stdexcept>
#include <string>

namespace http
{

#define HTTP_TIMEOUT 5000
#define HTTP_MAX_RESPONSE (4 * 1024 * 1024)

class http_error : public std::runtime_error
{
public:

    http_error(int status, const std::string& what)
        : std::runtime_error {what}, m_status {status}
    {}

    int status() const
    {
        return m_status;
    }

private:

    int m_status;

};

// Fetches the body behind a url or throws
class client
{
public:
    virtual ~client() = default;

    virtual std::string get(const std::string& url) const = 0;
};

/**
 * Plain HTTP/1.1 GET over a fresh tcp connection per request
 *
 * The timeout bounds the whole response transfer.
 * Throws std::invalid_argument for urls it can not handle, std::runtime_error
 * for connection failures and timeouts and http_error for non 2xx responses.
 * Safe to use from several threads at once.
 */
class tcp_client : public client
{
public:

    explicit tcp_client(std::chrono::milliseconds timeout = std::chrono::milliseconds {HTTP_TIMEOUT},
        size_t max_response = HTTP_MAX_RESPONSE)
        : m_timeout {timeout}, m_max_response {max_response}
    {}

    std::string get(const std::string& url) const override;

private:

    std::chrono::milliseconds m_timeout;

    size_t m_max_response;

};

} // namespace http

#endif
