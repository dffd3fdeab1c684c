#include "http/client.hpp"
#include "http/request.hpp"
#include "http/response.hpp"
#include "logger.hpp"
#include "utils.hpp"

#include <socketwrapper.hpp>

#include <array>
#include <cerrno>
#include <poll.h>

namespace http
{

template<net::ip_version IP_VER>
static std::string transfer(const utils::url& target, std::string request_text, std::chrono::milliseconds timeout,
    size_t max_response)
{
    net::tcp_connection<IP_VER> conn {target.host, target.port};
    conn.send(net::span {request_text.begin(), request_text.end()});

    using namespace std::chrono;

    // The timeout bounds the whole transfer, not each read
    const steady_clock::time_point deadline = steady_clock::now() + timeout;

    std::string raw;
    std::array<char, 4096> buffer;
    while(!response_complete(raw))
    {
        auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
        if(remaining.count() <= 0)
            throw std::runtime_error {"http read timed out"};

        pollfd pfd {conn.get(), POLLIN, 0};
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if(ready < 0 && errno == EINTR)
            continue;
        if(ready < 0)
            throw std::runtime_error {"poll on http connection failed"};
        if(ready == 0)
            throw std::runtime_error {"http read timed out"};

        size_t br = conn.read(net::span {buffer.data(), buffer.size()});
        if(br == 0)
            break;

        raw.append(buffer.data(), br);
        if(raw.size() > max_response)
            throw std::runtime_error {"http response exceeds size limit"};
    }

    return raw;
}

std::string tcp_client::get(const std::string& url) const
{
    utils::url target = utils::parse_url(url);
    if(target.scheme != "http")
        throw std::invalid_argument {"unsupported url scheme " + target.scheme};

    const bool v6 = target.host.find(':') != std::string::npos;

    request req {"GET", target.path};
    req.set_header("Host", (v6 ? "[" + target.host + "]" : target.host) + ":" + std::to_string(target.port));
    req.set_header("Connection", "close");
    req.set_header("Accept", "text/xml, application/xml, */*");

    logger::debug("GET {}", url);
    std::string raw = v6 ? transfer<net::ip_version::v6>(target, req.to_string(), m_timeout, m_max_response)
                         : transfer<net::ip_version::v4>(target, req.to_string(), m_timeout, m_max_response);

    response res;
    res.parse(raw);
    if(res.get_code() < 200 || res.get_code() >= 300)
        throw http_error {res.get_code(), "GET " + url + " returned " + std::to_string(res.get_code())};

    return res.get_body();
}

} // namespace http
