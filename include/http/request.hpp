#ifndef UPNP_SCAN_HTTP_REQUEST_HPP
#define UPNP_SCAN_HTTP_REQUEST_HPP

#include <map>
#include <string>
#include <string_view>

namespace http {

// Header names compare case-insensitively
struct header_less
{
    bool operator()(const std::string& a, const std::string& b) const;
};

using header_map = std::map<std::string, std::string, header_less>;

class request {

public:

    request() = default;
    request(const request& other) = default;
    request(request&& other) noexcept = default;
    request& operator=(const request& other) = default;
    request& operator=(request&& other) noexcept = default;

    request(std::string method, std::string resource);

    explicit request(std::string_view request_string);

    /**
     * Parses the request line and the header block
     * Throws std::invalid_argument on malformed input
     */
    void parse(std::string_view request);

    std::string to_string() const;

    bool check_header(const std::string& key) const;

    const header_map& get_headers() const { return m_headers; }

    std::string get_header(const std::string& key) const;

    void set_header(const std::string& key, std::string value);

    std::string get_method() const { return m_method; }

    std::string get_resource() const { return m_resource; }

    std::string get_protocol() const { return m_protocol; }

    std::string get_path() const { return m_path; }

private:

    void parse_requestline(std::string_view requestline);

    std::string m_method {"GET"};       /// http method used by this request (e.g. post, get, ...)
    std::string m_resource {"/"};       /// resource addressed by this request
    std::string m_protocol {"HTTP/1.1"};
    std::string m_path {"/"};           /// resource without the query string

    header_map m_headers;

};

} // namespace http

#endif
