#include "http/request.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace http
{

bool header_less::operator()(const std::string& a, const std::string& b) const
{
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), [](unsigned char x, unsigned char y) {
        return std::tolower(x) < std::tolower(y);
    });
}

request::request(std::string method, std::string resource)
    : m_method {std::move(method)},
      m_resource {std::move(resource)}
{
    m_path = m_resource.substr(0, m_resource.find('?'));
}

request::request(std::string_view request_string)
{
    parse(request_string);
}

void request::parse(std::string_view request)
{
    size_t endl = request.find("\r\n");
    if(endl == std::string_view::npos)
        throw std::invalid_argument {"invalid_request"};
    parse_requestline(request.substr(0, endl));

    m_path = m_resource.substr(0, m_resource.find('?'));

    /* Read and parse request headers until the empty line */
    m_headers.clear();
    request.remove_prefix(endl + 2);
    while(!request.empty())
    {
        endl = request.find("\r\n");
        if(endl == 0)
            break;
        if(endl == std::string_view::npos)
            throw std::invalid_argument {"invalid_request"};

        std::string_view headerline = request.substr(0, endl);
        size_t mid_pos = headerline.find(':');
        if(mid_pos == std::string_view::npos)
            throw std::invalid_argument {"invalid_request"};

        m_headers[std::string {utils::trim(headerline.substr(0, mid_pos))}] =
            std::string {utils::trim(headerline.substr(mid_pos + 1))};

        request.remove_prefix(endl + 2);
    }
}

std::string request::to_string() const
{
    std::string request;
    ((((request += m_method) += " ") += m_resource) += " ") += m_protocol;
    request += "\r\n";

    for(const auto& it : m_headers)
        (((request += it.first) += ": ") += it.second) += "\r\n";

    request += "\r\n";
    return request;
}

void request::parse_requestline(std::string_view requestline)
{
    std::string_view tmp_store[3];
    size_t vec_index = 0;
    while(vec_index < 3 && !requestline.empty())
    {
        size_t space = requestline.find(' ');
        tmp_store[vec_index++] = requestline.substr(0, space);
        if(space == std::string_view::npos)
            requestline = {};
        else
            requestline.remove_prefix(space + 1);
    }

    if(vec_index != 3 || !requestline.empty() || tmp_store[0].empty() || tmp_store[1].empty())
        throw std::invalid_argument {"invalid_requestline"};

    m_method = std::string {tmp_store[0]};
    m_resource = std::string {tmp_store[1]};
    m_protocol = std::string {tmp_store[2]};
}

bool request::check_header(const std::string& key) const
{
    return m_headers.find(key) != m_headers.end();
}

std::string request::get_header(const std::string& key) const
{
    auto it = m_headers.find(key);
    return (it != m_headers.end()) ? it->second : std::string {};
}

void request::set_header(const std::string& key, std::string value)
{
    m_headers[key] = std::move(value);
}

} // namespace http
