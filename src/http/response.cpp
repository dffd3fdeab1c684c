#include <http/response.hpp>

#include "utils.hpp"

#include <charconv>
#include <optional>
#include <stdexcept>

namespace http
{

static std::string get_http_phrase(int status_code)
{
    switch(status_code)
    {
        case 200: return "OK";
        case 206: return "Partial Content";
        case 302: return "Found";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

struct message_head
{
    std::string_view status_line;
    header_map headers;
    std::string_view body;
};

static std::optional<message_head> split_message(std::string_view raw)
{
    size_t head_end = raw.find("\r\n\r\n");
    if(head_end == std::string_view::npos)
        return std::nullopt;

    message_head head;
    head.body = raw.substr(head_end + 4);

    std::string_view block = raw.substr(0, head_end);
    size_t endl = block.find("\r\n");
    head.status_line = block.substr(0, endl);
    block = (endl == std::string_view::npos) ? std::string_view {} : block.substr(endl + 2);

    while(!block.empty())
    {
        endl = block.find("\r\n");
        std::string_view line = block.substr(0, endl);
        size_t sep = line.find(':');
        if(sep == std::string_view::npos)
            throw std::invalid_argument {"invalid header line"};

        head.headers[std::string {utils::trim(line.substr(0, sep))}] = std::string {utils::trim(line.substr(sep + 1))};

        block = (endl == std::string_view::npos) ? std::string_view {} : block.substr(endl + 2);
    }

    return head;
}

static bool is_chunked(const header_map& headers)
{
    auto it = headers.find("Transfer-Encoding");
    return it != headers.end() && utils::to_lower(it->second).find("chunked") != std::string::npos;
}

static std::optional<size_t> content_length(const header_map& headers)
{
    auto it = headers.find("Content-Length");
    if(it == headers.end())
        return std::nullopt;

    size_t length = 0;
    const std::string& value = it->second;
    auto res = std::from_chars(value.data(), value.data() + value.size(), length);
    if(res.ec != std::errc {} || res.ptr != value.data() + value.size())
        throw std::invalid_argument {"invalid Content-Length"};
    return length;
}

static std::string decode_chunked(std::string_view body)
{
    std::string decoded;
    while(true)
    {
        size_t endl = body.find("\r\n");
        if(endl == std::string_view::npos)
            throw std::invalid_argument {"truncated chunk header"};

        // Chunk extensions follow a ';'
        std::string_view size_view = utils::trim(body.substr(0, body.find_first_of(";\r")));
        size_t size = 0;
        auto res = std::from_chars(size_view.data(), size_view.data() + size_view.size(), size, 16);
        if(res.ec != std::errc {} || size_view.empty())
            throw std::invalid_argument {"invalid chunk size"};

        body.remove_prefix(endl + 2);
        if(size == 0)
            return decoded;

        if(body.size() < size + 2)
            throw std::invalid_argument {"truncated chunk"};

        decoded.append(body.data(), size);
        body.remove_prefix(size + 2);
    }
}

void response::parse(std::string_view raw)
{
    std::optional<message_head> head = split_message(raw);
    if(!head)
        throw std::invalid_argument {"incomplete response header"};

    // HTTP/1.1 200 OK
    std::string_view status_line = head->status_line;
    size_t first = status_line.find(' ');
    if(first == std::string_view::npos || status_line.substr(0, 5) != "HTTP/")
        throw std::invalid_argument {"invalid status line"};

    std::string_view rest = status_line.substr(first + 1);
    size_t second = rest.find(' ');
    std::string_view code_view = rest.substr(0, second);
    int code = 0;
    auto res = std::from_chars(code_view.data(), code_view.data() + code_view.size(), code);
    if(res.ec != std::errc {} || res.ptr != code_view.data() + code_view.size() || code < 100 || code > 999)
        throw std::invalid_argument {"invalid status code"};

    m_code = code;
    m_phrase = (second == std::string_view::npos) ? std::string {} : std::string {rest.substr(second + 1)};
    m_headers = std::move(head->headers);

    if(is_chunked(m_headers))
    {
        m_body = decode_chunked(head->body);
    }
    else if(std::optional<size_t> length = content_length(m_headers))
    {
        if(head->body.size() < *length)
            throw std::invalid_argument {"truncated body"};
        m_body = std::string {head->body.substr(0, *length)};
    }
    else
    {
        m_body = std::string {head->body};
    }
}

std::string response::to_string() const
{
    std::string response;

    /* Begin with response line */
    const int code = (m_code == 0) ? 200 : m_code;
    response.append("HTTP/1.1 " + std::to_string(code) + " " + (m_phrase.empty() ? get_http_phrase(code) : m_phrase) + "\r\n");

    /* Append all headers to response */
    for(const auto& it : m_headers)
    {
        response.append(it.first + ": " + it.second + "\r\n");
    }
    if(m_headers.find("Content-Type") == m_headers.end())
    {
        response.append("Content-Type: text/html; charset=UTF-8\r\n");
    }

    /* Append body to response line */
    response.append("\r\n");
    response.append(m_body);

    return response;
}

void response::set_body(const std::string& body)
{
    m_body = body;
    set_header("Content-Length", std::to_string(m_body.size()));
}

void response::set_body(std::string&& body)
{
    m_body = std::move(body);
    set_header("Content-Length", std::to_string(m_body.size()));
}

void response::set_header(const std::string& key, const std::string& value)
{
    m_headers[key] = value;
}

void response::set_header(const std::string& key, std::string&& value)
{
    m_headers[key] = std::move(value);
}

bool response::check_header(const std::string& key) const
{
    return m_headers.find(key) != m_headers.end();
}

std::string response::get_header(const std::string& key) const
{
    auto it = m_headers.find(key);
    return (it != m_headers.end()) ? it->second : std::string {};
}

bool response_complete(std::string_view raw)
{
    std::optional<message_head> head;
    try {
        head = split_message(raw);
        if(!head)
            return false;

        if(is_chunked(head->headers))
        {
            decode_chunked(head->body);
            return true;
        }

        if(std::optional<size_t> length = content_length(head->headers))
            return head->body.size() >= *length;
    } catch(const std::invalid_argument&) {
        // Not parseable yet, keep reading until the peer closes
        return false;
    }

    return false;
}

} // namespace http
