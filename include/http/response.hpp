#ifndef UPNP_SCAN_HTTP_RESPONSE_HPP
#define UPNP_SCAN_HTTP_RESPONSE_HPP

#include <string>
#include <string_view>

#include <http/request.hpp>

namespace http
{

class response
{
public:

    response() = default;

    explicit response(std::string_view raw)
    {
        parse(raw);
    }

    /**
     * Parses status line, headers and body of a complete response
     * Chunked bodies are decoded, Content-Length truncates the body
     * Throws std::invalid_argument on malformed input
     */
    void parse(std::string_view raw);

    std::string to_string() const;

    void set_header(const std::string& key, const std::string& value);

    void set_header(const std::string& key, std::string&& value);

    void set_code(int code)
    {
        m_code = code;
    }

    void set_code(int code, std::string&& phrase)
    {
        m_code = code; m_phrase = std::move(phrase);
    }

    void set_body(const std::string& body);

    void set_body(std::string&& body);

    int get_code() const
    {
        return m_code;
    }

    const std::string& get_phrase() const
    {
        return m_phrase;
    }

    bool check_header(const std::string& key) const;

    std::string get_header(const std::string& key) const;

    const std::string& get_body() const
    {
        return m_body;
    }

private:

    int m_code = 0;
    std::string m_phrase;
    std::string m_body;

    header_map m_headers;

};

/**
 * True once raw holds a full response: the header block plus either
 * Content-Length bytes or the terminating chunk. Responses without
 * either are complete only when the peer closes.
 */
bool response_complete(std::string_view raw);

} // namespace http

#endif
