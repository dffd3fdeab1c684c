#include "ssdp_discovery.hpp"
#include "logger.hpp"
#include "utils.hpp"

#include <socketwrapper.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <future>
#include <iterator>
#include <stdexcept>
#include <poll.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace discovery
{

address_class classify(const utils::local_address& addr)
{
    if(addr.family == AF_INET)
        return address_class::ipv4;

    if(addr.family == AF_INET6)
    {
        in6_addr in6;
        if(inet_pton(AF_INET6, addr.ip.c_str(), &in6) != 1)
            return address_class::unknown;

        if(IN6_IS_ADDR_LINKLOCAL(&in6))
            return address_class::ipv6_link_local;
        if(IN6_IS_ADDR_SITELOCAL(&in6))
            return address_class::ipv6_site_local;
    }

    return address_class::unknown;
}

const char* multicast_group(address_class cls)
{
    switch(cls)
    {
        case address_class::ipv4: return DISCOVERY_IP_V4;
        case address_class::ipv6_link_local: return DISCOVERY_IP_V6_LINK_LOCAL;
        case address_class::ipv6_site_local: return DISCOVERY_IP_V6_SITE_LOCAL;
        default: return nullptr;
    }
}

std::string build_search_request(address_class cls, std::string_view search_target)
{
    const char* group = multicast_group(cls);
    if(group == nullptr)
        throw std::invalid_argument {"no multicast group for address class"};

    std::string host = (cls == address_class::ipv4) ? fmt::format("{}:{}", group, DISCOVERY_PORT)
                                                     : fmt::format("[{}]:{}", group, DISCOVERY_PORT);

    return fmt::format("M-SEARCH * HTTP/1.1\r\nHOST: {}\r\nST: {}\r\nMAN: \"ssdp:discover\"\r\nMX: {}\r\n\r\n",
        host, search_target, DISCOVERY_MX);
}

static void set_option(int fd, int level, int name, int value, const char* what)
{
    if(setsockopt(fd, level, name, &value, sizeof(value)) != 0)
        logger::debug("setsockopt {} failed: errno {}", what, errno);
}

static void pin_multicast_interface(int fd, const utils::local_address& addr)
{
    if(addr.family == AF_INET)
    {
        in_addr local;
        if(inet_pton(AF_INET, addr.ip.c_str(), &local) == 1 &&
            setsockopt(fd, IPPROTO_IP, IP_MULTICAST_IF, &local, sizeof(local)) != 0)
            logger::debug("setsockopt IP_MULTICAST_IF failed for {}: errno {}", addr.ip, errno);
        set_option(fd, IPPROTO_IP, IP_MULTICAST_TTL, 2, "IP_MULTICAST_TTL");
    }
    else
    {
        unsigned int index = addr.if_index;
        if(index != 0 && setsockopt(fd, IPPROTO_IPV6, IPV6_MULTICAST_IF, &index, sizeof(index)) != 0)
            logger::debug("setsockopt IPV6_MULTICAST_IF failed for {}: errno {}", addr.ip, errno);
        set_option(fd, IPPROTO_IPV6, IPV6_MULTICAST_HOPS, 1, "IPV6_MULTICAST_HOPS");
    }
}

static std::string bind_host(const utils::local_address& addr, address_class cls)
{
    if(cls == address_class::ipv6_link_local && !addr.interface.empty())
        return addr.ip + "%" + addr.interface;
    return addr.ip;
}

template<typename socket_type>
static void receive_until(socket_type& sock, std::chrono::steady_clock::time_point deadline, std::vector<char>& buffer,
    std::vector<std::string>& responses)
{
    using namespace std::chrono;

    while(true)
    {
        auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
        if(remaining.count() <= 0)
            return;

        pollfd pfd {sock.get(), POLLIN, 0};
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if(ready < 0 && errno == EINTR)
            continue;
        if(ready < 0)
            throw std::runtime_error {"poll on discovery socket failed"};
        if(ready == 0)
            return;
        if(pfd.revents & (POLLERR | POLLHUP | POLLNVAL))
            return;

        auto [bytes_read, peer] = sock.read(net::span {buffer.data(), buffer.size()});
        if(bytes_read > 0)
            responses.emplace_back(buffer.data(), bytes_read);
    }
}

template<net::ip_version IP_VER>
static void run_search(const utils::local_address& addr, address_class cls, const std::string& search_target,
    const search_config& config, std::vector<std::string>& responses)
{
    // Port 0 lets the system pick an unused port. SO_REUSEADDR and SO_REUSEPORT
    // are off on a fresh socket, so the port is bound exclusively.
    net::udp_socket<IP_VER> sock {bind_host(addr, cls), 0};
    pin_multicast_interface(sock.get(), addr);

    std::string request = build_search_request(cls, search_target);
    for(size_t i = 0; i < config.send_count; ++i)
        sock.send(multicast_group(cls), DISCOVERY_PORT, request);

    std::vector<char> buffer(config.buffer_size);
    receive_until(sock, std::chrono::steady_clock::now() + config.timeout, buffer, responses);
}

std::vector<std::string> search_address(const utils::local_address& addr, const std::string& search_target,
    const search_config& config)
{
    std::vector<std::string> responses;

    address_class cls = classify(addr);
    if(cls == address_class::unknown)
    {
        logger::debug("Skipping {}: no multicast group for its address class", addr.ip);
        return responses;
    }

    try {
        if(cls == address_class::ipv4)
            run_search<net::ip_version::v4>(addr, cls, search_target, config, responses);
        else
            run_search<net::ip_version::v6>(addr, cls, search_target, config, responses);
    } catch(const std::runtime_error& e) {
        // Socket failures only end the search on this address
        logger::info("Search on {} ended early: {}", addr.ip, e.what());
    }

    logger::debug("Search on {} received {} response(s)", addr.ip, responses.size());
    return responses;
}

std::vector<std::string> search_all(const std::string& search_target, const utils::interface_provider& interfaces,
    const search_config& config)
{
    std::vector<std::future<std::vector<std::string>>> searches;
    for(const auto& addr : interfaces.addresses())
    {
        searches.push_back(std::async(std::launch::async, [addr, &search_target, &config]() {
            return search_address(addr, search_target, config);
        }));
    }

    std::vector<std::string> responses;
    for(auto& search : searches)
    {
        std::vector<std::string> partial = search.get();
        std::move(partial.begin(), partial.end(), std::back_inserter(responses));
    }
    return responses;
}

std::optional<int> ssdp_res::max_age() const
{
    const std::string lower = utils::to_lower(cache_control);
    size_t pos = lower.find("max-age");
    if(pos == std::string::npos)
        return std::nullopt;

    pos = lower.find('=', pos);
    if(pos == std::string::npos)
        return std::nullopt;

    std::string_view value = utils::trim(std::string_view {lower}.substr(pos + 1));
    int seconds = 0;
    auto res = std::from_chars(value.data(), value.data() + value.size(), seconds);
    if(res.ec != std::errc {} || seconds < 0)
        return std::nullopt;

    return seconds;
}

header_map parse_headers(std::string_view response)
{
    header_map headers;
    while(!response.empty())
    {
        size_t endl = response.find('\n');
        std::string_view line = response.substr(0, endl);
        if(!line.empty() && line.back() == '\r')
            line.remove_suffix(1);

        size_t sep = line.find(':');
        if(sep != std::string_view::npos)
            headers[utils::to_lower(line.substr(0, sep))] = std::string {utils::trim(line.substr(sep + 1))};

        if(endl == std::string_view::npos)
            break;
        response.remove_prefix(endl + 1);
    }
    return headers;
}

struct field_mapping
{
    const char* header;
    std::string ssdp_res::* member;
};

static const field_mapping c_fields[] = {
    {"usn", &ssdp_res::usn},
    {"location", &ssdp_res::location},
    {"st", &ssdp_res::st},
    {"cache-control", &ssdp_res::cache_control},
    {"server", &ssdp_res::server},
};

std::optional<ssdp_res> parse_response(std::string_view response)
{
    ssdp_res res;
    res.headers = parse_headers(response);

    for(const auto& field : c_fields)
    {
        auto it = res.headers.find(field.header);
        if(it == res.headers.end())
            return std::nullopt;
        res.*field.member = it->second;
    }

    return res;
}

std::vector<ssdp_res> parse_responses(const std::vector<std::string>& responses)
{
    std::vector<ssdp_res> devices;
    for(const auto& response : responses)
    {
        std::optional<ssdp_res> res = parse_response(response);
        if(!res)
        {
            logger::debug("Dropping response without the required headers");
            continue;
        }

        bool known = std::any_of(devices.begin(), devices.end(), [&usn = res->usn](const ssdp_res& d) {
            return d.usn == usn;
        });
        if(!known)
            devices.push_back(std::move(*res));
    }
    return devices;
}

std::vector<ssdp_res> search_devices(const std::string& device_type, const utils::interface_provider& interfaces,
    const search_config& config)
{
    return parse_responses(search_all(device_type, interfaces, config));
}

std::vector<ssdp_res> search_devices(const std::string& device_type)
{
    return search_devices(device_type, utils::system_interfaces {});
}

} // namespace discovery
