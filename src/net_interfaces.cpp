#include "net_interfaces.hpp"
#include "logger.hpp"

#include <array>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <ifaddrs.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netdb.h>
#include <net/if.h>
#include <net/route.h>

namespace utils
{

static bool is_zero_hex(const std::string& field)
{
    return !field.empty() && field.find_first_not_of('0') == std::string::npos;
}

static unsigned long parse_flags(const std::string& field)
{
    try {
        return std::stoul(field, nullptr, 16);
    } catch(std::logic_error&) {
        return 0;
    }
}

std::set<std::string> gateway_interfaces_v4(std::istream& route_table)
{
    // Iface Destination Gateway Flags RefCnt Use Metric Mask MTU Window IRTT
    std::set<std::string> result;
    std::string line;
    std::getline(route_table, line); // header
    while(std::getline(route_table, line))
    {
        std::istringstream fields {line};
        std::string iface, destination, gateway, flags;
        if(!(fields >> iface >> destination >> gateway >> flags))
            continue;

        if(!is_zero_hex(gateway) && (parse_flags(flags) & RTF_GATEWAY))
            result.insert(iface);
    }
    return result;
}

std::set<std::string> gateway_interfaces_v6(std::istream& route_table)
{
    // dest dest_plen src src_plen next_hop metric refcnt use flags iface
    std::set<std::string> result;
    std::string line;
    while(std::getline(route_table, line))
    {
        std::istringstream fields {line};
        std::array<std::string, 10> f;
        bool complete = true;
        for(auto& field : f)
        {
            if(!(fields >> field))
            {
                complete = false;
                break;
            }
        }
        if(!complete)
            continue;

        if(!is_zero_hex(f[4]) && (parse_flags(f[8]) & RTF_GATEWAY))
            result.insert(f[9]);
    }
    return result;
}

static std::set<std::string> read_gateway_interfaces()
{
    std::set<std::string> gateways;

    std::ifstream v4 {"/proc/net/route"};
    if(v4.good())
        gateways = gateway_interfaces_v4(v4);
    else
        logger::debug("/proc/net/route is not readable");

    std::ifstream v6 {"/proc/net/ipv6_route"};
    if(v6.good())
        gateways.merge(gateway_interfaces_v6(v6));
    else
        logger::debug("/proc/net/ipv6_route is not readable");

    return gateways;
}

std::vector<local_address> system_interfaces::addresses() const
{
    std::vector<local_address> result;

    const std::set<std::string> gateways = read_gateway_interfaces();
    if(gateways.empty())
        return result;

    ifaddrs* addrs;
    if(getifaddrs(&addrs))
    {
        logger::warn("Unable to enumerate network interfaces");
        return result;
    }

    for(ifaddrs* curr_addr = addrs; curr_addr != nullptr; curr_addr = curr_addr->ifa_next)
    {
        if(curr_addr->ifa_addr == nullptr || curr_addr->ifa_name == nullptr)
            continue;

        int family = curr_addr->ifa_addr->sa_family;
        if(family != AF_INET && family != AF_INET6)
            continue;

        if(!(curr_addr->ifa_flags & IFF_UP) || gateways.count(curr_addr->ifa_name) == 0)
            continue;

        std::array<char, NI_MAXHOST> host;
        int s = getnameinfo(curr_addr->ifa_addr, (family == AF_INET) ? sizeof(sockaddr_in) : sizeof(sockaddr_in6),
            host.data(), NI_MAXHOST, nullptr, 0, NI_NUMERICHOST);
        if(s != 0)
            continue;

        local_address addr;
        addr.ip = host.data();
        // getnameinfo appends the zone to link-local addresses
        if(size_t zone = addr.ip.find('%'); zone != std::string::npos)
            addr.ip.erase(zone);
        addr.family = family;
        addr.interface = curr_addr->ifa_name;
        addr.if_index = if_nametoindex(curr_addr->ifa_name);

        result.push_back(std::move(addr));
    }

    freeifaddrs(addrs);
    return result;
}

std::vector<local_address> get_local_addresses()
{
    return system_interfaces {}.addresses();
}

} // namespace utils
