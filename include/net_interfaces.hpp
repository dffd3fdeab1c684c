#ifndef UPNP_SCAN_NET_INTERFACES_HPP
#define UPNP_SCAN_NET_INTERFACES_HPP

#include <istream>
#include <set>
#include <string>
#include <vector>

namespace utils
{

struct local_address
{
    std::string ip;         /// numeric host without scope suffix
    int family = 0;         /// AF_INET or AF_INET6
    std::string interface;
    unsigned int if_index = 0;
};

class interface_provider
{
public:
    virtual ~interface_provider() = default;

    virtual std::vector<local_address> addresses() const = 0;
};

/**
 * Enumerates the unicast ipv4 and ipv6 addresses of all interfaces that are up
 * and own a gateway route. Reading never modifies system state so the provider
 * can be queried repeatedly and from several threads.
 */
class system_interfaces : public interface_provider
{
public:

    std::vector<local_address> addresses() const override;

};

/**
 * Parses /proc/net/route and returns the names of interfaces with at least one
 * gateway route
 */
std::set<std::string> gateway_interfaces_v4(std::istream& route_table);

/**
 * Same for /proc/net/ipv6_route
 */
std::set<std::string> gateway_interfaces_v6(std::istream& route_table);

/**
 * Local addresses eligible for multicast search, using the system interfaces
 */
std::vector<local_address> get_local_addresses();

} // namespace utils

#endif
