#include "platform/PlatformNetwork.hpp"

#include "core/Logger.hpp"
#include "platform/PlatformProcess.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <regex>
#include <set>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <linux/if_packet.h>
#include <net/if.h>
#include <netinet/in.h>

namespace vitco::platform
{
namespace
{
constexpr auto *NET_TAG{"PlatformNet"};

std::string trim(std::string_view text)
{
    const auto first{text.find_first_not_of(" \t\r\n")};
    if (first == std::string_view::npos)
    {
        return {};
    }
    const auto last{text.find_last_not_of(" \t\r\n")};
    return std::string{text.substr(first, last - first + 1)};
}

std::string toUpper(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(), [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::vector<std::string_view> splitLines(std::string_view text)
{
    std::vector<std::string_view> lines{};
    std::size_t start{0};
    while (start <= text.size())
    {
        auto end{text.find('\n', start)};
        if (end == std::string_view::npos)
        {
            end = text.size();
        }
        auto line{text.substr(start, end - start)};
        if (!line.empty() && line.back() == '\r')
        {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        start = end + 1;
    }
    return lines;
}
} // namespace

std::optional<std::string> parseIwgetidSsid(std::string_view output)
{
    auto ssid{trim(output)};
    if (ssid.empty())
    {
        return std::nullopt;
    }
    return ssid;
}

std::optional<std::string> parseMacAddress(std::string_view output)
{
    static const std::regex macPattern{"([0-9A-Fa-f]{2}:){5}[0-9A-Fa-f]{2}"};

    const std::string text{output};
    std::smatch match{};
    if (!std::regex_search(text, match, macPattern))
    {
        return std::nullopt;
    }
    return toUpper(match.str(0));
}

std::optional<std::string> parseNmcliActiveSsid(std::string_view output)
{
    for (const auto line : splitLines(output))
    {
        if (line.substr(0, 4) != "yes:")
        {
            continue;
        }
        auto ssid{trim(line.substr(4))};
        if (!ssid.empty())
        {
            return ssid;
        }
    }
    return std::nullopt;
}

std::optional<EthernetNetwork> parseIpLinkEthernet(std::string_view output)
{
    static const std::regex wirelessLink{R"(^\d+:\s+(wlan|wlp|wl-))", std::regex::icase};
    static const std::regex wiredLink{R"(^\d+:\s+(eth|enp|eno|ens|em))", std::regex::icase};
    static const std::regex etherAddr{R"(link/ether\s+([0-9a-f:]{17}))", std::regex::icase};
    static const std::regex adapterName{R"(^\d+:\s+([^:]+):)"};

    const auto lines{splitLines(output)};
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        const std::string line{lines[i]};
        if (std::regex_search(line, wirelessLink) || !std::regex_search(line, wiredLink))
        {
            continue;
        }

        const std::string next{i + 1 < lines.size() ? std::string{lines[i + 1]} : std::string{}};
        std::smatch mac{};
        if (!std::regex_search(next, mac, etherAddr))
        {
            continue;
        }

        EthernetNetwork eth{.macAddress = toUpper(mac.str(1))};
        if (std::smatch name{}; std::regex_search(line, name, adapterName))
        {
            eth.adapterName = trim(name.str(1));
        }
        return eth;
    }
    return std::nullopt;
}

NetworkInfo detectNetwork(const std::uint32_t commandTimeoutMs)
{
    std::optional<std::string> ssid{};
    std::optional<std::string> bssid{};

    if (const auto iw{runCommand({"iwgetid", "-r"}, commandTimeoutMs)}; iw.ok() && iw.value.exitCode == 0)
    {
        ssid = parseIwgetidSsid(iw.value.out);
        if (ssid)
        {
            // Needs extra privileges on some systems; the SSID alone is enough.
            if (const auto ap{runCommand({"iwgetid", "-ar"}, commandTimeoutMs)}; ap.ok() && ap.value.exitCode == 0)
            {
                bssid = parseMacAddress(ap.value.out);
            }
        }
    }
    else if (const auto nm{runCommand({"nmcli", "-t", "-f", "active,ssid", "dev", "wifi"}, commandTimeoutMs)}; nm.ok() && nm.value.exitCode == 0)
    {
        ssid = parseNmcliActiveSsid(nm.value.out);
    }

    if (ssid)
    {
        return WifiNetwork{.ssid = *ssid, .bssid = bssid};
    }

    if (const auto link{runCommand({"ip", "link", "show"}, commandTimeoutMs)}; link.ok() && link.value.exitCode == 0)
    {
        if (auto eth{parseIpLinkEthernet(link.value.out)})
        {
            return *eth;
        }
    }
    else
    {
        LOG_DEBUG(NET_TAG, "ip link show unavailable: %s", link.status.message.c_str());
    }

    return std::monostate{};
}

std::optional<std::string> firstNonLoopbackIpv4()
{
    ifaddrs *list{nullptr};
    if (getifaddrs(&list) != 0)
    {
        LOG_WARNING(NET_TAG, "getifaddrs failed");
        return std::nullopt;
    }

    std::optional<std::string> found{};
    for (const ifaddrs *it = list; it != nullptr; it = it->ifa_next)
    {
        if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET || (it->ifa_flags & IFF_LOOPBACK) != 0)
        {
            continue;
        }

        const auto *addr{reinterpret_cast<const sockaddr_in *>(it->ifa_addr)};
        char text[INET_ADDRSTRLEN]{};
        if (inet_ntop(AF_INET, &addr->sin_addr, text, sizeof(text)))
        {
            found = text;
            break;
        }
    }

    freeifaddrs(list);
    return found;
}

std::vector<std::string> hardwareAddresses()
{
    ifaddrs *list{nullptr};
    if (getifaddrs(&list) != 0)
    {
        return {};
    }

    std::set<std::string> seenInterfaces{};
    std::set<std::string> macs{};
    for (const ifaddrs *it = list; it != nullptr; it = it->ifa_next)
    {
        if (!it->ifa_addr || it->ifa_addr->sa_family != AF_PACKET || !seenInterfaces.insert(it->ifa_name).second)
        {
            continue;
        }

        const auto *ll{reinterpret_cast<const sockaddr_ll *>(it->ifa_addr)};
        if (ll->sll_halen != 6)
        {
            continue;
        }

        const bool allZero{std::all_of(ll->sll_addr, ll->sll_addr + 6, [](const unsigned char b) { return b == 0; })};
        if (allZero)
        {
            continue;
        }

        char text[18]{};
        std::snprintf(text, sizeof(text), "%02x:%02x:%02x:%02x:%02x:%02x",
                      ll->sll_addr[0], ll->sll_addr[1], ll->sll_addr[2],
                      ll->sll_addr[3], ll->sll_addr[4], ll->sll_addr[5]);
        macs.insert(text);
    }

    freeifaddrs(list);
    return {macs.begin(), macs.end()};
}
} // namespace vitco::platform
