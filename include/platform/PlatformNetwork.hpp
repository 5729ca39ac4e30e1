#ifndef VITCO_PLATFORM_NETWORK_HPP
#define VITCO_PLATFORM_NETWORK_HPP

/**
 * @file PlatformNetwork.hpp
 * @brief Linux network attachment detection
 *
 * Wi-Fi comes from `iwgetid` (falling back to `nmcli`), wired links from
 * `ip link show`. The parsers are split from the command runners so the
 * command output formats can be tested without the tools installed.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/Types.hpp"

namespace vitco::platform
{
/**
 * @brief Trimmed `iwgetid -r` output, nullopt when empty
 */
[[nodiscard]] std::optional<std::string> parseIwgetidSsid(std::string_view output);

/**
 * @brief First MAC address in `iwgetid -ar` output, uppercased
 */
[[nodiscard]] std::optional<std::string> parseMacAddress(std::string_view output);

/**
 * @brief SSID of the line starting with `yes:` in `nmcli -t -f active,ssid dev wifi`
 */
[[nodiscard]] std::optional<std::string> parseNmcliActiveSsid(std::string_view output);

/**
 * @brief First wired link in `ip link show` output
 *
 * Wireless names (`wl*`) are skipped. A link qualifies when its name starts
 * with eth, enp, eno, ens or em and the following line carries `link/ether`.
 */
[[nodiscard]] std::optional<EthernetNetwork> parseIpLinkEthernet(std::string_view output);

/**
 * @brief Detect the current attachment: Wi-Fi with an SSID wins, then Ethernet
 */
[[nodiscard]] NetworkInfo detectNetwork(std::uint32_t commandTimeoutMs);

/**
 * @brief First non-loopback IPv4 address in `getifaddrs` order
 */
[[nodiscard]] std::optional<std::string> firstNonLoopbackIpv4();

/**
 * @brief Non-zero hardware addresses, one per interface, lowercase, sorted
 */
[[nodiscard]] std::vector<std::string> hardwareAddresses();
} // namespace vitco::platform

#endif // VITCO_PLATFORM_NETWORK_HPP
