#include "utils/NetworkJson.hpp"

#include <string>

namespace vitco::utils {

    void writeNetwork(JsonObject out, const NetworkInfo& info) {
        out["type"] = toString(networkType(info));

        if (const auto* wifi = std::get_if<WifiNetwork>(&info)) {
            out["ssid"] = wifi->ssid;
            if (wifi->bssid) {
                out["bssid"] = *wifi->bssid;
            }
        } else if (const auto* eth = std::get_if<EthernetNetwork>(&info)) {
            out["macAddress"] = eth->macAddress;
            if (eth->adapterName) {
                out["adapterName"] = *eth->adapterName;
            }
        }
    }

    NetworkInfo readNetwork(JsonObjectConst in) {
        if (!in) {
            return std::monostate{};
        }

        const std::string type{in["type"] | "none"};
        if (type == "wifi") {
            WifiNetwork wifi{.ssid = in["ssid"] | std::string{}};
            if (in["bssid"].is<const char*>()) {
                wifi.bssid = in["bssid"].as<std::string>();
            }
            return wifi;
        }
        if (type == "ethernet") {
            EthernetNetwork eth{.macAddress = in["macAddress"] | std::string{}};
            if (in["adapterName"].is<const char*>()) {
                eth.adapterName = in["adapterName"].as<std::string>();
            }
            return eth;
        }
        return std::monostate{};
    }

}
