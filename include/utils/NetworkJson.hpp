#ifndef VITCO_UTILS_NETWORKJSON_HPP
#define VITCO_UTILS_NETWORKJSON_HPP

/**
 * @file NetworkJson.hpp
 * @brief NetworkInfo <-> JSON mapping shared by the state file and the API.
 *
 * Stored shape: `{type: "wifi"|"ethernet"|"none", ssid?, bssid?, macAddress?, adapterName?}`.
 */

#include <ArduinoJson.h>

#include "core/Types.hpp"

namespace vitco::utils {

    void writeNetwork(JsonObject out, const NetworkInfo& info);

    [[nodiscard]] NetworkInfo readNetwork(JsonObjectConst in);

}

#endif  // VITCO_UTILS_NETWORKJSON_HPP
