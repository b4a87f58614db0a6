#pragma once

#include "ParkingConfig.hpp"

#include <string>
#include <vector>

namespace autopark
{
    struct ConfigParseResult
    {
        bool ok = false;
        ParkingConfig config{};
        std::vector<std::string> errors;
    };

    std::string parkingConfigToJson(const ParkingConfig &config);

    // Missing keys keep their defaults; the result is also run through validateParkingConfig()
    ConfigParseResult parkingConfigFromJson(const std::string &json_text);

    std::string validationErrorsToJson(const std::vector<std::string> &errors);
} // namespace autopark
