#include "config/ClientConfig.h"

#include <algorithm>
#include <cctype>

const char *hazardModeToString(HazardMode mode)
{
    switch (mode)
    {
    case HazardMode::Lethal:
        return "lethal";
    case HazardMode::Solid:
        return "solid";
    }
    return "lethal";
}

std::optional<HazardMode> hazardModeFromString(const std::string &id)
{
    std::string lowered = id;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "lethal")
    {
        return HazardMode::Lethal;
    }
    if (lowered == "solid")
    {
        return HazardMode::Solid;
    }
    return std::nullopt;
}
