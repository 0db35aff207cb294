#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>

namespace SharedData
{
    using TimePoint = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

    // Serialized as seconds since the unix epoch, which is what both sftp and stat deliver.
    inline void to_json(nlohmann::json& j, TimePoint const& tp)
    {
        j = static_cast<std::int64_t>(tp.time_since_epoch().count());
    }
    inline void from_json(nlohmann::json const& j, TimePoint& tp)
    {
        tp = TimePoint{std::chrono::seconds{j.get<std::int64_t>()}};
    }
}

// Inject into STD for ADL:
namespace std::chrono
{
    inline void to_json(nlohmann::json& j, SharedData::TimePoint const& tp)
    {
        SharedData::to_json(j, tp);
    }
    inline void from_json(nlohmann::json const& j, SharedData::TimePoint& tp)
    {
        SharedData::from_json(j, tp);
    }
}
