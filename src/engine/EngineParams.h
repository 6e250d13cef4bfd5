#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace engine {

// Effect-chain controls settable from any thread.
enum class ParamId {
    ReverbRoomSize,
    ReverbDamping,
    ReverbWet,
    ReverbDry,
    ReverbWidth,
    LimiterThreshold,
    LimiterAttack,
    LimiterRelease,
    LimiterMakeupGain,
    Count,
};

constexpr std::size_t kParamCount = static_cast<std::size_t>(ParamId::Count);

struct ParamInfo {
    ParamId id;
    const char* name;
    const char* unit;
    float minValue;
    float maxValue;
    float defaultValue;
};

const std::vector<ParamInfo>& GetParamInfoList();
const ParamInfo* GetParamInfo(ParamId id);
// Case-insensitive.
const ParamInfo* FindParamByName(std::string_view name);
float ClampToRange(const ParamInfo& info, float value);

}  // namespace engine
