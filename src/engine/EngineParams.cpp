#include "engine/EngineParams.h"

#include <algorithm>
#include <cctype>

namespace engine {

namespace {

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

}  // namespace

const std::vector<ParamInfo>& GetParamInfoList() {
    static const std::vector<ParamInfo> kParams = {
        {ParamId::ReverbRoomSize, "roomSize", "", 0.0f, 1.0f, 0.5f},
        {ParamId::ReverbDamping, "damping", "", 0.0f, 1.0f, 0.5f},
        {ParamId::ReverbWet, "wet", "", 0.0f, 1.0f, 0.33f},
        {ParamId::ReverbDry, "dry", "", 0.0f, 1.0f, 0.4f},
        {ParamId::ReverbWidth, "width", "", 0.0f, 1.0f, 1.0f},
        {ParamId::LimiterThreshold, "threshold", "dB", -60.0f, 0.0f, -3.0f},
        {ParamId::LimiterAttack, "attack", "s", 0.001f, 1.0f, 0.005f},
        {ParamId::LimiterRelease, "release", "s", 0.001f, 3.0f, 0.05f},
        {ParamId::LimiterMakeupGain, "makeup", "dB", 0.0f, 30.0f, 0.0f},
    };
    return kParams;
}

const ParamInfo* GetParamInfo(ParamId id) {
    const auto& params = GetParamInfoList();
    auto it = std::find_if(params.begin(), params.end(),
                           [id](const ParamInfo& info) { return info.id == id; });
    if (it == params.end()) {
        return nullptr;
    }
    return &(*it);
}

const ParamInfo* FindParamByName(std::string_view name) {
    const auto& params = GetParamInfoList();
    auto it = std::find_if(params.begin(), params.end(), [name](const ParamInfo& info) {
        return EqualsIgnoreCase(name, info.name);
    });
    if (it == params.end()) {
        return nullptr;
    }
    return &(*it);
}

float ClampToRange(const ParamInfo& info, float value) {
    return std::clamp(value, info.minValue, info.maxValue);
}

}  // namespace engine
