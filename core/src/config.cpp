#include <auroscuro/config.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace auroscuro {

using json = nlohmann::json;

namespace {

const std::vector<SurfacePreset> kPresets = {
    {"9:16", 1080, 1920},
    {"1:1", 1080, 1080},
    {"16:9", 1920, 1080},
};

template <typename T>
void readNumber(const json& j, const char* key, T& value) {
    auto it = j.find(key);
    if (it != j.end() && it->is_number()) {
        value = it->get<T>();
    }
}

void readBool(const json& j, const char* key, bool& value) {
    auto it = j.find(key);
    if (it != j.end() && it->is_boolean()) {
        value = it->get<bool>();
    }
}

void readString(const json& j, const char* key, std::string& value) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string()) {
        value = it->get<std::string>();
    }
}

// Colors are [r, g, b] or [r, g, b, a] in 0-1
void readColor(const json& j, const char* key, glm::vec4& value) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_array() || it->size() < 3 || it->size() > 4) {
        return;
    }
    glm::vec4 c = value;
    for (size_t i = 0; i < it->size(); i++) {
        if (!(*it)[i].is_number()) {
            return;
        }
        c[static_cast<int>(i)] = (*it)[i].get<float>();
    }
    value = c;
}

json colorJson(const glm::vec4& c) {
    return json::array({c.r, c.g, c.b, c.a});
}

const json* section(const json& j, const char* key) {
    auto it = j.find(key);
    if (it != j.end() && it->is_object()) {
        return &*it;
    }
    return nullptr;
}

void readBand(const json& j, const char* key, audio::BandRange& band) {
    auto it = j.find(key);
    if (it != j.end() && it->is_array() && it->size() == 2 &&
        (*it)[0].is_number() && (*it)[1].is_number()) {
        band.startFrac = (*it)[0].get<float>();
        band.endFrac = (*it)[1].get<float>();
    }
}

void readWeights(const json& j, const char* key, LayerWeights& w) {
    if (const json* s = section(j, key)) {
        readNumber(*s, "bass", w.bass);
        readNumber(*s, "mid", w.mid);
        readNumber(*s, "beat", w.beat);
    }
}

json weightsJson(const LayerWeights& w) {
    return {{"bass", w.bass}, {"mid", w.mid}, {"beat", w.beat}};
}

void readGlow(const json& j, const char* key, effects::GlowStyle& g) {
    if (const json* s = section(j, key)) {
        readColor(*s, "color", g.color);
        readNumber(*s, "radiusScale", g.radiusScale);
        readNumber(*s, "strength", g.strength);
    }
}

json glowJson(const effects::GlowStyle& g) {
    return {{"color", colorJson(g.color)}, {"radiusScale", g.radiusScale}, {"strength", g.strength}};
}

const char* noiseStyleName(io::NoiseStyle style) {
    return style == io::NoiseStyle::Warm ? "warm" : "white";
}

void apply(const json& root, VisualizerConfig& c) {
    if (const json* s = section(root, "analyser")) {
        readNumber(*s, "fftSize", c.analyser.fftSize);
        readNumber(*s, "smoothingTimeConstant", c.analyser.smoothingTimeConstant);
        readNumber(*s, "minDecibels", c.analyser.minDecibels);
        readNumber(*s, "maxDecibels", c.analyser.maxDecibels);
    }

    if (const json* s = section(root, "detector")) {
        audio::BeatDetectorConfig& d = c.detector;
        readBand(*s, "bassRange", d.bassRange);
        readBand(*s, "midRange", d.midRange);
        readBool(*s, "ignoreSilentBins", d.ignoreSilentBins);
        readNumber(*s, "smoothingFactor", d.smoothingFactor);
        readNumber(*s, "rampDurationMs", d.rampDurationMs);
        readNumber(*s, "compressionGamma", d.compressionGamma);
        readNumber(*s, "signalEpsilon", d.signalEpsilon);
        readNumber(*s, "bassWeight", d.bassWeight);
        readNumber(*s, "midWeight", d.midWeight);
        readNumber(*s, "relativeEpsilon", d.relativeEpsilon);
        readNumber(*s, "envelopeSmoothing", d.envelopeSmoothing);
        readNumber(*s, "beatThresholdMultiplier", d.beatThresholdMultiplier);
        readNumber(*s, "beatCooldownMs", d.beatCooldownMs);
        readNumber(*s, "beatDecay", d.beatDecay);
        readNumber(*s, "boostSnapThreshold", d.boostSnapThreshold);
    }

    if (const json* s = section(root, "mapper")) {
        readWeights(*s, "edge", c.mapper.edge);
        readWeights(*s, "center", c.mapper.center);
        if (const json* g = section(*s, "grain")) {
            readNumber(*g, "baseOpacity", c.mapper.grain.baseOpacity);
            readNumber(*g, "maxOpacity", c.mapper.grain.maxOpacity);
            readNumber(*g, "bass", c.mapper.grain.bass);
            readNumber(*g, "mid", c.mapper.grain.mid);
            readNumber(*g, "beat", c.mapper.grain.beat);
        }
        if (const json* t = section(*s, "transform")) {
            TransformWeights& w = c.mapper.transform;
            readNumber(*t, "rotationDeg", w.rotationDeg);
            readNumber(*t, "beatRotationDeg", w.beatRotationDeg);
            readNumber(*t, "beatScale", w.beatScale);
            readNumber(*t, "brightnessBass", w.brightnessBass);
            readNumber(*t, "brightnessBeat", w.brightnessBeat);
            readNumber(*t, "contrastMid", w.contrastMid);
            readNumber(*t, "contrastBeat", w.contrastBeat);
        }
    }

    if (const json* s = section(root, "render")) {
        readNumber(*s, "overscan", c.render.overscan);
        readGlow(*s, "centerGlow", c.render.centerGlow);
        readGlow(*s, "edgeGlow", c.render.edgeGlow);
        readNumber(*s, "grainThreshold", c.render.grainThreshold);
        readColor(*s, "desaturateColor", c.render.desaturateColor);
        readNumber(*s, "desaturateAlpha", c.render.desaturateAlpha);
    }

    if (const json* s = section(root, "surface")) {
        readString(*s, "preset", c.surfacePreset);
        readNumber(*s, "devicePixelRatio", c.devicePixelRatio);
    }

    readNumber(root, "tickRate", c.tickRate);
    readNumber(root, "recordFps", c.recordFps);

    if (const json* s = section(root, "noise")) {
        readString(*s, "texture", c.noiseTexture);
        std::string style = noiseStyleName(c.noiseStyle);
        readString(*s, "style", style);
        if (!io::parseNoiseStyle(style, c.noiseStyle)) {
            std::cerr << "[Config] Unknown noise style '" << style << "', keeping "
                      << noiseStyleName(c.noiseStyle) << std::endl;
        }
        readNumber(*s, "size", c.noiseSize);
        readNumber(*s, "seed", c.noiseSeed);
    }
}

} // namespace

const std::vector<SurfacePreset>& surfacePresets() {
    return kPresets;
}

bool findSurfacePreset(const std::string& name, SurfacePreset& out) {
    for (const auto& preset : kPresets) {
        if (preset.name == name) {
            out = preset;
            return true;
        }
    }
    return false;
}

effects::SurfaceSize VisualizerConfig::surfaceSize() const {
    SurfacePreset preset;
    if (!findSurfacePreset(surfacePreset, preset)) {
        return {};
    }
    return {preset.width, preset.height, devicePixelRatio};
}

bool VisualizerConfig::fromJsonString(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        std::cerr << "[Config] Parse error: " << e.what() << std::endl;
        return false;
    }

    if (!root.is_object()) {
        std::cerr << "[Config] Top level must be an object" << std::endl;
        return false;
    }

    VisualizerConfig updated = *this;
    try {
        apply(root, updated);
    } catch (const json::exception& e) {
        std::cerr << "[Config] Invalid value: " << e.what() << std::endl;
        return false;
    }
    *this = updated;
    return true;
}

std::string VisualizerConfig::toJsonString() const {
    const audio::BeatDetectorConfig& d = detector;
    const TransformWeights& t = mapper.transform;

    json root;
    root["analyser"] = {
        {"fftSize", analyser.fftSize},
        {"smoothingTimeConstant", analyser.smoothingTimeConstant},
        {"minDecibels", analyser.minDecibels},
        {"maxDecibels", analyser.maxDecibels},
    };
    root["detector"] = {
        {"bassRange", json::array({d.bassRange.startFrac, d.bassRange.endFrac})},
        {"midRange", json::array({d.midRange.startFrac, d.midRange.endFrac})},
        {"ignoreSilentBins", d.ignoreSilentBins},
        {"smoothingFactor", d.smoothingFactor},
        {"rampDurationMs", d.rampDurationMs},
        {"compressionGamma", d.compressionGamma},
        {"signalEpsilon", d.signalEpsilon},
        {"bassWeight", d.bassWeight},
        {"midWeight", d.midWeight},
        {"relativeEpsilon", d.relativeEpsilon},
        {"envelopeSmoothing", d.envelopeSmoothing},
        {"beatThresholdMultiplier", d.beatThresholdMultiplier},
        {"beatCooldownMs", d.beatCooldownMs},
        {"beatDecay", d.beatDecay},
        {"boostSnapThreshold", d.boostSnapThreshold},
    };
    root["mapper"] = {
        {"edge", weightsJson(mapper.edge)},
        {"center", weightsJson(mapper.center)},
        {"grain", {
            {"baseOpacity", mapper.grain.baseOpacity},
            {"maxOpacity", mapper.grain.maxOpacity},
            {"bass", mapper.grain.bass},
            {"mid", mapper.grain.mid},
            {"beat", mapper.grain.beat},
        }},
        {"transform", {
            {"rotationDeg", t.rotationDeg},
            {"beatRotationDeg", t.beatRotationDeg},
            {"beatScale", t.beatScale},
            {"brightnessBass", t.brightnessBass},
            {"brightnessBeat", t.brightnessBeat},
            {"contrastMid", t.contrastMid},
            {"contrastBeat", t.contrastBeat},
        }},
    };
    root["render"] = {
        {"overscan", render.overscan},
        {"centerGlow", glowJson(render.centerGlow)},
        {"edgeGlow", glowJson(render.edgeGlow)},
        {"grainThreshold", render.grainThreshold},
        {"desaturateColor", colorJson(render.desaturateColor)},
        {"desaturateAlpha", render.desaturateAlpha},
    };
    root["surface"] = {
        {"preset", surfacePreset},
        {"devicePixelRatio", devicePixelRatio},
    };
    root["tickRate"] = tickRate;
    root["recordFps"] = recordFps;
    root["noise"] = {
        {"texture", noiseTexture},
        {"style", noiseStyleName(noiseStyle)},
        {"size", noiseSize},
        {"seed", noiseSeed},
    };

    return root.dump(2);
}

bool VisualizerConfig::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Config] Failed to open: " << path << std::endl;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!fromJsonString(buffer.str())) {
        std::cerr << "[Config] Ignoring " << path << std::endl;
        return false;
    }

    std::cout << "[Config] Loaded: " << path << std::endl;
    return true;
}

bool VisualizerConfig::saveFile(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Config] Failed to write: " << path << std::endl;
        return false;
    }

    file << toJsonString() << std::endl;
    return static_cast<bool>(file);
}

} // namespace auroscuro
