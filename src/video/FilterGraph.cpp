#include "FilterGraph.h"
#include "utils/StringUtils.h"

#include <algorithm>
#include <sstream>

namespace YtMerge {

std::string buildNormalizeFilter(int width, int height, int fps) {
    std::ostringstream vf;
    vf << "scale=" << width << ":" << height << ":force_original_aspect_ratio=decrease,"
       << "pad=" << width << ":" << height << ":(ow-iw)/2:(oh-ih)/2:black,"
       << "setsar=1,"
       << "fps=" << fps;
    return vf.str();
}

std::string buildSilentAudioSource(int sampleRate) {
    return "anullsrc=channel_layout=stereo:sample_rate=" + std::to_string(sampleRate);
}

CrossfadeGraph buildCrossfadeGraph(const std::vector<double>& durations,
                                   double fadeDuration,
                                   double fallbackDuration) {
    CrossfadeGraph graph;
    const size_t n = durations.size();
    if (n == 0) return graph;

    auto clipDuration = [&](size_t i) {
        return durations[i] > 0.0 ? durations[i] : fallbackDuration;
    };

    const std::string fade = formatDecimal(fadeDuration, 3);
    double running = clipDuration(0);
    graph.timeline.push_back(running);

    std::vector<std::string> videoSteps;
    std::vector<std::string> audioSteps;
    std::string prevV = "[0:v]";
    std::string prevA = "[0:a]";
    for (size_t i = 1; i < n; ++i) {
        double start = std::max(running - fadeDuration, 0.0);
        bool last = (i == n - 1);
        std::string outV = last ? graph.videoLabel : "[vf" + std::to_string(i) + "]";
        std::string outA = last ? graph.audioLabel : "[af" + std::to_string(i) + "]";

        videoSteps.push_back(prevV + "[" + std::to_string(i) + ":v]xfade=transition=fade:duration=" + fade +
                             ":offset=" + formatDecimal(start, 3) + outV);
        audioSteps.push_back(prevA + "[" + std::to_string(i) + ":a]acrossfade=d=" + fade +
                             ":c1=tri:c2=tri" + outA);

        graph.xfadeOffsets.push_back(start);
        running = start + clipDuration(i);
        graph.timeline.push_back(running);
        prevV = outV;
        prevA = outA;
    }

    // Video chain first, then audio chain
    std::ostringstream fc;
    for (size_t i = 0; i < videoSteps.size(); ++i) {
        fc << (i > 0 ? ";" : "") << videoSteps[i];
    }
    for (const auto& step : audioSteps) {
        fc << ";" << step;
    }
    graph.filter = fc.str();
    return graph;
}

std::string buildMusicMixFilter(double volume) {
    std::ostringstream fc;
    fc << "[1:a]aloop=loop=-1:size=2e+09,volume=" << formatDecimal(volume, 3) << "[bg];"
       << "[0:a][bg]amix=inputs=2:duration=first:dropout_transition=3[aout]";
    return fc.str();
}

std::string escapeConcatPath(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        if (c == '\\') {
            out += '/';
        } else if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    return out;
}

std::string buildConcatList(const std::vector<std::string>& paths) {
    std::string list;
    for (const auto& p : paths) {
        list += "file '" + escapeConcatPath(p) + "'\n";
    }
    return list;
}

} // namespace YtMerge
