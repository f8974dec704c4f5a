#pragma once

#include <string>
#include <vector>

namespace YtMerge {

/**
 * @brief Crossfade filter_complex for N inputs plus its timeline
 */
struct CrossfadeGraph {
    std::string filter;                // empty when fewer than two inputs
    std::vector<double> xfadeOffsets;  // start of each transition, n-1 values
    std::vector<double> timeline;      // running end offset after each clip, n values
    std::string videoLabel = "[vout]";
    std::string audioLabel = "[aout]";
};

// scale + letterbox pad + square pixels + constant frame rate
std::string buildNormalizeFilter(int width, int height, int fps);

// lavfi source producing silent stereo audio at the given rate
std::string buildSilentAudioSource(int sampleRate);

/**
 * @brief Chain xfade/acrossfade between consecutive inputs
 *
 * Each transition starts fadeDuration before the running end of the merged
 * timeline (never before 0). Non-positive durations use fallbackDuration.
 *
 * @param durations Clip durations in seconds, in input order
 * @param fadeDuration Transition length in seconds
 * @param fallbackDuration Duration assumed for clips that could not be probed
 */
CrossfadeGraph buildCrossfadeGraph(const std::vector<double>& durations,
                                   double fadeDuration,
                                   double fallbackDuration);

/**
 * @brief Loop input 1's audio forever at the given volume and mix it under
 * input 0's audio, ending with input 0
 *
 * Output label is [aout].
 */
std::string buildMusicMixFilter(double volume);

// Path in concat demuxer syntax: forward slashes, single quotes escaped
std::string escapeConcatPath(const std::string& path);

// One "file '<path>'" line per input
std::string buildConcatList(const std::vector<std::string>& paths);

} // namespace YtMerge
