#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <span>
#include <string>
#include <string_view>

namespace mediadex::graph {

// Bumped whenever one of the tables below changes.
inline constexpr int kNodeTableVersion = 1;

// Nodes that perform an actual sampling pass. Selector helpers are excluded.
inline constexpr std::array<std::string_view, 9> kSamplerTypes = {
    "KSampler",           "KSamplerAdvanced", "SamplerCustom",
    "SamplerCustomAdvanced", "KSamplerEfficient", "DetailerForEach",
    "SamplerDPMPP_2M_SDE", "WanVideoSampler",  "UltimateSDUpscale"};

inline constexpr std::array<std::string_view, 7> kModelLoaderTypes = {
    "CheckpointLoaderSimple", "CheckpointLoader",      "Load Checkpoint", "UNETLoader",
    "Load Diffusion Model",   "UnetLoaderGGUF",        "DualCLIPLoader"};

inline constexpr std::array<std::string_view, 5> kPromptEncoderTypes = {
    "CLIPTextEncode", "CLIP Text Encode (Prompt)", "TextEncodeQwenImageEditPlus",
    "CLIPTextEncodeSDXL", "CLIPTextEncodeSDXLRefiner"};

inline constexpr std::array<std::string_view, 4> kSchedulerTypes = {
    "BasicScheduler", "KarrasScheduler", "ExponentialScheduler", "SgmUniformScheduler"};

inline constexpr std::array<std::string_view, 1> kSamplerSelectTypes = {"KSamplerSelect"};

inline constexpr std::array<std::string_view, 3> kDimensionProviderTypes = {
    "EmptyLatentImage", "EmptySD3LatentImage", "WanImageToVideo"};

// Loader widget names tried in order when resolving a model name.
inline constexpr std::array<std::string_view, 4> kModelNameParams = {"ckpt_name", "unet_name",
                                                                     "model_name", "clip_name1"};

inline constexpr std::string_view kPrimitivePrefix = "Primitive";

inline bool containsType(std::span<const std::string_view> types, std::string_view type) {
    for (auto t : types) {
        if (t == type) {
            return true;
        }
    }
    return false;
}

/**
 * @brief Widget positions for well-known node types
 *
 * Used for the linked serialization when a document carries no
 * widget index map (or an incomplete one) for a node.
 */
using PositionalWidgetTable = std::map<std::string, std::map<std::string, size_t, std::less<>>,
                                       std::less<>>;

const PositionalWidgetTable& positionalWidgetTable();

} // namespace mediadex::graph
