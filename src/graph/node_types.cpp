#include <mediadex/graph/node_types.h>

namespace mediadex::graph {

const PositionalWidgetTable& positionalWidgetTable() {
    static const PositionalWidgetTable table = [] {
        PositionalWidgetTable t;
        const std::map<std::string, size_t, std::less<>> samplerLayout = {
            {"seed", 0},         {"control_after_generate", 1}, {"steps", 2}, {"cfg", 3},
            {"sampler_name", 4}, {"scheduler", 5},              {"denoise", 6}};
        const std::map<std::string, size_t, std::less<>> latentLayout = {
            {"width", 0}, {"height", 1}, {"batch_size", 2}};

        t["KSampler"] = samplerLayout;
        t["KSamplerAdvanced"] = samplerLayout;
        t["CLIPTextEncode"] = {{"text", 0}};
        t["CheckpointLoaderSimple"] = {{"ckpt_name", 0}};
        t["EmptyLatentImage"] = latentLayout;
        t["EmptySD3LatentImage"] = latentLayout;
        t["DualCLIPLoader"] = {{"clip_name1", 0}, {"clip_name2", 1}, {"type", 2}};
        t["UNETLoader"] = {{"unet_name", 0}};
        t["PrimitiveNode"] = {{"value", 0}};
        return t;
    }();
    return table;
}

} // namespace mediadex::graph
