#pragma once

#include <nlohmann/json.hpp>
#include <mediadex/extraction/sampler_record.h>
#include <mediadex/metadata/index_types.h>
#include <mediadex/sync/sync_engine.h>

namespace mediadex::cli {

using json = nlohmann::json;

json toJson(const metadata::FileRecord& file);
json toJson(const metadata::Page& page);
json toJson(const extraction::SamplerRecord& sampler);
json toJson(const extraction::SamplerRecords& samplers);
json toJson(const metadata::FilterOptions& options);
json toJson(const metadata::IndexStats& stats);
json toJson(const sync::SyncSummary& summary);

} // namespace mediadex::cli
