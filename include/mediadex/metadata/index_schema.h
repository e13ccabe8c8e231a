#pragma once

#include <vector>
#include <mediadex/metadata/migration.h>

namespace mediadex::metadata {

/**
 * @brief Ordered schema history of the gallery index
 *
 * 1. files table and the legacy one-row-per-file samplers table
 * 2. preview, sampler summary, thumbnail and folder columns
 * 3. samplers keyed by (file_id, sampler_index), rebuilt from a backup on failure
 * 4. secondary indices for every sortable and filterable column
 */
std::vector<Migration> indexMigrations();

// Current schema version
constexpr int kIndexSchemaVersion = 4;

} // namespace mediadex::metadata
