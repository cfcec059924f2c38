#pragma once

#include <cstddef>
#include <string>

#include "sqljudge/executor.h"
#include "sqljudge/result_table.h"

namespace sqljudge::render {

struct TableOptions {
  size_t max_rows = 40;
  size_t max_cell_width = 40;
};

/// Renders a result as a box-drawn table with a row-count footer.
std::string render_table(const ResultTable& table, const TableOptions& options);
/// Renders every table of a dataset preview with its declared column types.
std::string render_dataset_preview(const DatasetPreview& preview, const TableOptions& options);
/// JSON form of a dataset preview.
std::string render_dataset_preview_json(const DatasetPreview& preview);

}  // namespace sqljudge::render
