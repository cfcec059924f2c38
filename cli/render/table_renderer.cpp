#include "render/table_renderer.h"

#include <algorithm>
#include <sstream>
#include <vector>

#include <nlohmann/json.hpp>

namespace sqljudge::render {

namespace {

/// Counts code points; continuation bytes do not advance the column.
size_t display_width(const std::string& text) {
  size_t width = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0U) != 0x80U) ++width;
  }
  return width;
}

std::string clip(const std::string& text, size_t max_width) {
  std::string flat;
  flat.reserve(text.size());
  for (char c : text) flat.push_back(c == '\n' || c == '\r' || c == '\t' ? ' ' : c);
  if (max_width == 0 || display_width(flat) <= max_width) return flat;
  std::string out;
  size_t width = 0;
  for (size_t i = 0; i < flat.size(); ++i) {
    const auto c = static_cast<unsigned char>(flat[i]);
    if ((c & 0xC0U) != 0x80U) {
      if (width + 1 >= max_width) break;
      ++width;
    }
    out.push_back(flat[i]);
  }
  return out + "…";
}

std::string repeat(const std::string& unit, size_t count) {
  std::string out;
  out.reserve(unit.size() * count);
  for (size_t i = 0; i < count; ++i) out += unit;
  return out;
}

std::string pad(const std::string& text, size_t width) {
  return text + std::string(width - std::min(width, display_width(text)), ' ');
}

void write_border(std::ostringstream& out, const std::vector<size_t>& widths, const char* left,
                  const char* mid, const char* right) {
  out << left;
  for (size_t i = 0; i < widths.size(); ++i) {
    if (i > 0) out << mid;
    out << repeat("─", widths[i] + 2);
  }
  out << right << "\n";
}

void write_cells(std::ostringstream& out, const std::vector<std::string>& cells,
                 const std::vector<size_t>& widths) {
  out << "│";
  for (size_t i = 0; i < widths.size(); ++i) {
    out << " " << pad(i < cells.size() ? cells[i] : "", widths[i]) << " │";
  }
  out << "\n";
}

}  // namespace

std::string render_table(const ResultTable& table, const TableOptions& options) {
  const size_t shown = options.max_rows == 0 ? table.rows.size()
                                             : std::min(options.max_rows, table.rows.size());
  std::vector<std::string> header;
  std::vector<std::string> types;
  for (size_t i = 0; i < table.columns.size(); ++i) {
    header.push_back(clip(table.columns[i], options.max_cell_width));
    const std::string type = i < table.column_types.size() ? table.column_types[i] : "";
    types.push_back(clip(type, options.max_cell_width));
  }
  std::vector<std::vector<std::string>> cells;
  cells.reserve(shown);
  for (size_t r = 0; r < shown; ++r) {
    std::vector<std::string> row;
    for (const auto& value : table.rows[r]) row.push_back(clip(value_to_display(value), options.max_cell_width));
    cells.push_back(std::move(row));
  }

  std::vector<size_t> widths(header.size(), 1);
  for (size_t i = 0; i < header.size(); ++i) {
    widths[i] = std::max({widths[i], display_width(header[i]), display_width(types[i])});
    for (const auto& row : cells) widths[i] = std::max(widths[i], display_width(row[i]));
  }

  std::ostringstream out;
  if (header.empty()) {
    out << "(no columns)\n";
    return out.str();
  }
  const bool has_types = std::any_of(types.begin(), types.end(), [](const std::string& t) { return !t.empty(); });
  write_border(out, widths, "┌", "┬", "┐");
  write_cells(out, header, widths);
  if (has_types) write_cells(out, types, widths);
  write_border(out, widths, "├", "┼", "┤");
  for (const auto& row : cells) write_cells(out, row, widths);
  write_border(out, widths, "└", "┴", "┘");
  out << table.rows.size() << (table.rows.size() == 1 ? " row" : " rows");
  if (shown < table.rows.size()) out << " (" << shown << " shown)";
  out << "\n";
  return out.str();
}

std::string render_dataset_preview(const DatasetPreview& preview, const TableOptions& options) {
  std::ostringstream out;
  out << "Dataset " << preview.dataset_key;
  if (!preview.name.empty()) out << " (" << preview.name << ")";
  out << ": " << preview.tables.size() << (preview.tables.size() == 1 ? " table" : " tables") << "\n";
  for (const auto& table : preview.tables) {
    out << "\n" << table.schema.name << "\n";
    out << render_table(table.sample, options);
  }
  return out.str();
}

std::string render_dataset_preview_json(const DatasetPreview& preview) {
  nlohmann::ordered_json out;
  out["dataset"] = preview.dataset_key;
  out["name"] = preview.name;
  nlohmann::ordered_json tables = nlohmann::ordered_json::array();
  for (const auto& table : preview.tables) {
    nlohmann::ordered_json item;
    item["name"] = table.schema.name;
    nlohmann::ordered_json columns = nlohmann::ordered_json::array();
    for (const auto& col : table.schema.columns) {
      columns.push_back({{"name", col.name}, {"type", col.declared_type}});
    }
    item["columns"] = std::move(columns);
    nlohmann::ordered_json rows = nlohmann::ordered_json::array();
    for (const auto& row : table.sample.rows) {
      nlohmann::ordered_json cells = nlohmann::ordered_json::array();
      for (const auto& value : row) {
        if (value.is_null()) {
          cells.push_back(nullptr);
        } else {
          cells.push_back(value_to_display(value));
        }
      }
      rows.push_back(std::move(cells));
    }
    item["sample"] = std::move(rows);
    tables.push_back(std::move(item));
  }
  out["tables"] = std::move(tables);
  return out.dump();
}

}  // namespace sqljudge::render
