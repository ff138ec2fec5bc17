// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#include "bouquet/DataFormats.h"

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdint>
#include <cstddef>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "bouquet/Records.h"

#ifdef BOUQUET_ARROW_ENABLED
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <arrow/ipc/api.h>
#include <parquet/arrow/reader.h>
#endif

namespace {

bool set_error(std::string* err, const std::string& msg) {
  if (err) *err = msg;
  return false;
}

std::vector<std::string> BuildFileList(const bouquet::StockSourceSpec& spec) {
  std::vector<std::string> files;
  if (!spec.path.empty()) files.push_back(spec.path);
  files.insert(files.end(), spec.chunks.begin(), spec.chunks.end());
  return files;
}

std::string ChannelPath(const std::string& channel) {
  const std::string file_prefix = "file://";
  if (channel.rfind(file_prefix, 0) == 0 && channel.size() > file_prefix.size()) {
    return channel.substr(file_prefix.size());
  }
  return channel;
}

bool IsStdin(const std::string& channel) {
  return channel == "stdin" || channel == "STDIN";
}

std::string Trim(const std::string& input) {
  std::size_t start = 0;
  while (start < input.size() && std::isspace(static_cast<unsigned char>(input[start]))) ++start;
  std::size_t end = input.size();
  while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1]))) --end;
  return input.substr(start, end - start);
}

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
  return s;
}

bool ParseCount(const std::string& token, int* value) {
  try {
    std::size_t idx = 0;
    long long v = std::stoll(token, &idx);
    if (Trim(token.substr(idx)).size() != 0) return false;
    if (v < 0 || v > INT_MAX) return false;
    *value = static_cast<int>(v);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

bool AddCell(const std::string& species,
             const std::string& size_token,
             int count,
             const std::string& where,
             bouquet::InventoryBuilder* builder,
             std::string* err) {
  bouquet::SizeClass size;
  const std::string sz = Trim(size_token);
  if (sz.size() != 1 || !bouquet::ParseSizeClass(sz[0], &size)) {
    return set_error(err, where + ": unknown size '" + sz + "'");
  }
  const std::string sp = Trim(species);
  if (sp.empty() || !std::all_of(sp.begin(), sp.end(), [](char c) { return std::islower(static_cast<unsigned char>(c)) != 0; })) {
    return set_error(err, where + ": species '" + sp + "' must be lowercase letters");
  }
  return builder->AddStock(sp, size, count, err);
}

// One compact stock record per line; '#' starts a comment.
bool LoadRecordsFromStream(std::istream& in,
                           const std::string& name,
                           bouquet::InventoryBuilder* builder,
                           std::string* err) {
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    auto hash = line.find('#');
    if (hash != std::string::npos) line = line.substr(0, hash);
    line = Trim(line);
    if (line.empty()) continue;
    bouquet::StockRecord rec;
    std::string e;
    if (!bouquet::ParseStockRecord(line, &rec, &e)) {
      return set_error(err, name + ":" + std::to_string(line_no) + ": " + e);
    }
    if (!builder->AddRecord(rec, err)) return false;
  }
  return true;
}

void SplitCSV(const std::string& line, char delimiter, std::vector<std::string>* out) {
  out->clear();
  std::string field;
  field.reserve(16);
  bool in_quotes = false;
  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (c == '"') {
      if (in_quotes && i + 1 < line.size() && line[i + 1] == '"') {
        field.push_back('"');
        ++i;
      } else {
        in_quotes = !in_quotes;
      }
    } else if (c == delimiter && !in_quotes) {
      out->push_back(field);
      field.clear();
    } else {
      field.push_back(c);
    }
  }
  out->push_back(field);
}

bool ResolveHeaderIndex(const std::vector<std::string>& header,
                        const std::string& column,
                        const std::string& name,
                        int* out,
                        std::string* err) {
  const std::string wanted = ToLower(column);
  auto it = std::find_if(header.begin(), header.end(), [&](const std::string& col) {
    return ToLower(Trim(col)) == wanted;
  });
  if (it == header.end()) {
    return set_error(err, name + ": column '" + column + "' not found in header");
  }
  *out = static_cast<int>(std::distance(header.begin(), it));
  return true;
}

bool LoadCSVFromStream(const bouquet::StockSourceSpec& spec,
                       std::istream& in,
                       const std::string& name,
                       bouquet::InventoryBuilder* builder,
                       std::string* err) {
  std::vector<std::string> fields;
  fields.reserve(4);
  int species_idx = spec.species_index;
  int size_idx = spec.size_index;
  int count_idx = spec.count_index;
  bool header_processed = !spec.csv_has_header;
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    // Ignore empty lines
    bool only_ws = std::all_of(line.begin(), line.end(), [](char c) { return std::isspace(static_cast<unsigned char>(c)); });
    if (only_ws) continue;
    SplitCSV(line, spec.csv_delimiter, &fields);
    if (!header_processed) {
      if (!ResolveHeaderIndex(fields, spec.species_column, name, &species_idx, err)) return false;
      if (!ResolveHeaderIndex(fields, spec.size_column, name, &size_idx, err)) return false;
      if (!ResolveHeaderIndex(fields, spec.count_column, name, &count_idx, err)) return false;
      header_processed = true;
      continue;
    }
    const std::string where = name + ":" + std::to_string(line_no);
    const int needed = std::max(species_idx, std::max(size_idx, count_idx));
    if (needed >= static_cast<int>(fields.size())) {
      return set_error(err, where + ": column index out of range in CSV row");
    }
    int count = 0;
    if (!ParseCount(fields[count_idx], &count)) {
      return set_error(err, where + ": count '" + fields[count_idx] + "' is not a non-negative integer");
    }
    if (!AddCell(fields[species_idx], fields[size_idx], count, where, builder, err)) return false;
  }
  if (!header_processed) {
    return set_error(err, name + ": CSV header missing");
  }
  return true;
}

bool LoadTextFromFiles(const bouquet::StockSourceSpec& spec,
                       bouquet::InventoryBuilder* builder,
                       std::string* err) {
  auto files = BuildFileList(spec);
  if (files.empty()) return set_error(err, "stock source missing file paths");
  for (const auto& path : files) {
    std::ifstream in(path);
    if (!in) {
      if (spec.optional) continue;
      return set_error(err, "failed to open stock file '" + path + "'");
    }
    bool ok = spec.format_kind == bouquet::StockFormatKind::kCSV
                  ? LoadCSVFromStream(spec, in, path, builder, err)
                  : LoadRecordsFromStream(in, path, builder, err);
    if (!ok) return false;
  }
  return true;
}

bool LoadTextFromChannel(const bouquet::StockSourceSpec& spec,
                         bouquet::InventoryBuilder* builder,
                         std::string* err) {
  const bool csv = spec.format_kind == bouquet::StockFormatKind::kCSV;
  if (IsStdin(spec.channel)) {
    return csv ? LoadCSVFromStream(spec, std::cin, "stdin", builder, err)
               : LoadRecordsFromStream(std::cin, "stdin", builder, err);
  }
  if (spec.channel.empty()) {
    // Chunk lists behave like a sequence of files.
    return LoadTextFromFiles(spec, builder, err);
  }
  const std::string path = ChannelPath(spec.channel);
  std::ifstream in(path);
  if (!in) {
    if (spec.optional) return true;
    return set_error(err, "failed to open stock stream '" + spec.channel + "'");
  }
  return csv ? LoadCSVFromStream(spec, in, path, builder, err)
             : LoadRecordsFromStream(in, path, builder, err);
}

#ifdef BOUQUET_ARROW_ENABLED

bool ArrowStatusOk(const arrow::Status& status,
                   const std::string& context,
                   std::string* err) {
  if (status.ok()) return true;
  return set_error(err, context + ": " + status.ToString());
}

template <typename T>
bool AssignArrowResult(arrow::Result<T>&& result,
                       T* out,
                       const std::string& context,
                       std::string* err) {
  if (!result.ok()) {
    return set_error(err, context + ": " + result.status().ToString());
  }
  *out = std::move(result).ValueOrDie();
  return true;
}

bool ResolveArrowColumn(const std::shared_ptr<arrow::Table>& table,
                        const std::string& column,
                        int fallback_index,
                        const std::string& name,
                        std::shared_ptr<arrow::ChunkedArray>* out,
                        std::string* err) {
  auto schema = table->schema();
  int idx = schema->GetFieldIndex(column);
  if (idx < 0) idx = fallback_index;
  if (idx < 0 || idx >= schema->num_fields()) {
    return set_error(err, name + ": column '" + column + "' not found in Arrow schema");
  }
  *out = table->column(idx);
  if (!*out) return set_error(err, name + ": Arrow column '" + column + "' missing in table");
  return true;
}

// Reads a string cell; accepts utf8 and large_utf8 columns.
bool ArrowStringAt(const std::shared_ptr<arrow::Array>& array, int64_t i,
                   const std::string& name, std::string* out, std::string* err) {
  if (array->IsNull(i)) return set_error(err, name + ": Arrow string column contains null values");
  switch (array->type_id()) {
    case arrow::Type::STRING:
      *out = std::static_pointer_cast<arrow::StringArray>(array)->GetString(i);
      return true;
    case arrow::Type::LARGE_STRING:
      *out = std::static_pointer_cast<arrow::LargeStringArray>(array)->GetString(i);
      return true;
    default:
      return set_error(err, name + ": Arrow column type '" + array->type()->ToString() + "' is not a string type");
  }
}

bool ArrowCountAt(const std::shared_ptr<arrow::Array>& array, int64_t i,
                  const std::string& name, int* out, std::string* err) {
  if (array->IsNull(i)) return set_error(err, name + ": Arrow count column contains null values");
  long long v = 0;
  switch (array->type_id()) {
    case arrow::Type::INT64: v = std::static_pointer_cast<arrow::Int64Array>(array)->Value(i); break;
    case arrow::Type::INT32: v = std::static_pointer_cast<arrow::Int32Array>(array)->Value(i); break;
    case arrow::Type::UINT32: v = std::static_pointer_cast<arrow::UInt32Array>(array)->Value(i); break;
    case arrow::Type::UINT64: {
      auto u = std::static_pointer_cast<arrow::UInt64Array>(array)->Value(i);
      if (u > static_cast<uint64_t>(INT_MAX)) return set_error(err, name + ": Arrow count out of range");
      v = static_cast<long long>(u);
      break;
    }
    default:
      return set_error(err, name + ": Arrow count column type '" + array->type()->ToString() + "' not supported");
  }
  if (v < 0 || v > INT_MAX) return set_error(err, name + ": Arrow count out of range");
  *out = static_cast<int>(v);
  return true;
}

bool LoadArrowTableIntoBuilder(const bouquet::StockSourceSpec& spec,
                               const std::shared_ptr<arrow::Table>& table,
                               const std::string& name,
                               bouquet::InventoryBuilder* builder,
                               std::string* err) {
  if (!table) return true;
  // Chunk boundaries may differ between columns, so flatten each to one array.
  std::shared_ptr<arrow::Table> combined;
  if (!AssignArrowResult(table->CombineChunks(arrow::default_memory_pool()), &combined, name + ": combine chunks", err)) {
    return false;
  }
  std::shared_ptr<arrow::ChunkedArray> species_col, size_col, count_col;
  if (!ResolveArrowColumn(combined, spec.species_column, spec.species_index, name, &species_col, err)) return false;
  if (!ResolveArrowColumn(combined, spec.size_column, spec.size_index, name, &size_col, err)) return false;
  if (!ResolveArrowColumn(combined, spec.count_column, spec.count_index, name, &count_col, err)) return false;
  if (species_col->num_chunks() == 0) return true;
  auto species = species_col->chunk(0);
  auto sizes = size_col->chunk(0);
  auto counts = count_col->chunk(0);
  for (int64_t i = 0; i < combined->num_rows(); ++i) {
    std::string sp, sz;
    int count = 0;
    if (!ArrowStringAt(species, i, name, &sp, err)) return false;
    if (!ArrowStringAt(sizes, i, name, &sz, err)) return false;
    if (!ArrowCountAt(counts, i, name, &count, err)) return false;
    if (!AddCell(sp, sz, count, name + " row " + std::to_string(i), builder, err)) return false;
  }
  return true;
}

bool ReadArrowTableFromFile(const std::string& path,
                            std::shared_ptr<arrow::Table>* table,
                            std::string* err) {
  std::shared_ptr<arrow::io::ReadableFile> input;
  if (!AssignArrowResult(arrow::io::ReadableFile::Open(path), &input, "open Arrow file '" + path + "'", err)) {
    return false;
  }
  auto file_reader_result = arrow::ipc::RecordBatchFileReader::Open(input);
  std::vector<std::shared_ptr<arrow::RecordBatch>> batches;
  if (file_reader_result.ok()) {
    auto reader = std::move(file_reader_result).ValueOrDie();
    for (int i = 0; i < reader->num_record_batches(); ++i) {
      std::shared_ptr<arrow::RecordBatch> batch;
      if (!AssignArrowResult(reader->ReadRecordBatch(i), &batch, "Arrow file read", err)) return false;
      batches.push_back(batch);
    }
    return AssignArrowResult(arrow::Table::FromRecordBatches(reader->schema(), batches), table, "Arrow file to table", err);
  }
  if (!ArrowStatusOk(input->Seek(0), "rewind Arrow file '" + path + "'", err)) {
    return false;
  }
  auto stream_reader_result = arrow::ipc::RecordBatchStreamReader::Open(input);
  if (!stream_reader_result.ok()) {
    return set_error(err, "failed to interpret Arrow file '" + path + "': file reader error = " + file_reader_result.status().ToString() + ", stream reader error = " + stream_reader_result.status().ToString());
  }
  auto reader = std::move(stream_reader_result).ValueOrDie();
  while (true) {
    std::shared_ptr<arrow::RecordBatch> batch;
    if (!AssignArrowResult(reader->Next(), &batch, "Arrow stream read", err)) return false;
    if (!batch) break;
    batches.push_back(batch);
  }
  return AssignArrowResult(arrow::Table::FromRecordBatches(reader->schema(), batches), table, "Arrow stream to table", err);
}

bool LoadArrowFromFiles(const bouquet::StockSourceSpec& spec,
                        bouquet::InventoryBuilder* builder,
                        std::string* err) {
  auto files = BuildFileList(spec);
  if (files.empty()) return set_error(err, "Arrow stock source requires path or chunks");
  for (const auto& path : files) {
    std::shared_ptr<arrow::Table> table;
    if (!ReadArrowTableFromFile(path, &table, err)) return false;
    if (!LoadArrowTableIntoBuilder(spec, table, path, builder, err)) return false;
  }
  return true;
}

bool LoadParquetFromFiles(const bouquet::StockSourceSpec& spec,
                          bouquet::InventoryBuilder* builder,
                          std::string* err) {
  auto files = BuildFileList(spec);
  if (files.empty()) return set_error(err, "Parquet stock source requires path or chunks");
  for (const auto& path : files) {
    std::shared_ptr<arrow::io::ReadableFile> input;
    if (!AssignArrowResult(arrow::io::ReadableFile::Open(path), &input, "open Parquet file '" + path + "'", err)) {
      return false;
    }
    auto reader_result = parquet::arrow::OpenFile(input, arrow::default_memory_pool());
    if (!reader_result.ok()) {
      return set_error(err, "read Parquet file '" + path + "': " + reader_result.status().ToString());
    }
    std::unique_ptr<parquet::arrow::FileReader> reader = std::move(reader_result).ValueOrDie();
    std::shared_ptr<arrow::Table> table;
    if (!ArrowStatusOk(reader->ReadTable(&table), "convert Parquet file '" + path + "'", err)) {
      return false;
    }
    if (!LoadArrowTableIntoBuilder(spec, table, path, builder, err)) return false;
  }
  return true;
}

#endif // BOUQUET_ARROW_ENABLED

} // namespace

namespace bouquet {

bool LoadStockFromSource(const StockSourceSpec& spec,
                         InventoryBuilder* builder,
                         std::string* err) {
  if (!builder) return set_error(err, "builder is null");
  switch (spec.format_kind) {
    case StockFormatKind::kRecords:
    case StockFormatKind::kCSV:
      if (spec.format_kind == StockFormatKind::kCSV && spec.csv_delimiter == '\0') {
        return set_error(err, "stock source CSV delimiter invalid");
      }
      if (spec.is_file()) return LoadTextFromFiles(spec, builder, err);
      if (spec.is_stream()) return LoadTextFromChannel(spec, builder, err);
      return set_error(err, "stock source has unsupported source kind for format '" + spec.format + "'");
    case StockFormatKind::kArrow:
    #ifdef BOUQUET_ARROW_ENABLED
      if (!spec.is_file()) return set_error(err, "Arrow stock source requires file source");
      return LoadArrowFromFiles(spec, builder, err);
    #else
      return set_error(err, "stock format '" + spec.format + "' not supported in this build");
    #endif
    case StockFormatKind::kParquet:
    #ifdef BOUQUET_ARROW_ENABLED
      if (!spec.is_file()) return set_error(err, "Parquet stock source requires file source");
      return LoadParquetFromFiles(spec, builder, err);
    #else
      return set_error(err, "stock format '" + spec.format + "' not supported in this build");
    #endif
    case StockFormatKind::kUnknown:
      return set_error(err, "stock format '" + spec.format + "' not recognized");
  }
  return set_error(err, "stock source encountered unexpected format");
}

} // namespace bouquet
