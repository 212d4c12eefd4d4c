#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "label_record.hpp"

namespace labelsheet {

/* barcodes read from one CSV file */
struct CsvBatch {
  std::string path, source;
  std::vector<std::string> barcodes;
  size_t skipped=0;   // rows with a missing or blank barcode field
};

struct InputSpec {
  std::vector<std::string> paths;
  std::string directory;
  std::string pattern="*.csv";
  std::string default_directory="input";
};

struct LoadedInput {
  std::vector<LabelRecord> records;
  std::vector<CsvBatch> batches;
  size_t skipped() const;
};

std::vector<std::vector<std::string>> parse_csv(const std::string& text);
CsvBatch read_barcodes(const std::string& path);
std::vector<std::string> resolve_inputs(const InputSpec& spec);
LoadedInput load_records(const std::vector<std::string>& paths);

}
