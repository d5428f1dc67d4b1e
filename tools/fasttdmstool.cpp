// Copyright 2025 Jonas Teuwen. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <ostream>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/log/initialize.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_split.h"
#include "fasttdms/fasttdms.h"

// Common flags
ABSL_FLAG(std::string, input, "", "Path to the TDMS file");
ABSL_FLAG(bool, lenient_version, false,
          "Accept segment versions other than 4712 and 4713");

// Info command flags
ABSL_FLAG(bool, verbose, false, "Show properties of every object");

// Read command flags
ABSL_FLAG(std::vector<std::string>, channels, {},
          "Comma separated channels as group/channel");
ABSL_FLAG(uint64_t, start, 0, "Index of the first value");
ABSL_FLAG(int64_t, count, -1, "Number of values (-1 reads to the end)");
ABSL_FLAG(uint32_t, threads, 0, "Worker limit (0 = pool size, 1 = serial)");
ABSL_FLAG(std::string, output, "", "CSV output path (default: stdout)");
ABSL_FLAG(bool, plan_only, false, "Print the read plan without reading");

namespace {

void PrintSeparator(char c = '=') {
  std::cout << std::string(80, c) << '\n';
}

void PrintHeader(const std::string& title) {
  std::cout << '\n';
  PrintSeparator('=');
  std::cout << " " << title << '\n';
  PrintSeparator('=');
}

void PrintSubHeader(const std::string& title) {
  std::cout << '\n';
  std::cout << "--- " << title << " ---\n";
}

template <typename T>
void PrintKeyValue(const std::string& key, const T& value, int width = 30) {
  std::cout << std::left << std::setw(width) << (key + ":") << value << '\n';
}

void PrintProperties(const fasttdms::PropertyMap& properties, int width) {
  for (const auto& [name, value] : properties) {
    PrintKeyValue("    " + name, fasttdms::PropertyValueToString(value), width);
  }
}

void PrintFileInfo(const fasttdms::TdmsFile& file, bool verbose) {
  const auto& index = file.GetIndex();

  PrintHeader("File Information");
  PrintKeyValue("File Size (bytes)", index.GetFileLength());
  PrintKeyValue("Segments", index.GetSegments().size());
  PrintKeyValue("Groups", file.GroupNames().size());
  PrintKeyValue("Channels", index.GetChannelCount());

  if (verbose) {
    auto root = file.Properties("/");
    if (root.ok() && !root->empty()) {
      PrintSubHeader("Root Properties");
      PrintProperties(*root, 35);
    }
  }

  for (const auto& group : file.GroupNames()) {
    PrintHeader("Group '" + group + "'");

    if (verbose) {
      auto properties = file.Properties(fasttdms::GroupPathString(group));
      if (properties.ok()) {
        PrintProperties(*properties, 35);
      }
    }

    auto paths = file.ChannelPaths(group);
    if (!paths.ok()) {
      std::cerr << "Error listing group " << group << ": " << paths.status()
                << '\n';
      continue;
    }

    for (const auto& path : *paths) {
      auto info = index.GetChannelInfo(path);
      if (!info.ok()) {
        std::cerr << "Error reading channel " << path << ": "
                  << info.status() << '\n';
        continue;
      }

      PrintSubHeader("Channel '" + info->name + "'");
      PrintKeyValue("  Data Type",
                    std::string(fasttdms::DataTypeName(info->data_type)), 25);
      PrintKeyValue("  Values", info->total_values, 25);
      PrintKeyValue("  Data Locations", info->location_count, 25);

      if (verbose) {
        auto properties = file.Properties(path);
        if (properties.ok()) {
          PrintProperties(*properties, 35);
        }
      }
    }
  }
}

void PrintPlan(const fasttdms::ReadPlan& plan) {
  PrintHeader("Read Plan");
  PrintKeyValue("Operations", plan.cost.total_operations);
  PrintKeyValue("Claims", plan.cost.total_claims);
  PrintKeyValue("Bytes To Read", plan.cost.total_bytes_to_read);

  for (size_t i = 0; i < plan.operations.size(); ++i) {
    const auto& op = plan.operations[i];
    PrintSubHeader("Operation " + std::to_string(i));
    PrintKeyValue("  Segment", op.segment, 25);
    PrintKeyValue("  Byte Range",
                  "[" + std::to_string(op.file_offset) + ", " +
                      std::to_string(op.end()) + ")",
                  25);
    for (const auto& claim : op.claims) {
      PrintKeyValue("  " + claim.channel,
                    std::to_string(claim.count) + " value(s) at output " +
                        std::to_string(claim.output_offset),
                    25);
    }
  }
}

absl::StatusOr<fasttdms::ReadQuery> BuildQuery(
    const std::vector<std::string>& channels, uint64_t start, int64_t count) {
  fasttdms::ValueRange range{.start = start};
  if (count >= 0) {
    range.count = static_cast<uint64_t>(count);
  }

  fasttdms::ReadQuery query;
  for (const auto& channel : channels) {
    std::vector<std::string> parts = absl::StrSplit(channel, '/');
    if (parts.size() != 2 || parts[0].empty() || parts[1].empty()) {
      return absl::InvalidArgumentError("Expected group/channel, got '" +
                                        channel + "'");
    }
    query[fasttdms::ChannelPathString(parts[0], parts[1])] = range;
  }
  return query;
}

int InfoCommand(const std::string& input_file, bool verbose,
                const fasttdms::OpenOptions& options) {
  std::cout << "Opening file: " << input_file << '\n';
  auto file_or = fasttdms::TdmsFile::Open(input_file, options);

  if (!file_or.ok()) {
    std::cerr << "\nError: Failed to open file\n";
    std::cerr << "Status: " << file_or.status() << '\n';
    return 1;
  }

  PrintFileInfo(**file_or, verbose);

  std::cout << '\n';
  PrintSeparator('=');
  std::cout << "Successfully read file information!\n";
  PrintSeparator('=');
  std::cout << '\n';
  return 0;
}

int ReadCommand(const std::string& input_file,
                const fasttdms::OpenOptions& options) {
  auto query_or = BuildQuery(absl::GetFlag(FLAGS_channels),
                             absl::GetFlag(FLAGS_start),
                             absl::GetFlag(FLAGS_count));
  if (!query_or.ok()) {
    std::cerr << "Error: " << query_or.status() << '\n';
    return 1;
  }

  auto file_or = fasttdms::TdmsFile::Open(input_file, options);
  if (!file_or.ok()) {
    std::cerr << "Error: Failed to open file\n";
    std::cerr << "Status: " << file_or.status() << '\n';
    return 1;
  }
  const auto& file = **file_or;

  auto plan_or = file.Plan(*query_or);
  if (!plan_or.ok()) {
    std::cerr << "Error: Failed to plan read\n";
    std::cerr << "Status: " << plan_or.status() << '\n';
    return 1;
  }

  if (absl::GetFlag(FLAGS_plan_only)) {
    PrintPlan(*plan_or);
    return 0;
  }

  fasttdms::ExecuteOptions execute_options;
  execute_options.max_threads = absl::GetFlag(FLAGS_threads);
  auto result_or = file.Execute(*plan_or, execute_options);
  if (!result_or.ok()) {
    std::cerr << "Error: Failed to read values\n";
    std::cerr << "Status: " << result_or.status() << '\n';
    return 1;
  }

  // Failed channels are reported and skipped
  std::vector<std::string> names;
  std::vector<const fasttdms::ChannelData*> columns;
  size_t rows = 0;
  for (const auto& [path, range] : *query_or) {
    const auto& entry = result_or->at(path);
    if (!entry.ok()) {
      std::cerr << "Skipping " << path << ": " << entry.status() << '\n';
      continue;
    }
    names.push_back(path);
    columns.push_back(&*entry);
    rows = std::max(rows, fasttdms::core::ChannelDataSize(*entry));
  }

  std::ofstream file_out;
  const std::string output = absl::GetFlag(FLAGS_output);
  if (!output.empty()) {
    file_out.open(output);
    if (!file_out) {
      std::cerr << "Error: Cannot write " << output << '\n';
      return 1;
    }
  }
  std::ostream& out = output.empty() ? std::cout : file_out;

  for (size_t c = 0; c < names.size(); ++c) {
    out << (c > 0 ? "," : "") << '"' << names[c] << '"';
  }
  out << '\n';
  for (size_t row = 0; row < rows; ++row) {
    for (size_t c = 0; c < columns.size(); ++c) {
      if (c > 0) {
        out << ',';
      }
      out << fasttdms::ChannelValueToString(*columns[c], row);
    }
    out << '\n';
  }

  return names.size() == query_or->size() ? 0 : 2;
}

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " <command> [options]\n\n";
  std::cerr << "Commands:\n";
  std::cerr << "  info     Show groups, channels and properties\n";
  std::cerr << "  read     Read channel values as CSV\n";
  std::cerr << "\n";
  std::cerr << "Common options:\n";
  std::cerr << "  --input=<path>         Path to TDMS file (required)\n";
  std::cerr << "  --lenient_version      Accept unknown segment versions\n";
  std::cerr << "\n";
  std::cerr << "Info command options:\n";
  std::cerr << "  --verbose              Show properties\n";
  std::cerr << "\n";
  std::cerr << "Read command options:\n";
  std::cerr << "  --channels=<g/c,...>   Channels to read (required)\n";
  std::cerr << "  --start=<n>            First value (default: 0)\n";
  std::cerr << "  --count=<n>            Number of values (default: all)\n";
  std::cerr << "  --threads=<n>          Worker limit (default: 0)\n";
  std::cerr << "  --output=<path>        CSV output (default: stdout)\n";
  std::cerr << "  --plan_only            Print the read plan only\n";
  std::cerr << "\n";
  std::cerr << "Examples:\n";
  std::cerr << "  " << program_name << " info --input=run.tdms --verbose\n";
  std::cerr << "  " << program_name
            << " read --input=run.tdms --channels=Measured/Voltage "
               "--start=1000 --count=500\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    PrintUsage(argv[0]);
    return 1;
  }

  // Get command
  std::string command = argv[1];

  // Parse remaining flags
  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();

  std::string input_file = absl::GetFlag(FLAGS_input);

  if (input_file.empty()) {
    std::cerr << "Error: --input flag is required\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  fasttdms::OpenOptions options;
  options.strict_version = !absl::GetFlag(FLAGS_lenient_version);

  if (command == "info") {
    return InfoCommand(input_file, absl::GetFlag(FLAGS_verbose), options);
  } else if (command == "read") {
    if (absl::GetFlag(FLAGS_channels).empty()) {
      std::cerr << "Error: --channels flag is required\n\n";
      PrintUsage(argv[0]);
      return 1;
    }
    return ReadCommand(input_file, options);
  } else {
    std::cerr << "Error: Unknown command '" << command << "'\n\n";
    PrintUsage(argv[0]);
    return 1;
  }
}
