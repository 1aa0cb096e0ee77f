#include "graph_io.hh"
#include "errors.hh"
#include "spdlog/fmt/fmt.h"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace dfrank {

namespace {

std::vector<std::string> SplitRow(const std::string &line, char delimiter) {
  std::vector<std::string> fields;
  std::istringstream iss(line);
  std::string field;
  while (std::getline(iss, field, delimiter)) {
    // Trim surrounding whitespace
    const auto first = field.find_first_not_of(" \t\r");
    const auto last = field.find_last_not_of(" \t\r");
    fields.push_back(first == std::string::npos
                         ? std::string()
                         : field.substr(first, last - first + 1));
  }
  return fields;
}

std::optional<VertexId> ParseId(const std::string &field) {
  if (field.empty()) {
    return std::nullopt;
  }
  size_t consumed = 0;
  try {
    VertexId id = std::stoll(field, &consumed);
    if (consumed != field.size()) {
      return std::nullopt;
    }
    return id;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

bool IsSkippable(const std::string &line) {
  const auto first = line.find_first_not_of(" \t\r");
  return first == std::string::npos || line[first] == '#';
}

// A header names its columns; a row with any id in it is data, even if
// malformed.
bool IsHeader(const std::vector<std::string> &fields) {
  return std::none_of(fields.begin(), fields.end(),
                      [](const std::string &field) {
                        return ParseId(field).has_value();
                      });
}

// Calls `row` with the fields of every data row. The first data row may be a
// header; it is skipped when none of its fields is an id.
template <typename RowFn>
void ForEachRow(std::istream &in, char delimiter, RowFn row) {
  std::string line;
  size_t line_no = 0;
  bool first_row = true;
  while (std::getline(in, line)) {
    ++line_no;
    if (IsSkippable(line)) {
      continue;
    }
    auto fields = SplitRow(line, delimiter);
    if (first_row) {
      first_row = false;
      if (IsHeader(fields)) {
        continue;
      }
    }
    row(fields, line_no);
  }
}

[[noreturn]] void MalformedRow(const std::string &source_name, size_t line_no,
                               const std::string &reason) {
  throw InvalidGraphError(
      fmt::format("{}:{}: {}", source_name, line_no, reason));
}

std::ifstream OpenInput(const std::string &path) {
  std::ifstream in(path);
  if (!in) {
    throw TableIoError("Unable to open " + path);
  }
  return in;
}

std::ofstream OpenOutput(const std::string &path) {
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    throw TableIoError("Unable to open " + path + " for writing");
  }
  return out;
}

} // namespace

std::vector<VertexId> ParseVertexTable(std::istream &in,
                                       const std::string &source_name,
                                       char delimiter) {
  std::vector<VertexId> vertices;
  ForEachRow(in, delimiter,
             [&](const std::vector<std::string> &fields, size_t line_no) {
               auto id = ParseId(fields[0]);
               if (!id) {
                 MalformedRow(source_name, line_no,
                              "expected an integer vertex id");
               }
               vertices.push_back(*id);
             });
  return vertices;
}

std::vector<Edge> ParseEdgeTable(std::istream &in,
                                 const std::string &source_name,
                                 char delimiter) {
  std::vector<Edge> edges;
  ForEachRow(in, delimiter,
             [&](const std::vector<std::string> &fields, size_t line_no) {
               if (fields.size() < 2) {
                 MalformedRow(source_name, line_no,
                              "expected src and dst columns");
               }
               auto src = ParseId(fields[0]);
               auto dst = ParseId(fields[1]);
               if (!src || !dst) {
                 MalformedRow(source_name, line_no,
                              "expected integer src and dst ids");
               }
               edges.push_back({*src, *dst});
             });
  return edges;
}

Graph LoadGraph(const std::optional<std::string> &vertex_path,
                const std::string &edge_path, char delimiter) {
  auto edge_in = OpenInput(edge_path);
  auto edges = ParseEdgeTable(edge_in, edge_path, delimiter);
  spdlog::info("Read {} edges from {}", edges.size(), edge_path);

  if (!vertex_path) {
    return Graph::FromEdges(std::move(edges));
  }

  auto vertex_in = OpenInput(*vertex_path);
  auto vertices = ParseVertexTable(vertex_in, *vertex_path, delimiter);
  spdlog::info("Read {} vertices from {}", vertices.size(), *vertex_path);
  return Graph(std::move(vertices), std::move(edges));
}

void WriteVertexTable(std::ostream &out, const ResultGraph &result,
                      char delimiter) {
  out << "id" << delimiter << kWeightColumn << "\n";
  for (const auto &vertex : result.vertices) {
    out << fmt::format("{}{}{}\n", vertex.id, delimiter, vertex.weight);
  }
}

void WriteEdgeTable(std::ostream &out, const ResultGraph &result,
                    char delimiter) {
  out << "src" << delimiter << "dst" << delimiter << kWeightColumn << "\n";
  for (const auto &edge : result.edges) {
    out << fmt::format("{}{}{}{}{}\n", edge.src, delimiter, edge.dst,
                       delimiter, edge.weight);
  }
}

void WriteVertexTable(const std::string &path, const ResultGraph &result,
                      char delimiter) {
  auto out = OpenOutput(path);
  WriteVertexTable(out, result, delimiter);
  if (!out) {
    throw TableIoError("Failed writing " + path);
  }
}

void WriteEdgeTable(const std::string &path, const ResultGraph &result,
                    char delimiter) {
  auto out = OpenOutput(path);
  WriteEdgeTable(out, result, delimiter);
  if (!out) {
    throw TableIoError("Failed writing " + path);
  }
}

} // namespace dfrank
