#ifndef __DFRANK_GRAPH_IO_HH__
#define __DFRANK_GRAPH_IO_HH__

#include "graph.hh"
#include "result_projector.hh"
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace dfrank {

// Delimited vertex and edge tables.
//
// Vertex rows are `id[,attr...]` and edge rows `src,dst[,attr...]`. Attribute
// columns are accepted and dropped. Blank lines and lines starting with '#'
// are skipped; a first row in which no field is an integer is taken as the
// header. Any other malformed row raises InvalidGraphError naming the
// source and line.

std::vector<VertexId> ParseVertexTable(std::istream &in,
                                       const std::string &source_name,
                                       char delimiter = ',');
std::vector<Edge> ParseEdgeTable(std::istream &in,
                                 const std::string &source_name,
                                 char delimiter = ',');

// Throws TableIoError if a file cannot be opened. Without a vertex table the
// vertex set is derived from the edge endpoints.
Graph LoadGraph(const std::optional<std::string> &vertex_path,
                const std::string &edge_path, char delimiter = ',');

// Writes `id,weight` and `src,dst,weight` tables with a header row.
void WriteVertexTable(std::ostream &out, const ResultGraph &result,
                      char delimiter = ',');
void WriteEdgeTable(std::ostream &out, const ResultGraph &result,
                    char delimiter = ',');
void WriteVertexTable(const std::string &path, const ResultGraph &result,
                      char delimiter = ',');
void WriteEdgeTable(const std::string &path, const ResultGraph &result,
                    char delimiter = ',');

} // namespace dfrank
#endif
