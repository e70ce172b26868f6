#include "track_parser.hpp"
#include "errors.hpp"
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <cmath>
#include <memory>
#include <utility>
#include <vector>

namespace gpx_profiler
{

namespace
{

auto trim(const std::string &text) -> std::string
{
  const char *ws = " \t\r\n";
  size_t first = text.find_first_not_of(ws);
  if (first == std::string::npos)
    return {};
  size_t last = text.find_last_not_of(ws);
  return text.substr(first, last - first + 1);
}

struct xml_doc_deleter_t
{
  auto operator()(xmlDoc *doc) const -> void { xmlFreeDoc(doc); }
};

struct xml_ctxt_deleter_t
{
  auto operator()(xmlParserCtxt *ctxt) const -> void { xmlFreeParserCtxt(ctxt); }
};

using xml_doc_ptr_t = std::unique_ptr<xmlDoc, xml_doc_deleter_t>;
using xml_ctxt_ptr_t = std::unique_ptr<xmlParserCtxt, xml_ctxt_deleter_t>;

// Takes ownership of a string allocated by libxml2
auto take_xml_string(xmlChar *value) -> std::string
{
  if (value == nullptr)
    return {};
  std::string result(reinterpret_cast<const char *>(value));
  xmlFree(value);
  return result;
}

auto node_line(const xmlNode *node) -> int { return static_cast<int>(xmlGetLineNo(node)); }

auto node_name(const xmlNode *node) -> std::string { return reinterpret_cast<const char *>(node->name); }

auto namespace_of(const xmlNode *node) -> std::string
{
  if (node->ns == nullptr || node->ns->href == nullptr)
    return {};
  return reinterpret_cast<const char *>(node->ns->href);
}

// Element children in the same namespace as the <gpx> root, so extensions cannot shadow GPX names
class gpx_tree_t
{
public:
  explicit gpx_tree_t(const xmlNode *root) : m_namespace(namespace_of(root)) {}

  auto is_gpx(const xmlNode *node, const char *name) const -> bool
  {
    return node->type == XML_ELEMENT_NODE && node_name(node) == name && namespace_of(node) == m_namespace;
  }

  // Points, segments and routes outside their GPX parent are malformed
  auto check_placement(const xmlNode *node) const -> void
  {
    static const std::pair<const char *, const char *> parents[] = {
        {"trk", "gpx"}, {"rte", "gpx"}, {"trkseg", "trk"}, {"trkpt", "trkseg"}, {"rtept", "rte"}};

    for (const xmlNode *child = node->children; child != nullptr; child = child->next)
    {
      if (child->type != XML_ELEMENT_NODE)
        continue;
      if (namespace_of(child) == m_namespace)
      {
        for (const auto &[name, parent] : parents)
        {
          if (node_name(child) == name && !is_gpx(node, parent))
            throw parse_error_t("<" + node_name(child) + "> outside <" + parent + ">", node_line(child));
        }
      }
      check_placement(child);
    }
  }

  auto first_child(const xmlNode *node, const char *name) const -> const xmlNode *
  {
    for (const xmlNode *child = node->children; child != nullptr; child = child->next)
    {
      if (is_gpx(child, name))
        return child;
    }
    return nullptr;
  }

private:
  std::string m_namespace;
};

} // namespace

auto track_parser_t::parse_gpx(const std::string &content) -> track_t
{
  track_t track;
  if (trim(content).empty())
    return track;

  xml_ctxt_ptr_t ctxt(xmlNewParserCtxt());
  if (!ctxt)
    throw parse_error_t("failed to create XML parser");

  const int parse_flags = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING | XML_PARSE_NOCDATA | XML_PARSE_BIG_LINES;
  xml_doc_ptr_t doc(xmlCtxtReadMemory(ctxt.get(), content.data(), static_cast<int>(content.size()), nullptr, nullptr, parse_flags));
  if (!doc)
  {
    const xmlError *error = xmlCtxtGetLastError(ctxt.get());
    if (error == nullptr || error->message == nullptr)
      throw parse_error_t("malformed XML");
    throw parse_error_t(trim(error->message), error->line);
  }

  const xmlNode *root = xmlDocGetRootElement(doc.get());
  if (root == nullptr)
    throw parse_error_t("missing <gpx> root element");
  if (node_name(root) != "gpx")
    throw parse_error_t("root element is <" + node_name(root) + ">, expected <gpx>", node_line(root));

  gpx_tree_t tree(root);
  tree.check_placement(root);

  auto read_point = [&](const xmlNode *node) -> point_t {
    const int line = node_line(node);
    xmlChar *lat = xmlGetProp(node, reinterpret_cast<const xmlChar *>("lat"));
    xmlChar *lon = xmlGetProp(node, reinterpret_cast<const xmlChar *>("lon"));
    if (lat == nullptr || lon == nullptr)
    {
      xmlFree(lat);
      xmlFree(lon);
      throw parse_error_t("<" + node_name(node) + "> without lat/lon attributes", line);
    }

    point_t point;
    std::string lat_text = take_xml_string(lat);
    std::string lon_text = take_xml_string(lon);
    point.lat = parse_coordinate(lat_text, "latitude", 90.0, line);
    point.lon = parse_coordinate(lon_text, "longitude", 180.0, line);

    // Text content resolves character references and CDATA sections
    if (const xmlNode *ele = tree.first_child(node, "ele"))
      point.elevation = parse_elevation(trim(take_xml_string(xmlNodeGetContent(ele))), node_line(ele));
    if (const xmlNode *time = tree.first_child(node, "time"))
      point.time = parse_time(trim(take_xml_string(xmlNodeGetContent(time))), node_line(time));
    return point;
  };

  std::vector<segment_t> routes;
  bool seen_trkseg = false;

  for (const xmlNode *child = root->children; child != nullptr; child = child->next)
  {
    if (tree.is_gpx(child, "trk"))
    {
      for (const xmlNode *seg = child->children; seg != nullptr; seg = seg->next)
      {
        if (!tree.is_gpx(seg, "trkseg"))
          continue;
        seen_trkseg = true;
        segment_t &segment = track.segments.emplace_back();
        for (const xmlNode *pt = seg->children; pt != nullptr; pt = pt->next)
        {
          if (tree.is_gpx(pt, "trkpt"))
            segment.push_back(read_point(pt));
        }
      }
    }
    else if (tree.is_gpx(child, "rte"))
    {
      segment_t &route = routes.emplace_back();
      for (const xmlNode *pt = child->children; pt != nullptr; pt = pt->next)
      {
        if (tree.is_gpx(pt, "rtept"))
          route.push_back(read_point(pt));
      }
    }
  }

  // Display the route if the track is missing
  if (!seen_trkseg)
    track.segments = std::move(routes);

  return track;
}

auto track_parser_t::parse_coordinate(const std::string &text, const char *what, double limit, int line) -> double
{
  std::string value = trim(text);
  double result = 0.0;
  size_t consumed = 0;
  try
  {
    result = std::stod(value, &consumed);
  }
  catch (const std::exception &)
  {
    throw parse_error_t(std::string("invalid ") + what + " '" + text + "'", line);
  }

  if (consumed != value.size() || !std::isfinite(result))
    throw parse_error_t(std::string("invalid ") + what + " '" + text + "'", line);
  if (result < -limit || result > limit)
    throw parse_error_t(std::string(what) + " out of range: " + value, line);
  return result;
}

auto track_parser_t::parse_elevation(const std::string &text, int line) -> std::optional<double>
{
  // <ele></ele> carries no value
  if (text.empty())
    return std::nullopt;

  double result = 0.0;
  size_t consumed = 0;
  try
  {
    result = std::stod(text, &consumed);
  }
  catch (const std::exception &)
  {
    throw parse_error_t("invalid elevation '" + text + "'", line);
  }
  if (consumed != text.size() || !std::isfinite(result))
    throw parse_error_t("invalid elevation '" + text + "'", line);
  return result;
}

auto track_parser_t::parse_time(const std::string &text, int line) -> std::optional<time_point_t>
{
  if (text.empty())
    return std::nullopt;

  auto time = time_util::parse_iso8601(text);
  if (!time)
    throw parse_error_t("invalid timestamp '" + text + "'", line);
  return time;
}

} // namespace gpx_profiler
