#include "tagging_plan.hpp"

#include <qpdf/JSON.hh>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace pdf_a11y {

namespace {

using Fields = std::map<std::string, JSON>;

Fields fields_of(JSON const& j) {
  Fields fields;
  j.forEachDictItem([&fields](std::string const& key, JSON value) { fields.emplace(key, value); });
  return fields;
}

std::string get_string(Fields const& f, std::string const& key) {
  std::string value;
  auto it = f.find(key);
  if (it != f.end() && it->second.getString(value)) return value;
  return "";
}

std::optional<double> get_number(Fields const& f, std::string const& key) {
  std::string encoded;
  auto it = f.find(key);
  if (it == f.end() || !it->second.getNumber(encoded)) return std::nullopt;
  return std::strtod(encoded.c_str(), nullptr);
}

int get_int(Fields const& f, std::string const& key, int dflt) {
  auto n = get_number(f, key);
  return n ? static_cast<int>(*n) : dflt;
}

std::optional<bool> get_bool(Fields const& f, std::string const& key) {
  bool value = false;
  auto it = f.find(key);
  if (it != f.end() && it->second.getBool(value)) return value;
  return std::nullopt;
}

// null, a missing key or anything but four numbers reads as no box
std::optional<ParserBBox> get_bbox(Fields const& f, std::string const& key) {
  auto it = f.find(key);
  if (it == f.end() || !it->second.isArray()) return std::nullopt;

  std::vector<double> values;
  bool numeric = true;
  it->second.forEachArrayItem([&](JSON item) {
    std::string encoded;
    if (item.getNumber(encoded)) {
      values.push_back(std::strtod(encoded.c_str(), nullptr));
    } else {
      numeric = false;
    }
  });
  if (!numeric || values.size() != 4) return std::nullopt;
  return ParserBBox{values[0], values[1], values[2], values[3]};
}

template <typename Fn>
void for_each_dict(Fields const& f, std::string const& key, Fn fn) {
  auto it = f.find(key);
  if (it == f.end()) return;
  it->second.forEachArrayItem([&fn](JSON item) {
    if (item.isDictionary()) fn(fields_of(item));
  });
}

std::vector<std::vector<TableCell>> read_rows(Fields const& f) {
  std::vector<std::vector<TableCell>> rows;
  for_each_dict(f, "rows", [&rows](Fields const& row) {
    std::vector<TableCell> cells;
    for_each_dict(row, "cells", [&cells](Fields const& cell) {
      TableCell c;
      c.text = get_string(cell, "text");
      c.grid_span = std::max(1, get_int(cell, "grid_span", 1));
      cells.push_back(c);
    });
    rows.push_back(cells);
  });
  return rows;
}

void read_element(Fields const& e, size_t index, FixRequest& request) {
  std::string type = get_string(e, "type");
  int page = get_int(e, "page", 0);
  auto bbox = get_bbox(e, "bbox");

  if (type == "heading") {
    HeadingAction h;
    h.element_id = get_string(e, "element_id");
    if (h.element_id.empty()) h.element_id = "heading_" + std::to_string(index);
    h.level = get_int(e, "level", 1);
    h.text = get_string(e, "text");
    h.page = page;
    h.bbox = bbox;
    request.headings.push_back(h);
  } else if (type == "image_alt") {
    std::string alt = get_string(e, "alt_text");
    int xref = get_int(e, "xref", 0);
    std::optional<int> object_id;
    if (xref > 0) object_id = xref;

    if (alt.empty()) {
      request.decorative.push_back({get_string(e, "image_id"), object_id, page});
    } else {
      request.alt_texts.push_back({get_string(e, "image_id"), alt, object_id, page, bbox});
    }
  } else if (type == "table") {
    TableAction t;
    t.table_id = get_string(e, "table_id");
    t.header_rows = get_int(e, "header_rows", 1);
    t.rows = read_rows(e);
    t.page = page;
    t.bbox = bbox;
    request.tables.push_back(t);
  } else if (type == "link") {
    LinkAction l;
    l.link_id = get_string(e, "link_id");
    l.link_text = get_string(e, "link_text");
    l.link_url = get_string(e, "link_url");
    l.page = page;
    l.bbox = bbox;
    request.links.push_back(l);
  } else {
    throw std::runtime_error("pdf_a11y: unknown element type \"" + type + "\" at elements[" + std::to_string(index) +
                             "]");
  }
}

void read_options(Fields const& o, EngineOptions& options) {
  if (auto v = get_bool(o, "verify_visually")) options.verify_visually = *v;
  if (auto v = get_bool(o, "incremental")) options.incremental = *v;
  if (auto v = get_number(o, "render_dpi")) options.render_dpi = *v;
  if (auto v = get_number(o, "heading_tolerance_percent")) options.heading_tolerance_percent = *v;
  if (auto v = get_number(o, "contrast_tolerance_percent")) options.contrast_tolerance_percent = *v;
  if (auto v = get_number(o, "color_tolerance")) options.color_tolerance = *v;
  if (auto v = get_number(o, "bbox_tolerance")) options.bbox_tolerance = *v;
  options.pixel_threshold = get_int(o, "pixel_threshold", options.pixel_threshold);
  options.max_heading_attempts = get_int(o, "max_heading_attempts", options.max_heading_attempts);

  std::string backend = get_string(o, "tier2_backend");
  if (!backend.empty()) options.tier2_backend = tier2_backend_from_string(backend);
}

JSON bbox_json(std::optional<ParserBBox> const& bbox) {
  if (!bbox) return JSON::makeNull();
  JSON arr = JSON::makeArray();
  for (double v : *bbox) arr.addArrayElement(JSON::makeReal(v));
  return arr;
}

JSON string_array(std::vector<std::string> const& items) {
  JSON arr = JSON::makeArray();
  for (auto const& s : items) arr.addArrayElement(JSON::makeString(s));
  return arr;
}

JSON element(char const* type, int page, std::optional<ParserBBox> const& bbox) {
  JSON e = JSON::makeDictionary();
  e.addDictionaryMember("type", JSON::makeString(type));
  e.addDictionaryMember("page", JSON::makeInt(page));
  e.addDictionaryMember("bbox", bbox_json(bbox));
  return e;
}

JSON image_element(std::string const& id, std::string const& alt, std::optional<int> xref, std::optional<int> page,
                   std::optional<ParserBBox> const& bbox) {
  JSON e = element("image_alt", page ? *page : 0, bbox);
  e.addDictionaryMember("image_id", JSON::makeString(id));
  e.addDictionaryMember("alt_text", JSON::makeString(alt));
  e.addDictionaryMember("xref", JSON::makeInt(xref ? *xref : 0));
  return e;
}

}  // namespace

TaggingPlan parse_tagging_plan(std::string const& json) {
  JSON root = JSON::makeNull();
  try {
    root = JSON::parse(json);
  } catch (std::exception& e) {
    throw std::runtime_error(std::string("pdf_a11y: invalid tagging plan: ") + e.what());
  }
  if (!root.isDictionary()) throw std::runtime_error("pdf_a11y: invalid tagging plan: not a JSON object");

  Fields top = fields_of(root);
  TaggingPlan plan;
  plan.input_path = get_string(top, "input_path");
  plan.output_path = get_string(top, "output_path");
  if (plan.input_path.empty() || plan.output_path.empty()) {
    throw std::runtime_error("pdf_a11y: invalid tagging plan: input_path and output_path are required");
  }

  auto metadata = top.find("metadata");
  if (metadata != top.end() && metadata->second.isDictionary()) {
    Fields m = fields_of(metadata->second);
    plan.request.metadata.title = get_string(m, "title");
    plan.request.metadata.language = get_string(m, "language");
  }

  size_t index = 0;
  for_each_dict(top, "elements", [&](Fields const& e) { read_element(e, index++, plan.request); });

  for_each_dict(top, "contrast", [&plan](Fields const& c) {
    plan.request.contrast.push_back({get_string(c, "original"), get_string(c, "fixed")});
  });

  auto options = top.find("options");
  if (options != top.end() && options->second.isDictionary()) read_options(fields_of(options->second), plan.options);

  return plan;
}

TaggingPlan read_tagging_plan(std::string const& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("pdf_a11y: cannot read tagging plan \"" + path + "\"");

  std::ostringstream buf;
  buf << in.rdbuf();
  return parse_tagging_plan(buf.str());
}

std::string tagging_plan_json(TaggingPlan const& plan) {
  FixRequest const& r = plan.request;

  JSON root = JSON::makeDictionary();
  root.addDictionaryMember("input_path", JSON::makeString(plan.input_path));
  root.addDictionaryMember("output_path", JSON::makeString(plan.output_path));

  JSON metadata = root.addDictionaryMember("metadata", JSON::makeDictionary());
  metadata.addDictionaryMember("title", JSON::makeString(r.metadata.title));
  metadata.addDictionaryMember("language", JSON::makeString(r.metadata.language));

  JSON elements = root.addDictionaryMember("elements", JSON::makeArray());
  for (auto const& h : r.headings) {
    JSON e = element("heading", h.page, h.bbox);
    e.addDictionaryMember("element_id", JSON::makeString(h.element_id));
    e.addDictionaryMember("level", JSON::makeInt(h.level));
    e.addDictionaryMember("text", JSON::makeString(h.text));
    elements.addArrayElement(e);
  }
  for (auto const& a : r.alt_texts) elements.addArrayElement(image_element(a.image_id, a.alt_text, a.xref, a.page, a.bbox));
  for (auto const& d : r.decorative) elements.addArrayElement(image_element(d.image_id, "", d.xref, d.page, std::nullopt));
  for (auto const& t : r.tables) {
    JSON e = element("table", t.page, t.bbox);
    e.addDictionaryMember("table_id", JSON::makeString(t.table_id));
    e.addDictionaryMember("header_rows", JSON::makeInt(t.header_rows));
    JSON rows = e.addDictionaryMember("rows", JSON::makeArray());
    for (auto const& row : t.rows) {
      JSON row_json = JSON::makeDictionary();
      JSON cells = row_json.addDictionaryMember("cells", JSON::makeArray());
      for (auto const& cell : row) {
        JSON c = JSON::makeDictionary();
        c.addDictionaryMember("text", JSON::makeString(cell.text));
        c.addDictionaryMember("grid_span", JSON::makeInt(cell.grid_span));
        cells.addArrayElement(c);
      }
      rows.addArrayElement(row_json);
    }
    elements.addArrayElement(e);
  }
  for (auto const& l : r.links) {
    JSON e = element("link", l.page, l.bbox);
    e.addDictionaryMember("link_id", JSON::makeString(l.link_id));
    e.addDictionaryMember("link_text", JSON::makeString(l.link_text));
    e.addDictionaryMember("link_url", JSON::makeString(l.link_url));
    elements.addArrayElement(e);
  }

  if (!r.contrast.empty()) {
    JSON contrast = root.addDictionaryMember("contrast", JSON::makeArray());
    for (auto const& c : r.contrast) {
      JSON pair = JSON::makeDictionary();
      pair.addDictionaryMember("original", JSON::makeString(c.original_hex));
      pair.addDictionaryMember("fixed", JSON::makeString(c.fixed_hex));
      contrast.addArrayElement(pair);
    }
  }

  EngineOptions const& o = plan.options;
  JSON options = root.addDictionaryMember("options", JSON::makeDictionary());
  options.addDictionaryMember("verify_visually", JSON::makeBool(o.verify_visually));
  options.addDictionaryMember("render_dpi", JSON::makeReal(o.render_dpi));
  options.addDictionaryMember("pixel_threshold", JSON::makeInt(o.pixel_threshold));
  options.addDictionaryMember("heading_tolerance_percent", JSON::makeReal(o.heading_tolerance_percent));
  options.addDictionaryMember("contrast_tolerance_percent", JSON::makeReal(o.contrast_tolerance_percent));
  options.addDictionaryMember("color_tolerance", JSON::makeReal(o.color_tolerance));
  options.addDictionaryMember("max_heading_attempts", JSON::makeInt(o.max_heading_attempts));
  options.addDictionaryMember("bbox_tolerance", JSON::makeReal(o.bbox_tolerance));
  options.addDictionaryMember("tier2_backend", JSON::makeString(tier2_backend_name(o.tier2_backend)));
  options.addDictionaryMember("incremental", JSON::makeBool(o.incremental));

  return root.unparse();
}

void write_tagging_plan(std::string const& path, TaggingPlan const& plan) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) throw std::runtime_error("pdf_a11y: cannot write tagging plan \"" + path + "\"");
  out << tagging_plan_json(plan);
  out.close();
  if (!out) throw std::runtime_error("pdf_a11y: failed writing tagging plan \"" + path + "\"");
}

std::string result_json(PdfWriteResult const& result) {
  JSON root = JSON::makeDictionary();
  root.addDictionaryMember("success", JSON::makeBool(result.success));
  root.addDictionaryMember("output_path", JSON::makeString(result.output_path));
  root.addDictionaryMember("tags_applied", JSON::makeInt(result.tags_applied));
  root.addDictionaryMember("heading_tags_applied", JSON::makeInt(result.heading_tags_applied));
  root.addDictionaryMember("contrast_fixes_applied", JSON::makeInt(result.contrast_fixes_applied));
  root.addDictionaryMember("changes", string_array(result.changes));
  root.addDictionaryMember("warnings", string_array(result.warnings));
  root.addDictionaryMember("errors", string_array(result.errors));
  return root.unparse();
}

}  // namespace pdf_a11y
