#include "rcx_json.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <sstream>

using rcx::extract::rcx_field_resolution;
using rcx::extract::rcx_receipt_result;

namespace {

  // Reads a number member; absent or null members keep def.
  bool read_number(const nlohmann::json& obj, const char* key, double def, double& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
      out = def;
      return true;
    }
    if (!it->is_number()) {
      std::cerr << "Error: fragment member '" << key << "' is not a number." << std::endl;
      return false;
    }
    out = it->get<double>();
    return true;
  }

  bool fragment_from_json(const nlohmann::json& j_val, size_t position, rcx_fragment& out) {
    if (!j_val.is_object()) {
      std::cerr << "Error: fragment " << position << " is not an object." << std::endl;
      return false;
    }

    auto text_it = j_val.find("text");
    if (text_it == j_val.end() || !text_it->is_string()) {
      std::cerr << "Error: fragment " << position << " has no string 'text'." << std::endl;
      return false;
    }

    double confidence = 1.0;
    if (!read_number(j_val, "confidence", 1.0, confidence)) {
      return false;
    }

    double x = 0, y = 0, width = 0, height = 0;
    auto box_it = j_val.find("box");
    if (box_it != j_val.end() && box_it->is_object()) {
      if (!read_number(*box_it, "x", 0.0, x) || !read_number(*box_it, "y", 0.0, y) ||
          !read_number(*box_it, "width", 0.0, width) || !read_number(*box_it, "height", 0.0, height)) {
        return false;
      }
    } else {
      box_it = j_val.find("boundingBox");
      if (box_it == j_val.end() || !box_it->is_object()) {
        std::cerr << "Error: fragment " << position << " has neither 'box' nor 'boundingBox'." << std::endl;
        return false;
      }
      if (!read_number(*box_it, "minX", 0.0, x) || !read_number(*box_it, "minY", 0.0, y) ||
          !read_number(*box_it, "width", 0.0, width) || !read_number(*box_it, "height", 0.0, height)) {
        return false;
      }
    }

    out = rcx_fragment(rcx_string(text_it->get<std::string>()), x, y, width, height, confidence);
    return true;
  }

  nlohmann::json index_to_json(size_t index) {
    if (index == rcx_field_resolution::npos) {
      return nullptr;
    }
    return index;
  }

  nlohmann::json resolution_to_json(const rcx_field_resolution& r) {
    nlohmann::json obj = nlohmann::json::object();
    obj["key"] = r.key.to_std_const();
    obj["value"] = r.raw_value.to_std_const();
    obj["method"] = rcx::extract::resolution_method_name(r.method).to_std_const();
    obj["labelIndex"] = index_to_json(r.label_index);
    obj["valueIndex"] = index_to_json(r.value_index);
    return obj;
  }

  rcx_string dump(const nlohmann::json& j_obj, bool pretty) {
    try {
      return rcx_string(pretty ? j_obj.dump(2) : j_obj.dump());
    } catch (const nlohmann::json::type_error& e) {
      std::cerr << "JSON dump type error: " << e.what() << std::endl;
      return rcx_string("");
    }
  }

} // namespace

bool rcx_json::parse_fragments(const rcx_string& json_string, std::vector<rcx_fragment>& out) {
  out.clear();

  try {
    nlohmann::json parsed_json = nlohmann::json::parse(json_string.to_std_const());

    const nlohmann::json* list = &parsed_json;
    if (parsed_json.is_object()) {
      auto it = parsed_json.find("fragments");
      if (it == parsed_json.end()) {
        std::cerr << "Error: JSON object has no 'fragments' member." << std::endl;
        return false;
      }
      list = &(*it);
    }

    if (!list->is_array()) {
      std::cerr << "Error: fragments must be a JSON array." << std::endl;
      return false;
    }

    std::vector<rcx_fragment> fragments;
    fragments.reserve(list->size());
    for (size_t i = 0; i < list->size(); ++i) {
      rcx_fragment fragment;
      if (!fragment_from_json((*list)[i], i, fragment)) {
        return false;
      }
      fragments.push_back(fragment);
    }

    out.swap(fragments);
    return true;

  } catch (const nlohmann::json::parse_error& e) {
    std::cerr << "JSON parse error: " << e.what()
              << " at byte " << e.byte << std::endl;
    return false;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "An unexpected error occurred during JSON parsing: " << e.what() << std::endl;
    return false;
  }
}

bool rcx_json::read_fragments_file(const rcx_string& path, std::vector<rcx_fragment>& out) {
  std::ifstream file(path.c_str());
  if (!file.is_open()) {
    std::cerr << "Error: cannot open fragments file " << path.c_str() << std::endl;
    out.clear();
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse_fragments(rcx_string(buffer.str()), out);
}

rcx_string rcx_json::create(const rcx_receipt_result& result, bool pretty) {
  nlohmann::json j_obj = nlohmann::json::object();

  if (result.date) {
    j_obj["date"] = result.date->to_iso_date().to_std_const();
  } else {
    j_obj["date"] = nullptr;
  }
  if (result.amount) {
    j_obj["amount"] = *result.amount;
  } else {
    j_obj["amount"] = nullptr;
  }

  j_obj["description"] = result.description.to_std_const();

  nlohmann::json categories = nlohmann::json::array();
  for (const auto& category : result.categories) {
    categories.push_back(category.to_std_const());
  }
  j_obj["categories"] = categories;

  j_obj["paymentMode"] = rcx::extract::payment_mode_name(result.payment_mode).to_std_const();
  j_obj["paymentModeLabel"] = rcx::extract::payment_mode_label(result.payment_mode).to_std_const();
  j_obj["itemType"] = result.item_type.to_std_const();
  j_obj["item"] = result.item.to_std_const();
  j_obj["brand"] = result.brand.to_std_const();
  j_obj["spec"] = result.spec.to_std_const();
  j_obj["quantity"] = result.quantity.to_std_const();
  j_obj["uom"] = result.unit_of_measure.to_std_const();
  j_obj["unitPrice"] = result.unit_price.to_std_const();

  nlohmann::json fields = nlohmann::json::object();
  for (const auto& pair : result.fields) {
    fields[pair.first.to_std_const()] = pair.second.to_std_const();
  }
  j_obj["fields"] = fields;

  nlohmann::json resolutions = nlohmann::json::array();
  for (const auto& r : result.resolutions) {
    resolutions.push_back(resolution_to_json(r));
  }
  j_obj["resolutions"] = resolutions;

  return dump(j_obj, pretty);
}

rcx_string rcx_json::create(const std::vector<rcx_fragment>& fragments, bool pretty) {
  nlohmann::json list = nlohmann::json::array();
  for (const auto& f : fragments) {
    nlohmann::json box = nlohmann::json::object();
    box["x"] = f.x;
    box["y"] = f.y;
    box["width"] = f.width;
    box["height"] = f.height;

    nlohmann::json obj = nlohmann::json::object();
    obj["text"] = f.text.to_std_const();
    obj["confidence"] = f.confidence;
    obj["box"] = box;
    list.push_back(obj);
  }
  nlohmann::json j_obj = nlohmann::json::object();
  j_obj["fragments"] = list;
  return dump(j_obj, pretty);
}
