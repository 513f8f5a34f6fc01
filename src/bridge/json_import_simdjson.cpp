#include "foa_codec/json_bridge.hpp"
#include "foa_codec/encoder.hpp"
#include "foa_codec/errors.hpp"
#include "foa_codec/token_classifier.hpp"

#include <simdjson.h>
#include <string>
#include <string_view>

namespace foa {

namespace {

void write_scalar(Encoder& enc, const std::string* name, std::string_view text) {
  if (name) enc.write_data(*name, text);
  else enc.write_data(text);
}

void write_open(Encoder& enc, const std::string* name, EntityKind k) {
  if (name) enc.write_structural(*name, k);
  else enc.write_structural(k);
}

void emit_value(simdjson::ondemand::value v, const std::string* name, Encoder& enc) {
  switch (v.type()) {
    case simdjson::ondemand::json_type::object: {
      write_open(enc, name, EntityKind::StartObject);
      simdjson::ondemand::object obj = v.get_object();
      for (auto field : obj) {
        std::string_view k = field.unescaped_key();
        const std::string key(k.data(), k.size());
        emit_value(field.value(), &key, enc);
      }
      enc.write_structural(EntityKind::EndObject);
      break;
    }
    case simdjson::ondemand::json_type::array: {
      write_open(enc, name, EntityKind::StartArray);
      simdjson::ondemand::array arr = v.get_array();
      for (auto child : arr) emit_value(child.value(), nullptr, enc);
      enc.write_structural(EntityKind::EndArray);
      break;
    }
    case simdjson::ondemand::json_type::number: {
      // Keep the source spelling; FOA values are text.
      std::string_view tok = v.raw_json_token();
      write_scalar(enc, name, trim(tok));
      break;
    }
    case simdjson::ondemand::json_type::string: {
      std::string_view s = v.get_string();
      write_scalar(enc, name, s);
      break;
    }
    case simdjson::ondemand::json_type::boolean: {
      bool b = v.get_bool();
      write_scalar(enc, name, b ? "true" : "false");
      break;
    }
    case simdjson::ondemand::json_type::null: {
      write_scalar(enc, name, "null");
      break;
    }
    default:
      throw simdjson::simdjson_error(simdjson::INCORRECT_TYPE);
  }
}

}

bool json_to_foa(std::string_view json, Encoder& enc, std::string* err_out) {
  simdjson::ondemand::parser parser;
  simdjson::padded_string padded(json.data(), json.size());

  try {
    auto doc = parser.iterate(padded);
    // Scalar documents cannot be viewed as a value; read them from the document.
    switch (doc.type()) {
      case simdjson::ondemand::json_type::object:
      case simdjson::ondemand::json_type::array:
        emit_value(doc.get_value(), nullptr, enc);
        break;
      case simdjson::ondemand::json_type::number: {
        std::string_view tok = doc.raw_json_token();
        enc.write_data(trim(tok));
        break;
      }
      case simdjson::ondemand::json_type::string: {
        std::string_view s = doc.get_string();
        enc.write_data(s);
        break;
      }
      case simdjson::ondemand::json_type::boolean: {
        bool b = doc.get_bool();
        enc.write_data(b ? "true" : "false");
        break;
      }
      case simdjson::ondemand::json_type::null:
        if (!static_cast<bool>(doc.is_null())) throw simdjson::simdjson_error(simdjson::INCORRECT_TYPE);
        enc.write_data("null");
        break;
      default:
        throw simdjson::simdjson_error(simdjson::INCORRECT_TYPE);
    }
    if (!doc.at_end()) {
      if (err_out) *err_out = "trailing content after JSON document";
      return false;
    }
    return true;
  } catch (const simdjson::simdjson_error& e) {
    if (err_out) *err_out = std::string("json: ") + e.what();
    return false;
  } catch (const Error& e) {
    if (err_out) *err_out = std::string("foa: ") + e.what();
    return false;
  }
}

}
