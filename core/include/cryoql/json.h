#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace cryoql {

// Insertion-ordered so result records keep the engine's column order.
using json = nlohmann::ordered_json;

/// Serializes a document for output. File names, subprocess output and engine
/// messages are not guaranteed UTF-8; invalid bytes become U+FFFD instead of throwing.
inline std::string dump_text(const json& document, int indent = -1) {
  return document.dump(indent, ' ', false, json::error_handler_t::replace);
}

}  // namespace cryoql
