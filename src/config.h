#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "codec.h"

namespace pngdata
{
  // Defaults loaded from --config=<file.json>. Unset fields leave the CLI
  // defaults alone.
  struct ToolConfig
  {
    std::optional<std::string> layout;
    std::optional<std::string> comment;
    std::optional<std::string> seed;
    std::optional<bool> entropy;
    std::optional<DenseFill> dense_fill;
    std::optional<uint64_t> filler_seed;
    std::optional<bool> verbose;
  };

  bool parse_dense_fill(const std::string &text, DenseFill &out);
  // Decimal, 0 .. 2^64-1. Signs, blanks and trailing text are rejected.
  bool parse_filler_seed(const std::string &text, uint64_t &out);
  const char *dense_fill_name(DenseFill fill);

  bool parse_config(const std::string &text, ToolConfig &out, std::string &err);
  bool load_config(const std::string &path, ToolConfig &out, std::string &err);

  nlohmann::json header_to_json(const HeaderInfo &header, const std::string &layout_tag, const std::string &seed);
}
