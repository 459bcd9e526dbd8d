#include "config.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

using nlohmann::json;

namespace pngdata
{
  namespace
  {
    bool get_string(const json &value, const char *key, std::optional<std::string> &out, std::string &err)
    {
      if (!value.is_string())
      {
        err = std::string("config key `") + key + "` must be a string";
        return false;
      }
      out = value.get<std::string>();
      return true;
    }

    bool get_bool(const json &value, const char *key, std::optional<bool> &out, std::string &err)
    {
      if (!value.is_boolean())
      {
        err = std::string("config key `") + key + "` must be true or false";
        return false;
      }
      out = value.get<bool>();
      return true;
    }
  }

  bool parse_dense_fill(const std::string &text, DenseFill &out)
  {
    if (text == "random")
      out = DenseFill::Random;
    else if (text == "zero")
      out = DenseFill::Zero;
    else
      return false;
    return true;
  }

  bool parse_filler_seed(const std::string &text, uint64_t &out)
  {
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0])))
      return false;
    char *endptr = nullptr;
    errno = 0;
    const unsigned long long v = std::strtoull(text.c_str(), &endptr, 10);
    if (errno == ERANGE || *endptr != '\0')
      return false;
    out = static_cast<uint64_t>(v);
    return true;
  }

  const char *dense_fill_name(DenseFill fill)
  {
    return fill == DenseFill::Zero ? "zero" : "random";
  }

  bool parse_config(const std::string &text, ToolConfig &out, std::string &err)
  {
    json root;
    try
    {
      root = json::parse(text);
    }
    catch (const json::parse_error &e)
    {
      err = std::string("config is not valid JSON: ") + e.what();
      return false;
    }
    if (!root.is_object())
    {
      err = "config must be a JSON object";
      return false;
    }

    ToolConfig cfg;
    for (auto it = root.begin(); it != root.end(); ++it)
    {
      const std::string &key = it.key();
      const json &value = it.value();
      bool ok = true;
      if (key == "layout")
        ok = get_string(value, "layout", cfg.layout, err);
      else if (key == "comment")
        ok = get_string(value, "comment", cfg.comment, err);
      else if (key == "seed")
        ok = get_string(value, "seed", cfg.seed, err);
      else if (key == "entropy")
        ok = get_bool(value, "entropy", cfg.entropy, err);
      else if (key == "verbose")
        ok = get_bool(value, "verbose", cfg.verbose, err);
      else if (key == "dense_fill")
      {
        DenseFill fill = DenseFill::Random;
        if (!value.is_string() || !parse_dense_fill(value.get<std::string>(), fill))
        {
          err = "config key `dense_fill` must be \"random\" or \"zero\"";
          return false;
        }
        cfg.dense_fill = fill;
      }
      else if (key == "filler_seed")
      {
        if (!value.is_number_unsigned())
        {
          err = "config key `filler_seed` must be a non-negative integer";
          return false;
        }
        cfg.filler_seed = value.get<uint64_t>();
      }
      else
      {
        err = "unknown config key `" + key + "`";
        return false;
      }
      if (!ok)
        return false;
    }
    out = std::move(cfg);
    return true;
  }

  bool load_config(const std::string &path, ToolConfig &out, std::string &err)
  {
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
      err = "cannot open config " + path;
      return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad())
    {
      err = "failed to read config " + path;
      return false;
    }
    return parse_config(ss.str(), out, err);
  }

  json header_to_json(const HeaderInfo &header, const std::string &layout_tag, const std::string &seed)
  {
    json j;
    j["version"] = header.version;
    j["comment"] = header.comment;
    j["payload_length"] = header.payload_length;
    j["layout"] = layout_tag;
    if (!seed.empty())
      j["seed"] = seed;
    return j;
  }
}
