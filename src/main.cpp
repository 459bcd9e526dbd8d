#include "codec.h"
#include "config.h"
#include "filler.h"
#include "image_io.h"
#include "layout.h"

#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#ifndef PNGDATA_VERSION
#define PNGDATA_VERSION "0.0.0"
#endif

namespace
{
  enum ExitCode
  {
    kExitOk = 0,
    kExitIo = 1,
    kExitUsage = 2,
    kExitCodec = 3,
  };

  enum class Command
  {
    Encode,
    Decode,
    Info,
  };

  struct CliOptions
  {
    Command command = Command::Encode;
    std::string layout;
    std::string payload_path;
    std::string carrier_path;
    std::string input_path;
    std::string output_path;
    std::string comment;
    std::string config_path;
    bool json = false;
    bool verbose = false;
    pngdata::CodecOptions codec;

    // 明示指定されたかどうか (config より優先するため)
    bool has_layout = false;
    bool has_comment = false;
    bool has_seed = false;
    bool has_entropy = false;
    bool has_dense_fill = false;
    bool has_filler_seed = false;
    bool has_verbose = false;
  };

  void print_usage()
  {
    std::cerr << "Usage: pngdata encode --layout=<tag> --payload=<file> [--carrier=<in.png>] --output=<out.png>\n"
              << "                      [--comment=<text>] [--seed=<text>] [--entropy]\n"
              << "                      [--dense-fill=random|zero] [--filler-seed=N]\n"
              << "       pngdata decode [--layout=<tag>] --input=<in.png> --output=<file> [--seed=<text>]\n"
              << "       pngdata info   [--layout=<tag>] --input=<in.png> [--seed=<text>] [--json]\n"
              << "Common: [--config=<file.json>] [--verbose] [-h|--help] [--version]\n"
              << "Layouts: g1 g2 g4 g8 g16 ga1 ga2 ga4 ga8 ga16 rgb8 rgb16 rgba8 rgba16 (dense), lo1..lo7 (embed)\n";
  }

  int report_error(const char *what, const pngdata::Error &err)
  {
    std::cerr << "pngdata: " << what << ": [" << pngdata::error_kind_name(err.kind) << "] " << err.message << "\n";
    return err.is_codec_error() ? kExitCodec : kExitIo;
  }

  bool value_of(const std::string &arg, const char *prefix, std::string &out)
  {
    const std::string p(prefix);
    if (arg.rfind(p, 0) != 0)
      return false;
    out = arg.substr(p.size());
    return true;
  }

  bool read_file(const std::string &path, std::vector<uint8_t> &out, std::string &err)
  {
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
      err = "cannot open " + path;
      return false;
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad())
    {
      err = "failed to read " + path;
      return false;
    }
    out.swap(bytes);
    return true;
  }

  bool write_file(const std::string &path, const std::vector<uint8_t> &data, std::string &err)
  {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
      err = "cannot create " + path;
      return false;
    }
    out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out)
    {
      err = "failed to write " + path;
      return false;
    }
    return true;
  }

  // Returns -1 to continue, otherwise an exit code.
  int parse_args(int argc, char **argv, CliOptions &opt)
  {
    if (argc < 2)
    {
      print_usage();
      return kExitUsage;
    }

    const std::string cmd = argv[1];
    if (cmd == "-h" || cmd == "--help")
    {
      print_usage();
      return kExitOk;
    }
    if (cmd == "--version")
    {
      std::cout << "pngdata " << PNGDATA_VERSION << "\n";
      return kExitOk;
    }
    if (cmd == "encode")
      opt.command = Command::Encode;
    else if (cmd == "decode")
      opt.command = Command::Decode;
    else if (cmd == "info")
      opt.command = Command::Info;
    else
    {
      std::cerr << "Unknown command: " << cmd << "\n";
      print_usage();
      return kExitUsage;
    }

    for (int i = 2; i < argc; ++i)
    {
      const std::string arg = argv[i];
      std::string v;
      if (value_of(arg, "--layout=", v))
      {
        opt.layout = v;
        opt.has_layout = true;
      }
      else if (value_of(arg, "--payload=", v))
        opt.payload_path = v;
      else if (value_of(arg, "--carrier=", v))
        opt.carrier_path = v;
      else if (value_of(arg, "--input=", v))
        opt.input_path = v;
      else if (value_of(arg, "--output=", v))
        opt.output_path = v;
      else if (arg == "-o")
      {
        if (i + 1 >= argc)
        {
          std::cerr << "-o requires a path\n";
          return kExitUsage;
        }
        opt.output_path = argv[++i];
      }
      else if (value_of(arg, "--comment=", v))
      {
        opt.comment = v;
        opt.has_comment = true;
      }
      else if (value_of(arg, "--seed=", v))
      {
        opt.codec.seed = v;
        opt.has_seed = true;
      }
      else if (arg == "--entropy")
      {
        opt.codec.entropy_fill = true;
        opt.has_entropy = true;
      }
      else if (value_of(arg, "--dense-fill=", v))
      {
        if (!pngdata::parse_dense_fill(v, opt.codec.dense_fill))
        {
          std::cerr << "Invalid --dense-fill: " << v << "\n";
          return kExitUsage;
        }
        opt.has_dense_fill = true;
      }
      else if (value_of(arg, "--filler-seed=", v))
      {
        uint64_t n = 0;
        if (!pngdata::parse_filler_seed(v, n))
        {
          std::cerr << "Invalid --filler-seed: " << v << "\n";
          return kExitUsage;
        }
        opt.codec.filler_seed = n;
        opt.has_filler_seed = true;
      }
      else if (value_of(arg, "--config=", v))
        opt.config_path = v;
      else if (arg == "--json")
        opt.json = true;
      else if (arg == "--verbose")
      {
        opt.verbose = true;
        opt.has_verbose = true;
      }
      else if (arg == "-h" || arg == "--help")
      {
        print_usage();
        return kExitOk;
      }
      else
      {
        std::cerr << "Unknown option: " << arg << "\n";
        return kExitUsage;
      }
    }
    return -1;
  }

  // config の値は CLI で指定されなかった項目だけ埋める
  int apply_config(CliOptions &opt)
  {
    if (opt.config_path.empty())
      return -1;
    pngdata::ToolConfig cfg;
    std::string err;
    if (!pngdata::load_config(opt.config_path, cfg, err))
    {
      std::cerr << "pngdata: " << err << "\n";
      return kExitUsage;
    }
    if (cfg.layout && !opt.has_layout)
    {
      opt.layout = *cfg.layout;
      opt.has_layout = true;
    }
    if (cfg.comment && !opt.has_comment)
      opt.comment = *cfg.comment;
    if (cfg.seed && !opt.has_seed)
      opt.codec.seed = *cfg.seed;
    if (cfg.entropy && !opt.has_entropy)
      opt.codec.entropy_fill = *cfg.entropy;
    if (cfg.dense_fill && !opt.has_dense_fill)
      opt.codec.dense_fill = *cfg.dense_fill;
    if (cfg.filler_seed && !opt.has_filler_seed)
      opt.codec.filler_seed = *cfg.filler_seed;
    if (cfg.verbose && !opt.has_verbose)
      opt.verbose = *cfg.verbose;
    return -1;
  }

  int load_raster(const std::string &path, pngdata::RasterBuffer &raster)
  {
    std::string err;
    if (!pngdata::has_ext(path, "png"))
      std::cerr << "pngdata: warning: " << path << " has no .png extension\n";
    if (!pngdata::load_png(path, raster, err))
    {
      std::cerr << "pngdata: failed to load " << path << ": " << err << "\n";
      return kExitIo;
    }
    return -1;
  }

  // 指定がなければ PNG の色形式から dense レイアウトを推定する
  int resolve_layout(const CliOptions &opt, const pngdata::RasterBuffer &raster, pngdata::layout::Layout &out)
  {
    pngdata::Error err;
    const bool ok = opt.has_layout ? pngdata::layout::parse_layout(opt.layout, out, err)
                                   : pngdata::layout::layout_from_raster(raster, out, err);
    if (!ok)
      return report_error("layout", err);
    return -1;
  }

  void print_header(const pngdata::HeaderInfo &header)
  {
    std::cout << "=== HEADER ===\n";
    std::cout << "Version: " << header.version << "\n";
    std::cout << "Comment: \"" << header.comment << "\"\n";
    std::cout << "Data: " << header.payload_length << "bytes\n";
    std::cout << "==============\n";
  }

  void print_report(const pngdata::EncodeReport &rep, const pngdata::layout::Layout &layout)
  {
    std::cerr << "pngdata: layout=" << pngdata::layout::layout_tag(layout) << " stage="
              << pngdata::codec_stage_name(rep.stage) << "\n";
    if (!rep.seed.empty())
      std::cerr << "pngdata: seed=\"" << rep.seed << "\"\n";
    std::cerr << "pngdata: frame_bits=" << rep.frame_bits << " capacity_bits=" << rep.capacity_bits << "\n";
    std::cerr << "pngdata: carrier_blocks=" << rep.carrier_blocks << " filler_blocks=" << rep.filler_blocks << "\n";
    std::cerr << "pngdata: payload_entropy=" << std::fixed << std::setprecision(4) << rep.payload_entropy
              << " bits/byte\n";
  }

  int run_encode(const CliOptions &opt)
  {
    if (!opt.has_layout || opt.payload_path.empty() || opt.output_path.empty())
    {
      std::cerr << "encode requires --layout, --payload and --output\n";
      return kExitUsage;
    }

    pngdata::layout::Layout layout;
    pngdata::Error err;
    if (!pngdata::layout::parse_layout(opt.layout, layout, err))
      return report_error("layout", err);
    if (layout.mode == pngdata::layout::Mode::Embed && opt.carrier_path.empty())
    {
      std::cerr << "layout " << opt.layout << " embeds into an existing image, --carrier is required\n";
      return kExitUsage;
    }

    std::vector<uint8_t> payload;
    std::string io_err;
    if (!read_file(opt.payload_path, payload, io_err))
    {
      std::cerr << "pngdata: " << io_err << "\n";
      return kExitIo;
    }

    pngdata::RasterBuffer raster;
    if (!opt.carrier_path.empty())
    {
      const int rc = load_raster(opt.carrier_path, raster);
      if (rc >= 0)
        return rc;
    }
    else if (!pngdata::make_dense_canvas(layout, payload.size(), opt.comment.size(), raster, err))
    {
      return report_error("encode", err);
    }

    if (opt.verbose)
    {
      std::cerr << "pngdata: payload " << payload.size() << " bytes, image " << raster.width << "x" << raster.height
                << " channels=" << raster.channels << " depth=" << raster.bit_depth << "\n";
    }

    pngdata::EncodeReport report;
    if (!pngdata::encode(raster, layout, payload, opt.comment, opt.codec, err, &report))
      return report_error("encode", err);
    if (opt.verbose)
      print_report(report, layout);
    if (opt.codec.entropy_fill && layout.mode == pngdata::layout::Mode::Embed)
      std::cout << "Payload entropy: " << report.payload_entropy << "\n";

    if (!pngdata::save_png(opt.output_path, raster, io_err))
    {
      std::cerr << "pngdata: failed to save " << opt.output_path << ": " << io_err << "\n";
      return kExitIo;
    }
    return kExitOk;
  }

  int run_decode(const CliOptions &opt)
  {
    if (opt.input_path.empty() || opt.output_path.empty())
    {
      std::cerr << "decode requires --input and --output\n";
      return kExitUsage;
    }

    pngdata::RasterBuffer raster;
    int rc = load_raster(opt.input_path, raster);
    if (rc >= 0)
      return rc;
    pngdata::layout::Layout layout;
    rc = resolve_layout(opt, raster, layout);
    if (rc >= 0)
      return rc;

    std::vector<uint8_t> payload;
    pngdata::HeaderInfo header;
    pngdata::Error err;
    pngdata::DecodeReport report;
    if (!pngdata::decode(raster, layout, opt.codec, payload, err, &header, &report))
    {
      if (opt.verbose)
        std::cerr << "pngdata: decode stopped after " << pngdata::codec_stage_name(report.stage) << "\n";
      return report_error("decode", err);
    }
    if (opt.verbose)
    {
      std::cerr << "pngdata: layout=" << pngdata::layout::layout_tag(layout) << " comment=\"" << header.comment
                << "\" payload=" << header.payload_length << " bytes entropy=" << std::fixed << std::setprecision(4)
                << pngdata::filler::shannon_entropy(payload) << " bits/byte\n";
    }

    std::string io_err;
    if (!write_file(opt.output_path, payload, io_err))
    {
      std::cerr << "pngdata: " << io_err << "\n";
      return kExitIo;
    }
    return kExitOk;
  }

  int run_info(const CliOptions &opt)
  {
    if (opt.input_path.empty())
    {
      std::cerr << "info requires --input\n";
      return kExitUsage;
    }

    pngdata::RasterBuffer raster;
    int rc = load_raster(opt.input_path, raster);
    if (rc >= 0)
      return rc;
    pngdata::layout::Layout layout;
    rc = resolve_layout(opt, raster, layout);
    if (rc >= 0)
      return rc;

    pngdata::HeaderInfo header;
    pngdata::Error err;
    if (!pngdata::read_header(raster, layout, opt.codec, header, err))
      return report_error("info", err);

    if (opt.json)
    {
      const std::string seed =
          layout.mode == pngdata::layout::Mode::Embed ? pngdata::effective_seed(opt.codec, raster) : std::string();
      std::cout << pngdata::header_to_json(header, pngdata::layout::layout_tag(layout), seed).dump(2) << "\n";
    }
    else
    {
      print_header(header);
    }
    return kExitOk;
  }
}

int main(int argc, char **argv)
{
  CliOptions opt;
  int rc = parse_args(argc, argv, opt);
  if (rc >= 0)
    return rc;
  rc = apply_config(opt);
  if (rc >= 0)
    return rc;

  switch (opt.command)
  {
  case Command::Encode:
    return run_encode(opt);
  case Command::Decode:
    return run_decode(opt);
  case Command::Info:
    return run_info(opt);
  }
  return kExitUsage;
}
