#include "codec.h"

#include <cmath>
#include <limits>
#include <memory>
#include <utility>

#include "block_selector.h"
#include "filler.h"
#include "packing.h"

namespace pngdata
{
  namespace
  {
    bool check_raster(const RasterBuffer &raster, Error &err)
    {
      if (raster.width == 0 || raster.height == 0)
        return fail(err, ErrorKind::UnsupportedLayout, "empty raster");
      if (raster.samples.size() != raster.sample_count())
        return fail(err, ErrorKind::UnsupportedLayout,
                    "raster holds " + std::to_string(raster.samples.size()) + " samples, expected " +
                        std::to_string(raster.sample_count()));
      return true;
    }

    // 埋め込みのブロック番号は 32bit
    bool check_block_count(const RasterBuffer &raster, Error &err)
    {
      if (raster.pixel_count() > std::numeric_limits<uint32_t>::max())
        return fail(err, ErrorKind::CapacityExceeded,
                    "carrier has " + std::to_string(raster.pixel_count()) + " pixels, at most 2^32-1 are addressable");
      return true;
    }

    uint64_t units_for(uint64_t bits, uint32_t unit_bits)
    {
      return (bits + unit_bits - 1) / unit_bits;
    }

    // Scan and (for embed) the selector that owns its order. Both live as long
    // as one driver call.
    struct CarrierPlan
    {
      layout::Layout bound;
      std::unique_ptr<select::BlockSelector> selector;
      packing::CarrierScan scan;
    };

    bool plan_carrier(const RasterBuffer &raster,
                      const layout::Layout &layout,
                      const CodecOptions &opt,
                      CarrierPlan &plan,
                      Error &err)
    {
      if (!check_raster(raster, err))
        return false;
      if (!layout::bind_carrier(layout, raster, plan.bound, err))
        return false;

      if (plan.bound.mode == layout::Mode::Embed)
      {
        if (!check_block_count(raster, err))
          return false;
        plan.selector = std::make_unique<select::BlockSelector>(effective_seed(opt, raster),
                                                                static_cast<uint32_t>(raster.pixel_count()));
        plan.scan = packing::CarrierScan::selected(*plan.selector);
      }
      else
      {
        plan.scan = packing::CarrierScan::linear(0, raster.pixel_count());
      }
      return true;
    }
  }

  const char *codec_stage_name(CodecStage stage)
  {
    switch (stage)
    {
    case CodecStage::Idle:
      return "Idle";
    case CodecStage::CapacityChecked:
      return "CapacityChecked";
    case CodecStage::BlockSelected:
      return "BlockSelected";
    case CodecStage::FrameWritten:
      return "FrameWritten";
    case CodecStage::FillerWritten:
      return "FillerWritten";
    case CodecStage::HeaderRead:
      return "HeaderRead";
    case CodecStage::PayloadRead:
      return "PayloadRead";
    case CodecStage::ChecksumVerified:
      return "ChecksumVerified";
    case CodecStage::Done:
      return "Done";
    }
    return "?";
  }

  std::string effective_seed(const CodecOptions &opt, const RasterBuffer &raster)
  {
    if (!opt.seed.empty())
      return opt.seed;
    return select::default_seed(raster.width, raster.height);
  }

  bool encode(RasterBuffer &raster,
              const layout::Layout &layout,
              const std::vector<uint8_t> &payload,
              const std::string &comment,
              const CodecOptions &opt,
              Error &err,
              EncodeReport *report)
  {
    EncodeReport local;
    EncodeReport &rep = report ? *report : local;
    rep = EncodeReport{};

    if (!frame::validate_comment(comment, err))
      return false;

    CarrierPlan plan;
    if (!plan_carrier(raster, layout, opt, plan, err))
      return false;
    const bool embed = plan.bound.mode == layout::Mode::Embed;

    rep.seed = embed ? effective_seed(opt, raster) : std::string();
    rep.frame_bits = frame::frame_bits(payload.size(), comment.size());
    rep.capacity_bits = layout::capacity_bits(plan.bound, raster.width, raster.height);
    if (rep.frame_bits > rep.capacity_bits)
      return fail(err, ErrorKind::CapacityExceeded,
                  "payload of " + std::to_string(payload.size()) + " bytes needs " +
                      std::to_string(rep.frame_bits) + " bits, layout " + layout::layout_tag(plan.bound) +
                      " holds " + std::to_string(rep.capacity_bits) + " bits (" +
                      std::to_string(rep.capacity_bits / 8) + " bytes)");
    rep.stage = CodecStage::CapacityChecked;

    std::vector<uint8_t> stream;
    if (!frame::serialize(comment, payload, stream, err))
      return false;

    const uint64_t carrier_units = units_for(rep.frame_bits, plan.bound.bits_per_pixel());
    select::BlockSpan rest;
    if (embed)
    {
      // 先頭 carrier_units 個だけ確定させ、残りが filler 候補になる
      rest = plan.selector->unused(carrier_units);
      rep.stage = CodecStage::BlockSelected;
    }

    uint64_t units_used = 0;
    if (!packing::write_stream(raster, plan.bound, plan.scan, stream, rep.frame_bits, units_used, err))
      return false;
    rep.carrier_blocks = units_used;
    rep.stage = CodecStage::FrameWritten;

    const filler::ByteHistogram histogram = filler::byte_histogram(payload.data(), payload.size());
    rep.payload_entropy = filler::shannon_entropy(histogram);

    if (embed)
    {
      if (opt.entropy_fill)
      {
        const filler::ByteSampler sampler(histogram);
        select::Rng rng = filler::make_filler_rng(opt.filler_seed);
        rep.filler_blocks = filler::fill_units(raster, plan.bound, packing::CarrierScan::listed(rest), sampler, rng);
        rep.stage = CodecStage::FillerWritten;
      }
    }
    else
    {
      filler::ByteHistogram fill{};
      if (opt.dense_fill == DenseFill::Zero)
        fill[0] = 1;
      const filler::ByteSampler sampler(fill);
      select::Rng rng = filler::make_filler_rng(opt.filler_seed);
      const uint64_t remainder = raster.pixel_count() - carrier_units;
      rep.filler_blocks =
          filler::fill_units(raster, plan.bound, packing::CarrierScan::linear(carrier_units, remainder), sampler, rng);
    }

    rep.stage = CodecStage::Done;
    return true;
  }

  bool decode(const RasterBuffer &raster,
              const layout::Layout &layout,
              const CodecOptions &opt,
              std::vector<uint8_t> &payload,
              Error &err,
              HeaderInfo *header,
              DecodeReport *report)
  {
    DecodeReport local;
    DecodeReport &rep = report ? *report : local;
    rep = DecodeReport{};

    CarrierPlan plan;
    if (!plan_carrier(raster, layout, opt, plan, err))
      return false;
    if (plan.bound.mode == layout::Mode::Embed)
      rep.seed = effective_seed(opt, raster);
    rep.capacity_bits = layout::capacity_bits(plan.bound, raster.width, raster.height);

    packing::StreamReader reader(raster, plan.bound, plan.scan);
    frame::Frame frame;
    if (!frame::read_header_only(reader, frame.header, err))
      return false;
    rep.stage = CodecStage::HeaderRead;

    if (!frame::read_body(reader, frame.header.payload_length, frame.checksum, frame.payload, err))
      return false;
    rep.stage = CodecStage::PayloadRead;

    if (!frame::verify_checksum(frame.checksum, frame.payload, err))
      return false;
    rep.stage = CodecStage::ChecksumVerified;

    payload.swap(frame.payload);
    if (header)
      *header = std::move(frame.header);
    rep.stage = CodecStage::Done;
    return true;
  }

  bool read_header(const RasterBuffer &raster,
                   const layout::Layout &layout,
                   const CodecOptions &opt,
                   HeaderInfo &header,
                   Error &err,
                   DecodeReport *report)
  {
    DecodeReport local;
    DecodeReport &rep = report ? *report : local;
    rep = DecodeReport{};

    CarrierPlan plan;
    if (!plan_carrier(raster, layout, opt, plan, err))
      return false;
    if (plan.bound.mode == layout::Mode::Embed)
      rep.seed = effective_seed(opt, raster);
    rep.capacity_bits = layout::capacity_bits(plan.bound, raster.width, raster.height);

    packing::StreamReader reader(raster, plan.bound, plan.scan);
    HeaderInfo parsed;
    if (!frame::read_header_only(reader, parsed, err))
      return false;
    rep.stage = CodecStage::HeaderRead;

    header = std::move(parsed);
    rep.stage = CodecStage::Done;
    return true;
  }

  bool make_dense_canvas(const layout::Layout &layout,
                         uint64_t payload_size,
                         std::size_t comment_size,
                         RasterBuffer &out,
                         Error &err)
  {
    if (layout.mode != layout::Mode::Dense || !layout.bound())
      return fail(err, ErrorKind::UnsupportedLayout,
                  "layout " + layout::layout_tag(layout) + " cannot synthesize an image, a carrier is required");
    if (comment_size > frame::kMaxCommentBytes)
      return fail(err, ErrorKind::InvalidComment,
                  "comment is too long, maximum length: " + std::to_string(frame::kMaxCommentBytes));

    const uint64_t max_payload = (std::numeric_limits<uint64_t>::max() / 8u) - frame::header_overhead(comment_size);
    if (payload_size > max_payload)
      return fail(err, ErrorKind::CapacityExceeded, "payload is too large");
    const uint64_t units = units_for(frame::frame_bits(payload_size, comment_size), layout.bits_per_pixel());

    uint64_t width = static_cast<uint64_t>(std::sqrt(static_cast<double>(units)));
    while (width > 1 && width * width > units)
      --width;
    while ((width + 1) * (width + 1) <= units)
      ++width;
    if (width == 0)
      width = 1;
    const uint64_t height = (units + width - 1) / width;

    if (width > std::numeric_limits<uint32_t>::max() || height > std::numeric_limits<uint32_t>::max() ||
        width * height > std::numeric_limits<uint32_t>::max())
      return fail(err, ErrorKind::CapacityExceeded,
                  "payload needs " + std::to_string(units) + " pixels, too many for one image");

    out.reset(static_cast<uint32_t>(width), static_cast<uint32_t>(height), layout.channels,
              layout::container_depth(layout));
    return true;
  }
}
