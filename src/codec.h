#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "error.h"
#include "frame.h"
#include "image_io.h"
#include "layout.h"

namespace pngdata
{
  // Contents of the dense remainder after the frame
  enum class DenseFill : uint8_t
  {
    Random = 0,
    Zero = 1,
  };

  struct CodecOptions
  {
    // Empty means "{width}x{height}" of the raster.
    std::string seed;
    // Embed encode only: fill the unused blocks with payload-like bytes.
    bool entropy_fill = false;
    // Fixed seed for filler bits. Unset: std::random_device.
    std::optional<uint64_t> filler_seed;
    DenseFill dense_fill = DenseFill::Random;
  };

  enum class CodecStage : uint8_t
  {
    Idle,
    CapacityChecked,
    BlockSelected,
    FrameWritten,
    FillerWritten,
    HeaderRead,
    PayloadRead,
    ChecksumVerified,
    Done,
  };

  const char *codec_stage_name(CodecStage stage);

  struct EncodeReport
  {
    CodecStage stage = CodecStage::Idle;
    std::string seed;
    uint64_t frame_bits = 0;
    uint64_t capacity_bits = 0;
    uint64_t carrier_blocks = 0;
    uint64_t filler_blocks = 0;
    double payload_entropy = 0.0; // bits per byte
  };

  using HeaderInfo = frame::FrameHeader;

  // Filled on failure too: `stage` is the last step that succeeded.
  struct DecodeReport
  {
    CodecStage stage = CodecStage::Idle;
    std::string seed;
    uint64_t capacity_bits = 0;
  };

  std::string effective_seed(const CodecOptions &opt, const RasterBuffer &raster);

  // Writes the frame into `raster` in place. Nothing is modified unless every
  // check passes.
  bool encode(RasterBuffer &raster,
              const layout::Layout &layout,
              const std::vector<uint8_t> &payload,
              const std::string &comment,
              const CodecOptions &opt,
              Error &err,
              EncodeReport *report = nullptr);

  // `payload` (and `header` when given) are only written on success.
  bool decode(const RasterBuffer &raster,
              const layout::Layout &layout,
              const CodecOptions &opt,
              std::vector<uint8_t> &payload,
              Error &err,
              HeaderInfo *header = nullptr,
              DecodeReport *report = nullptr);

  bool read_header(const RasterBuffer &raster,
                   const layout::Layout &layout,
                   const CodecOptions &opt,
                   HeaderInfo &header,
                   Error &err,
                   DecodeReport *report = nullptr);

  // Zeroed raster just large enough for a dense frame:
  // width = floor(sqrt(units)), height = ceil(units / width).
  bool make_dense_canvas(const layout::Layout &layout,
                         uint64_t payload_size,
                         std::size_t comment_size,
                         RasterBuffer &out,
                         Error &err);
}
