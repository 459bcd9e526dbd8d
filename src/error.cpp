#include "error.h"

namespace pngdata
{
  const char *error_kind_name(ErrorKind kind)
  {
    switch (kind)
    {
    case ErrorKind::None:
      return "None";
    case ErrorKind::UnsupportedLayout:
      return "UnsupportedLayout";
    case ErrorKind::CapacityExceeded:
      return "CapacityExceeded";
    case ErrorKind::CorruptFrame:
      return "CorruptFrame";
    case ErrorKind::ChecksumMismatch:
      return "ChecksumMismatch";
    case ErrorKind::InvalidComment:
      return "InvalidComment";
    case ErrorKind::Io:
      return "Io";
    }
    return "Unknown";
  }
}
