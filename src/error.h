#pragma once

#include <string>
#include <utility>

namespace pngdata
{
  // 失敗の種類。I/O 以外はコーデック本体が返す。
  enum class ErrorKind
  {
    None = 0,
    UnsupportedLayout,
    CapacityExceeded,
    CorruptFrame,
    ChecksumMismatch,
    InvalidComment,
    Io,
  };

  struct Error
  {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    void clear()
    {
      kind = ErrorKind::None;
      message.clear();
    }

    bool is_codec_error() const noexcept
    {
      return kind != ErrorKind::None && kind != ErrorKind::Io;
    }
  };

  inline bool fail(Error &err, ErrorKind kind, std::string message)
  {
    err.kind = kind;
    err.message = std::move(message);
    return false;
  }

  const char *error_kind_name(ErrorKind kind);
}
