#include "ppmkit/errors.hpp"

#include <utility>

namespace pk {

FormatError::FormatError(Kind kind,
                         const std::string& message,
                         int x,
                         int y,
                         std::string detail)
    : std::runtime_error(message),
      kind_(kind),
      x_(x),
      y_(y),
      detail_(std::move(detail))
{
}

const char* to_string(FormatError::Kind kind)
{
    switch (kind) {
    case FormatError::Kind::BadMagic:            return "BadMagic";
    case FormatError::Kind::BadDimensions:       return "BadDimensions";
    case FormatError::Kind::UnsupportedMaxValue: return "UnsupportedMaxValue";
    case FormatError::Kind::TruncatedPixelData:  return "TruncatedPixelData";
    case FormatError::Kind::InvalidChannelValue: return "InvalidChannelValue";
    case FormatError::Kind::PixelCountMismatch:  return "PixelCountMismatch";
    }
    return "Unknown";
}

UnknownFilterError::UnknownFilterError(const std::string& name)
    : std::runtime_error("Unknown filter type: " + name),
      name_(name)
{
}

} // namespace pk
