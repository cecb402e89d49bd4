#pragma once

#include "ktextools/pixel.h"

#include <istream>
#include <ostream>

namespace ktextools::tga {

// decode reads a true-color TGA (24/32 bpp), uncompressed (type 2) or
// run-length encoded (type 10), into top-down RGBA.
pixel::Image decode(std::istream& r);

// encode writes an uncompressed 32-bit true-color TGA with top-left origin.
void encode(std::ostream& w, const pixel::Image& img);

} // namespace ktextools::tga
