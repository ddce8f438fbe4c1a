#pragma once

#include <string_view>
#include <vector>

namespace pointzilla::sources {

struct GlyphVertex {
  double x = 0;
  double y = 0;
};

/*
  Stroke font used by the vectorized text waveform.

  Each glyph lives on a 4 x 6 grid (y up) and advances 6 units. Strokes are
  subdivided into unit steps so that the path is evenly sampled. Pen-up moves
  between strokes are not marked; the path jumps to the next stroke.

  Throws util::ConfigurationError on characters the font does not cover.
*/
std::vector<GlyphVertex> VectorizeText(std::string_view text);

} // namespace pointzilla::sources
