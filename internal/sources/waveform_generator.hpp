#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/point.hpp"
#include "internal/sources/vector_text.hpp"
#include "internal/util/time.hpp"

namespace pointzilla::sources {

enum class WaveformShape {
  kSineWave,
  kSquareWave,
  kSawTooth,
  kText,
};

enum class TextChannel {
  kX,
  kY,
};

struct WaveformSpec {
  WaveformShape   shape = WaveformShape::kSineWave;
  util::TimePoint start_time{};
  util::Duration  interval = std::chrono::minutes(1);

  // A nonzero point count wins over the period count.
  std::size_t number_of_points  = 0;
  double      number_of_periods = 1.0;
  double      samples_per_period = 1440.0;

  double scalar = 1.0;
  double offset = 0.0;
  double phase  = 0.0; // fraction of a period

  std::string text;
  TextChannel text_channel = TextChannel::kX;

  // Carried by every generated point.
  std::optional<std::int32_t> grade_code;
  std::vector<std::string>    qualifiers;
};

/*
  Deterministic synthetic point source.

  Every sample is computed from its index, so the sequence can be restarted
  or sampled at any position.
*/
class WaveformGenerator {
 public:
  // Throws util::ConfigurationError when the text can't be vectorized.
  explicit WaveformGenerator(WaveformSpec spec);

  std::size_t Count() const;
  model::Point Sample(std::size_t index) const;
  std::vector<model::Point> Generate() const;

  double SamplesPerPeriod() const;

  const WaveformSpec& spec() const {
    return spec_;
  }

 private:
  double Shape(std::size_t index) const;

  WaveformSpec             spec_;
  std::vector<GlyphVertex> path_;
};

} // namespace pointzilla::sources
