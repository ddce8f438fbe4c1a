#include "waveform_generator.hpp"

#include <cmath>
#include <utility>

#include "internal/util/errors.hpp"

namespace pointzilla::sources {

namespace {

constexpr double kPi = 3.14159265358979323846;

double PeriodFraction(double cycles) {
  double fraction = cycles - std::floor(cycles);
  if (fraction < 0) fraction += 1.0;
  return fraction;
}

} // namespace

WaveformGenerator::WaveformGenerator(WaveformSpec spec) : spec_(std::move(spec)) {
  spec_.qualifiers = model::NormalizeQualifiers(spec_.qualifiers);
  if (spec_.shape == WaveformShape::kText) {
    path_ = VectorizeText(spec_.text);
    if (path_.empty()) {
      throw util::ConfigurationError("Text waveform needs at least one visible character");
    }
  }
}

double WaveformGenerator::SamplesPerPeriod() const {
  if (spec_.shape == WaveformShape::kText) {
    return static_cast<double>(path_.size());
  }
  return spec_.samples_per_period;
}

std::size_t WaveformGenerator::Count() const {
  if (spec_.interval <= util::Duration::zero()) {
    return 0;
  }
  if (spec_.number_of_points > 0) {
    return spec_.number_of_points;
  }

  const double count = std::trunc(spec_.number_of_periods * SamplesPerPeriod());
  if (!(count > 0)) {
    return 0;
  }
  return static_cast<std::size_t>(count);
}

double WaveformGenerator::Shape(std::size_t index) const {
  const double samples_per_period = SamplesPerPeriod();
  const double cycles = (samples_per_period > 0 ? static_cast<double>(index) / samples_per_period : 0.0) + spec_.phase;

  switch (spec_.shape) {
    case WaveformShape::kSquareWave:
      return PeriodFraction(cycles) < 0.5 ? 1.0 : -1.0;

    case WaveformShape::kSawTooth:
      return PeriodFraction(cycles) * 2.0 - 1.0;

    case WaveformShape::kText: {
      const std::size_t length = path_.size();
      const auto shift = static_cast<std::size_t>(std::floor(PeriodFraction(spec_.phase) * static_cast<double>(length)));
      const auto& vertex = path_[(index + shift) % length];
      return spec_.text_channel == TextChannel::kX ? vertex.x : vertex.y;
    }

    case WaveformShape::kSineWave:
    default:
      return std::sin(2.0 * kPi * cycles);
  }
}

model::Point WaveformGenerator::Sample(std::size_t index) const {
  const auto time = spec_.start_time + spec_.interval * static_cast<int64_t>(index);
  auto point       = model::Point::Value(time, spec_.offset + spec_.scalar * Shape(index));
  point.grade_code = spec_.grade_code;
  point.qualifiers = spec_.qualifiers;
  return point;
}

std::vector<model::Point> WaveformGenerator::Generate() const {
  const std::size_t count = Count();

  std::vector<model::Point> points;
  points.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    points.push_back(Sample(i));
  }
  return points;
}

} // namespace pointzilla::sources
