#include "internal/sources/waveform_generator.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>

#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;

using pointzilla::sources::TextChannel;
using pointzilla::sources::WaveformGenerator;
using pointzilla::sources::WaveformShape;
using pointzilla::sources::WaveformSpec;

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

WaveformSpec MakeSpec(WaveformShape shape, double samples_per_period) {
  WaveformSpec spec;
  spec.shape              = shape;
  spec.start_time         = *pointzilla::util::ParseInstant("2020-01-01T00:00:00Z");
  spec.interval           = 1min;
  spec.samples_per_period = samples_per_period;
  return spec;
}

void TestPointCountIsExactAndEvenlySpaced() {
  auto spec             = MakeSpec(WaveformShape::kSineWave, 1440);
  spec.number_of_points = 10;

  const auto points = WaveformGenerator(spec).Generate();
  assert(points.size() == 10);
  for (std::size_t i = 1; i < points.size(); ++i) {
    assert(points[i].time - points[i - 1].time == 1min);
  }
  assert(points.front().time == spec.start_time);
}

void TestPeriodCountDerivesPointCount() {
  auto spec              = MakeSpec(WaveformShape::kSineWave, 1440);
  spec.number_of_periods = 2;
  assert(WaveformGenerator(spec).Count() == 2880);

  spec                    = MakeSpec(WaveformShape::kSineWave, 10);
  spec.number_of_periods  = 1.55;
  assert(WaveformGenerator(spec).Count() == 15);
}

void TestZeroIntervalOrCountIsEmpty() {
  auto spec     = MakeSpec(WaveformShape::kSineWave, 1440);
  spec.interval = pointzilla::util::Duration::zero();
  assert(WaveformGenerator(spec).Generate().empty());

  spec                   = MakeSpec(WaveformShape::kSineWave, 1440);
  spec.number_of_periods = 0;
  assert(WaveformGenerator(spec).Count() == 0);
}

void TestSineStartsAtZeroAndPeaksAtQuarterPeriod() {
  const WaveformGenerator generator(MakeSpec(WaveformShape::kSineWave, 1440));
  assert(Near(generator.Sample(0).value, 0.0));
  assert(Near(generator.Sample(360).value, 1.0));
  assert(Near(generator.Sample(1080).value, -1.0));
}

void TestSquareWaveIsPositiveOnFirstHalf() {
  const WaveformGenerator generator(MakeSpec(WaveformShape::kSquareWave, 4));
  assert(generator.Sample(0).value == 1.0);
  assert(generator.Sample(1).value == 1.0);
  assert(generator.Sample(2).value == -1.0);
  assert(generator.Sample(3).value == -1.0);
  assert(generator.Sample(4).value == 1.0);
}

void TestSawToothRampsAcrossEachPeriod() {
  const WaveformGenerator generator(MakeSpec(WaveformShape::kSawTooth, 4));
  assert(Near(generator.Sample(0).value, -1.0));
  assert(Near(generator.Sample(1).value, -0.5));
  assert(Near(generator.Sample(2).value, 0.0));
  assert(Near(generator.Sample(3).value, 0.5));
  assert(Near(generator.Sample(4).value, -1.0));
}

void TestScalarOffsetAndPhase() {
  auto spec   = MakeSpec(WaveformShape::kSquareWave, 4);
  spec.scalar = 2;
  spec.offset = 10;
  spec.phase  = 0.5;

  const WaveformGenerator generator(spec);
  assert(generator.Sample(0).value == 8.0);
  assert(generator.Sample(2).value == 12.0);
}

void TestSamplesAreRestartable() {
  auto spec             = MakeSpec(WaveformShape::kSineWave, 100);
  spec.number_of_points = 50;

  const WaveformGenerator generator(spec);
  const auto              points = generator.Generate();
  for (std::size_t i : {0u, 17u, 49u}) {
    const auto sample = generator.Sample(i);
    assert(sample.time == points[i].time);
    assert(sample.value == points[i].value);
  }
}

void TestTextWalksGlyphPath() {
  auto spec         = MakeSpec(WaveformShape::kText, 0);
  spec.text         = "I";
  spec.text_channel = TextChannel::kX;

  const WaveformGenerator x_channel(spec);
  // Three strokes: top bar (3 vertices), stem (7), bottom bar (3).
  assert(x_channel.SamplesPerPeriod() == 13);
  assert(x_channel.Count() == 13);
  assert(x_channel.Sample(0).value == 1.0);
  assert(x_channel.Sample(2).value == 3.0);
  assert(x_channel.Sample(13).value == 1.0);

  spec.text_channel = TextChannel::kY;
  spec.text         = "i";
  const WaveformGenerator y_channel(spec);
  assert(y_channel.Sample(0).value == 6.0);
  assert(y_channel.Sample(9).value == 0.0);
}

void TestUnsupportedTextIsConfigurationError() {
  auto spec  = MakeSpec(WaveformShape::kText, 0);
  spec.text  = "A#";
  bool threw = false;
  try {
    WaveformGenerator generator(spec);
  } catch (const pointzilla::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);

  spec.text = "  ";
  threw     = false;
  try {
    WaveformGenerator generator(spec);
  } catch (const pointzilla::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestPointCountIsExactAndEvenlySpaced();
  TestPeriodCountDerivesPointCount();
  TestZeroIntervalOrCountIsEmpty();
  TestSineStartsAtZeroAndPeaksAtQuarterPeriod();
  TestSquareWaveIsPositiveOnFirstHalf();
  TestSawToothRampsAcrossEachPeriod();
  TestScalarOffsetAndPhase();
  TestSamplesAreRestartable();
  TestTextWalksGlyphPath();
  TestUnsupportedTextIsConfigurationError();

  std::cout << "pointzilla_unit_waveform_generator: pass\n";
  return 0;
}
