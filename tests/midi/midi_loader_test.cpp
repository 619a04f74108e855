// Tests for MidiLoader -- melody / rhythm extraction from parsed tracks.

#include "midi/midi_loader.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "test_helpers.h"

namespace musent {
namespace {

using test_helpers::SmfBuilder;

ParsedMidi parse(const SmfBuilder& smf) {
  MidiReader reader;
  EXPECT_TRUE(reader.read(smf.bytes())) << reader.getError();
  return reader.getParsedMidi();
}

/// Conductor track plus two melodic tracks with 2 and 3 notes.
SmfBuilder threeTrackFile() {
  SmfBuilder smf(1, 480);
  smf.beginTrack();
  smf.tempo(500000);
  smf.endTrack();

  smf.beginTrack();
  smf.noteOn(0, 48, 100);
  smf.noteOff(480, 48);
  smf.noteOn(0, 55, 100);
  smf.noteOff(480, 55);
  smf.endTrack();

  smf.beginTrack();
  for (uint8_t pitch : {72, 74, 76}) {
    smf.noteOn(0, pitch, 100);
    smf.noteOff(240, pitch);
  }
  smf.endTrack();
  return smf;
}

// ---------------------------------------------------------------------------
// intervalsToRhythm
// ---------------------------------------------------------------------------

TEST(IntervalsToRhythmTest, QuarterNoteOnSixteenthGrid) {
  auto rhythm = intervalsToRhythm({{0.0, 1.0}}, 1.0, 0.25);
  EXPECT_EQ(rhythm, (std::vector<int>{1, 1, 1, 1, 0}));
}

TEST(IntervalsToRhythmTest, EmptyPieceHasOneSilentCell) {
  EXPECT_EQ(intervalsToRhythm({}, 0.0, 0.25), (std::vector<int>{0}));
}

TEST(IntervalsToRhythmTest, ShortNoteActivatesItsStartCell) {
  auto rhythm = intervalsToRhythm({{0.1, 0.15}}, 1.0, 0.25);
  EXPECT_EQ(rhythm, (std::vector<int>{1, 0, 0, 0, 0}));
}

TEST(IntervalsToRhythmTest, IntervalsPastTheGridAreClipped) {
  auto rhythm = intervalsToRhythm({{0.5, 9.0}, {10.0, 11.0}}, 1.0, 0.25);
  EXPECT_EQ(rhythm, (std::vector<int>{0, 0, 1, 1, 1}));
}

// ---------------------------------------------------------------------------
// selectMelodyTrack
// ---------------------------------------------------------------------------

TEST(SelectMelodyTrackTest, PicksBusiestTrack) {
  EXPECT_EQ(selectMelodyTrack(parse(threeTrackFile())), 2);
}

TEST(SelectMelodyTrackTest, TiesKeepFirstTrack) {
  SmfBuilder smf;
  for (int idx = 0; idx < 2; ++idx) {
    smf.beginTrack();
    smf.noteOn(0, 60, 100);
    smf.noteOff(480, 60);
    smf.endTrack();
  }
  EXPECT_EQ(selectMelodyTrack(parse(smf)), 0);
}

TEST(SelectMelodyTrackTest, NoTracks) {
  EXPECT_EQ(selectMelodyTrack(ParsedMidi{}), 0);
}

// ---------------------------------------------------------------------------
// MidiLoader
// ---------------------------------------------------------------------------

TEST(MidiLoaderTest, SingleQuarterNote) {
  SmfBuilder smf(0, 480);
  smf.beginTrack();
  smf.noteOn(0, 60, 100);
  smf.noteOff(480, 60);
  smf.endTrack();

  MidiLoader loader;
  ASSERT_TRUE(loader.extract(parse(smf))) << loader.getError();
  EXPECT_EQ(loader.getSequence().melody, (std::vector<int>{60}));
  EXPECT_EQ(loader.getSequence().rhythm, (std::vector<int>{1, 1, 1, 1, 0}));
  EXPECT_EQ(loader.getSequence().track_index, 0);
}

TEST(MidiLoaderTest, RestsLeaveGaps) {
  SmfBuilder smf(0, 480);
  smf.beginTrack();
  smf.noteOn(0, 60, 100);
  smf.noteOff(240, 60);
  smf.noteOn(240, 64, 100);
  smf.noteOff(480, 64);
  smf.endTrack();

  MidiLoader loader;
  ASSERT_TRUE(loader.extract(parse(smf), 0.5));
  EXPECT_EQ(loader.getSequence().melody, (std::vector<int>{60, 64}));
  EXPECT_EQ(loader.getSequence().rhythm, (std::vector<int>{1, 0, 1, 1, 0}));
}

TEST(MidiLoaderTest, ChordKeepsNoteOnOrder) {
  SmfBuilder smf;
  smf.beginTrack();
  smf.noteOn(0, 64, 100);
  smf.noteOn(0, 60, 100);
  smf.noteOff(480, 60);
  smf.noteOff(0, 64);
  smf.endTrack();

  MidiLoader loader;
  ASSERT_TRUE(loader.extract(parse(smf)));
  EXPECT_EQ(loader.getSequence().melody, (std::vector<int>{64, 60}));
}

TEST(MidiLoaderTest, AutomaticTrackSelection) {
  MidiLoader loader;
  ASSERT_TRUE(loader.extract(parse(threeTrackFile())));
  EXPECT_EQ(loader.getSequence().track_index, 2);
  EXPECT_EQ(loader.getSequence().melody, (std::vector<int>{72, 74, 76}));
}

TEST(MidiLoaderTest, ExplicitTrackIndex) {
  MidiLoader loader;
  ASSERT_TRUE(loader.extract(parse(threeTrackFile()), kDefaultTimeUnit, 1));
  EXPECT_EQ(loader.getSequence().track_index, 1);
  EXPECT_EQ(loader.getSequence().melody, (std::vector<int>{48, 55}));
}

TEST(MidiLoaderTest, TrackIndexOutOfBounds) {
  MidiLoader loader;
  EXPECT_FALSE(loader.extract(parse(threeTrackFile()), kDefaultTimeUnit, 5));
  EXPECT_EQ(loader.getError(), "track_index 5 out of bounds for MIDI with 3 tracks.");
}

TEST(MidiLoaderTest, NonPositiveTimeUnitFails) {
  MidiLoader loader;
  EXPECT_FALSE(loader.extract(parse(threeTrackFile()), 0.0));
  EXPECT_EQ(loader.getError(), "time_unit must be positive.");
  EXPECT_FALSE(loader.extract(parse(threeTrackFile()), -0.25));
}

TEST(MidiLoaderTest, LoadMissingFile) {
  MidiLoader loader;
  std::string path = "/tmp/musent_nonexistent_file_12345.mid";
  EXPECT_FALSE(loader.load(path));
  EXPECT_NE(loader.getError().find(path), std::string::npos);
}

TEST(MidiLoaderTest, LoadFromFile) {
  std::string path = test_helpers::writeFile(test_helpers::tempPath(".mid"),
                                             threeTrackFile().bytes());
  MidiLoader loader;
  ASSERT_TRUE(loader.load(path)) << loader.getError();
  EXPECT_EQ(loader.getSequence().melody.size(), 3u);
  // 3 eighth notes = 1.5 beats -> 7 sixteenth cells, the last one silent.
  EXPECT_EQ(loader.getSequence().rhythm, (std::vector<int>{1, 1, 1, 1, 1, 1, 0}));
}

}  // namespace
}  // namespace musent
