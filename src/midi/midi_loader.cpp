/// @file
/// @brief Melody / rhythm extraction from parsed MIDI tracks.

#include "midi/midi_loader.h"

#include <algorithm>

namespace musent {

int selectMelodyTrack(const ParsedMidi& midi) {
  int best_index = 0;
  size_t best_count = 0;
  for (size_t idx = 0; idx < midi.tracks.size(); ++idx) {
    size_t count = midi.tracks[idx].noteOnCount();
    if (count > best_count) {
      best_count = count;
      best_index = static_cast<int>(idx);
    }
  }
  return best_index;
}

std::vector<int> intervalsToRhythm(const std::vector<BeatInterval>& intervals,
                                   double total_beats, double time_unit) {
  int num_steps = std::max(1, static_cast<int>(total_beats / time_unit + 1.0));
  std::vector<int> rhythm(static_cast<size_t>(num_steps), 0);

  for (const auto& interval : intervals) {
    int start_idx = std::max(0, static_cast<int>(interval.start / time_unit));
    // 0.9999 rounds a fractional end cell up without spilling over an exact one.
    int end_idx = std::max(start_idx + 1, static_cast<int>(interval.end / time_unit + 0.9999));
    for (int idx = start_idx; idx < std::min(end_idx, num_steps); ++idx) {
      rhythm[static_cast<size_t>(idx)] = 1;
    }
  }
  return rhythm;
}

bool MidiLoader::load(const std::string& path, double time_unit, int track_index) {
  sequence_ = MidiSequence{};
  error_.clear();

  MidiReader reader;
  if (!reader.read(path)) {
    error_ = reader.getError();
    return false;
  }
  return extract(reader.getParsedMidi(), time_unit, track_index);
}

bool MidiLoader::extract(const ParsedMidi& midi, double time_unit, int track_index) {
  sequence_ = MidiSequence{};
  error_.clear();

  if (time_unit <= 0.0) {
    error_ = "time_unit must be positive.";
    return false;
  }

  int idx = track_index < 0 ? selectMelodyTrack(midi) : track_index;
  if (idx < 0 || static_cast<size_t>(idx) >= midi.tracks.size()) {
    error_ = "track_index " + std::to_string(idx) + " out of bounds for MIDI with " +
             std::to_string(midi.tracks.size()) + " tracks.";
    return false;
  }

  const ParsedTrack& track = midi.tracks[static_cast<size_t>(idx)];
  const double ticks_per_beat = static_cast<double>(midi.division);

  for (uint8_t pitch : track.onset_pitches) {
    sequence_.melody.push_back(static_cast<int>(pitch));
  }

  std::vector<BeatInterval> intervals;
  intervals.reserve(track.notes.size());
  double total_beats = 0.0;
  for (const auto& note : track.notes) {
    BeatInterval interval;
    interval.start = static_cast<double>(note.start_tick) / ticks_per_beat;
    interval.end = static_cast<double>(note.end_tick) / ticks_per_beat;
    total_beats = std::max(total_beats, interval.end);
    intervals.push_back(interval);
  }

  sequence_.rhythm = intervalsToRhythm(intervals, total_beats, time_unit);
  sequence_.track_index = idx;
  return true;
}

}  // namespace musent
