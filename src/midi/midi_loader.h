// MIDI loader -- extracts a melodic pitch sequence and a binary rhythm grid
// from one track of a Standard MIDI File.

#ifndef MUSENT_MIDI_MIDI_LOADER_H
#define MUSENT_MIDI_MIDI_LOADER_H

#include <string>
#include <vector>

#include "midi/midi_reader.h"

namespace musent {

/// Default rhythm grid resolution in beats (a sixteenth note).
constexpr double kDefaultTimeUnit = 0.25;

/// Melody and rhythm extracted from a MIDI file.
struct MidiSequence {
  std::vector<int> melody;  ///< MIDI pitches in note-on order.
  std::vector<int> rhythm;  ///< 1 where any note sounds in the grid cell.
  int track_index = -1;     ///< Track the sequences were taken from.
};

/// A note's extent in beats.
struct BeatInterval {
  double start = 0.0;
  double end = 0.0;
};

/// @brief Choose the track with the most note-on events.
/// @param midi Parsed file.
/// @return Index of the busiest track (first one on ties), 0 if no tracks.
int selectMelodyTrack(const ParsedMidi& midi);

/// @brief Rasterize note intervals onto a binary activation grid.
///
/// The grid has max(1, int(total_beats / time_unit + 1)) cells.  A note
/// covering [start, end) beats activates cells int(start / time_unit) up
/// to (exclusive) max(first + 1, ceil-ish(end / time_unit)), clipped to the
/// grid.
///
/// @param intervals Note extents in beats.
/// @param total_beats Length of the piece in beats.
/// @param time_unit Grid resolution in beats (> 0).
/// @return Activation grid.
std::vector<int> intervalsToRhythm(const std::vector<BeatInterval>& intervals,
                                   double total_beats, double time_unit);

/// @brief Loader producing MidiSequence from a file or parsed data.
class MidiLoader {
 public:
  MidiLoader() = default;

  /// @brief Load a MIDI file.
  /// @param path File path.
  /// @param time_unit Grid resolution in beats (> 0).
  /// @param track_index Track to use, or -1 to pick the busiest track.
  /// @return True on success. On failure, call getError() for details.
  bool load(const std::string& path, double time_unit = kDefaultTimeUnit,
            int track_index = -1);

  /// @brief Extract sequences from already-parsed MIDI data.
  bool extract(const ParsedMidi& midi, double time_unit = kDefaultTimeUnit,
               int track_index = -1);

  const MidiSequence& getSequence() const { return sequence_; }
  const std::string& getError() const { return error_; }

 private:
  MidiSequence sequence_;
  std::string error_;
};

}  // namespace musent

#endif  // MUSENT_MIDI_MIDI_LOADER_H
