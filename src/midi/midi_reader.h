// Standard MIDI File reader. Parses SMF format 0/1/2 files into per-track
// note lists for melody and rhythm extraction.

#ifndef MUSENT_MIDI_MIDI_READER_H
#define MUSENT_MIDI_MIDI_READER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace musent {

/// Microseconds per minute constant for MIDI tempo meta-events.
constexpr uint32_t kMicrosecondsPerMinute = 60000000;

/// A sounding note recovered from a note-on / note-off pair.
struct MidiNote {
  uint32_t start_tick = 0;
  uint32_t end_tick = 0;
  uint8_t pitch = 0;
  uint8_t velocity = 0;
  uint8_t channel = 0;
};

/// A single parsed MIDI track.
struct ParsedTrack {
  std::string name;
  uint8_t channel = 0;
  uint8_t program = 0;
  std::vector<MidiNote> notes;         ///< Sorted by start_tick (stable).
  std::vector<uint8_t> onset_pitches;  ///< Pitches in note-on order.
  uint32_t end_tick = 0;               ///< Absolute tick of the last event.

  /// @brief Number of note-on events with non-zero velocity.
  size_t noteOnCount() const { return onset_pitches.size(); }
};

/// Complete parsed representation of a Standard MIDI File.
struct ParsedMidi {
  uint16_t format = 0;
  uint16_t num_tracks = 0;
  uint16_t division = 480;  ///< Ticks per quarter note.
  uint16_t bpm = 120;
  std::vector<ParsedTrack> tracks;
};

/// @brief MIDI file reader that parses SMF files into ParsedMidi.
///
/// Handles note on/off pairing per channel, running status, tempo and track
/// name meta-events, and skips SysEx data.
class MidiReader {
 public:
  MidiReader() = default;

  /// @brief Read and parse a MIDI file from disk.
  /// @param path File path to read.
  /// @return True on success. On failure, call getError() for details.
  bool read(const std::string& path);

  /// @brief Read and parse MIDI data from a byte buffer.
  /// @param data Raw MIDI file bytes.
  /// @return True on success. On failure, call getError() for details.
  bool read(const std::vector<uint8_t>& data);

  /// @brief Get the parsed MIDI data (valid after a successful read).
  const ParsedMidi& getParsedMidi() const { return midi_; }

  /// @brief Get the error message from the last failed read().
  const std::string& getError() const { return error_; }

 private:
  ParsedMidi midi_;
  std::string error_;

  /// Parse the MThd header chunk.
  bool parseHeader(const uint8_t* data, size_t size);

  /// Parse a single MTrk chunk starting at offset.
  bool parseTrack(const uint8_t* data, size_t size, size_t& offset);
};

}  // namespace musent

#endif  // MUSENT_MIDI_MIDI_READER_H
