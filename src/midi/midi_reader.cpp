/// @file
/// @brief SMF Type 0/1/2 MIDI file reader implementation.

#include "midi/midi_reader.h"

#include <algorithm>
#include <cstdio>
#include <cstring>

namespace musent {

namespace {

constexpr size_t kHeaderChunkSize = 14;  // "MThd" + length + 6 data bytes
constexpr int kMaxVlqBytes = 4;

uint16_t readBE16(const uint8_t* data, size_t offset) {
  return static_cast<uint16_t>((static_cast<uint16_t>(data[offset]) << 8) |
                               static_cast<uint16_t>(data[offset + 1]));
}

uint32_t readBE32(const uint8_t* data, size_t offset) {
  return (static_cast<uint32_t>(data[offset]) << 24) |
         (static_cast<uint32_t>(data[offset + 1]) << 16) |
         (static_cast<uint32_t>(data[offset + 2]) << 8) |
          static_cast<uint32_t>(data[offset + 3]);
}

/// @brief Decode a variable-length quantity; offset is advanced past it.
uint32_t readVariableLength(const uint8_t* data, size_t& offset, size_t max_size) {
  uint32_t result = 0;
  for (int bytes_read = 0; offset < max_size && bytes_read < kMaxVlqBytes; ++bytes_read) {
    uint8_t byte = data[offset++];
    result = (result << 7) | static_cast<uint32_t>(byte & 0x7F);
    if ((byte & 0x80) == 0) break;
  }
  return result;
}

/// Note-on awaiting its note-off, per (channel, pitch).
struct PendingNote {
  bool active = false;
  uint32_t start_tick = 0;
  uint8_t velocity = 0;
};

}  // namespace

bool MidiReader::read(const std::string& path) {
  FILE* file = std::fopen(path.c_str(), "rb");
  if (!file) {
    error_ = "MIDI file not found: " + path;
    return false;
  }

  std::fseek(file, 0, SEEK_END);
  long file_size = std::ftell(file);
  std::fseek(file, 0, SEEK_SET);

  if (file_size <= 0) {
    std::fclose(file);
    error_ = "File is empty or unreadable: " + path;
    return false;
  }

  std::vector<uint8_t> data(static_cast<size_t>(file_size));
  size_t bytes_read = std::fread(data.data(), 1, data.size(), file);
  std::fclose(file);

  if (bytes_read != data.size()) {
    error_ = "Failed to read complete file: " + path;
    return false;
  }

  return read(data);
}

bool MidiReader::read(const std::vector<uint8_t>& data) {
  midi_ = ParsedMidi{};
  error_.clear();

  if (data.size() < kHeaderChunkSize) {
    error_ = "Data too small to be a valid MIDI file";
    return false;
  }

  if (!parseHeader(data.data(), data.size())) {
    return false;
  }

  // Tracks follow the header chunk, whose declared length may exceed 6.
  size_t offset = 8 + readBE32(data.data(), 4);
  for (uint16_t idx = 0; idx < midi_.num_tracks; ++idx) {
    if (!parseTrack(data.data(), data.size(), offset)) {
      return false;
    }
  }

  return true;
}

bool MidiReader::parseHeader(const uint8_t* data, size_t size) {
  if (std::memcmp(data, "MThd", 4) != 0) {
    error_ = "Invalid MIDI file: missing MThd header";
    return false;
  }

  uint32_t header_len = readBE32(data, 4);
  if (header_len < 6 || size < 8 + static_cast<size_t>(header_len)) {
    error_ = "Invalid MIDI header length";
    return false;
  }

  midi_.format = readBE16(data, 8);
  midi_.num_tracks = readBE16(data, 10);
  midi_.division = readBE16(data, 12);

  if (midi_.format > 2) {
    error_ = "Unsupported MIDI format: " + std::to_string(midi_.format);
    return false;
  }
  if ((midi_.division & 0x8000) != 0 || midi_.division == 0) {
    error_ = "Unsupported MIDI time division (SMPTE or zero)";
    return false;
  }

  return true;
}

bool MidiReader::parseTrack(const uint8_t* data, size_t size, size_t& offset) {
  if (offset + 8 > size) {
    error_ = "Unexpected end of data before track chunk";
    return false;
  }

  if (std::memcmp(data + offset, "MTrk", 4) != 0) {
    error_ = "Invalid track chunk: missing MTrk header";
    return false;
  }

  uint32_t track_len = readBE32(data, offset + 4);
  offset += 8;

  if (offset + track_len > size) {
    error_ = "Track chunk exceeds file size";
    return false;
  }

  const size_t track_end = offset + track_len;
  ParsedTrack parsed_track;
  bool channel_seen = false;

  uint8_t running_status = 0;
  uint32_t abs_tick = 0;

  // Indexed by channel * 128 + pitch.
  std::vector<PendingNote> pending(16 * 128);

  auto closeNote = [&](uint8_t channel, uint8_t pitch, uint32_t tick) {
    PendingNote& slot = pending[channel * 128u + pitch];
    if (!slot.active) return;
    MidiNote note;
    note.start_tick = slot.start_tick;
    note.end_tick = tick;
    note.pitch = pitch;
    note.velocity = slot.velocity;
    note.channel = channel;
    parsed_track.notes.push_back(note);
    slot.active = false;
  };

  while (offset < track_end) {
    abs_tick += readVariableLength(data, offset, track_end);
    if (offset >= track_end) break;

    uint8_t byte = data[offset];

    // Meta event
    if (byte == 0xFF) {
      ++offset;
      if (offset >= track_end) break;

      uint8_t meta_type = data[offset++];
      if (offset >= track_end) break;

      uint32_t meta_len = readVariableLength(data, offset, track_end);
      if (offset + meta_len > track_end) break;

      if (meta_type == 0x03 && meta_len > 0) {
        parsed_track.name.assign(reinterpret_cast<const char*>(data + offset), meta_len);
      } else if (meta_type == 0x51 && meta_len == 3) {
        uint32_t usec_per_beat = (static_cast<uint32_t>(data[offset]) << 16) |
                                 (static_cast<uint32_t>(data[offset + 1]) << 8) |
                                  static_cast<uint32_t>(data[offset + 2]);
        if (usec_per_beat > 0) {
          midi_.bpm = static_cast<uint16_t>(kMicrosecondsPerMinute / usec_per_beat);
        }
      } else if (meta_type == 0x2F) {
        offset += meta_len;
        break;
      }

      offset += meta_len;
      continue;
    }

    // SysEx event
    if (byte == 0xF0 || byte == 0xF7) {
      ++offset;
      uint32_t sysex_len = readVariableLength(data, offset, track_end);
      offset += sysex_len;
      continue;
    }

    uint8_t status;
    if (byte & 0x80) {
      status = byte;
      running_status = status;
      ++offset;
    } else if (running_status != 0) {
      status = running_status;
    } else {
      error_ = "Data byte without running status";
      return false;
    }

    uint8_t msg_type = status & 0xF0;
    uint8_t channel = status & 0x0F;

    if (msg_type == 0x90 || msg_type == 0x80) {
      if (offset + 1 >= track_end) break;
      uint8_t pitch = data[offset++] & 0x7F;
      uint8_t velocity = data[offset++] & 0x7F;

      // Note On with velocity 0 is a Note Off.
      if (msg_type == 0x90 && velocity > 0) {
        // Re-triggered pitch: the sounding note ends here.
        closeNote(channel, pitch, abs_tick);
        PendingNote& slot = pending[channel * 128u + pitch];
        slot.active = true;
        slot.start_tick = abs_tick;
        slot.velocity = velocity;
        parsed_track.onset_pitches.push_back(pitch);
        if (!channel_seen) {
          parsed_track.channel = channel;
          channel_seen = true;
        }
      } else {
        closeNote(channel, pitch, abs_tick);
      }
    } else if (msg_type == 0xC0 || msg_type == 0xD0) {
      if (offset >= track_end) break;
      uint8_t data1 = data[offset++] & 0x7F;
      if (msg_type == 0xC0) {
        parsed_track.program = data1;
      }
    } else {
      // Control Change, Pitch Bend, Key Pressure: 2 data bytes.
      if (offset + 1 >= track_end) break;
      offset += 2;
    }
  }

  parsed_track.end_tick = abs_tick;

  // Notes still sounding at the end of the track end with it.
  for (uint8_t channel = 0; channel < 16; ++channel) {
    for (uint8_t pitch = 0; pitch < 128; ++pitch) {
      closeNote(channel, pitch, abs_tick);
    }
  }

  offset = track_end;

  std::stable_sort(parsed_track.notes.begin(), parsed_track.notes.end(),
                   [](const MidiNote& lhs, const MidiNote& rhs) {
                     return lhs.start_tick < rhs.start_tick;
                   });

  midi_.tracks.push_back(std::move(parsed_track));
  return true;
}

}  // namespace musent
