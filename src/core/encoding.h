// Symbol encoding -- note-name parsing and standardization of raw melody
// and rhythm tokens into analysis-ready sequences.

#ifndef MUSENT_CORE_ENCODING_H
#define MUSENT_CORE_ENCODING_H

#include <optional>
#include <string>
#include <vector>

#include "core/symbol.h"

namespace musent {

/// Semitone offset from C for the natural note letters A-G.
constexpr int kLetterSemitones[7] = {9, 11, 0, 2, 4, 5, 7};  // A B C D E F G

/// @brief Parse a whole token as a base-10 integer.
///
/// Accepts an optional sign followed by digits; surrounding whitespace is
/// ignored.
///
/// @param token Raw token, e.g. "61" or " -3 ".
/// @return The value, or std::nullopt if the token is not an integer or does
///         not fit in an int.
std::optional<int> parseInteger(const std::string& token);

/// @brief Parse a scientific pitch name into a MIDI note number.
///
/// Accepts a letter A-G (either case), an optional '#' or 'b', and a signed
/// octave number, e.g. "C4" (60), "F#3" (54), "Db5" (73), "C-1" (0).
/// Surrounding whitespace is ignored.
///
/// @param name Note name.
/// @return MIDI note number, or std::nullopt if the name is malformed.
std::optional<int> noteNameToMidi(const std::string& name);

/// @brief Standardize raw melody tokens.
///
/// Integer tokens ("61") become Integer symbols, valid note names ("C4")
/// become Integer symbols holding the MIDI number, anything else is kept as
/// a Text symbol.
///
/// @param tokens Raw melody tokens in order.
/// @return One symbol per token, same order.
std::vector<Symbol> standardizeMelody(const std::vector<std::string>& tokens);

/// @brief Standardize melody symbols; Text symbols are re-parsed as above.
std::vector<Symbol> standardizeMelody(const std::vector<Symbol>& symbols);

/// @brief Force rhythm tokens onto {0,1}.
///
/// Each token is read as a number and truncated toward zero; positive
/// values map to 1, everything else (including unparsable tokens) to 0.
///
/// @param tokens Raw rhythm tokens in order.
/// @return Binary activation sequence, same length.
std::vector<int> standardizeRhythm(const std::vector<std::string>& tokens);

/// @brief Force numeric rhythm values onto {0,1}.
std::vector<int> standardizeRhythm(const std::vector<int>& values);

/// Standardized melody and rhythm of one piece.
struct EncodedSequences {
  std::vector<Symbol> melody;
  std::vector<int> rhythm;
};

/// @brief Standardize both sequences of a piece.
EncodedSequences encodeSequences(const std::vector<std::string>& melody_tokens,
                                 const std::vector<std::string>& rhythm_tokens);

}  // namespace musent

#endif  // MUSENT_CORE_ENCODING_H
