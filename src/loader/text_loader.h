// Text loader -- reads melody and rhythm token sequences from JSON or CSV
// piece files.

#ifndef MUSENT_LOADER_TEXT_LOADER_H
#define MUSENT_LOADER_TEXT_LOADER_H

#include <string>
#include <vector>

namespace musent {

/// Raw tokens of one piece, before standardization (see core/encoding.h).
struct TextSequence {
  std::vector<std::string> melody;
  std::vector<std::string> rhythm;
};

/// @brief Split a sequence cell into tokens on commas and whitespace.
/// @param cell Cell text, e.g. "C4 D4,E4".
/// @return Non-empty tokens in order.
std::vector<std::string> splitSequenceTokens(const std::string& cell);

/// @brief Split CSV text into rows of fields.
///
/// Fields may be quoted with '"'; a doubled quote inside a quoted field is a
/// literal quote, and quoted fields may span lines. Blank lines are dropped.
///
/// @param text Entire CSV document.
/// @return Rows of fields, header row first.
std::vector<std::vector<std::string>> parseCsvRows(const std::string& text);

/// @brief Loader for JSON and CSV piece files.
///
/// JSON layout:
/// @code
///   {"melody": ["C4", "D4", 64], "rhythm": [1, 1, 0]}
/// @endcode
///
/// CSV layouts (first row is the header):
/// @code
///   melody,rhythm          type,sequence
///   C4 D4 E4,"1 1 0"       melody,"C4,D4,E4"
///                          rhythm,"1,1,0"
/// @endcode
/// Any other CSV with two or more columns is read as melody in the first
/// column and rhythm in the second.
class TextLoader {
 public:
  TextLoader() = default;

  /// @brief Load a piece file, choosing the format from its extension.
  /// @param path Path to a .json or .csv file.
  /// @return True on success. On failure, call getError() for details.
  bool load(const std::string& path);

  /// @brief Parse JSON text directly.
  bool loadJson(const std::string& text);

  /// @brief Parse CSV text directly.
  bool loadCsv(const std::string& text);

  /// @brief Get the loaded tokens (valid after a successful load).
  const TextSequence& getSequence() const { return sequence_; }

  /// @brief Get the error message from the last failed load.
  const std::string& getError() const { return error_; }

 private:
  TextSequence sequence_;
  std::string error_;

  bool fail(const std::string& message);
};

/// @brief Read an entire file into a string.
/// @param path File path.
/// @param contents Output buffer.
/// @return False if the file cannot be opened or read.
bool readFileToString(const std::string& path, std::string& contents);

}  // namespace musent

#endif  // MUSENT_LOADER_TEXT_LOADER_H
