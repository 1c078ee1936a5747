#pragma once
/** @file  WireFormat.hpp
 *  @brief Field splitting and strict number parsing shared by the line protocols.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace susres {
  namespace protocols {

    /// Splits \p line on runs of spaces; a trailing "\r\n" is ignored.
    inline std::vector<std::string> splitFields(std::string_view line) {
      while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
        line.remove_suffix(1);

      std::vector<std::string> fields;
      std::size_t pos = 0;
      while (pos < line.size()) {
        while (pos < line.size() && line[pos] == ' ')
          ++pos;
        std::size_t end = line.find(' ', pos);
        if (end == std::string_view::npos)
          end = line.size();
        if (end > pos)
          fields.emplace_back(line.substr(pos, end - pos));
        pos = end;
      }
      return fields;
    }

    /// Whole-field unsigned decimal parse; rejects signs, blanks and trailing junk.
    inline std::optional<std::uint64_t> parseUnsigned(std::string_view field) {
      std::uint64_t value = 0;
      const char* first = field.data();
      const char* last = field.data() + field.size();
      auto [ptr, ec] = std::from_chars(first, last, value);
      if (field.empty() || ec != std::errc{} || ptr != last)
        return std::nullopt;
      return value;
    }

  } // namespace protocols
} // namespace susres
