#pragma once

#include <string>
#include <string_view>

namespace RemoteFiles
{
    struct CharsetOptions
    {
        // Charset the remote uses for names. "binary" is the raw single byte representation (ISO-8859-1).
        std::string wireCharset{"binary"};
        // Charset names are presented in to callers.
        std::string hostCharset{"UTF-8"};
    };

    /**
     * @brief Converts file names between the wire charset and the host charset using iconv.
     * Conversions never fail: undecodable bytes become U+FFFD, unencodable characters become '?'.
     */
    class CharsetTranscoder
    {
      public:
        /**
         * @throws std::invalid_argument if iconv does not support one of the charsets.
         */
        explicit CharsetTranscoder(CharsetOptions options = {});

        std::string toWire(std::string_view hostName) const;
        std::string toHost(std::string_view wireName) const;

        /**
         * @brief A name is suspect if its host form carries a replacement character, or more '?' than its wire
         * form had.
         */
        bool isSuspect(std::string_view wireName, std::string_view hostName) const;

        std::string const& wireCharset() const
        {
            return wireCharset_;
        }
        std::string const& hostCharset() const
        {
            return hostCharset_;
        }

        /**
         * @brief Maps aliases like "binary", "latin1" or "utf8" to names iconv understands.
         */
        static std::string resolveCharsetName(std::string_view name);

      private:
        std::string wireCharset_;
        std::string hostCharset_;
        // U+FFFD in the host charset, '?' if the host charset cannot represent it.
        std::string hostReplacement_;
        std::string hostQuestionMark_;
        std::string wireQuestionMark_;
    };
}
