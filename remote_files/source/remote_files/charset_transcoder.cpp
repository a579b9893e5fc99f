#include <remote_files/charset_transcoder.hpp>
#include <utility/algorithm/case_convert.hpp>

#include <iconv.h>

#include <algorithm>
#include <cerrno>
#include <functional>
#include <memory>
#include <stdexcept>

namespace RemoteFiles
{
    namespace
    {
        constexpr std::string_view replacementCharacterUtf8 = "\xEF\xBF\xBD";
        const iconv_t invalidDescriptor = reinterpret_cast<iconv_t>(-1);

        struct IconvCloser
        {
            void operator()(void* descriptor) const
            {
                iconv_close(static_cast<iconv_t>(descriptor));
            }
        };
        using IconvHandle = std::unique_ptr<void, IconvCloser>;

        IconvHandle openConverter(std::string const& from, std::string const& to)
        {
            const auto descriptor = iconv_open(to.c_str(), from.c_str());
            if (descriptor == invalidDescriptor)
                return IconvHandle{nullptr};
            return IconvHandle{descriptor};
        }

        std::size_t utf8SequenceLength(unsigned char lead)
        {
            if (lead < 0x80)
                return 1;
            if ((lead & 0xE0) == 0xC0)
                return 2;
            if ((lead & 0xF0) == 0xE0)
                return 3;
            if ((lead & 0xF8) == 0xF0)
                return 4;
            return 1;
        }

        /**
         * @brief Runs iconv over the whole input. On an unconvertible sequence the replacement is emitted and
         * skipLength(remaining input) bytes are dropped.
         */
        std::string convert(
            std::string const& from,
            std::string const& to,
            std::string_view input,
            std::string_view replacement,
            std::function<std::size_t(std::string_view)> const& skipLength)
        {
            auto converter = openConverter(from, to);
            if (!converter)
                throw std::invalid_argument("Unsupported charset conversion: " + from + " -> " + to);

            const auto descriptor = static_cast<iconv_t>(converter.get());

            std::string inputCopy{input};
            char* inPointer = inputCopy.data();
            std::size_t inLeft = inputCopy.size();

            std::string output{};
            std::string chunk(std::max<std::size_t>(input.size() * 4, 64), '\0');

            while (inLeft > 0)
            {
                char* outPointer = chunk.data();
                std::size_t outLeft = chunk.size();

                const auto result = iconv(descriptor, &inPointer, &inLeft, &outPointer, &outLeft);
                const int error = errno;
                output.append(chunk.data(), chunk.size() - outLeft);

                if (result != static_cast<std::size_t>(-1) || error == E2BIG)
                    continue;

                // EILSEQ or EINVAL (truncated sequence at the end of the input):
                output.append(replacement);
                const auto skip = std::min(inLeft, std::max<std::size_t>(1, skipLength({inPointer, inLeft})));
                inPointer += skip;
                inLeft -= skip;
                iconv(descriptor, nullptr, nullptr, nullptr, nullptr);
            }

            // Flush shift state for stateful encodings.
            char* outPointer = chunk.data();
            std::size_t outLeft = chunk.size();
            iconv(descriptor, nullptr, nullptr, &outPointer, &outLeft);
            output.append(chunk.data(), chunk.size() - outLeft);

            return output;
        }

        std::string convertStrict(std::string const& from, std::string const& to, std::string_view input)
        {
            return convert(from, to, input, {}, [](std::string_view remaining) {
                return remaining.size();
            });
        }
    }

    std::string CharsetTranscoder::resolveCharsetName(std::string_view name)
    {
        const auto lowered = Utility::Algorithm::toLowerCase(std::string{name});
        if (lowered.empty() || lowered == "binary" || lowered == "latin1" || lowered == "latin-1")
            return "ISO-8859-1";
        if (lowered == "utf8" || lowered == "utf-8")
            return "UTF-8";
        if (lowered == "ascii")
            return "ASCII";
        return std::string{name};
    }

    CharsetTranscoder::CharsetTranscoder(CharsetOptions options)
        : wireCharset_{resolveCharsetName(options.wireCharset)}
        , hostCharset_{resolveCharsetName(options.hostCharset)}
        , hostReplacement_{}
        , hostQuestionMark_{}
        , wireQuestionMark_{}
    {
        if (!openConverter(wireCharset_, hostCharset_) || !openConverter(hostCharset_, wireCharset_))
            throw std::invalid_argument("Unsupported charset pair: " + wireCharset_ + " / " + hostCharset_);

        hostReplacement_ = convertStrict("UTF-8", hostCharset_, replacementCharacterUtf8);
        if (hostReplacement_.empty())
            hostReplacement_ = convertStrict("UTF-8", hostCharset_, "?");
        hostQuestionMark_ = convertStrict("UTF-8", hostCharset_, "?");
        wireQuestionMark_ = convertStrict("UTF-8", wireCharset_, "?");
    }

    std::string CharsetTranscoder::toWire(std::string_view hostName) const
    {
        const bool hostIsUtf8 = hostCharset_ == "UTF-8";
        return convert(hostCharset_, wireCharset_, hostName, wireQuestionMark_, [hostIsUtf8](std::string_view rest) {
            if (!hostIsUtf8)
                return std::size_t{1};
            return utf8SequenceLength(static_cast<unsigned char>(rest.front()));
        });
    }

    std::string CharsetTranscoder::toHost(std::string_view wireName) const
    {
        return convert(wireCharset_, hostCharset_, wireName, hostReplacement_, [](std::string_view) {
            return std::size_t{1};
        });
    }

    bool CharsetTranscoder::isSuspect(std::string_view wireName, std::string_view hostName) const
    {
        if (hostReplacement_ != hostQuestionMark_ && hostName.find(hostReplacement_) != std::string_view::npos)
            return true;

        const auto countOf = [](std::string_view haystack, std::string_view needle) {
            if (needle.empty())
                return std::size_t{0};
            std::size_t count = 0;
            for (auto pos = haystack.find(needle); pos != std::string_view::npos;
                 pos = haystack.find(needle, pos + needle.size()))
                ++count;
            return count;
        };
        return countOf(hostName, hostQuestionMark_) > countOf(wireName, wireQuestionMark_);
    }
}
