#include "ReflowOptions.hpp"

#include <stdexcept>

#include <boost/nowide/convert.hpp>

#include "ReflowCommon.hpp"

namespace cjkreflow {
    CustomTitlePattern::CustomTitlePattern(const std::string &utf8Pattern)
        : source_(utf8Pattern),
          regex_(std::make_shared<const boost::wregex>(boost::nowide::widen(utf8Pattern),
                                                      boost::regex::ECMAScript)) {
    }

    bool CustomTitlePattern::Matches(const std::u32string_view bare) const {
        if (!regex_ || bare.empty())
            return false;

        const std::wstring wide = boost::nowide::widen(detail::U32ToUtf8(bare));
        try {
            return boost::regex_search(wide, *regex_);
        } catch (const std::runtime_error &) {
            // Backtracking limit hit on a pathological pattern: no match for this line.
            return false;
        }
    }

    PatternResult CompileCustomTitlePattern(const std::string &utf8Pattern) {
        PatternResult result;

        const std::u32string bare = detail::Utf8ToU32(utf8Pattern);
        if (text::IsWhitespaceOnly(bare)) {
            result.success = true;
            return result;
        }

        try {
            result.pattern.emplace(utf8Pattern);
            result.success = true;
        } catch (const boost::regex_error &ex) {
            result.success = false;
            result.message = std::string("Invalid title heading regex: ") + ex.what();
        }

        return result;
    }
} // namespace cjkreflow
