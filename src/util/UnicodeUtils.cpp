#include "util/UnicodeUtils.hpp"
#include <memory>
#include <mutex>
#include <sstream>
#include <unicode/unistr.h>
#include <unicode/translit.h>

namespace listui::util {

namespace {

// createInstance parses the rule set each time, so one instance is shared.
std::mutex translit_mutex;

icu::Transliterator* search_transliterator() {
    static std::unique_ptr<icu::Transliterator> trans = [] {
        UErrorCode status = U_ZERO_ERROR;
        std::unique_ptr<icu::Transliterator> t(icu::Transliterator::createInstance(
            "NFD; [:Nonspacing Mark:] Remove; NFC; Latin-ASCII", UTRANS_FORWARD, status));
        if (U_FAILURE(status)) t.reset();
        return t;
    }();
    return trans.get();
}

}  // namespace

std::string normalize_for_search(const std::string& text) {
    if (text.empty()) {
        return text;
    }

    icu::UnicodeString unicode_text = icu::UnicodeString::fromUTF8(text);

    {
        std::lock_guard<std::mutex> lock(translit_mutex);
        if (auto* trans = search_transliterator()) {
            trans->transliterate(unicode_text);
        }
    }

    std::string result;
    unicode_text.toLower().toUTF8String(result);
    return result;
}

bool matches_search(const std::string& text, const std::string& query) {
    if (query.empty()) return true;

    const std::string haystack = normalize_for_search(text);
    std::istringstream words(normalize_for_search(query));
    std::string word;
    while (words >> word) {
        if (haystack.find(word) == std::string::npos) return false;
    }
    return true;
}

int case_insensitive_compare(const std::string& a, const std::string& b) {
    icu::UnicodeString ua = icu::UnicodeString::fromUTF8(a);
    icu::UnicodeString ub = icu::UnicodeString::fromUTF8(b);

    ua.foldCase();
    ub.foldCase();

    return ua.compare(ub);
}

}  // namespace listui::util
