#include "cpjudge/language.hpp"
#include <boost/assign.hpp>
#include <unordered_map>
#include "cpjudge/common/exceptions.hpp"

namespace cpjudge {
using namespace std;

// clang-format off
static const unordered_map<language, language_traits> traits_table = boost::assign::map_list_of
    (language::cpp, language_traits{"cpp", ".cpp", "//", true})
    (language::py, language_traits{"py", ".py", "#", false});
// clang-format on

const language_traits &get_language_traits(language lang) {
    return traits_table.at(lang);
}

language language_from_extension(const string &extension) {
    for (auto &[lang, traits] : traits_table)
        if (extension == traits.extension)
            return lang;
    throw unsupported_language_error(extension);
}

}  // namespace cpjudge
