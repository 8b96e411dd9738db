// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "utility/filepath.hpp"


std::string_view rdist::trim_filepath(std::string_view path) {
    const std::size_t last_slash = path.find_last_of("/\\");

    if (last_slash != std::string_view::npos && last_slash + 1 < path.size()) return path.substr(last_slash + 1);
    return path;
    // '__FILE__' carries the full build path, which is mostly noise in an error message
}
