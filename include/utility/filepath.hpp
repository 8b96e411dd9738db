// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Filepath string helpers, used to shorten source locations in diagnostics.
// _________________________________________________________________________________

#pragma once

#include <string_view>


namespace rdist {

std::string_view trim_filepath(std::string_view path);

} // namespace rdist
