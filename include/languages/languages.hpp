#pragma once

#include "programming.hpp"
#include "spoken.hpp"

#include <optional>
#include <string>

namespace workshop {

// "Any" when no language is selected.
std::string spoken_name(std::optional<spoken::Code> code);
std::string programming_name(std::optional<programming::Code> code);

} // namespace workshop
