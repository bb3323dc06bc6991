/// @file core.cpp
#include "core.hpp"

namespace mms::core {

std::string_view version() noexcept {
    return "0.1.0";
}

}  // namespace mms::core
