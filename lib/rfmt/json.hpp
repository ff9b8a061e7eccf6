#pragma once
#include <string>

#include "rmanifest.hpp"
#include "wad.hpp"

namespace rfmt {
    extern auto to_json(RMAN const& manifest) -> std::string;

    extern auto to_json(WAD const& wad) -> std::string;
}
