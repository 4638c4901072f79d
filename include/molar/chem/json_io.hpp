// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include "molar/chem/element_counts.hpp"
#include "molar/chem/formula_error.hpp"
#include "molar/chem/molecule.hpp"

#include <nlohmann/json.hpp>

#include <string_view>

namespace molar::chem
{

    using json = nlohmann::json;

    // {"formula": ..., "mass": ..., "elements": {"H": 2, ...}}
    void to_json(json &j, const molecule &m);

    // {"formula": ..., "error": {"kind": ..., "token": ..., "offset": n|null}}
    json error_to_json(std::string_view formula, const formula_error &e);

} // namespace molar::chem
