// SPDX-License-Identifier: AGPL-3.0-or-later
#include "molar/chem/json_io.hpp"

#include <string>

namespace molar::chem
{

    void to_json(json &j, const molecule &m)
    {
        json elements = json::object();
        for (const auto &c : m.composition)
            elements[c.symbol] = c.count;

        j = json{{"formula", m.formula}, {"mass", m.mass_u}, {"elements", elements}};
    }

    json error_to_json(std::string_view formula, const formula_error &e)
    {
        json err{{"kind", to_string(e.kind())}, {"token", e.token_text()}};
        if (e.offset() == formula_error::npos)
            err["offset"] = nullptr;
        else
            err["offset"] = e.offset();
        return json{{"formula", std::string(formula)}, {"error", err}};
    }

} // namespace molar::chem
