// SPDX-License-Identifier: AGPL-3.0-or-later
#include "molar/chem/mass_table_loader.hpp"

#include "molar/chem/token.hpp"

#include <cmath>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace molar::chem
{

    namespace detail
    {
        static inline std::string trim(std::string s)
        {
            const char *ws = " \t\n\r\f\v";
            s.erase(0, s.find_first_not_of(ws));
            s.erase(s.find_last_not_of(ws) + 1);
            return s;
        }

        static inline std::vector<std::string> parse_csv_line(const std::string &line)
        {
            std::vector<std::string> fields;
            std::string field;
            bool in_quotes = false;
            for (std::size_t i = 0; i < line.size(); ++i)
            {
                char c = line[i];
                if (c == '"')
                {
                    if (in_quotes && i + 1 < line.size() && line[i + 1] == '"')
                    {
                        // Escaped quote inside a quoted field
                        field.push_back('"');
                        ++i;
                    }
                    else
                    {
                        in_quotes = !in_quotes;
                    }
                }
                else if (c == ',' && !in_quotes)
                {
                    fields.emplace_back(std::move(field));
                    field.clear();
                }
                else
                {
                    field.push_back(c);
                }
            }
            fields.emplace_back(std::move(field));
            for (auto &f : fields)
                f = trim(std::move(f));
            return fields;
        }

        static double parse_mass(const std::string &text, const std::string &where)
        {
            std::size_t used = 0;
            double value = 0.0;
            try
            {
                value = std::stod(text, &used);
            }
            catch (const std::invalid_argument &)
            {
                throw std::runtime_error(where + ": atomic mass is not a number: '" + text + "'");
            }
            catch (const std::out_of_range &)
            {
                throw std::runtime_error(where + ": atomic mass out of range: '" + text + "'");
            }
            if (used != text.size())
                throw std::runtime_error(where + ": atomic mass is not a number: '" + text + "'");
            return value;
        }

        static void add_entry(atomic_mass_table::map_type &masses, const std::string &symbol, double mass, const std::string &where)
        {
            if (!is_symbol_text(symbol))
                throw std::runtime_error(where + ": not an element symbol: '" + symbol + "'");
            if (!std::isfinite(mass) || mass <= 0.0)
                throw std::runtime_error(where + ": atomic mass of " + symbol + " must be positive");
            if (!masses.emplace(symbol, mass).second)
                throw std::runtime_error(where + ": duplicate symbol " + symbol);
        }

        static std::size_t find_column(const std::vector<std::string> &header, const char *name, const std::string &source)
        {
            for (std::size_t i = 0; i < header.size(); ++i)
            {
                if (header[i] == name)
                    return i;
            }
            throw std::runtime_error(source + ": missing column '" + name + "'");
        }
    }

    atomic_mass_table parse_atomic_masses_csv(std::string_view csv, const std::string &source_name)
    {
        std::istringstream ss{std::string(csv)};
        std::string line;
        atomic_mass_table::map_type masses;

        // Header
        std::size_t line_no = 0;
        while (std::getline(ss, line))
        {
            ++line_no;
            if (!detail::trim(line).empty())
                break;
        }
        if (detail::trim(line).empty())
            throw std::runtime_error(source_name + ": no header row");

        const auto header = detail::parse_csv_line(line);
        const std::size_t symbol_col = detail::find_column(header, "symbol", source_name);
        const std::size_t mass_col = detail::find_column(header, "atomic_mass_u", source_name);

        while (std::getline(ss, line))
        {
            ++line_no;
            if (detail::trim(line).empty())
                continue;
            const std::string where = source_name + ":" + std::to_string(line_no);
            auto cols = detail::parse_csv_line(line);
            if (symbol_col >= cols.size() || mass_col >= cols.size())
                throw std::runtime_error(where + ": expected " + std::to_string(header.size()) + " columns");

            detail::add_entry(masses, cols[symbol_col], detail::parse_mass(cols[mass_col], where), where);
        }

        return atomic_mass_table{std::move(masses)};
    }

    atomic_mass_table load_atomic_masses_from_csv(const std::string &csv_path)
    {
        std::ifstream file(csv_path);
        if (!file.is_open())
            throw std::runtime_error("Failed to open atomic mass table: " + csv_path);

        std::string csv;
        csv.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
        return parse_atomic_masses_csv(csv, csv_path);
    }

    atomic_mass_table load_atomic_masses_from_json(const std::string &json_path)
    {
        using json = nlohmann::json;

        std::ifstream f(json_path);
        if (!f)
            throw std::runtime_error("Failed to open atomic mass table: " + json_path);

        json arr;
        try
        {
            f >> arr;
        }
        catch (const json::parse_error &e)
        {
            throw std::runtime_error(json_path + ": " + e.what());
        }
        if (!arr.is_array())
            throw std::runtime_error(json_path + ": expected a JSON array of elements");

        atomic_mass_table::map_type masses;
        std::size_t index = 0;
        for (const auto &e : arr)
        {
            const std::string where = json_path + "[" + std::to_string(index++) + "]";
            if (!e.is_object())
                throw std::runtime_error(where + ": expected an object");

            std::string sym;
            auto symIt = e.find("Symbol");
            if (symIt != e.end() && symIt->is_string())
                sym = detail::trim(symIt->get<std::string>());

            auto massIt = e.find("AtomicMass");
            if (massIt == e.end())
                throw std::runtime_error(where + ": missing AtomicMass");

            double mass = 0.0;
            if (massIt->is_number())
                mass = massIt->get<double>();
            else if (massIt->is_string())
                mass = detail::parse_mass(detail::trim(massIt->get<std::string>()), where);
            else
                throw std::runtime_error(where + ": AtomicMass must be a number");

            detail::add_entry(masses, sym, mass, where);
        }

        return atomic_mass_table{std::move(masses)};
    }

    atomic_mass_table load_atomic_mass_table(const std::string &path)
    {
        if (std::filesystem::path(path).extension() == ".json")
            return load_atomic_masses_from_json(path);
        return load_atomic_masses_from_csv(path);
    }

} // namespace molar::chem
