// SPDX-License-Identifier: AGPL-3.0-or-later
#include <cstring>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "molar/chem/atomic_mass_table.hpp"
#include "molar/chem/formula_error.hpp"
#include "molar/chem/json_io.hpp"
#include "molar/chem/mass_table_loader.hpp"
#include "molar/chem/molecule.hpp"
#include "molar/chem/validator.hpp"

namespace
{
    void print_usage(const char *argv0)
    {
        std::cerr << "Usage: " << argv0 << " [--table PATH] [--json] [FORMULA...]\n"
                  << "  --table PATH  atomic masses from a .csv (symbol,atomic_mass_u) or .json file\n"
                  << "  --json        one JSON object per formula\n"
                  << "Without formulas, reads one formula per line from stdin.\n";
    }

    // Returns false if the formula could not be evaluated.
    bool report(const std::string &formula, const molar::chem::atomic_mass_table &table, bool as_json)
    {
        using namespace molar;

        try
        {
            const chem::molecule m = chem::analyze(formula, table);
            if (as_json)
            {
                std::cout << chem::json(m).dump() << "\n";
                return true;
            }

            std::cout << "The molecular mass of " << m.formula << " is "
                      << std::fixed << std::setprecision(7) << m.mass_u << "\n\n";
            std::cout << "The elements of " << m.formula << " are:\n";
            for (const auto &c : m.composition)
                std::cout << "(" << c.symbol << ", " << c.count << ")\n";
            return true;
        }
        catch (const chem::formula_error &e)
        {
            if (as_json)
            {
                std::cout << chem::error_to_json(formula, e).dump() << "\n";
            }
            else
            {
                std::cerr << "Invalid formula '" << formula << "': " << e.what()
                          << " [" << chem::to_string(e.kind()) << "]\n";
                const std::string cleaned = chem::clean_copy(formula, table);
                if (!cleaned.empty() && cleaned != formula)
                    std::cerr << "Clean copy: " << cleaned << "\n";
            }
            return false;
        }
    }
}

int main(int argc, char **argv)
{
    using namespace molar;

    std::optional<std::string> table_path;
    bool as_json = false;
    std::vector<std::string> formulas;

    for (int i = 1; i < argc; ++i)
    {
        if (std::strcmp(argv[i], "--json") == 0)
        {
            as_json = true;
        }
        else if (std::strcmp(argv[i], "--table") == 0)
        {
            if (i + 1 >= argc)
            {
                print_usage(argv[0]);
                return 2;
            }
            table_path = argv[++i];
        }
        else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0)
        {
            print_usage(argv[0]);
            return 0;
        }
        else if (argv[i][0] == '-' && argv[i][1] == '-')
        {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 2;
        }
        else
        {
            formulas.emplace_back(argv[i]);
        }
    }

    chem::atomic_mass_table custom;
    if (table_path)
    {
        try
        {
            custom = chem::load_atomic_mass_table(*table_path);
        }
        catch (const std::runtime_error &e)
        {
            std::cerr << "Cannot load atomic mass table: " << e.what() << "\n";
            return 2;
        }
    }
    const chem::atomic_mass_table &table = table_path ? custom : chem::default_atomic_mass_table();

    bool all_ok = true;
    if (!formulas.empty())
    {
        for (const auto &f : formulas)
            all_ok = report(f, table, as_json) && all_ok;
        return all_ok ? 0 : 1;
    }

    std::string line;
    while (true)
    {
        if (!as_json)
            std::cout << "Enter molecular formula: " << std::flush;
        if (!std::getline(std::cin, line))
            break;
        if (line.find_first_not_of(" \t\r") == std::string::npos)
            continue;
        all_ok = report(line, table, as_json) && all_ok;
        if (!as_json)
            std::cout << "\n";
    }
    return all_ok ? 0 : 1;
}
