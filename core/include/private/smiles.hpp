#pragma once
#include <string>

namespace basil {
namespace detail {

/**
 * @brief Structural check of a SMILES string: atoms, bonds, balanced
 * branches and paired ring closures. No valence or aromaticity checks.
 *
 * @param smiles Input string.
 * @param error Set to a human readable reason when the check fails.
 * @return true if the string is structurally valid.
 */
bool parse_smiles(const std::string &smiles, std::string &error);

} // namespace detail
} // namespace basil
