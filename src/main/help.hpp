#pragma once

#include <iostream>

/**
 * @brief Prints the usage screen.
 * @param out The stream to print to.
 */
void PrintHelp(std::ostream &out = std::cout);

/**
 * @brief Prints the launcher name and version.
 * @param out The stream to print to.
 */
void PrintVersion(std::ostream &out = std::cout);
