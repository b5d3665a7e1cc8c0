/*

main.cpp
--------

Copyright (C) 2026, gmcli contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <iostream>
#include <string>
#include <vector>
#include <gmcli/cli.hpp>


int main(int argc, char* argv[])
{
    std::vector<std::string> args(argv + 1, argv + argc);
    gmcli::cli front(std::cout, std::cerr);
    return front.run(argc > 0 ? argv[0] : "", args);
}
