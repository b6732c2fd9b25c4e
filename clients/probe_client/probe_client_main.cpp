/*
 * File: clients/probe_client/probe_client_main.cpp
 * Project: Demo HTTP Service
 * Purpose: Liveness probe for containers and CI smoke tests
 * Notes:
 *  - Exit 0 only on 200 (and status=healthy for /health)
 * Last updated: 2026-10-19
 */

#include <iostream>
#include <string>
#include "common/probe.hpp"

int main(int argc, char **argv)
{
    std::string base = "http://localhost:3000";
    std::string path = "/health";
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--http" && i + 1 < argc)
            base = argv[++i];
        else if (a == "--path" && i + 1 < argc)
            path = argv[++i];
        else
        {
            std::cerr << "usage: " << argv[0] << " [--http http://host:port] [--path /health]\n";
            return 1;
        }
    }
    return run_probe(base, path, std::cout, std::cerr);
}
