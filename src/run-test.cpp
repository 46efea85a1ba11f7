/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <iostream>
#include <tc/common/test.hpp>
#include <tc/config.hpp>
#include <tc/logger.hpp>

int main(const int argc, const char **argv)
{
    using namespace treasure_core;
    consider_bin_dir(argv[0]);
    if (argc >= 2) {
        std::cerr << "using test-filter mask: " << argv[1] << '\n';
        boost::ut::cfg<boost::ut::override> = { .filter = argv[1] };
    }
    const bool res = boost::ut::cfg<boost::ut::override>.run();
    logger::info("run-test finished with {}", res ? "failures" : "success");
    return res ? 1 : 0;
}
