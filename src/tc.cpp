/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <tc/cli.hpp>

int main(const int argc, const char **argv)
{
    using namespace treasure_core;
    consider_bin_dir(argv[0]);
    return cli::run(argc, argv);
}
