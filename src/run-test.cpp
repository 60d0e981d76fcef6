/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <chrono>
#include <iostream>
#include <shipyard/common/logger.hpp>
#include <shipyard/common/test.hpp>

int main(const int argc, const char **argv)
{
    using namespace shipyard;
    const auto start = std::chrono::steady_clock::now();
    if (argc >= 2) {
        std::cerr << fmt::format("using test-filter mask: {}\n", argv[1]);
        boost::ut::cfg<boost::ut::override> = { .filter = argv[1] };
    }
    const bool res = boost::ut::cfg<boost::ut::override>.run();
    logger::info("run-test: completed in {:.3f} sec",
        std::chrono::duration<double> { std::chrono::steady_clock::now() - start }.count());
    return res ? 1 : 0;
}
