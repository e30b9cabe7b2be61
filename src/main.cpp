// File: main.cpp

#include <csignal>
#include <iostream>

#include "batch/worker_pool.hpp"
#include "cli/runner.hpp"

namespace {
    batch::CancellationToken cancellation;

    void onInterrupt(int) { cancellation.cancel(); }
} // namespace

int main(const int argc, char *argv[]) {
    std::signal(SIGINT, onInterrupt);
    return cli::run(argc, argv, std::cout, std::cerr, &cancellation);
}
