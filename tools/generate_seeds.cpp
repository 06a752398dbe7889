#include "fairness.hpp"
#include "secure_random.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>

int main(int argc, char* argv[]) {
    long count = 1;
    if (argc > 1) {
        char* end = nullptr;
        long parsed = std::strtol(argv[1], &end, 10);
        if (end && *end == '\0' && parsed > 0) {
            count = parsed;
        } else {
            std::cerr << "Invalid count provided. Using default of 1.\n";
        }
    }

    try {
        // serverSeed nonce commitHex
        for (long i = 0; i < count; ++i) {
            std::string serverSeed = fd::generateServerSeed();
            std::string nonce = fd::generateRoundNonce();
            std::cout << serverSeed << ' ' << nonce << ' ' << fd::deriveCommitment(serverSeed, nonce)
                      << '\n';
        }
    } catch (const std::exception& ex) {
        std::cerr << "generate_seeds: " << ex.what() << '\n';
        return 1;
    }

    return 0;
}
