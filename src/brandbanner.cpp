// brandbanner.cpp
// MIT License (c) 2026 Pedro

#include "commands/command_support.h"

int main(int argc, char** argv) {
    return brandimg::commands::run_brandbanner(argc, argv);
}
