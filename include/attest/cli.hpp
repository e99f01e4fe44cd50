#pragma once

namespace attest::cli
{
    /** Entry point of the attest executable; returns the process exit code */
    int run(int argc, char *argv[]);
}
