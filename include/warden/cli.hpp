#pragma once

namespace warden::cli
{
    /** Entry point for the warden command line tool; returns the process exit code */
    int run(int argc, char *argv[]);
}
