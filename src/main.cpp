//
// Copyright (c) 2024-2025 JLGxy
//

#include "exec_cli.h"

int main(int argc, char **argv) {
    snipexec::cli::CliHandler handler;
    return handler.run(argc, argv);
}
