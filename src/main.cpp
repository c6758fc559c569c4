#include "cli/cli.h"

int main(int argc, char* argv[]) {
    return sciencefund::runCli(argc, argv);
}
