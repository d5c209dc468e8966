#include <mentat/cli/cli.h>

int main(int argc, char** argv)
{
    return mentat::cli::run(argc, argv);
}
