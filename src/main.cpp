#include "cli/application.hpp"

int main(int argc, char** argv)
{
    return narrowpack::cli::run(argc, argv);
}
