#include <iostream>

#include "nimbus/client/config.hpp"
#include "nimbus/client/shell.hpp"
#include "nimbus/version.hpp"

int main(int argc, char *argv[])
{
    try
    {
        auto config = nimbus::client::parse_arguments(argc, argv);
        std::cout << "Nimbus client " << nimbus::version() << std::endl;
        nimbus::client::Shell shell(std::move(config));
        return shell.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return 1;
    }
}
