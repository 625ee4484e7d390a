#include <exception>
#include <iostream>
#include <utility>

#include "dshare/client/config.hpp"
#include "dshare/client/logger.hpp"
#include "dshare/client/session.hpp"

int main(int argc, char *argv[])
{
    try
    {
        const auto config = dshare::client::parse_arguments(argc, argv);
        dshare::client::Logger logger(config.log_path);
        dshare::client::ClientSession session(config, std::move(logger));
        return session.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return 1;
    }
}
