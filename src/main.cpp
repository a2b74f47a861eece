//
// Gateway entry point
//

#include "Application.h"
#include "Lib/GeneralUtils.h"
#include <iostream>

auto main() -> int
{
    try {
        auto application = createApplication();

        // Start the http server to handle api requests, this blocks until the server stops
        application->run();
        application->shutdown();
    } catch (const std::exception &e) {
        dumpExceptions(e);
        std::cerr << "Unable to start the gateway: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
