#include "ar_app.h"
#include "ar_config.h"
#include "ar_error.h"
#include <iostream>
#include <memory>

int main(int argc, char* argv[]) {
    const std::string config_path = argc > 1 ? argv[1] : "config.yml";

    PHOTOAR_INFO("Main", "Starting PhotoAR");

    try {
        const photoar::AppConfig config = photoar::AppConfig::loadFromFile(config_path);
        config.applyLogging();

        auto app = std::make_unique<photoar::ARApp>(config);
        app->initialize();
        app->run();

        PHOTOAR_INFO("Main", "PhotoAR shutting down");
        app->shutdown();

    } catch (const photoar::ARError& e) {
        PHOTOAR_CRITICAL("Main", e.getFormattedMessage());
        return 1;
    } catch (const std::exception& e) {
        PHOTOAR_CRITICAL("Main", std::string("Unhandled exception: ") + e.what());
        return 1;
    }

    photoar::Profiler::getInstance().printSummary();
    return 0;
}
