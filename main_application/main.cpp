#include "trip_simulator.h"
#include "trip_sim_config.h"
#include "../common/logger.h"
#include <iostream>

int main(int argc, char* argv[]) {
    std::cout << "[BOOT] TripNavSim starting..." << std::endl;

    main_application::TripSimConfig config;
    config.initDefaults();
    if (!main_application::parseTripSimArguments(argc, argv, config)) {
        std::cerr << "usage: " << argv[0]
                  << " [origin_lat=..] [origin_lon=..] [dest_lat=..] [dest_lon=..] [speed_mps=..]"
                  << " [fix_interval_ms=..] [provider_latency_ms=..] [provider_failures=..] [miss_turn=0|1]"
                  << " [gps_fails=0|1] [max_sim_seconds=..] [tick_sleep_ms=..]"
                  << " [log_level=verbose|debug|info|warning|error|fatal]" << std::endl;
        return 2;
    }
    tripnav::logging::setMinLogLevel(config.log_level);
    TRIPNAV_LOG_INFO("main: Application Entry Point.");

    bool arrived = false;
    {
        main_application::TripSimulator simulator(config);
        TRIPNAV_LOG_INFO("main: Starting simulated trip...");
        arrived = simulator.runTrip();
        TRIPNAV_LOG_INFO("main: Simulated trip finished (%s).", arrived ? "arrived" : "not arrived");
    }

    TRIPNAV_LOG_INFO("main: Application will now exit.");
    std::cout << "[BOOT] TripNavSim finished." << std::endl;
    return arrived ? 0 : 1;
}
