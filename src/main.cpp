// main.cpp

#include <cstdlib>
#include <ctime>
#include <exception>
#include <iostream>
#include <string>

#include "camera_client.hpp"
#include "capture_scheduler.hpp"
#include "config.hpp"
#include "control_server.hpp"
#include "event_bus.hpp"
#include "logger.hpp"
#include "snapshot_store.hpp"
#include "sun_times.hpp"
#include "utils.hpp"

int main(int argc, char* argv[]) {
    std::string config_path = argc > 1 ? argv[1] : DEFAULT_CONFIG_FILE;

    try {
        // 1. Load and validate the configuration
        ScheduleConfig config = load_config(config_path);

        // 2. Logging and local time zone for the capture window
        if (config.log_enabled && !create_dir(LOGS_PATH)) {
            throw std::runtime_error("Failed to create logs directory: " + std::string(LOGS_PATH));
        }
        configure_logging(config.log_enabled, config.log_file);

        if (!set_time_zone(config.city_tz)) {
            throw std::runtime_error("Failed to apply time zone: " + config.city_tz);
        }
        log_status("ChronoCam starting" +
                   (config.instance_name.empty() ? std::string() : " (" + config.instance_name + ")") +
                   " with " + config_path);

        // 3. Wire the engine together
        HttpCameraClient camera;
        AlmanacSunResolver sun_resolver;
        EventBus bus(static_cast<size_t>(config.subscriber_queue_limit));
        CaptureScheduler scheduler(config, camera, bus, sun_resolver);

        // 4. Run the capture loop in the background and serve the dashboard API
        scheduler.start();
        ControlServer server(scheduler, bus, config_path);
        server.run(config.http_address, static_cast<unsigned short>(config.http_port));

    } catch (const ConfigError& e) {
        std::cerr << "Fatal Error during setup: " << e.what() << std::endl;
        std::cerr << "Action Required: Check " << config_path << "." << std::endl;
        return 1;
    } catch (const std::runtime_error& e) {
        // Storage directory, port binding and similar setup failures
        std::cerr << "Fatal Error during setup: " << e.what() << std::endl;
        std::cerr << "Action Required: Check directory permissions and the http_address/http_port settings." << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unhandled Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
