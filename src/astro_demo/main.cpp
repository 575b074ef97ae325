/**
 * Open Space Program
 * Copyright © 2019-2023 Open Space Program Project
 *
 * MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */
#include <astro/kinematics/orientation.h>
#include <astro/kinematics/space.h>
#include <astro/util/config.h>
#include <astro/util/logging.h>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <Corrade/Utility/Arguments.h>

#include <Magnum/Math/Angle.h>

#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <vector>

using namespace astro;
using namespace astro::kinematics;

using namespace Magnum::Math::Literals;

namespace
{

struct Ship
{
    std::string     name;
    EntityHandle    entity;
};

/**
 * @brief Spawn a small fleet: a flagship spinning slowly in place, an escort
 *        flying past it, and a raider closing in from the north-east
 */
std::vector<Ship> spawn_fleet(Space& rSpace)
{
    std::vector<Ship> fleet;

    fleet.push_back({"flagship", rSpace.spawn_entity(
            {0.0, 0.0, 0.0},
            {0.0, 0.0, 0.0},
            Quaterniond{IdentityInit},
            rotor(10.0_deg, {0.0, 0.0, 1.0}))});

    fleet.push_back({"escort", rSpace.spawn_entity(
            {-500.0, 200.0, 0.0},
            {40.0, 0.0, 0.0},
            rotor(-90.0_deg, {0.0, 0.0, 1.0}))});

    fleet.push_back({"raider", rSpace.spawn_entity(
            {3000.0, 3000.0, 800.0},
            {-60.0, -60.0, -15.0},
            rotor(-135.0_deg, {0.0, 0.0, 1.0}))});

    return fleet;
}

void log_bearings(Space const& space, std::vector<Ship> const& fleet)
{
    Ship const& flagship = fleet.front();

    for (Ship const& ship : fleet)
    {
        if (ship.entity == flagship.entity)
        {
            continue;
        }

        Spherical const b = space.bearing(ship.entity, flagship.entity);
        ASTRO_LOG_INFO("{:>8} from {}: range {:.1f}m, elevation {:.2f}, azimuth {:.2f}",
                       ship.name, flagship.name, b.rho, double(b.theta), double(b.phi));
    }
}

} // namespace

int main(int argc, char** argv)
{
    Corrade::Utility::Arguments args;
    args.addOption("config", "").setHelp("config", "path to a TOML configuration file")
        .addOption("ticks", "").setHelp("ticks", "number of ticks to run, overrides config")
        .addBooleanOption('v', "verbose").setHelp("verbose", "log verbosely")
        .setGlobalHelp("Flies a few ships around and prints bearings between them.")
        .parse(argc, argv);

    // Setup logger
    {
        auto pSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        pSink->set_pattern("[%T.%e] [%n] [%^%l%$] %v");
        set_thread_logger(std::make_shared<spdlog::logger>("astro", std::move(pSink)));
    }

    DemoConfig config;
    try
    {
        if ( ! args.value("config").empty() )
        {
            config = load_demo_config_file(args.value("config"));
        }
        if ( ! args.value("ticks").empty() )
        {
            config.tickCount = args.value<std::uint32_t>("ticks");
        }
    }
    catch (std::exception const& e)
    {
        ASTRO_LOG_CRITICAL("Bad configuration: {}", e.what());
        spdlog::shutdown();
        return EXIT_FAILURE;
    }

    t_logger->set_level(args.isSet("verbose") ? spdlog::level::debug
                                              : spdlog::level::from_str(config.logLevel));

    Space space{config.space};
    std::vector<Ship> fleet;
    try
    {
        fleet = spawn_fleet(space);
    }
    catch (KinematicsError const& e)
    {
        ASTRO_LOG_CRITICAL("Failed to spawn the fleet: {}", e.what());
        spdlog::shutdown();
        return EXIT_FAILURE;
    }

    for (std::uint32_t i = 0; i < config.tickCount; ++i)
    {
        TickReport const report = space.tick(config.tickInterval);
        if ( ! report.ok() )
        {
            ASTRO_LOG_ERROR("Tick {}: {} entities failed to integrate", i, report.failures.size());
        }

        ASTRO_LOG_INFO("Tick {} (t = {:.1f}s)", i, (i + 1) * config.tickInterval);
        log_bearings(space, fleet);
    }

    for (Ship const& ship : fleet)
    {
        space.despawn_entity(ship.entity);
    }

    spdlog::shutdown();
    return EXIT_SUCCESS;
}
